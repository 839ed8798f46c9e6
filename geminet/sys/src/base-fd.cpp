#include "geminet/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "geminet/log.hpp"

namespace geminet {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    close();
    _fd = other.release();
  }
  return *this;
}

void BaseFd::close() noexcept {
  const int fd = release();
  if (fd == kClosedFd) {
    return;
  }
  // On Linux the descriptor is released even when close reports EINTR: retrying could close a descriptor
  // reused by another thread in the meantime.
  if (::close(fd) != 0 && errno != EINTR) {
    log::error("close fd # {} failed: {}", fd, std::strerror(errno));
    return;
  }
  log::debug("fd # {} closed", fd);
}

int BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

}  // namespace geminet
