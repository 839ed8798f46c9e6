#include "geminet/connection.hpp"

#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstring>
#include <utility>

#include "geminet/base-fd.hpp"
#include "geminet/log.hpp"
#include "geminet/socket.hpp"

namespace geminet {

namespace {
bool SetTimeoutOption(int fd, int option, std::chrono::milliseconds timeout) noexcept {
  timeval tv{};
  tv.tv_sec = static_cast<decltype(tv.tv_sec)>(timeout.count() / 1000);
  tv.tv_usec = static_cast<decltype(tv.tv_usec)>((timeout.count() % 1000) * 1000);
  return ::setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv)) == 0;
}
}  // namespace

Connection::Connection(const Socket& socket) {
  sockaddr_in inAddr{};
  socklen_t inLen = sizeof(inAddr);
  const int fd = ::accept4(socket.fd(), reinterpret_cast<sockaddr*>(&inAddr), &inLen, SOCK_CLOEXEC);
  if (fd < 0) {
    _acceptErr = errno;  // capture errno before any other call
    log::debug("Connection accept failed for socket fd # {}: {}", socket.fd(), std::strerror(_acceptErr));
  } else {
    _baseFd = BaseFd(fd);
    log::debug("Connection fd # {} opened", fd);
  }
}

Connection::Connection(BaseFd&& bd) noexcept : _baseFd(std::move(bd)) {}

bool Connection::setReceiveTimeout(std::chrono::milliseconds timeout) const noexcept {
  return SetTimeoutOption(_baseFd.fd(), SO_RCVTIMEO, timeout);
}

bool Connection::setSendTimeout(std::chrono::milliseconds timeout) const noexcept {
  return SetTimeoutOption(_baseFd.fd(), SO_SNDTIMEO, timeout);
}

bool Connection::shutdownWrite() const noexcept { return ::shutdown(_baseFd.fd(), SHUT_WR) == 0; }

std::size_t Connection::discardInput(std::chrono::milliseconds timeout, std::size_t maxBytes) const noexcept {
  if (!SetTimeoutOption(_baseFd.fd(), SO_RCVTIMEO, timeout)) {
    return 0;
  }
  std::array<char, 1024> buf;
  std::size_t nbDiscarded = 0;
  while (nbDiscarded < maxBytes) {
    const auto ret = ::recv(_baseFd.fd(), buf.data(), buf.size(), 0);
    if (ret < 0 && errno == EINTR) {
      continue;
    }
    if (ret <= 0) {
      break;
    }
    nbDiscarded += static_cast<std::size_t>(ret);
  }
  return nbDiscarded;
}

}  // namespace geminet
