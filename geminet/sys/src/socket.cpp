#include "geminet/socket.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "geminet/errno-throw.hpp"
#include "geminet/log.hpp"

namespace geminet {

namespace {
int ToSocketType(Socket::Type type) {
  switch (type) {
    case Socket::Type::Stream:
      return SOCK_STREAM | SOCK_CLOEXEC;
  }
  throw std::invalid_argument("Invalid socket type");
}
}  // namespace

Socket::Socket(Type type) : _baseFd(::socket(AF_INET, ToSocketType(type), 0)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new socket");
  }
  log::debug("Socket fd # {} opened", _baseFd.fd());
}

void Socket::bindAndListen(std::string_view address, bool reuseAddress, uint16_t& port, int backlog) {
  const int fd = _baseFd.fd();

  static constexpr int kEnable = 1;
  if (reuseAddress && ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable)) == -1) {
    throw_errno("setsockopt(SO_REUSEADDR) failed");
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  // inet_pton needs a null terminated string
  const std::string addressStr(address);
  if (::inet_pton(AF_INET, addressStr.c_str(), &addr.sin_addr) != 1) {
    throw std::invalid_argument("Invalid IPv4 bind address");
  }

  if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == -1) {
    throw_errno("bind failed for {}:{}", address, port);
  }
  if (::listen(fd, backlog) == -1) {
    throw_errno("listen failed for {}:{}", address, port);
  }
  if (port == 0) {
    sockaddr_in actual{};
    socklen_t len = sizeof(actual);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&actual), &len) == -1) {
      throw_errno("getsockname failed");
    }
    port = ntohs(actual.sin_port);
  }
  log::debug("Socket fd # {} listening on {}:{}", fd, address, port);
}

bool Socket::waitReadable(std::chrono::milliseconds timeout) const {
  pollfd pfd{_baseFd.fd(), POLLIN, 0};
  const int nbReady = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (nbReady == -1) {
    if (errno == EINTR) {
      return false;
    }
    throw_errno("poll failed for socket fd # {}", _baseFd.fd());
  }
  return nbReady > 0 && (pfd.revents & POLLIN) != 0;
}

}  // namespace geminet
