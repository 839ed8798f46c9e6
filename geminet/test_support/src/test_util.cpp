#include "geminet/test_util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <thread>

#include "geminet/cctype.hpp"
#include "geminet/errno-throw.hpp"
#include "geminet/socket.hpp"

namespace geminet::test {

ClientConnection::ClientConnection(uint16_t port, std::chrono::milliseconds timeout)
    : _socket(Socket::Type::Stream) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (::connect(_socket.fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
    if (std::chrono::steady_clock::now() >= deadline) {
      throw_errno("Unable to connect to 127.0.0.1:{}", port);
    }
    // a failed connect leaves the socket in an unspecified state, start from a fresh one
    _socket = Socket(Socket::Type::Stream);
    std::this_thread::sleep_for(10ms);
  }
}

void ClientConnection::shutdownWrite() const {
  if (::shutdown(_socket.fd(), SHUT_WR) != 0) {
    throw_errno("shutdown(SHUT_WR) failed");
  }
}

void sendAll(int fd, std::string_view data) {
  while (!data.empty()) {
    const auto sent = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
    if (sent == -1) {
      if (errno == EINTR) {
        continue;
      }
      throw_errno("send failed on fd # {}", fd);
    }
    data.remove_prefix(static_cast<std::size_t>(sent));
  }
}

std::string recvUntilClosed(int fd, std::chrono::milliseconds timeout) {
  std::string out;
  char buffer[4096];
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      break;
    }
    pollfd pfd{fd, POLLIN, 0};
    const int nbReady = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (nbReady <= 0) {
      if (nbReady == -1 && errno == EINTR) {
        continue;
      }
      break;
    }
    const auto received = ::recv(fd, buffer, sizeof(buffer), 0);
    if (received <= 0) {
      break;
    }
    out.append(buffer, static_cast<std::size_t>(received));
  }
  return out;
}

std::string sendAndCollect(uint16_t port, std::string_view raw) {
  ClientConnection client(port);
  sendAll(client.fd(), raw);
  return recvUntilClosed(client.fd());
}

ParsedResponse parseResponse(std::string_view raw) {
  ParsedResponse ret;
  const auto crlfPos = raw.find("\r\n");
  if (crlfPos == std::string_view::npos || crlfPos < 3 || !isdigit(raw[0]) || !isdigit(raw[1]) || raw[2] != ' ') {
    return ret;
  }
  ret.status = (raw[0] - '0') * 10 + (raw[1] - '0');
  ret.meta = raw.substr(3, crlfPos - 3);
  ret.body = raw.substr(crlfPos + 2);
  ret.wellFramed = true;
  return ret;
}

}  // namespace geminet::test
