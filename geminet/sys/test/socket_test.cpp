#include "geminet/socket.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <system_error>

namespace geminet {

TEST(Socket, Nominal) {
  Socket sock(Socket::Type::Stream);
  EXPECT_TRUE(sock);
  EXPECT_GE(sock.fd(), 0);
  sock.close();
  EXPECT_FALSE(sock);
}

TEST(Socket, BindAndListenUpdatesPort) {
  Socket sock(Socket::Type::Stream);
  uint16_t port = 0;
  EXPECT_NO_THROW(sock.bindAndListen("127.0.0.1", false, port, 16));
  EXPECT_NE(0, port);
}

TEST(Socket, BindAndListenThrowsWhenPortInUse) {
  Socket first(Socket::Type::Stream);
  uint16_t port = 0;
  first.bindAndListen("127.0.0.1", false, port, 16);
  Socket second(Socket::Type::Stream);
  EXPECT_THROW(second.bindAndListen("127.0.0.1", false, port, 16), std::system_error);
}

TEST(Socket, BindAndListenRejectsInvalidAddress) {
  Socket sock(Socket::Type::Stream);
  uint16_t port = 0;
  EXPECT_THROW(sock.bindAndListen("not-an-address", false, port, 16), std::invalid_argument);
  EXPECT_THROW(sock.bindAndListen("::1", false, port, 16), std::invalid_argument);
}

TEST(Socket, WaitReadableTimesOutWithoutPendingConnection) {
  Socket sock(Socket::Type::Stream);
  uint16_t port = 0;
  sock.bindAndListen("127.0.0.1", true, port, 16);
  EXPECT_FALSE(sock.waitReadable(std::chrono::milliseconds{5}));
}

}  // namespace geminet
