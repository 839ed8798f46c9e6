#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

#include "geminet/base-fd.hpp"

namespace geminet {

// Simple RAII class wrapping a blocking IPv4 stream socket.
class Socket {
 public:
  Socket() noexcept = default;

  enum class Type : std::uint8_t { Stream };

  // Creates a new TCP socket (close-on-exec).
  // Throws std::system_error on failure.
  explicit Socket(Type type);

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Bind to the given IPv4 address literal and port, then start listening with given backlog.
  // If port is 0, an ephemeral port is chosen and updated in the argument.
  // Throws std::system_error on failure, std::invalid_argument if address is not a valid IPv4 literal.
  void bindAndListen(std::string_view address, bool reuseAddress, uint16_t& port, int backlog);

  // Wait at most 'timeout' for the socket to become readable (for a listening socket: a pending connection).
  // Returns false on timeout or interruption.
  // Throws std::system_error on poll failure.
  [[nodiscard]] bool waitReadable(std::chrono::milliseconds timeout) const;

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace geminet
