#pragma once

#include <chrono>
#include <cstddef>

#include "geminet/base-fd.hpp"
#include "geminet/socket.hpp"

namespace geminet {

// Simple RAII class wrapping a Connection accepted on a blocking listening socket.
class Connection {
 public:
  Connection() noexcept = default;

  // Accepts one pending connection on given listening socket.
  // On failure the Connection is empty and acceptError() returns the errno of accept.
  explicit Connection(const Socket& socket);

  // Construct a Connection that takes ownership of an existing fd wrapped in BaseFd.
  explicit Connection(BaseFd&& bd) noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  [[nodiscard]] int acceptError() const noexcept { return _acceptErr; }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Apply SO_RCVTIMEO / SO_SNDTIMEO. A zero duration means no timeout.
  // Returns false on failure (errno is set).
  bool setReceiveTimeout(std::chrono::milliseconds timeout) const noexcept;
  bool setSendTimeout(std::chrono::milliseconds timeout) const noexcept;

  // Half closes the connection: the peer reads end of stream once the data already sent is received.
  bool shutdownWrite() const noexcept;

  // Reads and drops incoming bytes until the peer closes, an error occurs, 'timeout' expires for a single read
  // or 'maxBytes' were dropped. Used before closing a connection with possibly unread input, so that the kernel
  // does not reset it and destroy the response in flight. Returns the number of dropped bytes.
  std::size_t discardInput(std::chrono::milliseconds timeout, std::size_t maxBytes) const noexcept;

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
  int _acceptErr{0};
};

}  // namespace geminet
