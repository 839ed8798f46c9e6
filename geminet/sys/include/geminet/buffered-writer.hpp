#pragma once

#include <array>
#include <cstddef>
#include <string_view>

#include "geminet/transport.hpp"

namespace geminet {

// Coalesces small writes into a fixed buffer to limit the number of transport calls.
// Writes that would overflow the buffer are emitted together with the pending bytes in one gathered write.
// Not thread safe: owned by a single connection.
class BufferedWriter {
 public:
  static constexpr std::size_t kBufferSize = 4096;

  explicit BufferedWriter(ITransport& transport) noexcept : _transport(&transport) {}

  // Throws std::system_error if the transport fails. Pending bytes are dropped in that case.
  void write(std::string_view data);

  // Sends all pending bytes to the transport.
  // Throws std::system_error if the transport fails. Pending bytes are dropped in that case.
  void flush();

  // Drops pending bytes without sending them.
  void discard() noexcept { _size = 0; }

  [[nodiscard]] std::size_t pendingBytes() const noexcept { return _size; }

  // True once any byte was handed to the transport, even partially.
  [[nodiscard]] bool hasSentBytes() const noexcept { return _hasSentBytes; }

 private:
  [[nodiscard]] std::string_view pending() const noexcept { return {_buf.data(), _size}; }

  ITransport* _transport;
  std::size_t _size{0};
  bool _hasSentBytes{false};
  std::array<char, kBufferSize> _buf;
};

}  // namespace geminet
