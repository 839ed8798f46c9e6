#pragma once

#include <cstddef>
#include <string_view>

namespace geminet {

// Base transport abstraction over a connected byte stream.
// A TLS terminating host can provide its own implementation; the server uses PlainTransport on accepted sockets.
class ITransport {
 public:
  virtual ~ITransport() = default;

  struct TransportResult {
    std::size_t bytesProcessed;  // bytes read for read operations, or written for write operations
    int errnum;                  // 0 on success, errno value of the failing system call otherwise
  };

  // Blocking read of at most len bytes. bytesProcessed == 0 with errnum == 0 means orderly close by the peer.
  virtual TransportResult read(char* buf, std::size_t len) = 0;

  // Blocking write of all of data, unless an error occurs (then bytesProcessed tells how much was sent).
  virtual TransportResult write(std::string_view data) = 0;

  // Writes firstBuf then secondBuf. Only starts the second buffer once the first one is fully written.
  virtual TransportResult write(std::string_view firstBuf, std::string_view secondBuf) {
    TransportResult result = write(firstBuf);
    if (result.errnum != 0 || secondBuf.empty()) {
      return result;
    }
    const auto [bytesWritten, errnum] = write(secondBuf);
    result.bytesProcessed += bytesWritten;
    result.errnum = errnum;
    return result;
  }
};

// Plain transport directly operates on a blocking socket fd. It does not own the fd.
class PlainTransport : public ITransport {
 public:
  explicit PlainTransport(int fd) noexcept : _fd(fd) {}

  TransportResult read(char* buf, std::size_t len) override;

  TransportResult write(std::string_view data) override;

  TransportResult write(std::string_view firstBuf, std::string_view secondBuf) override;

 private:
  int _fd;
};

}  // namespace geminet
