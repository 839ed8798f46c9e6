#pragma once

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <limits>
#include <string>
#include <string_view>

#include "geminet/transport.hpp"

namespace geminet::test {

// In-memory ITransport for unit tests.
//  * read() serves 'input' in chunks of at most 'maxReadChunk' bytes, then reports 'readErrorAtEnd'
//    (0 means orderly close).
//  * write() appends to 'output' until 'writeCapacity' bytes were accepted, then fails with 'writeError'.
//  * each call to write (single or gathered) counts as one transport write.
class MemoryTransport : public ITransport {
 public:
  MemoryTransport() = default;

  explicit MemoryTransport(std::string_view in, std::size_t maxChunk = std::numeric_limits<std::size_t>::max())
      : input(in), maxReadChunk(maxChunk) {}

  TransportResult read(char* buf, std::size_t len) override {
    ++nbReadCalls;
    if (readPos == input.size()) {
      return {0, readErrorAtEnd};
    }
    const std::size_t nbBytes = std::min({len, maxReadChunk, input.size() - readPos});
    std::memcpy(buf, input.data() + readPos, nbBytes);
    readPos += nbBytes;
    return {nbBytes, 0};
  }

  TransportResult write(std::string_view data) override {
    ++nbWriteCalls;
    return append(data);
  }

  TransportResult write(std::string_view firstBuf, std::string_view secondBuf) override {
    ++nbWriteCalls;
    TransportResult ret = append(firstBuf);
    if (ret.errnum == 0) {
      const auto [bytesWritten, errnum] = append(secondBuf);
      ret.bytesProcessed += bytesWritten;
      ret.errnum = errnum;
    }
    return ret;
  }

  std::string input;
  std::size_t maxReadChunk{std::numeric_limits<std::size_t>::max()};
  std::size_t readPos{0};
  int readErrorAtEnd{0};
  std::size_t nbReadCalls{0};

  std::string output;
  std::size_t writeCapacity{std::numeric_limits<std::size_t>::max()};
  int writeError{0};
  std::size_t nbWriteCalls{0};

 private:
  TransportResult append(std::string_view data) {
    const std::size_t room = writeCapacity - std::min(writeCapacity, output.size());
    if (data.size() <= room) {
      output.append(data);
      return {data.size(), 0};
    }
    output.append(data.substr(0, room));
    return {room, writeError};
  }
};

}  // namespace geminet::test
