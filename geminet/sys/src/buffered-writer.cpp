#include "geminet/buffered-writer.hpp"

#include <cstring>
#include <string_view>

#include "geminet/errno-throw.hpp"

namespace geminet {

void BufferedWriter::write(std::string_view data) {
  if (_size + data.size() <= kBufferSize) {
    if (!data.empty()) {
      std::memcpy(_buf.data() + _size, data.data(), data.size());
      _size += data.size();
    }
    return;
  }

  const auto expected = _size + data.size();
  const auto [bytesWritten, errnum] = _transport->write(pending(), data);
  _size = 0;
  _hasSentBytes |= bytesWritten != 0;
  if (errnum != 0) {
    throw_system_error(errnum, "write failed after {} / {} bytes", bytesWritten, expected);
  }
}

void BufferedWriter::flush() {
  if (_size == 0) {
    return;
  }
  const auto expected = _size;
  const auto [bytesWritten, errnum] = _transport->write(pending());
  _size = 0;
  _hasSentBytes |= bytesWritten != 0;
  if (errnum != 0) {
    throw_system_error(errnum, "flush failed after {} / {} bytes", bytesWritten, expected);
  }
}

}  // namespace geminet
