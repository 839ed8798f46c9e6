#include "geminet/transport.hpp"

#include <sys/socket.h>
#include <sys/uio.h>

#include <array>
#include <cerrno>
#include <cstddef>
#include <string_view>

namespace geminet {

ITransport::TransportResult PlainTransport::read(char* buf, std::size_t len) {
  while (true) {
    const auto nbRead = ::recv(_fd, buf, len, 0);
    if (nbRead >= 0) {
      return {static_cast<std::size_t>(nbRead), 0};
    }
    if (errno != EINTR) {
      return {0, errno};
    }
  }
}

ITransport::TransportResult PlainTransport::write(std::string_view data) {
  TransportResult ret{0, 0};

  while (ret.bytesProcessed < data.size()) {
    // MSG_NOSIGNAL: a peer that went away must not kill the process with SIGPIPE
    const auto nbWritten =
        ::send(_fd, data.data() + ret.bytesProcessed, data.size() - ret.bytesProcessed, MSG_NOSIGNAL);
    if (nbWritten == -1) [[unlikely]] {
      if (errno == EINTR) {
        continue;
      }
      ret.errnum = errno;
      break;
    }

    ret.bytesProcessed += static_cast<std::size_t>(nbWritten);
  }

  return ret;
}

ITransport::TransportResult PlainTransport::write(std::string_view firstBuf, std::string_view secondBuf) {
  // Scatter-gather write: single syscall for both buffers in the common case.
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
  std::array<iovec, 2> iov{{{const_cast<char*>(firstBuf.data()), firstBuf.size()},
                            // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
                            {const_cast<char*>(secondBuf.data()), secondBuf.size()}}};

  TransportResult ret{0, 0};
  const std::size_t totalSize = firstBuf.size() + secondBuf.size();

  while (ret.bytesProcessed < totalSize) {
    // Adjust iovec based on bytes already written
    std::size_t iovIdx = 0;
    std::size_t offset = ret.bytesProcessed;

    if (offset >= firstBuf.size()) {
      iovIdx = 1;
      offset -= firstBuf.size();
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
      iov[1].iov_base = const_cast<char*>(secondBuf.data()) + offset;
      iov[1].iov_len = secondBuf.size() - offset;
    } else {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
      iov[0].iov_base = const_cast<char*>(firstBuf.data()) + offset;
      iov[0].iov_len = firstBuf.size() - offset;
    }

    msghdr msg{};
    msg.msg_iov = iov.data() + iovIdx;
    msg.msg_iovlen = iov.size() - iovIdx;

    const auto nbWritten = ::sendmsg(_fd, &msg, MSG_NOSIGNAL);
    if (nbWritten == -1) [[unlikely]] {
      if (errno == EINTR) {
        continue;
      }
      ret.errnum = errno;
      break;
    }

    ret.bytesProcessed += static_cast<std::size_t>(nbWritten);
  }

  return ret;
}

}  // namespace geminet
