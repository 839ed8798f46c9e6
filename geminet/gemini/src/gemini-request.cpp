#include "geminet/gemini-request.hpp"

#include <cerrno>
#include <cstddef>
#include <span>
#include <string_view>

#include "geminet/gemini-constants.hpp"
#include "geminet/uri.hpp"

namespace geminet {

std::string_view RequestParseStatusToStr(RequestParseStatus status) {
  switch (status) {
    case RequestParseStatus::Ok:
      return "Ok";
    case RequestParseStatus::BufferTooSmall:
      return "BufferTooSmall";
    case RequestParseStatus::EndOfStream:
      return "EndOfStream";
    case RequestParseStatus::UriTooLong:
      return "UriTooLong";
    case RequestParseStatus::MissingUri:
      return "MissingUri";
    case RequestParseStatus::MissingCRLF:
      return "MissingCRLF";
    case RequestParseStatus::ConnectionReset:
      return "ConnectionReset";
    case RequestParseStatus::TimedOut:
      return "TimedOut";
    case RequestParseStatus::IoError:
      return "IoError";
    case RequestParseStatus::MissingScheme:
      return "MissingScheme";
    case RequestParseStatus::MissingHost:
      return "MissingHost";
    case RequestParseStatus::InvalidCharacter:
      return "InvalidCharacter";
    case RequestParseStatus::MissingClosingBracket:
      return "MissingClosingBracket";
    case RequestParseStatus::InvalidPort:
      return "InvalidPort";
    case RequestParseStatus::PortOverflow:
      return "PortOverflow";
  }
  return "Unknown";
}

RequestParseStatus ToRequestParseStatus(UriParseStatus status) noexcept {
  switch (status) {
    case UriParseStatus::Ok:
      return RequestParseStatus::Ok;
    case UriParseStatus::MissingScheme:
      return RequestParseStatus::MissingScheme;
    case UriParseStatus::MissingHost:
      return RequestParseStatus::MissingHost;
    case UriParseStatus::InvalidCharacter:
      return RequestParseStatus::InvalidCharacter;
    case UriParseStatus::MissingClosingBracket:
      return RequestParseStatus::MissingClosingBracket;
    case UriParseStatus::InvalidPort:
      return RequestParseStatus::InvalidPort;
    case UriParseStatus::PortOverflow:
      return RequestParseStatus::PortOverflow;
  }
  return RequestParseStatus::InvalidCharacter;
}

bool IsMalformedRequest(RequestParseStatus status) noexcept {
  switch (status) {
    case RequestParseStatus::UriTooLong:
    case RequestParseStatus::MissingUri:
    case RequestParseStatus::MissingCRLF:
    case RequestParseStatus::MissingScheme:
    case RequestParseStatus::MissingHost:
    case RequestParseStatus::InvalidCharacter:
    case RequestParseStatus::MissingClosingBracket:
    case RequestParseStatus::InvalidPort:
    case RequestParseStatus::PortOverflow:
      return true;
    default:
      return false;
  }
}

bool IsPeerGone(RequestParseStatus status) noexcept {
  return status == RequestParseStatus::EndOfStream || status == RequestParseStatus::ConnectionReset ||
         status == RequestParseStatus::TimedOut;
}

namespace {

RequestParseResult Failure(RequestParseStatus status, int sysErrno = 0) {
  RequestParseResult res;
  res.status = status;
  res.sysErrno = sysErrno;
  return res;
}

RequestParseStatus ClassifyTransportError(int errnum) noexcept {
  switch (errnum) {
    case ECONNRESET:
    case EPIPE:
      return RequestParseStatus::ConnectionReset;
    case EAGAIN:
#if EWOULDBLOCK != EAGAIN
    case EWOULDBLOCK:
#endif
    case ETIMEDOUT:
      return RequestParseStatus::TimedOut;
    default:
      return RequestParseStatus::IoError;
  }
}

}  // namespace

RequestParseResult ParseRequest(ITransport& transport, std::span<char> buffer) {
  if (buffer.size() < gemini::kMaxRequestLineSize) {
    return Failure(RequestParseStatus::BufferTooSmall);
  }

  // Never read past a maximal request line, so that a longer line is detected without looking further.
  const std::size_t capacity = gemini::kMaxRequestLineSize;
  std::size_t size = 0;
  std::size_t lineSize = 0;
  while (lineSize == 0) {
    if (size == capacity) {
      return Failure(RequestParseStatus::UriTooLong);
    }
    const auto [bytesRead, errnum] = transport.read(buffer.data() + size, capacity - size);
    if (errnum != 0) {
      return Failure(ClassifyTransportError(errnum), errnum);
    }
    if (bytesRead == 0) {
      return Failure(size == 0 ? RequestParseStatus::EndOfStream : RequestParseStatus::MissingCRLF);
    }
    const std::string_view chunk(buffer.data() + size, bytesRead);
    const auto lfPos = chunk.find('\n');
    size += bytesRead;
    if (lfPos != std::string_view::npos) {
      lineSize = size - bytesRead + lfPos + 1U;
    }
  }

  const std::string_view line(buffer.data(), lineSize);
  if (line.size() < gemini::CRLF.size() || !line.ends_with(gemini::CRLF)) {
    return Failure(RequestParseStatus::MissingCRLF);
  }
  if (line.size() == gemini::CRLF.size()) {
    return Failure(RequestParseStatus::MissingUri);
  }

  const auto uriRes = ParseUri(line.substr(0, line.size() - gemini::CRLF.size()));
  if (!uriRes.ok()) {
    return Failure(ToRequestParseStatus(uriRes.status));
  }
  RequestParseResult res;
  res.request = GeminiRequest(uriRes.uri);
  return res;
}

}  // namespace geminet
