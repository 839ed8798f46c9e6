#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "geminet/transport.hpp"
#include "geminet/uri.hpp"

namespace geminet {

// A parsed Gemini request. Immutable, all views borrow from the connection's request buffer:
// it is only valid for the duration of the handler invocation.
class GeminiRequest {
 public:
  GeminiRequest() noexcept = default;

  explicit GeminiRequest(const Uri& uri) noexcept : _uri(uri) {}

  [[nodiscard]] const Uri& uri() const noexcept { return _uri; }

  [[nodiscard]] std::string_view scheme() const noexcept { return _uri.scheme; }
  [[nodiscard]] std::string_view host() const noexcept { return _uri.host; }
  [[nodiscard]] std::optional<uint16_t> port() const noexcept { return _uri.port; }

  // Path without its leading '/', not decoded.
  [[nodiscard]] std::optional<std::string_view> path() const noexcept { return _uri.path; }
  [[nodiscard]] std::optional<std::string_view> query() const noexcept { return _uri.query; }
  [[nodiscard]] std::optional<std::string_view> fragment() const noexcept { return _uri.fragment; }

  bool operator==(const GeminiRequest&) const noexcept = default;

 private:
  Uri _uri;
};

// Outcome of reading and parsing one request line.
// The URI errors are part of the enumeration and keep their meaning.
enum class RequestParseStatus : uint8_t {
  Ok,
  // Given buffer cannot hold a maximal request line.
  BufferTooSmall,
  // Peer closed the connection before sending anything.
  EndOfStream,
  // Request line longer than the protocol allows.
  UriTooLong,
  // Request line only made of CRLF.
  MissingUri,
  // Line not terminated by CRLF (includes a peer close before LF).
  MissingCRLF,
  ConnectionReset,
  // Receive timeout expired.
  TimedOut,
  // Any other transport failure, see RequestParseResult::sysErrno.
  IoError,
  MissingScheme,
  MissingHost,
  InvalidCharacter,
  MissingClosingBracket,
  InvalidPort,
  PortOverflow,
};

std::string_view RequestParseStatusToStr(RequestParseStatus status);

RequestParseStatus ToRequestParseStatus(UriParseStatus status) noexcept;

// Errors that should be answered with a bad request response.
bool IsMalformedRequest(RequestParseStatus status) noexcept;

// Errors after which the peer cannot (or does not want to) receive anything: connection is silently closed.
bool IsPeerGone(RequestParseStatus status) noexcept;

struct RequestParseResult {
  RequestParseStatus status{RequestParseStatus::Ok};
  GeminiRequest request;
  // errno of the failing transport call for IoError, ConnectionReset and TimedOut, 0 otherwise.
  int sysErrno{0};

  [[nodiscard]] bool ok() const noexcept { return status == RequestParseStatus::Ok; }
};

// Reads one request line from transport into buffer and parses it.
// buffer must be able to hold at least gemini::kMaxRequestLineSize bytes, it owns the storage that the returned
// request views point to. Bytes received after the first LF are ignored.
[[nodiscard]] RequestParseResult ParseRequest(ITransport& transport, std::span<char> buffer);

}  // namespace geminet
