#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace geminet {

// Generic URI (RFC 3986) as used by Gemini requests: scheme "://" authority [path] ["?" query] ["#" fragment].
// All components are views into the parsed input: a Uri must not outlive the buffer it was parsed from.
struct Uri {
  // Never empty for a successfully parsed Uri, i.e. "gemini".
  std::string_view scheme;
  // Reg-name, or the content of an IP-literal without its brackets.
  std::string_view host;
  std::optional<uint16_t> port;
  // Bytes after the '/' following the authority, verbatim (no percent-decoding, no dot-segment removal).
  std::optional<std::string_view> path;
  std::optional<std::string_view> query;
  std::optional<std::string_view> fragment;

  bool operator==(const Uri&) const noexcept = default;
};

enum class UriParseStatus : uint8_t {
  Ok,
  // Empty input, empty scheme, or no ':' terminating the scheme.
  MissingScheme,
  // Authority without any host character.
  MissingHost,
  // Unexpected byte for the current component.
  InvalidCharacter,
  // IP-literal host opened with '[' but never closed.
  MissingClosingBracket,
  // ':' after the host not followed by any digit.
  InvalidPort,
  // Port number does not fit in 16 bits.
  PortOverflow,
};

std::string_view UriParseStatusToStr(UriParseStatus status);

struct UriParseResult {
  UriParseStatus status{UriParseStatus::Ok};
  // Only meaningful when status is Ok.
  Uri uri;
  // Offset in the input where parsing stopped on error.
  std::size_t errorPos{0};

  [[nodiscard]] bool ok() const noexcept { return status == UriParseStatus::Ok; }
};

// Parses input into a Uri. Pure function: no allocation, returned views alias input.
[[nodiscard]] UriParseResult ParseUri(std::string_view input) noexcept;

}  // namespace geminet
