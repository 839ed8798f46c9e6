#include "geminet/uri.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <system_error>

#include "geminet/cctype.hpp"

namespace geminet {

namespace {

constexpr std::string_view kSchemeSeparator = "://";

constexpr bool IsSchemeChar(char ch) { return isalnum(ch) || ch == '+' || ch == '-' || ch == '.'; }

// ALPHA / DIGIT / "-" / "." / "_" / "~"
constexpr bool IsUnreserved(char ch) { return isalnum(ch) || ch == '-' || ch == '.' || ch == '_' || ch == '~'; }

// "!" / "$" / "&" / "'" / "(" / ")" / "*" / "+" / "," / ";" / "="
// ';' is left out on purpose: Gemini hosts never carry parameters.
constexpr bool IsSubDelim(char ch) {
  switch (ch) {
    case '!':
    case '$':
    case '&':
    case '\'':
    case '(':
    case ')':
    case '*':
    case '+':
    case ',':
    case '=':
      return true;
    default:
      return false;
  }
}

// reg-name = *( unreserved / pct-encoded / sub-delims )
constexpr bool IsRegNameChar(char ch) { return IsUnreserved(ch) || ch == '%' || IsSubDelim(ch); }

static_assert(IsRegNameChar('~') && IsRegNameChar('%') && IsRegNameChar('=') && !IsRegNameChar('|'));
static_assert(!IsRegNameChar(':') && !IsRegNameChar('/') && !IsRegNameChar('[') && !IsRegNameChar('@'));

enum class State : uint8_t { Scheme, Host, DetectNext, Port, Path, Query, Fragment, Done };

}  // namespace

std::string_view UriParseStatusToStr(UriParseStatus status) {
  switch (status) {
    case UriParseStatus::Ok:
      return "Ok";
    case UriParseStatus::MissingScheme:
      return "MissingScheme";
    case UriParseStatus::MissingHost:
      return "MissingHost";
    case UriParseStatus::InvalidCharacter:
      return "InvalidCharacter";
    case UriParseStatus::MissingClosingBracket:
      return "MissingClosingBracket";
    case UriParseStatus::InvalidPort:
      return "InvalidPort";
    case UriParseStatus::PortOverflow:
      return "PortOverflow";
  }
  return "Unknown";
}

UriParseResult ParseUri(std::string_view input) noexcept {
  UriParseResult res;
  const auto fail = [&res](UriParseStatus status, std::size_t pos) {
    res.status = status;
    res.errorPos = pos;
    res.uri = Uri{};
    return res;
  };

  Uri& uri = res.uri;
  const std::size_t size = input.size();
  std::size_t pos = 0;
  // ':' introduces a port only right after the host
  bool portAllowed = false;

  State state = State::Scheme;
  while (state != State::Done) {
    switch (state) {
      case State::Scheme: {
        while (pos < size && IsSchemeChar(input[pos])) {
          ++pos;
        }
        if (pos == size) {
          return fail(UriParseStatus::MissingScheme, pos);
        }
        if (input[pos] != ':') {
          return fail(UriParseStatus::InvalidCharacter, pos);
        }
        if (pos == 0) {
          return fail(UriParseStatus::MissingScheme, pos);
        }
        uri.scheme = input.substr(0, pos);
        if (!input.substr(pos).starts_with(kSchemeSeparator)) {
          return fail(UriParseStatus::InvalidCharacter, pos);
        }
        pos += kSchemeSeparator.size();
        state = State::Host;
        break;
      }
      case State::Host: {
        if (pos < size && input[pos] == '[') {
          const auto closingPos = input.find(']', pos + 1U);
          if (closingPos == std::string_view::npos) {
            return fail(UriParseStatus::MissingClosingBracket, pos);
          }
          uri.host = input.substr(pos + 1U, closingPos - pos - 1U);
          pos = closingPos + 1U;
        } else {
          const std::size_t start = pos;
          while (pos < size && IsRegNameChar(input[pos])) {
            ++pos;
          }
          uri.host = input.substr(start, pos - start);
        }
        if (uri.host.empty()) {
          return fail(UriParseStatus::MissingHost, pos);
        }
        portAllowed = true;
        state = State::DetectNext;
        break;
      }
      case State::DetectNext: {
        if (pos == size) {
          state = State::Done;
          break;
        }
        switch (input[pos]) {
          case ':':
            if (!portAllowed) {
              return fail(UriParseStatus::InvalidCharacter, pos);
            }
            state = State::Port;
            break;
          case '/':
            state = State::Path;
            break;
          case '?':
            state = State::Query;
            break;
          case '#':
            state = State::Fragment;
            break;
          default:
            return fail(UriParseStatus::InvalidCharacter, pos);
        }
        portAllowed = false;
        ++pos;
        break;
      }
      case State::Port: {
        const std::size_t start = pos;
        while (pos < size && isdigit(input[pos])) {
          ++pos;
        }
        if (pos == start) {
          return fail(UriParseStatus::InvalidPort, pos);
        }
        uint16_t port;
        const auto [ptr, errc] = std::from_chars(input.data() + start, input.data() + pos, port);
        if (errc != std::errc()) {
          return fail(UriParseStatus::PortOverflow, start);
        }
        uri.port = port;
        state = State::DetectNext;
        break;
      }
      case State::Path: {
        auto end = input.find_first_of("?#", pos);
        if (end == std::string_view::npos) {
          end = size;
        }
        uri.path = input.substr(pos, end - pos);
        pos = end;
        state = State::DetectNext;
        break;
      }
      case State::Query: {
        auto end = input.find('#', pos);
        if (end == std::string_view::npos) {
          end = size;
        }
        uri.query = input.substr(pos, end - pos);
        pos = end;
        state = State::DetectNext;
        break;
      }
      case State::Fragment:
        uri.fragment = input.substr(pos);
        pos = size;
        state = State::Done;
        break;
      case State::Done:
        break;
    }
  }
  return res;
}

}  // namespace geminet
