#pragma once

#include <fmt/format.h>

#include <cerrno>
#include <string_view>
#include <system_error>
#include <utility>

namespace geminet {

// Throw std::system_error for the given error number with a formatted message.
template <typename... Args>
[[noreturn]] void throw_system_error(int errnum, fmt::format_string<Args...> fmt, Args&&... args) {
  throw std::system_error(std::error_code(errnum, std::generic_category()),
                          fmt::format(fmt, std::forward<Args>(args)...));
}

// Capture errno immediately and throw std::system_error with a formatted message.
// Usage: throw_errno("bind failed for {}", address);
template <typename... Args>
[[noreturn]] void throw_errno(fmt::format_string<Args...> fmt, Args&&... args) {
  const int savedErr = errno;
  throw_system_error(savedErr, fmt, std::forward<Args>(args)...);
}

}  // namespace geminet
