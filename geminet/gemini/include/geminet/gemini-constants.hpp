#pragma once

#include <cstddef>
#include <string_view>

namespace geminet::gemini {

inline constexpr std::string_view CRLF = "\r\n";

// Request: <URI><CR><LF>
inline constexpr std::size_t kMaxUriSize = 1024;
inline constexpr std::size_t kMaxRequestLineSize = kMaxUriSize + CRLF.size();

// Response header: <STATUS><SPACE><META><CR><LF>
inline constexpr std::size_t kStatusCodeSize = 2;
inline constexpr std::size_t kMaxMetaSize = 1024;
inline constexpr std::size_t kMaxHeaderSize = kStatusCodeSize + 1U + kMaxMetaSize + CRLF.size();

inline constexpr std::string_view kMalformedRequestMeta = "Malformed request";
inline constexpr std::string_view kUnexpectedErrorMeta = "Unexpected error. Retry later.";

static_assert(kMaxRequestLineSize == 1026);
static_assert(kMaxHeaderSize == 1029);

}  // namespace geminet::gemini
