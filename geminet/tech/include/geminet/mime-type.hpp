#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace geminet {

struct MIMEMapping {
  std::string_view extension;
  std::string_view mimeType;
};

using MIMETypeIdx = uint8_t;

inline constexpr MIMETypeIdx kUnknownMIMEMappingIdx = static_cast<MIMETypeIdx>(~0);

// Canonical content type of Gemini documents, used when nothing better is known.
inline constexpr std::string_view kDefaultMIMEType = "text/gemini; charset=UTF-8";

// Must stay sorted by extension (checked at compile time).
inline constexpr MIMEMapping kMIMEMappings[] = {
    {"7z", "application/x-7z-compressed"},
    {"aac", "audio/aac"},
    {"apng", "image/apng"},
    {"atom", "application/atom+xml"},
    {"avif", "image/avif"},
    {"bmp", "image/bmp"},
    {"c", "text/x-csrc"},
    {"cc", "text/x-c++src"},
    {"cpp", "text/x-c++src"},
    {"css", "text/css"},
    {"csv", "text/csv"},
    {"epub", "application/epub+zip"},
    {"flac", "audio/flac"},
    {"gemini", "text/gemini; charset=UTF-8"},
    {"gif", "image/gif"},
    {"gmi", "text/gemini; charset=UTF-8"},
    {"gz", "application/gzip"},
    {"h", "text/x-chdr"},
    {"hpp", "text/x-c++hdr"},
    {"htm", "text/html"},
    {"html", "text/html"},
    {"ico", "image/x-icon"},
    {"jpeg", "image/jpeg"},
    {"jpg", "image/jpeg"},
    {"js", "text/javascript"},
    {"json", "application/json"},
    {"m4a", "audio/mp4"},
    {"md", "text/markdown"},
    {"mp3", "audio/mpeg"},
    {"mp4", "video/mp4"},
    {"oga", "audio/ogg"},
    {"ogg", "audio/ogg"},
    {"opus", "audio/opus"},
    {"pdf", "application/pdf"},
    {"png", "image/png"},
    {"py", "text/x-python"},
    {"rss", "application/rss+xml"},
    {"sh", "application/x-sh"},
    {"svg", "image/svg+xml"},
    {"tar", "application/x-tar"},
    {"tgz", "application/gzip"},
    {"txt", "text/plain"},
    {"wav", "audio/wav"},
    {"webm", "video/webm"},
    {"webp", "image/webp"},
    {"xml", "application/xml"},
    {"zip", "application/zip"},
};

// Returns the index in kMIMEMappings of the given extension (without leading dot, case insensitive),
// or kUnknownMIMEMappingIdx if unknown.
MIMETypeIdx DetermineMIMETypeIdx(std::string_view extension);

// Content type of a response body. Lookups are total: unknown extensions yield kDefaultMIMEType.
class MimeType {
 public:
  constexpr MimeType() noexcept = default;

  // Accepts the extension with or without its leading dot ("gmi" and ".gmi" are equivalent).
  static MimeType FromExtension(std::string_view extension);

  // Uses the extension of the last path component of fileName.
  static MimeType FromFileName(std::string_view fileName);

  // Full content-type string, as written in the META of a success header.
  [[nodiscard]] constexpr std::string_view str() const noexcept { return _text; }

  // First known extension mapped to this content type, if any.
  [[nodiscard]] std::optional<std::string_view> extension() const noexcept;

  bool operator==(const MimeType&) const noexcept = default;

 private:
  explicit constexpr MimeType(std::string_view text) noexcept : _text(text) {}

  std::string_view _text{kDefaultMIMEType};
};

}  // namespace geminet
