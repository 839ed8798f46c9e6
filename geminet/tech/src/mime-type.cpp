#include "geminet/mime-type.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <limits>
#include <optional>
#include <string_view>

#include "geminet/cctype.hpp"

namespace geminet {

static_assert(std::ranges::is_sorted(kMIMEMappings, {}, &MIMEMapping::extension),
              "kMIMEMappings must be sorted by extension");

static_assert(std::size(kMIMEMappings) < std::numeric_limits<MIMETypeIdx>::max(),
              "kMIMEMappings size exceeds MIMETypeIdx capacity");

MIMETypeIdx DetermineMIMETypeIdx(std::string_view extension) {
  static constexpr std::size_t kMaximumKnownExtensionSize =
      std::ranges::max_element(kMIMEMappings, [](const auto &lhs, const auto &rhs) {
        return lhs.extension.size() < rhs.extension.size();
      })->extension.size();

  if (extension.empty() || extension.size() > kMaximumKnownExtensionSize) {
    return kUnknownMIMEMappingIdx;
  }

  char extBuf[kMaximumKnownExtensionSize];
  const auto endIt = std::transform(extension.begin(), extension.end(), extBuf, [](char ch) { return tolower(ch); });

  const std::string_view ext(extBuf, endIt);
  const auto it = std::ranges::lower_bound(kMIMEMappings, ext, {}, &MIMEMapping::extension);
  if (it != std::end(kMIMEMappings) && it->extension == ext) {
    return static_cast<MIMETypeIdx>(std::distance(std::begin(kMIMEMappings), it));
  }
  return kUnknownMIMEMappingIdx;
}

MimeType MimeType::FromExtension(std::string_view extension) {
  if (extension.starts_with('.')) {
    extension.remove_prefix(1);
  }
  const MIMETypeIdx idx = DetermineMIMETypeIdx(extension);
  if (idx == kUnknownMIMEMappingIdx) {
    return {};
  }
  return MimeType(kMIMEMappings[idx].mimeType);
}

MimeType MimeType::FromFileName(std::string_view fileName) {
  const auto slashPos = fileName.find_last_of('/');
  if (slashPos != std::string_view::npos) {
    fileName.remove_prefix(slashPos + 1U);
  }
  const auto dotPos = fileName.rfind('.');
  // a leading dot names a hidden file, not an extension
  if (dotPos == std::string_view::npos || dotPos == 0) {
    return {};
  }
  return FromExtension(fileName.substr(dotPos + 1U));
}

std::optional<std::string_view> MimeType::extension() const noexcept {
  const auto it = std::ranges::find(kMIMEMappings, _text, &MIMEMapping::mimeType);
  if (it == std::end(kMIMEMappings)) {
    return std::nullopt;
  }
  return it->extension;
}

}  // namespace geminet
