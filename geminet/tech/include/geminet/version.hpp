#pragma once

#include <string_view>

#ifndef GEMINET_VERSION_STR
#error "GEMINET_VERSION_STR must be defined via build system"
#endif

namespace geminet {

// Semver of the project as injected by the build system.
constexpr std::string_view version() { return GEMINET_VERSION_STR; }

}  // namespace geminet
