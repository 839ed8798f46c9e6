#pragma once

// Logging abstraction: geminet logs through spdlog.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace geminet {

namespace log = spdlog;

}  // namespace geminet
