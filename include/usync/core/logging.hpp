#pragma once

#include "usync/core/result.hpp"

#include <string>

namespace usync::logging {

constexpr const char* kDefaultPattern = "[%H:%M:%S] [%^%l%$] %v";

/**
 * @brief Set the global spdlog level and pattern
 *
 * Level names are spdlog's: trace, debug, info, warning, error, critical, off.
 * An unknown name is a Validation error and leaves the logger untouched.
 */
Result<void> configure(const std::string& level, const std::string& pattern = kDefaultPattern);

} // namespace usync::logging
