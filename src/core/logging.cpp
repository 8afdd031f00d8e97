#include "usync/core/logging.hpp"

#include <spdlog/spdlog.h>

namespace usync::logging {

Result<void> configure(const std::string& level, const std::string& pattern) {
    const auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        return Err<void>(ErrorCode::Validation, "Unknown log level '" + level + "'");
    }
    spdlog::set_level(parsed);
    spdlog::set_pattern(pattern);
    return Ok();
}

} // namespace usync::logging
