#include "orc/core/logging.hpp"

#include <spdlog/spdlog.h>

namespace orc {

Result<void> configure_logging(const EngineConfig& config) {
    const auto level = spdlog::level::from_str(config.log_level);
    if (level == spdlog::level::off && config.log_level != "off") {
        return Err<void>(ErrorCode::ConfigError, "Unknown log level: " + config.log_level);
    }
    spdlog::set_level(level);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [orc] %v");
    spdlog::debug("Logging configured for device {} at level {}", config.device_id, config.log_level);
    return Ok();
}

} // namespace orc
