#pragma once

#include "orc/core/config.hpp"
#include "orc/core/result.hpp"

namespace orc {

/**
 * @brief Apply the configured log level to the default spdlog logger
 *
 * Accepts the spdlog level names (trace, debug, info, warn, err, critical, off).
 */
Result<void> configure_logging(const EngineConfig& config);

} // namespace orc
