#pragma once

#include "Config.hpp"

namespace sqlctx {

/**
 * @brief Install a default spdlog logger built from the configuration.
 *
 * Console output goes to a colored stdout sink, `file` adds a file sink.
 * The library itself only logs through the default logger, so applications
 * that set up spdlog on their own do not need to call this.
 *
 * @return false if a sink could not be created; the previous default
 *         logger is kept in that case.
 */
bool configureLogging(const LoggingConfig& config);

}  // namespace sqlctx
