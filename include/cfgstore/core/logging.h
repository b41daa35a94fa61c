#pragma once

#include <cfgstore/core/types.h>

#include <string>

namespace cfgstore::logging {

/**
 * @brief Configure the default spdlog logger
 *
 * @param level trace|debug|info|warn|error|critical|off
 * @param file  optional rotating log file; empty keeps console output
 */
Result<void> configure(const std::string& level, const std::string& file = "");

} // namespace cfgstore::logging
