#pragma once
/**
 * @file log.hpp
 * @brief Process logger (spdlog) and its configuration.
 */

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "trellis/config/constants.hpp"

namespace trellis::obs {

/** @struct LoggingConfig
 *  @brief Level and line format of the process logger.
 */
struct LoggingConfig {
    std::string level{config::constants::DEFAULT_LOG_LEVEL}; ///< trace|debug|info|warn|error|critical|off
    bool        json{false};                                 ///< one JSON object per line instead of plain text

    bool operator==(const LoggingConfig&) const = default;
};

/// True if @p level names an spdlog level.
bool valid_log_level(const std::string& level) noexcept;

/// The shared "trellis" logger; created on first use with a colour stdout sink.
std::shared_ptr<spdlog::logger> logger();

/// Apply level and pattern to the shared logger.
void configure_logging(const LoggingConfig& cfg);

} // namespace trellis::obs
