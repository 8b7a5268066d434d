/**
 * @file log.cpp
 * @brief spdlog-backed process logger.
 */
#include "trellis/obs/log.hpp"

#include <array>
#include <string_view>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace trellis::obs {

namespace {
constexpr std::string_view kPlainPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
constexpr std::string_view kJsonPattern =
    R"({"time":"%Y-%m-%dT%H:%M:%S.%e%z","logger":"%n","level":"%l","msg":"%v"})";

constexpr std::array<std::string_view, 7> kLevels = {
    "trace", "debug", "info", "warn", "error", "critical", "off"};
} // namespace

bool valid_log_level(const std::string& level) noexcept {
    for (const auto l : kLevels) {
        if (l == level) return true;
    }
    return false;
}

std::shared_ptr<spdlog::logger> logger() {
    static const std::shared_ptr<spdlog::logger> lg = [] {
        const std::string name{config::constants::DEFAULT_LOGGER};
        if (auto existing = spdlog::get(name)) return existing;
        auto created = spdlog::stdout_color_mt(name);
        created->set_pattern(std::string{kPlainPattern});
        return created;
    }();
    return lg;
}

void configure_logging(const LoggingConfig& cfg) {
    auto lg = logger();
    lg->set_level(spdlog::level::from_str(cfg.level));
    lg->set_pattern(std::string{cfg.json ? kJsonPattern : kPlainPattern});
    lg->flush_on(spdlog::level::warn);
}

} // namespace trellis::obs
