#pragma once
/**
 * @file error.hpp
 * @brief Error value returned by configuration loading.
 */

#include <cstdint>
#include <string>
#include <string_view>

namespace trellis::config {

enum class ConfigErrc : std::uint8_t {
    FileNotFound,   ///< Path does not exist or cannot be opened.
    ParseError,     ///< Not well-formed YAML/JSON.
    InvalidValue    ///< Well-formed, but a field is out of range or of the wrong type.
};

std::string_view to_string(ConfigErrc c) noexcept;

struct ConfigError {
    ConfigErrc  code{ConfigErrc::InvalidValue};
    std::string message;
};

} // namespace trellis::config
