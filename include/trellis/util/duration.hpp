#pragma once
/**
 * @file duration.hpp
 * @brief Duration strings as written in resources ("10s", "1h30m", "250ms", "infinity").
 */

#include <chrono>
#include <string>
#include <string_view>

#include "trellis/compat/expected.hpp"

namespace trellis::util {

/// Resolution used for every policy duration in the model.
using Duration = std::chrono::milliseconds;

/**
 * @brief Parse a signed sequence of decimal numbers with unit suffixes
 *        (h, m, s, ms, us, ns), e.g. "1h30m", "-5s", "1.5s".
 * @return The duration truncated to milliseconds (a positive value below 1ms becomes 1ms),
 *         or a message describing the failure, including values too large to represent.
 */
trellis_detail::expected<Duration, std::string> parse_duration(std::string_view text);

/// Render a duration compactly ("1h0m0s", "10s", "250ms", "1.5s", "0s").
std::string format_duration(Duration d);

} // namespace trellis::util
