/**
 * @file duration.cpp
 * @brief Go-style duration parsing/formatting at millisecond resolution.
 * @details Parsing accumulates integer nanoseconds; anything beyond int64 nanoseconds is out of range.
 */
#include "trellis/util/duration.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <limits>
#include <system_error>

namespace trellis::util {

namespace {

/// Unit multipliers in nanoseconds.
struct Unit { std::string_view suffix; std::int64_t nanos; };

constexpr Unit kUnits[] = {
    {"ns", 1},
    {"us", 1'000},
    {"ms", 1'000'000},
    {"s",  1'000'000'000},
    {"m",  60'000'000'000},
    {"h",  3'600'000'000'000},
};

constexpr std::int64_t kMaxNanos = std::numeric_limits<std::int64_t>::max();

std::size_t digit_run(std::string_view s) {
    std::size_t i = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    return i;
}

} // namespace

trellis_detail::expected<Duration, std::string> parse_duration(std::string_view text) {
    const std::string original{text};
    const auto invalid = [&original] { return trellis_detail::unexpected("invalid duration \"" + original + "\""); };
    const auto out_of_range = [&original] {
        return trellis_detail::unexpected("duration \"" + original + "\" out of range");
    };
    if (text.empty()) return trellis_detail::unexpected(std::string{"empty duration"});

    bool negative = false;
    if (text.front() == '-' || text.front() == '+') {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }
    if (text == "0") return Duration{0};
    if (text.empty()) return invalid();

    std::int64_t total_ns = 0;
    while (!text.empty()) {
        // number: integer digits with an optional fractional part
        const auto int_len = digit_run(text);
        const auto int_digits = text.substr(0, int_len);
        text.remove_prefix(int_len);
        std::string_view frac_digits;
        if (!text.empty() && text.front() == '.') {
            text.remove_prefix(1);
            const auto frac_len = digit_run(text);
            frac_digits = text.substr(0, frac_len);
            text.remove_prefix(frac_len);
        }
        if (int_digits.empty() && frac_digits.empty()) return invalid();

        std::int64_t whole = 0;
        if (!int_digits.empty()) {
            const auto [ptr, ec] = std::from_chars(int_digits.data(), int_digits.data() + int_digits.size(), whole);
            if (ec == std::errc::result_out_of_range) return out_of_range();
            if (ec != std::errc{} || ptr != int_digits.data() + int_digits.size()) return invalid();
        }

        // unit: longest alphabetic run
        std::size_t u = 0;
        while (u < text.size() && std::isalpha(static_cast<unsigned char>(text[u]))) ++u;
        const auto suffix = text.substr(0, u);
        const Unit* unit = nullptr;
        for (const auto& k : kUnits) {
            if (k.suffix == suffix) { unit = &k; break; }
        }
        if (unit == nullptr) {
            if (suffix.empty()) return trellis_detail::unexpected("missing unit in duration \"" + original + "\"");
            return trellis_detail::unexpected("unknown unit \"" + std::string{suffix} + "\" in duration \"" + original + "\"");
        }
        text.remove_prefix(u);

        if (whole > kMaxNanos / unit->nanos) return out_of_range();
        std::int64_t segment = whole * unit->nanos;

        // fraction: digits beyond the unit's nanosecond precision are dropped
        std::int64_t frac_ns = 0;
        std::int64_t scale = unit->nanos;
        for (const char c : frac_digits) {
            if (scale < 10) break;
            scale /= 10;
            frac_ns += (c - '0') * scale;
        }
        if (segment > kMaxNanos - frac_ns) return out_of_range();
        segment += frac_ns;

        if (total_ns > kMaxNanos - segment) return out_of_range();
        total_ns += segment;
    }

    // positive sub-millisecond values round up to 1ms
    auto ms = total_ns / 1'000'000;
    if (ms == 0 && total_ns > 0) ms = 1;
    return Duration{negative ? -ms : ms};
}

std::string format_duration(Duration d) {
    if (d.count() == 0) return "0s";
    std::string out;
    auto ms = d.count();
    if (ms < 0) { out.push_back('-'); ms = -ms; }
    if (ms < 1000) return out + std::to_string(ms) + "ms";

    const auto h = ms / 3'600'000;
    ms %= 3'600'000;
    const auto m = ms / 60'000;
    ms %= 60'000;
    const auto s = ms / 1000;
    const auto frac = ms % 1000;

    if (h > 0) out += std::to_string(h) + "h";
    if (h > 0 || m > 0) out += std::to_string(m) + "m";
    out += std::to_string(s);
    if (frac != 0) {
        std::string f = std::to_string(frac);
        f.insert(0, 3 - f.size(), '0');
        while (!f.empty() && f.back() == '0') f.pop_back();
        out += "." + f;
    }
    out += "s";
    return out;
}

} // namespace trellis::util
