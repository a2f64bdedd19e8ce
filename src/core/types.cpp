/// @file src/core/types.cpp
/// @brief Calendar helpers and PriceSeries accessors.

#include "invest/types.hpp"

#include <fmt/format.h>

#include <charconv>

namespace invest {

namespace {

/// Parse exactly `text.size()` decimal digits.
[[nodiscard]] std::optional<int> parse_digits(std::string_view text) noexcept {
    int value = 0;
    const auto* first = text.data();
    const auto* last  = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return value;
}

}  // namespace

// ─── Calendar ─────────────────────────────────────────────────────────────────

std::string to_iso_date(Date date) {
    const std::chrono::year_month_day ymd{date};
    return fmt::format("{:04d}-{:02d}-{:02d}",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()));
}

std::optional<Date> parse_iso_date(std::string_view text) noexcept {
    // Layout: YYYY-MM-DD
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    const auto y = parse_digits(text.substr(0, 4));
    const auto m = parse_digits(text.substr(5, 2));
    const auto d = parse_digits(text.substr(8, 2));
    if (!y || !m || !d) return std::nullopt;

    const std::chrono::year_month_day ymd{
        std::chrono::year{*y},
        std::chrono::month{static_cast<unsigned>(*m)},
        std::chrono::day{static_cast<unsigned>(*d)}};
    if (!ymd.ok()) return std::nullopt;
    return Date{ymd};
}

// ─── BarInterval ──────────────────────────────────────────────────────────────

std::string_view to_string(BarInterval interval) noexcept {
    switch (interval) {
        case BarInterval::Daily:   return "1d";
        case BarInterval::Weekly:  return "1wk";
        case BarInterval::Monthly: return "1mo";
    }
    return "1d";
}

std::optional<BarInterval> parse_interval(std::string_view text) noexcept {
    if (text == "1d")  return BarInterval::Daily;
    if (text == "1wk") return BarInterval::Weekly;
    if (text == "1mo") return BarInterval::Monthly;
    return std::nullopt;
}

// ─── PriceSeries ──────────────────────────────────────────────────────────────

std::vector<double> PriceSeries::closes() const {
    std::vector<double> out;
    out.reserve(bars.size());
    for (const auto& bar : bars) {
        out.push_back(bar.close);
    }
    return out;
}

}  // namespace invest
