#pragma once

/// @file include/invest/types.hpp
/// @brief Shared value types for the investment meeting pipeline.
///
/// Every module includes this file. It defines the market-data records
/// consumed by the pipeline and the calendar helpers used to print and parse
/// ISO dates.

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace invest {

// ─── Calendar ─────────────────────────────────────────────────────────────────

/// A trading day.
using Date = std::chrono::sys_days;

/// Format a date as `YYYY-MM-DD`.
[[nodiscard]] std::string to_iso_date(Date date);

/// Parse a `YYYY-MM-DD` string.
///
/// # Returns
/// `nullopt` for malformed text or an invalid calendar day (e.g. 2023-02-30).
[[nodiscard]] std::optional<Date> parse_iso_date(std::string_view text) noexcept;

// ─── Price Data ───────────────────────────────────────────────────────────────

/// A single OHLCV bar.
struct PriceBar {
    Date   date;    ///< Trading period (strictly increasing within a series)
    double open;    ///< Opening price
    double high;    ///< High price
    double low;     ///< Low price
    double close;   ///< Closing price (> 0)
    double volume;  ///< Traded volume
};

/// Sampling interval of a price series.
enum class BarInterval { Daily, Weekly, Monthly };

/// Short name used by the CLI and the data providers ("1d", "1wk", "1mo").
[[nodiscard]] std::string_view to_string(BarInterval interval) noexcept;

/// Parse "1d" / "1wk" / "1mo".
[[nodiscard]] std::optional<BarInterval> parse_interval(std::string_view text) noexcept;

/// Ordered-by-date sequence of bars.
struct PriceSeries {
    std::vector<PriceBar> bars;
    BarInterval           interval = BarInterval::Daily;

    [[nodiscard]] bool        empty() const noexcept { return bars.empty(); }
    [[nodiscard]] std::size_t size()  const noexcept { return bars.size(); }

    /// Close prices in bar order.
    [[nodiscard]] std::vector<double> closes() const;
};

// ─── Fundamentals / News ──────────────────────────────────────────────────────

/// Fundamental metric name → value; a metric the source could not supply is
/// stored as `nullopt`.
using Fundamentals = std::map<std::string, std::optional<double>>;

/// Headline plus optional summary.
struct NewsItem {
    std::string title;
    std::string summary;
};

}  // namespace invest
