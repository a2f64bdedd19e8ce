#pragma once

/// @file include/invest/market_data.hpp
/// @brief Market-data collaborator interface and its two providers.
///
/// # Module: Market Data
///
/// The pipeline asks its collaborator for three things per symbol: a price
/// history, a fundamentals snapshot and recent news.  Missing or partial
/// data is represented (empty series, `nullopt` metrics, empty news list);
/// only a hard failure to obtain prices raises `MarketDataError`.
///
/// Providers:
///   - `CsvMarketData`       files under a data directory
///   - `SyntheticMarketData` deterministic offline data seeded per request

#include "invest/types.hpp"
#include "invest/constants.hpp"

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace invest::core {

/// Failure to obtain data for one symbol.
class MarketDataError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ─── MarketDataProvider ───────────────────────────────────────────────────────

class MarketDataProvider {
public:
    virtual ~MarketDataProvider() = default;

    /// Bars for `symbol` within [start, end] at `interval`.
    [[nodiscard]] virtual PriceSeries
    price_history(const std::string& symbol, Date start, Date end,
                  BarInterval interval = BarInterval::Daily) = 0;

    /// Fundamental metrics (keys as consumed by FundamentalAnalyst).
    [[nodiscard]] virtual Fundamentals fundamentals(const std::string& symbol) = 0;

    /// Up to `limit` recent news items, most recent first.
    [[nodiscard]] virtual std::vector<NewsItem>
    recent_news(const std::string& symbol,
                std::size_t limit = constants::DEFAULT_NEWS_LIMIT) = 0;
};

// ─── CsvMarketData ────────────────────────────────────────────────────────────

/// Reads `<dir>/<SYMBOL>.csv`, and optionally `<dir>/<SYMBOL>.fundamentals.json`
/// (object of number|null) and `<dir>/<SYMBOL>.news.json`
/// (array of {"title", "summary"}).
class CsvMarketData final : public MarketDataProvider {
public:
    explicit CsvMarketData(std::filesystem::path directory);

    /// # Errors
    /// `MarketDataError` when the price file is missing or unreadable.
    /// Weekly/monthly requests resample daily rows to the last bar of each
    /// week/month.
    [[nodiscard]] PriceSeries
    price_history(const std::string& symbol, Date start, Date end,
                  BarInterval interval = BarInterval::Daily) override;

    /// Empty when the file is absent; `MarketDataError` when malformed.
    [[nodiscard]] Fundamentals fundamentals(const std::string& symbol) override;

    /// Empty when the file is absent; `MarketDataError` when malformed.
    [[nodiscard]] std::vector<NewsItem>
    recent_news(const std::string& symbol,
                std::size_t limit = constants::DEFAULT_NEWS_LIMIT) override;

private:
    std::filesystem::path directory_;
};

// ─── SyntheticMarketData ──────────────────────────────────────────────────────

/// Deterministic offline data.
///
/// Prices follow close_t = 100 · exp(Σ ε_s), ε ~ N(0.001, 0.02), on business
/// days (daily), Fridays (weekly) or month ends (monthly).  The random stream
/// is seeded from (symbol, start, end, interval), so identical requests
/// return identical series.
class SyntheticMarketData final : public MarketDataProvider {
public:
    /// # Errors
    /// `MarketDataError` when the range contains no trading periods.
    [[nodiscard]] PriceSeries
    price_history(const std::string& symbol, Date start, Date end,
                  BarInterval interval = BarInterval::Daily) override;

    /// Heuristic metrics derived from a stable hash of the symbol.
    [[nodiscard]] Fundamentals fundamentals(const std::string& symbol) override;

    /// Placeholder headlines "Offline headline i for SYMBOL".
    [[nodiscard]] std::vector<NewsItem>
    recent_news(const std::string& symbol,
                std::size_t limit = constants::DEFAULT_NEWS_LIMIT) override;

    /// FNV-1a 64-bit hash; stable across runs and platforms.
    [[nodiscard]] static std::uint64_t stable_hash(std::string_view text) noexcept;

    /// Trading periods in [start, end] for `interval`.
    [[nodiscard]] static std::vector<Date>
    trading_calendar(Date start, Date end, BarInterval interval);
};

}  // namespace invest::core
