#pragma once

/// @file include/invest/indicators.hpp
/// @brief Technical indicator engine: public API.
///
/// # Module: IndicatorEngine
///
/// ## Responsibility
/// Derive a per-bar table of technical indicators from a price series:
///   - `sma_<w>` / `ema_<w>` for every configured window w
///   - `rsi` (Wilder-style exponential smoothing, period 14)
///   - `macd`, `macd_signal`, `macd_hist` (12/26/9)
///   - `bb_upper`, `bb_lower` (20-bar, ±2σ)
///
/// ## Warm-up Policy
/// A value that has not yet accumulated its lookback is absent from its row;
/// a row with no defined value at all is dropped.  When the input is shorter
/// than the largest window the table carries `insufficient_history = true`,
/// which is the single signal consumers use to avoid acting on partial data.
///
/// ## Guarantees
/// - The table never contains NaN or ±Inf
/// - `IndicatorMeta` is computed once and never modified
/// - Only `close` is read from the input bars

#include "invest/types.hpp"
#include "invest/constants.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace invest::indicators {

// ─── Types ────────────────────────────────────────────────────────────────────

/// Indicator values for one bar.  Undefined indicators are simply absent.
struct IndicatorRow {
    Date                                     date;
    std::map<std::string, double, std::less<>> values;

    /// Look up a value by name; `nullopt` if absent.
    [[nodiscard]] std::optional<double> get(std::string_view name) const;
};

/// Table-level metadata, fixed at computation time.
struct IndicatorMeta {
    bool        insufficient_history = true;
    std::size_t observations         = 0;  ///< Input series length
    std::size_t min_required         = 0;  ///< Largest configured window
};

/// Immutable indicator table.
class IndicatorTable {
public:
    IndicatorTable() = default;
    IndicatorTable(std::vector<IndicatorRow> rows, IndicatorMeta meta);

    [[nodiscard]] const std::vector<IndicatorRow>& rows() const noexcept { return rows_; }
    [[nodiscard]] const IndicatorMeta& meta() const noexcept { return meta_; }
    [[nodiscard]] bool        empty() const noexcept { return rows_.empty(); }
    [[nodiscard]] std::size_t size()  const noexcept { return rows_.size(); }

    /// Most recent row, or `nullptr` for an empty table.
    [[nodiscard]] const IndicatorRow* latest() const noexcept;

private:
    std::vector<IndicatorRow> rows_;
    IndicatorMeta             meta_{};
};

/// Lookback configuration.
struct IndicatorConfig {
    std::vector<std::size_t> windows{constants::DEFAULT_WINDOWS.begin(),
                                     constants::DEFAULT_WINDOWS.end()};
};

// ─── IndicatorEngine ──────────────────────────────────────────────────────────

/// Stateless indicator calculator.
class IndicatorEngine {
public:
    explicit IndicatorEngine(IndicatorConfig config = IndicatorConfig{});

    /// Compute the indicator table for `series`.
    ///
    /// A series containing a non-finite or non-positive close yields an empty
    /// table flagged `insufficient_history`.
    [[nodiscard]] IndicatorTable compute(const PriceSeries& series) const;

    /// Windows in use after dropping zeros and duplicates (ascending).
    [[nodiscard]] const std::vector<std::size_t>& windows() const noexcept {
        return windows_;
    }

    // ── Building blocks (exposed for tests) ──────────────────────────────────

    /// Trailing arithmetic mean; `nullopt` until `window` values are seen.
    [[nodiscard]] static std::vector<std::optional<double>>
    sma(std::span<const double> values, std::size_t window);

    /// Recursive exponential average y_t = α x_t + (1 − α) y_{t−1},
    /// seeded with y_0 = x_0.
    [[nodiscard]] static std::vector<double>
    ewm(std::span<const double> values, double alpha);

    /// EMA with span `window` (α = 2 / (window + 1)).
    [[nodiscard]] static std::vector<double>
    ema(std::span<const double> values, std::size_t window);

    /// RSI(period) on closes.  Index 0 is always `nullopt` (no delta yet).
    [[nodiscard]] static std::vector<std::optional<double>>
    rsi(std::span<const double> closes,
        std::size_t period = constants::RSI_PERIOD);

    /// Trailing sample standard deviation (n − 1); `nullopt` until
    /// `window` values are seen.
    [[nodiscard]] static std::vector<std::optional<double>>
    rolling_stddev(std::span<const double> values, std::size_t window);

private:
    std::vector<std::size_t> windows_;
};

}  // namespace invest::indicators
