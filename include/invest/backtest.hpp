#pragma once

/// @file include/invest/backtest.hpp
/// @brief Backtest evaluator and shared performance statistics: public API.
///
/// # Module: BacktestEvaluator
///
/// ## Responsibility
/// Replay a Decision's implied position weight against the historical price
/// series and report return, Sharpe ratio and drawdown.
///
/// ## Model
/// With simple returns r_t (r_0 = 0) and cumulative curve
///     C_t = Π_{s ≤ t} (1 + r_s)
/// holding a fraction w of capital in the asset and the rest in cash gives
///     P_t = 1 + w · (C_t − 1)
///
/// ## Metrics
///   - total_return      = P_last − 1
///   - annualized_return = mean(r) · ppy · w
///   - sharpe_ratio      = annualized_return / (σ(r) · √ppy · max(w, ε))
///   - max_drawdown      = min_t (P_t − max_{s≤t} P_s) / max_{s≤t} P_s   (≤ 0)
///
/// ## Guarantees
/// - Every reported field is finite; zero denominators yield 0.0
/// - `PerformanceCalculator` never throws and returns `std::optional` for
///   undefined statistics

#include "invest/types.hpp"
#include "invest/constants.hpp"

#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace invest::portfolio {
struct Decision;
}  // namespace invest::portfolio

namespace invest::backtest {

// ─── Types ────────────────────────────────────────────────────────────────────

/// Retrospective performance of one Decision.
struct BacktestReport {
    std::optional<Date> start_date;          ///< First bar (absent for an empty series)
    std::optional<Date> end_date;            ///< Last bar
    double total_return      = 0.0;
    double annualized_return = 0.0;
    double sharpe_ratio      = 0.0;
    double max_drawdown      = 0.0;          ///< ≤ 0
    std::map<std::string, double> cumulative_returns;  ///< {"portfolio": total_return}

    /// Human-readable summary line.
    [[nodiscard]] std::string to_string() const;
};

/// Configuration for the evaluator.
struct BacktestConfig {
    /// Overrides the interval-derived annualisation factor when set.
    std::optional<double> periods_per_year;
};

// ─── PerformanceCalculator ────────────────────────────────────────────────────

/// Stateless statistics shared by the agents and the evaluator.
class PerformanceCalculator {
public:
    /// Arithmetic mean; `nullopt` on empty input.
    [[nodiscard]] static std::optional<double>
    mean(std::span<const double> values) noexcept;

    /// Sample standard deviation (n − 1); `nullopt` for fewer than 2 values.
    [[nodiscard]] static std::optional<double>
    sample_stddev(std::span<const double> values) noexcept;

    /// Population standard deviation (n); `nullopt` on empty input.
    [[nodiscard]] static std::optional<double>
    population_stddev(std::span<const double> values) noexcept;

    /// Close-to-close simple returns, length `prices.size() − 1`.
    /// A pair with a non-finite or non-positive base contributes 0.0.
    [[nodiscard]] static std::vector<double>
    simple_returns(std::span<const double> prices);

    /// Simple returns of consecutive pairs with finite prices and a positive
    /// base; other pairs are dropped.
    [[nodiscard]] static std::vector<double>
    valid_returns(std::span<const double> prices);

    /// Annualised volatility: population σ of the valid simple returns × √ppy.
    ///
    /// Only pairs with finite prices and a positive base count as valid.
    /// Returns 0.0 when fewer than MIN_VOLATILITY_RETURNS valid returns exist.
    [[nodiscard]] static double
    annualized_volatility(std::span<const double> prices,
                          double periods_per_year = constants::TRADING_DAYS_PER_YEAR);

    /// Deepest relative decline of `curve` below its running maximum.
    ///
    /// # Returns
    /// A value in [−1, 0]; 0.0 for an empty or monotonically rising curve.
    [[nodiscard]] static double
    max_drawdown(std::span<const double> curve) noexcept;

    /// Annualisation factor for a bar interval: 252 / 52 / 12.
    [[nodiscard]] static double periods_per_year(BarInterval interval) noexcept;
};

// ─── BacktestEvaluator ────────────────────────────────────────────────────────

/// Evaluates the position implied by a Decision over a price series.
class BacktestEvaluator {
public:
    explicit BacktestEvaluator(BacktestConfig config = BacktestConfig{});

    /// Run the evaluation.
    ///
    /// The effective weight is the sum of `weight` over the decision's `buy`
    /// orders for its own symbol (zero when there are none).
    [[nodiscard]] BacktestReport
    backtest(const portfolio::Decision& decision,
             const PriceSeries& series) const;

    /// Total effective weight the evaluator would apply to `decision`.
    [[nodiscard]] static double effective_weight(const portfolio::Decision& decision) noexcept;

private:
    BacktestConfig config_;
};

}  // namespace invest::backtest
