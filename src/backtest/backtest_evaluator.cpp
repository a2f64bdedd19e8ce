/// @file src/backtest/backtest_evaluator.cpp
/// @brief BacktestEvaluator: replay a Decision's weight over historical closes.
///
/// Steps:
///   1. Effective weight from the decision's buy orders
///   2. Simple returns, leading return = 0
///   3. Cumulative curve and weighted portfolio curve
///   4. Total / annualised return, Sharpe, max drawdown

#include "invest/backtest.hpp"
#include "invest/portfolio.hpp"
#include "invest/constants.hpp"

#include <Eigen/Dense>
#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace invest::backtest {

namespace {

/// x if finite, otherwise 0.0.
[[nodiscard]] double finite_or_zero(double x) noexcept {
    return std::isfinite(x) ? x : 0.0;
}

}  // namespace

// ─── BacktestReport ───────────────────────────────────────────────────────────

std::string BacktestReport::to_string() const {
    return fmt::format(
        "{} → {}  TotalReturn={:+.4f}  Annualized={:+.4f}  Sharpe={:.4f}  MaxDrawdown={:.4f}",
        start_date ? to_iso_date(*start_date) : std::string("n/a"),
        end_date   ? to_iso_date(*end_date)   : std::string("n/a"),
        total_return, annualized_return, sharpe_ratio, max_drawdown);
}

// ─── BacktestEvaluator ────────────────────────────────────────────────────────

BacktestEvaluator::BacktestEvaluator(BacktestConfig config)
    : config_(config) {}

double BacktestEvaluator::effective_weight(const portfolio::Decision& decision) noexcept {
    double weight = 0.0;
    for (const auto& order : decision.orders) {
        if (order.action == portfolio::OrderAction::Buy &&
            order.symbol == decision.symbol &&
            std::isfinite(order.weight)) {
            weight += order.weight;
        }
    }
    return weight;
}

BacktestReport BacktestEvaluator::backtest(const portfolio::Decision& decision,
                                           const PriceSeries& series) const {
    BacktestReport report;
    report.cumulative_returns["portfolio"] = 0.0;
    if (series.empty()) {
        return report;
    }

    report.start_date = series.bars.front().date;
    report.end_date   = series.bars.back().date;

    const double weight = effective_weight(decision);
    const double ppy = config_.periods_per_year.value_or(
        PerformanceCalculator::periods_per_year(series.interval));

    // ── Returns with a zero leading entry ───────────────────────────────────
    const std::vector<double> closes = series.closes();
    std::vector<double> returns;
    returns.reserve(closes.size());
    returns.push_back(0.0);
    const auto tail = PerformanceCalculator::simple_returns(closes);
    returns.insert(returns.end(), tail.begin(), tail.end());

    // ── Curves ──────────────────────────────────────────────────────────────
    const Eigen::Index n = static_cast<Eigen::Index>(returns.size());
    Eigen::ArrayXd cumulative(n);
    double running = 1.0;
    for (Eigen::Index i = 0; i < n; ++i) {
        running *= 1.0 + returns[static_cast<std::size_t>(i)];
        cumulative[i] = running;
    }
    const Eigen::ArrayXd portfolio_curve = 1.0 + weight * (cumulative - 1.0);

    // ── Metrics ─────────────────────────────────────────────────────────────
    report.total_return = finite_or_zero(portfolio_curve[n - 1] - 1.0);

    const double mean_ret = PerformanceCalculator::mean(returns).value_or(0.0);
    report.annualized_return = finite_or_zero(mean_ret * ppy * weight);

    const double sd = PerformanceCalculator::sample_stddev(returns).value_or(0.0);
    const double denom = sd * std::sqrt(ppy) *
                         std::max(weight, constants::MIN_WEIGHT_EPSILON);
    if (std::isfinite(denom) && denom > 0.0) {
        report.sharpe_ratio = finite_or_zero(report.annualized_return / denom);
    }

    report.max_drawdown = PerformanceCalculator::max_drawdown(
        std::span<const double>(portfolio_curve.data(),
                                static_cast<std::size_t>(portfolio_curve.size())));

    report.cumulative_returns["portfolio"] = report.total_return;
    return report;
}

}  // namespace invest::backtest
