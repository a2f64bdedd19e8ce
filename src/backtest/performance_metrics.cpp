/// @file src/backtest/performance_metrics.cpp
/// @brief PerformanceCalculator: mean, dispersion, returns and drawdown.
///
/// Statistics are evaluated on Eigen array maps over the caller's storage.
/// Undefined results are reported as std::nullopt; nothing here throws.

#include "invest/backtest.hpp"
#include "invest/constants.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>

namespace invest::backtest {

namespace {

using ConstArrayMap = Eigen::Map<const Eigen::ArrayXd>;

[[nodiscard]] ConstArrayMap as_array(std::span<const double> v) noexcept {
    return ConstArrayMap(v.data(), static_cast<Eigen::Index>(v.size()));
}

/// Sum of squared deviations from `mean`.
[[nodiscard]] double squared_deviation(std::span<const double> v, double mean) noexcept {
    return (as_array(v) - mean).square().sum();
}

}  // namespace

// ─── Moments ──────────────────────────────────────────────────────────────────

std::optional<double>
PerformanceCalculator::mean(std::span<const double> values) noexcept {
    if (values.empty()) return std::nullopt;
    return as_array(values).mean();
}

std::optional<double>
PerformanceCalculator::sample_stddev(std::span<const double> values) noexcept {
    if (values.size() < 2) return std::nullopt;
    const double mu = as_array(values).mean();
    return std::sqrt(squared_deviation(values, mu) /
                     static_cast<double>(values.size() - 1));
}

std::optional<double>
PerformanceCalculator::population_stddev(std::span<const double> values) noexcept {
    if (values.empty()) return std::nullopt;
    const double mu = as_array(values).mean();
    return std::sqrt(squared_deviation(values, mu) /
                     static_cast<double>(values.size()));
}

// ─── Returns / Volatility ─────────────────────────────────────────────────────

std::vector<double>
PerformanceCalculator::simple_returns(std::span<const double> prices) {
    if (prices.size() < 2) return {};

    std::vector<double> rets;
    rets.reserve(prices.size() - 1);
    for (std::size_t i = 1; i < prices.size(); ++i) {
        const double prev = prices[i - 1];
        const double curr = prices[i];
        if (!std::isfinite(prev) || !std::isfinite(curr) || prev <= 0.0) {
            rets.push_back(0.0);
        } else {
            rets.push_back((curr - prev) / prev);
        }
    }
    return rets;
}

std::vector<double>
PerformanceCalculator::valid_returns(std::span<const double> prices) {
    std::vector<double> valid;
    if (prices.size() < 2) return valid;
    valid.reserve(prices.size() - 1);
    for (std::size_t i = 1; i < prices.size(); ++i) {
        const double prev = prices[i - 1];
        const double curr = prices[i];
        if (std::isfinite(prev) && std::isfinite(curr) && prev > 0.0) {
            valid.push_back((curr - prev) / prev);
        }
    }
    return valid;
}

double PerformanceCalculator::annualized_volatility(std::span<const double> prices,
                                                    double periods_per_year) {
    const std::vector<double> valid = valid_returns(prices);
    if (valid.size() < constants::MIN_VOLATILITY_RETURNS) return 0.0;
    if (!(periods_per_year > 0.0)) return 0.0;

    const auto sd = population_stddev(valid);
    if (!sd || !std::isfinite(*sd)) return 0.0;
    return *sd * std::sqrt(periods_per_year);
}

// ─── Drawdown ─────────────────────────────────────────────────────────────────

double PerformanceCalculator::max_drawdown(std::span<const double> curve) noexcept {
    double peak  = 0.0;
    double worst = 0.0;
    bool   first = true;

    for (double value : curve) {
        if (!std::isfinite(value)) continue;
        if (first || value > peak) {
            peak  = value;
            first = false;
        }
        if (peak > 0.0) {
            worst = std::min(worst, (value - peak) / peak);
        }
    }
    return worst;
}

double PerformanceCalculator::periods_per_year(BarInterval interval) noexcept {
    switch (interval) {
        case BarInterval::Daily:   return constants::TRADING_DAYS_PER_YEAR;
        case BarInterval::Weekly:  return constants::WEEKS_PER_YEAR;
        case BarInterval::Monthly: return constants::MONTHS_PER_YEAR;
    }
    return constants::TRADING_DAYS_PER_YEAR;
}

}  // namespace invest::backtest
