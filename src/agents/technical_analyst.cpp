/// @file src/agents/technical_analyst.cpp
/// @brief TechnicalAnalyst: trend, momentum and mean-reversion scoring.

#include "invest/agents.hpp"
#include "invest/backtest.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace invest::agents {

namespace {

/// A finite indicator value, or nullopt.
[[nodiscard]] std::optional<double> finite(const std::optional<double>& v) noexcept {
    if (v && std::isfinite(*v)) return v;
    return std::nullopt;
}

[[nodiscard]] std::string join(const std::vector<std::string>& parts) {
    return fmt::format("{}", fmt::join(parts, "; "));
}

}  // namespace

AgentReport TechnicalAnalyst::analyze(const AnalysisContext& context) const {
    const auto& prices = context.prices;
    const auto& table  = context.indicators;
    const auto& meta   = table.meta();

    AgentReport report{
        .agent_name = std::string(name()),
        .symbol     = context.symbol,
        .score      = 0.0,
        .rationale  = {},
        .metadata   = Metadata::object(),
    };

    if (prices.empty()) {
        report.rationale = "No price history available";
        report.metadata  = {{"indicators_available", false},
                            {"price_points", 0},
                            {"required_points", meta.min_required}};
        return report;
    }

    if (table.empty() || meta.insufficient_history) {
        report.rationale = "Insufficient price history to compute indicators";
        report.metadata  = {{"indicators_available", false},
                            {"price_points", prices.size()},
                            {"required_points", meta.min_required}};
        return report;
    }

    const indicators::IndicatorRow& latest_row = *table.latest();
    const double close = prices.bars.back().close;

    double trend = 0.0;
    std::vector<std::string> reasons;

    // ── Trend direction ─────────────────────────────────────────────────────
    const auto sma_fast = finite(latest_row.get("sma_20"));
    const auto sma_slow = finite(latest_row.get("sma_50"));
    if (sma_fast && sma_slow) {
        if (*sma_fast > *sma_slow) {
            trend += 0.3;
            reasons.emplace_back("SMA20 above SMA50");
        } else {
            trend -= 0.3;
            reasons.emplace_back("SMA20 below SMA50");
        }
    }

    // ── Momentum ────────────────────────────────────────────────────────────
    if (const auto hist = finite(latest_row.get("macd_hist"))) {
        if (*hist > 0.0) {
            trend += 0.2;
            reasons.emplace_back("MACD histogram positive");
        } else {
            trend -= 0.2;
            reasons.emplace_back("MACD histogram negative");
        }
    }

    // ── RSI banding ─────────────────────────────────────────────────────────
    if (const auto rsi = finite(latest_row.get("rsi"))) {
        if (*rsi >= 45.0 && *rsi <= 70.0) {
            trend += 0.2;
            reasons.push_back(fmt::format("RSI neutral-positive ({:.1f})", *rsi));
        } else if (*rsi < 35.0) {
            trend -= 0.1;
            reasons.push_back(fmt::format("RSI oversold ({:.1f})", *rsi));
        } else if (*rsi > 75.0) {
            trend -= 0.2;
            reasons.push_back(fmt::format("RSI overbought ({:.1f})", *rsi));
        }
    }

    // ── Bollinger mean reversion ────────────────────────────────────────────
    const auto bb_upper = finite(latest_row.get("bb_upper"));
    const auto bb_lower = finite(latest_row.get("bb_lower"));
    if (bb_upper && bb_lower && std::isfinite(close)) {
        if (close < *bb_lower) {
            trend += 0.1;
            reasons.emplace_back("Price near Bollinger lower band");
        } else if (close > *bb_upper) {
            trend -= 0.1;
            reasons.emplace_back("Price near Bollinger upper band");
        }
    }

    // ── Volatility dampener ─────────────────────────────────────────────────
    const std::vector<double> closes = prices.closes();
    const double volatility =
        backtest::PerformanceCalculator::annualized_volatility(closes);
    trend += std::clamp(0.2 - volatility, -0.2, 0.2);
    reasons.push_back(fmt::format("Annualized volatility {:.2f}", volatility));

    Metadata latest = Metadata::object();
    for (const auto& [key, value] : latest_row.values) {
        latest[key] = value;
    }

    report.score     = bounded_score(trend);
    report.rationale = join(reasons);
    report.metadata  = {{"indicators_available", true},
                        {"close", close},
                        {"volatility", volatility},
                        {"latest_indicators", std::move(latest)}};
    return report;
}

}  // namespace invest::agents
