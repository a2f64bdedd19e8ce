#include <gtest/gtest.h>
#include "invest/backtest.hpp"
#include "invest/portfolio.hpp"
#include "test_support.hpp"

#include <cmath>
#include <vector>

using namespace invest;
using namespace invest::backtest;
using namespace invest::portfolio;
using namespace invest::testing;

namespace {

Decision decision_with(std::vector<Order> orders, std::string symbol = "TEST") {
    Decision d;
    d.symbol = std::move(symbol);
    d.orders = std::move(orders);
    return d;
}

Order buy(double weight, std::string symbol = "TEST") {
    return Order{.symbol = std::move(symbol), .action = OrderAction::Buy, .weight = weight};
}

}  // namespace

// ─── Effective weight ─────────────────────────────────────────────────────────

TEST(BacktestEvaluator_Weight, OnlyBuyOrdersForDecisionSymbol) {
    auto d = decision_with({buy(0.1), buy(0.2, "OTHER"),
                            Order{.symbol = "TEST", .action = OrderAction::Hold, .weight = 0.5},
                            buy(0.05)});
    EXPECT_NEAR(BacktestEvaluator::effective_weight(d), 0.15, 1e-12);
}

TEST(BacktestEvaluator_Weight, NoOrders_Zero) {
    EXPECT_DOUBLE_EQ(BacktestEvaluator::effective_weight(decision_with({})), 0.0);
}

// ─── Metrics ──────────────────────────────────────────────────────────────────

TEST(BacktestEvaluator_Metrics, ZeroWeight_FlatCurve) {
    const auto series = series_from_closes({100.0, 120.0, 80.0, 130.0});
    const auto report = BacktestEvaluator{}.backtest(decision_with({}), series);

    EXPECT_DOUBLE_EQ(report.total_return, 0.0);
    EXPECT_DOUBLE_EQ(report.annualized_return, 0.0);
    EXPECT_DOUBLE_EQ(report.sharpe_ratio, 0.0);
    EXPECT_DOUBLE_EQ(report.max_drawdown, 0.0);
    EXPECT_DOUBLE_EQ(report.cumulative_returns.at("portfolio"), 0.0);
    EXPECT_EQ(report.start_date, series.bars.front().date);
    EXPECT_EQ(report.end_date, series.bars.back().date);
}

TEST(BacktestEvaluator_Metrics, FullWeight_UpThenDown) {
    // returns 0, +10 %, −10 % → curve 1, 1.1, 0.99
    const auto series = series_from_closes({100.0, 110.0, 99.0});
    const auto report = BacktestEvaluator{}.backtest(decision_with({buy(1.0)}), series);

    EXPECT_NEAR(report.total_return, -0.01, 1e-12);
    EXPECT_NEAR(report.annualized_return, 0.0, 1e-12);
    EXPECT_NEAR(report.sharpe_ratio, 0.0, 1e-9);
    EXPECT_NEAR(report.max_drawdown, -0.1, 1e-12);
    EXPECT_NEAR(report.cumulative_returns.at("portfolio"), -0.01, 1e-12);
}

TEST(BacktestEvaluator_Metrics, HalfWeight_KnownSharpe) {
    // returns {0, 0.1}: mean 0.05, sample σ = 0.1/√2
    const auto series = series_from_closes({100.0, 110.0});
    const auto report = BacktestEvaluator{}.backtest(decision_with({buy(0.5)}), series);

    const double annualized = 0.05 * 252.0 * 0.5;
    const double sharpe     = annualized / ((0.1 / std::sqrt(2.0)) * std::sqrt(252.0) * 0.5);
    EXPECT_NEAR(report.total_return, 0.05, 1e-12);
    EXPECT_NEAR(report.annualized_return, annualized, 1e-9);
    EXPECT_NEAR(report.sharpe_ratio, sharpe, 1e-9);
    EXPECT_DOUBLE_EQ(report.max_drawdown, 0.0);
}

TEST(BacktestEvaluator_Metrics, WeeklySeries_UsesWeeklyAnnualisation) {
    const auto series = series_from_closes({100.0, 110.0}, day(2024, 1, 5), BarInterval::Weekly);
    const auto report = BacktestEvaluator{}.backtest(decision_with({buy(1.0)}), series);
    EXPECT_NEAR(report.annualized_return, 0.05 * 52.0, 1e-9);
}

TEST(BacktestEvaluator_Metrics, ConfigOverridesPeriodsPerYear) {
    const BacktestEvaluator evaluator(BacktestConfig{.periods_per_year = 365.0});
    const auto series = series_from_closes({100.0, 110.0});
    const auto report = evaluator.backtest(decision_with({buy(1.0)}), series);
    EXPECT_NEAR(report.annualized_return, 0.05 * 365.0, 1e-9);
}

TEST(BacktestEvaluator_Metrics, OrdersForOtherSymbolsIgnored) {
    const auto series = series_from_closes({100.0, 110.0, 121.0});
    const auto report = BacktestEvaluator{}.backtest(decision_with({buy(1.0, "OTHER")}), series);
    EXPECT_DOUBLE_EQ(report.total_return, 0.0);
}

// ─── Degenerate input ─────────────────────────────────────────────────────────

TEST(BacktestEvaluator_Degenerate, EmptySeries_ZeroMetricsNoDates) {
    const auto report = BacktestEvaluator{}.backtest(decision_with({buy(0.2)}), PriceSeries{});
    EXPECT_FALSE(report.start_date.has_value());
    EXPECT_FALSE(report.end_date.has_value());
    EXPECT_DOUBLE_EQ(report.total_return, 0.0);
    EXPECT_DOUBLE_EQ(report.sharpe_ratio, 0.0);
    EXPECT_DOUBLE_EQ(report.cumulative_returns.at("portfolio"), 0.0);
}

TEST(BacktestEvaluator_Degenerate, SingleBar_AllFinite) {
    const auto report = BacktestEvaluator{}.backtest(decision_with({buy(0.2)}),
                                                     series_from_closes({100.0}));
    EXPECT_DOUBLE_EQ(report.total_return, 0.0);
    EXPECT_DOUBLE_EQ(report.annualized_return, 0.0);
    EXPECT_DOUBLE_EQ(report.sharpe_ratio, 0.0);
    EXPECT_DOUBLE_EQ(report.max_drawdown, 0.0);
}

TEST(BacktestEvaluator_Degenerate, ConstantPrices_SharpeZero) {
    const auto report = BacktestEvaluator{}.backtest(
        decision_with({buy(0.2)}), series_from_closes(std::vector<double>(10, 50.0)));
    EXPECT_DOUBLE_EQ(report.sharpe_ratio, 0.0);
    EXPECT_DOUBLE_EQ(report.total_return, 0.0);
}

TEST(BacktestEvaluator_Report, ToStringMentionsDatesAndMetrics) {
    const auto series = series_from_closes({100.0, 110.0}, day(2024, 2, 1));
    const auto text = BacktestEvaluator{}.backtest(decision_with({buy(1.0)}), series).to_string();
    EXPECT_NE(text.find("2024-02-01"), std::string::npos);
    EXPECT_NE(text.find("Sharpe="), std::string::npos);
}
