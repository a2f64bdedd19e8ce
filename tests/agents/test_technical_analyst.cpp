#include <gtest/gtest.h>
#include "invest/agents.hpp"
#include "test_support.hpp"

#include <cmath>
#include <map>
#include <string>
#include <utility>
#include <vector>

using namespace invest;
using namespace invest::agents;
using namespace invest::testing;

TEST(TechnicalAnalyst_Insufficient, ShortHistory_NeutralScore) {
    const auto ctx    = price_context("AAPL", series_from_closes({100.0, 101.0, 102.0}));
    const auto report = TechnicalAnalyst{}.analyze(ctx);

    EXPECT_EQ(report.agent_name, "Technical Analyst");
    EXPECT_EQ(report.symbol, "AAPL");
    EXPECT_DOUBLE_EQ(report.score, 0.0);
    EXPECT_NE(report.rationale.find("Insufficient"), std::string::npos);
    EXPECT_FALSE(report.metadata.at("indicators_available").get<bool>());
    EXPECT_EQ(report.metadata.at("price_points").get<std::size_t>(), 3u);
    EXPECT_EQ(report.metadata.at("required_points").get<std::size_t>(), 200u);
}

TEST(TechnicalAnalyst_Insufficient, NoPrices_NeutralScore) {
    const auto ctx    = price_context("AAPL", PriceSeries{});
    const auto report = TechnicalAnalyst{}.analyze(ctx);

    EXPECT_DOUBLE_EQ(report.score, 0.0);
    EXPECT_EQ(report.rationale, "No price history available");
    EXPECT_FALSE(report.metadata.at("indicators_available").get<bool>());
}

TEST(TechnicalAnalyst_Trend, SteadyUptrend_PositiveScore) {
    const auto ctx    = price_context("UP", series_from_closes(geometric(250, 100.0, 0.001)));
    const auto report = TechnicalAnalyst{}.analyze(ctx);

    EXPECT_GT(report.score, 0.0);
    EXPECT_LE(report.score, 1.0);
    EXPECT_NE(report.rationale.find("SMA20 above SMA50"), std::string::npos);
    EXPECT_NE(report.rationale.find("MACD histogram positive"), std::string::npos);
    EXPECT_NE(report.rationale.find("RSI overbought"), std::string::npos);
    EXPECT_TRUE(report.metadata.at("indicators_available").get<bool>());
    EXPECT_TRUE(report.metadata.at("latest_indicators").contains("sma_200"));
}

// ─── Contributions on a hand-built indicator row ──────────────────────────────

namespace {

AnalysisContext context_with_row(std::map<std::string, double, std::less<>> values,
                                 double close) {
    const auto prices = series_from_closes({close, close, close, close, close});
    indicators::IndicatorRow row{.date = prices.bars.back().date, .values = std::move(values)};
    return AnalysisContext{
        .symbol       = "HAND",
        .prices       = prices,
        .indicators   = indicators::IndicatorTable(
            {row}, indicators::IndicatorMeta{.insufficient_history = false,
                                             .observations         = prices.size(),
                                             .min_required         = 5}),
        .fundamentals = {},
        .news         = {},
    };
}

}  // namespace

TEST(TechnicalAnalyst_Contributions, AllBearish) {
    // −0.3 trend, −0.2 momentum, −0.2 overbought, −0.1 above upper band,
    // +0.2 for zero volatility
    const auto ctx = context_with_row({{"sma_20", 90.0}, {"sma_50", 100.0},
                                       {"macd_hist", -1.0}, {"rsi", 80.0},
                                       {"bb_upper", 110.0}, {"bb_lower", 95.0}},
                                      120.0);
    const auto report = TechnicalAnalyst{}.analyze(ctx);
    EXPECT_NEAR(report.score, -0.6, 1e-12);
    EXPECT_NE(report.rationale.find("SMA20 below SMA50"), std::string::npos);
    EXPECT_NE(report.rationale.find("MACD histogram negative"), std::string::npos);
    EXPECT_NE(report.rationale.find("Bollinger upper band"), std::string::npos);
}

TEST(TechnicalAnalyst_Contributions, AllBullish_ClampedAtOne) {
    const auto ctx = context_with_row({{"sma_20", 110.0}, {"sma_50", 100.0},
                                       {"macd_hist", 1.0}, {"rsi", 60.0},
                                       {"bb_upper", 140.0}, {"bb_lower", 125.0}},
                                      120.0);
    const auto report = TechnicalAnalyst{}.analyze(ctx);
    EXPECT_NEAR(report.score, 1.0, 1e-12);
    EXPECT_NE(report.rationale.find("Bollinger lower band"), std::string::npos);
}

TEST(TechnicalAnalyst_Contributions, MissingColumnsSkipped) {
    // Only RSI (oversold) and the volatility term apply.
    const auto ctx    = context_with_row({{"rsi", 30.0}}, 100.0);
    const auto report = TechnicalAnalyst{}.analyze(ctx);
    EXPECT_NEAR(report.score, 0.1, 1e-12);
    EXPECT_EQ(report.rationale.find("SMA20"), std::string::npos);
}

TEST(TechnicalAnalyst_Contributions, RsiDeadBand_NoContribution) {
    // 70 < RSI ≤ 75 contributes nothing.
    const auto ctx    = context_with_row({{"rsi", 72.0}}, 100.0);
    const auto report = TechnicalAnalyst{}.analyze(ctx);
    EXPECT_NEAR(report.score, 0.2, 1e-12);
}

TEST(TechnicalAnalyst_Trend, FlatPrices_RsiReadsOverbought) {
    // SMA20 == SMA50 (−0.3), zero histogram (−0.2), RSI 100 (−0.2),
    // close on both bands (0), zero volatility (+0.2).
    const std::vector<double> closes(250, 100.0);
    const auto report = TechnicalAnalyst{}.analyze(price_context("FLAT", series_from_closes(closes)));
    EXPECT_NEAR(report.score, -0.5, 1e-9);
    EXPECT_NE(report.rationale.find("RSI overbought (100.0)"), std::string::npos);
    EXPECT_EQ(report.rationale.find("neutral-positive"), std::string::npos);
    EXPECT_DOUBLE_EQ(report.metadata.at("latest_indicators").at("rsi").get<double>(), 100.0);
}

TEST(TechnicalAnalyst_Volatility, ConstantGrowth_ZeroVolatilityInMetadata) {
    const auto ctx    = price_context("UP", series_from_closes(geometric(220, 50.0, 0.001)));
    const auto report = TechnicalAnalyst{}.analyze(ctx);
    EXPECT_NEAR(report.metadata.at("volatility").get<double>(), 0.0, 1e-9);
    EXPECT_DOUBLE_EQ(report.metadata.at("close").get<double>(), ctx.prices.bars.back().close);
}

TEST(TechnicalAnalyst_Bounds, WildSeries_ScoreStaysBounded) {
    std::vector<double> closes;
    for (int i = 0; i < 260; ++i) closes.push_back(i % 2 == 0 ? 100.0 : 160.0);
    const auto report = TechnicalAnalyst{}.analyze(price_context("X", series_from_closes(closes)));
    EXPECT_TRUE(std::isfinite(report.score));
    EXPECT_GE(report.score, -1.0);
    EXPECT_LE(report.score, 1.0);
}
