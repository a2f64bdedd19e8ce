#include <gtest/gtest.h>
#include "invest/meeting.hpp"
#include "test_support.hpp"

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace invest;
using namespace invest::core;
using namespace invest::testing;

namespace {

/// In-memory provider; "FAIL" raises a provider error, "BOOM" a runtime error
/// from the fundamentals call.
class FakeMarketData final : public MarketDataProvider {
public:
    PriceSeries price_history(const std::string& symbol, Date, Date,
                              BarInterval interval) override {
        ++price_calls;
        if (symbol == "FAIL") throw MarketDataError("no data for FAIL");
        auto s = series_from_closes(geometric(260, 100.0, 0.001));
        s.interval = interval;
        return s;
    }

    Fundamentals fundamentals(const std::string& symbol) override {
        if (symbol == "BOOM") throw std::runtime_error("fundamentals backend down");
        return {{"pe_ratio", 15.0}, {"debt_to_asset", 0.3}};
    }

    std::vector<NewsItem> recent_news(const std::string&, std::size_t limit) override {
        last_limit = limit;
        return {{"Strong growth", "record quarter"}};
    }

    int         price_calls = 0;
    std::size_t last_limit  = 0;
};

/// Fixed-score agent that counts invocations.
class FixedAgent final : public agents::ScoringAgent {
public:
    FixedAgent(std::string name, double score, std::atomic<int>* calls = nullptr)
        : name_(std::move(name)), score_(score), calls_(calls) {}

    std::string_view name() const noexcept override { return name_; }

    agents::AgentReport analyze(const agents::AnalysisContext& context) const override {
        if (calls_) ++*calls_;
        return agents::AgentReport{.agent_name = name_, .symbol = context.symbol,
                                   .score = score_, .rationale = "fixed",
                                   .metadata = agents::Metadata::object()};
    }

private:
    std::string       name_;
    double            score_;
    std::atomic<int>* calls_;
};

agents::AgentList fixed_panel(double score, std::atomic<int>* calls = nullptr) {
    agents::AgentList panel;
    panel.push_back(std::make_unique<FixedAgent>("First", score, calls));
    panel.push_back(std::make_unique<FixedAgent>("Second", score, calls));
    return panel;
}

const Date kStart = day(2023, 1, 1);
const Date kEnd   = day(2023, 12, 31);

}  // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

TEST(MeetingOrchestrator_Construct, EmptyPanel_Throws) {
    FakeMarketData data;
    EXPECT_THROW((void)MeetingOrchestrator(data, agents::AgentList{}), std::invalid_argument);
}

TEST(MeetingOrchestrator_Construct, NullAgent_Throws) {
    FakeMarketData data;
    agents::AgentList panel;
    panel.push_back(nullptr);
    EXPECT_THROW((void)MeetingOrchestrator(data, std::move(panel)), std::invalid_argument);
}

// ─── Pipeline ─────────────────────────────────────────────────────────────────

TEST(MeetingOrchestrator_Run, DecisionPerSymbolWithBacktest) {
    FakeMarketData data;
    const MeetingOrchestrator meeting(data, agents::default_agents());
    const std::vector<std::string> symbols{"AAPL", "MSFT"};
    const auto result = meeting.run(symbols, kStart, kEnd);

    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(successful_count(result), 2u);
    for (const auto& symbol : symbols) {
        const auto* decision = std::get_if<portfolio::Decision>(&result.at(symbol));
        ASSERT_NE(decision, nullptr) << symbol;
        EXPECT_EQ(decision->symbol, symbol);
        EXPECT_EQ(decision->agent_reports.size(), 4u);
        EXPECT_TRUE(decision->backtest.has_value());
    }
}

TEST(MeetingOrchestrator_Run, AgentOrderPreserved) {
    FakeMarketData data;
    const MeetingOrchestrator meeting(data, agents::default_agents());
    const auto ctx     = meeting.build_context("AAPL", kStart, kEnd);
    const auto reports = meeting.run_agents(ctx);
    ASSERT_EQ(reports.size(), 4u);
    EXPECT_EQ(reports[0].agent_name, agents::TECHNICAL_ANALYST);
    EXPECT_EQ(reports[1].agent_name, agents::FUNDAMENTAL_ANALYST);
    EXPECT_EQ(reports[2].agent_name, agents::SENTIMENT_ANALYST);
    EXPECT_EQ(reports[3].agent_name, agents::RISK_OFFICER);
}

TEST(MeetingOrchestrator_Run, FailingSymbolIsolated) {
    FakeMarketData data;
    const MeetingOrchestrator meeting(data, agents::default_agents());
    const std::vector<std::string> symbols{"AAPL", "FAIL", "BOOM", "MSFT"};
    const auto result = meeting.run(symbols, kStart, kEnd);

    ASSERT_EQ(result.size(), 4u);
    EXPECT_EQ(successful_count(result), 2u);

    const auto* fail = std::get_if<SymbolError>(&result.at("FAIL"));
    ASSERT_NE(fail, nullptr);
    EXPECT_EQ(fail->symbol, "FAIL");
    EXPECT_EQ(fail->error, "no data for FAIL");

    const auto* boom = std::get_if<SymbolError>(&result.at("BOOM"));
    ASSERT_NE(boom, nullptr);
    EXPECT_EQ(boom->error, "fundamentals backend down");

    EXPECT_TRUE(std::holds_alternative<portfolio::Decision>(result.at("MSFT")));
}

TEST(MeetingOrchestrator_Run, DuplicateSymbolsProcessedOnce) {
    FakeMarketData data;
    const MeetingOrchestrator meeting(data, fixed_panel(0.5));
    const std::vector<std::string> symbols{"AAPL", "AAPL", "MSFT", "AAPL"};
    const auto result = meeting.run(symbols, kStart, kEnd);
    EXPECT_EQ(result.size(), 2u);
    EXPECT_EQ(data.price_calls, 2);
}

TEST(MeetingOrchestrator_Run, NoSymbols_EmptyResult) {
    FakeMarketData data;
    const MeetingOrchestrator meeting(data, fixed_panel(0.5));
    const auto result = meeting.run({}, kStart, kEnd);
    EXPECT_TRUE(result.empty());
    EXPECT_EQ(successful_count(result), 0u);
}

TEST(MeetingOrchestrator_Run, CustomPanelDrivesDecision) {
    FakeMarketData data;
    const MeetingOrchestrator meeting(data, fixed_panel(0.5));
    const auto decision = meeting.analyze_symbol("AAPL", kStart, kEnd);

    EXPECT_DOUBLE_EQ(decision.composite_score, 0.5);
    ASSERT_EQ(decision.orders.size(), 1u);
    // No Risk Officer in the panel → default 0.2 limit.
    EXPECT_DOUBLE_EQ(decision.orders.front().weight, 0.1);
    ASSERT_TRUE(decision.backtest.has_value());
    EXPECT_GT(decision.backtest->total_return, 0.0);
}

TEST(MeetingOrchestrator_Config, NewsLimitAndIntervalForwarded) {
    FakeMarketData data;
    MeetingConfig config;
    config.news_limit = 7;
    config.interval   = BarInterval::Monthly;
    const MeetingOrchestrator meeting(data, fixed_panel(0.0), config);

    const auto ctx = meeting.build_context("AAPL", kStart, kEnd);
    EXPECT_EQ(data.last_limit, 7u);
    EXPECT_EQ(ctx.prices.interval, BarInterval::Monthly);
    EXPECT_EQ(ctx.news.size(), 1u);
    EXPECT_FALSE(ctx.indicators.meta().insufficient_history);
}

TEST(MeetingOrchestrator_Config, ParallelAgentsMatchSequential) {
    FakeMarketData seq_data;
    FakeMarketData par_data;
    std::atomic<int> calls{0};

    MeetingConfig parallel;
    parallel.parallel_agents = true;

    const MeetingOrchestrator sequential(seq_data, agents::default_agents());
    const MeetingOrchestrator concurrent(par_data, agents::default_agents(), parallel);

    const auto a = sequential.analyze_symbol("AAPL", kStart, kEnd);
    const auto b = concurrent.analyze_symbol("AAPL", kStart, kEnd);
    ASSERT_EQ(a.agent_reports.size(), b.agent_reports.size());
    for (std::size_t i = 0; i < a.agent_reports.size(); ++i) {
        EXPECT_EQ(a.agent_reports[i].agent_name, b.agent_reports[i].agent_name);
        EXPECT_DOUBLE_EQ(a.agent_reports[i].score, b.agent_reports[i].score);
    }
    EXPECT_DOUBLE_EQ(a.composite_score, b.composite_score);

    const MeetingOrchestrator counted(par_data, fixed_panel(0.2, &calls), parallel);
    (void)counted.analyze_symbol("AAPL", kStart, kEnd);
    EXPECT_EQ(calls.load(), 2);
}
