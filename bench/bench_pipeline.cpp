/**
 * @file  bench/bench_pipeline.cpp
 * @brief Google Benchmark suite for the investment meeting hot paths.
 *
 * Benchmarks
 * ----------
 *   BM_IndicatorEngine_Compute   full indicator table over N daily bars
 *   BM_AgentPanel_Analyze        default four-agent panel on one context
 *   BM_Backtest_Evaluate         weighted replay over N bars
 *   BM_Meeting_Synthetic         one symbol end-to-end on synthetic data
 *
 * Build (CMake):
 *   cmake -DINVEST_BENCH=ON ..
 *   cmake --build build --target bench_pipeline
 *   ./build/bench_pipeline --benchmark_format=json
 *
 * Throughput units: items/second (bars processed).
 */

#include "benchmark/benchmark.h"

#include "invest/agents.hpp"
#include "invest/backtest.hpp"
#include "invest/indicators.hpp"
#include "invest/market_data.hpp"
#include "invest/meeting.hpp"
#include "invest/portfolio.hpp"

#include <chrono>
#include <cstddef>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// N synthetic daily bars from the offline provider, starting 2000-01-03.
static invest::PriceSeries make_series(std::size_t n) {
    using namespace std::chrono;
    const invest::Date start{year{2000} / January / 3};
    // Business days only: 7/5 calendar days per bar, plus slack.
    const invest::Date end = start + days{static_cast<int>(n * 7 / 5 + 7)};
    invest::core::SyntheticMarketData data;
    auto series = data.price_history("BENCH", start, end);
    if (series.bars.size() > n) series.bars.resize(n);
    return series;
}

// ── Indicators ─────────────────────────────────────────────────────────────────

static void BM_IndicatorEngine_Compute(benchmark::State& state) {
    const auto series = make_series(static_cast<std::size_t>(state.range(0)));
    const invest::indicators::IndicatorEngine engine;
    for (auto _ : state) {
        auto table = engine.compute(series);
        benchmark::DoNotOptimize(table);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(series.size()));
}
BENCHMARK(BM_IndicatorEngine_Compute)->RangeMultiplier(4)->Range(256, 16384)->Unit(benchmark::kMicrosecond);

// ── Agents ─────────────────────────────────────────────────────────────────────

static void BM_AgentPanel_Analyze(benchmark::State& state) {
    const auto series = make_series(static_cast<std::size_t>(state.range(0)));
    invest::core::SyntheticMarketData data;
    const invest::agents::AnalysisContext ctx{
        .symbol       = "BENCH",
        .prices       = series,
        .indicators   = invest::indicators::IndicatorEngine{}.compute(series),
        .fundamentals = data.fundamentals("BENCH"),
        .news         = data.recent_news("BENCH", 20),
    };
    const auto panel = invest::agents::default_agents();
    for (auto _ : state) {
        for (const auto& agent : panel) {
            auto report = agent->analyze(ctx);
            benchmark::DoNotOptimize(report);
        }
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(series.size()));
}
BENCHMARK(BM_AgentPanel_Analyze)->RangeMultiplier(4)->Range(256, 4096)->Unit(benchmark::kMicrosecond);

// ── Backtest ───────────────────────────────────────────────────────────────────

static void BM_Backtest_Evaluate(benchmark::State& state) {
    const auto series = make_series(static_cast<std::size_t>(state.range(0)));
    invest::portfolio::Decision decision;
    decision.symbol = "BENCH";
    decision.orders.push_back(invest::portfolio::Order{
        .symbol = "BENCH", .action = invest::portfolio::OrderAction::Buy, .weight = 0.15});
    const invest::backtest::BacktestEvaluator evaluator;
    for (auto _ : state) {
        auto report = evaluator.backtest(decision, series);
        benchmark::DoNotOptimize(report);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(series.size()));
}
BENCHMARK(BM_Backtest_Evaluate)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

// ── End to end ─────────────────────────────────────────────────────────────────

static void BM_Meeting_Synthetic(benchmark::State& state) {
    using namespace std::chrono;
    invest::core::SyntheticMarketData data;
    const invest::core::MeetingOrchestrator meeting(data, invest::agents::default_agents());
    const invest::Date start{year{2022} / January / 1};
    const invest::Date end{year{2023} / December / 31};
    for (auto _ : state) {
        auto decision = meeting.analyze_symbol("BENCH", start, end);
        benchmark::DoNotOptimize(decision);
    }
}
BENCHMARK(BM_Meeting_Synthetic)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
