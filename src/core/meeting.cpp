/// @file src/core/meeting.cpp
/// @brief MeetingOrchestrator: per-symbol pipeline with failure isolation.

#include "invest/meeting.hpp"

#include <spdlog/spdlog.h>

#include <future>
#include <set>
#include <stdexcept>
#include <utility>

namespace invest::core {

MeetingOrchestrator::MeetingOrchestrator(MarketDataProvider& data,
                                         agents::AgentList agents,
                                         MeetingConfig config)
    : data_(data)
    , agents_(std::move(agents))
    , config_(std::move(config))
    , engine_(config_.indicators)
    , synthesizer_(config_.synthesizer)
    , evaluator_(config_.backtest) {
    if (agents_.empty()) {
        throw std::invalid_argument("MeetingOrchestrator requires at least one agent");
    }
    for (const auto& agent : agents_) {
        if (!agent) {
            throw std::invalid_argument("MeetingOrchestrator: null agent in panel");
        }
    }
}

// ─── Context ──────────────────────────────────────────────────────────────────

agents::AnalysisContext
MeetingOrchestrator::build_context(const std::string& symbol, Date start, Date end) const {
    PriceSeries prices = data_.price_history(symbol, start, end, config_.interval);
    indicators::IndicatorTable table = engine_.compute(prices);

    if (table.meta().insufficient_history) {
        spdlog::info("{}: {} observations, {} required for full indicator history",
                     symbol, table.meta().observations, table.meta().min_required);
    }

    return agents::AnalysisContext{
        .symbol       = symbol,
        .prices       = std::move(prices),
        .indicators   = std::move(table),
        .fundamentals = data_.fundamentals(symbol),
        .news         = data_.recent_news(symbol, config_.news_limit),
    };
}

// ─── Agents ───────────────────────────────────────────────────────────────────

std::vector<agents::AgentReport>
MeetingOrchestrator::run_agents(const agents::AnalysisContext& context) const {
    std::vector<agents::AgentReport> reports;
    reports.reserve(agents_.size());

    if (!config_.parallel_agents) {
        for (const auto& agent : agents_) {
            reports.push_back(agent->analyze(context));
        }
    } else {
        std::vector<std::future<agents::AgentReport>> pending;
        pending.reserve(agents_.size());
        for (const auto& agent : agents_) {
            const agents::ScoringAgent* a = agent.get();
            pending.push_back(std::async(std::launch::async, [a, &context] {
                return a->analyze(context);
            }));
        }
        for (auto& f : pending) {
            reports.push_back(f.get());
        }
    }

    for (const auto& r : reports) {
        spdlog::debug("{}", r.to_string());
    }
    return reports;
}

// ─── Per-symbol pipeline ──────────────────────────────────────────────────────

portfolio::Decision
MeetingOrchestrator::analyze_symbol(const std::string& symbol, Date start, Date end) const {
    const agents::AnalysisContext context = build_context(symbol, start, end);
    const std::vector<agents::AgentReport> reports = run_agents(context);

    portfolio::Decision decision = synthesizer_.synthesize(reports, context);
    decision.backtest = evaluator_.backtest(decision, context.prices);
    return decision;
}

MeetingResult MeetingOrchestrator::run(std::span<const std::string> symbols,
                                       Date start, Date end) const {
    MeetingResult result;
    std::set<std::string> seen;

    for (const auto& symbol : symbols) {
        if (!seen.insert(symbol).second) continue;

        try {
            result.emplace(symbol, analyze_symbol(symbol, start, end));
            spdlog::info("{}: meeting complete", symbol);
        } catch (const std::exception& e) {
            spdlog::warn("{}: skipped: {}", symbol, e.what());
            result.emplace(symbol, SymbolError{.symbol = symbol, .error = e.what()});
        }
    }
    return result;
}

std::size_t successful_count(const MeetingResult& result) noexcept {
    std::size_t n = 0;
    for (const auto& [symbol, outcome] : result) {
        if (std::holds_alternative<portfolio::Decision>(outcome)) ++n;
    }
    return n;
}

}  // namespace invest::core
