#pragma once

/// @file include/invest/meeting.hpp
/// @brief Investment meeting orchestrator: public API.
///
/// # Module: MeetingOrchestrator
///
/// ## Responsibility
/// Run the full pipeline for a batch of symbols:
///   MarketDataProvider → IndicatorEngine → AnalysisContext →
///   ScoringAgents → PortfolioSynthesizer → BacktestEvaluator → Decision
///
/// ## Usage
/// ```cpp
/// core::SyntheticMarketData data;
/// MeetingOrchestrator meeting(data, agents::default_agents());
/// auto result = meeting.run({"AAPL", "MSFT"}, start, end);
/// ```
///
/// ## Failure Isolation
/// A failure while processing one symbol (data retrieval or any later stage)
/// is logged and recorded as a `SymbolError` for that symbol; the remaining
/// symbols are still processed.

#include "invest/agents.hpp"
#include "invest/backtest.hpp"
#include "invest/indicators.hpp"
#include "invest/market_data.hpp"
#include "invest/portfolio.hpp"
#include "invest/types.hpp"

#include <map>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace invest::core {

/// Error marker for a symbol that could not be processed.
struct SymbolError {
    std::string symbol;
    std::string error;
};

/// Per-symbol outcome: a Decision with its backtest attached, or an error.
using MeetingOutcome = std::variant<portfolio::Decision, SymbolError>;

/// Symbol → outcome, ordered by symbol.
using MeetingResult = std::map<std::string, MeetingOutcome>;

struct MeetingConfig {
    std::size_t                    news_limit      = constants::DEFAULT_NEWS_LIMIT;
    BarInterval                    interval        = BarInterval::Daily;
    bool                           parallel_agents = false;
    indicators::IndicatorConfig    indicators{};
    portfolio::SynthesizerConfig   synthesizer{};
    backtest::BacktestConfig       backtest{};
};

class MeetingOrchestrator {
public:
    /// # Arguments
    /// * `data`   : Market-data collaborator; must outlive the orchestrator.
    /// * `agents` : The scoring panel.  Must be non-empty.
    ///
    /// # Errors
    /// `std::invalid_argument` if `agents` is empty or holds a null entry.
    MeetingOrchestrator(MarketDataProvider& data,
                        agents::AgentList agents,
                        MeetingConfig config = MeetingConfig{});

    /// Process every symbol (duplicates once) and collect the outcomes.
    [[nodiscard]] MeetingResult run(std::span<const std::string> symbols,
                                    Date start, Date end) const;

    /// Process a single symbol.
    ///
    /// # Errors
    /// Propagates `MarketDataError` and any other failure from the pipeline.
    [[nodiscard]] portfolio::Decision analyze_symbol(const std::string& symbol,
                                                     Date start, Date end) const;

    /// Build the immutable context for `symbol` from the data collaborator.
    [[nodiscard]] agents::AnalysisContext build_context(const std::string& symbol,
                                                        Date start, Date end) const;

    /// Run every agent on `context` (concurrently if configured).
    [[nodiscard]] std::vector<agents::AgentReport>
    run_agents(const agents::AnalysisContext& context) const;

    [[nodiscard]] const agents::AgentList& panel() const noexcept { return agents_; }

private:
    MarketDataProvider&             data_;
    agents::AgentList               agents_;
    MeetingConfig                   config_;
    indicators::IndicatorEngine     engine_;
    portfolio::PortfolioSynthesizer synthesizer_;
    backtest::BacktestEvaluator     evaluator_;
};

/// Number of outcomes in `result` that hold a Decision.
[[nodiscard]] std::size_t successful_count(const MeetingResult& result) noexcept;

}  // namespace invest::core
