/// @file src/agents/risk_officer.cpp
/// @brief RiskOfficer: volatility budget and position limits.

#include "invest/agents.hpp"
#include "invest/backtest.hpp"
#include "invest/constants.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace invest::agents {

RiskOfficer::RiskOfficer(RiskConfig config)
    : config_(config) {}

AgentReport RiskOfficer::analyze(const AnalysisContext& context) const {
    using backtest::PerformanceCalculator;

    const std::vector<double> closes = context.prices.closes();
    const std::size_t sample = PerformanceCalculator::valid_returns(closes).size();

    AgentReport report{
        .agent_name = std::string(name()),
        .symbol     = context.symbol,
        .score      = 0.0,
        .rationale  = {},
        .metadata   = {{"max_weight", config_.max_weight_per_asset},
                       {"max_weight_per_asset", config_.max_weight_per_asset},
                       {"max_sector_exposure", config_.max_sector_exposure},
                       {"volatility", 0.0},
                       {"penalty", 0.0},
                       {"volatility_available", false},
                       {"returns", sample}},
    };

    // Volatility undefined: neutral score, limits still published.
    if (sample < constants::MIN_VOLATILITY_RETURNS) {
        report.rationale = fmt::format(
            "Insufficient price history to estimate volatility ({} returns, {} required)",
            sample, constants::MIN_VOLATILITY_RETURNS);
        return report;
    }

    const double volatility = PerformanceCalculator::annualized_volatility(closes);

    double penalty = 0.0;
    if (config_.target_volatility > 0.0) {
        const double raw = (volatility - config_.target_volatility) / config_.target_volatility;
        penalty = std::isfinite(raw) ? std::clamp(raw, 0.0, 1.0) : 0.0;
    }

    report.score     = bounded_score(0.5 - penalty);
    report.rationale = fmt::format("Annualized volatility {:.2f}; penalty {:.2f}",
                                   volatility, penalty);
    report.metadata["volatility"]           = volatility;
    report.metadata["penalty"]              = penalty;
    report.metadata["volatility_available"] = true;
    return report;
}

}  // namespace invest::agents
