/// @file src/agents/agent_report.cpp
/// @brief AgentReport helpers and the default agent panel.

#include "invest/agents.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace invest::agents {

double bounded_score(double score) noexcept {
    if (!std::isfinite(score)) return 0.0;
    return std::clamp(score, -1.0, 1.0);
}

std::string AgentReport::to_string() const {
    return fmt::format("{:<20} {:<8} score={:+.4f}  {}",
                       agent_name, symbol, score, rationale);
}

AgentList default_agents(RiskConfig risk) {
    AgentList panel;
    panel.reserve(4);
    panel.push_back(std::make_unique<TechnicalAnalyst>());
    panel.push_back(std::make_unique<FundamentalAnalyst>());
    panel.push_back(std::make_unique<SentimentAnalyst>());
    panel.push_back(std::make_unique<RiskOfficer>(risk));
    return panel;
}

}  // namespace invest::agents
