/// @file src/agents/fundamental_analyst.cpp
/// @brief FundamentalAnalyst: valuation, income, leverage and ESG scoring.

#include "invest/agents.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace invest::agents {

namespace {

/// Finite value of metric `key`; absent, null and non-finite all map to nullopt.
[[nodiscard]] std::optional<double> metric(const Fundamentals& f, const std::string& key) {
    const auto it = f.find(key);
    if (it == f.end() || !it->second || !std::isfinite(*it->second)) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace

AgentReport FundamentalAnalyst::analyze(const AnalysisContext& context) const {
    const Fundamentals& f = context.fundamentals;

    double score = 0.0;
    bool   any_present = false;
    std::vector<std::string> reasons;

    if (const auto pe = metric(f, "pe_ratio")) {
        any_present = true;
        if (*pe > 0.0 && *pe < 25.0) {
            score += 0.25;
            reasons.push_back(fmt::format("PE attractive at {:.1f}", *pe));
        } else if (*pe >= 40.0) {
            score -= 0.15;
            reasons.push_back(fmt::format("PE elevated at {:.1f}", *pe));
        }
    }

    if (const auto pb = metric(f, "pb_ratio")) {
        any_present = true;
        if (*pb < 4.0) {
            score += 0.10;
            reasons.push_back(fmt::format("PB reasonable at {:.1f}", *pb));
        } else if (*pb > 8.0) {
            score -= 0.10;
            reasons.push_back(fmt::format("PB high at {:.1f}", *pb));
        }
    }

    if (const auto yield = metric(f, "dividend_yield")) {
        any_present = true;
        score += std::min(*yield * 5.0, 0.10);
        reasons.push_back(fmt::format("Dividend yield {:.2f}%", *yield * 100.0));
    }

    if (const auto leverage = metric(f, "debt_to_asset")) {
        any_present = true;
        if (*leverage < 0.6) {
            score += 0.15;
            reasons.push_back(fmt::format("Leverage manageable ({:.2f})", *leverage));
        } else {
            score -= 0.15;
            reasons.push_back(fmt::format("Leverage high ({:.2f})", *leverage));
        }
    }

    if (const auto esg = metric(f, "esg_score")) {
        any_present = true;
        score += std::clamp((*esg - 50.0) / 200.0, -0.05, 0.10);
        reasons.push_back(fmt::format("ESG score {:.1f}", *esg));
    }

    Metadata echoed = Metadata::object();
    for (const auto& [key, value] : f) {
        if (value && std::isfinite(*value)) {
            echoed[key] = *value;
        } else {
            echoed[key] = nullptr;
        }
    }

    return AgentReport{
        .agent_name = std::string(name()),
        .symbol     = context.symbol,
        .score      = any_present ? bounded_score(score) : 0.0,
        .rationale  = reasons.empty() ? std::string("Limited fundamentals available")
                                      : fmt::format("{}", fmt::join(reasons, "; ")),
        .metadata   = std::move(echoed),
    };
}

}  // namespace invest::agents
