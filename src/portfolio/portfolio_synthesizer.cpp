/// @file src/portfolio/portfolio_synthesizer.cpp
/// @brief PortfolioSynthesizer: composite score and order sizing.

#include "invest/portfolio.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace invest::portfolio {

namespace {

constexpr std::string_view ENTRY_RULE     = "SMA20>SMA50 & MACD histogram positive";
constexpr std::string_view NOTES_CASH     = "Confidence below threshold; holding cash";
constexpr std::string_view NOTES_POSITION = "Diversify across sectors; keep tech exposure <50%";

/// Round half away from zero to 4 decimal places.
[[nodiscard]] double round4(double value) noexcept {
    return std::round(value * 1e4) / 1e4;
}

}  // namespace

// ─── OrderAction ──────────────────────────────────────────────────────────────

std::string_view to_string(OrderAction action) noexcept {
    return action == OrderAction::Buy ? "buy" : "hold";
}

std::optional<OrderAction> parse_action(std::string_view text) noexcept {
    if (text == "buy")  return OrderAction::Buy;
    if (text == "hold") return OrderAction::Hold;
    return std::nullopt;
}

// ─── Decision ─────────────────────────────────────────────────────────────────

std::string Decision::to_string() const {
    std::string out = fmt::format(
        "{} as of {}: composite={:+.4f} exposure<={:.2f}; {}",
        symbol,
        as_of_date ? to_iso_date(*as_of_date) : std::string("n/a"),
        composite_score, max_gross_exposure, notes);
    for (const auto& order : orders) {
        out += fmt::format("\n  {} {} weight={:.4f} stop={:.2f} take_profit={:.2f}",
                           portfolio::to_string(order.action), order.symbol,
                           order.weight, order.stop, order.take_profit);
    }
    if (backtest) {
        out += "\n  " + backtest->to_string();
    }
    return out;
}

// ─── PortfolioSynthesizer ─────────────────────────────────────────────────────

PortfolioSynthesizer::PortfolioSynthesizer(SynthesizerConfig config)
    : config_(config) {}

double PortfolioSynthesizer::composite_score(
        std::span<const agents::AgentReport> reports) noexcept {
    if (reports.empty()) return 0.0;

    double sum = 0.0;
    for (const auto& r : reports) {
        sum += std::isfinite(r.score) ? r.score : 0.0;
    }
    return sum / static_cast<double>(reports.size());
}

double PortfolioSynthesizer::risk_max_weight(
        std::span<const agents::AgentReport> reports) const {
    const auto it = std::find_if(reports.begin(), reports.end(), [](const auto& r) {
        return r.agent_name == agents::RISK_OFFICER;
    });
    if (it == reports.end()) return config_.default_max_weight;

    const auto& meta = it->metadata;
    if (!meta.is_object()) return config_.default_max_weight;
    const auto field = meta.find("max_weight");
    if (field == meta.end() || !field->is_number()) return config_.default_max_weight;

    const double value = field->get<double>();
    return std::isfinite(value) ? value : config_.default_max_weight;
}

Decision PortfolioSynthesizer::synthesize(std::span<const agents::AgentReport> reports,
                                          const agents::AnalysisContext& context) const {
    if (reports.empty()) {
        throw std::invalid_argument(
            "Portfolio synthesis requires at least one agent report");
    }

    const double composite = composite_score(reports);

    Decision decision;
    decision.symbol             = context.symbol;
    decision.composite_score    = composite;
    decision.max_gross_exposure = config_.max_gross_exposure;
    decision.agent_reports.assign(reports.begin(), reports.end());
    if (!context.prices.empty()) {
        decision.as_of_date = context.prices.bars.back().date;
    }

    if (composite < config_.min_confidence) {
        decision.notes = std::string(NOTES_CASH);
        spdlog::debug("{}: composite {:.4f} below {:.2f}, holding cash",
                      context.symbol, composite, config_.min_confidence);
        return decision;
    }

    const double max_weight = risk_max_weight(reports);
    const double weight = round4(std::clamp(composite, 0.0, 1.0) * max_weight);

    std::vector<std::string> rationales;
    for (const auto& r : reports) {
        if (!r.rationale.empty()) rationales.push_back(r.rationale);
    }

    decision.orders.push_back(Order{
        .symbol      = context.symbol,
        .action      = composite > 0.0 ? OrderAction::Buy : OrderAction::Hold,
        .weight      = std::clamp(weight, 0.0, 1.0),
        .entry_rule  = std::string(ENTRY_RULE),
        .stop        = config_.stop,
        .take_profit = config_.take_profit,
        .rationale   = fmt::format("{}", fmt::join(rationales, "; ")),
    });
    decision.notes = std::string(NOTES_POSITION);

    spdlog::debug("{}: composite {:.4f}, {} weight {:.4f}", context.symbol, composite,
                  to_string(decision.orders.front().action), decision.orders.front().weight);
    return decision;
}

}  // namespace invest::portfolio
