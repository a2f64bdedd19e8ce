#pragma once

/// @file include/invest/portfolio.hpp
/// @brief Portfolio synthesis: turns agent reports into one trade decision.
///
/// # Module: PortfolioSynthesizer
///
/// ## Decision Rule
///   1. composite = mean of agent scores (non-finite scores count as 0.0)
///   2. composite < min_confidence  →  no orders ("holding cash")
///   3. otherwise one order:
///        weight = round4(clamp(composite, 0, 1) × max_weight)
///      where max_weight comes from the Risk Officer's metadata, or the
///      configured default when that report is missing.
///
/// ## Guarantees
/// - An empty report list is a contract violation: `std::invalid_argument`
/// - `composite_score` and every order weight are finite
/// - The Decision embeds every input report unchanged

#include "invest/agents.hpp"
#include "invest/backtest.hpp"
#include "invest/constants.hpp"
#include "invest/types.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace invest::portfolio {

// ─── Types ────────────────────────────────────────────────────────────────────

enum class OrderAction { Buy, Hold };

[[nodiscard]] std::string_view to_string(OrderAction action) noexcept;
[[nodiscard]] std::optional<OrderAction> parse_action(std::string_view text) noexcept;

/// A single-asset order proposal.
struct Order {
    std::string symbol;
    OrderAction action      = OrderAction::Hold;
    double      weight      = 0.0;  ///< Fraction of capital ∈ [0, 1]
    std::string entry_rule;
    double      stop        = 0.0;  ///< Stop-loss distance (fraction)
    double      take_profit = 0.0;  ///< Take-profit distance (fraction)
    std::string rationale;
};

/// Output of one meeting for one symbol.
struct Decision {
    std::optional<Date>               as_of_date;
    std::string                       symbol;
    double                            composite_score    = 0.0;
    std::vector<Order>                orders;
    double                            max_gross_exposure = constants::DEFAULT_MAX_GROSS_EXPOSURE;
    std::string                       notes;
    std::vector<agents::AgentReport>  agent_reports;
    std::optional<backtest::BacktestReport> backtest;  ///< Attached by the orchestrator

    [[nodiscard]] std::string to_string() const;
};

struct SynthesizerConfig {
    double max_gross_exposure = constants::DEFAULT_MAX_GROSS_EXPOSURE;
    double min_confidence     = constants::DEFAULT_MIN_CONFIDENCE;
    double default_max_weight = constants::DEFAULT_MAX_WEIGHT_PER_ASSET;
    double stop               = constants::DEFAULT_STOP_LOSS;
    double take_profit        = constants::DEFAULT_TAKE_PROFIT;
};

// ─── PortfolioSynthesizer ─────────────────────────────────────────────────────

class PortfolioSynthesizer {
public:
    explicit PortfolioSynthesizer(SynthesizerConfig config = SynthesizerConfig{});

    /// Aggregate `reports` into a Decision for `context.symbol`.
    ///
    /// # Errors
    /// Throws `std::invalid_argument` when `reports` is empty.
    [[nodiscard]] Decision synthesize(std::span<const agents::AgentReport> reports,
                                      const agents::AnalysisContext& context) const;

    /// Mean score with non-finite entries replaced by 0.0; 0.0 when empty.
    [[nodiscard]] static double composite_score(
        std::span<const agents::AgentReport> reports) noexcept;

    [[nodiscard]] const SynthesizerConfig& config() const noexcept { return config_; }

private:
    /// Risk Officer's `max_weight`, or the configured default.
    [[nodiscard]] double risk_max_weight(
        std::span<const agents::AgentReport> reports) const;

    SynthesizerConfig config_;
};

}  // namespace invest::portfolio
