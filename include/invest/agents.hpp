#pragma once

/// @file include/invest/agents.hpp
/// @brief Scoring agents: public API.
///
/// # Module: Scoring Agents
///
/// ## Responsibility
/// Map an immutable AnalysisContext to a bounded score in [−1, 1] plus a
/// human-readable rationale.  Four independent variants are provided:
///
///   | Agent               | Reads                         |
///   |---------------------|-------------------------------|
///   | TechnicalAnalyst    | price history + indicators    |
///   | FundamentalAnalyst  | fundamentals                  |
///   | SentimentAnalyst    | news                          |
///   | RiskOfficer         | price history                 |
///
/// No agent sees another agent's report.  The Risk Officer publishes its
/// position limits through `metadata`, which is the only channel by which it
/// constrains portfolio synthesis.
///
/// ## Guarantees
/// - `score` is always finite and within [−1, 1]
/// - Missing inputs never throw; the agent reports a neutral score instead
/// - `analyze` is const: agents are safe to run concurrently

#include "invest/types.hpp"
#include "invest/constants.hpp"
#include "invest/indicators.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace invest::agents {

/// Opaque per-agent payload (always a JSON object).
using Metadata = nlohmann::json;

inline constexpr std::string_view TECHNICAL_ANALYST   = "Technical Analyst";
inline constexpr std::string_view FUNDAMENTAL_ANALYST = "Fundamental Analyst";
inline constexpr std::string_view SENTIMENT_ANALYST   = "Sentiment Analyst";
inline constexpr std::string_view RISK_OFFICER        = "Risk Officer";

// ─── Types ────────────────────────────────────────────────────────────────────

/// Everything an agent may look at for one symbol.
struct AnalysisContext {
    std::string                 symbol;
    PriceSeries                 prices;
    indicators::IndicatorTable  indicators;
    Fundamentals                fundamentals;
    std::vector<NewsItem>       news;
};

/// Output of one agent.
struct AgentReport {
    std::string agent_name;
    std::string symbol;
    double      score = 0.0;  ///< ∈ [−1, 1]
    std::string rationale;
    Metadata    metadata = Metadata::object();

    [[nodiscard]] std::string to_string() const;
};

/// Clamp `score` into [−1, 1]; non-finite values map to 0.0.
[[nodiscard]] double bounded_score(double score) noexcept;

// ─── ScoringAgent ─────────────────────────────────────────────────────────────

/// Interface implemented by every analyst.
class ScoringAgent {
public:
    virtual ~ScoringAgent() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    [[nodiscard]] virtual AgentReport analyze(const AnalysisContext& context) const = 0;
};

using AgentList = std::vector<std::unique_ptr<ScoringAgent>>;

// ─── TechnicalAnalyst ─────────────────────────────────────────────────────────

/// Trend / momentum / mean-reversion score from the latest indicator row.
///
/// Contributions (each skipped when its inputs are missing):
///   - ±0.3  sma_20 vs sma_50
///   - ±0.2  sign of macd_hist
///   - RSI band: +0.2 for [45, 70], −0.1 below 35, −0.2 above 75
///   - ±0.1  close outside the Bollinger bands (mean reversion)
///   - clamp(0.2 − annualised volatility, −0.2, 0.2)
class TechnicalAnalyst final : public ScoringAgent {
public:
    [[nodiscard]] std::string_view name() const noexcept override {
        return TECHNICAL_ANALYST;
    }
    [[nodiscard]] AgentReport analyze(const AnalysisContext& context) const override;
};

// ─── FundamentalAnalyst ───────────────────────────────────────────────────────

/// Valuation, income, leverage and ESG score.  Independent of prices.
class FundamentalAnalyst final : public ScoringAgent {
public:
    [[nodiscard]] std::string_view name() const noexcept override {
        return FUNDAMENTAL_ANALYST;
    }
    [[nodiscard]] AgentReport analyze(const AnalysisContext& context) const override;
};

// ─── SentimentAnalyst ─────────────────────────────────────────────────────────

/// Keyword-count sentiment over recent headlines, squashed with tanh.
class SentimentAnalyst final : public ScoringAgent {
public:
    [[nodiscard]] std::string_view name() const noexcept override {
        return SENTIMENT_ANALYST;
    }
    [[nodiscard]] AgentReport analyze(const AnalysisContext& context) const override;

    /// (pos − neg) / max(pos + neg, 1) over whitespace tokens of `text`
    /// (case-insensitive).
    [[nodiscard]] static double score_text(std::string_view text);

    [[nodiscard]] static const std::set<std::string, std::less<>>& positive_keywords();
    [[nodiscard]] static const std::set<std::string, std::less<>>& negative_keywords();
};

// ─── RiskOfficer ──────────────────────────────────────────────────────────────

/// Position limits and volatility budget.
struct RiskConfig {
    double max_weight_per_asset = constants::DEFAULT_MAX_WEIGHT_PER_ASSET;
    double max_sector_exposure  = constants::DEFAULT_MAX_SECTOR_EXPOSURE;
    double target_volatility    = constants::DEFAULT_TARGET_VOLATILITY;
};

/// Penalises realised volatility above target and publishes position limits.
///
/// score = clamp(0.5 − clamp((σ − target) / target, 0, 1), −1, 1)
///
/// With fewer than MIN_VOLATILITY_RETURNS valid returns σ is undefined and the
/// report is neutral (score 0, `volatility_available == false`).
class RiskOfficer final : public ScoringAgent {
public:
    explicit RiskOfficer(RiskConfig config = RiskConfig{});

    [[nodiscard]] std::string_view name() const noexcept override {
        return RISK_OFFICER;
    }
    [[nodiscard]] AgentReport analyze(const AnalysisContext& context) const override;

    [[nodiscard]] const RiskConfig& config() const noexcept { return config_; }

private:
    RiskConfig config_;
};

/// The standard four-agent panel (technical, fundamental, sentiment, risk).
[[nodiscard]] AgentList default_agents(RiskConfig risk = RiskConfig{});

}  // namespace invest::agents
