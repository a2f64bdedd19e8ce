/// @file src/io/serialization.cpp
/// @brief nlohmann::json adapters for the exported artefacts.

#include "invest/serialization.hpp"

#include <limits>
#include <stdexcept>

namespace invest {

namespace {

[[nodiscard]] nlohmann::json date_to_json(const std::optional<Date>& date) {
    if (!date) return nullptr;
    return to_iso_date(*date);
}

[[nodiscard]] std::optional<Date> date_from_json(const nlohmann::json& j) {
    if (j.is_null()) return std::nullopt;
    const auto text = j.get<std::string>();
    const auto parsed = parse_iso_date(text);
    if (!parsed) {
        throw std::invalid_argument("invalid ISO date '" + text + "'");
    }
    return parsed;
}

// nlohmann writes non-finite doubles as null.
[[nodiscard]] double score_from_json(const nlohmann::json& j) {
    if (j.is_null()) return std::numeric_limits<double>::quiet_NaN();
    return j.get<double>();
}

}  // namespace

// ─── AgentReport ──────────────────────────────────────────────────────────────

namespace agents {

void to_json(nlohmann::json& j, const AgentReport& report) {
    j = nlohmann::json{
        {"agent_name", report.agent_name},
        {"symbol",     report.symbol},
        {"score",      report.score},
        {"rationale",  report.rationale},
        {"metadata",   report.metadata},
    };
}

void from_json(const nlohmann::json& j, AgentReport& report) {
    j.at("agent_name").get_to(report.agent_name);
    j.at("symbol").get_to(report.symbol);
    report.score = score_from_json(j.at("score"));
    j.at("rationale").get_to(report.rationale);
    report.metadata = j.value("metadata", Metadata::object());
}

}  // namespace agents

// ─── BacktestReport ───────────────────────────────────────────────────────────

namespace backtest {

void to_json(nlohmann::json& j, const BacktestReport& report) {
    j = nlohmann::json{
        {"start_date",         date_to_json(report.start_date)},
        {"end_date",           date_to_json(report.end_date)},
        {"total_return",       report.total_return},
        {"annualized_return",  report.annualized_return},
        {"sharpe_ratio",       report.sharpe_ratio},
        {"max_drawdown",       report.max_drawdown},
        {"cumulative_returns", report.cumulative_returns},
    };
}

void from_json(const nlohmann::json& j, BacktestReport& report) {
    report.start_date = date_from_json(j.at("start_date"));
    report.end_date   = date_from_json(j.at("end_date"));
    j.at("total_return").get_to(report.total_return);
    j.at("annualized_return").get_to(report.annualized_return);
    j.at("sharpe_ratio").get_to(report.sharpe_ratio);
    j.at("max_drawdown").get_to(report.max_drawdown);
    j.at("cumulative_returns").get_to(report.cumulative_returns);
}

}  // namespace backtest

// ─── Order / Decision ─────────────────────────────────────────────────────────

namespace portfolio {

void to_json(nlohmann::json& j, const Order& order) {
    j = nlohmann::json{
        {"symbol",      order.symbol},
        {"action",      std::string(to_string(order.action))},
        {"weight",      order.weight},
        {"entry_rule",  order.entry_rule},
        {"stop",        order.stop},
        {"take_profit", order.take_profit},
        {"rationale",   order.rationale},
    };
}

void from_json(const nlohmann::json& j, Order& order) {
    j.at("symbol").get_to(order.symbol);
    const auto action_text = j.at("action").get<std::string>();
    const auto action = parse_action(action_text);
    if (!action) {
        throw std::invalid_argument("unknown order action '" + action_text + "'");
    }
    order.action = *action;
    j.at("weight").get_to(order.weight);
    j.at("entry_rule").get_to(order.entry_rule);
    j.at("stop").get_to(order.stop);
    j.at("take_profit").get_to(order.take_profit);
    j.at("rationale").get_to(order.rationale);
}

void to_json(nlohmann::json& j, const Decision& decision) {
    j = nlohmann::json{
        {"as_of_date",         date_to_json(decision.as_of_date)},
        {"symbol",             decision.symbol},
        {"composite_score",    decision.composite_score},
        {"orders",             decision.orders},
        {"max_gross_exposure", decision.max_gross_exposure},
        {"notes",              decision.notes},
        {"agent_reports",      decision.agent_reports},
    };
    if (decision.backtest) {
        j["backtest"] = *decision.backtest;
    }
}

void from_json(const nlohmann::json& j, Decision& decision) {
    decision.as_of_date = date_from_json(j.at("as_of_date"));
    j.at("symbol").get_to(decision.symbol);
    j.at("composite_score").get_to(decision.composite_score);
    j.at("orders").get_to(decision.orders);
    j.at("max_gross_exposure").get_to(decision.max_gross_exposure);
    j.at("notes").get_to(decision.notes);
    j.at("agent_reports").get_to(decision.agent_reports);
    if (const auto it = j.find("backtest"); it != j.end() && !it->is_null()) {
        decision.backtest = it->get<backtest::BacktestReport>();
    } else {
        decision.backtest.reset();
    }
}

}  // namespace portfolio

// ─── MeetingResult ────────────────────────────────────────────────────────────

namespace io {

nlohmann::json result_to_json(const core::MeetingResult& result) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [symbol, outcome] : result) {
        if (const auto* decision = std::get_if<portfolio::Decision>(&outcome)) {
            out[symbol] = *decision;
        } else {
            const auto& err = std::get<core::SymbolError>(outcome);
            out[symbol] = {{"symbol", err.symbol}, {"error", err.error}};
        }
    }
    return out;
}

core::MeetingResult result_from_json(const nlohmann::json& j) {
    core::MeetingResult result;
    for (const auto& [symbol, value] : j.items()) {
        if (value.contains("error")) {
            result.emplace(symbol, core::SymbolError{
                .symbol = value.value("symbol", symbol),
                .error  = value.at("error").get<std::string>(),
            });
        } else {
            result.emplace(symbol, value.get<portfolio::Decision>());
        }
    }
    return result;
}

std::string dump_result(const core::MeetingResult& result, int indent) {
    return result_to_json(result).dump(indent);
}

}  // namespace io

}  // namespace invest
