#pragma once

/// @file include/invest/serialization.hpp
/// @brief JSON encoding of reports, decisions and meeting results.
///
/// Field names follow the exported schema:
///
/// ```json
/// {
///   "as_of_date": "2023-12-29", "symbol": "AAPL", "composite_score": 0.21,
///   "orders": [{"symbol": "AAPL", "action": "buy", "weight": 0.042, ...}],
///   "max_gross_exposure": 1.0, "notes": "...",
///   "agent_reports": [{"agent_name": "...", "score": 0.4, ...}],
///   "backtest": {"start_date": "...", "total_return": 0.01, ...}
/// }
/// ```
///
/// Doubles are written in shortest round-trip form, so decode(encode(x)) == x
/// bit-for-bit.  Dates are ISO strings, or `null` when absent.  JSON has no
/// NaN or infinity: a non-finite agent score is written as `null` and read
/// back as a quiet NaN.  Decoding a
/// structurally malformed document throws `nlohmann::json::exception`; an
/// invalid date or order action throws `std::invalid_argument`.

#include "invest/agents.hpp"
#include "invest/backtest.hpp"
#include "invest/meeting.hpp"
#include "invest/portfolio.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace invest::agents {
void to_json(nlohmann::json& j, const AgentReport& report);
void from_json(const nlohmann::json& j, AgentReport& report);
}  // namespace invest::agents

namespace invest::backtest {
void to_json(nlohmann::json& j, const BacktestReport& report);
void from_json(const nlohmann::json& j, BacktestReport& report);
}  // namespace invest::backtest

namespace invest::portfolio {
void to_json(nlohmann::json& j, const Order& order);
void from_json(const nlohmann::json& j, Order& order);
void to_json(nlohmann::json& j, const Decision& decision);
void from_json(const nlohmann::json& j, Decision& decision);
}  // namespace invest::portfolio

namespace invest::io {

/// Encode a meeting result: symbol → Decision object, or
/// `{"symbol": ..., "error": ...}` for a failed symbol.
[[nodiscard]] nlohmann::json result_to_json(const core::MeetingResult& result);

/// Decode a document produced by `result_to_json`.
[[nodiscard]] core::MeetingResult result_from_json(const nlohmann::json& j);

/// Pretty-printed JSON text (`indent < 0` for compact output).
[[nodiscard]] std::string dump_result(const core::MeetingResult& result, int indent = 2);

}  // namespace invest::io
