/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for OHLCV market data.

#include "invest/data_loader.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace invest::core {

namespace {

[[nodiscard]] std::string_view trim(std::string_view token) noexcept {
    const auto first = token.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = token.find_last_not_of(" \t\r\n");
    return token.substr(first, last - first + 1);
}

/// Parse a whole token as a finite double.
[[nodiscard]] std::optional<double> parse_double(std::string_view token) noexcept {
    if (token.empty()) return std::nullopt;
    double value = 0.0;
    const auto* last = token.data() + token.size();
    const auto [ptr, ec] = std::from_chars(token.data(), last, value);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

}  // namespace

// ─── DataLoader::validate_bar ─────────────────────────────────────────────────

bool DataLoader::validate_bar(const PriceBar& bar) noexcept {
    if (!std::isfinite(bar.open)  ||
        !std::isfinite(bar.high)  ||
        !std::isfinite(bar.low)   ||
        !std::isfinite(bar.close) ||
        !std::isfinite(bar.volume)) {
        return false;
    }

    if (bar.close <= 0.0)     return false;
    if (bar.high < bar.low)   return false;
    if (bar.open  > bar.high) return false;
    if (bar.open  < bar.low)  return false;
    if (bar.close > bar.high) return false;
    if (bar.close < bar.low)  return false;
    if (bar.volume < 0.0)     return false;

    return true;
}

// ─── DataLoader::parse_row ────────────────────────────────────────────────────

std::optional<PriceBar>
DataLoader::parse_row(const std::string& line) noexcept {
    if (line.empty() || line[0] == '#') {
        return std::nullopt;
    }

    std::vector<std::string_view> tokens;
    std::string_view rest(line);
    while (true) {
        const auto comma = rest.find(',');
        tokens.push_back(trim(rest.substr(0, comma)));
        if (comma == std::string_view::npos) break;
        rest.remove_prefix(comma + 1);
    }
    if (tokens.size() != 6) {
        return std::nullopt;
    }

    const auto date = parse_iso_date(tokens[0]);
    if (!date) return std::nullopt;

    double fields[5];
    for (std::size_t i = 0; i < 5; ++i) {
        const auto v = parse_double(tokens[i + 1]);
        if (!v) return std::nullopt;
        fields[i] = *v;
    }

    PriceBar bar{
        .date   = *date,
        .open   = fields[0],
        .high   = fields[1],
        .low    = fields[2],
        .close  = fields[3],
        .volume = fields[4],
    };

    if (!validate_bar(bar)) {
        return std::nullopt;
    }
    return bar;
}

// ─── DataLoader::parse_csv_string ─────────────────────────────────────────────

PriceSeries DataLoader::parse_csv_string(const std::string& csv_content) {
    PriceSeries series;
    std::istringstream stream(csv_content);
    std::string line;
    bool header_skipped = false;
    std::size_t skipped = 0;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (!header_skipped) {
            if (!line.empty() && line[0] != '#') {
                header_skipped = true;
            }
            continue;
        }
        if (line.empty() || line[0] == '#') continue;

        auto bar = parse_row(line);
        if (!bar || (!series.bars.empty() && bar->date <= series.bars.back().date)) {
            ++skipped;
            continue;
        }
        series.bars.push_back(*bar);
    }

    if (skipped > 0) {
        spdlog::warn("DataLoader: skipped {} malformed or out-of-order rows", skipped);
    }
    return series;
}

// ─── DataLoader::load_csv ─────────────────────────────────────────────────────

std::optional<PriceSeries>
DataLoader::load_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

}  // namespace invest::core
