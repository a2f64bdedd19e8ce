/// @file src/core/market_data.cpp
/// @brief CsvMarketData and SyntheticMarketData providers.

#include "invest/market_data.hpp"
#include "invest/data_loader.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <random>

namespace invest::core {

namespace {

using std::chrono::days;
using std::chrono::weekday;
using std::chrono::year_month_day;

/// Parse a JSON file; absent file → nullopt, malformed → MarketDataError.
[[nodiscard]] std::optional<nlohmann::json> read_json_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::nullopt;
    }
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw MarketDataError(fmt::format("malformed JSON in {}: {}", path.string(), e.what()));
    }
}

/// Calendar key grouping a date into its week (Monday start) or month.
[[nodiscard]] Date period_key(Date date, BarInterval interval) {
    if (interval == BarInterval::Weekly) {
        const unsigned iso = weekday{date}.iso_encoding();  // Mon = 1 … Sun = 7
        return date - days{iso - 1};
    }
    const year_month_day ymd{date};
    return Date{ymd.year() / ymd.month() / std::chrono::day{1}};
}

/// Collapse daily bars into one bar per week or month.
[[nodiscard]] PriceSeries resample(const PriceSeries& daily, BarInterval interval) {
    PriceSeries out;
    out.interval = interval;
    if (interval == BarInterval::Daily) {
        out.bars = daily.bars;
        return out;
    }

    std::optional<Date> current_key;
    for (const auto& bar : daily.bars) {
        const Date key = period_key(bar.date, interval);
        if (!current_key || key != *current_key) {
            out.bars.push_back(bar);
            current_key = key;
            continue;
        }
        PriceBar& agg = out.bars.back();
        agg.date    = bar.date;
        agg.high    = std::max(agg.high, bar.high);
        agg.low     = std::min(agg.low, bar.low);
        agg.close   = bar.close;
        agg.volume += bar.volume;
    }
    return out;
}

[[nodiscard]] bool is_business_day(Date date) {
    const weekday wd{date};
    return wd != std::chrono::Saturday && wd != std::chrono::Sunday;
}

[[nodiscard]] bool is_month_end(Date date) {
    const year_month_day next{date + days{1}};
    return static_cast<unsigned>(next.day()) == 1;
}

}  // namespace

// ─── CsvMarketData ────────────────────────────────────────────────────────────

CsvMarketData::CsvMarketData(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

PriceSeries CsvMarketData::price_history(const std::string& symbol, Date start, Date end,
                                         BarInterval interval) {
    const auto path = directory_ / (symbol + ".csv");
    auto loaded = DataLoader::load_csv(path.string());
    if (!loaded) {
        throw MarketDataError(fmt::format("cannot open price file {}", path.string()));
    }

    PriceSeries window;
    for (const auto& bar : loaded->bars) {
        if (bar.date >= start && bar.date <= end) {
            window.bars.push_back(bar);
        }
    }
    spdlog::debug("{}: {} of {} bars within range", symbol, window.size(), loaded->size());
    return resample(window, interval);
}

Fundamentals CsvMarketData::fundamentals(const std::string& symbol) {
    Fundamentals out;
    const auto doc = read_json_file(directory_ / (symbol + ".fundamentals.json"));
    if (!doc) return out;
    if (!doc->is_object()) {
        throw MarketDataError(fmt::format("{}: fundamentals must be a JSON object", symbol));
    }

    for (const auto& [key, value] : doc->items()) {
        if (value.is_number()) {
            out[key] = value.get<double>();
        } else {
            out[key] = std::nullopt;
        }
    }
    return out;
}

std::vector<NewsItem> CsvMarketData::recent_news(const std::string& symbol,
                                                 std::size_t limit) {
    std::vector<NewsItem> out;
    const auto doc = read_json_file(directory_ / (symbol + ".news.json"));
    if (!doc) return out;
    if (!doc->is_array()) {
        throw MarketDataError(fmt::format("{}: news must be a JSON array", symbol));
    }

    for (const auto& item : *doc) {
        if (out.size() >= limit) break;
        if (!item.is_object()) continue;
        NewsItem news;
        if (const auto t = item.find("title"); t != item.end() && t->is_string()) {
            news.title = t->get<std::string>();
        }
        if (const auto s = item.find("summary"); s != item.end() && s->is_string()) {
            news.summary = s->get<std::string>();
        }
        out.push_back(std::move(news));
    }
    return out;
}

// ─── SyntheticMarketData ──────────────────────────────────────────────────────

std::uint64_t SyntheticMarketData::stable_hash(std::string_view text) noexcept {
    std::uint64_t h = 14695981039346656037ULL;
    for (unsigned char c : text) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

std::vector<Date> SyntheticMarketData::trading_calendar(Date start, Date end,
                                                        BarInterval interval) {
    std::vector<Date> dates;
    for (Date d = start; d <= end; d += days{1}) {
        switch (interval) {
            case BarInterval::Daily:
                if (is_business_day(d)) dates.push_back(d);
                break;
            case BarInterval::Weekly:
                if (weekday{d} == std::chrono::Friday) dates.push_back(d);
                break;
            case BarInterval::Monthly:
                if (is_month_end(d)) dates.push_back(d);
                break;
        }
    }
    return dates;
}

PriceSeries SyntheticMarketData::price_history(const std::string& symbol, Date start,
                                               Date end, BarInterval interval) {
    const auto dates = trading_calendar(start, end, interval);
    if (dates.empty()) {
        throw MarketDataError(fmt::format("{}: no trading periods between {} and {}",
                                          symbol, to_iso_date(start), to_iso_date(end)));
    }

    const std::uint64_t seed = stable_hash(fmt::format(
        "{}|{}|{}|{}", symbol, to_iso_date(start), to_iso_date(end), to_string(interval)));
    std::mt19937_64 rng(seed);
    std::normal_distribution<double>       step(0.001, 0.02);
    std::normal_distribution<double>       open_noise(0.0, 0.005);
    std::uniform_real_distribution<double> wick(0.0, 0.02);
    std::uniform_int_distribution<long>    volume(1'000'000, 4'999'999);

    PriceSeries series;
    series.interval = interval;
    series.bars.reserve(dates.size());

    double log_level = 0.0;
    for (const Date d : dates) {
        log_level += step(rng);
        const double close = 100.0 * std::exp(log_level);
        const double open  = close * (1.0 + open_noise(rng));
        const double high  = std::max({close * (1.0 + wick(rng)), open, close});
        const double low   = std::min({close * (1.0 - wick(rng)), open, close});
        series.bars.push_back(PriceBar{
            .date   = d,
            .open   = open,
            .high   = high,
            .low    = low,
            .close  = close,
            .volume = static_cast<double>(volume(rng)),
        });
    }
    return series;
}

Fundamentals SyntheticMarketData::fundamentals(const std::string& symbol) {
    const std::uint64_t base = stable_hash(symbol) % 1'000'000;
    const double b = static_cast<double>(base);

    const double dividend = static_cast<double>(base % 300) / 3000.0;

    return Fundamentals{
        {"market_cap",     1e9 + b * 1000.0},
        {"pe_ratio",       10.0 + static_cast<double>(base % 150) / 10.0},
        {"pb_ratio",       1.0 + static_cast<double>(base % 50) / 20.0},
        {"dividend_yield", dividend > 0.0 ? std::optional<double>(dividend) : std::nullopt},
        {"esg_score",      40.0 + static_cast<double>(base % 30)},
        {"debt_to_asset",  static_cast<double>(base % 70) / 100.0},
    };
}

std::vector<NewsItem> SyntheticMarketData::recent_news(const std::string& symbol,
                                                       std::size_t limit) {
    std::vector<NewsItem> out;
    out.reserve(limit);
    for (std::size_t i = 0; i < limit; ++i) {
        out.push_back(NewsItem{
            .title   = fmt::format("Offline headline {} for {}", i + 1, symbol),
            .summary = {},
        });
    }
    return out;
}

}  // namespace invest::core
