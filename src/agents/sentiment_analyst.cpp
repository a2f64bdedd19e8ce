/// @file src/agents/sentiment_analyst.cpp
/// @brief SentimentAnalyst: keyword sentiment over recent news.

#include "invest/agents.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <string>

namespace invest::agents {

namespace {

[[nodiscard]] std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

[[nodiscard]] std::string trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(first, last - first + 1));
}

}  // namespace

const std::set<std::string, std::less<>>& SentimentAnalyst::positive_keywords() {
    static const std::set<std::string, std::less<>> words{
        "beats", "growth", "surge", "outperform",
        "bullish", "upgrade", "strong", "record",
    };
    return words;
}

const std::set<std::string, std::less<>>& SentimentAnalyst::negative_keywords() {
    static const std::set<std::string, std::less<>> words{
        "miss", "decline", "drop", "lawsuit", "bearish",
        "downgrade", "weak", "fraud", "risk",
    };
    return words;
}

double SentimentAnalyst::score_text(std::string_view text) {
    const auto& positive = positive_keywords();
    const auto& negative = negative_keywords();

    std::istringstream tokens(to_lower(text));
    std::string word;
    int pos_hits = 0;
    int neg_hits = 0;
    while (tokens >> word) {
        if (positive.contains(word)) ++pos_hits;
        if (negative.contains(word)) ++neg_hits;
    }

    if (pos_hits == 0 && neg_hits == 0) return 0.0;
    return static_cast<double>(pos_hits - neg_hits) /
           static_cast<double>(std::max(pos_hits + neg_hits, 1));
}

AgentReport SentimentAnalyst::analyze(const AnalysisContext& context) const {
    AgentReport report{
        .agent_name = std::string(name()),
        .symbol     = context.symbol,
        .score      = 0.0,
        .rationale  = "No recent news",
        .metadata   = {{"news_count", context.news.size()}},
    };

    double sum = 0.0;
    Metadata articles = Metadata::array();
    for (const auto& item : context.news) {
        const std::string combined = trim(item.title + " " + item.summary);
        if (combined.empty()) continue;

        const double item_score = score_text(combined);
        sum += item_score;
        articles.push_back({{"title", item.title}, {"score", item_score}});
    }

    if (articles.empty()) {
        return report;
    }

    const std::size_t count = articles.size();
    const double average    = std::tanh(sum / static_cast<double>(count));

    report.score     = bounded_score(average);
    report.rationale = fmt::format(
        "Average sentiment score {:.2f} based on {} articles", report.score, count);
    report.metadata  = {{"news_count", context.news.size()},
                        {"articles", std::move(articles)}};
    return report;
}

}  // namespace invest::agents
