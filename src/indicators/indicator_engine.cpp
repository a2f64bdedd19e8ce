/// @file src/indicators/indicator_engine.cpp
/// @brief IndicatorEngine: moving averages, RSI, MACD and Bollinger bands.

#include "invest/indicators.hpp"
#include "invest/constants.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace invest::indicators {

namespace {

/// True if every close is finite and strictly positive.
[[nodiscard]] bool valid_closes(std::span<const double> closes) noexcept {
    return std::all_of(closes.begin(), closes.end(), [](double c) {
        return std::isfinite(c) && c > 0.0;
    });
}

}  // namespace

// ─── IndicatorRow / IndicatorTable ────────────────────────────────────────────

std::optional<double> IndicatorRow::get(std::string_view name) const {
    const auto it = values.find(name);
    if (it == values.end()) return std::nullopt;
    return it->second;
}

IndicatorTable::IndicatorTable(std::vector<IndicatorRow> rows, IndicatorMeta meta)
    : rows_(std::move(rows))
    , meta_(meta) {}

const IndicatorRow* IndicatorTable::latest() const noexcept {
    return rows_.empty() ? nullptr : &rows_.back();
}

// ─── IndicatorEngine ──────────────────────────────────────────────────────────

IndicatorEngine::IndicatorEngine(IndicatorConfig config) {
    for (std::size_t w : config.windows) {
        if (w > 0) windows_.push_back(w);
    }
    if (windows_.empty()) {
        windows_.assign(constants::DEFAULT_WINDOWS.begin(),
                        constants::DEFAULT_WINDOWS.end());
    }
    std::sort(windows_.begin(), windows_.end());
    windows_.erase(std::unique(windows_.begin(), windows_.end()), windows_.end());
}

std::vector<std::optional<double>>
IndicatorEngine::sma(std::span<const double> values, std::size_t window) {
    std::vector<std::optional<double>> out(values.size());
    if (window == 0) return out;

    // Running sum over the trailing window.
    double sum = 0.0;
    for (std::size_t i = 0; i < values.size(); ++i) {
        sum += values[i];
        if (i >= window) sum -= values[i - window];
        if (i + 1 >= window) {
            out[i] = sum / static_cast<double>(window);
        }
    }
    return out;
}

std::vector<double>
IndicatorEngine::ewm(std::span<const double> values, double alpha) {
    std::vector<double> out;
    out.reserve(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i == 0) {
            out.push_back(values[0]);
        } else {
            out.push_back(alpha * values[i] + (1.0 - alpha) * out.back());
        }
    }
    return out;
}

std::vector<double>
IndicatorEngine::ema(std::span<const double> values, std::size_t window) {
    const double alpha = 2.0 / (static_cast<double>(window) + 1.0);
    return ewm(values, alpha);
}

std::vector<std::optional<double>>
IndicatorEngine::rsi(std::span<const double> closes, std::size_t period) {
    std::vector<std::optional<double>> out(closes.size());
    if (closes.size() < 2 || period == 0) return out;

    // Split deltas into gains and losses (both ≥ 0).
    std::vector<double> gains;
    std::vector<double> losses;
    gains.reserve(closes.size() - 1);
    losses.reserve(closes.size() - 1);
    for (std::size_t i = 1; i < closes.size(); ++i) {
        const double delta = closes[i] - closes[i - 1];
        gains.push_back(std::max(delta, 0.0));
        losses.push_back(std::max(-delta, 0.0));
    }

    const double alpha = 1.0 / static_cast<double>(period);
    const auto avg_gain = ewm(gains, alpha);
    const auto avg_loss = ewm(losses, alpha);

    for (std::size_t i = 0; i < avg_gain.size(); ++i) {
        const double up   = avg_gain[i];
        const double down = avg_loss[i];
        // A window without losses, flat included, saturates at 100.
        const double value = (down <= 0.0) ? 100.0 : 100.0 - 100.0 / (1.0 + up / down);
        out[i + 1] = std::clamp(value, 0.0, 100.0);
    }
    return out;
}

std::vector<std::optional<double>>
IndicatorEngine::rolling_stddev(std::span<const double> values, std::size_t window) {
    std::vector<std::optional<double>> out(values.size());
    if (window < 2) return out;

    for (std::size_t i = window - 1; i < values.size(); ++i) {
        const auto slice = values.subspan(i + 1 - window, window);
        double mean = 0.0;
        for (double v : slice) mean += v;
        mean /= static_cast<double>(window);

        double sq_sum = 0.0;
        for (double v : slice) {
            const double d = v - mean;
            sq_sum += d * d;
        }
        // Bessel-corrected (n − 1).
        out[i] = std::sqrt(sq_sum / static_cast<double>(window - 1));
    }
    return out;
}

IndicatorTable IndicatorEngine::compute(const PriceSeries& series) const {
    const std::vector<double> closes = series.closes();
    const std::size_t n           = closes.size();
    const std::size_t largest     = windows_.back();

    IndicatorMeta meta{
        .insufficient_history = true,
        .observations         = n,
        .min_required         = largest,
    };

    if (n == 0 || !valid_closes(closes)) {
        return IndicatorTable({}, meta);
    }

    // ── Column computation ──────────────────────────────────────────────────
    using Column = std::vector<std::optional<double>>;
    std::vector<std::pair<std::string, Column>> columns;

    Column sma20;
    for (std::size_t w : windows_) {
        Column sma_col = sma(closes, w);
        if (w == constants::BOLLINGER_WINDOW) sma20 = sma_col;
        columns.emplace_back(fmt::format("sma_{}", w), std::move(sma_col));

        const auto ema_vals = ema(closes, w);
        columns.emplace_back(fmt::format("ema_{}", w),
                             Column(ema_vals.begin(), ema_vals.end()));
    }

    columns.emplace_back("rsi", rsi(closes));

    const auto ema_fast = ema(closes, constants::MACD_FAST);
    const auto ema_slow = ema(closes, constants::MACD_SLOW);
    std::vector<double> macd_line(n);
    for (std::size_t i = 0; i < n; ++i) {
        macd_line[i] = ema_fast[i] - ema_slow[i];
    }
    const auto signal = ema(macd_line, constants::MACD_SIGNAL);

    Column macd_col(n), signal_col(n), hist_col(n);
    for (std::size_t i = 0; i < n; ++i) {
        macd_col[i]   = macd_line[i];
        signal_col[i] = signal[i];
        hist_col[i]   = macd_line[i] - signal[i];
    }
    columns.emplace_back("macd", std::move(macd_col));
    columns.emplace_back("macd_signal", std::move(signal_col));
    columns.emplace_back("macd_hist", std::move(hist_col));

    // Bollinger bands always use a 20-bar SMA, configured window or not.
    if (sma20.empty()) sma20 = sma(closes, constants::BOLLINGER_WINDOW);
    const auto sigma = rolling_stddev(closes, constants::BOLLINGER_WINDOW);
    Column upper(n), lower(n);
    for (std::size_t i = 0; i < n; ++i) {
        if (sma20[i] && sigma[i]) {
            upper[i] = *sma20[i] + constants::BOLLINGER_WIDTH * *sigma[i];
            lower[i] = *sma20[i] - constants::BOLLINGER_WIDTH * *sigma[i];
        }
    }
    columns.emplace_back("bb_upper", std::move(upper));
    columns.emplace_back("bb_lower", std::move(lower));

    // ── Row assembly: drop undefined cells, then empty rows ────────────────
    std::vector<IndicatorRow> rows;
    rows.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        IndicatorRow row{.date = series.bars[i].date, .values = {}};
        for (const auto& [name, column] : columns) {
            const auto& cell = column[i];
            if (cell && std::isfinite(*cell)) {
                row.values.emplace(name, *cell);
            }
        }
        if (!row.values.empty()) {
            rows.push_back(std::move(row));
        }
    }

    meta.insufficient_history = rows.empty() || n < largest;
    return IndicatorTable(std::move(rows), meta);
}

}  // namespace invest::indicators
