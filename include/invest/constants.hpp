#pragma once

#include <array>
#include <cstddef>

/// @file include/invest/constants.hpp
/// @brief Numeric and scoring constants for the investment meeting pipeline.

namespace invest::constants {

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

/// Floor applied to the position weight in the Sharpe denominator.
static constexpr double MIN_WEIGHT_EPSILON = 1e-9;

// ─── Annualisation ────────────────────────────────────────────────────────────

/// Trading periods per year for daily bars.
static constexpr double TRADING_DAYS_PER_YEAR = 252.0;

/// Periods per year for weekly bars.
static constexpr double WEEKS_PER_YEAR = 52.0;

/// Periods per year for monthly bars.
static constexpr double MONTHS_PER_YEAR = 12.0;

/// Volatility estimates need at least this many valid returns; shorter
/// samples report a volatility of 0.0.
static constexpr std::size_t MIN_VOLATILITY_RETURNS = 3;

// ─── Indicator Defaults ───────────────────────────────────────────────────────

/// Default moving-average lookback windows.
static constexpr std::array<std::size_t, 6> DEFAULT_WINDOWS = {5, 10, 20, 50, 100, 200};

static constexpr std::size_t RSI_PERIOD      = 14;
static constexpr std::size_t MACD_FAST       = 12;
static constexpr std::size_t MACD_SLOW       = 26;
static constexpr std::size_t MACD_SIGNAL     = 9;
static constexpr std::size_t BOLLINGER_WINDOW = 20;
static constexpr double      BOLLINGER_WIDTH  = 2.0;

// ─── Risk / Portfolio Defaults ────────────────────────────────────────────────

static constexpr double DEFAULT_MAX_WEIGHT_PER_ASSET = 0.2;
static constexpr double DEFAULT_MAX_SECTOR_EXPOSURE  = 0.5;
static constexpr double DEFAULT_TARGET_VOLATILITY    = 0.3;

static constexpr double DEFAULT_MAX_GROSS_EXPOSURE = 1.0;
static constexpr double DEFAULT_MIN_CONFIDENCE     = 0.1;
static constexpr double DEFAULT_STOP_LOSS          = 0.08;
static constexpr double DEFAULT_TAKE_PROFIT        = 0.2;

// ─── Meeting Defaults ─────────────────────────────────────────────────────────

/// Number of news items requested per symbol.
static constexpr std::size_t DEFAULT_NEWS_LIMIT = 20;

}  // namespace invest::constants
