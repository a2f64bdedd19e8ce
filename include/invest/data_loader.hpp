#pragma once

/// @file include/invest/data_loader.hpp
/// @brief CSV loader for OHLCV price data.
///
/// # Module: DataLoader
///
/// ## Expected CSV Format
/// ```
/// date,open,high,low,close,volume
/// 2024-01-02,100.0,105.0,99.0,103.0,1000000
/// 2024-01-03,103.0,107.0,102.0,106.5,1200000
/// ```
/// The first non-comment line is treated as a header and skipped.
///
/// ## Guarantees
/// - Malformed, non-finite or inconsistent rows are skipped, never fatal
/// - Rows whose date does not advance past the previous kept row are skipped,
///   so the returned series is strictly increasing in date
/// - Bad input never throws; only allocation failures propagate.  The
///   skipped-row count is reported through the default spdlog logger, so the
///   parsing entry points are not `noexcept`

#include "invest/types.hpp"

#include <optional>
#include <string>

namespace invest::core {

class DataLoader {
public:
    /// Load bars from a CSV file.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Possibly empty series otherwise
    [[nodiscard]] static std::optional<PriceSeries>
    load_csv(const std::string& filepath);

    /// Parse bars from CSV text (same format as `load_csv`).
    [[nodiscard]] static PriceSeries
    parse_csv_string(const std::string& csv_content);

    /// A bar is valid if all prices are finite, close > 0,
    /// low ≤ open, close ≤ high, and volume ≥ 0.
    [[nodiscard]] static bool validate_bar(const PriceBar& bar) noexcept;

private:
    /// Parse one data row; `nullopt` when malformed or invalid.
    [[nodiscard]] static std::optional<PriceBar>
    parse_row(const std::string& line) noexcept;
};

}  // namespace invest::core
