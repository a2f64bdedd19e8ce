/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for the OHLCV CSV loader and the indicator engine
 *
 * Build:
 *   cmake -DINVEST_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every parsed bar passes DataLoader::validate_bar.
 *   3. Dates are strictly increasing.
 *   4. Indicator cells computed from the parsed series are finite.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

#include "invest/data_loader.hpp"
#include "invest/indicators.hpp"

using namespace invest;
using namespace invest::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);

    const PriceSeries series = DataLoader::parse_csv_string(input);

    for (std::size_t i = 0; i < series.size(); ++i) {
        assert(DataLoader::validate_bar(series.bars[i]));
        if (i > 0) {
            assert(series.bars[i - 1].date < series.bars[i].date);
        }
    }

    const auto table = indicators::IndicatorEngine{}.compute(series);
    for (const auto& row : table.rows()) {
        for (const auto& [name, value] : row.values) {
            assert(std::isfinite(value));
        }
    }
    return 0;
}
