#include <gtest/gtest.h>
#include "invest/data_loader.hpp"
#include "test_support.hpp"

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <memory>
#include <sstream>

using namespace invest;
using namespace invest::core;
using namespace invest::testing;

namespace {

const std::string kHeader = "date,open,high,low,close,volume\n";

}  // namespace

// ─── validate_bar ─────────────────────────────────────────────────────────────

TEST(DataLoader_Validate, WellFormedBar) {
    const PriceBar bar{.date = day(2024, 1, 2), .open = 10.0, .high = 11.0,
                       .low = 9.5, .close = 10.5, .volume = 1000.0};
    EXPECT_TRUE(DataLoader::validate_bar(bar));
}

TEST(DataLoader_Validate, RejectsInconsistentBars) {
    const PriceBar base{.date = day(2024, 1, 2), .open = 10.0, .high = 11.0,
                        .low = 9.5, .close = 10.5, .volume = 1000.0};

    PriceBar bad = base;
    bad.close = 0.0;
    EXPECT_FALSE(DataLoader::validate_bar(bad));

    bad = base;
    bad.high = 9.0;
    EXPECT_FALSE(DataLoader::validate_bar(bad));

    bad = base;
    bad.volume = -1.0;
    EXPECT_FALSE(DataLoader::validate_bar(bad));

    bad = base;
    bad.open = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(DataLoader::validate_bar(bad));
}

// ─── parse_csv_string ─────────────────────────────────────────────────────────

TEST(DataLoader_Parse, ReadsRowsAfterHeader) {
    const auto series = DataLoader::parse_csv_string(
        kHeader +
        "2024-01-02,10,11,9.5,10.5,1000\n"
        "2024-01-03, 10.5 ,12,10,11.5,2000\r\n");
    ASSERT_EQ(series.size(), 2u);
    EXPECT_EQ(series.bars[0].date, day(2024, 1, 2));
    EXPECT_DOUBLE_EQ(series.bars[1].close, 11.5);
    EXPECT_DOUBLE_EQ(series.bars[1].volume, 2000.0);
    EXPECT_EQ(series.interval, BarInterval::Daily);
}

TEST(DataLoader_Parse, SkipsMalformedRows) {
    const auto series = DataLoader::parse_csv_string(
        kHeader +
        "2024-01-02,10,11,9.5,10.5,1000\n"
        "2024-01-03,10,11,9.5\n"                 // too few fields
        "2024-01-04,ten,11,9.5,10.5,1000\n"      // not a number
        "2024-02-30,10,11,9.5,10.5,1000\n"       // not a date
        "2024-01-05,10,11,9.5,10.5,1000,extra\n" // too many fields
        "# comment\n"
        "\n"
        "2024-01-08,10,11,9.5,10.5,1000\n");
    ASSERT_EQ(series.size(), 2u);
    EXPECT_EQ(series.bars[1].date, day(2024, 1, 8));
}

TEST(DataLoader_Parse, DropsOutOfOrderAndDuplicateDates) {
    const auto series = DataLoader::parse_csv_string(
        kHeader +
        "2024-01-03,10,11,9.5,10.5,1000\n"
        "2024-01-02,10,11,9.5,10.5,1000\n"
        "2024-01-03,10,11,9.5,10.5,1000\n"
        "2024-01-04,10,11,9.5,10.5,1000\n");
    ASSERT_EQ(series.size(), 2u);
    EXPECT_EQ(series.bars[0].date, day(2024, 1, 3));
    EXPECT_EQ(series.bars[1].date, day(2024, 1, 4));
}

TEST(DataLoader_Parse, SkippedRows_WarnedThroughDefaultLogger) {
    // Logging may throw, so the parser must not promise noexcept.
    static_assert(!noexcept(DataLoader::parse_csv_string(std::string{})));
    static_assert(!noexcept(DataLoader::load_csv(std::string{})));

    std::ostringstream captured;
    auto previous = spdlog::default_logger();
    auto capture  = std::make_shared<spdlog::logger>(
        "capture", std::make_shared<spdlog::sinks::ostream_sink_mt>(captured));
    capture->set_pattern("%v");
    spdlog::set_default_logger(capture);

    const auto series = DataLoader::parse_csv_string(
        kHeader +
        "2024-01-02,10,11,9.5,10.5,1000\n"
        "bad row\n"
        "2024-01-01,10,11,9.5,10.5,1000\n");
    spdlog::set_default_logger(previous);

    EXPECT_EQ(series.size(), 1u);
    EXPECT_NE(captured.str().find("skipped 2 malformed or out-of-order rows"),
              std::string::npos);
}

TEST(DataLoader_Parse, EmptyAndHeaderOnly) {
    EXPECT_TRUE(DataLoader::parse_csv_string("").empty());
    EXPECT_TRUE(DataLoader::parse_csv_string(kHeader).empty());
}

// ─── load_csv ─────────────────────────────────────────────────────────────────

TEST(DataLoader_Load, MissingFile_Nullopt) {
    EXPECT_FALSE(DataLoader::load_csv("/nonexistent/invest/none.csv").has_value());
}

TEST(DataLoader_Load, ReadsFileFromDisk) {
    const auto path = std::filesystem::temp_directory_path() / "invest_test_loader.csv";
    {
        std::ofstream out(path);
        out << kHeader << "2024-01-02,10,11,9.5,10.5,1000\n";
    }
    const auto series = DataLoader::load_csv(path.string());
    std::filesystem::remove(path);

    ASSERT_TRUE(series.has_value());
    ASSERT_EQ(series->size(), 1u);
    EXPECT_DOUBLE_EQ(series->bars[0].high, 11.0);
}
