#include <gtest/gtest.h>
#include "rangefetch/report_format.hpp"

#include <ctime>
#include <regex>

using namespace rangefetch;

namespace {

std::tm makeTime(int year, int month, int day, int hour, int minute, int second) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    return tm;
}

TEST(ReportFormatTest, StatusLineShowsTimestampAndThreeUnits) {
    const auto line = formatStatusLine(makeTime(2024, 1, 31, 9, 5, 7), 3 * 1024 * 1024 + 512);
    EXPECT_EQ(line, "[2024-01-31 09:05:07] Average speed: 3146240 B/s, 3072 KB/s, 3 MB/s");
}

TEST(ReportFormatTest, StatusLineBelowOneKilobyte) {
    const auto line = formatStatusLine(makeTime(2023, 12, 1, 23, 59, 59), 1023);
    EXPECT_EQ(line, "[2023-12-01 23:59:59] Average speed: 1023 B/s, 0 KB/s, 0 MB/s");
}

TEST(ReportFormatTest, SummaryLine) {
    EXPECT_EQ(formatSummaryLine(1'000'000, 2048),
              "Download completed: 1000000 bytes downloaded at an average speed of 2048 B/s, 2 KB/s, 0 MB/s");
}

TEST(ReportFormatTest, SummaryLineZeroSpeed) {
    EXPECT_EQ(formatSummaryLine(0, 0),
              "Download completed: 0 bytes downloaded at an average speed of 0 B/s, 0 KB/s, 0 MB/s");
}

TEST(ReportFormatTest, CurrentLocalTimeFormatsAsTimestamp) {
    const auto line = formatStatusLine(currentLocalTime(), 0);
    EXPECT_TRUE(std::regex_match(line, std::regex(R"(\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\] Average speed: 0 B/s, 0 KB/s, 0 MB/s)")))
        << line;
}

} // namespace
