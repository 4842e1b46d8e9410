#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

#include "scanner.hpp"

static LiteralScanner ScanText(const std::string& text) {
    std::istringstream in(text);
    LiteralScanner scanner;
    EXPECT_TRUE(scanner.scanStream(in, "test.sp"));
    return scanner;
}

class LiteralScannerTest : public ::testing::Test {};

TEST_F(LiteralScannerTest, SplitsOnWhitespaceAndKeepsOrder) {
    LiteralScanner s = ScanText("1k  2.2u\t-3Meg\n\n47p\r\n");
    const auto& r = s.results();
    ASSERT_EQ(r.size(), 4u);
    EXPECT_EQ(s.errorCount(), 0);

    EXPECT_EQ(r[0].token, "1k");
    EXPECT_EQ(r[0].lineNo, 1);
    EXPECT_DOUBLE_EQ(r[0].number.value, 1e3);

    EXPECT_EQ(r[2].token, "-3Meg");
    EXPECT_DOUBLE_EQ(r[2].number.value, -3e6);

    EXPECT_EQ(r[3].token, "47p");    // CR stripped
    EXPECT_EQ(r[3].lineNo, 3);
    EXPECT_EQ(r[3].number.raw, "47p");
}

TEST_F(LiteralScannerTest, SkipsComments) {
    LiteralScanner s = ScanText(
        "* full line comment 1k\n"
        "   ; another 2k\n"
        "10n $ inline 5k\n"
        "$ only a comment\n"
        "20f\n");
    const auto& r = s.results();
    ASSERT_EQ(r.size(), 2u);
    EXPECT_EQ(r[0].token, "10n");
    EXPECT_EQ(r[0].lineNo, 3);
    EXPECT_EQ(r[1].token, "20f");
    EXPECT_EQ(r[1].lineNo, 5);
}

TEST_F(LiteralScannerTest, RecordsFailuresAndContinues) {
    LiteralScanner s = ScanText("1.2.3 474W\n5k\n");
    const auto& r = s.results();
    ASSERT_EQ(r.size(), 3u);
    EXPECT_EQ(s.errorCount(), 2);

    EXPECT_FALSE(r[0].ok);
    EXPECT_EQ(r[0].errorKind, NumberErrorKind::InvalidSyntax);
    EXPECT_FALSE(r[1].ok);
    EXPECT_EQ(r[1].errorKind, NumberErrorKind::InvalidMultiplier);
    EXPECT_TRUE(r[2].ok);
    EXPECT_EQ(r[2].lineNo, 2);
}

TEST_F(LiteralScannerTest, ScanTokensUsesLineZero) {
    LiteralScanner s;
    s.scanTokens({"1", "", "2m"});
    const auto& r = s.results();
    ASSERT_EQ(r.size(), 3u);
    EXPECT_EQ(r[0].lineNo, 0);
    EXPECT_FALSE(r[1].ok);
    EXPECT_EQ(r[1].errorKind, NumberErrorKind::Empty);
    EXPECT_DOUBLE_EQ(r[2].number.value, 2e-3);
    EXPECT_EQ(s.errorCount(), 1);
}

TEST_F(LiteralScannerTest, MissingFileFails) {
    LiteralScanner s;
    EXPECT_FALSE(s.scanFile("/nonexistent/dir/literals.txt"));
    EXPECT_TRUE(s.results().empty());
}

TEST_F(LiteralScannerTest, ClearResetsState) {
    LiteralScanner s = ScanText("bad 1\n");
    EXPECT_EQ(s.errorCount(), 1);
    s.clear();
    EXPECT_EQ(s.errorCount(), 0);
    EXPECT_TRUE(s.results().empty());
}

TEST_F(LiteralScannerTest, ResolvedValuesInInputOrder) {
    LiteralScanner s = ScanText("3k oops 1000 2k\n");
    std::vector<SpiceNumber> v = s.resolvedValues(false, false);
    ASSERT_EQ(v.size(), 3u);
    EXPECT_EQ(v[0].raw, "3k");
    EXPECT_EQ(v[1].raw, "1000");
    EXPECT_EQ(v[2].raw, "2k");
}

TEST_F(LiteralScannerTest, SortIsStableByValue) {
    LiteralScanner s = ScanText("2k 1e3 -5 1k 1000\n");
    std::vector<SpiceNumber> v = s.resolvedValues(true, false);
    ASSERT_EQ(v.size(), 5u);
    EXPECT_EQ(v[0].raw, "-5");
    EXPECT_EQ(v[1].raw, "1e3");
    EXPECT_EQ(v[2].raw, "1k");
    EXPECT_EQ(v[3].raw, "1000");
    EXPECT_EQ(v[4].raw, "2k");
}

TEST_F(LiteralScannerTest, UniqueKeepsFirstSpelling) {
    LiteralScanner s = ScanText("1k 2 1000 1e3 2.0 3\n");
    std::vector<SpiceNumber> v = s.resolvedValues(false, true);
    ASSERT_EQ(v.size(), 3u);
    EXPECT_EQ(v[0].raw, "1k");
    EXPECT_EQ(v[1].raw, "2");
    EXPECT_EQ(v[2].raw, "3");

    std::vector<SpiceNumber> sorted = s.resolvedValues(true, true);
    ASSERT_EQ(sorted.size(), 3u);
    EXPECT_EQ(sorted[0].raw, "2");
    EXPECT_EQ(sorted[1].raw, "3");
    EXPECT_EQ(sorted[2].raw, "1k");
}

TEST_F(LiteralScannerTest, ReportsFileTokenWithLine) {
    std::istringstream in("1k\n  2u 1.2.3\n");
    LiteralScanner s;

    testing::internal::CaptureStderr();
    EXPECT_TRUE(s.scanStream(in, "vals.sp"));
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(err, "vals.sp: Line 2: invalid number: '1.2.3'\n");
}

TEST_F(LiteralScannerTest, ReportsCommandLineTokenWithoutLine) {
    LiteralScanner s;

    testing::internal::CaptureStderr();
    s.scanTokens({"10n", "474W"});
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(err, "<command line>: invalid multiplier: '474W'\n");
}

TEST_F(LiteralScannerTest, StreamReadErrorFails) {
    std::istringstream in("1k 2k\n");
    in.setstate(std::ios::badbit);
    LiteralScanner s;

    testing::internal::CaptureStderr();
    EXPECT_FALSE(s.scanStream(in, "broken.sp"));
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_TRUE(s.results().empty());
    EXPECT_EQ(err, "broken.sp: read error after line 0\n");
}

TEST_F(LiteralScannerTest, LeadingPlusIsALiteralNotAContinuation) {
    LiteralScanner s = ScanText("1k\n+5\n");
    const auto& r = s.results();
    ASSERT_EQ(r.size(), 2u);
    EXPECT_EQ(r[1].token, "+5");
    EXPECT_EQ(r[1].lineNo, 2);
    EXPECT_DOUBLE_EQ(r[1].number.value, 5.0);
}
