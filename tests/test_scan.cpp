#include <gtest/gtest.h>
#include <string>
#include "errors.hpp"
#include "scan.hpp"

TEST(Scan, FindAllIsNonOverlapping) {
    std::vector<size_t> hits = find_all("aaaa", "aa");
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0], 0u);
    EXPECT_EQ(hits[1], 2u);
    EXPECT_TRUE(find_all("abc", "").empty());
    EXPECT_TRUE(find_all("abc", "x").empty());
}

TEST(Scan, FindLineStartsSkipsMidLineHits) {
    std::string text = " POSITION a\nx POSITION b\n POSITION c\n";
    std::vector<size_t> hits = find_line_starts(text, " POSITION");
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(line_at(text, hits[0]), " POSITION a");
    EXPECT_EQ(line_at(text, hits[1]), " POSITION c");
}

TEST(Scan, PrecedingSlices) {
    std::string text = "it 1\nit 2\nEND\nit 3\nEND\ntrailing";
    std::vector<std::string_view> slices = preceding_slices(text, "END");
    ASSERT_EQ(slices.size(), 2u);
    EXPECT_EQ(slices[0], "it 1\nit 2\n");
    EXPECT_EQ(slices[1], "\nit 3\n");
}

TEST(Scan, FollowingSlices) {
    std::string text = "head\nHDR 1\nrow\nHDR 2\nrow\nrow\n";
    std::vector<std::string_view> slices = following_slices(text, "HDR");
    ASSERT_EQ(slices.size(), 2u);
    EXPECT_EQ(slices[0], "HDR 1\nrow\n");
    EXPECT_EQ(slices[1], "HDR 2\nrow\nrow\n");
}

TEST(Scan, LineNavigation) {
    std::string text = "first\r\nsecond\n\nlast";
    EXPECT_EQ(line_at(text, 0), "first");
    EXPECT_EQ(line_at(text, 9), "second");
    EXPECT_EQ(line_at(text, 14), "second");  // the newline belongs to its line

    std::string_view rest = text;
    std::string_view line;
    std::vector<std::string> lines;
    while (next_line(rest, line)) lines.emplace_back(line);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "first");
    EXPECT_EQ(lines[2], "");
    EXPECT_EQ(lines[3], "last");
}

TEST(Scan, SplitWhitespace) {
    std::vector<std::string_view> tokens = split_ws("  1.0\t-2  x \r");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0], "1.0");
    EXPECT_EQ(tokens[1], "-2");
    EXPECT_EQ(tokens[2], "x");
    EXPECT_TRUE(split_ws("   ").empty());
    EXPECT_TRUE(is_blank(" \t "));
    EXPECT_FALSE(is_blank(" a "));
}

TEST(Scan, CheckedConversions) {
    EXPECT_EQ(to_int("42", "n"), 42);
    EXPECT_EQ(to_int("+7", "n"), 7);
    EXPECT_EQ(to_int("-3", "n"), -3);
    EXPECT_DOUBLE_EQ(to_double("-19.26550806", "x"), -19.26550806);
    EXPECT_DOUBLE_EQ(to_double("1.5E-03", "x"), 1.5e-3);

    EXPECT_THROW(to_int("4.0", "n"), ParseError);
    EXPECT_THROW(to_int("", "n"), ParseError);
    EXPECT_THROW(to_double("1.0;", "x"), ParseError);
    EXPECT_THROW(to_double("abc", "x"), ParseError);
    EXPECT_THROW(to_doubles("1.0 2.0 z", "x"), ParseError);
}

TEST(Scan, ConversionErrorNamesTheField) {
    try {
        to_int("x", "NIONS");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_NE(std::string(e.what()).find("NIONS"), std::string::npos);
    }
}

TEST(Scan, ValueAfter) {
    std::string text = "   ISPIN  =      1    spin polarized calculation?\n   NIONS =      4\n";
    EXPECT_EQ(value_after(text, "ISPIN  =", "ISPIN"), "1");
    EXPECT_EQ(value_after(text, "NIONS =", "NIONS"), "4");
    EXPECT_THROW(value_after(text, "NBANDS=", "NBANDS"), FormatError);
    // the value must be on the marker's line
    EXPECT_THROW(value_after("KEY =\n 5\n", "KEY =", "KEY"), FormatError);
}
