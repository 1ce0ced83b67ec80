/**
 * @file test_format_tools.cpp
 * @brief Layer 1 tests for the string helpers in format_tools.
 */
#include "lp_base.hpp"
#include "test_patterns.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace livepreview::format_tools;
using namespace ::testing;

class FormatToolsTest : public livepreview::tests::PureApiTest
{
};

// ============================================================================
// extract_value_from_string
// ============================================================================

TEST_F(FormatToolsTest, ExtractValue_SemicolonPairs)
{
    auto v = extract_value_from_string("port", "host=localhost; port = 5500 ;mode=x");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, "5500");
}

TEST_F(FormatToolsTest, ExtractValue_ProcStatusLayout)
{
    const std::string status = "Name:\tnvim\nUmask:\t0022\nState:\tS (sleeping)\nPid:\t4242\n";
    EXPECT_EQ(extract_value_from_string("Name", status, '\n', ':'), "nvim");
    EXPECT_EQ(extract_value_from_string("State", status, '\n', ':'), "S (sleeping)");
    EXPECT_EQ(extract_value_from_string("PPid", status, '\n', ':'), std::nullopt);
}

TEST_F(FormatToolsTest, ExtractValue_KeyMustMatchExactly)
{
    EXPECT_FALSE(extract_value_from_string("por", "port=1").has_value());
    EXPECT_FALSE(extract_value_from_string("port", "port").has_value())
        << "segments without an assignment symbol are not pairs";
    EXPECT_FALSE(extract_value_from_string("port", "").has_value());
}

TEST_F(FormatToolsTest, ExtractValue_FirstMatchWins)
{
    EXPECT_EQ(extract_value_from_string("k", "k=1;k=2"), "1");
}

// ============================================================================
// trim_whitespace / split_whitespace
// ============================================================================

TEST_F(FormatToolsTest, TrimWhitespace)
{
    EXPECT_EQ(trim_whitespace("  a b \t\n"), "a b");
    EXPECT_EQ(trim_whitespace(""), "");
    EXPECT_EQ(trim_whitespace(" \t "), "");
    EXPECT_EQ(trim_whitespace("x"), "x");
}

TEST_F(FormatToolsTest, SplitWhitespace_DropsEmptyFields)
{
    auto fields = split_whitespace("  0: 00000000:1388  00000000:0000 0A \n");
    ASSERT_EQ(fields.size(), 4u);
    EXPECT_EQ(fields[0], "0:");
    EXPECT_EQ(fields[1], "00000000:1388");
    EXPECT_EQ(fields[3], "0A");

    EXPECT_TRUE(split_whitespace("").empty());
    EXPECT_TRUE(split_whitespace(" \t\n ").empty());
}

// ============================================================================
// formatted_time / make_buffer
// ============================================================================

TEST_F(FormatToolsTest, FormattedTime_HasMicrosecondField)
{
    using namespace std::chrono;
    auto tp = system_clock::time_point(seconds(1'700'000'000) + microseconds(42));
    std::string text = formatted_time(tp);

    // "YYYY-MM-DD HH:MM:SS.uuuuuu"
    ASSERT_EQ(text.size(), 26u) << text;
    EXPECT_EQ(text[4], '-');
    EXPECT_EQ(text[10], ' ');
    EXPECT_EQ(text[19], '.');
    EXPECT_THAT(text, EndsWith(".000042"));
}

TEST_F(FormatToolsTest, MakeBuffer_FormatsArguments)
{
    auto mb = make_buffer("port {} held by {}", 5500, "nvim");
    EXPECT_EQ(fmt::to_string(mb), "port 5500 held by nvim");
}
