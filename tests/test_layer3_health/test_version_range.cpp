// tests/test_layer3_health/test_version_range.cpp
#include "lp_health.hpp"
#include "test_patterns.h"
#include "gtest/gtest.h"

using namespace livepreview::health;

class VersionRangeTest : public livepreview::tests::PureApiTest
{
};

// ============================================================================
// SemVer
// ============================================================================

TEST_F(VersionRangeTest, SemVer_ParsesFullAndPartialVersions)
{
    auto v = SemVer::parse("0.10.1");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->major, 0);
    EXPECT_EQ(v->minor, 10);
    EXPECT_EQ(v->patch, 1);
    EXPECT_TRUE(v->prerelease.empty());

    auto partial = SemVer::parse("0.10");
    ASSERT_TRUE(partial.has_value());
    EXPECT_EQ(*partial, (SemVer{0, 10, 0, ""}));

    EXPECT_EQ(SemVer::parse("v1")->major, 1);
}

TEST_F(VersionRangeTest, SemVer_PrereleaseAndBuildMetadata)
{
    auto v = SemVer::parse("0.11.0-dev+1234-gabcdef");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->prerelease, "dev");
    EXPECT_EQ(v->to_string(), "0.11.0-dev");
}

TEST_F(VersionRangeTest, SemVer_RejectsMalformedText)
{
    for (const char *bad : {"", "abc", "1.2.3.4", "1..2", "1.2.x", "1.2.3-", "-1.2.3", "1.2.3 4"})
    {
        EXPECT_FALSE(SemVer::parse(bad).has_value()) << "'" << bad << "'";
    }
}

TEST_F(VersionRangeTest, SemVer_Ordering)
{
    auto v = [](const char *text) { return *SemVer::parse(text); };
    EXPECT_LT(v("0.9.5"), v("0.10.0"));
    EXPECT_LT(v("0.10.0"), v("0.10.1"));
    EXPECT_LT(v("0.11.0-dev"), v("0.11.0"));
    EXPECT_LT(v("1.0.0-alpha"), v("1.0.0-alpha.1"));
    EXPECT_LT(v("1.0.0-alpha.1"), v("1.0.0-alpha.beta"));
    EXPECT_LT(v("1.0.0-beta.2"), v("1.0.0-beta.11"));
    EXPECT_LT(v("1.0.0-rc.1"), v("1.0.0"));
    EXPECT_EQ(v("1.2.3"), v("v1.2.3"));
}

// ============================================================================
// VersionRange
// ============================================================================

TEST_F(VersionRangeTest, Range_GreaterOrEqual)
{
    EXPECT_TRUE(is_compatible("0.10.1", ">=0.10.0"));
    EXPECT_TRUE(is_compatible("0.10.0", ">=0.10.0"));
    EXPECT_TRUE(is_compatible("0.11.0", ">= 0.10.0"));
    EXPECT_FALSE(is_compatible("0.9.5", ">=0.10.0"));
    EXPECT_FALSE(is_compatible("0.10.0-dev", ">=0.10.0"));
}

TEST_F(VersionRangeTest, Range_Caret)
{
    EXPECT_TRUE(is_compatible("0.10.4", "^0.10.0"));
    EXPECT_FALSE(is_compatible("0.11.0", "^0.10.0"));
    EXPECT_FALSE(is_compatible("0.11.0-dev", "^0.10.0"));
    EXPECT_TRUE(is_compatible("1.9.0", "^1.2.0"));
    EXPECT_FALSE(is_compatible("2.0.0", "^1.2.0"));
    EXPECT_TRUE(is_compatible("0.0.3", "^0.0.3"));
    EXPECT_FALSE(is_compatible("0.0.4", "^0.0.3"));
}

TEST_F(VersionRangeTest, Range_Tilde)
{
    EXPECT_TRUE(is_compatible("1.2.9", "~1.2.3"));
    EXPECT_FALSE(is_compatible("1.2.2", "~1.2.3"));
    EXPECT_FALSE(is_compatible("1.3.0", "~1.2.3"));
}

TEST_F(VersionRangeTest, Range_ComparatorSetsAndAlternatives)
{
    EXPECT_TRUE(is_compatible("0.10.2", ">=0.10.0 <0.11.0"));
    EXPECT_FALSE(is_compatible("0.11.0", ">=0.10.0 <0.11.0"));
    EXPECT_TRUE(is_compatible("0.9.5", "0.9.5 || >=0.10.0"));
    EXPECT_TRUE(is_compatible("0.12.0", "0.9.5 || >=0.10.0"));
    EXPECT_FALSE(is_compatible("0.9.4", "0.9.5 || >=0.10.0"));
}

TEST_F(VersionRangeTest, Range_HyphenIsInclusive)
{
    EXPECT_TRUE(is_compatible("0.9.0", "0.9.0 - 0.10.0"));
    EXPECT_TRUE(is_compatible("0.10.0", "0.9.0 - 0.10.0"));
    EXPECT_FALSE(is_compatible("0.10.1", "0.9.0 - 0.10.0"));
}

TEST_F(VersionRangeTest, Range_WildcardMatchesEverything)
{
    EXPECT_TRUE(is_compatible("0.1.0", "*"));
    EXPECT_TRUE(is_compatible("42.0.0", ""));
}

TEST_F(VersionRangeTest, Range_KeepsSourceText)
{
    auto range = VersionRange::parse("  >=0.10.0  ");
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->text(), ">=0.10.0");
}

TEST_F(VersionRangeTest, UnparseableInputIsNotCompatible)
{
    EXPECT_FALSE(VersionRange::parse(">=banana").has_value());
    EXPECT_FALSE(VersionRange::parse(">=").has_value());
    EXPECT_FALSE(is_compatible("unknown", ">=0.10.0"));
    EXPECT_FALSE(is_compatible("0.10.0", ">=banana"));
}
