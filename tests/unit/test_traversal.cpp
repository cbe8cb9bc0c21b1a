/**
 * LFI Chef - Traversal Expander Tests
 */

#include <gtest/gtest.h>
#include <limits>
#include <set>
#include "passes/traversal/traversal_expander.hpp"
#include "common/errors.hpp"

using namespace lfichef;
using namespace lfichef::traversal;

// ============================================================================
// Range parsing
// ============================================================================

TEST(TraversalRangeTest, SingleDepth) {
    auto range = parseTraversalRange("3");
    EXPECT_EQ(range.low, 3);
    EXPECT_EQ(range.high, 3);
    EXPECT_EQ(range.depthCount(), 1);
}

TEST(TraversalRangeTest, InclusiveRange) {
    auto range = parseTraversalRange("2:4");
    EXPECT_EQ(range.low, 2);
    EXPECT_EQ(range.high, 4);
    EXPECT_EQ(range.depthCount(), 3);
}

TEST(TraversalRangeTest, EqualBounds) {
    auto range = parseTraversalRange("5:5");
    EXPECT_EQ(range.depthCount(), 1);
}

TEST(TraversalRangeTest, RejectsReversedRange) {
    try {
        parseTraversalRange("4:2");
        FAIL() << "accepted reversed range";
    } catch (const LfiChefError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidRangeOrder);
        EXPECT_NE(std::string(e.what()).find("4:2"), std::string::npos);
    }
}

TEST(TraversalRangeTest, RejectsNonNumeric) {
    for (const std::string bad : {"", "abc", "1:x", ":3", "-1", "2:", "1.5"}) {
        try {
            parseTraversalRange(bad);
            FAIL() << "accepted \"" << bad << "\"";
        } catch (const LfiChefError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::InvalidTraversalDepth) << bad;
        }
    }
}

TEST(TraversalRangeTest, RejectsOverflow) {
    EXPECT_THROW(parseTraversalRange("99999999999999999999"), LfiChefError);
}

TEST(TraversalRangeTest, CapsDepth) {
    auto range = parseTraversalRange("0:" + std::to_string(kMaxTraversalDepth));
    EXPECT_EQ(range.depthCount(), static_cast<size_t>(kMaxTraversalDepth) + 1);
    EXPECT_EQ(parseTraversalRange("0002").high, 2);

    for (const std::string bad : {"257", "0:257", "0:2147483647", "2147483647", "1000"}) {
        try {
            parseTraversalRange(bad);
            FAIL() << "accepted \"" << bad << "\"";
        } catch (const LfiChefError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::InvalidTraversalDepth) << bad;
        }
    }
}

// ============================================================================
// Token parsing
// ============================================================================

TEST(TraversalTokenTest, ParsesCommaSeparatedPairs) {
    auto tokens = parseTraversalTokens("..:/,....://,..;:/");
    ASSERT_EQ(tokens.size(), 3);
    EXPECT_EQ(tokens[0], TraversalToken("..", "/"));
    EXPECT_EQ(tokens[1], TraversalToken("....", "//"));
    EXPECT_EQ(tokens[2], TraversalToken("..;", "/"));
}

TEST(TraversalTokenTest, SplitsOnFirstColon) {
    auto tokens = parseTraversalTokens("..:%3a/");
    ASSERT_EQ(tokens.size(), 1);
    EXPECT_EQ(tokens[0].traversal, "..");
    EXPECT_EQ(tokens[0].separator, "%3a/");
}

TEST(TraversalTokenTest, SkipsBlankEntriesAndDuplicates) {
    auto tokens = parseTraversalTokens(" ..:/ ,, ..:/,");
    ASSERT_EQ(tokens.size(), 1);
    EXPECT_EQ(tokens[0].unit(), "../");
}

TEST(TraversalTokenTest, RejectsMissingDelimiter) {
    try {
        parseTraversalTokens("..:/,../");
        FAIL() << "accepted entry without colon";
    } catch (const LfiChefError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidTraversalFormat);
        EXPECT_NE(std::string(e.what()).find("../"), std::string::npos);
    }
}

TEST(TraversalTokenTest, RejectsEmptySides) {
    EXPECT_THROW(parseTraversalTokens(":/"), LfiChefError);
    EXPECT_THROW(parseTraversalTokens("..:"), LfiChefError);
    EXPECT_THROW(parseTraversalTokens(" , "), LfiChefError);
}

TEST(TraversalTokenTest, DefaultsPerOS) {
    auto linux_tokens = defaultTraversalTokens(TargetOS::Linux);
    ASSERT_EQ(linux_tokens.size(), 2);
    EXPECT_EQ(linux_tokens[0].unit(), "../");
    EXPECT_EQ(linux_tokens[1].unit(), "....//");

    auto win_tokens = defaultTraversalTokens(TargetOS::Windows);
    ASSERT_EQ(win_tokens.size(), 2);
    EXPECT_EQ(win_tokens[0].unit(), "..\\");
    EXPECT_EQ(win_tokens[1].unit(), "....\\\\");
}

// ============================================================================
// Expansion
// ============================================================================

class TraversalExpanderTest : public ::testing::Test {
protected:
    TraversalSpec spec(const std::string& range, TargetOS os) {
        TraversalSpec s;
        s.range = parseTraversalRange(range);
        s.tokens = defaultTraversalTokens(os);
        return s;
    }
};

TEST_F(TraversalExpanderTest, InactiveWithoutSpec) {
    TraversalExpander expander(TargetOS::Linux, std::nullopt);
    EXPECT_FALSE(expander.isActive());
    EXPECT_TRUE(expander.expand("/etc/passwd").empty());
}

TEST_F(TraversalExpanderTest, SingleDepthLinux) {
    TraversalExpander expander(TargetOS::Linux, spec("3", TargetOS::Linux));

    auto variants = expander.expand("/etc/passwd");
    ASSERT_EQ(variants.size(), 2);
    EXPECT_EQ(variants[0], "../../..//etc/passwd");
    EXPECT_EQ(variants[1], "....//....//....////etc//passwd");
}

TEST_F(TraversalExpanderTest, RelativePathIsConcatenated) {
    TraversalExpander expander(TargetOS::Windows, spec("1", TargetOS::Windows));

    auto variants = expander.expand("windows\\system32\\config");
    ASSERT_EQ(variants.size(), 2);
    EXPECT_EQ(variants[0], "..\\windows\\system32\\config");
    EXPECT_EQ(variants[1], "....\\\\windows\\\\system32\\\\config");
}

TEST_F(TraversalExpanderTest, AbsolutePathKeepsLeadingSeparator) {
    TraversalSpec s;
    s.range = parseTraversalRange("1");
    s.tokens = parseTraversalTokens("..:/");

    TraversalExpander expander(TargetOS::Linux, s);
    auto variants = expander.expand("/etc/passwd");
    ASSERT_EQ(variants.size(), 1);
    EXPECT_EQ(variants[0], "..//etc/passwd");
}

TEST_F(TraversalExpanderTest, RejectsRangesPastTheCap) {
    TraversalSpec s;
    s.range = TraversalRange{0, std::numeric_limits<int>::max()};
    EXPECT_THROW(TraversalExpander expander(TargetOS::Linux, s), LfiChefError);

    s.range = TraversalRange{-1, 2};
    EXPECT_THROW(TraversalExpander expander(TargetOS::Linux, s), LfiChefError);

    s.range = TraversalRange{3, 1};
    EXPECT_THROW(TraversalExpander expander(TargetOS::Linux, s), LfiChefError);
}

TEST_F(TraversalExpanderTest, DeepestDepth) {
    TraversalSpec s;
    s.range = parseTraversalRange(std::to_string(kMaxTraversalDepth));
    s.tokens = parseTraversalTokens("..:/");

    TraversalExpander expander(TargetOS::Linux, s);
    auto variants = expander.expand("x");
    ASSERT_EQ(variants.size(), 1);
    EXPECT_EQ(variants[0].size(), 3u * kMaxTraversalDepth + 1);
}

TEST_F(TraversalExpanderTest, RangeIsDepthAscendingThenTokenOrder) {
    TraversalExpander expander(TargetOS::Linux, spec("1:2", TargetOS::Linux));

    auto variants = expander.expand("/etc/hosts");
    std::vector<std::string> expected = {
        "..//etc/hosts",
        "....////etc//hosts",
        "../..//etc/hosts",
        "....//....////etc//hosts"
    };
    EXPECT_EQ(variants, expected);
}

TEST_F(TraversalExpanderTest, WindowsRangeYieldsThreeDepthsPerPair) {
    TraversalExpander expander(TargetOS::Windows, spec("2:4", TargetOS::Windows));

    auto variants = expander.expand("\\boot.ini");
    ASSERT_EQ(variants.size(), 6);

    std::set<std::string> unique(variants.begin(), variants.end());
    EXPECT_EQ(unique.size(), 6);

    EXPECT_EQ(variants[0], "..\\..\\\\boot.ini");
    EXPECT_EQ(variants[2], "..\\..\\..\\\\boot.ini");
    EXPECT_EQ(variants[4], "..\\..\\..\\..\\\\boot.ini");
}

TEST_F(TraversalExpanderTest, DepthZeroIsPassThrough) {
    TraversalExpander expander(TargetOS::Linux, spec("0:1", TargetOS::Linux));

    auto variants = expander.expand("/etc/passwd");
    ASSERT_EQ(variants.size(), 4);
    EXPECT_EQ(variants[0], "/etc/passwd");
    EXPECT_EQ(variants[1], "/etc/passwd");
    EXPECT_EQ(variants[2], "..//etc/passwd");
}

TEST_F(TraversalExpanderTest, CustomTokens) {
    TraversalSpec s;
    s.range = parseTraversalRange("2");
    s.tokens = parseTraversalTokens("%2e%2e:%2f");

    TraversalExpander expander(TargetOS::Linux, s);
    auto variants = expander.expand("/etc/passwd");
    ASSERT_EQ(variants.size(), 1);
    EXPECT_EQ(variants[0], "%2e%2e%2f%2e%2e%2f%2fetc%2fpasswd");
}

TEST_F(TraversalExpanderTest, EmptyTokenListFallsBackToDefaults) {
    TraversalSpec s;
    s.range = parseTraversalRange("1");

    TraversalExpander expander(TargetOS::Mac, s);
    ASSERT_TRUE(expander.getSpec().has_value());
    EXPECT_EQ(expander.getSpec()->tokens.size(), 2);
}

TEST_F(TraversalExpanderTest, BuildPrefix) {
    TraversalToken token("..", "/");
    EXPECT_EQ(TraversalExpander::buildPrefix(token, 0), "");
    EXPECT_EQ(TraversalExpander::buildPrefix(token, 3), "../../../");
}

TEST_F(TraversalExpanderTest, MutateCountsVariants) {
    TraversalExpander expander(TargetOS::Linux, spec("1:3", TargetOS::Linux));

    expander.mutate("/a");
    expander.mutate("/b");

    auto stats = expander.getStatistics();
    EXPECT_EQ(stats["payloads_in"], 2);
    EXPECT_EQ(stats["variants"], 12);
}
