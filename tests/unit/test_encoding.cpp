/**
 * LFI Chef - Encoding Transformer Tests
 */

#include <gtest/gtest.h>
#include <set>
#include "passes/encoding/encoding_transformer.hpp"
#include "common/errors.hpp"

using namespace lfichef;
using namespace lfichef::encoding;

namespace {

EncodingTransformer makeTransformer(const std::string& letters,
                                    TargetOS os = TargetOS::Linux,
                                    EncodeScope scope = EncodeScope::Special) {
    EncodingConfig config;
    config.set = parseEncodingSet(letters);
    config.os = os;
    config.scope = scope;
    return EncodingTransformer(config);
}

EncodingTransformer makeAlternate(const std::string& letters,
                                  TargetOS os = TargetOS::Linux) {
    EncodingConfig config;
    config.set = parseEncodingSet(letters);
    config.os = os;
    config.alternate_forms = true;
    return EncodingTransformer(config);
}

} // namespace

// ============================================================================
// Option parsing
// ============================================================================

TEST(EncodingSetTest, ParsesInArgumentOrder) {
    auto set = parseEncodingSet("odbu");
    ASSERT_EQ(set.size(), 4);
    EXPECT_EQ(set.techniques[0], Encoding::OverlongUtf8);
    EXPECT_EQ(set.techniques[1], Encoding::DoubleUrl);
    EXPECT_EQ(set.techniques[2], Encoding::Unicode16);
    EXPECT_EQ(set.techniques[3], Encoding::Url);
    EXPECT_EQ(set.toString(), "odbu");
}

TEST(EncodingSetTest, IgnoresRepeats) {
    auto set = parseEncodingSet("uduu");
    EXPECT_EQ(set.toString(), "ud");
}

TEST(EncodingSetTest, EmptyStringIsEmptySet) {
    EXPECT_TRUE(parseEncodingSet("").empty());
}

TEST(EncodingSetTest, RejectsUnknownLetter) {
    try {
        parseEncodingSet("uxd");
        FAIL() << "accepted unknown encoding";
    } catch (const LfiChefError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnknownEncodingToken);
        EXPECT_NE(std::string(e.what()).find("\"x\""), std::string::npos);
    }
}

TEST(EncodingSetTest, ScopeParsing) {
    EXPECT_TRUE(parseEncodeScope("special") == EncodeScope::Special);
    EXPECT_TRUE(parseEncodeScope("all") == EncodeScope::All);
    EXPECT_FALSE(parseEncodeScope("some").has_value());
}

// ============================================================================
// Character rules
// ============================================================================

TEST(EncodingRulesTest, UrlEncoding) {
    EXPECT_EQ(EncodingTransformer::encodeChar(Encoding::Url, '/'), "%2f");
    EXPECT_EQ(EncodingTransformer::encodeChar(Encoding::Url, '\\'), "%5c");
    EXPECT_EQ(EncodingTransformer::encodeChar(Encoding::Url, '.'), "%2e");
    EXPECT_EQ(EncodingTransformer::encodeChar(Encoding::Url, ':'), "%3a");
}

TEST(EncodingRulesTest, DoubleUrlEncoding) {
    EXPECT_EQ(EncodingTransformer::encodeChar(Encoding::DoubleUrl, '/'), "%252f");
    EXPECT_EQ(EncodingTransformer::encodeChar(Encoding::DoubleUrl, '.'), "%252e");
}

TEST(EncodingRulesTest, Unicode16Encoding) {
    EXPECT_EQ(EncodingTransformer::encodeChar(Encoding::Unicode16, '/'), "%u002f");
    EXPECT_EQ(EncodingTransformer::encodeChar(Encoding::Unicode16, '\\'), "%u005c");
}

TEST(EncodingRulesTest, OverlongUtf8Encoding) {
    EXPECT_EQ(EncodingTransformer::encodeChar(Encoding::OverlongUtf8, '/'), "%c0%af");
    EXPECT_EQ(EncodingTransformer::encodeChar(Encoding::OverlongUtf8, '.'), "%c0%ae");
    EXPECT_EQ(EncodingTransformer::encodeChar(Encoding::OverlongUtf8, '\\'), "%c1%9c");
    EXPECT_EQ(EncodingTransformer::encodeChar(Encoding::OverlongUtf8, 0xE9), "%e0%83%a9");
}

// ============================================================================
// Transform
// ============================================================================

TEST(EncodingTransformerTest, EmptySetYieldsInput) {
    auto transformer = makeTransformer("");
    EXPECT_FALSE(transformer.isActive());

    auto variants = transformer.transform("/etc/passwd");
    ASSERT_EQ(variants.size(), 1);
    EXPECT_EQ(variants[0], "/etc/passwd");
    EXPECT_TRUE(transformer.mutate("/etc/passwd").empty());
}

TEST(EncodingTransformerTest, SingleTechniqueLinux) {
    auto transformer = makeTransformer("u");

    auto variants = transformer.transform("../etc/passwd");
    ASSERT_EQ(variants.size(), 1);
    EXPECT_EQ(variants[0], "%2e%2e%2fetc%2fpasswd");
}

TEST(EncodingTransformerTest, ColonOnlyEncodedForWindows) {
    auto linux_t = makeTransformer("u", TargetOS::Linux);
    auto win_t = makeTransformer("u", TargetOS::Windows);

    EXPECT_EQ(linux_t.transform("a:b")[0], "a:b");
    EXPECT_EQ(win_t.transform("C:\\boot.ini")[0], "C%3a%5cboot%2eini");
}

TEST(EncodingTransformerTest, PowerSetOrdering) {
    auto transformer = makeTransformer("ud");

    auto variants = transformer.transform("/x");
    std::vector<std::string> expected = {
        "%2fx",        // u
        "%252fx",      // d
        "%25252fx"     // u then d
    };
    EXPECT_EQ(variants, expected);
}

TEST(EncodingTransformerTest, ChainsFollowArgumentOrder) {
    auto ub = makeTransformer("ub");
    auto bu = makeTransformer("bu");

    // u then b: %2f, then its '%' becomes %u0025
    EXPECT_EQ(ub.transform("/x").back(), "%u00252fx");
    // b then u: %u002f, then its '%' becomes %25
    EXPECT_EQ(bu.transform("/x").back(), "%25u002fx");
    EXPECT_EQ(bu.getChains().back()[0], Encoding::Unicode16);
}

TEST(EncodingTransformerTest, ChainOrderBySizeThenPosition) {
    auto transformer = makeTransformer("udb");

    const auto& chains = transformer.getChains();
    ASSERT_EQ(chains.size(), 7);
    EXPECT_EQ(chains[0], std::vector<Encoding>{Encoding::Url});
    EXPECT_EQ(chains[1], std::vector<Encoding>{Encoding::DoubleUrl});
    EXPECT_EQ(chains[2], std::vector<Encoding>{Encoding::Unicode16});
    EXPECT_EQ(chains[3], (std::vector<Encoding>{Encoding::Url, Encoding::DoubleUrl}));
    EXPECT_EQ(chains[4], (std::vector<Encoding>{Encoding::Url, Encoding::Unicode16}));
    EXPECT_EQ(chains[5], (std::vector<Encoding>{Encoding::DoubleUrl, Encoding::Unicode16}));
    EXPECT_EQ(chains[6], (std::vector<Encoding>{Encoding::Url, Encoding::DoubleUrl,
                                               Encoding::Unicode16}));
}

TEST(EncodingTransformerTest, DistinctVariantCountIsPowerSetMinusEmpty) {
    const std::vector<std::string> sets = {"u", "d", "b", "o", "ud", "bo", "udb", "dbo", "udbo"};

    for (const auto& letters : sets) {
        for (auto os : {TargetOS::Linux, TargetOS::Windows}) {
            auto transformer = makeTransformer(letters, os);
            auto variants = transformer.transform("/etc/pa.wd");

            size_t k = letters.size();
            size_t expected = (size_t{1} << k) - 1;

            EXPECT_EQ(variants.size(), expected) << letters;
            std::set<std::string> unique(variants.begin(), variants.end());
            EXPECT_EQ(unique.size(), expected) << letters;
        }
    }
}

TEST(EncodingTransformerTest, PathWithoutSpecialsIsUnchanged) {
    auto transformer = makeTransformer("udbo");
    for (const auto& v : transformer.transform("passwd")) {
        EXPECT_EQ(v, "passwd");
    }
}

TEST(EncodingTransformerTest, EncodeAllScope) {
    auto transformer = makeTransformer("u", TargetOS::Linux, EncodeScope::All);
    EXPECT_EQ(transformer.transform("/ab")[0], "%2f%61%62");
}

TEST(EncodingTransformerTest, OverlongWindowsPath) {
    auto transformer = makeTransformer("o", TargetOS::Windows);
    EXPECT_EQ(transformer.transform("..\\win.ini")[0],
              "%c0%ae%c0%ae%c1%9cwin%c0%aeini");
}

TEST(EncodingTransformerTest, MutateCountsVariants) {
    auto transformer = makeTransformer("udbo");
    auto variants = transformer.mutate("/etc/passwd");

    EXPECT_EQ(variants.size(), 15);
    EXPECT_EQ(transformer.getStatistics()["variants"], 15);
}

// ============================================================================
// Alternate forms
// ============================================================================

TEST(EncodingFormsTest, FormCounts) {
    EXPECT_EQ(encodingFormCount(Encoding::Url), 1);
    EXPECT_EQ(encodingFormCount(Encoding::DoubleUrl), 1);
    EXPECT_EQ(encodingFormCount(Encoding::Unicode16), 2);
    EXPECT_EQ(encodingFormCount(Encoding::OverlongUtf8), 3);
    EXPECT_STREQ(encodingFormToString(Encoding::OverlongUtf8, 2), "invalid-continuation");
}

TEST(EncodingFormsTest, Unicode16Lookalike) {
    EXPECT_EQ(EncodingTransformer::encodeChar(Encoding::Unicode16, '/', 1), "%u2215");
    EXPECT_EQ(EncodingTransformer::encodeChar(Encoding::Unicode16, '\\', 1), "%u2216");
    EXPECT_EQ(EncodingTransformer::encodeChar(Encoding::Unicode16, '.', 1), "%u002e");
}

TEST(EncodingFormsTest, OverlongThreeByte) {
    EXPECT_EQ(EncodingTransformer::encodeChar(Encoding::OverlongUtf8, '/', 1), "%e0%80%af");
    EXPECT_EQ(EncodingTransformer::encodeChar(Encoding::OverlongUtf8, '.', 1), "%e0%80%ae");
    EXPECT_EQ(EncodingTransformer::encodeChar(Encoding::OverlongUtf8, '\\', 1), "%e0%81%9c");
}

TEST(EncodingFormsTest, OverlongInvalidContinuation) {
    EXPECT_EQ(EncodingTransformer::encodeChar(Encoding::OverlongUtf8, '/', 2), "%c0%2f");
    EXPECT_EQ(EncodingTransformer::encodeChar(Encoding::OverlongUtf8, '.', 2), "%c0%2e");
    EXPECT_EQ(EncodingTransformer::encodeChar(Encoding::OverlongUtf8, '\\', 2), "%c0%5c");
    EXPECT_EQ(EncodingTransformer::encodeChar(Encoding::OverlongUtf8, 0xe9, 2), "%e0%80%e9");
}

TEST(EncodingFormsTest, OffByDefault) {
    auto transformer = makeTransformer("bo");
    EXPECT_FALSE(transformer.getConfig().alternate_forms);
    EXPECT_EQ(transformer.variantCount(), 3);
    EXPECT_EQ(transformer.transform("/etc/passwd").size(), 3);
}

TEST(EncodingFormsTest, SingleTechniqueFansOutOverForms) {
    auto b = makeAlternate("b").transform("/x");
    ASSERT_EQ(b.size(), 2);
    EXPECT_EQ(b[0], "%u002fx");
    EXPECT_EQ(b[1], "%u2215x");

    auto o = makeAlternate("o").transform("/x");
    ASSERT_EQ(o.size(), 3);
    EXPECT_EQ(o[0], "%c0%afx");
    EXPECT_EQ(o[1], "%e0%80%afx");
    EXPECT_EQ(o[2], "%c0%2fx");
}

TEST(EncodingFormsTest, ChainedFormsVaryLastTechniqueFastest) {
    auto variants = makeAlternate("bo").transform("/x");
    ASSERT_EQ(variants.size(), 11);
    EXPECT_EQ(variants[5], "%c0%a5u002fx");
    EXPECT_EQ(variants[6], "%e0%80%a5u002fx");
    EXPECT_EQ(variants[7], "%c0%25u002fx");
    EXPECT_EQ(variants[8], "%c0%a5u2215x");
    EXPECT_EQ(variants[10], "%c0%25u2215x");
}

TEST(EncodingFormsTest, VariantCountIsProductOfForms) {
    // sum over subsets of the product of form counts = prod(1 + forms) - 1
    struct Case { const char* letters; size_t count; };
    for (const auto& c : {Case{"u", 1}, Case{"b", 2}, Case{"o", 3},
                          Case{"ud", 3}, Case{"bo", 11}, Case{"dbo", 23}, Case{"udbo", 47}}) {
        auto transformer = makeAlternate(c.letters);
        EXPECT_EQ(transformer.variantCount(), c.count) << c.letters;
        EXPECT_EQ(transformer.transform("/etc/pa.wd").size(), c.count) << c.letters;
    }
}

TEST(EncodingFormsTest, BoFormsAreDistinct) {
    for (auto os : {TargetOS::Linux, TargetOS::Windows}) {
        auto variants = makeAlternate("bo", os).transform("..\\win/sy.ini");
        std::set<std::string> unique(variants.begin(), variants.end());
        EXPECT_EQ(unique.size(), 11);
    }
}

TEST(EncodingFormsTest, InvalidContinuationWindowsPath) {
    auto variants = makeAlternate("o", TargetOS::Windows).transform("..\\a");
    ASSERT_EQ(variants.size(), 3);
    EXPECT_EQ(variants[1], "%e0%80%ae%e0%80%ae%e0%81%9ca");
    EXPECT_EQ(variants[2], "%c0%2e%c0%2e%c0%5ca");
}
