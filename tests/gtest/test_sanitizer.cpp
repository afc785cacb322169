// =============================================================================
// Token Sanitizer Tests
// =============================================================================

#include <gtest/gtest.h>
#include "volvelle/sanitizer.hpp"
#include <string>
#include <vector>

using namespace volvelle;

class SanitizerTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}

    std::vector<std::string> samples_ = {
        "daiin", "qokeedy<$>", "<!@folio note>daiin", "ch{e}dy", "ok[a:o]r",
        "*shedy*", "ol,", "  chol  ", "<%x", "qo;ke", "<f1r.1>", "ot<!a>e<b>dy",
        "sh[e]dy<$", "{}", "", "[[a]]"
    };
};

// Closed tag immediately after a word
TEST_F(SanitizerTest, StripsTrailingTag) {
    EXPECT_EQ(sanitize("qokeedy<$>"), "qokeedy");
}

TEST_F(SanitizerTest, StripsInlineMetadata) {
    EXPECT_EQ(sanitize("<!@folio note>daiin"), "daiin");
    EXPECT_EQ(sanitize("ot<!a>e<b>dy"), "otedy");
}

TEST_F(SanitizerTest, StripsUnterminatedOpeners) {
    EXPECT_EQ(sanitize("chol<!unfinished"), "chol");
    EXPECT_EQ(sanitize("<%x"), "");
    EXPECT_EQ(sanitize("sh[e]dy<$"), "shdy");
}

// Alternative readings are deleted as a whole by default
TEST_F(SanitizerTest, DropsAlternativeReadings) {
    EXPECT_EQ(sanitize("ok[a:o]r"), "okr");
}

TEST_F(SanitizerTest, AlternativeReadingPolicies) {
    Sanitizer first(SanitizerOptions{AlternativeReadingPolicy::FIRST_READING});
    Sanitizer second(SanitizerOptions{AlternativeReadingPolicy::SECOND_READING});

    EXPECT_EQ(first("ok[a:o]r"), "okar");
    EXPECT_EQ(second("ok[a:o]r"), "okor");

    // A span without ':' has no reading to keep
    EXPECT_EQ(first("sh[e]dy"), "shdy");
}

TEST_F(SanitizerTest, StripsLooseSymbolsAndPunctuation) {
    EXPECT_EQ(sanitize("ch{e}dy"), "chedy");
    EXPECT_EQ(sanitize("*shedy*"), "shedy");
    EXPECT_EQ(sanitize("ol,"), "ol");
    EXPECT_EQ(sanitize("qo;ke"), "qoke");
    EXPECT_EQ(sanitize("  chol  "), "chol");
}

TEST_F(SanitizerTest, MayYieldEmpty) {
    EXPECT_EQ(sanitize("{}"), "");
    EXPECT_EQ(sanitize(""), "");
    EXPECT_EQ(sanitize("<f1r.1>"), "");
}

TEST_F(SanitizerTest, Idempotent) {
    for (const auto& token : samples_) {
        std::string once = sanitize(token);
        EXPECT_EQ(sanitize(once), once) << "token: " << token;
    }
}

TEST_F(SanitizerTest, IdempotentUnderEveryPolicy) {
    for (auto policy : {AlternativeReadingPolicy::DROP_SPAN,
                        AlternativeReadingPolicy::FIRST_READING,
                        AlternativeReadingPolicy::SECOND_READING}) {
        Sanitizer s(SanitizerOptions{policy});
        for (const auto& token : samples_) {
            std::string once = s(token);
            EXPECT_EQ(s(once), once) << "token: " << token;
        }
    }
}

TEST_F(SanitizerTest, SanitizeAllDropsEmpties) {
    Sanitizer s;
    auto out = s.sanitize_all({"daiin", "{}", "qokeedy<$>", "<%x"});
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], "daiin");
    EXPECT_EQ(out[1], "qokeedy");
}
