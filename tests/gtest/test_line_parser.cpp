// =============================================================================
// Line Parser Tests
// =============================================================================

#include <gtest/gtest.h>
#include "volvelle/line_parser.hpp"
#include <string>
#include <vector>

using namespace volvelle;

class LineParserTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}

    LineParser parser_;
};

TEST_F(LineParserTest, FullLine) {
    auto entries = parser_.parse("<f1r.1,@P0> daiin.qokeedy.ol");
    ASSERT_EQ(entries.size(), 1u);

    const auto& e = entries[0];
    EXPECT_EQ(e.line_number, 1u);
    EXPECT_EQ(e.line_type, LineType::FULL_LINE);
    ASSERT_TRUE(e.location.has_value());
    EXPECT_EQ(*e.location, "f1r.1,@P0");
    EXPECT_FALSE(e.has_error());
    EXPECT_EQ(e.tokens, (std::vector<std::string>{"daiin", "qokeedy", "ol"}));
}

TEST_F(LineParserTest, ContentOnlyLine) {
    auto e = parser_.parse_line("daiin.chedy", 4);
    EXPECT_EQ(e.line_type, LineType::CONTENT_ONLY);
    EXPECT_EQ(e.line_number, 4u);
    EXPECT_FALSE(e.location.has_value());
    EXPECT_EQ(e.tokens.size(), 2u);
}

TEST_F(LineParserTest, BlankAndCommentLinesKeepNumbering) {
    auto entries = parser_.parse("# header\n\n   \ndaiin");
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].line_type, LineType::COMMENT);
    EXPECT_EQ(entries[1].line_type, LineType::BLANK);
    EXPECT_EQ(entries[2].line_type, LineType::BLANK);
    EXPECT_EQ(entries[3].line_type, LineType::CONTENT_ONLY);
    EXPECT_EQ(entries[3].line_number, 4u);
    EXPECT_TRUE(entries[0].tokens.empty());
}

// Double separators and mixed whitespace never produce empty tokens
TEST_F(LineParserTest, DropsEmptyTokens) {
    auto e = parser_.parse_line("daiin..chedy. .\tol..", 1);
    EXPECT_FALSE(e.has_error());
    EXPECT_EQ(e.tokens, (std::vector<std::string>{"daiin", "chedy", "ol"}));
}

// Separators inside markup do not split the token
TEST_F(LineParserTest, MarkupIsOpaque) {
    auto e = parser_.parse_line("daiin<!a.b c>.ok[a.o]r.ch{e.}dy", 1);
    ASSERT_FALSE(e.has_error());
    EXPECT_EQ(e.tokens, (std::vector<std::string>{"daiin<!a.b c>", "ok[a.o]r", "ch{e.}dy"}));
}

TEST_F(LineParserTest, UnterminatedConstruct) {
    auto e = parser_.parse_line("daiin.<!abc", 7);
    ASSERT_TRUE(e.has_error());
    EXPECT_NE(e.error->find("unterminated '<'"), std::string::npos);
    EXPECT_NE(e.error->find("column 7"), std::string::npos);
    EXPECT_TRUE(e.tokens.empty());
}

TEST_F(LineParserTest, UnterminatedHeader) {
    auto e = parser_.parse_line("<f1r.1 daiin", 1);
    ASSERT_TRUE(e.has_error());
    EXPECT_EQ(e.line_type, LineType::FULL_LINE);
    EXPECT_EQ(*e.error, "unterminated locus header");
}

// Page headers like <f1r> fail the locus grammar
TEST_F(LineParserTest, MalformedHeader) {
    auto e = parser_.parse_line("<f1r>", 1);
    ASSERT_TRUE(e.has_error());
    EXPECT_EQ(*e.error, "malformed locus header <f1r>");
    EXPECT_FALSE(e.location.has_value());
}

TEST_F(LineParserTest, HeaderNeedsWhitespace) {
    auto e = parser_.parse_line("<f1r.1,@P0>daiin", 1);
    ASSERT_TRUE(e.has_error());
    EXPECT_NE(e.error->find("must be followed by whitespace"), std::string::npos);
}

TEST_F(LineParserTest, ControlCharacterIsAnError) {
    auto e = parser_.parse_line(std::string("dai\x01in"), 1);
    EXPECT_TRUE(e.has_error());
}

// A leading tag that is not header-like is ordinary content
TEST_F(LineParserTest, LeadingMarkupIsContent) {
    auto e = parser_.parse_line("<$>daiin.ol", 1);
    EXPECT_EQ(e.line_type, LineType::CONTENT_ONLY);
    EXPECT_FALSE(e.has_error());
    EXPECT_EQ(e.tokens.size(), 2u);
}

TEST_F(LineParserTest, CanonicalLocusGrammar) {
    EXPECT_TRUE(LineParser::is_canonical_locus("f1r.1,@P0"));
    EXPECT_TRUE(LineParser::is_canonical_locus("f102v1.14a"));
    EXPECT_TRUE(LineParser::is_canonical_locus("f1000r.3,+P0"));
    EXPECT_FALSE(LineParser::is_canonical_locus("x1.1"));
    EXPECT_FALSE(LineParser::is_canonical_locus("f1r"));
    EXPECT_FALSE(LineParser::is_canonical_locus("F1r.1"));

    EXPECT_TRUE(LineParser::is_locus("x1.1"));
    EXPECT_FALSE(LineParser::is_locus("f1r"));
}

TEST_F(LineParserTest, PhysicalLines) {
    auto lines = split_physical_lines("a\r\nb\n\nc");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "a");
    EXPECT_EQ(lines[2], "");
    EXPECT_EQ(lines[3], "c");

    EXPECT_EQ(split_physical_lines("a\n").size(), 1u);
    EXPECT_TRUE(split_physical_lines("").empty());
}

// Parsing never throws, whatever the input
TEST_F(LineParserTest, GarbageInputIsTotal) {
    std::string garbage = "<<<>>>\n[[[\n\x02\x03\n<a.b>c\n}{";
    std::vector<LineEntry> entries;
    EXPECT_NO_THROW(entries = parser_.parse(garbage));
    EXPECT_EQ(entries.size(), 5u);
}
