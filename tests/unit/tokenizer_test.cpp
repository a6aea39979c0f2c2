#include <livepatch/html/tokenizer.h>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace livepatch::html;

namespace {

std::vector<Token> tokenize_all(std::string_view input) {
    Tokenizer tokenizer(input);
    std::vector<Token> tokens;
    while (true) {
        Token t = tokenizer.next_token();
        tokens.push_back(t);
        if (t.type == Token::EndOfFile) break;
    }
    return tokens;
}

} // namespace

// ---------------------------------------------------------------------------
// Tags and attributes
// ---------------------------------------------------------------------------

TEST(TokenizerTest, StartTagWithAttributes) {
    auto tokens = tokenize_all("<DIV Class=\"a b\" id='x' hidden data-n=3>");
    ASSERT_EQ(tokens.size(), 2u);
    const Token& t = tokens[0];
    EXPECT_EQ(t.type, Token::StartTag);
    EXPECT_EQ(t.name, "div");
    ASSERT_EQ(t.attributes.size(), 4u);
    EXPECT_EQ(t.attributes[0].name, "class");
    EXPECT_EQ(t.attributes[0].value, "a b");
    EXPECT_EQ(t.attributes[1].name, "id");
    EXPECT_EQ(t.attributes[1].value, "x");
    EXPECT_EQ(t.attributes[2].name, "hidden");
    EXPECT_EQ(t.attributes[2].value, "");
    EXPECT_EQ(t.attributes[3].name, "data-n");
    EXPECT_EQ(t.attributes[3].value, "3");
}

TEST(TokenizerTest, SelfClosingFlag) {
    auto tokens = tokenize_all("<br/><img src=a />");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_TRUE(tokens[0].self_closing);
    EXPECT_EQ(tokens[1].name, "img");
    EXPECT_TRUE(tokens[1].self_closing);
    EXPECT_EQ(tokens[1].attributes[0].value, "a");
}

TEST(TokenizerTest, EndTag) {
    auto tokens = tokenize_all("<p>x</P>");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[2].type, Token::EndTag);
    EXPECT_EQ(tokens[2].name, "p");
    EXPECT_EQ(tokens[2].offset, 4u);
}

// ---------------------------------------------------------------------------
// Character data
// ---------------------------------------------------------------------------

TEST(TokenizerTest, TextRunIsOneToken) {
    auto tokens = tokenize_all("hello world<b>");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].type, Token::Character);
    EXPECT_EQ(tokens[0].data, "hello world");
    EXPECT_EQ(tokens[0].offset, 0u);
}

TEST(TokenizerTest, NamedAndNumericReferences) {
    auto tokens = tokenize_all("a &amp; b &lt;&#65;&#x42;&nbsp;&copy;");
    ASSERT_EQ(tokens[0].type, Token::Character);
    EXPECT_EQ(tokens[0].data, "a & b <AB\xC2\xA0\xC2\xA9");
}

TEST(TokenizerTest, UnknownOrUnterminatedReferenceStaysLiteral) {
    auto tokens = tokenize_all("?a=1&copy=2&bogus;");
    EXPECT_EQ(tokens[0].data, "?a=1&copy=2&bogus;");
}

TEST(TokenizerTest, InvalidNumericReferenceBecomesReplacementChar) {
    auto tokens = tokenize_all("&#0;&#xD800;");
    EXPECT_EQ(tokens[0].data, "\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST(TokenizerTest, ReferencesInAttributeValues) {
    auto tokens = tokenize_all("<a href=\"?x=1&amp;y=2\">");
    EXPECT_EQ(tokens[0].attributes[0].value, "?x=1&y=2");
}

TEST(TokenizerTest, StrayLessThanIsText) {
    auto tokens = tokenize_all("1 < 2");
    std::string text;
    for (const auto& t : tokens) {
        if (t.type == Token::Character) text += t.data;
    }
    EXPECT_EQ(text, "1 < 2");
}

// ---------------------------------------------------------------------------
// Comments and DOCTYPE
// ---------------------------------------------------------------------------

TEST(TokenizerTest, Comment) {
    auto tokens = tokenize_all("<!-- note -->x");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].type, Token::Comment);
    EXPECT_EQ(tokens[0].data, " note ");
    EXPECT_EQ(tokens[1].data, "x");
}

TEST(TokenizerTest, Doctype) {
    auto tokens = tokenize_all("<!DOCTYPE html><p>");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].type, Token::DOCTYPE);
    EXPECT_EQ(tokens[0].name, "html");
    EXPECT_EQ(tokens[1].name, "p");
}

TEST(TokenizerTest, BogusCommentFromProcessingInstruction) {
    auto tokens = tokenize_all("<?xml version=1?><p>");
    EXPECT_EQ(tokens[0].type, Token::Comment);
    EXPECT_EQ(tokens[1].name, "p");
}

// ---------------------------------------------------------------------------
// RAWTEXT / RCDATA
// ---------------------------------------------------------------------------

TEST(TokenizerTest, RawTextKeepsMarkupLiteral) {
    Tokenizer tokenizer("if (a < b) { x = '<p>'; }</script>after");
    tokenizer.set_state(TokenizerState::RAWTEXT);
    tokenizer.set_last_start_tag("script");

    std::string text;
    Token t = tokenizer.next_token();
    while (t.type == Token::Character) {
        text += t.data;
        t = tokenizer.next_token();
    }
    EXPECT_EQ(text, "if (a < b) { x = '<p>'; }");
    EXPECT_EQ(t.type, Token::EndTag);
    EXPECT_EQ(t.name, "script");
    EXPECT_EQ(tokenizer.next_token().data, "after");
}

TEST(TokenizerTest, RawTextIgnoresOtherEndTags) {
    Tokenizer tokenizer("a</style></scriptx></script>");
    tokenizer.set_state(TokenizerState::RAWTEXT);
    tokenizer.set_last_start_tag("script");

    std::string text;
    Token t = tokenizer.next_token();
    while (t.type == Token::Character) {
        text += t.data;
        t = tokenizer.next_token();
    }
    EXPECT_EQ(text, "a</style></scriptx>");
    EXPECT_EQ(t.name, "script");
}

TEST(TokenizerTest, RcdataDecodesReferences) {
    Tokenizer tokenizer("a &amp; <b></title>");
    tokenizer.set_state(TokenizerState::RCDATA);
    tokenizer.set_last_start_tag("title");

    std::string text;
    Token t = tokenizer.next_token();
    while (t.type == Token::Character) {
        text += t.data;
        t = tokenizer.next_token();
    }
    EXPECT_EQ(text, "a & <b>");
    EXPECT_EQ(t.name, "title");
}

// ---------------------------------------------------------------------------
// UTF-8 validation
// ---------------------------------------------------------------------------

TEST(TokenizerTest, ValidUtf8Accepted) {
    EXPECT_FALSE(find_invalid_utf8("plain").has_value());
    EXPECT_FALSE(find_invalid_utf8("caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80").has_value());
}

TEST(TokenizerTest, InvalidUtf8Located) {
    EXPECT_EQ(find_invalid_utf8("ab\xFF"), 2u);
    EXPECT_EQ(find_invalid_utf8("a\xC3"), 1u);            // truncated
    EXPECT_EQ(find_invalid_utf8("\xC0\xAF"), 0u);          // overlong
    EXPECT_EQ(find_invalid_utf8("\xED\xA0\x80"), 0u);      // surrogate
    EXPECT_EQ(find_invalid_utf8(std::string_view("a\0b", 3)), 1u);
}
