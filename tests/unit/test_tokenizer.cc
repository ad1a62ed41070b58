// File: tests/unit/test_tokenizer.cc
// Purpose: Verify markup tokenization of tags, attributes, comments and raw text.
// Key invariants: Tokenization is restartable from a returned state; unterminated
//                 constructs fail with a positioned ParseError.
// Ownership/Lifetime: Tests own every source string and token vector.

#include <gtest/gtest.h>

#include "frontend/eex.h"
#include "frontend/tokenizer.h"
#include "cli/error.h"

#include <string>
#include <vector>

namespace
{
ErrorKind lex_error_kind(const std::string &source)
{
    try
    {
        lex_template(source);
    }
    catch (const ParseError &e)
    {
        return e.kind;
    }
    ADD_FAILURE() << "expected a ParseError for: " << source;
    return ErrorKind::InvalidTag;
}
} // namespace

TEST(Tokenizer, SplitsTagsTextAndLiteralAttributes)
{
    auto [tokens, state] = tokenize("<p class=\"lead\" hidden>hi</p>", TokenizerState{});

    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].type, MarkupType::TagOpen);
    EXPECT_EQ(tokens[0].name, "p");
    EXPECT_EQ(tokens[0].tag_kind, TagKind::Element);
    ASSERT_EQ(tokens[0].attrs.size(), 2u);
    EXPECT_EQ(tokens[0].attrs[0].name, "class");
    EXPECT_EQ(tokens[0].attrs[0].kind, AttrValueKind::Literal);
    EXPECT_EQ(tokens[0].attrs[0].value, "lead");
    EXPECT_EQ(tokens[0].attrs[1].name, "hidden");
    EXPECT_EQ(tokens[0].attrs[1].kind, AttrValueKind::Boolean);

    EXPECT_EQ(tokens[1].type, MarkupType::Text);
    EXPECT_EQ(tokens[1].content, "hi");
    EXPECT_EQ(tokens[2].type, MarkupType::TagClose);
    EXPECT_EQ(tokens[2].name, "p");
    EXPECT_EQ(state.mode, TokenizerMode::Text);
}

TEST(Tokenizer, ExpressionAttributesKeepBalancedBraces)
{
    auto [tokens, state] = tokenize("<div data={%{a: \"}\"}} {@rest}>", TokenizerState{});

    ASSERT_EQ(tokens.size(), 1u);
    ASSERT_EQ(tokens[0].attrs.size(), 2u);
    EXPECT_EQ(tokens[0].attrs[0].name, "data");
    EXPECT_EQ(tokens[0].attrs[0].kind, AttrValueKind::Expression);
    EXPECT_EQ(tokens[0].attrs[0].value, "%{a: \"}\"}");
    EXPECT_TRUE(tokens[0].attrs[1].is_spread());
    EXPECT_EQ(tokens[0].attrs[1].value, "@rest");
}

TEST(Tokenizer, BracesInsideStringLiteralsDoNotCloseExpressions)
{
    auto [tokens, state] = tokenize("<div title={'}'} x={\"a\\\"}\"}>", TokenizerState{});

    ASSERT_EQ(tokens.size(), 1u);
    ASSERT_EQ(tokens[0].attrs.size(), 2u);
    EXPECT_EQ(tokens[0].attrs[0].value, "'}'");
    EXPECT_EQ(tokens[0].attrs[1].value, "\"a\\\"}\"");
}

TEST(Tokenizer, EscapeAtChunkEndIsKept)
{
    auto [first, mid] = tokenize("<div x={\"a\\", TokenizerState{});
    EXPECT_TRUE(first.empty());
    EXPECT_TRUE(mid.string_escape);

    auto [second, end] = tokenize("\"}\"}>", mid);
    ASSERT_EQ(second.size(), 1u);
    ASSERT_EQ(second[0].attrs.size(), 1u);
    EXPECT_EQ(second[0].attrs[0].value, "\"a\\\"}\"");
    EXPECT_EQ(end.mode, TokenizerMode::Text);
}

TEST(Tokenizer, ClassifiesTagKinds)
{
    EXPECT_EQ(classify_tag("br"), TagKind::Void);
    EXPECT_EQ(classify_tag("section"), TagKind::Element);
    EXPECT_EQ(classify_tag(".card"), TagKind::LocalComponent);
    EXPECT_EQ(classify_tag("Ui.button"), TagKind::RemoteComponent);
    EXPECT_EQ(classify_tag(":footer"), TagKind::Slot);
}

TEST(Tokenizer, SelfClosingTagsAreMarked)
{
    auto [tokens, state] = tokenize("<.card title=\"x\"/><br/>", TokenizerState{});

    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_TRUE(tokens[0].self_close);
    EXPECT_EQ(tokens[0].tag_kind, TagKind::LocalComponent);
    EXPECT_TRUE(tokens[1].self_close);
    EXPECT_EQ(tokens[1].tag_kind, TagKind::Void);
}

TEST(Tokenizer, CommentsAndStrayAnglesStayText)
{
    auto [tokens, state] = tokenize("a < b<!-- <div> -->", TokenizerState{});

    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].type, MarkupType::Text);
    EXPECT_EQ(tokens[0].content, "a < b");
    EXPECT_EQ(tokens[1].type, MarkupType::Text);
    EXPECT_EQ(tokens[1].content, "<!-- <div> -->");
}

TEST(Tokenizer, ScriptBodyIsRawText)
{
    auto [tokens, state] = tokenize("<script>if (a < b) { x(\"<p>\"); }</script>", TokenizerState{});

    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[1].type, MarkupType::Text);
    EXPECT_EQ(tokens[1].content, "if (a < b) { x(\"<p>\"); }");
    EXPECT_EQ(tokens[2].type, MarkupType::TagClose);
    EXPECT_EQ(tokens[2].name, "script");
}

TEST(Tokenizer, RawTextEndsOnlyAtItsOwnCloseTag)
{
    auto [tokens, state] = tokenize("<script>a = \"</scripts>\";</script>", TokenizerState{});

    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[1].type, MarkupType::Text);
    EXPECT_EQ(tokens[1].content, "a = \"</scripts>\";");
    EXPECT_EQ(tokens[2].type, MarkupType::TagClose);
    EXPECT_EQ(tokens[2].name, "script");
}

TEST(Tokenizer, ResumesFromReturnedState)
{
    auto [first, mid] = tokenize("<di", TokenizerState{});
    EXPECT_TRUE(first.empty());
    EXPECT_EQ(mid.mode, TokenizerMode::TagName);

    auto [second, end] = tokenize("v id=\"a\">", mid);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].name, "div");
    ASSERT_EQ(second[0].attrs.size(), 1u);
    EXPECT_EQ(second[0].attrs[0].value, "a");
    EXPECT_EQ(end.mode, TokenizerMode::Text);
}

TEST(Tokenizer, TracksLinesAndColumns)
{
    auto [tokens, state] = tokenize("<p>\n  <b>x</b></p>", TokenizerState{});

    ASSERT_GE(tokens.size(), 3u);
    EXPECT_EQ(tokens[2].name, "b");
    EXPECT_EQ(tokens[2].span.line, 2);
    EXPECT_EQ(tokens[2].span.column, 3);
}

TEST(Tokenizer, UnterminatedConstructsFail)
{
    EXPECT_EQ(lex_error_kind("<div class=\"a\""), ErrorKind::UnterminatedTag);
    EXPECT_EQ(lex_error_kind("<!-- never closed"), ErrorKind::UnterminatedComment);
    EXPECT_EQ(lex_error_kind("<script>var a;"), ErrorKind::UnterminatedTag);
    EXPECT_EQ(lex_error_kind("<p><%= @a </p>"), ErrorKind::UnterminatedExpression);
}

TEST(Tokenizer, RejectsBadNamesAndValues)
{
    EXPECT_EQ(lex_error_kind("<div cl\"ass>"), ErrorKind::InvalidCharacterInName);
    EXPECT_EQ(lex_error_kind("<a href=x>"), ErrorKind::InvalidCharacterInName);
    EXPECT_EQ(lex_error_kind("<p></p x>"), ErrorKind::InvalidCharacterInName);
}

TEST(Tokenizer, ExpressionInsideTagIsRejected)
{
    EXPECT_EQ(lex_error_kind("<div <%= @a %>></div>"), ErrorKind::ExpressionInsideTag);
}

TEST(Tokenizer, UnterminatedTagReportsPosition)
{
    try
    {
        lex_template("<p>\n<span id=\"x\"", "page.heex");
        FAIL() << "expected ParseError";
    }
    catch (const ParseError &e)
    {
        EXPECT_EQ(e.kind, ErrorKind::UnterminatedTag);
        EXPECT_EQ(e.span.line, 2);
        EXPECT_EQ(e.span.column, 1);
        EXPECT_EQ(e.file, "page.heex");
    }
}

TEST(Eex, InterleavesExpressionTokens)
{
    auto tokens = lex_template("<p>Hi <%= @name %>!</p><%# gone %>");

    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[1].content, "Hi ");
    EXPECT_EQ(tokens[2].type, MarkupType::Expression);
    EXPECT_EQ(tokens[2].content, " @name ");
    EXPECT_EQ(tokens[2].marker, "=");
    EXPECT_EQ(tokens[3].content, "!");
    EXPECT_EQ(tokens[4].type, MarkupType::TagClose);
}

TEST(Eex, ClassifiesBlockMarkers)
{
    EXPECT_EQ(block_role(" if @show do "), BlockRole::Start);
    EXPECT_EQ(block_role("for x <- @xs do"), BlockRole::Start);
    EXPECT_EQ(block_role(" else "), BlockRole::Middle);
    EXPECT_EQ(block_role(" end "), BlockRole::End);
    EXPECT_EQ(block_role(" @done "), BlockRole::None);
}

TEST(Eex, EscapedMarkerIsLiteral)
{
    auto tokens = lex_template("<%% raw %>");

    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].content, "<% raw %>");
}
