//===----------------------------------------------------------------------===//
//
// Part of the SyndrQL project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/test_tokenizer.cpp
// Purpose: Verify the tokenizer is lossless, position-accurate, and tolerant
//          of malformed input.
// Key invariants: Concatenated token values always reproduce the input.
// Ownership/Lifetime: Test owns all source strings and token vectors.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "syndrql/lang/keywords.hpp"
#include "syndrql/lang/tokenizer.hpp"

#include <string>
#include <vector>

using namespace syndrql::lang;

namespace
{
std::string rejoin(const std::vector<Token> &tokens)
{
    std::string out;
    for (const auto &tok : tokens)
        out += tok.value;
    return out;
}

std::vector<TokenType> typesOf(const std::vector<Token> &tokens)
{
    std::vector<TokenType> out;
    for (const auto &tok : tokens)
        out.push_back(tok.type);
    return out;
}
} // namespace

TEST(Tokenizer, ConcatenationReproducesInput)
{
    const std::vector<std::string> inputs = {
        "",
        "SELECT DOCUMENTS FROM users;",
        "-- comment\nSELECT * FROM t;",
        "SELECT \"abc FROM t;",
        "a\r\nb\rc\n",
        "/* never closed",
        "x = 'it\\'s' || y <> 3.5e-2;",
        "caf\xC3\xA9 | ~ #",
        "12ab $1 @p $name ?",
    };
    for (const auto &src : inputs)
        EXPECT_EQ(rejoin(tokenize(src)), src) << src;
}

TEST(Tokenizer, RetokenizingRejoinedTextIsStable)
{
    const std::string src = "CREATE BUNDLE \"users\" WITH FIELDS ({\"name\", STRING});\n-- done";
    const auto first = tokenize(src);
    EXPECT_EQ(tokenize(rejoin(first)), first);
}

TEST(Tokenizer, KeywordsAreCaseInsensitive)
{
    for (const char *spelling : {"select", "SELECT", "Select"})
    {
        const auto tokens = tokenize(spelling);
        ASSERT_EQ(tokens.size(), 1u);
        EXPECT_EQ(tokens[0].type, TokenType::Keyword);
        ASSERT_NE(tokens[0].keyword, nullptr);
        EXPECT_EQ(tokens[0].keyword->lexeme, "SELECT");
        EXPECT_EQ(tokens[0].value, spelling);
    }
}

TEST(Tokenizer, CreateDatabaseStatement)
{
    const auto tokens = tokenize("CREATE DATABASE company_db;");
    const std::vector<TokenType> expected = {TokenType::Keyword,
                                             TokenType::Whitespace,
                                             TokenType::Keyword,
                                             TokenType::Whitespace,
                                             TokenType::Identifier,
                                             TokenType::Punctuation};
    EXPECT_EQ(typesOf(tokens), expected);
    EXPECT_EQ(tokens[4].value, "company_db");
    EXPECT_EQ(tokens[4].startPosition, 16u);
    EXPECT_EQ(tokens[4].endPosition, 26u);
    EXPECT_EQ(tokens[5].column, 26u);

    const auto significant = significantTokens(tokens);
    ASSERT_EQ(significant.size(), 4u);
    EXPECT_EQ(significant[2].value, "company_db");
}

TEST(Tokenizer, LineCommentEndsAtLineBreak)
{
    const auto tokens = tokenize("-- comment\nSELECT * FROM t;");
    ASSERT_GE(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].type, TokenType::Comment);
    EXPECT_EQ(tokens[0].value, "-- comment");
    EXPECT_EQ(tokens[1].type, TokenType::Newline);
    EXPECT_EQ(tokens[2].type, TokenType::Keyword);
    EXPECT_EQ(tokens[2].line, 1u);
    EXPECT_EQ(tokens[2].column, 0u);
}

TEST(Tokenizer, BlockCommentsSpanLines)
{
    const auto tokens = tokenize("/* a\nb */ SHOW");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].type, TokenType::Comment);
    EXPECT_EQ(tokens[0].value, "/* a\nb */");
    EXPECT_EQ(tokens[2].line, 1u);
    EXPECT_EQ(tokens[2].column, 5u);

    const auto open = tokenize("SHOW /* open");
    EXPECT_EQ(open.back().type, TokenType::Comment);
    EXPECT_EQ(open.back().value, "/* open");
}

TEST(Tokenizer, UnterminatedStringStopsAtLineEnd)
{
    const auto tokens = tokenize("SELECT \"abc FROM t;\nSHOW");
    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[2].type, TokenType::String);
    EXPECT_EQ(tokens[2].value, "\"abc FROM t;");
    EXPECT_EQ(tokens[3].type, TokenType::Newline);
    EXPECT_EQ(tokens[4].type, TokenType::Keyword);
}

TEST(Tokenizer, EscapedQuotesStayInsideString)
{
    const auto tokens = tokenize("'it\\'s' x");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].type, TokenType::String);
    EXPECT_EQ(tokens[0].value, "'it\\'s'");
}

TEST(Tokenizer, LineBreakVariants)
{
    const auto crlf = tokenize("a\r\nb");
    ASSERT_EQ(crlf.size(), 3u);
    EXPECT_EQ(crlf[1].type, TokenType::Newline);
    EXPECT_EQ(crlf[1].value, "\r\n");
    EXPECT_EQ(crlf[2].line, 1u);
    EXPECT_EQ(crlf[2].column, 0u);

    const auto cr = tokenize("a\rb");
    ASSERT_EQ(cr.size(), 3u);
    EXPECT_EQ(cr[2].line, 1u);
}

TEST(Tokenizer, Placeholders)
{
    const auto tokens = significantTokens(tokenize("@name $1 $id"));
    ASSERT_EQ(tokens.size(), 3u);
    for (const auto &tok : tokens)
        EXPECT_EQ(tok.type, TokenType::Placeholder) << tok.value;
    EXPECT_EQ(tokens[1].value, "$1");
}

TEST(Tokenizer, OperatorsPreferTwoCharacterForms)
{
    const auto tokens = significantTokens(tokenize("a<=b != c || d | e"));
    ASSERT_EQ(tokens.size(), 9u);
    EXPECT_EQ(tokens[1].value, "<=");
    EXPECT_EQ(tokens[1].type, TokenType::Operator);
    EXPECT_EQ(tokens[3].value, "!=");
    EXPECT_EQ(tokens[5].value, "||");
    EXPECT_EQ(tokens[7].value, "|");
    EXPECT_EQ(tokens[7].type, TokenType::Unknown);
}

TEST(Tokenizer, Numbers)
{
    const auto tokens = significantTokens(tokenize("42 3.25 1.5e-3 12ab"));
    ASSERT_EQ(tokens.size(), 4u);
    for (const auto &tok : tokens)
        EXPECT_EQ(tok.type, TokenType::Number) << tok.value;
    EXPECT_EQ(tokens[2].value, "1.5e-3");
    EXPECT_EQ(tokens[3].value, "12ab");
}

TEST(Tokenizer, MultibyteCharacterIsOneUnknownToken)
{
    const auto tokens = tokenize("\xC3\xA9");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type, TokenType::Unknown);
    EXPECT_EQ(tokens[0].value.size(), 2u);
}

TEST(Tokenizer, UsersIsAnIdentifier)
{
    const auto tokens = tokenize("users");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type, TokenType::Identifier);
    EXPECT_FALSE(isKeyword("users"));
    EXPECT_TRUE(isKeyword("bundle"));
}
