//===----------------------------------------------------------------------===//
//
// Part of the SyndrQL project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/test_error_analyzer.cpp
// Purpose: Verify diagnostics produced for lexical anomalies, structural
//          mistakes, and grammar mismatches.
// Key invariants: Failed validation always yields at least one diagnostic.
// Ownership/Lifetime: Test owns analyzers, tokens, and results.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "syndrql/lang/error_analyzer.hpp"
#include "syndrql/lang/error_codes.hpp"
#include "syndrql/lang/grammar_validator.hpp"
#include "syndrql/lang/tokenizer.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

using namespace syndrql::lang;

namespace
{
std::vector<ErrorDetail> analyzeSource(const std::string &src, std::size_t lineOffset = 0)
{
    const auto tokens = tokenize(src);
    GrammarValidator validator;
    ErrorAnalyzer analyzer;
    return analyzer.analyze(tokens, validator.validate(tokens), lineOffset);
}

const ErrorDetail *findCode(const std::vector<ErrorDetail> &errors, std::string_view code)
{
    auto it = std::find_if(
        errors.begin(), errors.end(), [&](const ErrorDetail &e) { return e.code == code; });
    return it == errors.end() ? nullptr : &*it;
}
} // namespace

TEST(ErrorAnalyzer, BareSelectReportsMissingTarget)
{
    const auto errors = analyzeSource("SELECT");
    const ErrorDetail *missing = findCode(errors, diag::SelectMissingTarget);
    ASSERT_NE(missing, nullptr);
    EXPECT_NE(missing->message.find("SELECT statement is incomplete"), std::string::npos);
    EXPECT_EQ(missing->line, 0u);
    EXPECT_EQ(missing->column, 6u);

    const ErrorDetail *incomplete = findCode(errors, diag::IncompleteStatement);
    ASSERT_NE(incomplete, nullptr);
    EXPECT_NE(incomplete->message.find("DATABASES"), std::string::npos);
}

TEST(ErrorAnalyzer, UnterminatedStringIsFlagged)
{
    const auto tokens = tokenize("SELECT \"abc FROM t;");
    ASSERT_EQ(tokens.back().type, TokenType::String);
    EXPECT_TRUE(ErrorAnalyzer::isUnterminatedString(tokens.back()));

    const auto errors = analyzeSource("SELECT \"abc FROM t;");
    const ErrorDetail *err = findCode(errors, diag::UnterminatedString);
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(err->column, 7u);
    EXPECT_EQ(err->source, "\"abc FROM t;");
}

TEST(ErrorAnalyzer, StringTerminationRespectsEscapes)
{
    Token tok;
    tok.type = TokenType::String;
    tok.value = "\"done\"";
    EXPECT_FALSE(ErrorAnalyzer::isUnterminatedString(tok));
    tok.value = "\"esc\\\"";
    EXPECT_TRUE(ErrorAnalyzer::isUnterminatedString(tok));
    tok.value = "\"";
    EXPECT_TRUE(ErrorAnalyzer::isUnterminatedString(tok));
}

TEST(ErrorAnalyzer, LexicalChecks)
{
    Token num;
    num.type = TokenType::Number;
    num.value = "12ab";
    EXPECT_TRUE(ErrorAnalyzer::isInvalidNumber(num));
    num.value = "1.5e-3";
    EXPECT_FALSE(ErrorAnalyzer::isInvalidNumber(num));

    Token comment;
    comment.type = TokenType::Comment;
    comment.value = "/* open";
    EXPECT_TRUE(ErrorAnalyzer::isUnterminatedComment(comment));
    comment.value = "/* closed */";
    EXPECT_FALSE(ErrorAnalyzer::isUnterminatedComment(comment));
    comment.value = "-- line";
    EXPECT_FALSE(ErrorAnalyzer::isUnterminatedComment(comment));

    ErrorAnalyzer analyzer;
    const auto errors = analyzer.analyzeTokenErrors(tokenize("SHOW 12ab ~ /* x"));
    ASSERT_EQ(errors.size(), 3u);
    EXPECT_EQ(errors[0].code, diag::InvalidNumberFormat);
    EXPECT_EQ(errors[1].code, diag::InvalidToken);
    EXPECT_EQ(errors[2].code, diag::UnterminatedComment);
}

TEST(ErrorAnalyzer, MisspelledCommandSuggestsKeyword)
{
    const auto errors = analyzeSource("SELEC DOCUMENTS FROM users;");
    const ErrorDetail *err = findCode(errors, diag::UnrecognizedCommand);
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(err->message, "\"SELEC\" is not a recognized SyndrQL command.");
    ASSERT_TRUE(err->suggestion.has_value());
    EXPECT_EQ(*err->suggestion, "Did you mean SELECT?");

    // Every significant token is unexpected when no rule applies.
    const auto unexpected = std::count_if(errors.begin(),
                                          errors.end(),
                                          [](const ErrorDetail &e)
                                          { return e.code == diag::UnexpectedToken; });
    EXPECT_EQ(unexpected, 5);
}

TEST(ErrorAnalyzer, StructuralChecks)
{
    EXPECT_NE(findCode(analyzeSource("SELECT DOCUMENTS users;"), diag::SelectMissingFrom), nullptr);
    EXPECT_NE(findCode(analyzeSource("SELECT SET x;"), diag::SelectInvalidKeywordSequence),
              nullptr);
    EXPECT_NE(findCode(analyzeSource("INSERT DOCUMENT;"), diag::InsertMissingInto), nullptr);
    EXPECT_NE(findCode(analyzeSource("UPDATE users name = 1;"), diag::UpdateMissingSet), nullptr);
    EXPECT_NE(findCode(analyzeSource("UPDATE DOCUMENTS \"users\" ({a = 1}) WHERE id = 1;"),
                       diag::UpdateMissingBundle),
              nullptr);
    EXPECT_NE(findCode(analyzeSource("DELETE users;"), diag::DeleteMissingFrom), nullptr);
    EXPECT_NE(findCode(analyzeSource("ADD DOCUMENT users;"), diag::AddMissingTo), nullptr);

    const auto create = analyzeSource("CREATE TABLE x;");
    const ErrorDetail *err = findCode(create, diag::CreateMissingObject);
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(err->column, 7u);
    EXPECT_EQ(err->source, "TABLE");
}

TEST(ErrorAnalyzer, TrailingTokenIsUnexpected)
{
    const auto errors = analyzeSource("SHOW DATABASES; extra");
    const ErrorDetail *err = findCode(errors, diag::UnexpectedToken);
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(err->message, "Unexpected token \"extra\".");
    EXPECT_EQ(err->column, 16u);
    EXPECT_EQ(err->length, 5u);
}

TEST(ErrorAnalyzer, ValidStatementHasNoDiagnostics)
{
    EXPECT_TRUE(analyzeSource("SHOW BUNDLES FOR \"production\";").empty());
}

TEST(ErrorAnalyzer, EmptyStatement)
{
    GrammarValidationResult failed;
    failed.isValid = false;
    ErrorAnalyzer analyzer;
    const auto errors = analyzer.analyzeGrammarErrors(tokenize("   "), failed, 4);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].code, diag::EmptyStatement);
    EXPECT_EQ(errors[0].line, 4u);
}

TEST(ErrorAnalyzer, GenericSyntaxErrorFallback)
{
    GrammarValidationResult failed;
    failed.isValid = false;
    ErrorAnalyzer analyzer;
    const auto errors = analyzer.analyzeGrammarErrors(tokenize("SHOW DATABASES;"), failed);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].code, diag::SyntaxError);
    EXPECT_EQ(errors[0].column, 0u);
}

TEST(ErrorAnalyzer, LineOffsetShiftsEveryDiagnostic)
{
    const auto errors = analyzeSource("SELECT\n\"open", 10);
    ASSERT_FALSE(errors.empty());
    for (const auto &e : errors)
        EXPECT_GE(e.line, 10u) << e.code;
    const ErrorDetail *str = findCode(errors, diag::UnterminatedString);
    ASSERT_NE(str, nullptr);
    EXPECT_EQ(str->line, 11u);
}

TEST(ErrorAnalyzer, KeywordSuggestions)
{
    EXPECT_EQ(editDistance("kitten", "sitting"), 3u);
    EXPECT_EQ(editDistance("", "abc"), 3u);
    EXPECT_EQ(suggestKeyword("frm"), std::optional<std::string>("FROM"));
    EXPECT_EQ(suggestKeyword("ab"), std::nullopt);
    EXPECT_EQ(suggestKeyword("zzzzzzzz"), std::nullopt);
}
