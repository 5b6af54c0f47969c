//===----------------------------------------------------------------------===//
//
// Part of the SyndrQL project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/test_grammar_validator.cpp
// Purpose: Exercise rule matching, failure reporting, and completion hints
//          of the grammar validator.
// Key invariants: Results are deterministic; invalid indices refer to the
//                 unfiltered token vector.
// Ownership/Lifetime: Test owns validator instances and token vectors.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "syndrql/lang/grammar.hpp"
#include "syndrql/lang/grammar_validator.hpp"
#include "syndrql/lang/tokenizer.hpp"
#include "syndrql/support/log.hpp"

#include <algorithm>
#include <set>
#include <sstream>
#include <string>
#include <vector>

using namespace syndrql::lang;

namespace
{
GrammarValidationResult check(const std::string &src)
{
    GrammarValidator validator;
    return validator.validate(tokenize(src));
}

std::string matchedType(const GrammarValidationResult &result)
{
    return result.matchedRule ? result.matchedRule->statementType : std::string("<none>");
}
} // namespace

TEST(GrammarValidator, BareSelectIsIncomplete)
{
    const auto result = check("SELECT");
    EXPECT_FALSE(result.isValid);
    EXPECT_TRUE(result.invalidTokens.empty());
    ASSERT_FALSE(result.incompleteStatements.empty());
    EXPECT_EQ(result.incompleteStatements.front().errorType, IncompleteKind::Incomplete);
    ASSERT_TRUE(result.errorMessage.has_value());
    EXPECT_EQ(*result.errorMessage, "Statement doesn't match SELECT_DATABASES pattern");
    EXPECT_EQ(result.expectedTokens, std::vector<std::string>{"DATABASES"});
}

TEST(GrammarValidator, SelectDocumentsFromIdentifier)
{
    const auto result = check("SELECT DOCUMENTS FROM users;");
    EXPECT_TRUE(result.isValid);
    EXPECT_TRUE(result.invalidTokens.empty());
    EXPECT_EQ(matchedType(result), "SELECT_DOCUMENTS");
}

TEST(GrammarValidator, MatchingIsCaseInsensitive)
{
    const auto result = check("select documents from \"users\";");
    EXPECT_TRUE(result.isValid);
    EXPECT_EQ(matchedType(result), "SELECT_DOCUMENTS");
}

TEST(GrammarValidator, CreateDatabase)
{
    const auto result = check("CREATE DATABASE company_db;");
    EXPECT_TRUE(result.isValid);
    EXPECT_EQ(matchedType(result), "CREATE_DATABASE");
}

TEST(GrammarValidator, CommentsAndLineBreaksAreIgnored)
{
    const auto result = check("-- comment\nSELECT * FROM t;");
    EXPECT_TRUE(result.isValid);
    EXPECT_EQ(matchedType(result), "SELECT_ALL");
}

TEST(GrammarValidator, WhereClauseAcceptsExpressions)
{
    const auto result = check("SELECT DOCUMENTS FROM \"users\" WHERE age > 18 AND name LIKE 'J%';");
    EXPECT_TRUE(result.isValid);
    EXPECT_EQ(matchedType(result), "SELECT_DOCUMENTS_WHERE");
}

TEST(GrammarValidator, JoinWithQualifiedNames)
{
    const auto result =
        check("SELECT DOCUMENTS FROM users JOIN profiles ON users.id = profiles.user_id;");
    EXPECT_TRUE(result.isValid);
    EXPECT_EQ(matchedType(result), "SELECT_WITH_JOIN");
}

TEST(GrammarValidator, OrderByWithDirection)
{
    const auto result = check("SELECT DOCUMENTS FROM users ORDER BY name DESC;");
    EXPECT_TRUE(result.isValid);
    EXPECT_EQ(matchedType(result), "SELECT_ORDER_BY");
}

TEST(GrammarValidator, RecordSlotsAcceptFieldDefinitions)
{
    const auto result = check(
        "CREATE BUNDLE \"users\" WITH FIELDS ({\"name\", STRING, true, false}, {\"age\", INTEGER});");
    EXPECT_TRUE(result.isValid);
    EXPECT_EQ(matchedType(result), "CREATE_BUNDLE");

    const auto add = check("ADD DOCUMENT TO BUNDLE \"users\" WITH ({name = \"John\", age = 25});");
    EXPECT_TRUE(add.isValid);
    EXPECT_EQ(matchedType(add), "INSERT_DOCUMENT");
}

TEST(GrammarValidator, ShowUsersMatchesIdentifierElement)
{
    const auto result = check("show users;");
    EXPECT_TRUE(result.isValid);
    EXPECT_EQ(matchedType(result), "SHOW_USERS");
}

TEST(GrammarValidator, UnknownStarterFlagsEveryToken)
{
    const auto tokens = tokenize("FOO bar;");
    GrammarValidator validator;
    const auto result = validator.validate(tokens);
    EXPECT_FALSE(result.isValid);
    EXPECT_EQ(result.invalidTokens, (std::set<std::size_t>{0, 2, 3}));
    EXPECT_EQ(result.invalidLines, (std::set<std::size_t>{0}));
    ASSERT_TRUE(result.errorMessage.has_value());
    EXPECT_EQ(*result.errorMessage, "No matching grammar rule found for statement");
    EXPECT_EQ(result.completionSuggestions, statementStarters());
    EXPECT_TRUE(std::is_sorted(result.completionSuggestions.begin(),
                               result.completionSuggestions.end()));
    ASSERT_EQ(result.incompleteStatements.size(), 1u);
    EXPECT_EQ(result.incompleteStatements[0].errorType, IncompleteKind::InvalidSequence);
}

TEST(GrammarValidator, TrailingTokensAreInvalid)
{
    // SHOW(0) ws(1) DATABASES(2) ;(3) ws(4) extra(5)
    const auto result = check("SHOW DATABASES; extra");
    EXPECT_FALSE(result.isValid);
    EXPECT_EQ(result.invalidTokens, (std::set<std::size_t>{5}));
    ASSERT_FALSE(result.incompleteStatements.empty());
    EXPECT_EQ(result.incompleteStatements[0].errorType, IncompleteKind::InvalidSequence);
}

TEST(GrammarValidator, WrongTokenInRequiredSlot)
{
    // DELETE(0) ws(1) DATABASE(2) ws(3) ;(4)
    const auto result = check("DELETE DATABASE ;");
    EXPECT_FALSE(result.isValid);
    EXPECT_EQ(result.invalidTokens, (std::set<std::size_t>{4}));
    EXPECT_EQ(*result.errorMessage, "Statement doesn't match DELETE_DATABASE pattern");
}

TEST(GrammarValidator, InvalidLinesCoverTheWholeStatement)
{
    const auto result = check("SELECT\nDOCUMENTS\nFROM");
    EXPECT_FALSE(result.isValid);
    EXPECT_EQ(result.invalidLines, (std::set<std::size_t>{0, 1, 2}));
    EXPECT_EQ(result.incompleteStatements.size(), 3u);
}

TEST(GrammarValidator, EmptyInputIsTriviallyValid)
{
    const auto result = check("  \n -- nothing here\n");
    EXPECT_TRUE(result.isValid);
    EXPECT_EQ(result.matchedRule, nullptr);
}

TEST(GrammarValidator, ValidationIsDeterministic)
{
    const auto tokens = tokenize("UPDATE DOCUMENTS IN BUNDLE \"users\" ({age = 30}) WHERE id = 1");
    GrammarValidator validator;
    const auto a = validator.validate(tokens);
    const auto b = validator.validate(tokens);
    EXPECT_EQ(a, b);
}

TEST(GrammarValidator, TokenValidityInContext)
{
    GrammarValidator validator;
    const auto tokens = tokenize("SHOW DATABASES");
    const std::vector<Token> context(tokens.begin(), tokens.begin() + 2);
    EXPECT_TRUE(validator.isTokenValid(tokens[2], context));

    const auto bad = tokenize("SHOW FROM");
    EXPECT_FALSE(validator.isTokenValid(bad[2], context));
}

TEST(GrammarValidator, CompletionSuggestions)
{
    GrammarValidator validator;
    EXPECT_EQ(validator.getCompletionSuggestionsForStatement(tokenize("SHOW")),
              std::vector<std::string>{"DATABASES"});

    // Punctuation slots carry no completion text but are still expected.
    const auto tokens = tokenize("INVALIDATE SESSION");
    EXPECT_TRUE(validator.getCompletionSuggestionsForStatement(tokens).empty());
    EXPECT_EQ(validator.validate(tokens).expectedTokens,
              std::vector<std::string>{"<SEMICOLON>"});
}

TEST(GrammarValidator, RuleTableQueries)
{
    GrammarValidator validator;
    const auto supported = validator.getSupportedStatements();
    ASSERT_EQ(supported.size(), validator.getAllGrammarRules().size());
    EXPECT_EQ(supported.front(), "CREATE_DATABASE");
    const GrammarRule *rule = validator.getGrammarRule("SHOW_RATE_LIMIT");
    ASSERT_NE(rule, nullptr);
    EXPECT_EQ(rule->leadingKeyword(), "SHOW");
    EXPECT_EQ(validator.getGrammarRule("NOT_A_RULE"), nullptr);

    for (const auto &r : validator.getAllGrammarRules())
    {
        for (const auto &example : r.examples)
            EXPECT_TRUE(validator.validate(tokenize(example)).isValid) << example;
    }
}

TEST(GrammarValidator, DebugLogNamesCandidateRules)
{
    std::ostringstream out;
    syndrql::support::LogSink log(out, {syndrql::support::LogConfig::Debug});
    GrammarValidator validator(&log);
    EXPECT_TRUE(validator.validate(tokenize("SHOW BUNDLES;")).isValid);
    EXPECT_NE(out.str().find("[syndrql:debug] grammar: rule SHOW_BUNDLES matched"),
              std::string::npos);
}
