//===----------------------------------------------------------------------===//
//
// Part of the SyndrQL project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/lang/grammar.cpp
// Purpose: SyndrQL statement rule table and token-to-grammar classification.
// Key invariants: Rule order below is significant: candidates are tried in
//                 this order and the first candidate reports errors when no
//                 rule matches cleanly.
// Links: include/syndrql/lang/grammar.hpp
//
//===----------------------------------------------------------------------===//

#include "syndrql/lang/grammar.hpp"

#include "syndrql/lang/keywords.hpp"
#include "syndrql/support/char_utils.hpp"

#include <algorithm>
#include <array>
#include <initializer_list>
#include <utility>

namespace syndrql::lang
{

using support::char_utils::equalsIgnoreCase;

namespace
{

GrammarElement kw(std::string value, bool optional = false)
{
    GrammarElement e;
    e.type = GrammarType::Keyword;
    e.value = std::move(value);
    e.optional = optional;
    return e;
}

GrammarElement slot(GrammarType type, std::string placeholder, bool repeatable = false,
                    bool optional = false)
{
    GrammarElement e;
    e.type = type;
    e.placeholder = std::move(placeholder);
    e.repeatable = repeatable;
    e.optional = optional;
    return e;
}

GrammarElement name(std::string placeholder)
{
    return slot(GrammarType::Name, std::move(placeholder));
}

GrammarElement conditions(std::string placeholder = "CONDITIONS", bool optional = false)
{
    return slot(GrammarType::Expression, std::move(placeholder), true, optional);
}

GrammarElement punct(GrammarType type)
{
    GrammarElement e;
    e.type = type;
    return e;
}

GrammarElement wildcard()
{
    GrammarElement e = punct(GrammarType::Wildcard);
    e.value = "*";
    return e;
}

GrammarElement semi()
{
    return punct(GrammarType::Semicolon);
}

GrammarRule rule(std::string type,
                 std::string description,
                 std::initializer_list<GrammarElement> pattern,
                 std::initializer_list<std::string> examples)
{
    return GrammarRule{std::move(type), std::move(description), pattern, examples};
}

std::vector<GrammarRule> buildRules()
{
    using GT = GrammarType;
    std::vector<GrammarRule> rules;

    // Database operations
    rules.push_back(rule("CREATE_DATABASE",
                         "Create a new database",
                         {kw("CREATE"), kw("DATABASE"), name("DATABASE_NAME"), semi()},
                         {"CREATE DATABASE \"my_database\";"}));
    rules.push_back(rule("DELETE_DATABASE",
                         "Delete an existing database",
                         {kw("DELETE"), kw("DATABASE"), name("DATABASE_NAME"), semi()},
                         {"DELETE DATABASE \"old_database\";"}));
    rules.push_back(rule("SELECT_DATABASES",
                         "Select databases matching a name",
                         {kw("SELECT"), kw("DATABASES"), name("DATABASE_NAME"), semi()},
                         {"SELECT DATABASES \"production\";"}));
    rules.push_back(rule("USE_DATABASE",
                         "Switch the active database",
                         {kw("USE"), name("DATABASE_NAME"), semi()},
                         {"USE \"production\";"}));

    // Bundle operations
    rules.push_back(rule("CREATE_BUNDLE",
                         "Create a new bundle with field definitions",
                         {kw("CREATE"),
                          kw("BUNDLE"),
                          name("BUNDLE_NAME"),
                          kw("WITH"),
                          kw("FIELDS"),
                          punct(GT::ParenOpen),
                          slot(GT::Record, "FIELD_DEFINITIONS", true),
                          punct(GT::ParenClose),
                          semi()},
                         {"CREATE BUNDLE \"users\" WITH FIELDS ({\"name\", STRING, true, false}, "
                          "{\"email\", STRING, true, true});"}));
    rules.push_back(rule("DELETE_BUNDLE",
                         "Delete an existing bundle",
                         {kw("DELETE"), kw("BUNDLE"), name("BUNDLE_NAME"), semi()},
                         {"DELETE BUNDLE \"old_bundle\";"}));
    rules.push_back(rule("UPDATE_BUNDLE",
                         "Change the field definitions of a bundle",
                         {kw("UPDATE"),
                          kw("BUNDLE"),
                          name("BUNDLE_NAME"),
                          punct(GT::BracketOpen),
                          slot(GT::Record, "UPDATE_OPERATIONS", true),
                          punct(GT::BracketClose),
                          semi()},
                         {"UPDATE BUNDLE \"users\" [ADD FIELD \"age\" INTEGER];"}));

    // Document operations
    rules.push_back(rule("INSERT_DOCUMENT",
                         "Add a document to a bundle",
                         {kw("ADD"),
                          kw("DOCUMENT"),
                          kw("TO"),
                          kw("BUNDLE"),
                          name("BUNDLE_NAME"),
                          kw("WITH"),
                          punct(GT::ParenOpen),
                          slot(GT::Record, "KEY_VALUE_PAIRS", true),
                          punct(GT::ParenClose),
                          semi()},
                         {"ADD DOCUMENT TO BUNDLE \"users\" WITH ({name=\"John\", age=25});"}));
    rules.push_back(rule("SELECT_DOCUMENTS",
                         "Select all documents from a bundle",
                         {kw("SELECT"), kw("DOCUMENTS"), kw("FROM"), name("BUNDLE_NAME"), semi()},
                         {"SELECT DOCUMENTS FROM \"users\";"}));
    rules.push_back(rule("SELECT_DOCUMENTS_WHERE",
                         "Select documents matching conditions",
                         {kw("SELECT"),
                          kw("DOCUMENTS"),
                          kw("FROM"),
                          name("BUNDLE_NAME"),
                          kw("WHERE"),
                          conditions(),
                          semi()},
                         {"SELECT DOCUMENTS FROM \"users\" WHERE age > 18;"}));
    rules.push_back(rule("SELECT_ALL",
                         "Select every document from a bundle",
                         {kw("SELECT"), wildcard(), kw("FROM"), name("BUNDLE_NAME"), semi()},
                         {"SELECT * FROM \"users\";"}));
    rules.push_back(rule("SELECT_ALL_WHERE",
                         "Select every document matching conditions",
                         {kw("SELECT"),
                          wildcard(),
                          kw("FROM"),
                          name("BUNDLE_NAME"),
                          kw("WHERE"),
                          conditions(),
                          semi()},
                         {"SELECT * FROM \"users\" WHERE active = true;"}));
    rules.push_back(rule("SELECT_WITH_JOIN",
                         "Select documents joined across bundles",
                         {kw("SELECT"),
                          kw("DOCUMENTS"),
                          kw("FROM"),
                          name("BUNDLE_NAME"),
                          kw("JOIN"),
                          name("OTHER_BUNDLE"),
                          kw("ON"),
                          conditions("JOIN_CONDITIONS"),
                          kw("WHERE", true),
                          conditions("CONDITIONS", true),
                          semi()},
                         {"SELECT DOCUMENTS FROM \"users\" JOIN \"profiles\" ON users.id = "
                          "profiles.user_id WHERE users.active = true;"}));
    {
        GrammarElement direction = kw("ASC", true);
        direction.value.clear();
        direction.choices = {"ASC", "DESC"};
        rules.push_back(rule("SELECT_ORDER_BY",
                             "Select documents in a given order",
                             {kw("SELECT"),
                              kw("DOCUMENTS"),
                              kw("FROM"),
                              name("BUNDLE_NAME"),
                              kw("WHERE", true),
                              conditions("CONDITIONS", true),
                              kw("ORDER"),
                              kw("BY"),
                              name("FIELD_NAME"),
                              direction,
                              semi()},
                             {"SELECT DOCUMENTS FROM \"users\" WHERE active = true ORDER BY name ASC;"}));
    }
    rules.push_back(rule("SELECT_GROUP_BY",
                         "Select documents grouped by a field",
                         {kw("SELECT"),
                          kw("DOCUMENTS"),
                          kw("FROM"),
                          name("BUNDLE_NAME"),
                          kw("WHERE", true),
                          conditions("CONDITIONS", true),
                          kw("GROUP"),
                          kw("BY"),
                          name("FIELD_NAME"),
                          semi()},
                         {"SELECT DOCUMENTS FROM \"orders\" WHERE status = \"completed\" GROUP BY "
                          "customer_id;"}));
    rules.push_back(rule("SELECT_FIELDS",
                         "Select field expressions from a bundle",
                         {kw("SELECT"),
                          slot(GT::Expression, "FIELD_LIST", true),
                          kw("FROM"),
                          name("BUNDLE_NAME"),
                          kw("WHERE", true),
                          conditions("CONDITIONS", true),
                          semi()},
                         {"SELECT name, COUNT(id) FROM \"users\" WHERE age > 18;"}));
    rules.push_back(rule("UPDATE_DOCUMENTS",
                         "Update documents matching conditions",
                         {kw("UPDATE"),
                          kw("DOCUMENTS"),
                          kw("IN"),
                          kw("BUNDLE"),
                          name("BUNDLE_NAME"),
                          punct(GT::ParenOpen),
                          slot(GT::Record, "KEY_VALUE_UPDATES", true),
                          punct(GT::ParenClose),
                          kw("WHERE"),
                          conditions(),
                          semi()},
                         {"UPDATE DOCUMENTS IN BUNDLE \"users\" ({name=\"Jane\", age=30}) WHERE id = 1;"}));
    rules.push_back(rule("DELETE_DOCUMENTS",
                         "Delete documents matching conditions",
                         {kw("DELETE"),
                          kw("DOCUMENTS"),
                          kw("FROM"),
                          kw("BUNDLE"),
                          name("BUNDLE_NAME"),
                          kw("WHERE"),
                          conditions(),
                          semi()},
                         {"DELETE DOCUMENTS FROM BUNDLE \"users\" WHERE active = false;"}));

    // Index operations
    rules.push_back(rule("CREATE_BTREE_INDEX",
                         "Create a B-tree index over one or more fields",
                         {kw("CREATE"),
                          kw("BTREE"),
                          kw("INDEX"),
                          name("INDEX_NAME"),
                          kw("ON"),
                          kw("BUNDLE"),
                          name("BUNDLE_NAME"),
                          punct(GT::ParenOpen),
                          slot(GT::Record, "FIELD_NAMES", true),
                          punct(GT::ParenClose),
                          semi()},
                         {"CREATE BTREE INDEX \"user_name_idx\" ON BUNDLE \"users\" (name, email);"}));
    rules.push_back(rule("CREATE_HASH_INDEX",
                         "Create a hash index over one field",
                         {kw("CREATE"),
                          kw("HASH"),
                          kw("INDEX"),
                          name("INDEX_NAME"),
                          kw("ON"),
                          kw("BUNDLE"),
                          name("BUNDLE_NAME"),
                          punct(GT::ParenOpen),
                          name("FIELD_NAME"),
                          punct(GT::ParenClose),
                          semi()},
                         {"CREATE HASH INDEX \"user_id_idx\" ON BUNDLE \"users\" (id);"}));

    // Server information
    rules.push_back(rule("SHOW_DATABASES",
                         "List all databases",
                         {kw("SHOW"), kw("DATABASES"), semi()},
                         {"SHOW DATABASES;"}));
    rules.push_back(rule("SHOW_BUNDLES",
                         "List bundles in the active database",
                         {kw("SHOW"), kw("BUNDLES"), semi()},
                         {"SHOW BUNDLES;"}));
    rules.push_back(rule("SHOW_BUNDLES_FOR_DATABASE",
                         "List bundles in a named database",
                         {kw("SHOW"), kw("BUNDLES"), kw("FOR"), name("DATABASE_NAME"), semi()},
                         {"SHOW BUNDLES FOR \"production\";"}));
    rules.push_back(rule("SHOW_BUNDLE",
                         "Describe one bundle",
                         {kw("SHOW"), kw("BUNDLE"), name("BUNDLE_NAME"), semi()},
                         {"SHOW BUNDLE \"users\";"}));
    {
        // USERS stays an identifier so bundles named "users" are not keywords.
        GrammarElement users;
        users.type = GT::Identifier;
        users.value = "USERS";
        rules.push_back(rule("SHOW_USERS",
                             "List server users",
                             {kw("SHOW"), users, semi()},
                             {"SHOW USERS;"}));
    }
    rules.push_back(rule("SHOW_RATE_LIMIT",
                         "Show the current rate limit",
                         {kw("SHOW"), kw("RATE"), kw("LIMIT"), semi()},
                         {"SHOW RATE LIMIT;"}));

    // Permissions and sessions
    rules.push_back(rule("GRANT_PERMISSION",
                         "Grant a permission on a resource",
                         {kw("GRANT"),
                          slot(GT::Record, "PERMISSION_TYPE"),
                          kw("ON"),
                          name("RESOURCE"),
                          kw("TO"),
                          name("USER_OR_ROLE"),
                          semi()},
                         {"GRANT READ ON \"users\" TO \"analyst_role\";"}));
    rules.push_back(rule("ATTACH_RESOURCE",
                         "Attach an external resource",
                         {kw("ATTACH"), slot(GT::Record, "RESOURCE_SPECIFICATION", true), semi()},
                         {"ATTACH DATABASE \"/path/to/external.db\";"}));
    rules.push_back(rule("INVALIDATE_SESSION",
                         "Invalidate the current session",
                         {kw("INVALIDATE"), kw("SESSION"), semi()},
                         {"INVALIDATE SESSION;"}));
    rules.push_back(rule("INVALIDATE_SESSION_ID",
                         "Invalidate a session by id",
                         {kw("INVALIDATE"), kw("SESSION"), name("SESSION_ID"), semi()},
                         {"INVALIDATE SESSION \"session-123-abc\";"}));

    return rules;
}

const std::vector<GrammarRule> &ruleTable()
{
    static const std::vector<GrammarRule> rules = buildRules();
    return rules;
}

bool isExpressionKeyword(const Token &token)
{
    static constexpr std::array<std::string_view, 11> kOperands = {
        "AND", "OR", "NOT", "IS", "NULL", "LIKE", "BETWEEN", "IN", "EXISTS", "TRUE", "FALSE"};
    if (token.keyword && token.keyword->category == KeywordCategory::Functions)
        return true;
    for (std::string_view word : kOperands)
    {
        if (equalsIgnoreCase(token.value, word))
            return true;
    }
    return false;
}

bool typeCompatible(const Token &token, GrammarType mapped, GrammarType wanted)
{
    switch (wanted)
    {
        case GrammarType::Name:
            return mapped == GrammarType::Identifier || mapped == GrammarType::StringLiteral;
        case GrammarType::Expression:
            switch (mapped)
            {
                case GrammarType::Identifier:
                case GrammarType::StringLiteral:
                case GrammarType::Number:
                case GrammarType::Placeholder:
                case GrammarType::Operator:
                case GrammarType::Equals:
                case GrammarType::Wildcard:
                case GrammarType::Separator:
                case GrammarType::ParenOpen:
                case GrammarType::ParenClose:
                case GrammarType::Comma:
                    return true;
                case GrammarType::Keyword:
                    return isExpressionKeyword(token);
                default:
                    return false;
            }
        case GrammarType::Record:
            return mapped != GrammarType::ParenOpen && mapped != GrammarType::ParenClose &&
                   mapped != GrammarType::BracketOpen && mapped != GrammarType::BracketClose &&
                   mapped != GrammarType::Semicolon;
        default:
            return mapped == wanted;
    }
}

} // namespace

std::string_view grammarTypeName(GrammarType type) noexcept
{
    switch (type)
    {
        case GrammarType::Keyword:
            return "KEYWORD";
        case GrammarType::Identifier:
            return "IDENTIFIER";
        case GrammarType::StringLiteral:
            return "STRING_LITERAL";
        case GrammarType::Number:
            return "NUMBER";
        case GrammarType::Placeholder:
            return "PLACEHOLDER";
        case GrammarType::Operator:
            return "OPERATOR";
        case GrammarType::Separator:
            return "SEPARATOR";
        case GrammarType::ParenOpen:
            return "PARENTHESIS_OPEN";
        case GrammarType::ParenClose:
            return "PARENTHESIS_CLOSE";
        case GrammarType::BraceOpen:
            return "BRACE_OPEN";
        case GrammarType::BraceClose:
            return "BRACE_CLOSE";
        case GrammarType::BracketOpen:
            return "BRACKET_OPEN";
        case GrammarType::BracketClose:
            return "BRACKET_CLOSE";
        case GrammarType::Semicolon:
            return "SEMICOLON";
        case GrammarType::Comma:
            return "COMMA";
        case GrammarType::Equals:
            return "EQUALS";
        case GrammarType::Wildcard:
            return "WILDCARD";
        case GrammarType::Name:
            return "NAME";
        case GrammarType::Expression:
            return "EXPRESSION";
        case GrammarType::Record:
            return "RECORD";
    }
    return "UNKNOWN";
}

std::string GrammarElement::describe() const
{
    if (!value.empty())
        return value;
    if (!choices.empty())
    {
        std::string joined;
        for (const auto &choice : choices)
        {
            if (!joined.empty())
                joined += '|';
            joined += choice;
        }
        return joined;
    }
    if (!placeholder.empty())
        return "<" + placeholder + ">";
    return "<" + std::string(grammarTypeName(type)) + ">";
}

std::span<const GrammarRule> grammarRules()
{
    return ruleTable();
}

const GrammarRule *findGrammarRule(std::string_view statementType)
{
    for (const auto &r : ruleTable())
    {
        if (r.statementType == statementType)
            return &r;
    }
    return nullptr;
}

std::vector<const GrammarRule *> findMatchingGrammarRules(std::string_view statementText)
{
    const std::size_t space = statementText.find(' ');
    const std::string_view first = statementText.substr(0, space);

    std::vector<const GrammarRule *> out;
    if (first.empty())
        return out;
    for (const auto &r : ruleTable())
    {
        if (equalsIgnoreCase(r.leadingKeyword(), first))
            out.push_back(&r);
    }
    return out;
}

std::vector<std::string> statementStarters()
{
    std::vector<std::string> starters;
    for (const auto &r : ruleTable())
        starters.push_back(r.leadingKeyword());
    std::sort(starters.begin(), starters.end());
    starters.erase(std::unique(starters.begin(), starters.end()), starters.end());
    return starters;
}

std::optional<GrammarType> mapTokenType(const Token &token)
{
    switch (token.type)
    {
        case TokenType::Keyword:
            return GrammarType::Keyword;
        case TokenType::Identifier:
            return GrammarType::Identifier;
        case TokenType::String:
        case TokenType::Literal:
            return GrammarType::StringLiteral;
        case TokenType::Number:
            return GrammarType::Number;
        case TokenType::Placeholder:
            return GrammarType::Placeholder;
        case TokenType::Operator:
        case TokenType::Punctuation:
            break;
        default:
            return std::nullopt;
    }

    if (token.value == "=")
        return GrammarType::Equals;
    if (token.value == "*")
        return GrammarType::Wildcard;
    if (token.type == TokenType::Operator)
        return GrammarType::Operator;
    if (token.value.size() != 1)
        return std::nullopt;
    switch (token.value[0])
    {
        case '(':
            return GrammarType::ParenOpen;
        case ')':
            return GrammarType::ParenClose;
        case '{':
            return GrammarType::BraceOpen;
        case '}':
            return GrammarType::BraceClose;
        case '[':
            return GrammarType::BracketOpen;
        case ']':
            return GrammarType::BracketClose;
        case ';':
            return GrammarType::Semicolon;
        case ',':
            return GrammarType::Comma;
        case '.':
        case ':':
        case '?':
            return GrammarType::Separator;
        default:
            return std::nullopt;
    }
}

bool matchesElement(const Token &token, const GrammarElement &element)
{
    const auto mapped = mapTokenType(token);
    if (!mapped || !typeCompatible(token, *mapped, element.type))
        return false;
    if (!element.value.empty())
        return equalsIgnoreCase(token.value, element.value);
    if (!element.choices.empty())
    {
        return std::any_of(element.choices.begin(),
                           element.choices.end(),
                           [&](const std::string &choice)
                           { return equalsIgnoreCase(token.value, choice); });
    }
    return true;
}

} // namespace syndrql::lang
