//===----------------------------------------------------------------------===//
//
// Part of the SyndrQL project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/syndrql/lang/grammar.hpp
// Purpose: Declarative grammar rule table describing every supported
//          SyndrQL statement shape.
//
// Key Invariants:
//   - Rules are kept in declaration order; that order is the tie-break for
//     candidate selection and for the accepted match
//   - Every rule pattern starts with a Keyword element carrying a value
//   - statementType values are unique
//
// Ownership/Lifetime: The rule table has static storage duration; callers
// receive references or pointers into it.
//
//===----------------------------------------------------------------------===//
#pragma once

#include "syndrql/lang/token.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace syndrql::lang
{

/// @brief Grammar-level classification of a token, or a slot class that
///        accepts several classifications.
enum class GrammarType
{
    Keyword,
    Identifier,
    StringLiteral,
    Number,
    Placeholder,
    Operator,
    Separator, ///< `.`, `:`, `?`
    ParenOpen,
    ParenClose,
    BraceOpen,
    BraceClose,
    BracketOpen,
    BracketClose,
    Semicolon,
    Comma,
    Equals,
    Wildcard,

    // Slot classes: never produced by mapTokenType.
    Name,       ///< Identifier or string literal naming an object.
    Expression, ///< One token of a condition or field expression.
    Record,     ///< One token of a body; anything but ( ) [ ] ;
};

/// @brief Upper-snake name of @p type as used in diagnostics ("STRING_LITERAL").
[[nodiscard]] std::string_view grammarTypeName(GrammarType type) noexcept;

/// @brief One slot in a rule pattern.
struct GrammarElement
{
    GrammarType type = GrammarType::Keyword;
    std::string value;                ///< Exact value required (case-insensitive); empty if any.
    std::vector<std::string> choices; ///< Accepted values (case-insensitive); empty if any.
    std::string placeholder;          ///< Human name of the slot ("BUNDLE_NAME").
    bool optional = false;
    bool repeatable = false;

    /// @brief Text naming what this element expects: the value, the
    ///        placeholder in angle brackets, or the type name in angle brackets.
    [[nodiscard]] std::string describe() const;
};

/// @brief An ordered template one statement form must align with.
struct GrammarRule
{
    std::string statementType;
    std::string description;
    std::vector<GrammarElement> pattern;
    std::vector<std::string> examples;

    /// @brief Uppercase keyword the statement starts with.
    [[nodiscard]] const std::string &leadingKeyword() const
    {
        return pattern.front().value;
    }
};

/// @brief Every rule in declaration order.
[[nodiscard]] std::span<const GrammarRule> grammarRules();

/// @brief Rule named @p statementType, or nullptr.
[[nodiscard]] const GrammarRule *findGrammarRule(std::string_view statementType);

/// @brief Rules whose leading keyword equals the first word of @p statementText.
/// @param statementText Uppercased significant token values joined by single spaces.
/// @return Matching rules in declaration order.
[[nodiscard]] std::vector<const GrammarRule *> findMatchingGrammarRules(
    std::string_view statementText);

/// @brief Sorted, de-duplicated leading keywords of all rules.
[[nodiscard]] std::vector<std::string> statementStarters();

/// @brief Concrete grammar type of @p token, or nullopt for tokens the grammar
///        never accepts (whitespace, comments, unknown characters).
[[nodiscard]] std::optional<GrammarType> mapTokenType(const Token &token);

/// @brief True if @p token satisfies @p element's type, value, and choices.
[[nodiscard]] bool matchesElement(const Token &token, const GrammarElement &element);

} // namespace syndrql::lang
