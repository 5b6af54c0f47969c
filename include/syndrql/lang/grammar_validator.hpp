//===----------------------------------------------------------------------===//
//
// Part of the SyndrQL project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/syndrql/lang/grammar_validator.hpp
// Purpose: Align token streams against the grammar rule table and report
//          invalid tokens, missing elements, and completion hints.
//
// Key Invariants:
//   - validate() is a pure function of its input and the static rule table
//   - invalidTokens holds indices into the caller's token vector (including
//     whitespace and comment tokens), never into the filtered stream
//   - A result is valid iff no token is invalid and no required element is
//     missing
//
// Ownership/Lifetime: matchedRule points into the static rule table. The
// optional log sink is borrowed and must outlive the validator.
//
//===----------------------------------------------------------------------===//
#pragma once

#include "syndrql/lang/grammar.hpp"
#include "syndrql/lang/token.hpp"

#include <cstddef>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace syndrql::support
{
class LogSink;
} // namespace syndrql::support

namespace syndrql::lang
{

/// @brief Why a statement failed to align with its rule.
enum class IncompleteKind
{
    Incomplete,      ///< Tokens ran out before required elements.
    MissingCritical, ///< A required element was replaced by a wrong token.
    InvalidSequence, ///< No rule applies or only trailing tokens are wrong.
};

/// @brief Wire name of @p kind ("incomplete", "missing_critical", "invalid_sequence").
[[nodiscard]] std::string_view incompleteKindName(IncompleteKind kind) noexcept;

/// @brief Per-line record of what a failed statement is missing.
struct IncompleteStatement
{
    std::size_t lineNumber = 0;
    std::vector<std::string> missingElements;
    IncompleteKind errorType = IncompleteKind::Incomplete;

    friend bool operator==(const IncompleteStatement &, const IncompleteStatement &) = default;
};

/// @brief Outcome of aligning one statement with the rule table.
struct GrammarValidationResult
{
    bool isValid = true;
    std::set<std::size_t> invalidTokens;
    std::set<std::size_t> invalidLines;
    std::vector<std::string> expectedTokens;
    std::optional<std::string> errorMessage;
    const GrammarRule *matchedRule = nullptr;
    std::vector<std::string> completionSuggestions;
    std::vector<IncompleteStatement> incompleteStatements;

    friend bool operator==(const GrammarValidationResult &,
                           const GrammarValidationResult &) = default;
};

/// @brief Matches statements against the SyndrQL grammar rule table.
class GrammarValidator
{
  public:
    /// @brief Create a validator; @p log receives per-pass debug lines when set.
    explicit GrammarValidator(support::LogSink *log = nullptr) : log_(log) {}

    /// @brief Validate one statement's tokens.
    /// @param tokens Full token stream of the statement, trivia included.
    [[nodiscard]] GrammarValidationResult validate(const std::vector<Token> &tokens) const;

    /// @brief True if @p token is acceptable when appended to @p context.
    [[nodiscard]] bool isTokenValid(const Token &token, const std::vector<Token> &context) const;

    /// @brief Completion suggestions after the last token of @p tokens.
    [[nodiscard]] std::vector<std::string> getCompletionSuggestionsForStatement(
        const std::vector<Token> &tokens) const;

    /// @brief Statement type names of every rule, in table order.
    [[nodiscard]] std::vector<std::string> getSupportedStatements() const;

    /// @brief Rule for @p statementType, or nullptr.
    [[nodiscard]] const GrammarRule *getGrammarRule(std::string_view statementType) const;

    /// @brief The whole rule table, in declaration order.
    [[nodiscard]] std::span<const GrammarRule> getAllGrammarRules() const;

  private:
    [[nodiscard]] GrammarValidationResult validateAgainstRule(
        const std::vector<Token> &tokens,
        const std::vector<std::size_t> &significant,
        const GrammarRule &rule) const;

    support::LogSink *log_;
};

} // namespace syndrql::lang
