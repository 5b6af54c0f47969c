//===----------------------------------------------------------------------===//
//
// Part of the SyndrQL project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/syndrql/lang/error_analyzer.hpp
// Purpose: Expand grammar validation failures and lexical anomalies into
//          user-facing diagnostics with stable codes and suggestions.
//
// Key Invariants:
//   - A valid result never produces grammar diagnostics
//   - A failed result always produces at least one diagnostic
//   - Every reported line is shifted by the caller's line offset
//
// Ownership/Lifetime: Stateless; diagnostics own their strings.
//
//===----------------------------------------------------------------------===//
#pragma once

#include "syndrql/lang/grammar_validator.hpp"
#include "syndrql/lang/token.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace syndrql::lang
{

/// @brief One user-facing diagnostic.
struct ErrorDetail
{
    std::string code;    ///< Stable Q#### code from error_codes.hpp.
    std::string message; ///< Human readable description.
    std::size_t line = 0;
    std::size_t column = 0;
    std::size_t length = 1;
    std::string source; ///< Offending source text.
    std::optional<std::string> suggestion;
};

/// @brief Levenshtein edit distance between @p a and @p b.
[[nodiscard]] std::size_t editDistance(std::string_view a, std::string_view b);

/// @brief Closest keyword to @p word within edit distance 2, if any.
[[nodiscard]] std::optional<std::string> suggestKeyword(std::string_view word);

/// @brief Maps validation results and tokens to ErrorDetail records.
class ErrorAnalyzer
{
  public:
    /// @brief Diagnostics for a grammar validation result.
    /// @param tokens Tokens that were validated, trivia included.
    /// @param result Result of GrammarValidator::validate on @p tokens.
    /// @param lineOffset Document line of the statement's first line.
    [[nodiscard]] std::vector<ErrorDetail> analyzeGrammarErrors(
        const std::vector<Token> &tokens,
        const GrammarValidationResult &result,
        std::size_t lineOffset = 0) const;

    /// @brief Diagnostics for lexical anomalies in @p tokens: unknown
    ///        characters, unterminated strings and block comments, and
    ///        malformed numbers.
    [[nodiscard]] std::vector<ErrorDetail> analyzeTokenErrors(const std::vector<Token> &tokens,
                                                              std::size_t lineOffset = 0) const;

    /// @brief Lexical diagnostics followed by grammar diagnostics.
    [[nodiscard]] std::vector<ErrorDetail> analyze(const std::vector<Token> &tokens,
                                                   const GrammarValidationResult &result,
                                                   std::size_t lineOffset = 0) const;

    /// @brief True if the String token @p token lacks its closing quote.
    [[nodiscard]] static bool isUnterminatedString(const Token &token);

    /// @brief True if the Number token @p token is not a well-formed number.
    [[nodiscard]] static bool isInvalidNumber(const Token &token);

    /// @brief True if the Comment token @p token opens a block never closed.
    [[nodiscard]] static bool isUnterminatedComment(const Token &token);

  private:
    void analyzeStructure(const std::vector<const Token *> &sig,
                          std::size_t lineOffset,
                          std::vector<ErrorDetail> &out) const;
    void analyzeSelect(const std::vector<const Token *> &sig,
                       std::size_t lineOffset,
                       std::vector<ErrorDetail> &out) const;
    void analyzeInsert(const std::vector<const Token *> &sig,
                       std::size_t lineOffset,
                       std::vector<ErrorDetail> &out) const;
    void analyzeUpdate(const std::vector<const Token *> &sig,
                       std::size_t lineOffset,
                       std::vector<ErrorDetail> &out) const;
    void analyzeDelete(const std::vector<const Token *> &sig,
                       std::size_t lineOffset,
                       std::vector<ErrorDetail> &out) const;
    void analyzeAdd(const std::vector<const Token *> &sig,
                    std::size_t lineOffset,
                    std::vector<ErrorDetail> &out) const;
    void analyzeCreate(const std::vector<const Token *> &sig,
                       std::size_t lineOffset,
                       std::vector<ErrorDetail> &out) const;
};

} // namespace syndrql::lang
