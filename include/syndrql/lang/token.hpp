//===----------------------------------------------------------------------===//
//
// Part of the SyndrQL project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/syndrql/lang/token.hpp
// Purpose: Token model produced by the SyndrQL tokenizer.
// Key invariants: Concatenating the values of a token stream in order
//                 reproduces the source text exactly.
//                 line/column are 0-based; startPosition/endPosition are
//                 absolute byte offsets forming a half-open range.
// Ownership/Lifetime: Tokens own their text. The keyword pointer refers to the
//                     static keyword table and never dangles.
//
//===----------------------------------------------------------------------===//
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace syndrql::lang
{

struct KeywordInfo;

/// @brief Lexical classification of a token.
enum class TokenType
{
    Keyword,
    Identifier,
    Literal,
    Operator,
    Punctuation,
    Whitespace,
    Newline,
    Comment,
    String,
    Number,
    Placeholder,
    Unknown,
};

/// @brief Lowercase name of @p type ("keyword", "identifier", ...).
[[nodiscard]] std::string_view tokenTypeName(TokenType type) noexcept;

/// @brief One lexical unit with its source location.
struct Token
{
    TokenType type = TokenType::Unknown;
    std::string value;
    std::size_t startPosition = 0; ///< Offset of the first byte.
    std::size_t endPosition = 0;   ///< Offset one past the last byte.
    std::size_t line = 0;
    std::size_t column = 0;
    const KeywordInfo *keyword = nullptr; ///< Set for Keyword tokens only.

    /// @brief True for tokens the grammar reasons about (not whitespace,
    ///        newline, or comment).
    [[nodiscard]] bool isSignificant() const noexcept
    {
        return type != TokenType::Whitespace && type != TokenType::Newline &&
               type != TokenType::Comment;
    }

    friend bool operator==(const Token &, const Token &) = default;
};

/// @brief Copy of @p tokens with whitespace, newline, and comment tokens removed.
[[nodiscard]] std::vector<Token> significantTokens(const std::vector<Token> &tokens);

} // namespace syndrql::lang
