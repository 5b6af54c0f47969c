//===----------------------------------------------------------------------===//
//
// Part of the SyndrQL project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/syndrql/lang/tokenizer.hpp
// Purpose: Lossless single-pass tokenizer for SyndrQL source text.
//
// Key Invariants:
//   - Total: every input string yields a token stream; malformed input
//     degrades to Unknown, unterminated String, or unterminated Comment tokens
//   - Lossless: concatenating token values reproduces the input exactly
//   - Positions are 0-based lines and byte columns; "\n", "\r\n", and a lone
//     "\r" each end a line
//
// Ownership/Lifetime: The tokenizer borrows the source view for the duration
// of one tokenize() call; produced tokens own copies of their text.
//
//===----------------------------------------------------------------------===//
#pragma once

#include "syndrql/lang/token.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

namespace syndrql::lang
{

/// @brief Converts SyndrQL text into a flat, position-annotated token stream.
class Tokenizer
{
  public:
    /// @brief Tokenize @p source from the beginning.
    /// @return Every token of @p source in order, including whitespace,
    ///         newline, and comment tokens.
    [[nodiscard]] std::vector<Token> tokenize(std::string_view source);

  private:
    [[nodiscard]] char peek(std::size_t offset = 0) const noexcept;
    [[nodiscard]] bool eof() const noexcept;
    void advance();
    void advanceBy(std::size_t count);

    void lexWhitespace();
    void lexNewline();
    void lexLineComment();
    void lexBlockComment();
    void lexString();
    void lexNumber();
    void lexWord();
    void lexPlaceholder();
    void lexOperatorOrPunctuation();
    void lexUnknown();

    /// @brief Emit a token covering [tokStart_, pos_) with @p type.
    void emit(TokenType type, const KeywordInfo *keyword = nullptr);

    std::string_view src_;
    std::size_t pos_ = 0;
    std::size_t line_ = 0;
    std::size_t column_ = 0;
    std::size_t tokStart_ = 0;
    std::size_t tokLine_ = 0;
    std::size_t tokColumn_ = 0;
    std::vector<Token> out_;
};

/// @brief Convenience wrapper around Tokenizer::tokenize.
[[nodiscard]] std::vector<Token> tokenize(std::string_view source);

} // namespace syndrql::lang
