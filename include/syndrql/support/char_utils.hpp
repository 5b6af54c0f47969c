//===----------------------------------------------------------------------===//
//
// Part of the SyndrQL project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/syndrql/support/char_utils.hpp
// Purpose: Character classification helpers shared by the tokenizer and the
//          statement segmenter.
//
// All helpers operate on single bytes. Non-ASCII bytes are never letters,
// digits, or whitespace; the tokenizer groups them via utf8SequenceLength.
//
//===----------------------------------------------------------------------===//
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace syndrql::support::char_utils
{

/// @brief Check if character is an ASCII letter (A-Z, a-z).
[[nodiscard]] constexpr bool isLetter(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

/// @brief Check if character is a decimal digit (0-9).
[[nodiscard]] constexpr bool isDigit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

/// @brief Check if character can start an identifier (letter or underscore).
[[nodiscard]] constexpr bool isIdentifierStart(char c) noexcept
{
    return isLetter(c) || c == '_';
}

/// @brief Check if character can continue an identifier (letter, digit, or underscore).
[[nodiscard]] constexpr bool isIdentifierContinue(char c) noexcept
{
    return isLetter(c) || isDigit(c) || c == '_';
}

/// @brief Check if character is horizontal whitespace (space or tab).
[[nodiscard]] constexpr bool isHorizontalWhitespace(char c) noexcept
{
    return c == ' ' || c == '\t';
}

/// @brief Check if character is any ASCII whitespace, including line breaks.
[[nodiscard]] constexpr bool isWhitespace(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

/// @brief Convert an ASCII letter to uppercase; other bytes pass through.
[[nodiscard]] constexpr char toUpper(char c) noexcept
{
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

/// @brief Return an uppercased copy of @p s (ASCII only).
[[nodiscard]] inline std::string toUppercase(std::string_view s)
{
    std::string out(s);
    for (char &c : out)
        c = toUpper(c);
    return out;
}

/// @brief Case-insensitive ASCII equality.
[[nodiscard]] constexpr bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (toUpper(a[i]) != toUpper(b[i]))
            return false;
    }
    return true;
}

/// @brief Length in bytes of the UTF-8 sequence introduced by lead byte @p c.
/// @return 1 for ASCII and for stray continuation bytes.
[[nodiscard]] constexpr std::size_t utf8SequenceLength(char c) noexcept
{
    const auto b = static_cast<unsigned char>(c);
    if (b >= 0xF0 && b <= 0xF7)
        return 4;
    if (b >= 0xE0)
        return b <= 0xEF ? 3 : 1;
    if (b >= 0xC0)
        return 2;
    return 1;
}

} // namespace syndrql::support::char_utils
