//===----------------------------------------------------------------------===//
//
// Part of the SyndrQL project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/syndrql/lang/keywords.hpp
// Purpose: Static keyword, operator, and punctuation tables for SyndrQL.
//
// Keywords are stored uppercase in a sorted compile-time table; lookup
// uppercases the candidate first, so matching is case-insensitive.
//
//===----------------------------------------------------------------------===//
#pragma once

#include <span>
#include <string_view>

namespace syndrql::lang
{

/// @brief Functional group a keyword belongs to.
enum class KeywordCategory
{
    DDL,
    DQL,
    DML,
    Objects,
    Logical,
    Functions,
    Types,
    Admin,
    Literals,
};

/// @brief Name of @p category as shown in hover text ("DDL", "Functions", ...).
[[nodiscard]] std::string_view keywordCategoryName(KeywordCategory category) noexcept;

/// @brief Canonical keyword entry.
struct KeywordInfo
{
    std::string_view lexeme; ///< Uppercase canonical spelling.
    KeywordCategory category;
    std::string_view description;
};

/// @brief Look up @p word case-insensitively.
/// @return Pointer into the static table, or nullptr if @p word is not a keyword.
[[nodiscard]] const KeywordInfo *lookupKeyword(std::string_view word);

/// @brief True if @p word is a keyword (case-insensitive).
[[nodiscard]] inline bool isKeyword(std::string_view word)
{
    return lookupKeyword(word) != nullptr;
}

/// @brief All keywords in lexeme order.
[[nodiscard]] std::span<const KeywordInfo> allKeywords() noexcept;

/// @brief True if @p op is a SyndrQL operator (`=`, `!=`, `<>`, `||`, ...).
[[nodiscard]] bool isOperator(std::string_view op) noexcept;

/// @brief True if @p c is a punctuation character.
[[nodiscard]] bool isPunctuation(char c) noexcept;

} // namespace syndrql::lang
