//===----------------------------------------------------------------------===//
//
// Part of the SyndrQL project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/syndrql/support/keyword_table.hpp
// Purpose: Compile-time keyword tables with binary-search lookup.
//
// Key Features:
//   - Sorted array of entries searched with std::lower_bound semantics
//   - constexpr verification of table sorting for static_assert
//   - Lookup returns a pointer into the static table so callers can keep a
//     stable reference to the canonical entry
//
//===----------------------------------------------------------------------===//
#pragma once

#include <array>
#include <cstddef>
#include <string_view>

namespace syndrql::support::keyword_table
{

/// @brief Check if a table of entries exposing `lexeme` is strictly sorted.
/// @details Used for static_assert validation of compile-time tables.
/// @tparam Entry Entry type with a `std::string_view lexeme` member.
/// @tparam N Size of the table.
/// @return True if the table is lexicographically sorted without duplicates.
template <typename Entry, std::size_t N>
[[nodiscard]] constexpr bool isKeywordTableSorted(const std::array<Entry, N> &table)
{
    for (std::size_t i = 1; i < N; ++i)
    {
        if (!(table[i - 1].lexeme < table[i].lexeme))
            return false;
    }
    return true;
}

/// @brief Binary search lookup in a sorted keyword table.
/// @param table The sorted keyword table.
/// @param lexeme The lexeme to look up; must already be normalized to the
///               table's case.
/// @return Pointer to the matching entry, or nullptr if absent.
template <typename Entry, std::size_t N>
[[nodiscard]] constexpr const Entry *lookupKeywordBinary(const std::array<Entry, N> &table,
                                                         std::string_view lexeme)
{
    std::size_t first = 0;
    std::size_t last = N;

    while (first < last)
    {
        const std::size_t mid = first + (last - first) / 2;
        if (table[mid].lexeme == lexeme)
            return &table[mid];
        if (table[mid].lexeme < lexeme)
            first = mid + 1;
        else
            last = mid;
    }

    return nullptr;
}

} // namespace syndrql::support::keyword_table
