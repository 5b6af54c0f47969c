//===----------------------------------------------------------------------===//
//
// Part of the SyndrQL project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/syndrql/lang/statement_parser.hpp
// Purpose: Split documents into semicolon-terminated statements and track
//          per-statement dirty/valid flags.
//
// Key Invariants:
//   - Only a `;` outside strings and comments ends a statement; brace depth
//     is not tracked
//   - Statements never overlap and appear in document order
//   - A trailing statement without `;` is kept; whitespace-only spans are not
//   - Statement tokens carry document-absolute lines, columns, and offsets
//
// Ownership/Lifetime: Statement lists hold shared immutable entries. Every
// update returns a new list; untouched entries keep their identity, so
// callers may compare entries by pointer.
//
//===----------------------------------------------------------------------===//
#pragma once

#include "syndrql/lang/token.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace syndrql::lang
{

/// @brief One statement-sized span of a document.
struct CodeStatement
{
    std::string code;          ///< Text from first non-blank character to `;` (inclusive).
    std::size_t lineStart = 0; ///< Line of the first character of code.
    std::size_t lineEnd = 0;   ///< Line of the last character of code.
    std::size_t columnStart = 0;
    std::size_t columnEnd = 0; ///< Column one past the last character on lineEnd.
    std::size_t startOffset = 0;
    std::size_t endOffset = 0; ///< Offset one past the last character of code.
    std::vector<Token> tokens; ///< Tokens of code in document coordinates.
    bool isDirty = true;
    bool isValid = false;
};

using StatementPtr = std::shared_ptr<const CodeStatement>;
using StatementList = std::vector<StatementPtr>;

/// @brief Segments documents and performs copy-on-write status updates.
class StatementParser
{
  public:
    /// @brief Split @p text into statements; every new statement is dirty and invalid.
    [[nodiscard]] StatementList parseStatements(std::string_view text) const;

    /// @brief First statement whose line range contains @p line, or nullptr.
    [[nodiscard]] static StatementPtr findStatementAtLine(const StatementList &statements,
                                                          std::size_t line);

    /// @brief Statement containing the cursor at (@p line, @p column), or nullptr.
    /// @details A cursor directly after a statement's last character belongs to
    ///          it. When several statements share the line and none contains
    ///          the column, the first of them is returned.
    [[nodiscard]] static StatementPtr findStatementAtPosition(const StatementList &statements,
                                                              std::size_t line,
                                                              std::size_t column);

    /// @brief Copy of @p statements with @p target flagged dirty.
    [[nodiscard]] static StatementList markStatementDirty(const StatementList &statements,
                                                          const StatementPtr &target);

    /// @brief Copy of @p statements with @p target clean and its validity set.
    [[nodiscard]] static StatementList markStatementClean(const StatementList &statements,
                                                          const StatementPtr &target,
                                                          bool isValid);

    /// @brief Copy of @p statements with @p target's code replaced, re-tokenized,
    ///        and flagged dirty. The statement keeps its start position.
    [[nodiscard]] StatementList updateStatementCode(const StatementList &statements,
                                                    const StatementPtr &target,
                                                    std::string_view newCode) const;

  private:
    [[nodiscard]] CodeStatement makeStatement(std::string_view code,
                                              std::size_t startOffset,
                                              std::size_t line,
                                              std::size_t column) const;
};

} // namespace syndrql::lang
