//===----------------------------------------------------------------------===//
//
// Part of the SyndrQL project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/lang/statement_parser.cpp
// Purpose: Statement segmentation and copy-on-write statement list updates.
// Key invariants: A quote that never closes keeps the scanner in string
//                 state until end of input.
// Links: include/syndrql/lang/statement_parser.hpp
//
//===----------------------------------------------------------------------===//

#include "syndrql/lang/statement_parser.hpp"

#include "syndrql/lang/tokenizer.hpp"
#include "syndrql/support/char_utils.hpp"

#include <algorithm>
#include <utility>

namespace syndrql::lang
{

namespace
{

using support::char_utils::isWhitespace;

/// @brief Offsets at which each line of @p text begins.
std::vector<std::size_t> lineStarts(std::string_view text)
{
    std::vector<std::size_t> starts{0};
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        const char c = text[i];
        if (c == '\n' || (c == '\r' && (i + 1 >= text.size() || text[i + 1] != '\n')))
            starts.push_back(i + 1);
    }
    return starts;
}

struct LinePos
{
    std::size_t line;
    std::size_t column;
};

LinePos locate(const std::vector<std::size_t> &starts, std::size_t offset)
{
    const auto it = std::upper_bound(starts.begin(), starts.end(), offset);
    const std::size_t line = static_cast<std::size_t>(it - starts.begin()) - 1;
    return {line, offset - starts[line]};
}

struct Span
{
    std::size_t begin;
    std::size_t end;
};

/// @brief Raw statement spans; each ends just after its `;` or at end of text.
std::vector<Span> splitOnSemicolons(std::string_view text)
{
    enum class State
    {
        Code,
        String,
        LineComment,
        BlockComment,
    };

    std::vector<Span> spans;
    State state = State::Code;
    char quote = '\0';
    std::size_t segStart = 0;

    for (std::size_t i = 0; i < text.size(); ++i)
    {
        const char c = text[i];
        const char next = i + 1 < text.size() ? text[i + 1] : '\0';
        switch (state)
        {
            case State::Code:
                if (c == '"' || c == '\'')
                {
                    state = State::String;
                    quote = c;
                }
                else if ((c == '-' && next == '-') || (c == '/' && next == '/'))
                {
                    state = State::LineComment;
                    ++i;
                }
                else if (c == '/' && next == '*')
                {
                    state = State::BlockComment;
                    ++i;
                }
                else if (c == ';')
                {
                    spans.push_back({segStart, i + 1});
                    segStart = i + 1;
                }
                break;
            case State::String:
                if (c == '\\')
                    ++i;
                else if (c == quote)
                    state = State::Code;
                break;
            case State::LineComment:
                if (c == '\n' || c == '\r')
                    state = State::Code;
                break;
            case State::BlockComment:
                if (c == '*' && next == '/')
                {
                    state = State::Code;
                    ++i;
                }
                break;
        }
    }
    if (segStart < text.size())
        spans.push_back({segStart, text.size()});
    return spans;
}

StatementList replaceEntry(const StatementList &statements,
                           const StatementPtr &target,
                           const CodeStatement &replacement)
{
    StatementList out;
    out.reserve(statements.size());
    for (const auto &stmt : statements)
    {
        if (stmt == target)
            out.push_back(std::make_shared<const CodeStatement>(replacement));
        else
            out.push_back(stmt);
    }
    return out;
}

} // namespace

CodeStatement StatementParser::makeStatement(std::string_view code,
                                             std::size_t startOffset,
                                             std::size_t line,
                                             std::size_t column) const
{
    CodeStatement stmt;
    stmt.code = std::string(code);
    stmt.startOffset = startOffset;
    stmt.endOffset = startOffset + code.size();
    stmt.lineStart = line;
    stmt.columnStart = column;

    stmt.tokens = tokenize(code);
    for (auto &tok : stmt.tokens)
    {
        if (tok.line == 0)
            tok.column += column;
        tok.line += line;
        tok.startPosition += startOffset;
        tok.endPosition += startOffset;
    }

    const auto starts = lineStarts(code);
    const LinePos last = locate(starts, code.empty() ? 0 : code.size() - 1);
    stmt.lineEnd = line + last.line;
    stmt.columnEnd = (last.line == 0 ? column : 0) + last.column + (code.empty() ? 0 : 1);
    return stmt;
}

StatementList StatementParser::parseStatements(std::string_view text) const
{
    StatementList statements;
    const auto starts = lineStarts(text);

    for (const Span &span : splitOnSemicolons(text))
    {
        std::size_t begin = span.begin;
        std::size_t end = span.end;
        while (begin < end && isWhitespace(text[begin]))
            ++begin;
        while (end > begin && isWhitespace(text[end - 1]))
            --end;
        if (begin == end)
            continue;

        const LinePos pos = locate(starts, begin);
        statements.push_back(std::make_shared<const CodeStatement>(
            makeStatement(text.substr(begin, end - begin), begin, pos.line, pos.column)));
    }
    return statements;
}

StatementPtr StatementParser::findStatementAtLine(const StatementList &statements,
                                                  std::size_t line)
{
    for (const auto &stmt : statements)
    {
        if (line >= stmt->lineStart && line <= stmt->lineEnd)
            return stmt;
    }
    return nullptr;
}

StatementPtr StatementParser::findStatementAtPosition(const StatementList &statements,
                                                      std::size_t line,
                                                      std::size_t column)
{
    StatementPtr firstOnLine;
    for (const auto &stmt : statements)
    {
        if (line < stmt->lineStart || line > stmt->lineEnd)
            continue;
        if (!firstOnLine)
            firstOnLine = stmt;
        const bool afterStart = line > stmt->lineStart || column >= stmt->columnStart;
        const bool beforeEnd = line < stmt->lineEnd || column <= stmt->columnEnd;
        if (afterStart && beforeEnd)
            return stmt;
    }
    return firstOnLine;
}

StatementList StatementParser::markStatementDirty(const StatementList &statements,
                                                  const StatementPtr &target)
{
    if (!target)
        return statements;
    CodeStatement updated = *target;
    updated.isDirty = true;
    return replaceEntry(statements, target, updated);
}

StatementList StatementParser::markStatementClean(const StatementList &statements,
                                                  const StatementPtr &target,
                                                  bool isValid)
{
    if (!target)
        return statements;
    CodeStatement updated = *target;
    updated.isDirty = false;
    updated.isValid = isValid;
    return replaceEntry(statements, target, updated);
}

StatementList StatementParser::updateStatementCode(const StatementList &statements,
                                                   const StatementPtr &target,
                                                   std::string_view newCode) const
{
    if (!target)
        return statements;
    CodeStatement updated =
        makeStatement(newCode, target->startOffset, target->lineStart, target->columnStart);
    updated.isValid = target->isValid;
    updated.isDirty = true;
    return replaceEntry(statements, target, updated);
}

} // namespace syndrql::lang
