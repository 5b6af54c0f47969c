//===----------------------------------------------------------------------===//
//
// Part of the SyndrQL project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/lang/error_analyzer.cpp
// Purpose: Statement-type specific structural checks and per-token
//          diagnostics for failed validations.
// Key invariants: analyzeGrammarErrors never returns an empty vector for a
//                 failed result.
// Links: include/syndrql/lang/error_analyzer.hpp, error_codes.hpp
//
//===----------------------------------------------------------------------===//

#include "syndrql/lang/error_analyzer.hpp"

#include "syndrql/lang/error_codes.hpp"
#include "syndrql/lang/keywords.hpp"
#include "syndrql/support/char_utils.hpp"

#include <algorithm>
#include <utility>

namespace syndrql::lang
{

using support::char_utils::equalsIgnoreCase;
using support::char_utils::isDigit;
using support::char_utils::toUppercase;

namespace
{

ErrorDetail makeError(std::string_view code,
                      std::string message,
                      const Token &anchor,
                      std::size_t lineOffset,
                      std::optional<std::string> suggestion)
{
    ErrorDetail e;
    e.code = std::string(code);
    e.message = std::move(message);
    e.line = anchor.line + lineOffset;
    e.column = anchor.column;
    e.length = std::max<std::size_t>(anchor.value.size(), 1);
    e.source = anchor.value;
    e.suggestion = std::move(suggestion);
    return e;
}

/// @brief Zero-width error placed just after @p anchor.
ErrorDetail makeErrorAfter(std::string_view code,
                           std::string message,
                           const Token &anchor,
                           std::size_t lineOffset,
                           std::string source,
                           std::optional<std::string> suggestion)
{
    ErrorDetail e = makeError(code, std::move(message), anchor, lineOffset, std::move(suggestion));
    e.column = anchor.column + anchor.value.size();
    e.length = 1;
    e.source = std::move(source);
    return e;
}

const Token *findWord(const std::vector<const Token *> &sig, std::string_view word)
{
    for (const Token *tok : sig)
    {
        if (equalsIgnoreCase(tok->value, word))
            return tok;
    }
    return nullptr;
}

bool wordAt(const std::vector<const Token *> &sig, std::size_t index, std::string_view word)
{
    return index < sig.size() && equalsIgnoreCase(sig[index]->value, word);
}

std::string joinUpper(const std::vector<const Token *> &sig)
{
    std::string out;
    for (const Token *tok : sig)
    {
        if (!out.empty())
            out += ' ';
        out += toUppercase(tok->value);
    }
    return out;
}

std::string joinList(const std::vector<std::string> &items, std::string_view sep)
{
    std::string out;
    for (const auto &item : items)
    {
        if (!out.empty())
            out += sep;
        out += item;
    }
    return out;
}

} // namespace

std::size_t editDistance(std::string_view a, std::string_view b)
{
    const std::size_t m = a.size();
    const std::size_t n = b.size();
    std::vector<std::size_t> prev(n + 1), cur(n + 1);
    for (std::size_t j = 0; j <= n; ++j)
        prev[j] = j;
    for (std::size_t i = 1; i <= m; ++i)
    {
        cur[0] = i;
        for (std::size_t j = 1; j <= n; ++j)
        {
            const std::size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, cur);
    }
    return prev[n];
}

std::optional<std::string> suggestKeyword(std::string_view word)
{
    if (word.size() < 3)
        return std::nullopt;
    const std::string upper = toUppercase(word);
    std::size_t best = 3;
    std::optional<std::string> match;
    for (const auto &kw : allKeywords())
    {
        const std::size_t d = editDistance(upper, kw.lexeme);
        if (d > 0 && d < best)
        {
            best = d;
            match = std::string(kw.lexeme);
        }
    }
    return match;
}

bool ErrorAnalyzer::isUnterminatedString(const Token &token)
{
    const std::string &v = token.value;
    if (v.size() < 2)
        return true;
    const char quote = v.front();
    if (quote != '"' && quote != '\'')
        return false;
    if (v.back() != quote)
        return true;
    // The closing quote must not itself be escaped.
    std::size_t backslashes = 0;
    for (std::size_t i = v.size() - 1; i > 1 && v[i - 1] == '\\'; --i)
        ++backslashes;
    return backslashes % 2 == 1;
}

bool ErrorAnalyzer::isInvalidNumber(const Token &token)
{
    const std::string &v = token.value;
    std::size_t i = 0;
    auto digits = [&]
    {
        const std::size_t start = i;
        while (i < v.size() && isDigit(v[i]))
            ++i;
        return i > start;
    };

    if (!digits())
        return true;
    if (i < v.size() && v[i] == '.')
    {
        ++i;
        if (!digits())
            return true;
    }
    if (i < v.size() && (v[i] == 'e' || v[i] == 'E'))
    {
        ++i;
        if (i < v.size() && (v[i] == '+' || v[i] == '-'))
            ++i;
        if (!digits())
            return true;
    }
    return i != v.size();
}

bool ErrorAnalyzer::isUnterminatedComment(const Token &token)
{
    const std::string &v = token.value;
    if (v.rfind("/*", 0) != 0)
        return false;
    return v.size() < 4 || v.compare(v.size() - 2, 2, "*/") != 0;
}

std::vector<ErrorDetail> ErrorAnalyzer::analyzeGrammarErrors(const std::vector<Token> &tokens,
                                                             const GrammarValidationResult &result,
                                                             std::size_t lineOffset) const
{
    std::vector<ErrorDetail> errors;
    if (result.isValid)
        return errors;

    std::vector<const Token *> sig;
    for (const auto &tok : tokens)
    {
        if (tok.isSignificant())
            sig.push_back(&tok);
    }

    if (sig.empty())
    {
        ErrorDetail e;
        e.code = std::string(diag::EmptyStatement);
        e.message = "Empty statement. Expected a SyndrQL command.";
        e.line = lineOffset;
        e.suggestion = "Add a valid SyndrQL statement (SELECT, ADD, UPDATE, DELETE, etc.)";
        errors.push_back(std::move(e));
        return errors;
    }

    analyzeStructure(sig, lineOffset, errors);

    const bool incomplete =
        std::any_of(result.incompleteStatements.begin(),
                    result.incompleteStatements.end(),
                    [](const IncompleteStatement &s)
                    { return s.errorType == IncompleteKind::Incomplete; });
    if (incomplete && !result.expectedTokens.empty())
    {
        const std::string expected = joinList(result.expectedTokens, " or ");
        errors.push_back(makeErrorAfter(diag::IncompleteStatement,
                                        "Statement is incomplete. Expected " + expected + ".",
                                        *sig.back(),
                                        lineOffset,
                                        joinUpper(sig),
                                        "Continue the statement with " + expected));
    }

    for (std::size_t idx : result.invalidTokens)
    {
        if (idx >= tokens.size())
            continue;
        const Token &tok = tokens[idx];
        std::optional<std::string> suggestion;
        if (tok.type == TokenType::Identifier || tok.type == TokenType::Unknown)
        {
            if (auto kw = suggestKeyword(tok.value))
                suggestion = "Did you mean " + *kw + "?";
        }
        if (!suggestion)
            suggestion = "Check spelling or refer to SyndrQL documentation";
        errors.push_back(makeError(diag::UnexpectedToken,
                                   "Unexpected token \"" + tok.value + "\".",
                                   tok,
                                   lineOffset,
                                   std::move(suggestion)));
    }

    if (errors.empty())
    {
        errors.push_back(makeError(diag::SyntaxError,
                                   "Syntax error in SyndrQL statement.",
                                   *sig.front(),
                                   lineOffset,
                                   "Check statement structure and syntax"));
    }
    return errors;
}

std::vector<ErrorDetail> ErrorAnalyzer::analyzeTokenErrors(const std::vector<Token> &tokens,
                                                           std::size_t lineOffset) const
{
    std::vector<ErrorDetail> errors;
    for (const auto &tok : tokens)
    {
        if (tok.type == TokenType::Unknown)
        {
            errors.push_back(makeError(diag::InvalidToken,
                                       "Invalid token \"" + tok.value +
                                           "\". Contains invalid characters or format.",
                                       tok,
                                       lineOffset,
                                       "Use only letters, numbers, and underscores for identifiers"));
        }
        else if (tok.type == TokenType::String && isUnterminatedString(tok))
        {
            errors.push_back(makeError(diag::UnterminatedString,
                                       "Unterminated string literal. Missing closing quote.",
                                       tok,
                                       lineOffset,
                                       "Add closing quote to complete the string"));
        }
        else if (tok.type == TokenType::Number && isInvalidNumber(tok))
        {
            errors.push_back(makeError(diag::InvalidNumberFormat,
                                       "Invalid number format \"" + tok.value + "\".",
                                       tok,
                                       lineOffset,
                                       "Use valid number format (e.g., 123, 123.45, 1.23e-4)"));
        }
        else if (tok.type == TokenType::Comment && isUnterminatedComment(tok))
        {
            ErrorDetail e = makeError(diag::UnterminatedComment,
                                      "Unterminated block comment. Missing closing */.",
                                      tok,
                                      lineOffset,
                                      "Add */ to close the comment");
            e.length = 2;
            errors.push_back(std::move(e));
        }
    }
    return errors;
}

std::vector<ErrorDetail> ErrorAnalyzer::analyze(const std::vector<Token> &tokens,
                                                const GrammarValidationResult &result,
                                                std::size_t lineOffset) const
{
    std::vector<ErrorDetail> errors = analyzeTokenErrors(tokens, lineOffset);
    std::vector<ErrorDetail> grammar = analyzeGrammarErrors(tokens, result, lineOffset);
    errors.insert(errors.end(),
                  std::make_move_iterator(grammar.begin()),
                  std::make_move_iterator(grammar.end()));
    return errors;
}

void ErrorAnalyzer::analyzeStructure(const std::vector<const Token *> &sig,
                                     std::size_t lineOffset,
                                     std::vector<ErrorDetail> &out) const
{
    const std::string first = toUppercase(sig.front()->value);
    if (first == "SELECT")
        analyzeSelect(sig, lineOffset, out);
    else if (first == "INSERT")
        analyzeInsert(sig, lineOffset, out);
    else if (first == "UPDATE")
        analyzeUpdate(sig, lineOffset, out);
    else if (first == "DELETE")
        analyzeDelete(sig, lineOffset, out);
    else if (first == "ADD")
        analyzeAdd(sig, lineOffset, out);
    else if (first == "CREATE")
        analyzeCreate(sig, lineOffset, out);
    else
    {
        const auto starters = statementStarters();
        if (std::find(starters.begin(), starters.end(), first) != starters.end())
            return;

        std::string suggestion = "Use " + joinList(starters, ", ");
        for (const auto &starter : starters)
        {
            if (editDistance(first, starter) <= 2)
            {
                suggestion = "Did you mean " + starter + "?";
                break;
            }
        }
        out.push_back(makeError(diag::UnrecognizedCommand,
                                "\"" + sig.front()->value + "\" is not a recognized SyndrQL command.",
                                *sig.front(),
                                lineOffset,
                                std::move(suggestion)));
    }
}

void ErrorAnalyzer::analyzeSelect(const std::vector<const Token *> &sig,
                                  std::size_t lineOffset,
                                  std::vector<ErrorDetail> &out) const
{
    for (const Token *tok : sig)
    {
        if (equalsIgnoreCase(tok->value, "ADD") || equalsIgnoreCase(tok->value, "SET"))
        {
            out.push_back(makeError(diag::SelectInvalidKeywordSequence,
                                    "\"" + tok->value +
                                        "\" is not valid in a SELECT statement. Expected "
                                        "DOCUMENTS, *, or field names.",
                                    *tok,
                                    lineOffset,
                                    "Try SELECT DOCUMENTS FROM bundle_name;"));
            break;
        }
    }

    if (sig.size() < 2)
    {
        out.push_back(makeErrorAfter(diag::SelectMissingTarget,
                                     "SELECT statement is incomplete. Expected DOCUMENTS, *, or "
                                     "field names.",
                                     *sig.front(),
                                     lineOffset,
                                     "SELECT",
                                     "Add DOCUMENTS or field names after SELECT"));
    }

    // SELECT DATABASES "name"; has no FROM clause.
    if (sig.size() > 2 && !findWord(sig, "FROM") && !wordAt(sig, 1, "DATABASES"))
    {
        out.push_back(makeErrorAfter(diag::SelectMissingFrom,
                                     "SELECT statement missing FROM clause.",
                                     *sig.back(),
                                     lineOffset,
                                     joinUpper(sig),
                                     "Add FROM bundle_name"));
    }
}

void ErrorAnalyzer::analyzeInsert(const std::vector<const Token *> &sig,
                                  std::size_t lineOffset,
                                  std::vector<ErrorDetail> &out) const
{
    if (!findWord(sig, "INTO"))
    {
        out.push_back(makeErrorAfter(diag::InsertMissingInto,
                                     "INSERT statement missing INTO clause.",
                                     *sig.front(),
                                     lineOffset,
                                     "INSERT",
                                     "Add INTO bundle_name, or use ADD DOCUMENT TO BUNDLE"));
    }
}

void ErrorAnalyzer::analyzeUpdate(const std::vector<const Token *> &sig,
                                  std::size_t lineOffset,
                                  std::vector<ErrorDetail> &out) const
{
    if (wordAt(sig, 1, "BUNDLE"))
        return;
    if (wordAt(sig, 1, "DOCUMENTS"))
    {
        if (!findWord(sig, "IN") || !findWord(sig, "BUNDLE"))
        {
            out.push_back(makeErrorAfter(diag::UpdateMissingBundle,
                                         "UPDATE DOCUMENTS statement missing IN BUNDLE clause.",
                                         *sig[1],
                                         lineOffset,
                                         "UPDATE DOCUMENTS",
                                         "Add IN BUNDLE bundle_name"));
        }
        return;
    }
    if (!findWord(sig, "SET"))
    {
        out.push_back(makeErrorAfter(diag::UpdateMissingSet,
                                     "UPDATE statement missing SET clause.",
                                     *sig.front(),
                                     lineOffset,
                                     "UPDATE",
                                     "Add SET field = value"));
    }
}

void ErrorAnalyzer::analyzeDelete(const std::vector<const Token *> &sig,
                                  std::size_t lineOffset,
                                  std::vector<ErrorDetail> &out) const
{
    if (wordAt(sig, 1, "DATABASE") || wordAt(sig, 1, "BUNDLE"))
        return;
    if (!findWord(sig, "FROM"))
    {
        out.push_back(makeErrorAfter(diag::DeleteMissingFrom,
                                     "DELETE statement missing FROM clause.",
                                     *sig.front(),
                                     lineOffset,
                                     "DELETE",
                                     "Add FROM BUNDLE bundle_name"));
    }
}

void ErrorAnalyzer::analyzeAdd(const std::vector<const Token *> &sig,
                               std::size_t lineOffset,
                               std::vector<ErrorDetail> &out) const
{
    if (!findWord(sig, "TO"))
    {
        out.push_back(makeErrorAfter(diag::AddMissingTo,
                                     "ADD statement missing TO clause.",
                                     *sig.back(),
                                     lineOffset,
                                     joinUpper(sig),
                                     "Use ADD DOCUMENT TO BUNDLE bundle_name WITH (...)"));
    }
}

void ErrorAnalyzer::analyzeCreate(const std::vector<const Token *> &sig,
                                  std::size_t lineOffset,
                                  std::vector<ErrorDetail> &out) const
{
    static constexpr std::string_view kObjects[] = {"DATABASE", "BUNDLE", "BTREE", "HASH"};
    if (sig.size() >= 2)
    {
        for (std::string_view object : kObjects)
        {
            if (equalsIgnoreCase(sig[1]->value, object))
                return;
        }
        out.push_back(makeError(diag::CreateMissingObject,
                                "\"" + sig[1]->value + "\" cannot be created.",
                                *sig[1],
                                lineOffset,
                                "Use CREATE DATABASE, CREATE BUNDLE, or CREATE BTREE/HASH INDEX"));
        return;
    }
    out.push_back(makeErrorAfter(diag::CreateMissingObject,
                                 "CREATE statement is incomplete. Expected DATABASE, BUNDLE, or "
                                 "an index type.",
                                 *sig.front(),
                                 lineOffset,
                                 "CREATE",
                                 "Add DATABASE, BUNDLE, BTREE INDEX, or HASH INDEX"));
}

} // namespace syndrql::lang
