// src/highlight/syntax_highlighter.cpp
// @brief Highlighter orchestration: caching, debounced validation, styling.
// @invariant statements_ always reflects the last updateDocumentContext()
//            text; validation callbacks never outlive the highlighter because
//            the timer queue is a member.
// @ownership Caches hold copies of tokens and results.

#include "syndrql/highlight/syntax_highlighter.hpp"

#include "syndrql/support/log.hpp"

#include <iterator>
#include <string>
#include <utility>

namespace syndrql::highlight
{

namespace
{
constexpr std::string_view kComponent = "highlight";

std::size_t weighTokens(const std::string &key, const std::vector<lang::Token> &tokens)
{
    std::size_t bytes = key.size() + tokens.size() * sizeof(lang::Token);
    for (const auto &tok : tokens)
        bytes += tok.value.size();
    return bytes;
}

std::size_t weighResult(const std::string &key, const lang::GrammarValidationResult &result)
{
    std::size_t bytes = key.size() + sizeof(result);
    bytes += (result.invalidTokens.size() + result.invalidLines.size()) * sizeof(std::size_t);
    for (const auto &s : result.expectedTokens)
        bytes += s.size();
    for (const auto &s : result.completionSuggestions)
        bytes += s.size();
    if (result.errorMessage)
        bytes += result.errorMessage->size();
    return bytes;
}

std::size_t countLines(std::string_view text)
{
    std::size_t lines = 1;
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == '\n')
            ++lines;
        else if (text[i] == '\r')
        {
            if (i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
            ++lines;
        }
    }
    return lines;
}

struct Piece
{
    std::size_t column;
    std::size_t length;
};

// Portion of @p tok lying on @p line; block comments may span several lines.
std::optional<Piece> pieceOnLine(const lang::Token &tok, std::size_t line)
{
    if (tok.line > line)
        return std::nullopt;
    std::size_t curLine = tok.line;
    std::size_t start = 0;
    const std::string &v = tok.value;
    for (std::size_t i = 0; i <= v.size(); ++i)
    {
        const bool atEnd = i == v.size();
        if (!atEnd && v[i] != '\n' && v[i] != '\r')
            continue;
        if (curLine == line)
        {
            const std::size_t column = curLine == tok.line ? tok.column : 0;
            return Piece{column, i - start};
        }
        if (atEnd)
            break;
        if (v[i] == '\r' && i + 1 < v.size() && v[i + 1] == '\n')
            ++i;
        ++curLine;
        start = i + 1;
    }
    return std::nullopt;
}
} // namespace

SyntaxHighlighter::SyntaxHighlighter(HighlighterOptions options,
                                     Clock clock,
                                     support::LogSink *log)
    : log_(log), validator_(log), tokenCache_(options.cache, weighTokens),
      resultCache_(options.cache, weighResult), timers_(std::move(clock)),
      debouncer_(timers_, options.debounce), theme_(options.theme)
{
}

std::vector<lang::Token> SyntaxHighlighter::tokenize(const std::string &code)
{
    if (const auto *cached = tokenCache_.get(code))
        return *cached;
    std::vector<lang::Token> tokens = tokenizer_.tokenize(code);
    const std::size_t before = tokenCache_.evictions();
    tokenCache_.put(code, tokens);
    logEvictions("token", before, tokenCache_.evictions());
    return tokens;
}

void SyntaxHighlighter::updateDocumentContext(std::string_view fullText)
{
    text_.assign(fullText);
    documentTokens_ = tokenize(text_);
    lineCount_ = countLines(text_);

    const lang::StatementList parsed = parser_.parseStatements(text_);
    lang::StatementList current = parsed;
    for (const auto &stmt : parsed)
    {
        if (!tokenCache_.contains(stmt->code))
            tokenCache_.put(stmt->code, tokenizer_.tokenize(stmt->code));
        if (const auto *result = resultCache_.get(stmt->code))
            current = lang::StatementParser::markStatementClean(current, stmt, result->isValid);
    }
    statements_ = std::move(current);

    if (log_)
        log_->debug(kComponent,
                    "document context: " + std::to_string(statements_.size()) + " statements, " +
                        std::to_string(lineCount_) + " lines");
}

void SyntaxHighlighter::notifyEdit(std::size_t line, std::size_t column)
{
    const lang::StatementPtr stmt =
        lang::StatementParser::findStatementAtPosition(statements_, line, column);
    if (!stmt)
        return;
    statements_ = lang::StatementParser::markStatementDirty(statements_, stmt);

    // One pending validation per statement, keyed by where it starts.
    debouncer_.trigger(std::to_string(stmt->startOffset),
                       [this, line, column] { validateStatementAt(line, column); });
}

void SyntaxHighlighter::markDirty()
{
    const lang::StatementList snapshot = statements_;
    for (const auto &stmt : snapshot)
    {
        resultCache_.erase(stmt->code);
        statements_ = lang::StatementParser::markStatementDirty(statements_, stmt);
    }
}

void SyntaxHighlighter::clearCache()
{
    tokenCache_.clear();
    resultCache_.clear();
    if (log_)
        log_->debug(kComponent, "caches cleared");
}

void SyntaxHighlighter::setGrammarValidationCallback(ValidationCallback callback)
{
    callback_ = std::move(callback);
}

void SyntaxHighlighter::validateAll()
{
    debouncer_.cancelAll();
    const lang::StatementList snapshot = statements_;
    for (const auto &stmt : snapshot)
    {
        if (stmt->isDirty)
            validateStatement(stmt);
    }
}

void SyntaxHighlighter::validateStatementAt(std::size_t line, std::size_t column)
{
    const lang::StatementPtr stmt =
        lang::StatementParser::findStatementAtPosition(statements_, line, column);
    if (!stmt || !stmt->isDirty)
        return;
    validateStatement(stmt);
}

void SyntaxHighlighter::validateStatement(const lang::StatementPtr &stmt)
{
    const std::vector<lang::Token> tokens = tokenize(stmt->code);
    lang::GrammarValidationResult result = validator_.validate(tokens);
    const bool valid = result.isValid;

    const std::size_t before = resultCache_.evictions();
    resultCache_.put(stmt->code, std::move(result));
    logEvictions("result", before, resultCache_.evictions());

    statements_ = lang::StatementParser::markStatementClean(statements_, stmt, valid);
    ++passCount_;

    if (log_)
        log_->debug(kComponent,
                    "validated statement at line " + std::to_string(stmt->lineStart) + ": " +
                        (valid ? "valid" : "invalid"));
    if (callback_)
        callback_(stmt->code, tokens);
}

std::optional<lang::GrammarValidationResult> SyntaxHighlighter::getGrammarValidationResult(
    const std::string &code)
{
    if (const auto *result = resultCache_.get(code))
        return *result;
    return std::nullopt;
}

std::vector<lang::ErrorDetail> SyntaxHighlighter::diagnostics(const lang::CodeStatement &stmt)
{
    const auto result = getGrammarValidationResult(stmt.code);
    if (!result)
        return {};
    std::vector<lang::ErrorDetail> details =
        analyzer_.analyze(tokenize(stmt.code), *result, stmt.lineStart);
    // Statement-relative columns only need shifting on the first line.
    for (auto &detail : details)
    {
        if (detail.line == stmt.lineStart)
            detail.column += stmt.columnStart;
    }
    return details;
}

std::vector<lang::ErrorDetail> SyntaxHighlighter::diagnostics()
{
    std::vector<lang::ErrorDetail> all;
    for (const auto &stmt : statements_)
    {
        auto details = diagnostics(*stmt);
        all.insert(all.end(),
                   std::make_move_iterator(details.begin()),
                   std::make_move_iterator(details.end()));
    }
    return all;
}

std::vector<StyledSpan> SyntaxHighlighter::lineSpans(std::size_t line)
{
    std::vector<StyledSpan> spans;
    if (line >= lineCount_)
        return spans;

    // Byte ranges of failed statements flagged on this line.
    std::vector<std::pair<std::size_t, std::size_t>> invalidRanges;
    for (const auto &stmt : statements_)
    {
        if (line < stmt->lineStart || line > stmt->lineEnd || stmt->isDirty || stmt->isValid)
            continue;
        const auto *result = resultCache_.get(stmt->code);
        if (result && result->invalidLines.count(line - stmt->lineStart) != 0)
            invalidRanges.emplace_back(stmt->startOffset, stmt->endOffset);
    }
    const auto inInvalidStatement = [&invalidRanges](std::size_t offset)
    {
        for (const auto &[begin, end] : invalidRanges)
        {
            if (offset >= begin && offset < end)
                return true;
        }
        return false;
    };

    for (const auto &tok : documentTokens_)
    {
        if (tok.line > line)
            break;
        if (tok.type == lang::TokenType::Whitespace || tok.type == lang::TokenType::Newline)
            continue;
        const auto piece = pieceOnLine(tok, line);
        if (!piece || piece->length == 0)
            continue;
        StyledSpan span;
        span.column = piece->column;
        span.length = piece->length;
        span.category = categoryFor(tok.type);
        span.color = theme_.color(span.category);
        span.error = tok.type == lang::TokenType::Unknown ||
                     (tok.isSignificant() && inInvalidStatement(tok.startPosition));
        spans.push_back(span);
    }
    return spans;
}

void SyntaxHighlighter::setCachePolicy(CachePolicy policy)
{
    const std::size_t tokensBefore = tokenCache_.evictions();
    const std::size_t resultsBefore = resultCache_.evictions();
    tokenCache_.setPolicy(policy);
    resultCache_.setPolicy(policy);
    logEvictions("token", tokensBefore, tokenCache_.evictions());
    logEvictions("result", resultsBefore, resultCache_.evictions());
}

void SyntaxHighlighter::logEvictions(std::string_view cache, std::size_t before, std::size_t after)
{
    if (!log_ || after == before)
        return;
    log_->debug(kComponent,
                std::string(cache) + " cache evicted " + std::to_string(after - before) +
                    " entries");
}

} // namespace syndrql::highlight
