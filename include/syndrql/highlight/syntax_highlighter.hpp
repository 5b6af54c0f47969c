// include/syndrql/highlight/syntax_highlighter.hpp
// @brief Orchestrates tokenization, statement tracking, debounced grammar
//        validation and per-line styling for one SyndrQL document.
// @invariant At most one validation is pending per statement; a statement is
//            validated at most once per quiet period after its last edit.
// @invariant Token and result caches are keyed by exact source text and
//            bounded by the configured CachePolicy.
// @ownership Owns its caches, timer queue and statement list. The optional
//            log sink is borrowed and must outlive the highlighter.
#pragma once

#include "syndrql/highlight/lru_cache.hpp"
#include "syndrql/highlight/theme.hpp"
#include "syndrql/highlight/timer_queue.hpp"
#include "syndrql/lang/error_analyzer.hpp"
#include "syndrql/lang/grammar_validator.hpp"
#include "syndrql/lang/statement_parser.hpp"
#include "syndrql/lang/token.hpp"
#include "syndrql/lang/tokenizer.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace syndrql::support
{
class LogSink;
} // namespace syndrql::support

namespace syndrql::highlight
{

/// @brief Tunables for a highlighter instance.
struct HighlighterOptions
{
    Millis debounce{200};
    CachePolicy cache{};
    Theme theme{};
};

/// @brief Styled run of one token on one line.
struct StyledSpan
{
    std::size_t column = 0;
    std::size_t length = 0;
    ColorCategory category = ColorCategory::Plain;
    RGBA color{};
    bool error = false; ///< Draw an error underline beneath the run.
};

class SyntaxHighlighter
{
  public:
    using ValidationCallback =
        std::function<void(const std::string &code, const std::vector<lang::Token> &tokens)>;

    explicit SyntaxHighlighter(HighlighterOptions options = {},
                               Clock clock = steadyClock(),
                               support::LogSink *log = nullptr);

    SyntaxHighlighter(const SyntaxHighlighter &) = delete;
    SyntaxHighlighter &operator=(const SyntaxHighlighter &) = delete;

    /// @brief Tokens for @p code, served from the token cache when possible.
    [[nodiscard]] std::vector<lang::Token> tokenize(const std::string &code);

    /// @brief Re-segment @p fullText into statements.
    /// Statements whose text already has a cached validation result come back
    /// clean with that result's validity; all others start dirty.
    void updateDocumentContext(std::string_view fullText);

    /// @brief Keystroke hook: mark the statement under the cursor dirty and
    ///        restart its validation debounce.
    void notifyEdit(std::size_t line, std::size_t column);

    /// @brief Mark every statement stale and forget their validation results.
    void markDirty();

    /// @brief Drop all cached tokens and validation results.
    void clearCache();

    void setGrammarValidationCallback(ValidationCallback callback);

    /// @brief Validate every dirty statement immediately.
    void validateAll();

    [[nodiscard]] const lang::StatementList &statements() const
    {
        return statements_;
    }

    /// @brief Cached validation result for statement text @p code.
    [[nodiscard]] std::optional<lang::GrammarValidationResult> getGrammarValidationResult(
        const std::string &code);

    /// @brief Diagnostics for @p stmt in document coordinates; empty until
    ///        the statement has been validated.
    [[nodiscard]] std::vector<lang::ErrorDetail> diagnostics(const lang::CodeStatement &stmt);

    /// @brief Diagnostics for every validated statement, in document order.
    [[nodiscard]] std::vector<lang::ErrorDetail> diagnostics();

    /// @brief Styled runs for document line @p line, left to right.
    [[nodiscard]] std::vector<StyledSpan> lineSpans(std::size_t line);

    [[nodiscard]] std::size_t lineCount() const
    {
        return lineCount_;
    }

    /// @brief Number of grammar validations performed so far.
    [[nodiscard]] std::size_t validationPassCount() const
    {
        return passCount_;
    }

    void setTheme(const Theme &theme)
    {
        theme_ = theme;
    }

    [[nodiscard]] const Theme &theme() const
    {
        return theme_;
    }

    void setCachePolicy(CachePolicy policy);

    void setDebounce(Millis delay)
    {
        debouncer_.setDelay(delay);
    }

    /// @brief Timer queue the host loop drives through runDue().
    [[nodiscard]] TimerQueue &timers()
    {
        return timers_;
    }

    [[nodiscard]] const LruCache<std::vector<lang::Token>> &tokenCache() const
    {
        return tokenCache_;
    }

    [[nodiscard]] const LruCache<lang::GrammarValidationResult> &resultCache() const
    {
        return resultCache_;
    }

  private:
    void validateStatementAt(std::size_t line, std::size_t column);
    void validateStatement(const lang::StatementPtr &stmt);
    void logEvictions(std::string_view cache, std::size_t before, std::size_t after);

    support::LogSink *log_;
    lang::Tokenizer tokenizer_;
    lang::StatementParser parser_;
    lang::GrammarValidator validator_;
    lang::ErrorAnalyzer analyzer_;
    LruCache<std::vector<lang::Token>> tokenCache_;
    LruCache<lang::GrammarValidationResult> resultCache_;
    TimerQueue timers_;
    Debouncer debouncer_;
    Theme theme_;
    ValidationCallback callback_;

    std::string text_;
    std::vector<lang::Token> documentTokens_;
    std::size_t lineCount_ = 1;
    lang::StatementList statements_;
    std::size_t passCount_ = 0;
};

} // namespace syndrql::highlight
