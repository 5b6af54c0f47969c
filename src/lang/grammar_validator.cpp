//===----------------------------------------------------------------------===//
//
// Part of the SyndrQL project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/lang/grammar_validator.cpp
// Purpose: Lockstep alignment of significant tokens against rule patterns.
// Key invariants: Alignment never backtracks; each loop step advances the
//                 token cursor, the pattern cursor, or both.
// Links: include/syndrql/lang/grammar_validator.hpp
//
//===----------------------------------------------------------------------===//

#include "syndrql/lang/grammar_validator.hpp"

#include "syndrql/support/char_utils.hpp"
#include "syndrql/support/log.hpp"

#include <string>

namespace syndrql::lang
{

namespace
{

constexpr std::string_view kComponent = "grammar";

std::vector<std::string> expectedAt(const GrammarRule &rule, std::size_t patternIndex)
{
    if (patternIndex >= rule.pattern.size())
        return {};
    const GrammarElement &element = rule.pattern[patternIndex];
    if (element.value.empty() && !element.choices.empty())
        return element.choices;
    return {element.describe()};
}

void appendCompletions(const GrammarRule &rule,
                       std::size_t patternIndex,
                       std::vector<std::string> &out)
{
    // Optional elements also expose what may follow them.
    while (patternIndex < rule.pattern.size())
    {
        const GrammarElement &element = rule.pattern[patternIndex];
        if (!element.value.empty())
            out.push_back(element.value);
        else
            out.insert(out.end(), element.choices.begin(), element.choices.end());
        if (!element.optional)
            break;
        ++patternIndex;
    }
}

} // namespace

std::string_view incompleteKindName(IncompleteKind kind) noexcept
{
    switch (kind)
    {
        case IncompleteKind::Incomplete:
            return "incomplete";
        case IncompleteKind::MissingCritical:
            return "missing_critical";
        case IncompleteKind::InvalidSequence:
            return "invalid_sequence";
    }
    return "invalid_sequence";
}

GrammarValidationResult GrammarValidator::validate(const std::vector<Token> &tokens) const
{
    std::vector<std::size_t> significant;
    std::string statementText;
    for (std::size_t i = 0; i < tokens.size(); ++i)
    {
        if (!tokens[i].isSignificant())
            continue;
        significant.push_back(i);
        if (!statementText.empty())
            statementText += ' ';
        statementText += support::char_utils::toUppercase(tokens[i].value);
    }

    if (significant.empty())
        return {};

    if (log_)
        log_->debug(kComponent, "statement text: " + statementText);

    const auto candidates = findMatchingGrammarRules(statementText);
    if (candidates.empty())
    {
        GrammarValidationResult result;
        result.isValid = false;
        for (std::size_t idx : significant)
        {
            result.invalidTokens.insert(idx);
            result.invalidLines.insert(tokens[idx].line);
        }
        result.errorMessage = "No matching grammar rule found for statement";
        result.completionSuggestions = statementStarters();
        result.expectedTokens = result.completionSuggestions;
        result.incompleteStatements.push_back(IncompleteStatement{
            tokens[significant.front()].line,
            {"Valid statement starter"},
            IncompleteKind::InvalidSequence,
        });
        if (log_)
            log_->debug(kComponent, "no candidate rules");
        return result;
    }

    for (const GrammarRule *rule : candidates)
    {
        GrammarValidationResult result = validateAgainstRule(tokens, significant, *rule);
        if (log_)
        {
            log_->debug(kComponent,
                        "rule " + rule->statementType + (result.isValid ? " matched" : " rejected"));
        }
        if (result.isValid)
        {
            result.matchedRule = rule;
            return result;
        }
    }

    return validateAgainstRule(tokens, significant, *candidates.front());
}

GrammarValidationResult GrammarValidator::validateAgainstRule(
    const std::vector<Token> &tokens,
    const std::vector<std::size_t> &significant,
    const GrammarRule &rule) const
{
    GrammarValidationResult result;
    std::vector<std::string> missingCritical;
    std::vector<std::string> missingRequired;

    std::size_t tokenIndex = 0;
    std::size_t patternIndex = 0;
    const auto &pattern = rule.pattern;

    while (tokenIndex < significant.size() && patternIndex < pattern.size())
    {
        const Token &token = tokens[significant[tokenIndex]];
        const GrammarElement &element = pattern[patternIndex];

        if (matchesElement(token, element))
        {
            ++tokenIndex;
            if (element.repeatable && tokenIndex < significant.size() &&
                matchesElement(tokens[significant[tokenIndex]], element))
            {
                continue;
            }
            ++patternIndex;
        }
        else if (element.optional)
        {
            ++patternIndex;
        }
        else
        {
            result.invalidTokens.insert(significant[tokenIndex]);
            result.invalidLines.insert(token.line);
            missingCritical.push_back(element.describe());
            ++tokenIndex;
            ++patternIndex;
        }
    }

    // Trailing tokens beyond the pattern.
    for (; tokenIndex < significant.size(); ++tokenIndex)
    {
        result.invalidTokens.insert(significant[tokenIndex]);
        result.invalidLines.insert(tokens[significant[tokenIndex]].line);
    }

    result.expectedTokens = expectedAt(rule, patternIndex);
    appendCompletions(rule, patternIndex, result.completionSuggestions);

    for (; patternIndex < pattern.size(); ++patternIndex)
    {
        if (!pattern[patternIndex].optional)
            missingRequired.push_back(pattern[patternIndex].describe());
    }

    result.isValid = result.invalidTokens.empty() && missingCritical.empty() &&
                     missingRequired.empty();
    if (result.isValid)
        return result;

    for (std::size_t idx : significant)
        result.invalidLines.insert(tokens[idx].line);

    IncompleteKind kind = IncompleteKind::InvalidSequence;
    if (!missingRequired.empty())
        kind = IncompleteKind::Incomplete;
    else if (!missingCritical.empty())
        kind = IncompleteKind::MissingCritical;

    std::vector<std::string> missing = missingCritical;
    missing.insert(missing.end(), missingRequired.begin(), missingRequired.end());
    for (std::size_t line : result.invalidLines)
        result.incompleteStatements.push_back(IncompleteStatement{line, missing, kind});

    result.errorMessage = "Statement doesn't match " + rule.statementType + " pattern";
    return result;
}

bool GrammarValidator::isTokenValid(const Token &token, const std::vector<Token> &context) const
{
    std::vector<Token> extended = context;
    extended.push_back(token);
    const auto result = validate(extended);
    return result.invalidTokens.count(context.size()) == 0;
}

std::vector<std::string> GrammarValidator::getCompletionSuggestionsForStatement(
    const std::vector<Token> &tokens) const
{
    return validate(tokens).completionSuggestions;
}

std::vector<std::string> GrammarValidator::getSupportedStatements() const
{
    std::vector<std::string> out;
    for (const auto &rule : grammarRules())
        out.push_back(rule.statementType);
    return out;
}

const GrammarRule *GrammarValidator::getGrammarRule(std::string_view statementType) const
{
    return findGrammarRule(statementType);
}

std::span<const GrammarRule> GrammarValidator::getAllGrammarRules() const
{
    return grammarRules();
}

} // namespace syndrql::lang
