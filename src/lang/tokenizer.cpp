//===----------------------------------------------------------------------===//
//
// Part of the SyndrQL project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/lang/tokenizer.cpp
// Purpose: Implement the SyndrQL tokenizer.
// Key invariants: Every loop iteration in tokenize() consumes at least one
//                 byte, so scanning always terminates and never drops input.
// Links: include/syndrql/lang/tokenizer.hpp
//
//===----------------------------------------------------------------------===//

#include "syndrql/lang/tokenizer.hpp"

#include "syndrql/lang/keywords.hpp"
#include "syndrql/support/char_utils.hpp"

#include <utility>

namespace syndrql::lang
{

using namespace support::char_utils;

std::string_view tokenTypeName(TokenType type) noexcept
{
    switch (type)
    {
        case TokenType::Keyword:
            return "keyword";
        case TokenType::Identifier:
            return "identifier";
        case TokenType::Literal:
            return "literal";
        case TokenType::Operator:
            return "operator";
        case TokenType::Punctuation:
            return "punctuation";
        case TokenType::Whitespace:
            return "whitespace";
        case TokenType::Newline:
            return "newline";
        case TokenType::Comment:
            return "comment";
        case TokenType::String:
            return "string";
        case TokenType::Number:
            return "number";
        case TokenType::Placeholder:
            return "placeholder";
        case TokenType::Unknown:
            return "unknown";
    }
    return "unknown";
}

std::vector<Token> significantTokens(const std::vector<Token> &tokens)
{
    std::vector<Token> out;
    out.reserve(tokens.size());
    for (const auto &tok : tokens)
    {
        if (tok.isSignificant())
            out.push_back(tok);
    }
    return out;
}

std::vector<Token> Tokenizer::tokenize(std::string_view source)
{
    src_ = source;
    pos_ = 0;
    line_ = 0;
    column_ = 0;
    out_.clear();

    while (!eof())
    {
        tokStart_ = pos_;
        tokLine_ = line_;
        tokColumn_ = column_;

        const char c = peek();
        const char next = peek(1);

        if (isHorizontalWhitespace(c))
            lexWhitespace();
        else if (c == '\n' || c == '\r')
            lexNewline();
        else if ((c == '-' && next == '-') || (c == '/' && next == '/'))
            lexLineComment();
        else if (c == '/' && next == '*')
            lexBlockComment();
        else if (c == '"' || c == '\'')
            lexString();
        else if (isDigit(c))
            lexNumber();
        else if (isIdentifierStart(c))
            lexWord();
        else if ((c == '@' && isIdentifierStart(next)) ||
                 (c == '$' && (isIdentifierStart(next) || isDigit(next))))
            lexPlaceholder();
        else if (isPunctuation(c) || isOperator(std::string_view(&c, 1)) || c == '|')
            lexOperatorOrPunctuation();
        else
            lexUnknown();
    }

    return std::exchange(out_, {});
}

char Tokenizer::peek(std::size_t offset) const noexcept
{
    const std::size_t idx = pos_ + offset;
    return idx < src_.size() ? src_[idx] : '\0';
}

bool Tokenizer::eof() const noexcept
{
    return pos_ >= src_.size();
}

void Tokenizer::advance()
{
    if (eof())
        return;
    const char c = src_[pos_++];
    if (c == '\n' || (c == '\r' && peek() != '\n'))
    {
        ++line_;
        column_ = 0;
    }
    else
    {
        ++column_;
    }
}

void Tokenizer::advanceBy(std::size_t count)
{
    for (std::size_t i = 0; i < count && !eof(); ++i)
        advance();
}

void Tokenizer::emit(TokenType type, const KeywordInfo *keyword)
{
    Token tok;
    tok.type = type;
    tok.value = std::string(src_.substr(tokStart_, pos_ - tokStart_));
    tok.startPosition = tokStart_;
    tok.endPosition = pos_;
    tok.line = tokLine_;
    tok.column = tokColumn_;
    tok.keyword = keyword;
    out_.push_back(std::move(tok));
}

void Tokenizer::lexWhitespace()
{
    while (!eof() && isHorizontalWhitespace(peek()))
        advance();
    emit(TokenType::Whitespace);
}

void Tokenizer::lexNewline()
{
    if (peek() == '\r' && peek(1) == '\n')
        advanceBy(2);
    else
        advance();
    emit(TokenType::Newline);
}

void Tokenizer::lexLineComment()
{
    while (!eof() && peek() != '\n' && peek() != '\r')
        advance();
    emit(TokenType::Comment);
}

void Tokenizer::lexBlockComment()
{
    advanceBy(2);
    while (!eof())
    {
        if (peek() == '*' && peek(1) == '/')
        {
            advanceBy(2);
            break;
        }
        advance();
    }
    emit(TokenType::Comment);
}

void Tokenizer::lexString()
{
    const char quote = peek();
    advance();
    while (!eof())
    {
        const char c = peek();
        if (c == '\n' || c == '\r')
            break;
        if (c == '\\')
        {
            advance();
            // An escaped line break still ends the literal on this line.
            if (!eof() && peek() != '\n' && peek() != '\r')
                advance();
            continue;
        }
        advance();
        if (c == quote)
            break;
    }
    emit(TokenType::String);
}

void Tokenizer::lexNumber()
{
    while (isDigit(peek()))
        advance();
    if (peek() == '.' && isDigit(peek(1)))
    {
        advance();
        while (isDigit(peek()))
            advance();
    }
    if (peek() == 'e' || peek() == 'E')
    {
        if (isDigit(peek(1)))
        {
            advance();
        }
        else if ((peek(1) == '+' || peek(1) == '-') && isDigit(peek(2)))
        {
            advanceBy(2);
        }
        while (isDigit(peek()))
            advance();
    }
    // Absorb trailing identifier characters so "12ab" stays one malformed number.
    while (isIdentifierContinue(peek()))
        advance();
    emit(TokenType::Number);
}

void Tokenizer::lexWord()
{
    while (isIdentifierContinue(peek()))
        advance();
    const KeywordInfo *kw = lookupKeyword(src_.substr(tokStart_, pos_ - tokStart_));
    emit(kw ? TokenType::Keyword : TokenType::Identifier, kw);
}

void Tokenizer::lexPlaceholder()
{
    advance();
    if (isDigit(peek()))
    {
        while (isDigit(peek()))
            advance();
    }
    else
    {
        while (isIdentifierContinue(peek()))
            advance();
    }
    emit(TokenType::Placeholder);
}

void Tokenizer::lexOperatorOrPunctuation()
{
    const char two[2] = {peek(), peek(1)};
    if (two[1] != '\0' && isOperator(std::string_view(two, 2)))
    {
        advanceBy(2);
        emit(TokenType::Operator);
        return;
    }

    const char c = peek();
    if (c == '|')
    {
        lexUnknown();
        return;
    }
    advance();
    emit(isPunctuation(c) ? TokenType::Punctuation : TokenType::Operator);
}

void Tokenizer::lexUnknown()
{
    std::size_t len = utf8SequenceLength(peek());
    if (pos_ + len > src_.size())
        len = 1;
    for (std::size_t i = 1; i < len; ++i)
    {
        if ((static_cast<unsigned char>(peek(i)) & 0xC0) != 0x80)
        {
            len = 1;
            break;
        }
    }
    advanceBy(len);
    emit(TokenType::Unknown);
}

std::vector<Token> tokenize(std::string_view source)
{
    Tokenizer tokenizer;
    return tokenizer.tokenize(source);
}

} // namespace syndrql::lang
