// src/highlight/theme.cpp
// @brief Theme color lookup and hex color parsing.
// @invariant parseColor accepts exactly six hex digits.
// @ownership Stateless helpers over value types.

#include "syndrql/highlight/theme.hpp"

#include <cstdio>

namespace syndrql::highlight
{

namespace
{
int hexValue(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}
} // namespace

std::optional<RGBA> parseColor(std::string_view text)
{
    if (!text.empty() && text.front() == '#')
        text.remove_prefix(1);
    if (text.size() != 6)
        return std::nullopt;
    uint8_t channels[3];
    for (int i = 0; i < 3; ++i)
    {
        const int hi = hexValue(text[2 * i]);
        const int lo = hexValue(text[2 * i + 1]);
        if (hi < 0 || lo < 0)
            return std::nullopt;
        channels[i] = static_cast<uint8_t>(hi * 16 + lo);
    }
    return RGBA{channels[0], channels[1], channels[2], 255};
}

std::string formatColor(RGBA color)
{
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02X%02X%02X", color.r, color.g, color.b);
    return buf;
}

ColorCategory categoryFor(lang::TokenType type) noexcept
{
    using lang::TokenType;
    switch (type)
    {
        case TokenType::Keyword:
            return ColorCategory::Keyword;
        case TokenType::Identifier:
            return ColorCategory::Identifier;
        case TokenType::Literal:
            return ColorCategory::Literal;
        case TokenType::Operator:
            return ColorCategory::Operator;
        case TokenType::Punctuation:
            return ColorCategory::Punctuation;
        case TokenType::Comment:
            return ColorCategory::Comment;
        case TokenType::String:
            return ColorCategory::String;
        case TokenType::Number:
            return ColorCategory::Number;
        case TokenType::Placeholder:
            return ColorCategory::Placeholder;
        case TokenType::Unknown:
            return ColorCategory::Unknown;
        case TokenType::Whitespace:
        case TokenType::Newline:
            return ColorCategory::Plain;
    }
    return ColorCategory::Unknown;
}

std::string_view categoryName(ColorCategory category) noexcept
{
    switch (category)
    {
        case ColorCategory::Keyword:
            return "keyword";
        case ColorCategory::Identifier:
            return "identifier";
        case ColorCategory::Literal:
            return "literal";
        case ColorCategory::Operator:
            return "operator";
        case ColorCategory::Punctuation:
            return "punctuation";
        case ColorCategory::Comment:
            return "comment";
        case ColorCategory::String:
            return "string";
        case ColorCategory::Number:
            return "number";
        case ColorCategory::Placeholder:
            return "placeholder";
        case ColorCategory::Unknown:
            return "unknown";
        case ColorCategory::Plain:
            return "plain";
    }
    return "unknown";
}

RGBA Theme::color(ColorCategory category) const noexcept
{
    switch (category)
    {
        case ColorCategory::Keyword:
            return keyword;
        case ColorCategory::Identifier:
        case ColorCategory::Plain:
            return identifier;
        case ColorCategory::Literal:
            return literal;
        case ColorCategory::Operator:
            return op;
        case ColorCategory::Punctuation:
            return punctuation;
        case ColorCategory::Comment:
            return comment;
        case ColorCategory::String:
            return string;
        case ColorCategory::Number:
            return number;
        case ColorCategory::Placeholder:
            return placeholder;
        case ColorCategory::Unknown:
            return unknown;
    }
    return unknown;
}

bool Theme::set(std::string_view name, RGBA value)
{
    if (name == "keyword")
        keyword = value;
    else if (name == "identifier")
        identifier = value;
    else if (name == "literal")
        literal = value;
    else if (name == "operator")
        op = value;
    else if (name == "punctuation")
        punctuation = value;
    else if (name == "comment")
        comment = value;
    else if (name == "string")
        string = value;
    else if (name == "number")
        number = value;
    else if (name == "placeholder")
        placeholder = value;
    else if (name == "unknown")
        unknown = value;
    else if (name == "error")
        error = value;
    else
        return false;
    return true;
}

} // namespace syndrql::highlight
