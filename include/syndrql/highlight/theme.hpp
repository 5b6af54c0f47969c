// include/syndrql/highlight/theme.hpp
// @brief Color categories and the syntax color theme.
// @invariant Every TokenType maps to exactly one ColorCategory.
// @ownership Theme is a plain value type.
#pragma once

#include "syndrql/lang/token.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace syndrql::highlight
{

/// @brief 8-bit RGBA color.
struct RGBA
{
    uint8_t r{0};
    uint8_t g{0};
    uint8_t b{0};
    uint8_t a{255};

    friend bool operator==(const RGBA &, const RGBA &) = default;
};

/// @brief Parse "#rrggbb" (leading '#' optional) into an opaque color.
[[nodiscard]] std::optional<RGBA> parseColor(std::string_view text);

/// @brief Format @p color as "#RRGGBB".
[[nodiscard]] std::string formatColor(RGBA color);

/// @brief Rendering category of a token.
enum class ColorCategory
{
    Keyword,
    Identifier,
    Literal,
    Operator,
    Punctuation,
    Comment,
    String,
    Number,
    Placeholder,
    Unknown,
    Plain, ///< Whitespace and line breaks.
};

/// @brief Category for tokens of @p type.
[[nodiscard]] ColorCategory categoryFor(lang::TokenType type) noexcept;

/// @brief Lowercase name of @p category as used in config files.
[[nodiscard]] std::string_view categoryName(ColorCategory category) noexcept;

/// @brief Foreground color per category plus the error underline color.
struct Theme
{
    RGBA keyword{0x56, 0x9C, 0xD6, 255};
    RGBA identifier{0x9C, 0xDC, 0xFE, 255};
    RGBA literal{0xCE, 0x91, 0x78, 255};
    RGBA op{0xD4, 0xD4, 0xD4, 255};
    RGBA punctuation{0xD4, 0xD4, 0xD4, 255};
    RGBA comment{0x6A, 0x99, 0x55, 255};
    RGBA string{0xCE, 0x91, 0x78, 255};
    RGBA number{0xB5, 0xCE, 0xA8, 255};
    RGBA placeholder{0x4E, 0xC9, 0xB0, 255};
    RGBA unknown{0xD4, 0xD4, 0xD4, 255};
    RGBA error{0xFF, 0x00, 0x00, 255};

    /// @brief Color for @p category; Plain uses the identifier color.
    [[nodiscard]] RGBA color(ColorCategory category) const noexcept;

    /// @brief Set the color for the category named @p name.
    /// @return False if @p name is not a category or "error".
    bool set(std::string_view name, RGBA value);

    friend bool operator==(const Theme &, const Theme &) = default;
};

} // namespace syndrql::highlight
