// include/syndrql/text/document.hpp
// @brief Line-array text document with cursor and selections.
// @invariant Holds at least one line; 0 <= cursor.line < lineCount().
// @invariant Lines never contain line breaks.
// @ownership Document owns its lines; readers receive copies or const references.
#pragma once

#include <compare>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace syndrql::text
{

/// @brief Zero-based line/column location; columns count bytes.
struct Position
{
    std::size_t line = 0;
    std::size_t column = 0;

    friend bool operator==(const Position &, const Position &) = default;
    friend auto operator<=>(const Position &, const Position &) = default;
};

/// @brief Ordered selection range; active marks the caret end.
struct Selection
{
    Position start;
    Position end;
    Position active;

    friend bool operator==(const Selection &, const Selection &) = default;
};

/// @brief Editable line-array document.
class Document
{
  public:
    /// @brief Create a document from @p initial; "\n", "\r\n" and "\r" each separate lines.
    explicit Document(std::string_view initial = {});

    /// @brief All lines, without line terminators.
    [[nodiscard]] const std::vector<std::string> &lines() const
    {
        return lines_;
    }

    /// @brief Line @p index.
    /// @throws std::out_of_range if @p index >= lineCount().
    [[nodiscard]] const std::string &line(std::size_t index) const;

    [[nodiscard]] std::size_t lineCount() const
    {
        return lines_.size();
    }

    /// @brief Insert @p text at @p pos, creating missing lines and padding the
    ///        target line with spaces first. The cursor moves to the end of the
    ///        inserted text.
    void insertText(Position pos, std::string_view text);

    /// @brief Remove the text between @p a and @p b (in either order); the
    ///        cursor moves to the earlier position.
    /// @throws std::out_of_range if either position is outside the document.
    void deleteText(Position a, Position b);

    [[nodiscard]] Position cursorPosition() const
    {
        return cursor_;
    }

    /// @brief Move the cursor.
    /// @throws std::out_of_range if @p pos is outside the document.
    void setCursorPosition(Position pos);

    [[nodiscard]] const std::vector<Selection> &selections() const
    {
        return selections_;
    }

    void setSelections(std::vector<Selection> selections)
    {
        selections_ = std::move(selections);
    }

    /// @brief Replace all selections with one from @p a to @p b, clamped to
    ///        the document and ordered; the later end is active.
    void setSelection(Position a, Position b);

    void clearSelections()
    {
        selections_.clear();
    }

    /// @brief First selection, if any.
    [[nodiscard]] std::optional<Selection> currentSelection() const;

    /// @brief True if any selection spans at least one character.
    [[nodiscard]] bool hasSelection() const;

    /// @brief Text covered by the first selection, or empty.
    [[nodiscard]] std::string selectedText() const;

    /// @brief Whole document joined with "\n".
    [[nodiscard]] std::string text() const;

    /// @brief Text from the document start to @p pos; positions past the end
    ///        are clipped.
    [[nodiscard]] std::string textUpTo(Position pos) const;

  private:
    void validate(Position pos) const;
    [[nodiscard]] Position clamp(Position pos) const;
    [[nodiscard]] std::string textRange(Position a, Position b) const;

    std::vector<std::string> lines_;
    Position cursor_;
    std::vector<Selection> selections_;
};

} // namespace syndrql::text
