// src/text/document.cpp
// @brief Implementation of the line-array document.
// @invariant Mutations keep at least one line and keep the cursor in bounds.
// @ownership Document exclusively owns its line storage.

#include "syndrql/text/document.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace syndrql::text
{

namespace
{
std::vector<std::string> splitLines(std::string_view text)
{
    std::vector<std::string> out;
    std::size_t begin = 0;
    while (true)
    {
        const std::size_t br = text.find_first_of("\r\n", begin);
        if (br == std::string_view::npos)
        {
            out.emplace_back(text.substr(begin));
            break;
        }
        out.emplace_back(text.substr(begin, br - begin));
        // "\r\n" counts as one break.
        begin = br + 1;
        if (text[br] == '\r' && begin < text.size() && text[begin] == '\n')
            ++begin;
    }
    return out;
}
} // namespace

Document::Document(std::string_view initial) : lines_(splitLines(initial)) {}

const std::string &Document::line(std::size_t index) const
{
    if (index >= lines_.size())
    {
        throw std::out_of_range("line " + std::to_string(index) + " out of bounds (0 to " +
                                std::to_string(lines_.size() - 1) + ")");
    }
    return lines_[index];
}

void Document::validate(Position pos) const
{
    if (pos.line >= lines_.size())
    {
        throw std::out_of_range("line " + std::to_string(pos.line) + " out of bounds (0 to " +
                                std::to_string(lines_.size() - 1) + ")");
    }
    const std::size_t len = lines_[pos.line].size();
    if (pos.column > len)
    {
        throw std::out_of_range("column " + std::to_string(pos.column) + " out of bounds (0 to " +
                                std::to_string(len) + ")");
    }
}

Position Document::clamp(Position pos) const
{
    pos.line = std::min(pos.line, lines_.size() - 1);
    pos.column = std::min(pos.column, lines_[pos.line].size());
    return pos;
}

void Document::insertText(Position pos, std::string_view text)
{
    if (lines_.size() <= pos.line)
        lines_.resize(pos.line + 1);
    std::string &target = lines_[pos.line];
    if (target.size() < pos.column)
        target.append(pos.column - target.size(), ' ');

    const std::string after = target.substr(pos.column);
    target.erase(pos.column);

    std::vector<std::string> pieces = splitLines(text);
    if (pieces.size() == 1)
    {
        target += pieces.front();
        target += after;
        cursor_ = {pos.line, pos.column + pieces.front().size()};
        return;
    }

    target += pieces.front();
    const std::size_t lastColumn = pieces.back().size();
    pieces.back() += after;
    lines_.insert(lines_.begin() + static_cast<std::ptrdiff_t>(pos.line) + 1,
                  std::make_move_iterator(pieces.begin() + 1),
                  std::make_move_iterator(pieces.end()));
    cursor_ = {pos.line + pieces.size() - 1, lastColumn};
}

void Document::deleteText(Position a, Position b)
{
    validate(a);
    validate(b);
    if (b < a)
        std::swap(a, b);

    if (a.line == b.line)
    {
        lines_[a.line].erase(a.column, b.column - a.column);
    }
    else
    {
        const std::string tail = lines_[b.line].substr(b.column);
        lines_[a.line].erase(a.column);
        lines_[a.line] += tail;
        lines_.erase(lines_.begin() + static_cast<std::ptrdiff_t>(a.line) + 1,
                     lines_.begin() + static_cast<std::ptrdiff_t>(b.line) + 1);
    }
    cursor_ = a;
}

void Document::setCursorPosition(Position pos)
{
    validate(pos);
    cursor_ = pos;
}

void Document::setSelection(Position a, Position b)
{
    a = clamp(a);
    b = clamp(b);
    if (b < a)
        std::swap(a, b);
    selections_ = {Selection{a, b, b}};
}

std::optional<Selection> Document::currentSelection() const
{
    if (selections_.empty())
        return std::nullopt;
    return selections_.front();
}

bool Document::hasSelection() const
{
    return std::any_of(selections_.begin(),
                       selections_.end(),
                       [](const Selection &s) { return s.start != s.end; });
}

std::string Document::selectedText() const
{
    const auto sel = currentSelection();
    if (!sel || sel->start == sel->end)
        return {};
    return textRange(clamp(sel->start), clamp(sel->end));
}

std::string Document::textRange(Position a, Position b) const
{
    if (a.line == b.line)
        return lines_[a.line].substr(a.column, b.column - a.column);

    std::string out = lines_[a.line].substr(a.column);
    for (std::size_t i = a.line + 1; i < b.line; ++i)
    {
        out += '\n';
        out += lines_[i];
    }
    out += '\n';
    out += lines_[b.line].substr(0, b.column);
    return out;
}

std::string Document::text() const
{
    std::string out;
    for (std::size_t i = 0; i < lines_.size(); ++i)
    {
        if (i != 0)
            out += '\n';
        out += lines_[i];
    }
    return out;
}

std::string Document::textUpTo(Position pos) const
{
    std::string out;
    for (std::size_t i = 0; i < pos.line && i < lines_.size(); ++i)
    {
        out += lines_[i];
        out += '\n';
    }
    if (pos.line < lines_.size())
    {
        const std::string &l = lines_[pos.line];
        out += l.substr(0, std::min(pos.column, l.size()));
    }
    return out;
}

} // namespace syndrql::text
