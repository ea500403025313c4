#ifndef FOLIO_SOURCE_POSITION_HPP
#define FOLIO_SOURCE_POSITION_HPP

#include <cstddef>
#include <string_view>

#include "folio/util/assert.hpp"

#include "folio/fwd.hpp"

namespace folio {

/// Represents a position in a source file.
struct Source_Position {
    /// Line number, starting at zero.
    std::size_t line;
    /// Column number, starting at zero.
    std::size_t column;
    /// Index in the source file in code units.
    std::size_t begin;

    [[nodiscard]]
    friend constexpr auto operator<=>(Source_Position, Source_Position)
        = default;

    [[nodiscard]]
    constexpr Source_Position to_right(std::size_t offset) const
    {
        return { .line = line, .column = column + offset, .begin = begin + offset };
    }

    /// @brief Interprets this position as being relative to `base` and returns
    /// the corresponding absolute position.
    /// Lines are added; columns are only added when this position lies on the first line
    /// of the relative text, since any later line starts over at column zero.
    [[nodiscard]]
    constexpr Source_Position offset(const Source_Position& base) const
    {
        return {
            .line = base.line + line,
            .column = line == 0 ? base.column + column : column,
            .begin = base.begin + begin,
        };
    }
};

inline constexpr Source_Position zero_position { .line = 0, .column = 0, .begin = 0 };

constexpr void advance(Source_Position& pos, char8_t c)
{
    switch (c) {
    case '\r': pos.column = 0; break;
    case '\n':
        pos.column = 0;
        pos.line += 1;
        break;
    default: pos.column += 1;
    }
    pos.begin += 1;
}

constexpr void advance(Source_Position& pos, std::u8string_view str)
{
    for (const char8_t c : str) {
        advance(pos, c);
    }
}

/// @brief A range `[start, end)` in a source file.
/// `start.begin <= end.begin` always holds.
/// Lines and columns are not comparable in general,
/// since a carriage return resets the column without starting a new line.
/// Spans are opaque metadata for the syntax tree;
/// nothing in the tree interprets them.
struct Source_Span {
    Source_Position start;
    Source_Position end;

    [[nodiscard]]
    constexpr Source_Span(const Source_Position& start, const Source_Position& end)
        : start { start }
        , end { end }
    {
        FOLIO_ASSERT(start.begin <= end.begin);
    }

    /// @brief Returns an empty span located at `pos`.
    [[nodiscard]]
    static constexpr Source_Span at(const Source_Position& pos)
    {
        return { pos, pos };
    }

    /// @brief Returns the smallest span which contains both `a` and `b`.
    [[nodiscard]]
    static constexpr Source_Span merge(const Source_Span& a, const Source_Span& b)
    {
        return {
            a.start.begin <= b.start.begin ? a.start : b.start,
            a.end.begin >= b.end.begin ? a.end : b.end,
        };
    }

    [[nodiscard]]
    friend constexpr bool operator==(const Source_Span&, const Source_Span&)
        = default;

    [[nodiscard]]
    constexpr bool empty() const
    {
        return start.begin == end.begin;
    }

    /// @brief Returns the amount of code units covered by this span.
    [[nodiscard]]
    constexpr std::size_t length() const
    {
        return end.begin - start.begin;
    }

    [[nodiscard]]
    constexpr bool contains(std::size_t pos) const
    {
        return pos >= start.begin && pos < end.begin;
    }

    /// @brief Returns this span with both positions made absolute relative to `base`.
    /// @see Source_Position::offset
    [[nodiscard]]
    constexpr Source_Span offset(const Source_Position& base) const
    {
        return { start.offset(base), end.offset(base) };
    }
};

inline constexpr Source_Span zero_span = Source_Span::at(zero_position);

} // namespace folio

#endif
