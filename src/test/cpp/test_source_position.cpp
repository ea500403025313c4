#include <string_view>

#include <gtest/gtest.h>

#include "folio/util/source_position.hpp"

#include "folio/memory_resources.hpp"
#include "folio/spanned.hpp"

namespace folio {
namespace {

TEST(Source_Position, advance)
{
    Source_Position pos = zero_position;
    advance(pos, u8"ab\ncd");
    EXPECT_EQ(pos, (Source_Position { .line = 1, .column = 2, .begin = 5 }));

    advance(pos, u8"\r\n");
    EXPECT_EQ(pos, (Source_Position { .line = 2, .column = 0, .begin = 7 }));
}

TEST(Source_Position, offset_same_line)
{
    constexpr Source_Position base { .line = 3, .column = 10, .begin = 50 };
    constexpr Source_Position relative { .line = 0, .column = 4, .begin = 4 };
    EXPECT_EQ(relative.offset(base), (Source_Position { .line = 3, .column = 14, .begin = 54 }));
}

TEST(Source_Position, offset_later_line)
{
    constexpr Source_Position base { .line = 3, .column = 10, .begin = 50 };
    constexpr Source_Position relative { .line = 2, .column = 4, .begin = 20 };
    EXPECT_EQ(relative.offset(base), (Source_Position { .line = 5, .column = 4, .begin = 70 }));
}

TEST(Source_Span, basics)
{
    constexpr Source_Position a { .line = 0, .column = 2, .begin = 2 };
    constexpr Source_Span span { a, a.to_right(5) };
    static_assert(span.length() == 5);
    static_assert(!span.empty());
    static_assert(span.contains(2));
    static_assert(span.contains(6));
    static_assert(!span.contains(7));
    static_assert(Source_Span::at(a).empty());
    static_assert(zero_span.empty());
}

TEST(Source_Span, merge)
{
    constexpr Source_Position a { .line = 0, .column = 2, .begin = 2 };
    constexpr Source_Position b { .line = 1, .column = 0, .begin = 9 };
    const Source_Span merged = Source_Span::merge({ a, a.to_right(1) }, { b, b.to_right(3) });
    EXPECT_EQ(merged.start, a);
    EXPECT_EQ(merged.end, b.to_right(3));
}

TEST(Source_Span, across_carriage_return)
{
    Source_Position start = zero_position;
    advance(start, u8"abc");
    Source_Position end = start;
    advance(end, u8"de\rx");
    ASSERT_LT(end.column, start.column);
    ASSERT_EQ(end.line, start.line);

    const Source_Span span { start, end };
    EXPECT_EQ(span.length(), 4);
    EXPECT_FALSE(span.empty());
    EXPECT_TRUE(span.contains(3));
    EXPECT_FALSE(span.contains(7));
}

TEST(Source_Span, merge_across_carriage_return)
{
    Source_Position a = zero_position;
    advance(a, u8"abc");
    Source_Position b = a;
    advance(b, u8"d\r");
    Source_Position c = b;
    advance(c, u8"x");

    const Source_Span first { a, a.to_right(1) };
    const Source_Span second { b, c };
    const Source_Span merged = Source_Span::merge(second, first);
    EXPECT_EQ(merged.start, a);
    EXPECT_EQ(merged.end, c);
    EXPECT_EQ(merged.length(), 3);
    EXPECT_EQ(Source_Span::merge(first, second), merged);
}

TEST(Spanned, map)
{
    const Spanned<int> x { Source_Span::at({ .line = 1, .column = 1, .begin = 8 }), 20 };
    const Spanned<int> y = x.map([](int v) { return v + 1; });
    EXPECT_EQ(y.span, x.span);
    EXPECT_EQ(y.value, 21);
}

TEST(Spanned, offset_spans)
{
    constexpr Source_Position base { .line = 2, .column = 5, .begin = 30 };
    constexpr Source_Position first { .line = 0, .column = 1, .begin = 1 };
    constexpr Source_Position second { .line = 1, .column = 0, .begin = 6 };

    Span_Vector<int> values;
    values.push_back({ Source_Span::at(first), 1 });
    values.push_back({ Source_Span::at(second), 2 });
    offset_spans(values, base);

    EXPECT_EQ(values[0].span.start, (Source_Position { .line = 2, .column = 6, .begin = 31 }));
    EXPECT_EQ(values[1].span.start, (Source_Position { .line = 3, .column = 0, .begin = 36 }));
    EXPECT_EQ(values[0].value, 1);
    EXPECT_EQ(values[1].value, 2);
}

} // namespace
} // namespace folio
