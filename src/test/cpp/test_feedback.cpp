#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include <gtest/gtest.h>

#include "folio/util/ansi.hpp"
#include "folio/util/severity.hpp"
#include "folio/util/source_position.hpp"

#include "folio/collecting_logger.hpp"
#include "folio/decoration.hpp"
#include "folio/diagnostic.hpp"
#include "folio/feedback.hpp"
#include "folio/memory_resources.hpp"
#include "folio/print.hpp"
#include "folio/services.hpp"
#include "folio/stream_logger.hpp"
#include "test_models.hpp"

namespace folio {
namespace {

using test::make_span;

TEST(Feedback, empty)
{
    Feedback feedback;
    EXPECT_TRUE(feedback.empty());
    EXPECT_FALSE(feedback.has_errors());

    feedback.decorate(make_span(0, 0, 0, 1), Decoration::bold);
    EXPECT_FALSE(feedback.empty());
    EXPECT_FALSE(feedback.has_errors());
}

TEST(Feedback, has_errors)
{
    Feedback feedback;
    feedback.warning(make_span(0, 0, 0, 1), u8"test.warning", u8"Warning.");
    EXPECT_FALSE(feedback.has_errors());

    feedback.error(make_span(0, 1, 1, 1), u8"test.error", u8"Error.");
    EXPECT_TRUE(feedback.has_errors());
}

TEST(Feedback, extend_concatenates)
{
    Feedback a;
    a.warning(make_span(0, 0, 0, 1), u8"a", u8"A.");
    a.decorate(make_span(0, 0, 0, 1), Decoration::italic);

    Feedback b;
    b.error(make_span(0, 2, 2, 1), u8"b", u8"B.");
    b.decorate(make_span(0, 2, 2, 1), Decoration::argument_key);

    a.extend(std::move(b));
    ASSERT_EQ(a.diagnostics.size(), 2);
    EXPECT_EQ(std::u8string_view { a.diagnostics[0].id }, u8"a");
    EXPECT_EQ(std::u8string_view { a.diagnostics[1].id }, u8"b");
    ASSERT_EQ(a.decorations.size(), 2);
    EXPECT_EQ(a.decorations[1].value, Decoration::argument_key);
    EXPECT_TRUE(b.empty()); // NOLINT(bugprone-use-after-move)
}

TEST(Feedback, extend_with_itself)
{
    Feedback feedback;
    feedback.error(make_span(0, 0, 0, 1), u8"e", u8"E.");
    feedback.decorate(make_span(0, 0, 0, 1), Decoration::bold);
    const Feedback before = feedback;

    feedback.extend(std::move(feedback)); // NOLINT(bugprone-use-after-move)
    EXPECT_EQ(feedback, before);
}

TEST(Feedback, extend_offset)
{
    Feedback relative;
    relative.error(make_span(1, 2, 7, 3), u8"x", u8"X.");
    relative.decorate(make_span(0, 1, 1, 2), Decoration::object_key);

    Feedback absolute;
    absolute.extend_offset({ .line = 4, .column = 8, .begin = 40 }, std::move(relative));

    ASSERT_EQ(absolute.diagnostics.size(), 1);
    EXPECT_EQ(absolute.diagnostics[0].location, make_span(5, 2, 47, 3));
    ASSERT_EQ(absolute.decorations.size(), 1);
    EXPECT_EQ(absolute.decorations[0].span, make_span(4, 9, 41, 2));
}

TEST(Feedback, log_to_respects_min_severity)
{
    Feedback feedback;
    feedback.add(Severity::debug, make_span(0, 0, 0, 1), u8"d", u8"D.");
    feedback.warning(make_span(0, 0, 0, 1), u8"w", u8"W.");
    feedback.error(make_span(0, 0, 0, 1), u8"e", u8"E.");

    Collecting_Logger logger { Global_Memory_Resource::get(), Severity::warning };
    feedback.log_to(logger);
    ASSERT_EQ(logger.diagnostics.size(), 2);
    EXPECT_FALSE(logger.was_logged(u8"d"));
    EXPECT_TRUE(logger.was_logged(u8"w"));
    EXPECT_TRUE(logger.was_logged(u8"e"));

    Collecting_Logger silent { Global_Memory_Resource::get(), Severity::none };
    feedback.log_to(silent);
    EXPECT_TRUE(silent.nothing_logged());

    feedback.log_to(ignorant_logger);
}

TEST(Severity, emittable)
{
    static_assert(severity_is_emittable(Severity::min));
    static_assert(severity_is_emittable(Severity::warning));
    static_assert(severity_is_emittable(Severity::fatal));
    static_assert(!severity_is_emittable(Severity::none));
    EXPECT_EQ(severity_tag(Severity::soft_warning), u8"SOFTWARN");
}

TEST(Pass, map)
{
    Feedback feedback;
    feedback.warning(make_span(0, 0, 0, 1), u8"w", u8"W.");
    Pass<int> pass { 20, std::move(feedback) };

    const Pass<int> mapped = std::move(pass).map([](int x) { return x + 1; });
    EXPECT_EQ(mapped.output, 21);
    EXPECT_EQ(mapped.feedback.diagnostics.size(), 1);
}

TEST(Stream_Logger, format)
{
    std::ostringstream out;
    Stream_Logger logger { out, Severity::warning };

    Feedback feedback;
    feedback.add(Severity::info, make_span(0, 0, 0, 1), u8"i", u8"Ignored.");
    feedback.warning(make_span(2, 4, 20, 3), u8"style.spacing", u8"Double space.");
    feedback.log_to(logger);
    EXPECT_FALSE(logger.any_errors());

    feedback.diagnostics.clear();
    feedback.error(make_span(0, 0, 0, 5), u8"function.unknown", u8"No such function.");
    feedback.log_to(logger);
    EXPECT_TRUE(logger.any_errors());

    const std::string expected = "WARNING: 3:5: Double space. [style.spacing]\n"
                                 "ERROR: 1:1: No such function. [function.unknown]\n";
    EXPECT_EQ(out.str(), expected);
}

TEST(Stream_Logger, colors)
{
    std::ostringstream out;
    Stream_Logger logger { out, Severity::min, true };
    logger(Diagnostic { Severity::error, u8"e", make_span(0, 0, 0, 1), u8"E.",
                        Global_Memory_Resource::get() });

    const std::string str = out.str();
    EXPECT_NE(str.find("ERROR"), std::string::npos);
    EXPECT_NE(str.find(as_string_view(ansi::reset)), std::string::npos);
}

} // namespace
} // namespace folio
