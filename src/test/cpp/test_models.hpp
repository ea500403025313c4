#ifndef FOLIO_TEST_MODELS_HPP
#define FOLIO_TEST_MODELS_HPP

#include <stdexcept>
#include <string_view>
#include <utility>

#include "folio/util/source_position.hpp"

#include "folio/decoration.hpp"
#include "folio/feedback.hpp"
#include "folio/layout.hpp"
#include "folio/memory_resources.hpp"
#include "folio/model.hpp"
#include "folio/syntax_model.hpp"

namespace folio::test {

/// @brief Lays out its body in italics, like `[emph: body]`.
struct Emphasis_Model {
    Syntax_Model body;

    [[nodiscard]]
    Layout_Task layout(const Layout_Context& context) const
    {
        Commands commands = context.make_commands();
        commands.push_back(Command::toggle_italic());
        commands.push_back(Command::layout_syntax_model(body));
        commands.push_back(Command::toggle_italic());
        co_return Pass<Commands> { std::move(commands), context.make_feedback() };
    }

    [[nodiscard]]
    friend bool operator==(const Emphasis_Model&, const Emphasis_Model&)
        = default;
};

/// @brief Produces its text, but only after yielding to the scheduler `yields` times,
/// as if it was waiting on something like a cross-reference.
struct Label_Model {
    Pmr_String text;
    int yields = 0;

    [[nodiscard]]
    Layout_Task layout(const Layout_Context& context) const
    {
        for (int i = 0; i < yields; ++i) {
            co_await context.yield();
        }
        Commands commands = context.make_commands();
        commands.push_back(Command::add_text(text));
        co_return Pass<Commands> { std::move(commands), context.make_feedback() };
    }

    [[nodiscard]]
    friend bool operator==(const Label_Model&, const Label_Model&)
        = default;
};

/// @brief An invocation of a function that could not be resolved.
/// Layout reproduces the name literally and reports an error.
struct Unknown_Function_Model {
    Pmr_String name;
    /// @brief The span of the name, relative to the start of the invocation.
    Source_Span name_span = zero_span;

    [[nodiscard]]
    Layout_Task layout(const Layout_Context& context) const
    {
        Commands commands = context.make_commands();
        commands.push_back(Command::add_text(name));
        Feedback feedback = context.make_feedback();
        feedback.error(name_span, u8"function.unknown", u8"No function with this name exists.");
        feedback.decorate(name_span, Decoration::invalid_func_name);
        co_return Pass<Commands> { std::move(commands), std::move(feedback) };
    }

    [[nodiscard]]
    friend bool operator==(const Unknown_Function_Model&, const Unknown_Function_Model&)
        = default;
};

/// @brief Holds another model of any type and lays it out in bold.
struct Strong_Model {
    Boxed_Model inner;

    [[nodiscard]]
    Layout_Task layout(const Layout_Context& context) const
    {
        Pass<Commands> pass = co_await inner.layout(context);
        Commands commands = context.make_commands();
        commands.push_back(Command::toggle_bolder());
        commands.insert(commands.end(), pass.output.begin(), pass.output.end());
        commands.push_back(Command::toggle_bolder());
        co_return Pass<Commands> { std::move(commands), std::move(pass.feedback) };
    }

    [[nodiscard]]
    friend bool operator==(const Strong_Model&, const Strong_Model&)
        = default;
};

/// @brief Fails to lay out by throwing `std::runtime_error`.
struct Throwing_Model {
    int id = 0;

    [[nodiscard]]
    Layout_Task layout(const Layout_Context& context) const
    {
        co_await context.yield();
        throw std::runtime_error("layout failed");
    }

    [[nodiscard]]
    friend bool operator==(const Throwing_Model&, const Throwing_Model&)
        = default;
};

[[nodiscard]]
inline Source_Span
make_span(std::size_t line, std::size_t column, std::size_t begin, std::size_t length)
{
    const Source_Position start { .line = line, .column = column, .begin = begin };
    return { start, start.to_right(length) };
}

[[nodiscard]]
inline Pmr_String make_string(std::u8string_view str)
{
    return to_pmr_string(str, Global_Memory_Resource::get());
}

} // namespace folio::test

#endif
