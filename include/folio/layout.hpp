#ifndef FOLIO_LAYOUT_HPP
#define FOLIO_LAYOUT_HPP

#include <cstddef>
#include <memory_resource>
#include <string_view>
#include <variant>

#include "folio/util/assert.hpp"

#include "folio/feedback.hpp"
#include "folio/fwd.hpp"
#include "folio/memory_resources.hpp"
#include "folio/settings.hpp"
#include "folio/task.hpp"

namespace folio {

enum struct Command_Kind : Default_Underlying {
    /// @brief Lay out all nodes of a syntax model, in order.
    layout_syntax_model,
    /// @brief Add a run of text.
    add_text,
    /// @brief Add interword space.
    add_space,
    /// @brief Finish the current line.
    finish_line,
    /// @brief Finish the current paragraph and start a new one.
    break_paragraph,
    /// @brief Toggle italic text on or off.
    toggle_italic,
    /// @brief Toggle bolder text on or off.
    toggle_bolder,
};

[[nodiscard]]
constexpr std::u8string_view command_kind_name(Command_Kind kind)
{
    using enum Command_Kind;
    switch (kind) {
        FOLIO_ENUM_STRING_CASE8(layout_syntax_model);
        FOLIO_ENUM_STRING_CASE8(add_text);
        FOLIO_ENUM_STRING_CASE8(add_space);
        FOLIO_ENUM_STRING_CASE8(finish_line);
        FOLIO_ENUM_STRING_CASE8(break_paragraph);
        FOLIO_ENUM_STRING_CASE8(toggle_italic);
        FOLIO_ENUM_STRING_CASE8(toggle_bolder);
    }
    FOLIO_ASSERT_UNREACHABLE(u8"Invalid command kind.");
}

/// @brief An instruction to the layout engine.
/// Commands are non-owning:
/// they may refer to syntax models and text owned by the model that produced them,
/// so they must not outlive that model.
struct Command {
private:
    Command_Kind m_kind;
    std::variant<std::monostate, const Syntax_Model*, std::u8string_view> m_extra;

    [[nodiscard]]
    constexpr explicit Command(Command_Kind kind) noexcept
        : m_kind { kind }
    {
    }

public:
    [[nodiscard]]
    static constexpr Command layout_syntax_model(const Syntax_Model& model) noexcept
    {
        Command result { Command_Kind::layout_syntax_model };
        result.m_extra = &model;
        return result;
    }

    [[nodiscard]]
    static constexpr Command add_text(std::u8string_view text) noexcept
    {
        Command result { Command_Kind::add_text };
        result.m_extra = text;
        return result;
    }

    [[nodiscard]]
    static constexpr Command add_space() noexcept
    {
        return Command { Command_Kind::add_space };
    }

    [[nodiscard]]
    static constexpr Command finish_line() noexcept
    {
        return Command { Command_Kind::finish_line };
    }

    [[nodiscard]]
    static constexpr Command break_paragraph() noexcept
    {
        return Command { Command_Kind::break_paragraph };
    }

    [[nodiscard]]
    static constexpr Command toggle_italic() noexcept
    {
        return Command { Command_Kind::toggle_italic };
    }

    [[nodiscard]]
    static constexpr Command toggle_bolder() noexcept
    {
        return Command { Command_Kind::toggle_bolder };
    }

    [[nodiscard]]
    constexpr Command_Kind get_kind() const noexcept
    {
        return m_kind;
    }

    [[nodiscard]]
    const Syntax_Model& get_syntax_model() const
    {
        FOLIO_ASSERT(m_kind == Command_Kind::layout_syntax_model);
        return *std::get<const Syntax_Model*>(m_extra);
    }

    [[nodiscard]]
    std::u8string_view get_text() const
    {
        FOLIO_ASSERT(m_kind == Command_Kind::add_text);
        return std::get<std::u8string_view>(m_extra);
    }

    /// @brief Two commands are equal if they have the same kind and payload.
    /// Syntax models are compared by identity, text by content.
    [[nodiscard]]
    friend constexpr bool operator==(const Command&, const Command&)
        = default;
};

using Commands = Pmr_Vector<Command>;

/// @brief The environment in which a model is laid out.
/// The context is provided by the layout engine and only ever borrowed by models;
/// models shall not assume exclusive access to anything reachable through it.
struct Layout_Context {
    /// @brief The memory resource for commands and feedback produced during layout.
    std::pmr::memory_resource* memory = Global_Memory_Resource::get();
    /// @brief The scheduler to which suspended layouts are posted by `yield()`,
    /// or null if layouts should never be suspended.
    Layout_Scheduler* scheduler = nullptr;
    /// @brief How deeply the model being laid out is nested within other models.
    std::size_t depth = 0;
    /// @brief The greatest `depth` at which models are still laid out.
    std::size_t max_depth = default_max_layout_depth;

    /// @brief Returns an awaitable which suspends the current layout
    /// so that other pending layouts can make progress.
    [[nodiscard]]
    Yield_Awaiter yield() const noexcept
    {
        return { scheduler };
    }

    /// @brief Returns the context for laying out a model nested inside the current one.
    [[nodiscard]]
    Layout_Context nested() const noexcept
    {
        Layout_Context result = *this;
        ++result.depth;
        return result;
    }

    [[nodiscard]]
    bool depth_exceeded() const noexcept
    {
        return depth > max_depth;
    }

    [[nodiscard]]
    Commands make_commands() const
    {
        return Commands { memory };
    }

    [[nodiscard]]
    Feedback make_feedback() const
    {
        return Feedback { memory };
    }
};

/// @brief The result of laying out a model:
/// commands which may borrow from that model, plus feedback.
using Layout_Task = Task<Pass<Commands>>;

} // namespace folio

#endif
