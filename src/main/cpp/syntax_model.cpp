#include <memory_resource>
#include <span>
#include <string_view>
#include <utility>

#include "folio/util/assert.hpp"

#include "folio/feedback.hpp"
#include "folio/layout.hpp"
#include "folio/memory_resources.hpp"
#include "folio/model.hpp"
#include "folio/syntax_model.hpp"

namespace folio {

Node Node::text(std::u8string_view str, std::pmr::memory_resource* memory)
{
    return Node { Node_Kind::text, to_pmr_string(str, memory) };
}

Node Node::raw(std::span<const std::u8string_view> lines, std::pmr::memory_resource* memory)
{
    Raw_Lines result { memory };
    result.reserve(lines.size());
    for (const std::u8string_view line : lines) {
        result.push_back(to_pmr_string(line, memory));
    }
    return raw(std::move(result));
}

Node Node::raw(Raw_Lines&& lines)
{
    return Node { Node_Kind::raw, std::move(lines) };
}

Node Node::model(Boxed_Model&& model)
{
    FOLIO_ASSERT(model.has_value());
    return Node { Node_Kind::model, std::move(model) };
}

Layout_Task Syntax_Model::layout(const Layout_Context& context) const
{
    Commands commands = context.make_commands();
    commands.push_back(Command::layout_syntax_model(*this));
    co_return Pass<Commands> { std::move(commands), context.make_feedback() };
}

} // namespace folio
