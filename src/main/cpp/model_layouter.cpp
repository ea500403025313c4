#include <iterator>
#include <utility>

#include "folio/diagnostic.hpp"
#include "folio/feedback.hpp"
#include "folio/layout.hpp"
#include "folio/model.hpp"
#include "folio/model_layouter.hpp"
#include "folio/spanned.hpp"
#include "folio/syntax_model.hpp"

namespace folio {
namespace {

void append(Commands& out, Commands&& commands)
{
    out.insert(
        out.end(), std::make_move_iterator(commands.begin()),
        std::make_move_iterator(commands.end())
    );
}

} // namespace

Layout_Task expand_commands(Pass<Commands> pass, const Layout_Context& context)
{
    Commands result = context.make_commands();
    Feedback feedback = std::move(pass.feedback);
    for (const Command& command : pass.output) {
        if (command.get_kind() != Command_Kind::layout_syntax_model) {
            result.push_back(command);
            continue;
        }
        Pass<Commands> nested = co_await layout_syntax_model(command.get_syntax_model(), context);
        append(result, std::move(nested.output));
        feedback.extend(std::move(nested.feedback));
    }
    co_return Pass<Commands> { std::move(result), std::move(feedback) };
}

Layout_Task layout_syntax_model(const Syntax_Model& model, const Layout_Context& context)
{
    Commands commands = context.make_commands();
    Feedback feedback = context.make_feedback();

    for (const auto& [span, node] : model) {
        switch (node.get_kind()) {
        case Node_Kind::space: commands.push_back(Command::add_space()); break;
        case Node_Kind::parbreak: commands.push_back(Command::break_paragraph()); break;
        case Node_Kind::linebreak: commands.push_back(Command::finish_line()); break;
        case Node_Kind::text: commands.push_back(Command::add_text(node.get_text())); break;
        case Node_Kind::raw: {
            for (const Pmr_String& line : node.get_raw_lines()) {
                commands.push_back(Command::add_text(line));
                commands.push_back(Command::finish_line());
            }
            break;
        }
        case Node_Kind::toggle_italic: commands.push_back(Command::toggle_italic()); break;
        case Node_Kind::toggle_bolder: commands.push_back(Command::toggle_bolder()); break;
        case Node_Kind::model: {
            const Layout_Context nested_context = context.nested();
            if (nested_context.depth_exceeded()) {
                feedback.error(
                    span, diagnostic::layout_depth,
                    u8"Submodels are nested too deeply to be laid out."
                );
                break;
            }
            Pass<Commands> nested = co_await layout_model(node.get_model().get(), nested_context);
            append(commands, std::move(nested.output));
            feedback.extend_offset(span.start, std::move(nested.feedback));
            break;
        }
        }
    }

    co_return Pass<Commands> { std::move(commands), std::move(feedback) };
}

Layout_Task layout_model(const Model& model, const Layout_Context& context)
{
    Pass<Commands> pass = co_await model.layout(context);
    co_return co_await expand_commands(std::move(pass), context);
}

} // namespace folio
