#ifndef FOLIO_MODEL_LAYOUTER_HPP
#define FOLIO_MODEL_LAYOUTER_HPP

#include <utility>

#include "folio/feedback.hpp"
#include "folio/fwd.hpp"
#include "folio/layout.hpp"
#include "folio/model.hpp"
#include "folio/syntax_model.hpp"

namespace folio {

/// @brief Lays out the nodes of `model` in document order,
/// producing only primitive commands (i.e. no `Command_Kind::layout_syntax_model`).
///
/// Submodels are laid out using `layout_model` within `context.nested()`,
/// and their feedback is treated as relative to the start of the node that holds them.
/// If a submodel would be nested more deeply than `context.max_depth`,
/// it is skipped and a `diagnostic::layout_depth` error is produced instead.
///
/// `model` and `context` have to outlive the returned task,
/// and `model` has to outlive the resulting commands.
[[nodiscard]]
Layout_Task layout_syntax_model(const Syntax_Model& model, const Layout_Context& context);

/// @brief Replaces every `Command_Kind::layout_syntax_model` command in `pass`
/// with the result of `layout_syntax_model` for the referenced model.
/// Feedback from those syntax models is appended to the feedback of `pass`.
[[nodiscard]]
Layout_Task expand_commands(Pass<Commands> pass, const Layout_Context& context);

/// @brief Lays out `model` via its own `layout` member function
/// and expands the result using `expand_commands`.
[[nodiscard]]
Layout_Task layout_model(const Model& model, const Layout_Context& context);

/// @brief Like `layout_model(const Model&, const Layout_Context&)`,
/// but for a model whose type is statically known,
/// such as the `Syntax_Model` at the root of a document.
template <concrete_model T>
[[nodiscard]]
Layout_Task layout_model(const T& model, const Layout_Context& context)
{
    Pass<Commands> pass = co_await model.layout(context);
    co_return co_await expand_commands(std::move(pass), context);
}

} // namespace folio

#endif
