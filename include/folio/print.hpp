#ifndef FOLIO_PRINT_HPP
#define FOLIO_PRINT_HPP

#include <string_view>
#include <typeinfo>

#include "folio/fwd.hpp"
#include "folio/memory_resources.hpp"

namespace folio {

[[nodiscard]]
inline std::string_view as_string_view(std::u8string_view str)
{
    return { reinterpret_cast<const char*>(str.data()), str.size() };
}

/// @brief Appends the human-readable name of `type` to `out`.
void print_type_name(Pmr_String& out, const std::type_info& type);

/// @brief Appends a position in the form `line:column` to `out`,
/// where both numbers are one-based.
void print_position(Pmr_String& out, const Source_Position& pos);

/// @brief Appends a span in the form `1:4-1:9` to `out`.
void print_span(Pmr_String& out, const Source_Span& span);

/// @brief Appends a one-line description of `node` to `out`, without a trailing line break.
/// The node is described by its `node_kind_display_name` and its payload,
/// for example, `text "hello"` or `model folio::Syntax_Model`.
void print_node(Pmr_String& out, const Node& node);

/// @brief Appends a description of each node in `model` to `out`,
/// one line per node, followed by the span of the node.
/// Submodels which are themselves syntax models are printed recursively, indented.
void print_syntax_model(Pmr_String& out, const Syntax_Model& model, int indent = 0);

/// @brief Appends a one-line description of `command` to `out`.
void print_command(Pmr_String& out, const Command& command);

} // namespace folio

#endif
