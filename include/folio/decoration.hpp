#ifndef FOLIO_DECORATION_HPP
#define FOLIO_DECORATION_HPP

#include <optional>
#include <span>
#include <string_view>

#include "folio/util/assert.hpp"

#include "folio/fwd.hpp"
#include "folio/memory_resources.hpp"
#include "folio/spanned.hpp"

namespace folio {

/// @brief A category for semantic syntax highlighting,
/// attached to spans of source code by the parser and resolver.
enum struct Decoration : Default_Underlying {
    /// @brief A valid function name, like `box` in `[box]`.
    valid_func_name,
    /// @brief An invalid function name, like `blabla` in `[blabla]`.
    invalid_func_name,
    /// @brief A key of a keyword argument, like `width` in `[box: width=5cm]`.
    argument_key,
    /// @brief A key in an object, like `left` in `[box: padding={ left: 1cm }]`.
    object_key,
    /// @brief An italic word.
    italic,
    /// @brief A bold word.
    bold,
};

/// @brief Returns the stable name of `decoration` which is used when exchanging
/// decorations with editor tooling.
/// For example, `decoration_name(Decoration::valid_func_name)` is `"validFuncName"`.
[[nodiscard]]
constexpr std::u8string_view decoration_name(Decoration decoration)
{
    using enum Decoration;
    switch (decoration) {
    case valid_func_name: return u8"validFuncName";
    case invalid_func_name: return u8"invalidFuncName";
    case argument_key: return u8"argumentKey";
    case object_key: return u8"objectKey";
    case italic: return u8"italic";
    case bold: return u8"bold";
    }
    FOLIO_ASSERT_UNREACHABLE(u8"Invalid decoration.");
}

/// @brief Returns the decoration whose `decoration_name` is `name`,
/// or `std::nullopt` if there is none.
[[nodiscard]]
std::optional<Decoration> decoration_by_name(std::u8string_view name) noexcept;

/// @brief Appends a JSON array to `out` which contains one object per element in `decorations`,
/// in the given order.
/// Each object has the form
/// `{"value":"italic","span":{"start":{"line":0,"column":1},"end":{"line":0,"column":5}}}`.
void write_decorations_json(Pmr_String& out, std::span<const Spanned<Decoration>> decorations);

} // namespace folio

#endif
