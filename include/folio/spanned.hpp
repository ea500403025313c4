#ifndef FOLIO_SPANNED_HPP
#define FOLIO_SPANNED_HPP

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

#include "folio/util/source_position.hpp"

#include "folio/fwd.hpp"
#include "folio/memory_resources.hpp"

namespace folio {

/// @brief A value paired with the span of source code it originates from.
template <typename T>
struct Spanned {
    Source_Span span;
    T value;

    /// @brief Returns a `Spanned` with the same span whose value is `f(value)`.
    template <typename F>
        requires std::invocable<F, const T&>
    [[nodiscard]]
    Spanned<std::invoke_result_t<F, const T&>> map(F&& f) const&
    {
        return { span, std::invoke(std::forward<F>(f), value) };
    }

    template <typename F>
        requires std::invocable<F, T&&>
    [[nodiscard]]
    Spanned<std::invoke_result_t<F, T&&>> map(F&& f) &&
    {
        return { span, std::invoke(std::forward<F>(f), std::move(value)) };
    }

    [[nodiscard]]
    friend bool operator==(const Spanned&, const Spanned&)
        = default;
};

/// @brief A sequence of spanned values.
/// The order of elements is significant; it is the order in which they appear in the document.
template <typename T>
using Span_Vector = Pmr_Vector<Spanned<T>>;

/// @brief Turns all spans in `values` which are relative to `base` into absolute spans.
template <typename T>
void offset_spans(Span_Vector<T>& values, const Source_Position& base)
{
    for (Spanned<T>& v : values) {
        v.span = v.span.offset(base);
    }
}

} // namespace folio

#endif
