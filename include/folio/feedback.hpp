#ifndef FOLIO_FEEDBACK_HPP
#define FOLIO_FEEDBACK_HPP

#include <concepts>
#include <functional>
#include <memory_resource>
#include <string_view>
#include <type_traits>
#include <utility>

#include "folio/util/assert.hpp"
#include "folio/util/severity.hpp"
#include "folio/util/source_position.hpp"

#include "folio/decoration.hpp"
#include "folio/diagnostic.hpp"
#include "folio/fwd.hpp"
#include "folio/memory_resources.hpp"
#include "folio/spanned.hpp"

namespace folio {

/// @brief Diagnostics and decorations which were accumulated while processing something.
/// Feedback is never fatal on its own;
/// it is up to the caller to decide whether e.g. errors should prevent rendering.
struct Feedback {
    /// @brief Errors, warnings, and other messages, in the order in which they were raised.
    Pmr_Vector<Diagnostic> diagnostics;
    /// @brief Decorations for semantic syntax highlighting.
    Span_Vector<Decoration> decorations;

    [[nodiscard]]
    explicit Feedback(std::pmr::memory_resource* memory = Global_Memory_Resource::get())
        : diagnostics { memory }
        , decorations { memory }
    {
    }

    [[nodiscard]]
    std::pmr::memory_resource* get_memory() const
    {
        return folio::get_memory(diagnostics);
    }

    [[nodiscard]]
    bool empty() const noexcept
    {
        return diagnostics.empty() && decorations.empty();
    }

    /// @brief Returns `true` iff any diagnostic has a severity of at least `Severity::error`.
    [[nodiscard]]
    bool has_errors() const noexcept;

    void add(
        Severity severity,
        const Source_Span& location,
        std::u8string_view id,
        std::u8string_view message
    )
    {
        FOLIO_ASSERT(severity_is_emittable(severity));
        diagnostics.emplace_back(severity, id, location, message, get_memory());
    }

    void error(const Source_Span& location, std::u8string_view id, std::u8string_view message)
    {
        add(Severity::error, location, id, message);
    }

    void warning(const Source_Span& location, std::u8string_view id, std::u8string_view message)
    {
        add(Severity::warning, location, id, message);
    }

    void decorate(const Source_Span& span, Decoration decoration)
    {
        decorations.push_back({ span, decoration });
    }

    /// @brief Appends all diagnostics and decorations in `other` to `*this`.
    /// Extending feedback with itself has no effect.
    void extend(Feedback&& other);

    /// @brief Like `extend`, but the spans in `other` are treated as relative to `base`
    /// and made absolute first.
    void extend_offset(const Source_Position& base, Feedback&& other);

    /// @brief Passes every diagnostic which `logger` accepts to `logger`, in order.
    void log_to(Logger& logger) const;

    [[nodiscard]]
    friend bool operator==(const Feedback&, const Feedback&)
        = default;
};

/// @brief The output of a computation along with the feedback gathered while computing it.
/// Producing a `Pass` always means that the computation succeeded,
/// even if `feedback` contains errors.
template <typename T>
struct Pass {
    T output;
    Feedback feedback;

    /// @brief Returns a `Pass` with the same feedback whose output is `f(output)`.
    template <typename F>
        requires std::invocable<F, T&&>
    [[nodiscard]]
    Pass<std::invoke_result_t<F, T&&>> map(F&& f) &&
    {
        return { std::invoke(std::forward<F>(f), std::move(output)), std::move(feedback) };
    }
};

} // namespace folio

#endif
