#ifndef FOLIO_DIAGNOSTIC_HPP
#define FOLIO_DIAGNOSTIC_HPP

#include <memory_resource>
#include <string_view>

#include "folio/util/severity.hpp"
#include "folio/util/source_position.hpp"

#include "folio/fwd.hpp"
#include "folio/memory_resources.hpp"

namespace folio {

struct Diagnostic {
    /// @brief The severity of the diagnostic.
    /// `severity_is_emittable(severity)` shall be `true`.
    Severity severity;
    /// @brief The id of the diagnostic,
    /// which is a non-empty string containing a
    /// dot-separated sequence of identifier for this diagnostic.
    Pmr_String id;
    /// @brief The span of code that is responsible for this diagnostic.
    Source_Span location;
    /// @brief The diagnostic message.
    Pmr_String message;

    [[nodiscard]]
    Diagnostic(
        Severity severity,
        std::u8string_view id,
        const Source_Span& location,
        std::u8string_view message,
        std::pmr::memory_resource* memory
    )
        : severity { severity }
        , id { to_pmr_string(id, memory) }
        , location { location }
        , message { to_pmr_string(message, memory) }
    {
    }

    [[nodiscard]]
    friend bool operator==(const Diagnostic&, const Diagnostic&)
        = default;
};

namespace diagnostic {

/// @brief While laying out a syntax model,
/// submodels were nested more deeply than the layout context permits.
inline constexpr std::u8string_view layout_depth = u8"layout.depth";

} // namespace diagnostic

} // namespace folio

#endif
