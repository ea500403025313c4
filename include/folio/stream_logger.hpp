#ifndef FOLIO_STREAM_LOGGER_HPP
#define FOLIO_STREAM_LOGGER_HPP

#include <iosfwd>

#include "folio/util/severity.hpp"

#include "folio/diagnostic.hpp"
#include "folio/services.hpp"

namespace folio {

/// @brief A `Logger` which prints one line per diagnostic to a stream, in the form
/// `ERROR: 3:14: message [id]`.
struct Stream_Logger final : Logger {
private:
    std::ostream& m_out;
    bool m_colors;
    bool m_any_errors = false;

public:
    [[nodiscard]]
    explicit Stream_Logger(std::ostream& out, Severity min_severity, bool colors = false)
        : Logger { min_severity }
        , m_out { out }
        , m_colors { colors }
    {
    }

    void operator()(const Diagnostic& diagnostic) final;

    /// @brief Returns `true` iff a diagnostic with at least `Severity::error` was printed.
    [[nodiscard]]
    bool any_errors() const noexcept
    {
        return m_any_errors;
    }
};

} // namespace folio

#endif
