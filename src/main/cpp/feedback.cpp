#include <algorithm>
#include <utility>

#include "folio/util/severity.hpp"
#include "folio/util/source_position.hpp"

#include "folio/diagnostic.hpp"
#include "folio/feedback.hpp"
#include "folio/services.hpp"
#include "folio/spanned.hpp"

namespace folio {

bool Feedback::has_errors() const noexcept
{
    return std::ranges::any_of(diagnostics, [](const Diagnostic& d) {
        return d.severity >= Severity::error;
    });
}

void Feedback::extend(Feedback&& other)
{
    if (&other == this) {
        return;
    }
    diagnostics.insert(
        diagnostics.end(), std::make_move_iterator(other.diagnostics.begin()),
        std::make_move_iterator(other.diagnostics.end())
    );
    decorations.insert(
        decorations.end(), std::make_move_iterator(other.decorations.begin()),
        std::make_move_iterator(other.decorations.end())
    );
    other.diagnostics.clear();
    other.decorations.clear();
}

void Feedback::extend_offset(const Source_Position& base, Feedback&& other)
{
    for (Diagnostic& d : other.diagnostics) {
        d.location = d.location.offset(base);
    }
    offset_spans(other.decorations, base);
    extend(std::move(other));
}

void Feedback::log_to(Logger& logger) const
{
    for (const Diagnostic& d : diagnostics) {
        if (logger.can_log(d.severity)) {
            logger(d);
        }
    }
}

} // namespace folio
