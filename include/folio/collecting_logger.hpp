#ifndef FOLIO_COLLECTING_LOGGER_HPP
#define FOLIO_COLLECTING_LOGGER_HPP

#include <algorithm>
#include <memory_resource>
#include <string_view>

#include "folio/util/severity.hpp"

#include "folio/diagnostic.hpp"
#include "folio/memory_resources.hpp"
#include "folio/services.hpp"

namespace folio {

struct Collecting_Logger final : Logger {
    Pmr_Vector<Diagnostic> diagnostics;

    [[nodiscard]]
    explicit Collecting_Logger(
        std::pmr::memory_resource* const memory,
        Severity min_severity = Severity::min
    )
        : Logger { min_severity }
        , diagnostics { memory }
    {
    }

    void operator()(const Diagnostic& diagnostic) final
    {
        diagnostics.push_back(diagnostic);
    }

    [[nodiscard]]
    bool nothing_logged() const
    {
        return diagnostics.empty();
    }

    [[nodiscard]]
    bool was_logged(const std::u8string_view id) const
    {
        return std::ranges::find(diagnostics, id, &Diagnostic::id) != diagnostics.end();
    }
};

} // namespace folio

#endif
