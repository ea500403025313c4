#ifndef FOLIO_SERVICES_HPP
#define FOLIO_SERVICES_HPP

#include "folio/util/assert.hpp"
#include "folio/util/severity.hpp"

#include "folio/diagnostic.hpp"
#include "folio/fwd.hpp"

namespace folio {

struct Logger {
private:
    Severity m_min_severity;

public:
    [[nodiscard]]
    constexpr explicit Logger(Severity min_severity)
    {
        set_min_severity(min_severity);
    }

    constexpr virtual ~Logger() = default;

    [[nodiscard]]
    constexpr Severity get_min_severity() const
    {
        return m_min_severity;
    }

    constexpr void set_min_severity(Severity severity)
    {
        FOLIO_ASSERT(severity <= Severity::none);
        m_min_severity = severity;
    }

    [[nodiscard]]
    constexpr bool can_log(Severity severity) const
    {
        return severity >= m_min_severity;
    }

    virtual void operator()(const Diagnostic& diagnostic) = 0;
};

struct Ignorant_Logger final : Logger {
    using Logger::Logger;

    void operator()(const Diagnostic&) final { }
};

inline constinit Ignorant_Logger ignorant_logger { Severity::none };

} // namespace folio

#endif
