#include <ostream>
#include <string_view>

#include "folio/util/ansi.hpp"
#include "folio/util/severity.hpp"

#include "folio/diagnostic.hpp"
#include "folio/print.hpp"
#include "folio/stream_logger.hpp"

namespace folio {
namespace {

[[nodiscard]]
std::u8string_view severity_highlight(Severity severity)
{
    return severity <= Severity::trace      ? ansi::black
        : severity <= Severity::debug        ? ansi::h_black
        : severity <= Severity::info         ? ansi::blue
        : severity <= Severity::soft_warning ? ansi::green
        : severity <= Severity::warning      ? ansi::h_yellow
        : severity <= Severity::error        ? ansi::h_red
        : severity <= Severity::fatal        ? ansi::red
                                             : ansi::magenta;
}

} // namespace

void Stream_Logger::operator()(const Diagnostic& diagnostic)
{
    m_any_errors |= diagnostic.severity >= Severity::error;

    const Propagated_Polymorphic_Allocator<char8_t> alloc { get_memory(diagnostic.message) };
    Pmr_String out { alloc };
    if (m_colors) {
        out += severity_highlight(diagnostic.severity);
    }
    out += severity_tag(diagnostic.severity);
    if (m_colors) {
        out += ansi::reset;
    }
    out += u8": ";
    print_position(out, diagnostic.location.start);
    out += u8": ";
    out += diagnostic.message;
    if (m_colors) {
        out += ansi::h_black;
    }
    out += u8" [";
    out += diagnostic.id;
    out += u8']';
    if (m_colors) {
        out += ansi::reset;
    }
    out += u8'\n';
    m_out << as_string_view(out);
}

} // namespace folio
