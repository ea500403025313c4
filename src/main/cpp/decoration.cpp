#include <array>
#include <charconv>
#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <system_error>

#include "folio/util/assert.hpp"
#include "folio/util/source_position.hpp"

#include "folio/decoration.hpp"
#include "folio/memory_resources.hpp"
#include "folio/spanned.hpp"

namespace folio {
namespace {

constexpr Decoration all_decorations[] {
    Decoration::valid_func_name, Decoration::invalid_func_name, Decoration::argument_key,
    Decoration::object_key,      Decoration::italic,            Decoration::bold,
};

void append_number(Pmr_String& out, std::size_t x)
{
    std::array<char, 24> buffer {};
    const auto [end, error] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), x);
    FOLIO_ASSERT(error == std::errc {});
    for (const char* p = buffer.data(); p != end; ++p) {
        out.push_back(char8_t(*p));
    }
}

void append_position(Pmr_String& out, const Source_Position& pos)
{
    out += u8"{\"line\":";
    append_number(out, pos.line);
    out += u8",\"column\":";
    append_number(out, pos.column);
    out += u8'}';
}

} // namespace

std::optional<Decoration> decoration_by_name(std::u8string_view name) noexcept
{
    for (const Decoration d : all_decorations) {
        if (decoration_name(d) == name) {
            return d;
        }
    }
    return {};
}

void write_decorations_json(Pmr_String& out, std::span<const Spanned<Decoration>> decorations)
{
    out += u8'[';
    bool first = true;
    for (const auto& [span, decoration] : decorations) {
        if (!first) {
            out += u8',';
        }
        first = false;
        // Decoration names are plain ASCII identifiers, so no escaping is needed.
        out += u8"{\"value\":\"";
        out += decoration_name(decoration);
        out += u8"\",\"span\":{\"start\":";
        append_position(out, span.start);
        out += u8",\"end\":";
        append_position(out, span.end);
        out += u8"}}";
    }
    out += u8']';
}

} // namespace folio
