#include <array>
#include <charconv>
#include <cstddef>
#include <cstdlib>
#include <memory>
#include <string_view>
#include <system_error>
#include <typeinfo>

#include <cxxabi.h>

#include "folio/util/assert.hpp"
#include "folio/util/source_position.hpp"

#include "folio/layout.hpp"
#include "folio/memory_resources.hpp"
#include "folio/print.hpp"
#include "folio/syntax_model.hpp"

namespace folio {
namespace {

void append_number(Pmr_String& out, std::size_t x)
{
    std::array<char, 24> buffer {};
    const auto [end, error] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), x);
    FOLIO_ASSERT(error == std::errc {});
    for (const char* p = buffer.data(); p != end; ++p) {
        out.push_back(char8_t(*p));
    }
}

void append_chars(Pmr_String& out, std::string_view str)
{
    for (const char c : str) {
        out.push_back(char8_t(c));
    }
}

void append_quoted(Pmr_String& out, std::u8string_view str)
{
    out += u8'"';
    for (const char8_t c : str) {
        switch (c) {
        case u8'"': out += u8"\\\""; break;
        case u8'\\': out += u8"\\\\"; break;
        case u8'\n': out += u8"\\n"; break;
        case u8'\t': out += u8"\\t"; break;
        default: out += c; break;
        }
    }
    out += u8'"';
}

void append_indent(Pmr_String& out, int indent)
{
    for (int i = 0; i < indent; ++i) {
        out += u8"  ";
    }
}

struct Free_Deleter {
    void operator()(char* p) const noexcept
    {
        std::free(p); // NOLINT(cppcoreguidelines-no-malloc)
    }
};

} // namespace

void print_type_name(Pmr_String& out, const std::type_info& type)
{
    int status = 0;
    const std::unique_ptr<char, Free_Deleter> demangled {
        abi::__cxa_demangle(type.name(), nullptr, nullptr, &status)
    };
    append_chars(out, status == 0 && demangled ? demangled.get() : type.name());
}

void print_position(Pmr_String& out, const Source_Position& pos)
{
    append_number(out, pos.line + 1);
    out += u8':';
    append_number(out, pos.column + 1);
}

void print_span(Pmr_String& out, const Source_Span& span)
{
    print_position(out, span.start);
    out += u8'-';
    print_position(out, span.end);
}

void print_node(Pmr_String& out, const Node& node)
{
    out += node_kind_display_name(node.get_kind());
    switch (node.get_kind()) {
    case Node_Kind::text: {
        out += u8' ';
        append_quoted(out, node.get_text());
        break;
    }
    case Node_Kind::raw: {
        out += u8" [";
        bool first = true;
        for (const Pmr_String& line : node.get_raw_lines()) {
            if (!first) {
                out += u8", ";
            }
            first = false;
            append_quoted(out, line);
        }
        out += u8']';
        break;
    }
    case Node_Kind::model: {
        out += u8' ';
        print_type_name(out, node.get_model().get_type());
        break;
    }
    default: break;
    }
}

void print_syntax_model(Pmr_String& out, const Syntax_Model& model, int indent)
{
    for (const auto& [span, node] : model) {
        append_indent(out, indent);
        print_node(out, node);
        out += u8" @ ";
        print_span(out, span);
        out += u8'\n';
        if (const auto* const nested = node.downcast<Syntax_Model>()) {
            print_syntax_model(out, *nested, indent + 1);
        }
    }
}

void print_command(Pmr_String& out, const Command& command)
{
    out += command_kind_name(command.get_kind());
    switch (command.get_kind()) {
    case Command_Kind::add_text: {
        out += u8' ';
        append_quoted(out, command.get_text());
        break;
    }
    case Command_Kind::layout_syntax_model: {
        out += u8" (";
        append_number(out, command.get_syntax_model().size());
        out += u8" nodes)";
        break;
    }
    default: break;
    }
}

} // namespace folio
