#ifndef FOLIO_SYNTAX_MODEL_HPP
#define FOLIO_SYNTAX_MODEL_HPP

#include <concepts>
#include <cstddef>
#include <memory_resource>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "folio/util/assert.hpp"

#include "folio/fwd.hpp"
#include "folio/layout.hpp"
#include "folio/memory_resources.hpp"
#include "folio/model.hpp"
#include "folio/spanned.hpp"

namespace folio {

enum struct Node_Kind : Default_Underlying {
    /// @brief Whitespace containing less than two newlines.
    space,
    /// @brief Whitespace with two or more newlines.
    parbreak,
    /// @brief A forced line break.
    linebreak,
    /// @brief Plain text.
    text,
    /// @brief Lines of raw text.
    raw,
    /// @brief Italics were enabled or disabled.
    toggle_italic,
    /// @brief Bolder text was enabled or disabled.
    toggle_bolder,
    /// @brief A submodel, typically a function invocation.
    model,
};

[[nodiscard]]
constexpr std::u8string_view node_kind_display_name(Node_Kind kind)
{
    using enum Node_Kind;
    switch (kind) {
    case space: return u8"space";
    case parbreak: return u8"paragraph break";
    case linebreak: return u8"line break";
    case text: return u8"text";
    case raw: return u8"raw text";
    case toggle_italic: return u8"italic toggle";
    case toggle_bolder: return u8"bolder toggle";
    case model: return u8"model";
    }
    FOLIO_ASSERT_UNREACHABLE(u8"Invalid kind.");
}

/// @brief A node in a `Syntax_Model`.
///
/// Apart from `Node_Kind::model`, all kinds of node are plain data.
/// Model nodes own a `Boxed_Model`,
/// which is how the syntax tree is extended with new constructs
/// without adding new kinds of node.
struct Node {
public:
    using Raw_Lines = Pmr_Vector<Pmr_String>;

    [[nodiscard]]
    static Node space() noexcept
    {
        return Node { Node_Kind::space };
    }

    [[nodiscard]]
    static Node parbreak() noexcept
    {
        return Node { Node_Kind::parbreak };
    }

    [[nodiscard]]
    static Node linebreak() noexcept
    {
        return Node { Node_Kind::linebreak };
    }

    [[nodiscard]]
    static Node toggle_italic() noexcept
    {
        return Node { Node_Kind::toggle_italic };
    }

    [[nodiscard]]
    static Node toggle_bolder() noexcept
    {
        return Node { Node_Kind::toggle_bolder };
    }

    [[nodiscard]]
    static Node text(
        std::u8string_view str,
        std::pmr::memory_resource* memory = Global_Memory_Resource::get()
    );

    [[nodiscard]]
    static Node raw(
        std::span<const std::u8string_view> lines,
        std::pmr::memory_resource* memory = Global_Memory_Resource::get()
    );

    [[nodiscard]]
    static Node raw(Raw_Lines&& lines);

    [[nodiscard]]
    static Node model(Boxed_Model&& model);

    /// @brief Equivalent to `model(Boxed_Model::make(std::forward<T>(value), memory))`.
    template <typename T>
        requires concrete_model<std::remove_cvref_t<T>>
        && (!std::same_as<std::remove_cvref_t<T>, Boxed_Model>)
    [[nodiscard]]
    static Node
    model(T&& value, std::pmr::memory_resource* memory = Global_Memory_Resource::get())
    {
        return model(Boxed_Model::make(std::forward<T>(value), memory));
    }

private:
    Node_Kind m_kind;
    std::variant<std::monostate, Pmr_String, Raw_Lines, Boxed_Model> m_extra;

    [[nodiscard]]
    explicit Node(Node_Kind kind) noexcept
        : m_kind { kind }
    {
    }

    template <typename T>
    [[nodiscard]]
    Node(Node_Kind kind, T&& extra)
        : m_kind { kind }
        , m_extra { std::forward<T>(extra) }
    {
    }

public:
    [[nodiscard]]
    Node_Kind get_kind() const noexcept
    {
        return m_kind;
    }

    [[nodiscard]]
    bool is_model() const noexcept
    {
        return m_kind == Node_Kind::model;
    }

    [[nodiscard]]
    std::u8string_view get_text() const
    {
        FOLIO_ASSERT(m_kind == Node_Kind::text);
        return std::get<Pmr_String>(m_extra);
    }

    [[nodiscard]]
    std::span<const Pmr_String> get_raw_lines() const
    {
        FOLIO_ASSERT(m_kind == Node_Kind::raw);
        return std::get<Raw_Lines>(m_extra);
    }

    [[nodiscard]]
    const Boxed_Model& get_model() const
    {
        FOLIO_ASSERT(m_kind == Node_Kind::model);
        return std::get<Boxed_Model>(m_extra);
    }

    [[nodiscard]]
    Boxed_Model& get_model()
    {
        FOLIO_ASSERT(m_kind == Node_Kind::model);
        return std::get<Boxed_Model>(m_extra);
    }

    /// @brief Returns the submodel of this node if this is a model node
    /// and the submodel is of type `T`, otherwise a null pointer.
    template <concrete_model T>
    [[nodiscard]]
    const T* downcast() const
    {
        return is_model() ? get_model().downcast<T>() : nullptr;
    }

    template <concrete_model T>
    [[nodiscard]]
    T* downcast()
    {
        return is_model() ? get_model().downcast<T>() : nullptr;
    }

    /// @brief Two nodes are equal if they are of the same kind and have equal contents.
    /// Submodels are equal if they have the same concrete type and compare equal.
    [[nodiscard]]
    friend bool operator==(const Node&, const Node&)
        = default;
};

/// @brief A tree representation of source code.
///
/// The nodes appear in document order.
/// A syntax model is only ever built up by appending nodes,
/// in the order in which they are parsed.
struct Syntax_Model {
private:
    Span_Vector<Node> m_nodes;

public:
    /// @brief Creates an empty syntax model.
    [[nodiscard]]
    explicit Syntax_Model(std::pmr::memory_resource* memory = Global_Memory_Resource::get())
        : m_nodes { memory }
    {
    }

    /// @brief Appends `node` to the model.
    void add(Spanned<Node>&& node)
    {
        m_nodes.push_back(std::move(node));
    }

    void add(const Source_Span& span, Node&& node)
    {
        m_nodes.push_back({ span, std::move(node) });
    }

    [[nodiscard]]
    std::span<const Spanned<Node>> get_nodes() const noexcept
    {
        return m_nodes;
    }

    /// @brief Returns the nodes for in-place modification of their contents.
    /// Nodes cannot be added or removed through the result.
    [[nodiscard]]
    std::span<Spanned<Node>> get_nodes() noexcept
    {
        return m_nodes;
    }

    [[nodiscard]]
    const Spanned<Node>& operator[](std::size_t i) const
    {
        FOLIO_ASSERT(i < m_nodes.size());
        return m_nodes[i];
    }

    [[nodiscard]]
    std::size_t size() const noexcept
    {
        return m_nodes.size();
    }

    [[nodiscard]]
    bool empty() const noexcept
    {
        return m_nodes.empty();
    }

    [[nodiscard]]
    auto begin() const noexcept
    {
        return m_nodes.begin();
    }

    [[nodiscard]]
    auto end() const noexcept
    {
        return m_nodes.end();
    }

    [[nodiscard]]
    std::pmr::memory_resource* get_memory() const noexcept
    {
        return folio::get_memory(m_nodes);
    }

    /// @brief Yields a single command which instructs the layout engine
    /// to lay out the nodes of this model.
    /// This never suspends and never produces feedback.
    [[nodiscard]]
    Layout_Task layout(const Layout_Context& context) const;

    [[nodiscard]]
    friend bool operator==(const Syntax_Model&, const Syntax_Model&)
        = default;
};

static_assert(concrete_model<Syntax_Model>);

} // namespace folio

#endif
