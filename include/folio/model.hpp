#ifndef FOLIO_MODEL_HPP
#define FOLIO_MODEL_HPP

#include <concepts>
#include <memory_resource>
#include <type_traits>
#include <typeinfo>
#include <utility>

#include "folio/util/assert.hpp"

#include "folio/fwd.hpp"
#include "folio/layout.hpp"
#include "folio/memory_resources.hpp"

namespace folio {

/// @brief A type whose values can be stored in a syntax tree as a submodel.
///
/// Such a type can be laid out into commands, compared with values of its own type,
/// and copied.
/// Additionally, values of the type have to be self-contained:
/// they shall not refer to data they do not own (other than static data),
/// since submodels are kept alive independently of the source they were parsed from.
///
/// The `layout` member function may return commands which borrow from the model.
template <typename T>
concept concrete_model = std::is_object_v<T> //
    && !std::is_const_v<T> //
    && !std::is_volatile_v<T> //
    && !std::is_array_v<T> //
    && !std::is_pointer_v<T> //
    && std::copy_constructible<T> //
    && std::equality_comparable<T> //
    && requires(const T& m, const Layout_Context& context) {
           { m.layout(context) } -> std::same_as<Layout_Task>;
       };

template <concrete_model T>
struct Erased_Model;

/// @brief A model whose concrete type is not statically known.
///
/// The only implementation of this interface is `Erased_Model<T>`,
/// which makes it possible to recover the concrete type safely via `downcast`.
struct Model {
private:
    template <concrete_model T>
    friend struct Erased_Model;

    Model() = default;

public:
    Model(const Model&) = delete;
    Model& operator=(const Model&) = delete;

    virtual ~Model() = default;

    /// @brief Lays out this model into commands,
    /// possibly suspending when `context` provides a scheduler.
    /// The commands of the resulting `Pass` may borrow from `*this`,
    /// which therefore has to outlive them.
    /// The returned task is lazy and borrows `context`,
    /// so `context` has to outlive the task as well.
    [[nodiscard]]
    virtual Layout_Task layout(const Layout_Context& context) const
        = 0;

    /// @brief Returns the runtime type of the concrete model.
    [[nodiscard]]
    virtual const std::type_info& get_type() const noexcept
        = 0;

    /// @brief Returns `true` iff `other` holds a model of the same concrete type
    /// that compares equal to this one.
    /// Models of different types are never equal.
    [[nodiscard]]
    virtual bool equals(const Model& other) const
        = 0;

    /// @brief Returns a deep copy of this model, allocated using `memory`.
    /// The result has to be released using `destroy` with the same `memory`.
    [[nodiscard]]
    virtual Model* clone(std::pmr::memory_resource* memory) const
        = 0;

    /// @brief Destroys this model and frees its storage.
    /// `memory` shall be the resource this model was allocated with.
    virtual void destroy(std::pmr::memory_resource* memory) noexcept = 0;

    /// @brief Returns a pointer to the concrete model
    /// if its type is exactly `T`, otherwise a null pointer.
    template <concrete_model T>
    [[nodiscard]]
    const T* downcast() const noexcept;

    template <concrete_model T>
    [[nodiscard]]
    T* downcast() noexcept
    {
        return const_cast<T*>(std::as_const(*this).downcast<T>()); // NOLINT
    }
};

template <concrete_model T>
struct Erased_Model final : Model {
private:
    T m_value;

public:
    template <typename... Args>
        requires std::is_constructible_v<T, Args&&...>
    [[nodiscard]]
    explicit Erased_Model(Args&&... args)
        : m_value(std::forward<Args>(args)...)
    {
    }

    /// @brief Allocates a new `Erased_Model<T>` using `memory`.
    template <typename... Args>
    [[nodiscard]]
    static Erased_Model* make(std::pmr::memory_resource* memory, Args&&... args)
    {
        FOLIO_ASSERT(memory);
        std::pmr::polymorphic_allocator<> alloc { memory };
        return alloc.new_object<Erased_Model>(std::forward<Args>(args)...);
    }

    [[nodiscard]]
    const T& get() const noexcept
    {
        return m_value;
    }

    [[nodiscard]]
    T& get() noexcept
    {
        return m_value;
    }

    [[nodiscard]]
    Layout_Task layout(const Layout_Context& context) const final
    {
        return m_value.layout(context);
    }

    [[nodiscard]]
    const std::type_info& get_type() const noexcept final
    {
        return typeid(T);
    }

    [[nodiscard]]
    bool equals(const Model& other) const final
    {
        const T* const other_value = other.downcast<T>();
        return other_value != nullptr && m_value == *other_value;
    }

    [[nodiscard]]
    Model* clone(std::pmr::memory_resource* memory) const final
    {
        return make(memory, m_value);
    }

    void destroy(std::pmr::memory_resource* memory) noexcept final
    {
        std::pmr::polymorphic_allocator<> alloc { memory };
        alloc.delete_object(this);
    }
};

template <concrete_model T>
const T* Model::downcast() const noexcept
{
    if (get_type() != typeid(T)) {
        return nullptr;
    }
    // Erased_Model<T> is the only type whose get_type() is typeid(T).
    return &static_cast<const Erased_Model<T>&>(*this).get();
}

/// @brief An owning, type-erased handle to a model.
///
/// Copying a `Boxed_Model` deep-copies the held model into the same memory resource,
/// and comparing two boxes compares the held models.
/// A moved-from box holds nothing and may only be assigned to or destroyed.
struct Boxed_Model {
private:
    Model* m_model;
    std::pmr::memory_resource* m_memory;

    [[nodiscard]]
    Boxed_Model(Model* model, std::pmr::memory_resource* memory) noexcept
        : m_model { model }
        , m_memory { memory }
    {
    }

public:
    /// @brief Creates a box holding a copy of (or value moved from) `value`.
    template <typename T>
        requires concrete_model<std::remove_cvref_t<T>>
        && (!std::same_as<std::remove_cvref_t<T>, Boxed_Model>)
    [[nodiscard]]
    static Boxed_Model
    make(T&& value, std::pmr::memory_resource* memory = Global_Memory_Resource::get())
    {
        using Erased = Erased_Model<std::remove_cvref_t<T>>;
        return { Erased::make(memory, std::forward<T>(value)), memory };
    }

    /// @brief Creates a box holding a `T` constructed in place from `args`.
    template <concrete_model T, typename... Args>
        requires std::is_constructible_v<T, Args&&...>
    [[nodiscard]]
    static Boxed_Model emplace(std::pmr::memory_resource* memory, Args&&... args)
    {
        return { Erased_Model<T>::make(memory, std::forward<Args>(args)...), memory };
    }

    [[nodiscard]]
    Boxed_Model(const Boxed_Model& other)
        : m_model { other.get().clone(other.m_memory) }
        , m_memory { other.m_memory }
    {
    }

    [[nodiscard]]
    Boxed_Model(Boxed_Model&& other) noexcept
        : m_model { std::exchange(other.m_model, nullptr) }
        , m_memory { other.m_memory }
    {
    }

    Boxed_Model& operator=(const Boxed_Model& other)
    {
        if (this != &other) {
            Boxed_Model copy = other;
            swap(copy);
        }
        return *this;
    }

    Boxed_Model& operator=(Boxed_Model&& other) noexcept
    {
        Boxed_Model moved = std::move(other);
        swap(moved);
        return *this;
    }

    ~Boxed_Model()
    {
        if (m_model) {
            m_model->destroy(m_memory);
        }
    }

    void swap(Boxed_Model& other) noexcept
    {
        std::swap(m_model, other.m_model);
        std::swap(m_memory, other.m_memory);
    }

    [[nodiscard]]
    bool has_value() const noexcept
    {
        return m_model != nullptr;
    }

    [[nodiscard]]
    const Model& get() const
    {
        FOLIO_ASSERT(m_model);
        return *m_model;
    }

    [[nodiscard]]
    Model& get()
    {
        FOLIO_ASSERT(m_model);
        return *m_model;
    }

    [[nodiscard]]
    const Model* operator->() const
    {
        return &get();
    }

    [[nodiscard]]
    std::pmr::memory_resource* get_memory() const noexcept
    {
        return m_memory;
    }

    [[nodiscard]]
    const std::type_info& get_type() const
    {
        return get().get_type();
    }

    /// @brief Returns `true` iff the held model is of type `T`.
    template <concrete_model T>
    [[nodiscard]]
    bool holds() const
    {
        return get().get_type() == typeid(T);
    }

    template <concrete_model T>
    [[nodiscard]]
    const T* downcast() const
    {
        return get().downcast<T>();
    }

    template <concrete_model T>
    [[nodiscard]]
    T* downcast()
    {
        return get().downcast<T>();
    }

    [[nodiscard]]
    Layout_Task layout(const Layout_Context& context) const
    {
        return get().layout(context);
    }

    [[nodiscard]]
    friend bool operator==(const Boxed_Model& x, const Boxed_Model& y)
    {
        return x.get().equals(y.get());
    }
};

} // namespace folio

#endif
