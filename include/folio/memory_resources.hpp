#ifndef FOLIO_MEMORY_RESOURCES_HPP
#define FOLIO_MEMORY_RESOURCES_HPP

#include <cstddef>
#include <memory_resource>
#include <new>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace folio {

/// @brief A `pmr::memory_resource` which uses global (aligned) `operator new` and
/// `operator delete` for allocation and deallocation, respectively.
struct Global_Memory_Resource final : std::pmr::memory_resource {

    /// @brief Returns a pointer to an object of type `Global_Memory_Resource`
    /// with static duration.
    /// Note that all objects of this type are interchangeable,
    /// so `get()` is typically better than creating a new instance.
    [[nodiscard]]
    static Global_Memory_Resource* get() noexcept
    {
        static constinit Global_Memory_Resource instance;
        return &instance;
    }

    [[nodiscard]]
    void* do_allocate(std::size_t bytes, std::size_t alignment) final
    {
        return ::operator new(bytes, std::align_val_t(alignment));
    }

    void do_deallocate(void* p, std::size_t bytes, std::size_t alignment) noexcept final
    {
        ::operator delete(p, bytes, std::align_val_t(alignment));
    }

    [[nodiscard]]
    bool do_is_equal(const std::pmr::memory_resource& other) const noexcept final
    {
        return dynamic_cast<const Global_Memory_Resource*>(&other) != nullptr;
    }
};

/// @brief Like `std::pmr::polymorphic_allocator`,
/// but propagated whenever possible.
/// In particular, copying a container keeps the memory resource of the original
/// instead of falling back to the default resource.
template <typename T>
struct Propagated_Polymorphic_Allocator {
    using propagate_on_container_copy_assignment = std::true_type;
    using propagate_on_container_move_assignment = std::true_type;
    using propagate_on_container_swap = std::true_type;

    using value_type = T;
    std::pmr::memory_resource* resource;

    [[nodiscard]]
    constexpr Propagated_Polymorphic_Allocator(
        std::pmr::memory_resource* resource = Global_Memory_Resource::get()
    ) noexcept
        : resource { resource }
    {
    }

    template <typename U>
        requires(!std::is_same_v<T, U>)
    Propagated_Polymorphic_Allocator(const Propagated_Polymorphic_Allocator<U>& other) noexcept
        : resource { other.resource }
    {
    }

    [[nodiscard]]
    T* allocate(std::size_t n)
    {
        return static_cast<T*>(resource->allocate(n * sizeof(T), alignof(T)));
    }

    void deallocate(T* p, std::size_t n)
    {
        resource->deallocate(p, n * sizeof(T), alignof(T));
    }

    friend bool
    operator==(const Propagated_Polymorphic_Allocator& x, const Propagated_Polymorphic_Allocator& y)
        = default;
};

template <typename T>
using Pmr_Vector = std::vector<T, Propagated_Polymorphic_Allocator<T>>;

using Pmr_String
    = std::basic_string<char8_t, std::char_traits<char8_t>, Propagated_Polymorphic_Allocator<char8_t>>;

[[nodiscard]]
inline Pmr_String to_pmr_string(std::u8string_view str, std::pmr::memory_resource* memory)
{
    return Pmr_String { str, Propagated_Polymorphic_Allocator<char8_t> { memory } };
}

[[nodiscard]]
inline std::pmr::memory_resource* get_memory(const Pmr_String& str)
{
    return str.get_allocator().resource;
}

template <typename T>
[[nodiscard]]
std::pmr::memory_resource* get_memory(const Pmr_Vector<T>& vec)
{
    return vec.get_allocator().resource;
}

} // namespace folio

#endif
