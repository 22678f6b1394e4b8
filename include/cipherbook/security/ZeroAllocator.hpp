#ifndef INCLUDE_CIPHERBOOK_SECURITY_ZEROALLOCATOR_HPP
#define INCLUDE_CIPHERBOOK_SECURITY_ZEROALLOCATOR_HPP

#include "cipherbook/security/MemoryWiper.hpp"
#include <cstddef>
#include <limits>
#include <new>
#include <span>
#include <type_traits>

namespace cipherbook::security
{

// Allocator that wipes every block before handing it back to the heap.
// Containers using it never leave key material behind on reallocation.
template <class T> struct ZeroAllocator
{
    using value_type = T;
    using is_always_equal = std::true_type;
    using propagate_on_container_move_assignment = std::true_type;
    using propagate_on_container_swap = std::true_type;

    ZeroAllocator() noexcept = default;

    template <class U> constexpr explicit ZeroAllocator([[maybe_unused]] const ZeroAllocator<U>& other) noexcept
    {
    }

    [[nodiscard]] T* allocate(std::size_t count)
    {
        if (count == 0U)
        {
            return nullptr;
        }
        if (count > (std::numeric_limits<std::size_t>::max() / sizeof(T)))
        {
            throw std::bad_array_new_length{};
        }
        return static_cast<T*>(::operator new(count * sizeof(T), std::align_val_t{ alignof(T) }));
    }

    void deallocate(T* ptr, std::size_t count) noexcept
    {
        if (ptr == nullptr)
        {
            return;
        }
        if (count != 0U)
        {
            secureWipe(std::span<std::byte>{ reinterpret_cast<std::byte*>(ptr), count * sizeof(T) });
        }
        ::operator delete(ptr, std::align_val_t{ alignof(T) });
    }
};

template <class T, class U>
constexpr bool operator==([[maybe_unused]] const ZeroAllocator<T>& lhs,
                          [[maybe_unused]] const ZeroAllocator<U>& rhs) noexcept
{
    return true;
}

} // namespace cipherbook::security

#endif // INCLUDE_CIPHERBOOK_SECURITY_ZEROALLOCATOR_HPP
