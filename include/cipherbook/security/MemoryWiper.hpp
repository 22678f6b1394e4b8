#ifndef INCLUDE_CIPHERBOOK_SECURITY_MEMORYWIPER_HPP
#define INCLUDE_CIPHERBOOK_SECURITY_MEMORYWIPER_HPP

#include <cstddef>
#include <span>
#include <type_traits>

namespace cipherbook::security
{

// Zeroes the bytes in a way the optimizer may not elide.
void secureWipe(std::span<std::byte> bytes) noexcept;

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(std::span<T> values) noexcept
{
    secureWipe(std::as_writable_bytes(values));
}

} // namespace cipherbook::security

#endif // INCLUDE_CIPHERBOOK_SECURITY_MEMORYWIPER_HPP
