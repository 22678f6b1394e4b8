#ifndef INCLUDE_CIPHERBOOK_SECURITY_SECUREEQUALS_HPP
#define INCLUDE_CIPHERBOOK_SECURITY_SECUREEQUALS_HPP

#include "cipherbook/security/SecureBuffer.hpp"
#include "cipherbook/security/SecureString.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace cipherbook::security
{

// Compares key material or passwords without an early exit. Only the length leaks.
[[nodiscard]] inline bool secureEquals(std::span<const std::byte> lhs, std::span<const std::byte> rhs) noexcept
{
    if (lhs.size() != rhs.size())
    {
        return false;
    }

    volatile std::uint8_t acc{ 0U };
    for (std::size_t i{ 0U }; i < lhs.size(); ++i)
    {
        acc = static_cast<std::uint8_t>(acc | std::to_integer<std::uint8_t>(lhs[i] ^ rhs[i]));
    }
    return acc == 0U;
}

[[nodiscard]] inline bool secureEquals(const SecureBuffer& lhs, const SecureBuffer& rhs) noexcept
{
    return secureEquals(asBytes(lhs), asBytes(rhs));
}

// Used for "confirm password" prompts.
[[nodiscard]] inline bool secureEquals(const SecureString& lhs, const SecureString& rhs) noexcept
{
    return secureEquals(asBytes(lhs), asBytes(rhs));
}

} // namespace cipherbook::security

#endif // INCLUDE_CIPHERBOOK_SECURITY_SECUREEQUALS_HPP
