#ifndef INCLUDE_CIPHERBOOK_SECURITY_SECUREBUFFER_HPP
#define INCLUDE_CIPHERBOOK_SECURITY_SECUREBUFFER_HPP

#include "cipherbook/security/ZeroAllocator.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace cipherbook::security
{

using SecureBuffer = std::vector<std::uint8_t, ZeroAllocator<std::uint8_t>>;

[[nodiscard]] inline SecureBuffer secureBufferFrom(std::span<const std::uint8_t> bytes)
{
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureBuffer(bytes.begin(), bytes.end());
}

[[nodiscard]] inline std::span<const std::uint8_t> asSpan(const SecureBuffer& b) noexcept
{
    return std::span{ b };
}

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureBuffer& b) noexcept
{
    return std::as_writable_bytes(std::span{ b });
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureBuffer& b) noexcept
{
    return std::as_bytes(std::span{ b });
}

inline void secureWipeSize(SecureBuffer& b) noexcept
{
    secureWipe(asWritableBytes(b));
}

// Wipes and gives the allocation back, leaving an empty buffer with no capacity.
inline void secureRelease(SecureBuffer& b) noexcept
{
    secureWipeSize(b);
    SecureBuffer empty{};
    b.swap(empty);
}

} // namespace cipherbook::security

#endif // INCLUDE_CIPHERBOOK_SECURITY_SECUREBUFFER_HPP
