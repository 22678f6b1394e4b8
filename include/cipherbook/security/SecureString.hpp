#ifndef INCLUDE_CIPHERBOOK_SECURITY_SECURESTRING_HPP
#define INCLUDE_CIPHERBOOK_SECURITY_SECURESTRING_HPP

#include "cipherbook/security/SecureBuffer.hpp"
#include "cipherbook/security/ZeroAllocator.hpp"
#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace cipherbook::security
{

// Passwords and decrypted field values. Not NUL-terminated.
using SecureString = std::vector<char, ZeroAllocator<char>>;

[[nodiscard]] inline SecureString secureStringFrom(std::string_view s)
{
    // Parentheses select the iterator-range constructor.
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureString(s.begin(), s.end());
}

[[nodiscard]] inline SecureString secureStringFrom(const SecureBuffer& bytes)
{
    SecureString out{};
    out.reserve(bytes.size());
    for (const std::uint8_t b : bytes)
    {
        out.push_back(static_cast<char>(b));
    }
    return out;
}

[[nodiscard]] inline std::string_view asStringView(const SecureString& s) noexcept
{
    if (s.empty())
    {
        return {};
    }
    return std::string_view{ s.data(), s.size() };
}

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureString& s) noexcept
{
    return std::as_writable_bytes(std::span{ s });
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureString& s) noexcept
{
    return std::as_bytes(std::span{ s });
}

inline void secureRelease(SecureString& s) noexcept
{
    secureWipe(asWritableBytes(s));
    SecureString empty{};
    s.swap(empty);
}

} // namespace cipherbook::security

#endif // INCLUDE_CIPHERBOOK_SECURITY_SECURESTRING_HPP
