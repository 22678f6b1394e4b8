#ifndef INCLUDE_CIPHERBOOK_SECURITY_SCOPEWIPE_HPP
#define INCLUDE_CIPHERBOOK_SECURITY_SCOPEWIPE_HPP

#include "cipherbook/security/MemoryWiper.hpp"
#include "cipherbook/security/SecureBuffer.hpp"
#include "cipherbook/security/SecureString.hpp"
#include <cstddef>
#include <span>

namespace cipherbook::security
{

// Wipes a borrowed byte range when the guard goes out of scope.
class [[nodiscard]] ScopeWipe final
{
public:
    explicit ScopeWipe(std::span<std::byte> bytes) noexcept : m_bytes{ bytes }
    {
    }

    ScopeWipe(const ScopeWipe&) = delete;
    ScopeWipe& operator=(const ScopeWipe&) = delete;

    ScopeWipe(ScopeWipe&& other) noexcept : m_bytes{ other.m_bytes }
    {
        other.m_bytes = {};
    }

    ScopeWipe& operator=(ScopeWipe&&) = delete;

    ~ScopeWipe() noexcept
    {
        secureWipe(m_bytes);
    }

    void release() noexcept
    {
        m_bytes = {};
    }

private:
    std::span<std::byte> m_bytes;
};

[[nodiscard]] inline ScopeWipe scopeWipe(SecureBuffer& b) noexcept
{
    return ScopeWipe{ asWritableBytes(b) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureString& s) noexcept
{
    return ScopeWipe{ asWritableBytes(s) };
}

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
[[nodiscard]] ScopeWipe scopeWipe(std::span<T> values) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(values) };
}

} // namespace cipherbook::security

#endif // INCLUDE_CIPHERBOOK_SECURITY_SCOPEWIPE_HPP
