#ifndef INCLUDE_CIPHERBOOK_CORE_DATAKEY_HPP
#define INCLUDE_CIPHERBOOK_CORE_DATAKEY_HPP

#include "cipherbook/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>

namespace cipherbook::core
{

constexpr std::size_t g_kDataKeyBytes{ 32 };

// The symmetric key that encrypts record fields. Move-only; wiped on destruction.
class DataKey final
{
public:
    DataKey() = default;
    explicit DataKey(cipherbook::security::SecureBuffer bytes) noexcept : m_bytes(std::move(bytes))
    {
    }

    DataKey(const DataKey&) = delete;
    DataKey& operator=(const DataKey&) = delete;

    DataKey(DataKey&& other) noexcept
    {
        m_bytes.swap(other.m_bytes);
    }

    DataKey& operator=(DataKey&& other) noexcept
    {
        if (this != &other)
        {
            cipherbook::security::secureRelease(m_bytes);
            m_bytes.swap(other.m_bytes);
        }
        return *this;
    }

    ~DataKey() noexcept
    {
        cipherbook::security::secureRelease(m_bytes);
    }

    [[nodiscard]] std::span<const std::uint8_t> bytes() const noexcept
    {
        return cipherbook::security::asSpan(m_bytes);
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return m_bytes.empty();
    }

    void wipe() noexcept
    {
        cipherbook::security::secureRelease(m_bytes);
    }

private:
    cipherbook::security::SecureBuffer m_bytes;
};

} // namespace cipherbook::core

#endif // INCLUDE_CIPHERBOOK_CORE_DATAKEY_HPP
