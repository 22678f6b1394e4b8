#include "cipherbook/core/VaultSession.hpp"
#include <utility>

namespace cipherbook::core
{

VaultSession::VaultSession(DataKey&& key, Duration timeout, NowProvider nowProvider)
    : m_now(std::move(nowProvider)), m_timeout(timeout), m_lastActivity{}, m_key(std::move(key))
{
    m_lastActivity = m_now();
}

void VaultSession::touch() noexcept
{
    m_lastActivity = m_now();
}

bool VaultSession::isExpired() const noexcept
{
    if (m_timeout.count() <= 0)
    {
        return false;
    }

    return (m_now() - m_lastActivity) > m_timeout;
}

bool VaultSession::isUnlocked() const noexcept
{
    return !m_key.empty();
}

bool VaultSession::touchIfUnlocked() noexcept
{
    if (!isUnlocked())
    {
        return false;
    }
    if (isExpired())
    {
        lock();
        return false;
    }
    touch();
    return true;
}

void VaultSession::lock() noexcept
{
    m_key.wipe();
}

void VaultSession::setTimeout(Duration timeout) noexcept
{
    m_timeout = timeout;
}

VaultSession::Duration VaultSession::timeout() const noexcept
{
    return m_timeout;
}

const DataKey& VaultSession::dataKey() const noexcept
{
    return m_key;
}

} // namespace cipherbook::core
