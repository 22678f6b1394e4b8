#ifndef INCLUDE_CIPHERBOOK_CORE_VAULTSESSION_HPP
#define INCLUDE_CIPHERBOOK_CORE_VAULTSESSION_HPP

#include "cipherbook/core/DataKey.hpp"
#include <chrono>
#include <functional>

namespace cipherbook::core
{

constexpr std::chrono::seconds g_kDefaultAutoLockTimeout{ 300 };

// The unlocked state of a vault. Holds the DataKey until lock(), expiry or destruction.
class VaultSession final
{
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::seconds;
    using NowProvider = std::function<TimePoint()>;

    explicit VaultSession(DataKey&& key, Duration timeout = g_kDefaultAutoLockTimeout,
                          NowProvider nowProvider = Clock::now);

    VaultSession(const VaultSession&) = delete;
    VaultSession& operator=(const VaultSession&) = delete;
    VaultSession(VaultSession&&) noexcept = default;
    VaultSession& operator=(VaultSession&&) noexcept = default;
    ~VaultSession() = default;

    void touch() noexcept;
    [[nodiscard]] bool isExpired() const noexcept;
    [[nodiscard]] bool isUnlocked() const noexcept;

    // Locks an expired session, otherwise refreshes its activity time. Returns whether it is still unlocked.
    [[nodiscard]] bool touchIfUnlocked() noexcept;

    void lock() noexcept;

    void setTimeout(Duration timeout) noexcept;
    [[nodiscard]] Duration timeout() const noexcept;

    // Empty once locked.
    [[nodiscard]] const DataKey& dataKey() const noexcept;

private:
    NowProvider m_now;
    Duration m_timeout{};
    TimePoint m_lastActivity{};
    DataKey m_key;
};

} // namespace cipherbook::core

#endif // INCLUDE_CIPHERBOOK_CORE_VAULTSESSION_HPP
