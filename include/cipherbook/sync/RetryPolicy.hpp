#ifndef INCLUDE_CIPHERBOOK_SYNC_RETRYPOLICY_HPP
#define INCLUDE_CIPHERBOOK_SYNC_RETRYPOLICY_HPP

#include <chrono>
#include <cstdint>

namespace cipherbook::sync
{

struct RetryPolicy final
{
    std::chrono::milliseconds initialDelay{ std::chrono::seconds{ 2 } };
    std::chrono::milliseconds maxDelay{ std::chrono::minutes{ 5 } };
};

// initialDelay * 2^(attempt-1), capped at maxDelay. attempt 0 means no wait.
[[nodiscard]] constexpr std::chrono::milliseconds backoffDelay(const RetryPolicy& policy,
                                                               std::uint32_t attempt) noexcept
{
    if (attempt == 0U)
    {
        return std::chrono::milliseconds{ 0 };
    }
    auto delay{ policy.initialDelay };
    for (std::uint32_t i{ 1U }; i < attempt; ++i)
    {
        if (delay >= policy.maxDelay / 2)
        {
            return policy.maxDelay;
        }
        delay *= 2;
    }
    return (delay < policy.maxDelay) ? delay : policy.maxDelay;
}

} // namespace cipherbook::sync

#endif // INCLUDE_CIPHERBOOK_SYNC_RETRYPOLICY_HPP
