#ifndef INCLUDE_CIPHERBOOK_CORE_TIMESTAMP_HPP
#define INCLUDE_CIPHERBOOK_CORE_TIMESTAMP_HPP

#include <chrono>
#include <cstdint>
#include <functional>

namespace cipherbook::core
{

// Wall-clock instant with millisecond resolution; the unit stored locally and compared by LWW.
using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;
using WallClock = std::function<Timestamp()>;

[[nodiscard]] inline Timestamp systemNow() noexcept
{
    return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

[[nodiscard]] constexpr std::int64_t toUnixMillis(Timestamp t) noexcept
{
    return t.time_since_epoch().count();
}

[[nodiscard]] constexpr Timestamp fromUnixMillis(std::int64_t ms) noexcept
{
    return Timestamp{ std::chrono::milliseconds{ ms } };
}

} // namespace cipherbook::core

#endif // INCLUDE_CIPHERBOOK_CORE_TIMESTAMP_HPP
