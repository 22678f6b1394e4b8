#include "cipherbook/security/SecureRandom.hpp"
#include <array>
#include <cerrno>
#include <cstddef>

#if defined(__linux__)
#include <sys/random.h>
#else
#error Unsupported platform
#endif

namespace cipherbook::security
{
namespace
{

constexpr std::size_t g_kUuidBytes{ 16U };
constexpr std::uint8_t g_kUuidVersionMask{ 0x0FU };
constexpr std::uint8_t g_kUuidVersion4{ 0x40U };
constexpr std::uint8_t g_kUuidVariantMask{ 0x3FU };
constexpr std::uint8_t g_kUuidVariantRfc4122{ 0x80U };

} // namespace

bool secureRandomFill(std::span<std::uint8_t> out) noexcept
{
    std::uint8_t* cursor{ out.data() };
    std::size_t remaining{ out.size() };

    while (remaining > 0U)
    {
        const ssize_t got{ ::getrandom(cursor, remaining, 0) };
        if (got < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return false;
        }
        if (got == 0 || static_cast<std::size_t>(got) > remaining)
        {
            return false;
        }
        remaining -= static_cast<std::size_t>(got);
        cursor += got;
    }
    return true;
}

std::optional<std::string> secureRandomUuid()
{
    std::array<std::uint8_t, g_kUuidBytes> raw{};
    if (!secureRandomFill(std::span{ raw }))
    {
        return std::nullopt;
    }

    raw[6] = static_cast<std::uint8_t>((raw[6] & g_kUuidVersionMask) | g_kUuidVersion4);
    raw[8] = static_cast<std::uint8_t>((raw[8] & g_kUuidVariantMask) | g_kUuidVariantRfc4122);

    constexpr char kHex[] = "0123456789abcdef";
    constexpr std::uint8_t kNibbleShift{ 4U };
    constexpr std::uint8_t kNibbleMask{ 0x0FU };

    std::string out{};
    out.reserve(36U);
    for (std::size_t i{}; i < raw.size(); ++i)
    {
        if (i == 4U || i == 6U || i == 8U || i == 10U)
        {
            out.push_back('-');
        }
        out.push_back(kHex[(raw[i] >> kNibbleShift) & kNibbleMask]);
        out.push_back(kHex[raw[i] & kNibbleMask]);
    }
    return out;
}

} // namespace cipherbook::security
