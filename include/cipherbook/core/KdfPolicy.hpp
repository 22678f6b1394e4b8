#ifndef INCLUDE_CIPHERBOOK_CORE_KDFPOLICY_HPP
#define INCLUDE_CIPHERBOOK_CORE_KDFPOLICY_HPP

#include "cipherbook/crypto/KdfParams.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>

namespace cipherbook::core
{

// Parameters used for new wrappings. Existing vaults keep whatever their stored params say.
struct KdfPolicy final
{
    cipherbook::crypto::KdfAlgorithm algorithm{ cipherbook::crypto::KdfAlgorithm::Pbkdf2HmacSha256 };
    std::uint32_t iterations{};
    std::uint32_t memoryKiB{};
    std::uint32_t parallelism{};
    std::size_t saltBytes{ cipherbook::crypto::g_kMinSaltBytes };
};

// PBKDF2-HMAC-SHA256, 210,000 iterations.
[[nodiscard]] KdfPolicy defaultKdfPolicy() noexcept;

// Argon2id, 3 passes over 64 MiB, single lane.
[[nodiscard]] KdfPolicy argon2idKdfPolicy() noexcept;

// Fills a fresh random salt. std::nullopt if the CSPRNG failed.
[[nodiscard]] std::optional<cipherbook::crypto::KdfParams> makeKdfParams(const KdfPolicy& policy);

} // namespace cipherbook::core

#endif // INCLUDE_CIPHERBOOK_CORE_KDFPOLICY_HPP
