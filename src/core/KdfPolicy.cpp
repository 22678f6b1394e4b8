#include "cipherbook/core/KdfPolicy.hpp"
#include "cipherbook/security/SecureRandom.hpp"
#include <span>

namespace cipherbook::core
{

KdfPolicy defaultKdfPolicy() noexcept
{
    constexpr std::uint32_t kDefaultPbkdf2Iterations{ 210'000U };

    return KdfPolicy{
        .algorithm = cipherbook::crypto::KdfAlgorithm::Pbkdf2HmacSha256,
        .iterations = kDefaultPbkdf2Iterations,
        .memoryKiB = 0U,
        .parallelism = 0U,
        .saltBytes = cipherbook::crypto::g_kMinSaltBytes,
    };
}

KdfPolicy argon2idKdfPolicy() noexcept
{
    constexpr std::uint32_t kDefaultIterations{ 3U };
    constexpr std::uint32_t kDefaultMemoryMiB{ 64U };
    constexpr std::uint32_t kKiBPerMiB{ 1024U };
    constexpr std::uint32_t kDefaultParallelism{ 1U };

    return KdfPolicy{
        .algorithm = cipherbook::crypto::KdfAlgorithm::Argon2id,
        .iterations = kDefaultIterations,
        .memoryKiB = kDefaultMemoryMiB * kKiBPerMiB,
        .parallelism = kDefaultParallelism,
        .saltBytes = cipherbook::crypto::g_kMinSaltBytes,
    };
}

std::optional<cipherbook::crypto::KdfParams> makeKdfParams(const KdfPolicy& policy)
{
    cipherbook::crypto::KdfParams params{};
    params.policyVersion = cipherbook::crypto::g_kKdfPolicyVersion;
    params.algorithm = policy.algorithm;
    params.iterations = policy.iterations;
    params.memoryKiB = policy.memoryKiB;
    params.parallelism = policy.parallelism;
    params.salt.resize(policy.saltBytes);

    if (!cipherbook::security::secureRandomFill(std::span<std::uint8_t>{ params.salt }))
    {
        return std::nullopt;
    }

    return params;
}

} // namespace cipherbook::core
