#ifndef INCLUDE_CIPHERBOOK_CRYPTO_KDFPARAMS_HPP
#define INCLUDE_CIPHERBOOK_CRYPTO_KDFPARAMS_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace cipherbook::crypto
{

constexpr std::size_t g_kMinSaltBytes{ 16 };
constexpr std::size_t g_kPasswordKeyBytes{ 32 };

constexpr std::uint32_t g_kKdfPolicyVersion{ 1 };

constexpr std::uint32_t g_kMaxPbkdf2Iterations{ 10'000'000U };
constexpr std::uint32_t g_kMaxArgon2Iterations{ 10U };
constexpr std::uint32_t g_kMaxArgon2MemoryKiB{ 1024U * 1024U };
constexpr std::uint32_t g_kMaxArgon2Parallelism{ 16U };

enum class KdfAlgorithm : std::uint32_t
{
    Pbkdf2HmacSha256 = 1U,
    Argon2id = 2U,
};

// Everything needed to re-derive a password key. Persisted next to the wrapped data key.
// memoryKiB and parallelism are meaningful for Argon2id only and stay 0 for PBKDF2.
struct KdfParams final
{
    std::uint32_t policyVersion{ g_kKdfPolicyVersion };
    KdfAlgorithm algorithm{ KdfAlgorithm::Pbkdf2HmacSha256 };
    std::uint32_t iterations{};
    std::uint32_t memoryKiB{};
    std::uint32_t parallelism{};
    std::vector<std::uint8_t> salt;

    friend bool operator==(const KdfParams&, const KdfParams&) = default;
};

} // namespace cipherbook::crypto

#endif // INCLUDE_CIPHERBOOK_CRYPTO_KDFPARAMS_HPP
