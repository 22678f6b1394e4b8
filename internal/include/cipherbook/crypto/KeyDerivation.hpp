#ifndef INCLUDE_CIPHERBOOK_CRYPTO_KEYDERIVATION_HPP
#define INCLUDE_CIPHERBOOK_CRYPTO_KEYDERIVATION_HPP

#include "cipherbook/crypto/KdfParams.hpp"
#include "cipherbook/security/SecureBuffer.hpp"
#include <cstddef>
#include <span>
#include <stdexcept>

namespace cipherbook::crypto
{

// Shared by every provider so that both reject the same parameter sets.
inline void requireUsableKdfParams(std::span<const std::byte> password, const KdfParams& params)
{
    if (password.empty())
    {
        throw std::invalid_argument("derivePasswordKey: empty password");
    }
    if (params.policyVersion != g_kKdfPolicyVersion)
    {
        throw std::invalid_argument("derivePasswordKey: unsupported policyVersion");
    }
    if (params.salt.size() < g_kMinSaltBytes)
    {
        throw std::invalid_argument("derivePasswordKey: salt too short");
    }
    if (params.iterations == 0U)
    {
        throw std::invalid_argument("derivePasswordKey: zero iterations");
    }

    switch (params.algorithm)
    {
    case KdfAlgorithm::Pbkdf2HmacSha256:
        if (params.iterations > g_kMaxPbkdf2Iterations)
        {
            throw std::invalid_argument("derivePasswordKey: unsafe PBKDF2 iteration count");
        }
        return;
    case KdfAlgorithm::Argon2id:
        if (params.parallelism == 0U || params.parallelism > g_kMaxArgon2Parallelism ||
            params.iterations > g_kMaxArgon2Iterations || params.memoryKiB > g_kMaxArgon2MemoryKiB)
        {
            throw std::invalid_argument("derivePasswordKey: unsafe Argon2id parameters");
        }
        if (params.memoryKiB < params.parallelism * 8U)
        {
            throw std::invalid_argument("derivePasswordKey: Argon2id memory too small for parallelism");
        }
        return;
    }
    throw std::invalid_argument("derivePasswordKey: unsupported algorithm");
}

// Monocypher back end. Expects parameters already checked by requireUsableKdfParams.
[[nodiscard]] cipherbook::security::SecureBuffer deriveKeyArgon2id(std::span<const std::byte> password,
                                                                  const KdfParams& params);

} // namespace cipherbook::crypto

#endif // INCLUDE_CIPHERBOOK_CRYPTO_KEYDERIVATION_HPP
