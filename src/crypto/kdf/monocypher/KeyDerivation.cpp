#include "cipherbook/crypto/KeyDerivation.hpp"

#include "cipherbook/security/ZeroAllocator.hpp"
#include "monocypher.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <new>
#include <stdexcept>
#include <vector>

namespace cipherbook::crypto
{

[[nodiscard]] cipherbook::security::SecureBuffer deriveKeyArgon2id(std::span<const std::byte> password,
                                                                  const KdfParams& params)
{
    if (password.size() > std::numeric_limits<std::uint32_t>::max() ||
        params.salt.size() > std::numeric_limits<std::uint32_t>::max())
    {
        throw std::invalid_argument("deriveKeyArgon2id: input too large");
    }

    // One Argon2 block is 1 KiB, i.e. 128 64-bit words.
    constexpr std::size_t kWordsPerBlock{ 128U };
    if (params.memoryKiB > (std::numeric_limits<std::size_t>::max() / kWordsPerBlock))
    {
        throw std::bad_alloc{};
    }
    std::vector<std::uint64_t, cipherbook::security::ZeroAllocator<std::uint64_t>> workArea(
        static_cast<std::size_t>(params.memoryKiB) * kWordsPerBlock);

    cipherbook::security::SecureBuffer key{};
    key.resize(g_kPasswordKeyBytes);

    const crypto_argon2_config cfg{ .algorithm = CRYPTO_ARGON2_ID,
                                    .nb_blocks = params.memoryKiB,
                                    .nb_passes = params.iterations,
                                    .nb_lanes = params.parallelism };
    const crypto_argon2_inputs inputs{ .pass = reinterpret_cast<const std::uint8_t*>(password.data()),
                                       .salt = params.salt.data(),
                                       .pass_size = static_cast<std::uint32_t>(password.size()),
                                       .salt_size = static_cast<std::uint32_t>(params.salt.size()) };

    crypto_argon2(key.data(), static_cast<std::uint32_t>(key.size()), workArea.data(), cfg, inputs,
                  crypto_argon2_no_extras);
    return key;
}

} // namespace cipherbook::crypto
