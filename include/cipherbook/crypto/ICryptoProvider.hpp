#ifndef INCLUDE_CIPHERBOOK_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_CIPHERBOOK_CRYPTO_ICRYPTOPROVIDER_HPP

#include "cipherbook/crypto/KdfParams.hpp"
#include "cipherbook/security/SecureBuffer.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace cipherbook::crypto
{

// Sizes baked into the stored envelope layout; every provider must honour them.
constexpr std::size_t g_aeadKeyBytes{ 32 };
constexpr std::size_t g_aeadNonceBytes{ 12 };
constexpr std::size_t g_aeadTagBytes{ 16 };

// One sealed field or wrapped key before it is framed for storage.
struct AeadBox final
{
    std::array<std::uint8_t, g_aeadNonceBytes> nonce{};
    std::array<std::uint8_t, g_aeadTagBytes> tag{};
    std::vector<std::uint8_t> cipherText;
};

class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    // Short backend label for logs ("openssl", "monocypher").
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    // True when derivePasswordKey() can serve the algorithm on this build.
    [[nodiscard]] virtual bool supportsKdf(KdfAlgorithm algorithm) const noexcept = 0;

    // Password -> 32-byte key-encryption key. Deterministic for equal inputs.
    // Unsupported algorithms or unsafe parameters throw std::invalid_argument,
    // back-end failures throw std::runtime_error.
    [[nodiscard]] virtual cipherbook::security::SecureBuffer derivePasswordKey(std::span<const std::byte> password,
                                                                             const KdfParams& params) const = 0;

    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;

    // AEAD: ChaCha20-Poly1305 (IETF, 12-byte nonce). A fresh random nonce is drawn per call.
    [[nodiscard]] virtual AeadBox aeadEncrypt(std::span<const std::uint8_t> key, std::span<const std::byte> plainText,
                                              std::span<const std::byte> associatedData) = 0;

    // Returns std::nullopt on authentication failure.
    [[nodiscard]] virtual std::optional<cipherbook::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const AeadBox& box, std::span<const std::byte> associatedData) = 0;
};

} // namespace cipherbook::crypto

#endif // INCLUDE_CIPHERBOOK_CRYPTO_ICRYPTOPROVIDER_HPP
