#ifndef INCLUDE_CIPHERBOOK_CORE_AEADCIPHER_HPP
#define INCLUDE_CIPHERBOOK_CORE_AEADCIPHER_HPP

#include "cipherbook/crypto/ICryptoProvider.hpp"
#include "cipherbook/security/SecureBuffer.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cipherbook::core
{

enum class CipherError : std::uint8_t
{
    // Tag mismatch, wrong key, truncated or malformed envelope. Deliberately not told apart.
    DecryptFailed,
    Locked,
    CryptoError,
};

template <class T> using CipherResult = std::variant<T, CipherError>;

struct SealedBox final
{
    std::array<std::uint8_t, cipherbook::crypto::g_aeadNonceBytes> nonce{};
    std::vector<std::uint8_t> cipherTextWithTag;
};

// One-shot AEAD over a provider. Stateless apart from the provider's RNG.
// String envelopes are base64(nonce || ciphertext || tag).
class AeadCipher final
{
public:
    explicit AeadCipher(cipherbook::crypto::ICryptoProvider& crypto) noexcept;

    [[nodiscard]] CipherResult<SealedBox> seal(std::span<const std::uint8_t> key, std::span<const std::byte> plainText,
                                               std::span<const std::byte> associatedData = {}) noexcept;

    [[nodiscard]] CipherResult<cipherbook::security::SecureBuffer>
    open(std::span<const std::uint8_t> key, std::span<const std::uint8_t> nonce,
         std::span<const std::uint8_t> cipherTextWithTag, std::span<const std::byte> associatedData = {}) noexcept;

    [[nodiscard]] CipherResult<std::string> sealToString(std::span<const std::uint8_t> key,
                                                         std::span<const std::byte> plainText,
                                                         std::span<const std::byte> associatedData = {}) noexcept;

    [[nodiscard]] CipherResult<cipherbook::security::SecureBuffer>
    openFromString(std::span<const std::uint8_t> key, std::string_view envelope,
                   std::span<const std::byte> associatedData = {}) noexcept;

private:
    cipherbook::crypto::ICryptoProvider* m_crypto{ nullptr };
};

} // namespace cipherbook::core

#endif // INCLUDE_CIPHERBOOK_CORE_AEADCIPHER_HPP
