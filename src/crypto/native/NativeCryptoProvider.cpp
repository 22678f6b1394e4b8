#include "cipherbook/crypto/KeyDerivation.hpp"
#include "cipherbook/crypto/providers/NativeProviderFactory.hpp"
#include "cipherbook/security/SecureBuffer.hpp"
#include "cipherbook/security/SecureRandom.hpp"
#include "monocypher.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace cipherbook::crypto::providers
{
namespace
{

const std::uint8_t* bytePtr(std::span<const std::byte> s) noexcept
{
    return reinterpret_cast<const std::uint8_t*>(s.data());
}

// Keyed ChaCha20-Poly1305 stream context that is wiped when it leaves scope.
class IetfAeadContext final
{
public:
    IetfAeadContext(std::span<const std::uint8_t> key, std::span<const std::uint8_t> nonce, const char* op)
    {
        if (key.size() != g_aeadKeyBytes)
        {
            throw std::invalid_argument(std::string{ op } + ": key must be 32 bytes");
        }
        if (nonce.size() != g_aeadNonceBytes)
        {
            throw std::invalid_argument(std::string{ op } + ": nonce must be 12 bytes");
        }
        crypto_aead_init_ietf(&m_ctx, key.data(), nonce.data());
    }

    IetfAeadContext(const IetfAeadContext&) = delete;
    IetfAeadContext& operator=(const IetfAeadContext&) = delete;
    IetfAeadContext(IetfAeadContext&&) = delete;
    IetfAeadContext& operator=(IetfAeadContext&&) = delete;

    ~IetfAeadContext()
    {
        crypto_wipe(&m_ctx, sizeof(m_ctx));
    }

    [[nodiscard]] crypto_aead_ctx* get() noexcept
    {
        return &m_ctx;
    }

private:
    crypto_aead_ctx m_ctx{};
};

// Argon2id and the AEAD run on Monocypher. Monocypher has no SHA-256, so
// PBKDF2 vaults are handed to the optional fallback provider; without one
// they are reported as unsupported.
class NativeCryptoProvider final : public cipherbook::crypto::ICryptoProvider
{
public:
    explicit NativeCryptoProvider(std::unique_ptr<cipherbook::crypto::ICryptoProvider> pbkdf2Fallback)
        : m_pbkdf2Fallback(std::move(pbkdf2Fallback))
    {
    }

    [[nodiscard]] std::string_view name() const noexcept override
    {
        return "monocypher";
    }

    [[nodiscard]] bool supportsKdf(cipherbook::crypto::KdfAlgorithm algorithm) const noexcept override
    {
        switch (algorithm)
        {
        case cipherbook::crypto::KdfAlgorithm::Argon2id:
            return true;
        case cipherbook::crypto::KdfAlgorithm::Pbkdf2HmacSha256:
            return m_pbkdf2Fallback != nullptr && m_pbkdf2Fallback->supportsKdf(algorithm);
        }
        return false;
    }

    [[nodiscard]] cipherbook::security::SecureBuffer
    derivePasswordKey(std::span<const std::byte> password, const cipherbook::crypto::KdfParams& params) const override
    {
        cipherbook::crypto::requireUsableKdfParams(password, params);
        if (params.algorithm == cipherbook::crypto::KdfAlgorithm::Argon2id)
        {
            return cipherbook::crypto::deriveKeyArgon2id(password, params);
        }
        if (!m_pbkdf2Fallback)
        {
            throw std::invalid_argument("derivePasswordKey: PBKDF2 needs a fallback provider");
        }
        return m_pbkdf2Fallback->derivePasswordKey(password, params);
    }

    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return cipherbook::security::secureRandomFill(out);
    }

    [[nodiscard]] cipherbook::crypto::AeadBox aeadEncrypt(std::span<const std::uint8_t> key,
                                                          std::span<const std::byte> plainText,
                                                          std::span<const std::byte> associatedData) override
    {
        cipherbook::crypto::AeadBox box{};
        if (!randomBytes(std::span<std::uint8_t>{ box.nonce }))
        {
            throw std::runtime_error("aeadEncrypt: CSPRNG failure");
        }

        IetfAeadContext ctx{ key, box.nonce, "aeadEncrypt" };
        box.cipherText.resize(plainText.size());
        crypto_aead_write(ctx.get(), box.cipherText.data(), box.tag.data(), bytePtr(associatedData),
                          associatedData.size(), bytePtr(plainText), plainText.size());
        return box;
    }

    [[nodiscard]] std::optional<cipherbook::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const cipherbook::crypto::AeadBox& box,
                std::span<const std::byte> associatedData) override
    {
        IetfAeadContext ctx{ key, box.nonce, "aeadDecrypt" };

        cipherbook::security::SecureBuffer plainText{};
        plainText.resize(box.cipherText.size());
        if (crypto_aead_read(ctx.get(), plainText.data(), box.tag.data(), bytePtr(associatedData),
                             associatedData.size(), box.cipherText.data(), box.cipherText.size()) != 0)
        {
            cipherbook::security::secureRelease(plainText);
            return std::nullopt;
        }
        return plainText;
    }

private:
    std::unique_ptr<cipherbook::crypto::ICryptoProvider> m_pbkdf2Fallback;
};

} // namespace

[[nodiscard]] std::unique_ptr<cipherbook::crypto::ICryptoProvider>
makeNativeCryptoProvider(std::unique_ptr<cipherbook::crypto::ICryptoProvider> pbkdf2Fallback)
{
    return std::make_unique<NativeCryptoProvider>(std::move(pbkdf2Fallback));
}

} // namespace cipherbook::crypto::providers
