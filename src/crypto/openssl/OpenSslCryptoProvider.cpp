#include "cipherbook/crypto/KeyDerivation.hpp"
#include "cipherbook/crypto/providers/OpenSslProviderFactory.hpp"
#include "cipherbook/security/SecureBuffer.hpp"
#include "cipherbook/security/SecureRandom.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <optional>
#include <span>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace cipherbook::crypto::providers
{
namespace
{

constexpr const char* g_kKdfParamArgon2Memcost{ "memcost" };
constexpr const char* g_kKdfParamArgon2Lanes{ "lanes" };
constexpr const char* g_kKdfParamThreads{ "threads" };
constexpr const char* g_kKdfParamArgon2Version{ "version" };

// Argon2 v1.3, the only version Monocypher implements.
constexpr std::uint32_t g_kArgon2Version13{ 0x13U };

void requireExactSize(std::span<const std::uint8_t> s, std::size_t expected, const char* what)
{
    if (s.size() != expected)
    {
        throw std::invalid_argument(what);
    }
}

void requireIntSized(std::size_t n, const char* what)
{
    if (n > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
        throw std::invalid_argument(what);
    }
}

using EvpKdfPtr = std::unique_ptr<EVP_KDF, decltype(&EVP_KDF_free)>;
using EvpKdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)>;
using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

// ARGON2ID ships with OpenSSL 3.2 and later; older libraries yield a null handle.
EvpKdfPtr fetchArgon2idKdf()
{
    return EvpKdfPtr{ EVP_KDF_fetch(nullptr, "ARGON2ID", nullptr), &EVP_KDF_free };
}

cipherbook::security::SecureBuffer derivePbkdf2HmacSha256(std::span<const std::byte> password,
                                                         const cipherbook::crypto::KdfParams& params)
{
    requireIntSized(password.size(), "derivePasswordKey: password too large");
    requireIntSized(params.salt.size(), "derivePasswordKey: salt too large");
    if (params.iterations > static_cast<std::uint32_t>(std::numeric_limits<int>::max()))
    {
        throw std::invalid_argument("derivePasswordKey: iteration count too large");
    }

    cipherbook::security::SecureBuffer out{};
    out.resize(cipherbook::crypto::g_kPasswordKeyBytes);

    const auto* passPtr{ reinterpret_cast<const char*>(password.data()) };
    if (PKCS5_PBKDF2_HMAC(passPtr, static_cast<int>(password.size()), params.salt.data(),
                          static_cast<int>(params.salt.size()), static_cast<int>(params.iterations), EVP_sha256(),
                          static_cast<int>(out.size()), out.data()) != 1)
    {
        cipherbook::security::secureRelease(out);
        throw std::runtime_error("derivePasswordKey: PKCS5_PBKDF2_HMAC failed");
    }
    return out;
}

class OpenSslCryptoProvider final : public cipherbook::crypto::ICryptoProvider
{
public:
    OpenSslCryptoProvider() : m_argon2idKdf{ fetchArgon2idKdf() }
    {
    }

    [[nodiscard]] std::string_view name() const noexcept override
    {
        return "openssl";
    }

    [[nodiscard]] bool supportsKdf(cipherbook::crypto::KdfAlgorithm algorithm) const noexcept override
    {
        switch (algorithm)
        {
        case cipherbook::crypto::KdfAlgorithm::Pbkdf2HmacSha256:
            return true;
        case cipherbook::crypto::KdfAlgorithm::Argon2id:
            return m_argon2idKdf != nullptr;
        }
        return false;
    }

    [[nodiscard]] cipherbook::security::SecureBuffer
    derivePasswordKey(std::span<const std::byte> password, const cipherbook::crypto::KdfParams& params) const override
    {
        cipherbook::crypto::requireUsableKdfParams(password, params);

        if (params.algorithm == cipherbook::crypto::KdfAlgorithm::Pbkdf2HmacSha256)
        {
            return derivePbkdf2HmacSha256(password, params);
        }
        return deriveArgon2id(password, params);
    }

    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return cipherbook::security::secureRandomFill(out);
    }

    [[nodiscard]] cipherbook::crypto::AeadBox aeadEncrypt(std::span<const std::uint8_t> key,
                                                          std::span<const std::byte> plainText,
                                                          std::span<const std::byte> associatedData) override
    {
        requireExactSize(key, cipherbook::crypto::g_aeadKeyBytes, "aeadEncrypt: key");
        requireIntSized(plainText.size(), "aeadEncrypt: plainText too large");
        requireIntSized(associatedData.size(), "aeadEncrypt: associatedData too large");

        cipherbook::crypto::AeadBox box{};
        if (!randomBytes(std::span<std::uint8_t>{ box.nonce }))
        {
            throw std::runtime_error("aeadEncrypt: CSPRNG failure");
        }

        EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("aeadEncrypt: EVP_CIPHER_CTX_new failed");
        }
        if (EVP_EncryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(box.nonce.size()), nullptr) !=
                1 ||
            EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), box.nonce.data()) != 1)
        {
            throw std::runtime_error("aeadEncrypt: cipher init failed");
        }

        int adLen{ 0 };
        const auto* adPtr{ reinterpret_cast<const unsigned char*>(associatedData.data()) };
        if (!associatedData.empty() &&
            EVP_EncryptUpdate(ctx.get(), nullptr, &adLen, adPtr, static_cast<int>(associatedData.size())) != 1)
        {
            throw std::runtime_error("aeadEncrypt: add aad failed");
        }

        box.cipherText.resize(plainText.size());
        int outLen{ 0 };
        if (!plainText.empty())
        {
            const auto* ptPtr{ reinterpret_cast<const unsigned char*>(plainText.data()) };
            if (EVP_EncryptUpdate(ctx.get(), box.cipherText.data(), &outLen, ptPtr,
                                  static_cast<int>(plainText.size())) != 1)
            {
                throw std::runtime_error("aeadEncrypt: encrypt update failed");
            }
        }
        if (outLen < 0 || static_cast<std::size_t>(outLen) > box.cipherText.size())
        {
            throw std::runtime_error("aeadEncrypt: invalid output length");
        }

        // ChaCha20-Poly1305 is a stream construction; final never emits bytes, the scratch block is spare room.
        std::array<unsigned char, 16> finalScratch{};
        int finalLen{ 0 };
        if (EVP_EncryptFinal_ex(ctx.get(), finalScratch.data(), &finalLen) != 1 || finalLen != 0)
        {
            throw std::runtime_error("aeadEncrypt: encrypt final failed");
        }
        box.cipherText.resize(static_cast<std::size_t>(outLen));

        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(box.tag.size()), box.tag.data()) !=
            1)
        {
            throw std::runtime_error("aeadEncrypt: get tag failed");
        }
        return box;
    }

    [[nodiscard]] std::optional<cipherbook::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const cipherbook::crypto::AeadBox& box,
                std::span<const std::byte> associatedData) override
    {
        requireExactSize(key, cipherbook::crypto::g_aeadKeyBytes, "aeadDecrypt: key");
        requireIntSized(associatedData.size(), "aeadDecrypt: associatedData too large");
        requireIntSized(box.cipherText.size(), "aeadDecrypt: cipherText too large");

        EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("aeadDecrypt: EVP_CIPHER_CTX_new failed");
        }
        if (EVP_DecryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(box.nonce.size()), nullptr) !=
                1 ||
            EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), box.nonce.data()) != 1)
        {
            throw std::runtime_error("aeadDecrypt: cipher init failed");
        }

        int adLen{ 0 };
        const auto* adPtr{ reinterpret_cast<const unsigned char*>(associatedData.data()) };
        if (!associatedData.empty() &&
            EVP_DecryptUpdate(ctx.get(), nullptr, &adLen, adPtr, static_cast<int>(associatedData.size())) != 1)
        {
            throw std::runtime_error("aeadDecrypt: add aad failed");
        }

        cipherbook::security::SecureBuffer plainText{};
        plainText.resize(box.cipherText.size());
        int outLen{ 0 };
        if (!box.cipherText.empty() && EVP_DecryptUpdate(ctx.get(), plainText.data(), &outLen, box.cipherText.data(),
                                                         static_cast<int>(box.cipherText.size())) != 1)
        {
            cipherbook::security::secureRelease(plainText);
            return std::nullopt;
        }
        if (outLen < 0 || static_cast<std::size_t>(outLen) > plainText.size())
        {
            cipherbook::security::secureRelease(plainText);
            return std::nullopt;
        }

        std::array<std::uint8_t, cipherbook::crypto::g_aeadTagBytes> tagCopy{ box.tag };
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(tagCopy.size()), tagCopy.data()) !=
            1)
        {
            throw std::runtime_error("aeadDecrypt: set tag failed");
        }

        std::array<unsigned char, 16> finalScratch{};
        int finalLen{ 0 };
        if (EVP_DecryptFinal_ex(ctx.get(), finalScratch.data(), &finalLen) != 1 || finalLen != 0)
        {
            cipherbook::security::secureRelease(plainText);
            return std::nullopt;
        }
        plainText.resize(static_cast<std::size_t>(outLen));
        return plainText;
    }

private:
    [[nodiscard]] cipherbook::security::SecureBuffer deriveArgon2id(std::span<const std::byte> password,
                                                                   const cipherbook::crypto::KdfParams& params) const
    {
        if (!m_argon2idKdf)
        {
            throw std::runtime_error("derivePasswordKey: OpenSSL Argon2id KDF not available");
        }

        EvpKdfCtxPtr ctx{ EVP_KDF_CTX_new(m_argon2idKdf.get()), &EVP_KDF_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("derivePasswordKey: EVP_KDF_CTX_new failed");
        }

        std::uint32_t iter{ params.iterations };
        std::uint32_t memcostKiB{ params.memoryKiB };
        std::uint32_t lanes{ params.parallelism };
        std::uint32_t threads{ params.parallelism };
        std::uint32_t version{ g_kArgon2Version13 };

        // OSSL_PARAM takes non-const pointers even for inputs, so hand it private copies.
        cipherbook::security::SecureBuffer passwordCopy{};
        passwordCopy.resize(password.size());
        std::memcpy(passwordCopy.data(), password.data(), password.size());
        std::vector<std::uint8_t> saltCopy{ params.salt };

        OSSL_PARAM ossl[]{
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_PASSWORD, passwordCopy.data(), passwordCopy.size()),
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, saltCopy.data(), saltCopy.size()),
            OSSL_PARAM_construct_uint32(OSSL_KDF_PARAM_ITER, &iter),
            OSSL_PARAM_construct_uint32(g_kKdfParamArgon2Memcost, &memcostKiB),
            OSSL_PARAM_construct_uint32(g_kKdfParamArgon2Lanes, &lanes),
            OSSL_PARAM_construct_uint32(g_kKdfParamThreads, &threads),
            OSSL_PARAM_construct_uint32(g_kKdfParamArgon2Version, &version),
            OSSL_PARAM_construct_end(),
        };

        cipherbook::security::SecureBuffer out{};
        out.resize(cipherbook::crypto::g_kPasswordKeyBytes);
        if (EVP_KDF_derive(ctx.get(), out.data(), out.size(), ossl) <= 0)
        {
            cipherbook::security::secureRelease(out);
            throw std::runtime_error("derivePasswordKey: EVP_KDF_derive failed");
        }
        return out;
    }

    EvpKdfPtr m_argon2idKdf{ nullptr, &EVP_KDF_free };
};

} // namespace

[[nodiscard]] std::unique_ptr<cipherbook::crypto::ICryptoProvider> makeOpenSslCryptoProvider()
{
    return std::make_unique<OpenSslCryptoProvider>();
}

} // namespace cipherbook::crypto::providers
