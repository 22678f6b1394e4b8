#include "cipherbook/core/AeadCipher.hpp"
#include "cipherbook/core/Base64.hpp"
#include <algorithm>
#include <exception>
#include <utility>

namespace cipherbook::core
{

AeadCipher::AeadCipher(cipherbook::crypto::ICryptoProvider& crypto) noexcept : m_crypto(&crypto)
{
}

CipherResult<SealedBox> AeadCipher::seal(std::span<const std::uint8_t> key, std::span<const std::byte> plainText,
                                         std::span<const std::byte> associatedData) noexcept
{
    if (key.empty())
    {
        return CipherError::Locked;
    }
    if (key.size() != cipherbook::crypto::g_aeadKeyBytes)
    {
        return CipherError::CryptoError;
    }

    try
    {
        auto box{ m_crypto->aeadEncrypt(key, plainText, associatedData) };

        SealedBox out{};
        out.nonce = box.nonce;
        out.cipherTextWithTag = std::move(box.cipherText);
        out.cipherTextWithTag.insert(out.cipherTextWithTag.end(), box.tag.begin(), box.tag.end());
        return out;
    }
    catch (const std::exception&)
    {
        return CipherError::CryptoError;
    }
}

CipherResult<cipherbook::security::SecureBuffer> AeadCipher::open(std::span<const std::uint8_t> key,
                                                                  std::span<const std::uint8_t> nonce,
                                                                  std::span<const std::uint8_t> cipherTextWithTag,
                                                                  std::span<const std::byte> associatedData) noexcept
{
    if (key.empty())
    {
        return CipherError::Locked;
    }
    if (key.size() != cipherbook::crypto::g_aeadKeyBytes || nonce.size() != cipherbook::crypto::g_aeadNonceBytes ||
        cipherTextWithTag.size() < cipherbook::crypto::g_aeadTagBytes)
    {
        return CipherError::DecryptFailed;
    }

    try
    {
        const std::size_t ctLen{ cipherTextWithTag.size() - cipherbook::crypto::g_aeadTagBytes };

        cipherbook::crypto::AeadBox box{};
        std::copy(nonce.begin(), nonce.end(), box.nonce.begin());
        box.cipherText.assign(cipherTextWithTag.begin(), cipherTextWithTag.begin() + static_cast<std::ptrdiff_t>(ctLen));
        std::copy(cipherTextWithTag.begin() + static_cast<std::ptrdiff_t>(ctLen), cipherTextWithTag.end(),
                  box.tag.begin());

        auto plainOpt{ m_crypto->aeadDecrypt(key, box, associatedData) };
        if (!plainOpt)
        {
            return CipherError::DecryptFailed;
        }
        return std::move(*plainOpt);
    }
    catch (const std::exception&)
    {
        return CipherError::DecryptFailed;
    }
}

CipherResult<std::string> AeadCipher::sealToString(std::span<const std::uint8_t> key,
                                                   std::span<const std::byte> plainText,
                                                   std::span<const std::byte> associatedData) noexcept
{
    auto sealed{ seal(key, plainText, associatedData) };
    if (auto* err = std::get_if<CipherError>(&sealed))
    {
        return *err;
    }
    const auto& box{ std::get<SealedBox>(sealed) };

    try
    {
        std::vector<std::uint8_t> joined{};
        joined.reserve(box.nonce.size() + box.cipherTextWithTag.size());
        joined.insert(joined.end(), box.nonce.begin(), box.nonce.end());
        joined.insert(joined.end(), box.cipherTextWithTag.begin(), box.cipherTextWithTag.end());
        return base64Encode(joined);
    }
    catch (const std::exception&)
    {
        return CipherError::CryptoError;
    }
}

CipherResult<cipherbook::security::SecureBuffer> AeadCipher::openFromString(std::span<const std::uint8_t> key,
                                                                            std::string_view envelope,
                                                                            std::span<const std::byte> associatedData) noexcept
{
    if (key.empty())
    {
        return CipherError::Locked;
    }

    try
    {
        const auto rawOpt{ base64Decode(envelope) };
        if (!rawOpt || rawOpt->size() < cipherbook::crypto::g_aeadNonceBytes + cipherbook::crypto::g_aeadTagBytes)
        {
            return CipherError::DecryptFailed;
        }
        const std::span<const std::uint8_t> raw{ *rawOpt };
        return open(key, raw.first(cipherbook::crypto::g_aeadNonceBytes),
                    raw.subspan(cipherbook::crypto::g_aeadNonceBytes), associatedData);
    }
    catch (const std::exception&)
    {
        return CipherError::DecryptFailed;
    }
}

} // namespace cipherbook::core
