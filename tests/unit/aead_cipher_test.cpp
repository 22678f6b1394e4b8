#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <variant>

#include "cipherbook/core/AeadCipher.hpp"
#include "cipherbook/core/Base64.hpp"
#include "cipherbook/crypto/providers/OpenSslProviderFactory.hpp"

namespace
{

using cipherbook::core::CipherError;

std::span<const std::byte> asBytes(std::string_view s) noexcept
{
    return { reinterpret_cast<const std::byte*>(s.data()), s.size() };
}

std::string_view asText(const cipherbook::security::SecureBuffer& b)
{
    return { reinterpret_cast<const char*>(b.data()), b.size() };
}

class AeadCipherTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_crypto = cipherbook::crypto::providers::makeOpenSslCryptoProvider();
        m_cipher = std::make_unique<cipherbook::core::AeadCipher>(*m_crypto);
        m_key.fill(0x33U);
    }

    std::unique_ptr<cipherbook::crypto::ICryptoProvider> m_crypto; // NOLINT
    std::unique_ptr<cipherbook::core::AeadCipher> m_cipher;        // NOLINT
    std::array<std::uint8_t, cipherbook::crypto::g_aeadKeyBytes> m_key{}; // NOLINT
};

} // namespace

TEST_F(AeadCipherTest, SealOpenRoundTrip)
{
    const auto sealed{ m_cipher->seal(m_key, asBytes("hello"), asBytes("ad")) };
    ASSERT_TRUE(std::holds_alternative<cipherbook::core::SealedBox>(sealed));
    const auto& box{ std::get<cipherbook::core::SealedBox>(sealed) };
    EXPECT_EQ(box.cipherTextWithTag.size(), 5U + cipherbook::crypto::g_aeadTagBytes);

    const auto opened{ m_cipher->open(m_key, box.nonce, box.cipherTextWithTag, asBytes("ad")) };
    ASSERT_TRUE(std::holds_alternative<cipherbook::security::SecureBuffer>(opened));
    EXPECT_EQ(asText(std::get<cipherbook::security::SecureBuffer>(opened)), "hello");
}

TEST_F(AeadCipherTest, StringEnvelopeRoundTripAndLayout)
{
    const auto sealed{ m_cipher->sealToString(m_key, asBytes("p@ss"), asBytes("field")) };
    ASSERT_TRUE(std::holds_alternative<std::string>(sealed));
    const auto& envelope{ std::get<std::string>(sealed) };

    const auto raw{ cipherbook::core::base64Decode(envelope) };
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(raw->size(), cipherbook::crypto::g_aeadNonceBytes + 4U + cipherbook::crypto::g_aeadTagBytes);

    const auto opened{ m_cipher->openFromString(m_key, envelope, asBytes("field")) };
    ASSERT_TRUE(std::holds_alternative<cipherbook::security::SecureBuffer>(opened));
    EXPECT_EQ(asText(std::get<cipherbook::security::SecureBuffer>(opened)), "p@ss");
}

TEST_F(AeadCipherTest, SameInputSealsDifferently)
{
    const auto a{ m_cipher->sealToString(m_key, asBytes("same"), {}) };
    const auto b{ m_cipher->sealToString(m_key, asBytes("same"), {}) };
    ASSERT_TRUE(std::holds_alternative<std::string>(a));
    ASSERT_TRUE(std::holds_alternative<std::string>(b));
    EXPECT_NE(std::get<std::string>(a), std::get<std::string>(b));
}

TEST_F(AeadCipherTest, EmptyKeyMeansLocked)
{
    const std::span<const std::uint8_t> noKey{};
    EXPECT_EQ(std::get<CipherError>(m_cipher->seal(noKey, asBytes("x"))), CipherError::Locked);
    EXPECT_EQ(std::get<CipherError>(m_cipher->sealToString(noKey, asBytes("x"))), CipherError::Locked);
    EXPECT_EQ(std::get<CipherError>(m_cipher->openFromString(noKey, "AAAA")), CipherError::Locked);
}

TEST_F(AeadCipherTest, WrongKeySizeOnSealIsCryptoError)
{
    const std::array<std::uint8_t, 16> shortKey{};
    EXPECT_EQ(std::get<CipherError>(m_cipher->seal(shortKey, asBytes("x"))), CipherError::CryptoError);
}

TEST_F(AeadCipherTest, AnyCorruptionIsDecryptFailed)
{
    const auto envelope{ std::get<std::string>(m_cipher->sealToString(m_key, asBytes("secret"), asBytes("ad"))) };

    std::array<std::uint8_t, cipherbook::crypto::g_aeadKeyBytes> otherKey{};
    otherKey.fill(0x34U);
    EXPECT_EQ(std::get<CipherError>(m_cipher->openFromString(otherKey, envelope, asBytes("ad"))),
              CipherError::DecryptFailed);
    EXPECT_EQ(std::get<CipherError>(m_cipher->openFromString(m_key, envelope, asBytes("other"))),
              CipherError::DecryptFailed);

    auto raw{ *cipherbook::core::base64Decode(envelope) };
    raw.back() ^= 0x01U;
    EXPECT_EQ(std::get<CipherError>(m_cipher->openFromString(m_key, cipherbook::core::base64Encode(raw), asBytes("ad"))),
              CipherError::DecryptFailed);

    raw.resize(cipherbook::crypto::g_aeadNonceBytes + cipherbook::crypto::g_aeadTagBytes - 1U);
    EXPECT_EQ(std::get<CipherError>(m_cipher->openFromString(m_key, cipherbook::core::base64Encode(raw), asBytes("ad"))),
              CipherError::DecryptFailed);

    EXPECT_EQ(std::get<CipherError>(m_cipher->openFromString(m_key, "not base64!", asBytes("ad"))),
              CipherError::DecryptFailed);
}
