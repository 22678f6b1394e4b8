#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <set>
#include <span>
#include <stdexcept>
#include <string_view>

#include "cipherbook/crypto/providers/OpenSslProviderFactory.hpp"

namespace
{

std::span<const std::byte> asBytes(std::string_view s) noexcept
{
    return { reinterpret_cast<const std::byte*>(s.data()), s.size() };
}

std::array<std::uint8_t, cipherbook::crypto::g_aeadKeyBytes> patternKey(std::uint8_t base)
{
    std::array<std::uint8_t, cipherbook::crypto::g_aeadKeyBytes> key{};
    for (std::size_t i{}; i < key.size(); ++i)
    {
        key[i] = static_cast<std::uint8_t>(base + i);
    }
    return key;
}

} // namespace

TEST(OpenSslCryptoProvider, AeadRoundTripWithAssociatedData)
{
    auto provider{ cipherbook::crypto::providers::makeOpenSslCryptoProvider() };
    const auto key{ patternKey(0x10U) };

    const auto box{ provider->aeadEncrypt(key, asBytes("p@ss"), asBytes("cipherbook.vault.secret.v1")) };
    EXPECT_EQ(box.cipherText.size(), 4U);

    const auto plain{ provider->aeadDecrypt(key, box, asBytes("cipherbook.vault.secret.v1")) };
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ((std::string_view{ reinterpret_cast<const char*>(plain->data()), plain->size() }), "p@ss");
}

TEST(OpenSslCryptoProvider, EmptyPlainTextStillAuthenticates)
{
    auto provider{ cipherbook::crypto::providers::makeOpenSslCryptoProvider() };
    const auto key{ patternKey(0x20U) };

    auto box{ provider->aeadEncrypt(key, std::span<const std::byte>{}, asBytes("ad")) };
    ASSERT_TRUE(provider->aeadDecrypt(key, box, asBytes("ad")).has_value());

    box.tag[0] ^= 0x01U;
    EXPECT_FALSE(provider->aeadDecrypt(key, box, asBytes("ad")).has_value());
}

TEST(OpenSslCryptoProvider, RejectsTamperingWrongKeyAndWrongAad)
{
    auto provider{ cipherbook::crypto::providers::makeOpenSslCryptoProvider() };
    const auto key{ patternKey(0x30U) };
    const auto otherKey{ patternKey(0x31U) };

    const auto box{ provider->aeadEncrypt(key, asBytes("secret-data"), asBytes("header")) };

    auto flipped{ box };
    flipped.cipherText[0] ^= 0x80U;
    EXPECT_FALSE(provider->aeadDecrypt(key, flipped, asBytes("header")).has_value());

    auto badNonce{ box };
    badNonce.nonce[11] ^= 0x01U;
    EXPECT_FALSE(provider->aeadDecrypt(key, badNonce, asBytes("header")).has_value());

    EXPECT_FALSE(provider->aeadDecrypt(otherKey, box, asBytes("header")).has_value());
    EXPECT_FALSE(provider->aeadDecrypt(key, box, asBytes("other")).has_value());
}

TEST(OpenSslCryptoProvider, FreshNoncePerEncryption)
{
    auto provider{ cipherbook::crypto::providers::makeOpenSslCryptoProvider() };
    const auto key{ patternKey(0x40U) };

    std::set<std::array<std::uint8_t, cipherbook::crypto::g_aeadNonceBytes>> nonces;
    constexpr int kRounds{ 16 };
    for (int i{}; i < kRounds; ++i)
    {
        nonces.insert(provider->aeadEncrypt(key, asBytes("same"), asBytes("")).nonce);
    }
    EXPECT_EQ(nonces.size(), static_cast<std::size_t>(kRounds));
}

TEST(OpenSslCryptoProvider, RejectsWrongKeySize)
{
    auto provider{ cipherbook::crypto::providers::makeOpenSslCryptoProvider() };
    std::array<std::uint8_t, cipherbook::crypto::g_aeadKeyBytes - 1U> shortKey{};

    EXPECT_THROW((void)provider->aeadEncrypt(shortKey, asBytes("x"), asBytes("")), std::invalid_argument);

    const cipherbook::crypto::AeadBox box{};
    EXPECT_THROW((void)provider->aeadDecrypt(shortKey, box, asBytes("")), std::invalid_argument);
}
