#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string_view>
#include <vector>

#include "test_utils/TestUtils.hpp"
#include "cipherbook/crypto/KeyDerivation.hpp"
#include "cipherbook/crypto/providers/OpenSslProviderFactory.hpp"
#include "cipherbook/security/SecureEquals.hpp"

namespace
{

using cipherbook::crypto::KdfAlgorithm;
using cipherbook::crypto::KdfParams;

constexpr std::string_view g_kPassword{ "strongPassword" };

std::span<const std::byte> asBytes(std::string_view s) noexcept
{
    return { reinterpret_cast<const std::byte*>(s.data()), s.size() };
}

std::vector<std::uint8_t> saltOf(std::string_view s)
{
    return { s.begin(), s.end() };
}

KdfParams pbkdf2(std::uint32_t iterations, std::vector<std::uint8_t> salt)
{
    KdfParams p{};
    p.algorithm = KdfAlgorithm::Pbkdf2HmacSha256;
    p.iterations = iterations;
    p.salt = std::move(salt);
    return p;
}

KdfParams argon2id(std::uint32_t iterations, std::uint32_t memoryKiB, std::uint32_t parallelism)
{
    KdfParams p{};
    p.algorithm = KdfAlgorithm::Argon2id;
    p.iterations = iterations;
    p.memoryKiB = memoryKiB;
    p.parallelism = parallelism;
    p.salt = saltOf("0123456789abcdef");
    return p;
}

} // namespace

TEST(KdfParamsValidation, RejectsUnusableInput)
{
    const auto good{ pbkdf2(1U, saltOf("0123456789abcdef")) };
    EXPECT_NO_THROW(cipherbook::crypto::requireUsableKdfParams(asBytes(g_kPassword), good));

    EXPECT_THROW(cipherbook::crypto::requireUsableKdfParams(std::span<const std::byte>{}, good), std::invalid_argument);

    auto badVersion{ good };
    badVersion.policyVersion = 99U;
    EXPECT_THROW(cipherbook::crypto::requireUsableKdfParams(asBytes(g_kPassword), badVersion), std::invalid_argument);

    EXPECT_THROW(cipherbook::crypto::requireUsableKdfParams(asBytes(g_kPassword), pbkdf2(1U, saltOf("salt"))),
                 std::invalid_argument);
    EXPECT_THROW(
        cipherbook::crypto::requireUsableKdfParams(asBytes(g_kPassword), pbkdf2(0U, saltOf("0123456789abcdef"))),
        std::invalid_argument);
    EXPECT_THROW(cipherbook::crypto::requireUsableKdfParams(
                     asBytes(g_kPassword),
                     pbkdf2(cipherbook::crypto::g_kMaxPbkdf2Iterations + 1U, saltOf("0123456789abcdef"))),
                 std::invalid_argument);

    auto unknown{ good };
    unknown.algorithm = static_cast<KdfAlgorithm>(7U);
    EXPECT_THROW(cipherbook::crypto::requireUsableKdfParams(asBytes(g_kPassword), unknown), std::invalid_argument);
}

TEST(KdfParamsValidation, RejectsUnsafeArgon2id)
{
    EXPECT_NO_THROW(cipherbook::crypto::requireUsableKdfParams(asBytes(g_kPassword), argon2id(1U, 8U, 1U)));

    EXPECT_THROW(cipherbook::crypto::requireUsableKdfParams(asBytes(g_kPassword), argon2id(1U, 8U, 0U)),
                 std::invalid_argument);
    EXPECT_THROW(cipherbook::crypto::requireUsableKdfParams(asBytes(g_kPassword), argon2id(11U, 8U, 1U)),
                 std::invalid_argument);
    EXPECT_THROW(
        cipherbook::crypto::requireUsableKdfParams(asBytes(g_kPassword), argon2id(1U, 1024U * 1024U + 1U, 1U)),
        std::invalid_argument);
    EXPECT_THROW(cipherbook::crypto::requireUsableKdfParams(asBytes(g_kPassword), argon2id(1U, 8U, 2U)),
                 std::invalid_argument);
}

TEST(OpenSslKeyDerivation, Pbkdf2HmacSha256MatchesPublishedVector)
{
    auto provider{ cipherbook::crypto::providers::makeOpenSslCryptoProvider() };

    // P = "passwordPASSWORDpassword", S = "saltSALTsaltSALTsaltSALTsaltSALTsalt", c = 4096; first 32 bytes.
    const auto key{ provider->derivePasswordKey(asBytes("passwordPASSWORDpassword"),
                                                pbkdf2(4096U, saltOf("saltSALTsaltSALTsaltSALTsaltSALTsalt"))) };

    ASSERT_EQ(key.size(), cipherbook::crypto::g_kPasswordKeyBytes);
    EXPECT_EQ(cipherbook::test_utils::toHex(cipherbook::security::asSpan(key)),
              "348c89dbcbd32b2f32d814b8116e84cf2b17347ebc1800181c4e2a1fb8dd53e1");
}

TEST(OpenSslKeyDerivation, DeterministicAndSaltSensitive)
{
    auto provider{ cipherbook::crypto::providers::makeOpenSslCryptoProvider() };

    const auto a{ provider->derivePasswordKey(asBytes(g_kPassword), pbkdf2(1000U, saltOf("AAAAAAAAAAAAAAAA"))) };
    const auto b{ provider->derivePasswordKey(asBytes(g_kPassword), pbkdf2(1000U, saltOf("AAAAAAAAAAAAAAAA"))) };
    const auto c{ provider->derivePasswordKey(asBytes(g_kPassword), pbkdf2(1000U, saltOf("AAAAAAAAAAAAAAAB"))) };
    const auto d{ provider->derivePasswordKey(asBytes(g_kPassword), pbkdf2(1001U, saltOf("AAAAAAAAAAAAAAAA"))) };

    EXPECT_TRUE(cipherbook::security::secureEquals(a, b));
    EXPECT_FALSE(cipherbook::security::secureEquals(a, c));
    EXPECT_FALSE(cipherbook::security::secureEquals(a, d));
}

TEST(OpenSslKeyDerivation, Argon2idDerivesOrReportsUnavailable)
{
    auto provider{ cipherbook::crypto::providers::makeOpenSslCryptoProvider() };

    try
    {
        const auto a{ provider->derivePasswordKey(asBytes(g_kPassword), argon2id(1U, 8U, 1U)) };
        const auto b{ provider->derivePasswordKey(asBytes(g_kPassword), argon2id(1U, 16U, 1U)) };
        ASSERT_EQ(a.size(), cipherbook::crypto::g_kPasswordKeyBytes);
        EXPECT_FALSE(cipherbook::security::secureEquals(a, b));
    }
    catch (const std::runtime_error& e)
    {
        // OpenSSL before 3.2 has no Argon2 KDF.
        GTEST_SKIP() << e.what();
    }
}

TEST(OpenSslKeyDerivation, SlowDefaultPolicy)
{
    if (!cipherbook::test_utils::envFlagSet("CPBK_RUN_SLOW_TESTS"))
    {
        GTEST_SKIP() << "Set CPBK_RUN_SLOW_TESTS=1 to run slow KDF tests.";
    }

    auto provider{ cipherbook::crypto::providers::makeOpenSslCryptoProvider() };
    const auto key{ provider->derivePasswordKey(asBytes(g_kPassword), pbkdf2(210000U, saltOf("0123456789abcdef"))) };
    EXPECT_EQ(key.size(), cipherbook::crypto::g_kPasswordKeyBytes);
}
