#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <memory>
#include <string>
#include <variant>
#include <utility>
#include <vector>

#include "cipherbook/core/FieldCipher.hpp"
#include "cipherbook/crypto/providers/OpenSslProviderFactory.hpp"

namespace
{

using cipherbook::core::CipherError;
using cipherbook::core::DataKey;
using cipherbook::core::EncryptedVaultRecord;
using cipherbook::core::VaultRecord;

DataKey keyOf(std::uint8_t fill)
{
    const std::vector<std::uint8_t> raw(cipherbook::core::g_kDataKeyBytes, fill);
    return DataKey{ cipherbook::security::secureBufferFrom(raw) };
}

VaultRecord bankRecord()
{
    VaultRecord r{};
    r.id = "7f1c2a9e-4b1d-4c3e-9a57-0e2d7b6c1f00";
    r.title = "Bank";
    r.username = "alice";
    r.secret = "p@ss";
    r.url = "https://bank.example";
    r.updatedAt = cipherbook::core::fromUnixMillis(1'700'000'000'000);
    return r;
}

class FieldCipherTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_crypto = cipherbook::crypto::providers::makeOpenSslCryptoProvider();
        m_fields = std::make_unique<cipherbook::core::FieldCipher>(*m_crypto);
    }

    [[nodiscard]] EncryptedVaultRecord encryptOk(const VaultRecord& r, const DataKey& key)
    {
        auto res{ m_fields->encrypt(r, key) };
        EXPECT_TRUE(std::holds_alternative<EncryptedVaultRecord>(res));
        return std::holds_alternative<EncryptedVaultRecord>(res) ? std::get<EncryptedVaultRecord>(res)
                                                                  : EncryptedVaultRecord{};
    }

    std::unique_ptr<cipherbook::crypto::ICryptoProvider> m_crypto; // NOLINT
    std::unique_ptr<cipherbook::core::FieldCipher> m_fields;       // NOLINT
};

} // namespace

TEST_F(FieldCipherTest, EncryptsPresentFieldsOnly)
{
    const auto key{ keyOf(0x21U) };
    const auto record{ bankRecord() };
    const auto enc{ encryptOk(record, key) };

    EXPECT_EQ(enc.id, record.id);
    EXPECT_EQ(enc.updatedAt, record.updatedAt);
    EXPECT_EQ(enc.deletedAt, std::nullopt);
    EXPECT_TRUE(enc.usernameEnc.has_value());
    EXPECT_TRUE(enc.secretEnc.has_value());
    EXPECT_TRUE(enc.urlEnc.has_value());
    EXPECT_FALSE(enc.noteEnc.has_value());

    EXPECT_EQ(enc.titleEnc.find("Bank"), std::string::npos);
    EXPECT_EQ(enc.secretEnc->find("p@ss"), std::string::npos);
    EXPECT_NE(*enc.usernameEnc, *enc.secretEnc);
}

TEST_F(FieldCipherTest, DecryptRestoresRecord)
{
    const auto key{ keyOf(0x22U) };
    auto record{ bankRecord() };
    record.note = "";
    record.deletedAt = record.updatedAt;

    const auto dec{ m_fields->decrypt(encryptOk(record, key), key) };
    ASSERT_TRUE(std::holds_alternative<VaultRecord>(dec));
    EXPECT_EQ(std::get<VaultRecord>(dec), record);
}

TEST_F(FieldCipherTest, RoundTripCoversUnusualContent)
{
    constexpr std::size_t kLongFieldBytes{ 1024U * 1024U };

    struct Case final
    {
        const char* name;
        VaultRecord record;
    };
    std::vector<Case> cases{};

    VaultRecord allNull{};
    allNull.id = "all-null";
    allNull.updatedAt = cipherbook::core::fromUnixMillis(1);
    cases.push_back({ "empty title, every optional field null", allNull });

    auto unicode{ bankRecord() };
    unicode.title = "Bank \xc5\xbc\xc3\xb3\xc5\x82w \xf0\x9f\x94\x91 \xe6\x97\xa5\xe6\x9c\xac";
    unicode.username = std::string{ "nul\0inside", 10U };
    unicode.note = "quotes \" ' \\ tabs\t newlines\n\r <>&%";
    cases.push_back({ "multi-byte UTF-8, embedded NUL, special characters", unicode });

    auto longSecret{ bankRecord() };
    longSecret.secret = std::string(kLongFieldBytes, 'x');
    longSecret.url = std::nullopt;
    cases.push_back({ "1 MiB secret", longSecret });

    auto emptyStrings{ bankRecord() };
    emptyStrings.username = "";
    emptyStrings.secret = "";
    emptyStrings.url = "";
    emptyStrings.note = "";
    cases.push_back({ "empty strings stay distinct from null", emptyStrings });

    auto onlyNote{ allNull };
    onlyNote.id = "only-note";
    onlyNote.title = "Wifi";
    onlyNote.note = "router in the hallway";
    onlyNote.deletedAt = cipherbook::core::fromUnixMillis(2);
    cases.push_back({ "single optional field, tombstoned", onlyNote });

    const auto key{ keyOf(0x28U) };
    for (const auto& c : cases)
    {
        SCOPED_TRACE(c.name);
        const auto enc{ encryptOk(c.record, key) };
        EXPECT_EQ(enc.usernameEnc.has_value(), c.record.username.has_value());
        EXPECT_EQ(enc.secretEnc.has_value(), c.record.secret.has_value());
        EXPECT_EQ(enc.urlEnc.has_value(), c.record.url.has_value());
        EXPECT_EQ(enc.noteEnc.has_value(), c.record.note.has_value());

        const auto dec{ m_fields->decrypt(enc, key) };
        ASSERT_TRUE(std::holds_alternative<VaultRecord>(dec));
        EXPECT_EQ(std::get<VaultRecord>(dec), c.record);
    }
}

TEST_F(FieldCipherTest, EachEncryptionUsesFreshNonces)
{
    const auto key{ keyOf(0x23U) };
    auto record{ bankRecord() };
    record.note = "memo";
    const auto a{ encryptOk(record, key) };
    const auto b{ encryptOk(record, key) };

    EXPECT_NE(a.titleEnc, b.titleEnc);
    ASSERT_TRUE(a.usernameEnc && a.secretEnc && a.urlEnc && a.noteEnc);
    ASSERT_TRUE(b.usernameEnc && b.secretEnc && b.urlEnc && b.noteEnc);
    EXPECT_NE(*a.usernameEnc, *b.usernameEnc);
    EXPECT_NE(*a.secretEnc, *b.secretEnc);
    EXPECT_NE(*a.urlEnc, *b.urlEnc);
    EXPECT_NE(*a.noteEnc, *b.noteEnc);
}

TEST_F(FieldCipherTest, WrongKeyFailsWholeRecord)
{
    const auto enc{ encryptOk(bankRecord(), keyOf(0x24U)) };
    const auto dec{ m_fields->decrypt(enc, keyOf(0x25U)) };
    ASSERT_TRUE(std::holds_alternative<CipherError>(dec));
    EXPECT_EQ(std::get<CipherError>(dec), CipherError::DecryptFailed);
}

TEST_F(FieldCipherTest, FieldsCannotBeSwapped)
{
    const auto key{ keyOf(0x26U) };
    auto enc{ encryptOk(bankRecord(), key) };
    std::swap(*enc.usernameEnc, *enc.secretEnc);

    const auto dec{ m_fields->decrypt(enc, key) };
    ASSERT_TRUE(std::holds_alternative<CipherError>(dec));
    EXPECT_EQ(std::get<CipherError>(dec), CipherError::DecryptFailed);
}

TEST_F(FieldCipherTest, SingleCorruptFieldFailsRecord)
{
    const auto key{ keyOf(0x27U) };
    auto enc{ encryptOk(bankRecord(), key) };
    enc.urlEnc = "AAAA";

    const auto dec{ m_fields->decrypt(enc, key) };
    EXPECT_EQ(std::get<CipherError>(dec), CipherError::DecryptFailed);
}

TEST_F(FieldCipherTest, EmptyKeyIsLocked)
{
    const DataKey none{};
    EXPECT_EQ(std::get<CipherError>(m_fields->encrypt(bankRecord(), none)), CipherError::Locked);
    EXPECT_EQ(std::get<CipherError>(m_fields->decrypt(EncryptedVaultRecord{}, none)), CipherError::Locked);
}
