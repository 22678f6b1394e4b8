#include "cipherbook/core/FieldCipher.hpp"
#include "cipherbook/security/SecureString.hpp"
#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace cipherbook::core
{
namespace
{

constexpr std::string_view g_kAadTitle{ "cipherbook.vault.title.v1" };
constexpr std::string_view g_kAadUsername{ "cipherbook.vault.username.v1" };
constexpr std::string_view g_kAadSecret{ "cipherbook.vault.secret.v1" };
constexpr std::string_view g_kAadUrl{ "cipherbook.vault.url.v1" };
constexpr std::string_view g_kAadNote{ "cipherbook.vault.note.v1" };

[[nodiscard]] std::span<const std::byte> asBytes(std::string_view s) noexcept
{
    return std::as_bytes(std::span<const char>{ s.data(), s.size() });
}

// Carries the first error out of a chain of field operations.
class FieldStatus final
{
public:
    [[nodiscard]] bool ok() const noexcept
    {
        return !m_error.has_value();
    }
    [[nodiscard]] CipherError error() const noexcept
    {
        return m_error.value_or(CipherError::CryptoError);
    }
    void fail(CipherError e) noexcept
    {
        if (!m_error)
        {
            m_error = e;
        }
    }

private:
    std::optional<CipherError> m_error;
};

[[nodiscard]] std::string sealField(AeadCipher& aead, const DataKey& key, std::string_view value, std::string_view aad,
                                    FieldStatus& status)
{
    if (!status.ok())
    {
        return {};
    }
    auto res{ aead.sealToString(key.bytes(), asBytes(value), asBytes(aad)) };
    if (auto* err = std::get_if<CipherError>(&res))
    {
        status.fail(*err);
        return {};
    }
    return std::move(std::get<std::string>(res));
}

[[nodiscard]] std::optional<std::string> sealOptional(AeadCipher& aead, const DataKey& key,
                                                      const std::optional<std::string>& value, std::string_view aad,
                                                      FieldStatus& status)
{
    if (!value)
    {
        return std::nullopt;
    }
    return sealField(aead, key, *value, aad, status);
}

[[nodiscard]] std::string openField(AeadCipher& aead, const DataKey& key, std::string_view envelope,
                                    std::string_view aad, FieldStatus& status)
{
    if (!status.ok())
    {
        return {};
    }
    auto res{ aead.openFromString(key.bytes(), envelope, asBytes(aad)) };
    if (auto* err = std::get_if<CipherError>(&res))
    {
        status.fail(*err);
        return {};
    }
    auto& plain{ std::get<cipherbook::security::SecureBuffer>(res) };
    std::string out(plain.begin(), plain.end());
    cipherbook::security::secureRelease(plain);
    return out;
}

[[nodiscard]] std::optional<std::string> openOptional(AeadCipher& aead, const DataKey& key,
                                                      const std::optional<std::string>& envelope, std::string_view aad,
                                                      FieldStatus& status)
{
    if (!envelope)
    {
        return std::nullopt;
    }
    return openField(aead, key, *envelope, aad, status);
}

} // namespace

FieldCipher::FieldCipher(cipherbook::crypto::ICryptoProvider& crypto) noexcept : m_aead(crypto)
{
}

CipherResult<EncryptedVaultRecord> FieldCipher::encrypt(const VaultRecord& record, const DataKey& key) noexcept
{
    if (key.empty())
    {
        return CipherError::Locked;
    }

    try
    {
        FieldStatus status{};
        EncryptedVaultRecord out{};
        out.id = record.id;
        out.titleEnc = sealField(m_aead, key, record.title, g_kAadTitle, status);
        out.usernameEnc = sealOptional(m_aead, key, record.username, g_kAadUsername, status);
        out.secretEnc = sealOptional(m_aead, key, record.secret, g_kAadSecret, status);
        out.urlEnc = sealOptional(m_aead, key, record.url, g_kAadUrl, status);
        out.noteEnc = sealOptional(m_aead, key, record.note, g_kAadNote, status);
        out.updatedAt = record.updatedAt;
        out.deletedAt = record.deletedAt;

        if (!status.ok())
        {
            return status.error();
        }
        return out;
    }
    catch (const std::exception&)
    {
        return CipherError::CryptoError;
    }
}

CipherResult<VaultRecord> FieldCipher::decrypt(const EncryptedVaultRecord& record, const DataKey& key) noexcept
{
    if (key.empty())
    {
        return CipherError::Locked;
    }

    try
    {
        FieldStatus status{};
        VaultRecord out{};
        out.id = record.id;
        out.title = openField(m_aead, key, record.titleEnc, g_kAadTitle, status);
        out.username = openOptional(m_aead, key, record.usernameEnc, g_kAadUsername, status);
        out.secret = openOptional(m_aead, key, record.secretEnc, g_kAadSecret, status);
        out.url = openOptional(m_aead, key, record.urlEnc, g_kAadUrl, status);
        out.note = openOptional(m_aead, key, record.noteEnc, g_kAadNote, status);
        out.updatedAt = record.updatedAt;
        out.deletedAt = record.deletedAt;

        if (!status.ok())
        {
            return status.error();
        }
        return out;
    }
    catch (const std::exception&)
    {
        return CipherError::DecryptFailed;
    }
}

} // namespace cipherbook::core
