#include "cipherbook/core/KeyManager.hpp"
#include "cipherbook/security/ScopeWipe.hpp"
#include "cipherbook/security/SecureBuffer.hpp"
#include "cipherbook/security/SecureEquals.hpp"
#include <algorithm>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace cipherbook::core
{
namespace
{

using cipherbook::security::SecureBuffer;

[[nodiscard]] AuthResult<std::optional<std::string>> loadParamsTextOrError(const cipherbook::storage::ISecureParamStore& store) noexcept
{
    try
    {
        return store.load(g_kVaultKeyParamsKey);
    }
    catch (const std::exception&)
    {
        return AuthError::StorageError;
    }
}

[[nodiscard]] AuthResult<VaultKeyParams> loadParamsOrError(const cipherbook::storage::ISecureParamStore& store) noexcept
{
    auto loaded{ loadParamsTextOrError(store) };
    if (auto* err = std::get_if<AuthError>(&loaded))
    {
        return *err;
    }
    const auto& textOpt{ std::get<std::optional<std::string>>(loaded) };
    if (!textOpt)
    {
        return AuthError::NotInitialized;
    }

    try
    {
        auto parsed{ parseVaultKeyParams(*textOpt) };
        if (!parsed)
        {
            return AuthError::Corrupt;
        }
        if (parsed->kdf.policyVersion != cipherbook::crypto::g_kKdfPolicyVersion)
        {
            return AuthError::UnsupportedKdf;
        }
        return std::move(*parsed);
    }
    catch (const std::exception&)
    {
        return AuthError::Corrupt;
    }
}

[[nodiscard]] AuthResult<std::monostate> storeParamsOrError(cipherbook::storage::ISecureParamStore& store,
                                                            const VaultKeyParams& params) noexcept
{
    try
    {
        store.store(g_kVaultKeyParamsKey, serializeVaultKeyParams(params));
        return std::monostate{};
    }
    catch (const std::exception&)
    {
        return AuthError::StorageError;
    }
}

[[nodiscard]] AuthResult<SecureBuffer> derivePasswordKeyOrError(const cipherbook::crypto::ICryptoProvider& crypto,
                                                                const cipherbook::security::SecureString& password,
                                                                const cipherbook::crypto::KdfParams& kdf) noexcept
{
    if (!crypto.supportsKdf(kdf.algorithm))
    {
        return AuthError::UnsupportedKdf;
    }
    try
    {
        return crypto.derivePasswordKey(cipherbook::security::asBytes(password), kdf);
    }
    catch (const std::invalid_argument&)
    {
        return AuthError::UnsupportedKdf;
    }
    catch (const std::exception&)
    {
        return AuthError::CryptoError;
    }
}

[[nodiscard]] AuthResult<VaultKeyParams> wrapDataKeyOrError(cipherbook::crypto::ICryptoProvider& crypto,
                                                            std::span<const std::uint8_t> passwordKey,
                                                            const SecureBuffer& dataKey,
                                                            cipherbook::crypto::KdfParams kdf) noexcept
{
    try
    {
        const auto aad{ encodeKeyWrapAad(kdf) };
        auto box{ crypto.aeadEncrypt(passwordKey, cipherbook::security::asBytes(dataKey),
                                     std::span<const std::byte>{ aad.data(), aad.size() }) };

        VaultKeyParams out{};
        out.kdf = std::move(kdf);
        out.wrapNonce = box.nonce;
        out.wrappedDataKey = std::move(box.cipherText);
        out.wrappedDataKey.insert(out.wrappedDataKey.end(), box.tag.begin(), box.tag.end());
        return out;
    }
    catch (const std::exception&)
    {
        return AuthError::CryptoError;
    }
}

// InvalidPassword when the tag does not verify: wrong password or tampered params look the same.
[[nodiscard]] AuthResult<SecureBuffer> unwrapDataKeyOrError(cipherbook::crypto::ICryptoProvider& crypto,
                                                            std::span<const std::uint8_t> passwordKey,
                                                            const VaultKeyParams& params) noexcept
{
    if (params.wrappedDataKey.size() != g_kDataKeyBytes + cipherbook::crypto::g_aeadTagBytes)
    {
        return AuthError::Corrupt;
    }

    try
    {
        const auto tagStart{ params.wrappedDataKey.begin() + static_cast<std::ptrdiff_t>(g_kDataKeyBytes) };

        cipherbook::crypto::AeadBox box{};
        box.nonce = params.wrapNonce;
        box.cipherText.assign(params.wrappedDataKey.begin(), tagStart);
        std::copy(tagStart, params.wrappedDataKey.end(), box.tag.begin());

        const auto aad{ encodeKeyWrapAad(params.kdf) };
        auto plainOpt{ crypto.aeadDecrypt(passwordKey, box, std::span<const std::byte>{ aad.data(), aad.size() }) };
        if (!plainOpt)
        {
            return AuthError::InvalidPassword;
        }
        if (plainOpt->size() != g_kDataKeyBytes)
        {
            cipherbook::security::secureRelease(*plainOpt);
            return AuthError::Corrupt;
        }
        return std::move(*plainOpt);
    }
    catch (const std::exception&)
    {
        return AuthError::CryptoError;
    }
}

// Wraps `dataKey` under a freshly salted password key and proves the result opens again.
[[nodiscard]] AuthResult<VaultKeyParams> wrapVerifiedOrError(cipherbook::crypto::ICryptoProvider& crypto,
                                                             const KdfPolicy& policy,
                                                             const cipherbook::security::SecureString& password,
                                                             const SecureBuffer& dataKey) noexcept
{
    std::optional<cipherbook::crypto::KdfParams> kdfOpt{};
    try
    {
        kdfOpt = makeKdfParams(policy);
    }
    catch (const std::exception&)
    {
        return AuthError::RandomFailed;
    }
    if (!kdfOpt)
    {
        return AuthError::RandomFailed;
    }

    auto pkRes{ derivePasswordKeyOrError(crypto, password, *kdfOpt) };
    if (auto* err = std::get_if<AuthError>(&pkRes))
    {
        return *err;
    }
    auto& passwordKey{ std::get<SecureBuffer>(pkRes) };
    auto wipePk{ cipherbook::security::scopeWipe(passwordKey) };

    auto wrapped{ wrapDataKeyOrError(crypto, passwordKey, dataKey, std::move(*kdfOpt)) };
    if (std::holds_alternative<AuthError>(wrapped))
    {
        return wrapped;
    }

    auto check{ unwrapDataKeyOrError(crypto, passwordKey, std::get<VaultKeyParams>(wrapped)) };
    if (!std::holds_alternative<SecureBuffer>(check))
    {
        return AuthError::CryptoError;
    }
    auto& roundTrip{ std::get<SecureBuffer>(check) };
    const bool same{ cipherbook::security::secureEquals(roundTrip, dataKey) };
    cipherbook::security::secureRelease(roundTrip);
    if (!same)
    {
        return AuthError::CryptoError;
    }
    return wrapped;
}

[[nodiscard]] AuthResult<SecureBuffer> unlockOrError(cipherbook::crypto::ICryptoProvider& crypto,
                                                     const cipherbook::storage::ISecureParamStore& store,
                                                     const cipherbook::security::SecureString& password) noexcept
{
    if (password.empty())
    {
        return AuthError::InvalidPassword;
    }

    auto loaded{ loadParamsOrError(store) };
    if (auto* err = std::get_if<AuthError>(&loaded))
    {
        return *err;
    }
    const auto& params{ std::get<VaultKeyParams>(loaded) };

    auto pkRes{ derivePasswordKeyOrError(crypto, password, params.kdf) };
    if (auto* err = std::get_if<AuthError>(&pkRes))
    {
        return *err;
    }
    auto& passwordKey{ std::get<SecureBuffer>(pkRes) };
    auto wipePk{ cipherbook::security::scopeWipe(passwordKey) };

    return unwrapDataKeyOrError(crypto, passwordKey, params);
}

} // namespace

KeyManager::KeyManager(cipherbook::crypto::ICryptoProvider& crypto, cipherbook::storage::ISecureParamStore& params,
                       KdfPolicy policy, Logger logger)
    : m_crypto(&crypto), m_params(&params), m_policy(policy), m_log(std::move(logger))
{
}

bool KeyManager::isInitialized() const noexcept
{
    auto loaded{ loadParamsTextOrError(*m_params) };
    const auto* textOpt{ std::get_if<std::optional<std::string>>(&loaded) };
    return textOpt != nullptr && textOpt->has_value();
}

AuthResult<std::monostate> KeyManager::initialize(const cipherbook::security::SecureString& password) noexcept
{
    if (password.empty())
    {
        return AuthError::InvalidPassword;
    }

    auto existing{ loadParamsTextOrError(*m_params) };
    if (auto* err = std::get_if<AuthError>(&existing))
    {
        return *err;
    }
    if (std::get<std::optional<std::string>>(existing).has_value())
    {
        return AuthError::AlreadyInitialized;
    }

    if (!m_crypto->supportsKdf(m_policy.algorithm))
    {
        m_log.error(std::string{ "initialize: KDF policy not available on the " } + std::string{ m_crypto->name() } +
                    " provider");
        return AuthError::UnsupportedKdf;
    }

    SecureBuffer dataKey{};
    try
    {
        dataKey.resize(g_kDataKeyBytes);
    }
    catch (const std::exception&)
    {
        return AuthError::CryptoError;
    }
    auto wipeDk{ cipherbook::security::scopeWipe(dataKey) };
    if (!m_crypto->randomBytes(std::span<std::uint8_t>{ dataKey }))
    {
        m_log.error("initialize: CSPRNG failure");
        return AuthError::RandomFailed;
    }

    auto wrapped{ wrapVerifiedOrError(*m_crypto, m_policy, password, dataKey) };
    if (auto* err = std::get_if<AuthError>(&wrapped))
    {
        m_log.error("initialize: key wrap failed");
        return *err;
    }

    auto stored{ storeParamsOrError(*m_params, std::get<VaultKeyParams>(wrapped)) };
    if (std::holds_alternative<AuthError>(stored))
    {
        m_log.error("initialize: failed to persist key parameters");
        return stored;
    }

    m_log.info("vault key initialized");
    return std::monostate{};
}

AuthResult<DataKey> KeyManager::unlock(const cipherbook::security::SecureString& password) noexcept
{
    auto res{ unlockOrError(*m_crypto, *m_params, password) };
    if (auto* err = std::get_if<AuthError>(&res))
    {
        if (*err == AuthError::InvalidPassword)
        {
            m_log.warn("unlock rejected");
        }
        else
        {
            m_log.error("unlock failed");
        }
        return *err;
    }

    m_log.debug("unlocked");
    return DataKey{ std::move(std::get<SecureBuffer>(res)) };
}

AuthResult<std::monostate> KeyManager::changePassword(const cipherbook::security::SecureString& oldPassword,
                                                      const cipherbook::security::SecureString& newPassword) noexcept
{
    auto res{ unlockOrError(*m_crypto, *m_params, oldPassword) };
    if (auto* err = std::get_if<AuthError>(&res))
    {
        m_log.warn("changePassword: current password rejected");
        return *err;
    }
    auto& dataKey{ std::get<SecureBuffer>(res) };
    auto wipeDk{ cipherbook::security::scopeWipe(dataKey) };

    if (newPassword.empty())
    {
        return AuthError::InvalidPassword;
    }

    auto wrapped{ wrapVerifiedOrError(*m_crypto, m_policy, newPassword, dataKey) };
    if (auto* err = std::get_if<AuthError>(&wrapped))
    {
        m_log.error("changePassword: key wrap failed");
        return *err;
    }

    auto stored{ storeParamsOrError(*m_params, std::get<VaultKeyParams>(wrapped)) };
    if (std::holds_alternative<AuthError>(stored))
    {
        m_log.error("changePassword: failed to persist key parameters; previous password still valid");
        return stored;
    }

    m_log.info("password changed");
    return std::monostate{};
}

AuthResult<VaultKeyParams> KeyManager::exportKeyParams() const noexcept
{
    return loadParamsOrError(*m_params);
}

AuthResult<std::monostate> KeyManager::restoreKeyParams(const VaultKeyParams& params) noexcept
{
    try
    {
        // Re-parsing the serialized form applies the same structural checks as unlock().
        if (!parseVaultKeyParams(serializeVaultKeyParams(params)))
        {
            return AuthError::Corrupt;
        }
    }
    catch (const std::exception&)
    {
        return AuthError::Corrupt;
    }
    if (params.kdf.policyVersion != cipherbook::crypto::g_kKdfPolicyVersion)
    {
        return AuthError::UnsupportedKdf;
    }

    auto stored{ storeParamsOrError(*m_params, params) };
    if (std::holds_alternative<AuthError>(stored))
    {
        m_log.error("restoreKeyParams: failed to persist key parameters");
        return stored;
    }

    m_log.info("key parameters restored");
    return std::monostate{};
}

AuthResult<std::monostate> KeyManager::reset() noexcept
{
    try
    {
        m_params->remove(g_kVaultKeyParamsKey);
    }
    catch (const std::exception&)
    {
        m_log.error("reset: failed to remove key parameters");
        return AuthError::StorageError;
    }

    m_log.warn("vault key parameters removed");
    return std::monostate{};
}

} // namespace cipherbook::core
