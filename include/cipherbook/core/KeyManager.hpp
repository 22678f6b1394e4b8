#ifndef INCLUDE_CIPHERBOOK_CORE_KEYMANAGER_HPP
#define INCLUDE_CIPHERBOOK_CORE_KEYMANAGER_HPP

#include "cipherbook/core/DataKey.hpp"
#include "cipherbook/core/KdfPolicy.hpp"
#include "cipherbook/core/KeyParams.hpp"
#include "cipherbook/core/Logger.hpp"
#include "cipherbook/crypto/ICryptoProvider.hpp"
#include "cipherbook/security/SecureString.hpp"
#include "cipherbook/storage/ISecureParamStore.hpp"
#include <cstdint>
#include <variant>

namespace cipherbook::core
{

enum class AuthError : std::uint8_t
{
    AlreadyInitialized,
    NotInitialized,
    InvalidPassword,
    Corrupt,
    UnsupportedKdf,
    RandomFailed,
    CryptoError,
    StorageError,
};

template <class T> using AuthResult = std::variant<T, AuthError>;

// Owns the persisted wrapping of the vault's DataKey. Never holds the DataKey itself.
class KeyManager final
{
public:
    KeyManager(cipherbook::crypto::ICryptoProvider& crypto, cipherbook::storage::ISecureParamStore& params,
               KdfPolicy policy = defaultKdfPolicy(), Logger logger = Logger{ "KeyManager" });

    [[nodiscard]] bool isInitialized() const noexcept;

    // Generates the DataKey and persists it wrapped under `password`.
    [[nodiscard]] AuthResult<std::monostate> initialize(const cipherbook::security::SecureString& password) noexcept;

    [[nodiscard]] AuthResult<DataKey> unlock(const cipherbook::security::SecureString& password) noexcept;

    // Re-wraps the same DataKey under a fresh salt. The old params stay valid if persisting fails.
    [[nodiscard]] AuthResult<std::monostate> changePassword(const cipherbook::security::SecureString& oldPassword,
                                                            const cipherbook::security::SecureString& newPassword) noexcept;

    [[nodiscard]] AuthResult<VaultKeyParams> exportKeyParams() const noexcept;
    [[nodiscard]] AuthResult<std::monostate> restoreKeyParams(const VaultKeyParams& params) noexcept;

    // Forgets the wrapped key. Anything encrypted under it becomes unreadable.
    [[nodiscard]] AuthResult<std::monostate> reset() noexcept;

    [[nodiscard]] const KdfPolicy& policy() const noexcept
    {
        return m_policy;
    }

private:
    cipherbook::crypto::ICryptoProvider* m_crypto{ nullptr };
    cipherbook::storage::ISecureParamStore* m_params{ nullptr };
    KdfPolicy m_policy;
    Logger m_log;
};

} // namespace cipherbook::core

#endif // INCLUDE_CIPHERBOOK_CORE_KEYMANAGER_HPP
