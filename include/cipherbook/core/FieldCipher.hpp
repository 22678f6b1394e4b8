#ifndef INCLUDE_CIPHERBOOK_CORE_FIELDCIPHER_HPP
#define INCLUDE_CIPHERBOOK_CORE_FIELDCIPHER_HPP

#include "cipherbook/core/AeadCipher.hpp"
#include "cipherbook/core/DataKey.hpp"
#include "cipherbook/core/VaultRecord.hpp"
#include "cipherbook/crypto/ICryptoProvider.hpp"

namespace cipherbook::core
{

// Per-field encryption of vault items. Each field gets its own nonce and is bound to its field name.
class FieldCipher final
{
public:
    explicit FieldCipher(cipherbook::crypto::ICryptoProvider& crypto) noexcept;

    [[nodiscard]] CipherResult<EncryptedVaultRecord> encrypt(const VaultRecord& record, const DataKey& key) noexcept;

    // All or nothing: one bad field fails the whole record.
    [[nodiscard]] CipherResult<VaultRecord> decrypt(const EncryptedVaultRecord& record, const DataKey& key) noexcept;

private:
    AeadCipher m_aead;
};

} // namespace cipherbook::core

#endif // INCLUDE_CIPHERBOOK_CORE_FIELDCIPHER_HPP
