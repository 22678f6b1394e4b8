#ifndef INCLUDE_CIPHERBOOK_CORE_VAULTTRANSFER_HPP
#define INCLUDE_CIPHERBOOK_CORE_VAULTTRANSFER_HPP

#include "cipherbook/core/AeadCipher.hpp"
#include "cipherbook/core/Logger.hpp"
#include "cipherbook/core/RecordService.hpp"
#include "cipherbook/core/VaultSession.hpp"
#include "cipherbook/crypto/ICryptoProvider.hpp"
#include "cipherbook/storage/ILocalStore.hpp"
#include <cstddef>
#include <string>
#include <string_view>

namespace cipherbook::core
{

struct ImportSummary final
{
    std::size_t notesImported{};
    std::size_t notesSkipped{};
    std::size_t vaultItemsImported{};
    std::size_t vaultItemsSkipped{};
};

// Encrypted backup of every active record. Vault item fields stay field-encrypted inside the sealed document,
// so an export only opens under the DataKey of the vault that wrote it.
class VaultTransfer final
{
public:
    VaultTransfer(cipherbook::crypto::ICryptoProvider& crypto, cipherbook::storage::ILocalStore& store,
                  Logger logger = Logger{ "VaultTransfer" });

    [[nodiscard]] RecordResult<std::string> exportAll(VaultSession& session) noexcept;

    // Takes a record only when it is missing locally or strictly newer than the local copy.
    [[nodiscard]] RecordResult<ImportSummary> importAll(VaultSession& session, std::string_view envelope) noexcept;

private:
    AeadCipher m_aead;
    cipherbook::storage::ILocalStore* m_store{ nullptr };
    Logger m_log;
};

} // namespace cipherbook::core

#endif // INCLUDE_CIPHERBOOK_CORE_VAULTTRANSFER_HPP
