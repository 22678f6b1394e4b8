#ifndef INCLUDE_CIPHERBOOK_CORE_RECORDSERVICE_HPP
#define INCLUDE_CIPHERBOOK_CORE_RECORDSERVICE_HPP

#include "cipherbook/core/FieldCipher.hpp"
#include "cipherbook/core/Logger.hpp"
#include "cipherbook/core/Timestamp.hpp"
#include "cipherbook/core/VaultRecord.hpp"
#include "cipherbook/core/VaultSession.hpp"
#include "cipherbook/crypto/ICryptoProvider.hpp"
#include "cipherbook/storage/ILocalStore.hpp"
#include <cstdint>
#include <string_view>
#include <variant>
#include <vector>

namespace cipherbook::core
{

enum class RecordError : std::uint8_t
{
    NotFound,
    Locked,
    DecryptFailed,
    InvalidRecord,
    StorageError,
    CryptoError,
};

template <class T> using RecordResult = std::variant<T, RecordError>;

// Application-facing record operations. Every write bumps updatedAt and leaves the row dirty for sync.
class RecordService final
{
public:
    RecordService(cipherbook::crypto::ICryptoProvider& crypto, cipherbook::storage::ILocalStore& store,
                  WallClock clock = systemNow, Logger logger = Logger{ "RecordService" });

    [[nodiscard]] RecordResult<VaultRecord> createVaultItem(VaultSession& session, const VaultItemDraft& draft) noexcept;
    [[nodiscard]] RecordResult<VaultRecord> updateVaultItem(VaultSession& session, const VaultRecord& record) noexcept;
    // Soft delete: the row stays, with deletedAt set, so the deletion syncs.
    [[nodiscard]] RecordResult<std::monostate> deleteVaultItem(VaultSession& session, std::string_view id) noexcept;
    [[nodiscard]] RecordResult<VaultRecord> getVaultItem(VaultSession& session, std::string_view id) noexcept;
    // Active items, newest first.
    [[nodiscard]] RecordResult<std::vector<VaultRecord>> listVaultItems(VaultSession& session) noexcept;
    [[nodiscard]] RecordResult<std::vector<VaultRecord>> searchVaultItems(VaultSession& session,
                                                                          std::string_view keyword) noexcept;

    [[nodiscard]] RecordResult<NoteRecord> createNote(const NoteDraft& draft) noexcept;
    [[nodiscard]] RecordResult<NoteRecord> updateNote(const NoteRecord& note) noexcept;
    [[nodiscard]] RecordResult<std::monostate> deleteNote(std::string_view id) noexcept;
    [[nodiscard]] RecordResult<NoteRecord> getNote(std::string_view id) noexcept;
    [[nodiscard]] RecordResult<std::vector<NoteRecord>> listNotes() noexcept;
    [[nodiscard]] RecordResult<std::vector<NoteRecord>> searchNotes(std::string_view keyword) noexcept;

private:
    [[nodiscard]] Timestamp nextTimestamp(Timestamp previous) const;

    cipherbook::storage::ILocalStore* m_store{ nullptr };
    FieldCipher m_fields;
    WallClock m_clock;
    Logger m_log;
};

} // namespace cipherbook::core

#endif // INCLUDE_CIPHERBOOK_CORE_RECORDSERVICE_HPP
