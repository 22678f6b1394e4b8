#ifndef INCLUDE_CIPHERBOOK_STORAGE_ILOCALSTORE_HPP
#define INCLUDE_CIPHERBOOK_STORAGE_ILOCALSTORE_HPP

#include "cipherbook/core/Timestamp.hpp"
#include "cipherbook/core/VaultRecord.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cipherbook::storage
{

enum class Collection : std::uint8_t
{
    Notes,
    VaultItems,
};

[[nodiscard]] constexpr std::string_view collectionName(Collection c) noexcept
{
    switch (c)
    {
    case Collection::Notes:
        return "notes";
    case Collection::VaultItems:
        return "vault_items";
    }
    return "unknown";
}

// How a put() leaves the row's sync state.
enum class SyncMark : std::uint8_t
{
    // Must be pushed: the local write is newer than anything the remote acknowledged.
    Dirty,
    // Came from the remote as-is.
    Synced,
};

// Offline-first record store. All methods throw StorageError on failure.
class ILocalStore
{
public:
    ILocalStore() = default;
    ILocalStore(const ILocalStore&) = delete;
    ILocalStore& operator=(const ILocalStore&) = delete;
    ILocalStore(ILocalStore&&) = delete;
    ILocalStore& operator=(ILocalStore&&) = delete;
    virtual ~ILocalStore() = default;

    [[nodiscard]] virtual std::optional<cipherbook::core::EncryptedVaultRecord>
    findVaultItem(std::string_view id) const = 0;
    [[nodiscard]] virtual std::optional<cipherbook::core::NoteRecord> findNote(std::string_view id) const = 0;

    // Ordered by updatedAt descending.
    [[nodiscard]] virtual std::vector<cipherbook::core::EncryptedVaultRecord>
    listVaultItems(bool includeDeleted) const = 0;
    [[nodiscard]] virtual std::vector<cipherbook::core::NoteRecord> listNotes(bool includeDeleted) const = 0;

    // Insert or replace by id.
    virtual void put(const cipherbook::core::EncryptedVaultRecord& record, SyncMark mark) = 0;
    virtual void put(const cipherbook::core::NoteRecord& record, SyncMark mark) = 0;

    // Rows that are dirty and either newer than the cursor or never synced, ordered by updatedAt then id.
    [[nodiscard]] virtual std::vector<cipherbook::core::EncryptedVaultRecord>
    dirtyVaultItems(cipherbook::core::Timestamp cursor) const = 0;
    [[nodiscard]] virtual std::vector<cipherbook::core::NoteRecord>
    dirtyNotes(cipherbook::core::Timestamp cursor) const = 0;

    // Records that the remote acknowledged `updatedAt`. No-op (returns false) if the row moved on meanwhile.
    [[nodiscard]] virtual bool markSynced(Collection collection, std::string_view id,
                                          cipherbook::core::Timestamp updatedAt) = 0;

    // Newest updatedAt of an acknowledged row that is older than every still-dirty row.
    // std::nullopt when no such row exists.
    [[nodiscard]] virtual std::optional<cipherbook::core::Timestamp> syncedWatermark(Collection collection) const = 0;

    // Forces the row to be pushed again.
    virtual void markDirty(Collection collection, std::string_view id) = 0;

    [[nodiscard]] virtual std::optional<cipherbook::core::Timestamp> loadCursor(std::string_view userId,
                                                                                Collection collection) const = 0;
    virtual void saveCursor(std::string_view userId, Collection collection, cipherbook::core::Timestamp cursor) = 0;

    // Runs `body` atomically. Nested calls join the outer transaction; an exception rolls back and propagates.
    virtual void runInTransaction(const std::function<void()>& body) = 0;
};

} // namespace cipherbook::storage

#endif // INCLUDE_CIPHERBOOK_STORAGE_ILOCALSTORE_HPP
