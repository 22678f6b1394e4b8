#include "cipherbook/core/RecordService.hpp"
#include "cipherbook/security/SecureRandom.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <utility>

namespace cipherbook::core
{
namespace
{

[[nodiscard]] RecordError toRecordError(CipherError e) noexcept
{
    switch (e)
    {
    case CipherError::Locked:
        return RecordError::Locked;
    case CipherError::DecryptFailed:
        return RecordError::DecryptFailed;
    case CipherError::CryptoError:
        return RecordError::CryptoError;
    }
    return RecordError::CryptoError;
}

[[nodiscard]] bool validTags(const std::vector<std::string>& tags) noexcept
{
    return std::none_of(tags.begin(), tags.end(), [](const std::string& t)
                        { return t.empty() || t.find('\n') != std::string::npos; });
}

[[nodiscard]] char foldAscii(char c) noexcept
{
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

[[nodiscard]] bool containsFolded(std::string_view haystack, std::string_view needle)
{
    if (needle.empty())
    {
        return true;
    }
    const auto it{ std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                               [](char a, char b) { return foldAscii(a) == foldAscii(b); }) };
    return it != haystack.end();
}

[[nodiscard]] RecordResult<std::string> newIdOrError() noexcept
{
    try
    {
        auto id{ cipherbook::security::secureRandomUuid() };
        if (!id)
        {
            return RecordError::CryptoError;
        }
        return std::move(*id);
    }
    catch (const std::exception&)
    {
        return RecordError::CryptoError;
    }
}

[[nodiscard]] RecordResult<std::optional<EncryptedVaultRecord>>
findVaultItemOrError(const cipherbook::storage::ILocalStore& store, std::string_view id) noexcept
{
    try
    {
        return store.findVaultItem(id);
    }
    catch (const std::exception&)
    {
        return RecordError::StorageError;
    }
}

[[nodiscard]] RecordResult<std::optional<NoteRecord>> findNoteOrError(const cipherbook::storage::ILocalStore& store,
                                                                      std::string_view id) noexcept
{
    try
    {
        return store.findNote(id);
    }
    catch (const std::exception&)
    {
        return RecordError::StorageError;
    }
}

template <class Record>
[[nodiscard]] RecordResult<std::monostate> putDirtyOrError(cipherbook::storage::ILocalStore& store,
                                                           const Record& record) noexcept
{
    try
    {
        store.put(record, cipherbook::storage::SyncMark::Dirty);
        return std::monostate{};
    }
    catch (const std::exception&)
    {
        return RecordError::StorageError;
    }
}

// Session must be unlocked and not idle past its timeout. Expired sessions are locked here.
[[nodiscard]] bool requireUnlocked(VaultSession& session) noexcept
{
    return session.touchIfUnlocked();
}

} // namespace

RecordService::RecordService(cipherbook::crypto::ICryptoProvider& crypto, cipherbook::storage::ILocalStore& store,
                             WallClock clock, Logger logger)
    : m_store(&store), m_fields(crypto), m_clock(std::move(clock)), m_log(std::move(logger))
{
}

Timestamp RecordService::nextTimestamp(Timestamp previous) const
{
    const Timestamp now{ m_clock() };
    const Timestamp bumped{ previous + std::chrono::milliseconds{ 1 } };
    return std::max(now, bumped);
}

RecordResult<VaultRecord> RecordService::createVaultItem(VaultSession& session, const VaultItemDraft& draft) noexcept
{
    if (!requireUnlocked(session))
    {
        return RecordError::Locked;
    }
    if (draft.title.empty())
    {
        return RecordError::InvalidRecord;
    }

    auto idRes{ newIdOrError() };
    if (auto* err = std::get_if<RecordError>(&idRes))
    {
        return *err;
    }

    try
    {
        VaultRecord record{};
        record.id = std::move(std::get<std::string>(idRes));
        record.title = draft.title;
        record.username = draft.username;
        record.secret = draft.secret;
        record.url = draft.url;
        record.note = draft.note;
        record.updatedAt = nextTimestamp(Timestamp{});

        auto enc{ m_fields.encrypt(record, session.dataKey()) };
        if (auto* err = std::get_if<CipherError>(&enc))
        {
            return toRecordError(*err);
        }
        auto put{ putDirtyOrError(*m_store, std::get<EncryptedVaultRecord>(enc)) };
        if (auto* err = std::get_if<RecordError>(&put))
        {
            m_log.error("createVaultItem: storage failure");
            return *err;
        }
        m_log.debug("vault item created");
        return record;
    }
    catch (const std::exception&)
    {
        return RecordError::StorageError;
    }
}

RecordResult<VaultRecord> RecordService::updateVaultItem(VaultSession& session, const VaultRecord& record) noexcept
{
    if (!requireUnlocked(session))
    {
        return RecordError::Locked;
    }
    if (record.title.empty())
    {
        return RecordError::InvalidRecord;
    }

    auto found{ findVaultItemOrError(*m_store, record.id) };
    if (auto* err = std::get_if<RecordError>(&found))
    {
        return *err;
    }
    const auto& existing{ std::get<std::optional<EncryptedVaultRecord>>(found) };
    if (!existing || existing->deletedAt.has_value())
    {
        return RecordError::NotFound;
    }

    try
    {
        VaultRecord updated{ record };
        updated.updatedAt = nextTimestamp(existing->updatedAt);
        updated.deletedAt.reset();

        auto enc{ m_fields.encrypt(updated, session.dataKey()) };
        if (auto* err = std::get_if<CipherError>(&enc))
        {
            return toRecordError(*err);
        }
        auto put{ putDirtyOrError(*m_store, std::get<EncryptedVaultRecord>(enc)) };
        if (auto* err = std::get_if<RecordError>(&put))
        {
            m_log.error("updateVaultItem: storage failure");
            return *err;
        }
        return updated;
    }
    catch (const std::exception&)
    {
        return RecordError::StorageError;
    }
}

RecordResult<std::monostate> RecordService::deleteVaultItem(VaultSession& session, std::string_view id) noexcept
{
    if (!requireUnlocked(session))
    {
        return RecordError::Locked;
    }

    auto found{ findVaultItemOrError(*m_store, id) };
    if (auto* err = std::get_if<RecordError>(&found))
    {
        return *err;
    }
    auto& existing{ std::get<std::optional<EncryptedVaultRecord>>(found) };
    if (!existing || existing->deletedAt.has_value())
    {
        return RecordError::NotFound;
    }

    try
    {
        const Timestamp stamp{ nextTimestamp(existing->updatedAt) };
        existing->updatedAt = stamp;
        existing->deletedAt = stamp;
    }
    catch (const std::exception&)
    {
        return RecordError::StorageError;
    }

    auto put{ putDirtyOrError(*m_store, *existing) };
    if (std::holds_alternative<RecordError>(put))
    {
        m_log.error("deleteVaultItem: storage failure");
        return put;
    }
    m_log.debug("vault item deleted");
    return std::monostate{};
}

RecordResult<VaultRecord> RecordService::getVaultItem(VaultSession& session, std::string_view id) noexcept
{
    if (!requireUnlocked(session))
    {
        return RecordError::Locked;
    }

    auto found{ findVaultItemOrError(*m_store, id) };
    if (auto* err = std::get_if<RecordError>(&found))
    {
        return *err;
    }
    const auto& existing{ std::get<std::optional<EncryptedVaultRecord>>(found) };
    if (!existing || existing->deletedAt.has_value())
    {
        return RecordError::NotFound;
    }

    auto dec{ m_fields.decrypt(*existing, session.dataKey()) };
    if (auto* err = std::get_if<CipherError>(&dec))
    {
        m_log.warn("getVaultItem: record failed to decrypt");
        return toRecordError(*err);
    }
    return std::move(std::get<VaultRecord>(dec));
}

RecordResult<std::vector<VaultRecord>> RecordService::listVaultItems(VaultSession& session) noexcept
{
    return searchVaultItems(session, {});
}

RecordResult<std::vector<VaultRecord>> RecordService::searchVaultItems(VaultSession& session,
                                                                       std::string_view keyword) noexcept
{
    if (!requireUnlocked(session))
    {
        return RecordError::Locked;
    }

    try
    {
        const auto rows{ m_store->listVaultItems(false) };

        std::vector<VaultRecord> out{};
        out.reserve(rows.size());
        for (const auto& row : rows)
        {
            auto dec{ m_fields.decrypt(row, session.dataKey()) };
            if (auto* err = std::get_if<CipherError>(&dec))
            {
                m_log.warn("listVaultItems: record failed to decrypt");
                return toRecordError(*err);
            }
            auto& plain{ std::get<VaultRecord>(dec) };
            if (containsFolded(plain.title, keyword))
            {
                out.push_back(std::move(plain));
            }
        }
        return out;
    }
    catch (const std::exception&)
    {
        return RecordError::StorageError;
    }
}

RecordResult<NoteRecord> RecordService::createNote(const NoteDraft& draft) noexcept
{
    if (!validTags(draft.tags))
    {
        return RecordError::InvalidRecord;
    }

    auto idRes{ newIdOrError() };
    if (auto* err = std::get_if<RecordError>(&idRes))
    {
        return *err;
    }

    try
    {
        NoteRecord note{};
        note.id = std::move(std::get<std::string>(idRes));
        note.title = draft.title;
        note.content = draft.content;
        note.tags = draft.tags;
        note.updatedAt = nextTimestamp(Timestamp{});

        auto put{ putDirtyOrError(*m_store, note) };
        if (auto* err = std::get_if<RecordError>(&put))
        {
            m_log.error("createNote: storage failure");
            return *err;
        }
        return note;
    }
    catch (const std::exception&)
    {
        return RecordError::StorageError;
    }
}

RecordResult<NoteRecord> RecordService::updateNote(const NoteRecord& note) noexcept
{
    if (!validTags(note.tags))
    {
        return RecordError::InvalidRecord;
    }

    auto found{ findNoteOrError(*m_store, note.id) };
    if (auto* err = std::get_if<RecordError>(&found))
    {
        return *err;
    }
    const auto& existing{ std::get<std::optional<NoteRecord>>(found) };
    if (!existing || existing->deletedAt.has_value())
    {
        return RecordError::NotFound;
    }

    try
    {
        NoteRecord updated{ note };
        updated.updatedAt = nextTimestamp(existing->updatedAt);
        updated.deletedAt.reset();

        auto put{ putDirtyOrError(*m_store, updated) };
        if (auto* err = std::get_if<RecordError>(&put))
        {
            m_log.error("updateNote: storage failure");
            return *err;
        }
        return updated;
    }
    catch (const std::exception&)
    {
        return RecordError::StorageError;
    }
}

RecordResult<std::monostate> RecordService::deleteNote(std::string_view id) noexcept
{
    auto found{ findNoteOrError(*m_store, id) };
    if (auto* err = std::get_if<RecordError>(&found))
    {
        return *err;
    }
    auto& existing{ std::get<std::optional<NoteRecord>>(found) };
    if (!existing || existing->deletedAt.has_value())
    {
        return RecordError::NotFound;
    }

    try
    {
        const Timestamp stamp{ nextTimestamp(existing->updatedAt) };
        existing->updatedAt = stamp;
        existing->deletedAt = stamp;
    }
    catch (const std::exception&)
    {
        return RecordError::StorageError;
    }

    auto put{ putDirtyOrError(*m_store, *existing) };
    if (std::holds_alternative<RecordError>(put))
    {
        m_log.error("deleteNote: storage failure");
        return put;
    }
    return std::monostate{};
}

RecordResult<NoteRecord> RecordService::getNote(std::string_view id) noexcept
{
    auto found{ findNoteOrError(*m_store, id) };
    if (auto* err = std::get_if<RecordError>(&found))
    {
        return *err;
    }
    auto& existing{ std::get<std::optional<NoteRecord>>(found) };
    if (!existing || existing->deletedAt.has_value())
    {
        return RecordError::NotFound;
    }
    return std::move(*existing);
}

RecordResult<std::vector<NoteRecord>> RecordService::listNotes() noexcept
{
    return searchNotes({});
}

RecordResult<std::vector<NoteRecord>> RecordService::searchNotes(std::string_view keyword) noexcept
{
    try
    {
        auto rows{ m_store->listNotes(false) };
        if (keyword.empty())
        {
            return rows;
        }

        std::vector<NoteRecord> out{};
        for (auto& row : rows)
        {
            if (containsFolded(row.title, keyword) || containsFolded(row.content, keyword))
            {
                out.push_back(std::move(row));
            }
        }
        return out;
    }
    catch (const std::exception&)
    {
        return RecordError::StorageError;
    }
}

} // namespace cipherbook::core
