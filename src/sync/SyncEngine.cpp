#include "cipherbook/sync/SyncEngine.hpp"
#include "cipherbook/security/SecureRandom.hpp"
#include "cipherbook/storage/StorageErrors.hpp"
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace cipherbook::sync
{
namespace
{

using cipherbook::core::EncryptedVaultRecord;
using cipherbook::core::NoteRecord;
using cipherbook::core::Timestamp;
using cipherbook::storage::Collection;
using cipherbook::storage::SyncMark;

[[nodiscard]] auto contentKey(const EncryptedVaultRecord& r) noexcept
{
    return std::tie(r.titleEnc, r.usernameEnc, r.secretEnc, r.urlEnc, r.noteEnc, r.deletedAt);
}

[[nodiscard]] auto contentKey(const NoteRecord& r) noexcept
{
    return std::tie(r.title, r.content, r.tags, r.deletedAt);
}

[[nodiscard]] constexpr Collection collectionOf(const EncryptedVaultRecord&) noexcept
{
    return Collection::VaultItems;
}

[[nodiscard]] constexpr Collection collectionOf(const NoteRecord&) noexcept
{
    return Collection::Notes;
}

[[nodiscard]] std::optional<EncryptedVaultRecord> findLocal(const cipherbook::storage::ILocalStore& store,
                                                            const EncryptedVaultRecord& r)
{
    return store.findVaultItem(r.id);
}

[[nodiscard]] std::optional<NoteRecord> findLocal(const cipherbook::storage::ILocalStore& store, const NoteRecord& r)
{
    return store.findNote(r.id);
}

class InFlightReset final
{
public:
    explicit InFlightReset(std::atomic<bool>& flag) noexcept : m_flag(flag)
    {
    }
    InFlightReset(const InFlightReset&) = delete;
    InFlightReset& operator=(const InFlightReset&) = delete;
    InFlightReset(InFlightReset&&) = delete;
    InFlightReset& operator=(InFlightReset&&) = delete;
    ~InFlightReset()
    {
        m_flag.store(false);
    }

private:
    std::atomic<bool>& m_flag;
};

// LWW decision for one record, run inside a local transaction.
template <class Record>
[[nodiscard]] ApplyOutcome applyLww(cipherbook::storage::ILocalStore& store, const Record& remote)
{
    const auto local{ findLocal(store, remote) };
    if (!local)
    {
        store.put(remote, SyncMark::Synced);
        return ApplyOutcome::Inserted;
    }
    if (remote.updatedAt > local->updatedAt)
    {
        store.put(remote, SyncMark::Synced);
        return ApplyOutcome::Overwritten;
    }
    if (remote.updatedAt < local->updatedAt)
    {
        store.markDirty(collectionOf(remote), local->id);
        return ApplyOutcome::KeptLocal;
    }

    // Equal timestamps: order by content so every replica picks the same winner.
    const auto localKey{ contentKey(*local) };
    const auto remoteKey{ contentKey(remote) };
    if (localKey == remoteKey)
    {
        (void)store.markSynced(collectionOf(remote), local->id, local->updatedAt);
        return ApplyOutcome::Identical;
    }
    if (remoteKey < localKey)
    {
        store.markDirty(collectionOf(remote), local->id);
        return ApplyOutcome::KeptLocal;
    }

    auto copyId{ cipherbook::security::secureRandomUuid() };
    if (!copyId)
    {
        throw std::runtime_error("sync: CSPRNG failure while creating conflict copy");
    }
    Record copy{ *local };
    copy.id = std::move(*copyId);
    store.put(remote, SyncMark::Synced);
    store.put(copy, SyncMark::Dirty);
    return ApplyOutcome::ConflictCopied;
}

} // namespace

SyncEngine::SyncEngine(cipherbook::storage::ILocalStore& local, IRemoteStore& remote, cipherbook::core::Logger logger)
    : m_local(&local), m_remote(&remote), m_log(std::move(logger))
{
}

SyncEngine::~SyncEngine()
{
    stop();
}

SyncResult<PushSummary> SyncEngine::pushLocal(std::string_view userId) noexcept
{
    if (m_pushInFlight.exchange(true))
    {
        return SyncError::AlreadyRunning;
    }
    InFlightReset reset{ m_pushInFlight };

    PushSummary summary{};

    // Pushes one collection. The cursor only moves across the unbroken run of acknowledged rows at the front.
    const auto pushCollection = [&](Collection collection, Timestamp cursor, const auto& rows, const auto& pushOne)
    {
        Timestamp newCursor{ cursor };
        bool prefixIntact{ true };

        for (const auto& row : rows)
        {
            try
            {
                pushOne(row);
            }
            catch (const NetworkError& e)
            {
                m_log.warn(std::string{ "push failed for " } +
                           std::string{ cipherbook::storage::collectionName(collection) } + " record: " + e.what());
                ++summary.failed;
                prefixIntact = false;
                continue;
            }
            catch (const std::exception& e)
            {
                m_log.error(std::string{ "remote store error: " } + e.what());
                ++summary.failed;
                prefixIntact = false;
                continue;
            }

            (void)m_local->markSynced(collection, row.id, row.updatedAt);
            ++summary.pushed;
            if (prefixIntact && row.updatedAt > newCursor)
            {
                newCursor = row.updatedAt;
            }
        }

        // Rows acknowledged by earlier passes also count once nothing older is still pending.
        const auto watermark{ m_local->syncedWatermark(collection) };
        if (watermark && *watermark > newCursor)
        {
            newCursor = *watermark;
        }

        if (newCursor != cursor)
        {
            m_local->saveCursor(userId, collection, newCursor);
        }
    };

    try
    {
        {
            const Timestamp cursor{ m_local->loadCursor(userId, Collection::Notes).value_or(Timestamp{}) };
            const auto rows{ m_local->dirtyNotes(cursor) };
            pushCollection(Collection::Notes, cursor, rows, [&](const NoteRecord& r) { m_remote->pushNote(userId, r); });
        }
        {
            const Timestamp cursor{ m_local->loadCursor(userId, Collection::VaultItems).value_or(Timestamp{}) };
            const auto rows{ m_local->dirtyVaultItems(cursor) };
            pushCollection(Collection::VaultItems, cursor, rows,
                           [&](const EncryptedVaultRecord& r) { m_remote->pushVaultItem(userId, r); });
        }
    }
    catch (const std::exception& e)
    {
        m_log.error(std::string{ "push aborted by local storage failure: " } + e.what());
        return SyncError::StorageError;
    }

    if (summary.pushed > 0U || summary.failed > 0U)
    {
        m_log.info("push pass: " + std::to_string(summary.pushed) + " pushed, " + std::to_string(summary.failed) +
                   " failed");
    }
    return summary;
}

ApplyOutcome SyncEngine::applyRemote(const EncryptedVaultRecord& remote) noexcept
{
    try
    {
        ApplyOutcome outcome{ ApplyOutcome::Failed };
        m_local->runInTransaction([&]() { outcome = applyLww(*m_local, remote); });
        if (outcome == ApplyOutcome::ConflictCopied)
        {
            m_log.warn("vault item conflict on equal timestamps; local version kept as a copy");
        }
        return outcome;
    }
    catch (const std::exception& e)
    {
        m_log.error(std::string{ "applyRemote(vault item) failed: " } + e.what());
        return ApplyOutcome::Failed;
    }
}

ApplyOutcome SyncEngine::applyRemote(const NoteRecord& remote) noexcept
{
    try
    {
        ApplyOutcome outcome{ ApplyOutcome::Failed };
        m_local->runInTransaction([&]() { outcome = applyLww(*m_local, remote); });
        if (outcome == ApplyOutcome::ConflictCopied)
        {
            m_log.warn("note conflict on equal timestamps; local version kept as a copy");
        }
        return outcome;
    }
    catch (const std::exception& e)
    {
        m_log.error(std::string{ "applyRemote(note) failed: " } + e.what());
        return ApplyOutcome::Failed;
    }
}

SyncResult<PushSummary> SyncEngine::start(std::string_view userId) noexcept
{
    auto pushed{ pushLocal(userId) };
    if (std::holds_alternative<SyncError>(pushed))
    {
        return pushed;
    }

    std::lock_guard<std::mutex> lock{ m_subMutex };
    if (m_remoteSub)
    {
        return pushed;
    }

    try
    {
        RemoteHandlers handlers{};
        handlers.onVaultItem = [this](const EncryptedVaultRecord& r) { (void)applyRemote(r); };
        handlers.onNote = [this](const NoteRecord& r) { (void)applyRemote(r); };
        handlers.onError = [this](const std::exception& e)
        { m_log.warn(std::string{ "remote subscription error: " } + e.what()); };
        m_remoteSub = m_remote->watch(userId, std::move(handlers));
    }
    catch (const std::exception& e)
    {
        m_log.warn(std::string{ "remote subscription failed: " } + e.what());
        return SyncError::NetworkError;
    }

    m_log.info("sync started");
    return pushed;
}

void SyncEngine::stop() noexcept
{
    std::unique_ptr<Subscription> sub{};
    {
        std::lock_guard<std::mutex> lock{ m_subMutex };
        sub = std::move(m_remoteSub);
    }
    if (sub)
    {
        sub->cancel();
        m_log.info("sync stopped");
    }
}

bool SyncEngine::isRunning() const noexcept
{
    std::lock_guard<std::mutex> lock{ m_subMutex };
    return m_remoteSub != nullptr;
}

} // namespace cipherbook::sync
