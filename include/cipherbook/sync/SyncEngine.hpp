#ifndef INCLUDE_CIPHERBOOK_SYNC_SYNCENGINE_HPP
#define INCLUDE_CIPHERBOOK_SYNC_SYNCENGINE_HPP

#include "cipherbook/core/Logger.hpp"
#include "cipherbook/core/VaultRecord.hpp"
#include "cipherbook/storage/ILocalStore.hpp"
#include "cipherbook/sync/IRemoteStore.hpp"
#include "cipherbook/sync/Subscription.hpp"
#include "cipherbook/sync/SyncErrors.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace cipherbook::sync
{

struct PushSummary final
{
    std::size_t pushed{};
    std::size_t failed{};
};

enum class ApplyOutcome : std::uint8_t
{
    Inserted,
    Overwritten,
    // Local copy won; it stays dirty so the next push corrects the remote.
    KeptLocal,
    Identical,
    // Remote won a timestamp tie; the losing local version was kept under a new id.
    ConflictCopied,
    Failed,
};

// Last-write-wins replication between the local store and a remote document store.
// Never decrypts: vault items travel in their field-encrypted form.
class SyncEngine final
{
public:
    SyncEngine(cipherbook::storage::ILocalStore& local, IRemoteStore& remote,
               cipherbook::core::Logger logger = cipherbook::core::Logger{ "SyncEngine" });

    SyncEngine(const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;
    SyncEngine(SyncEngine&&) = delete;
    SyncEngine& operator=(SyncEngine&&) = delete;
    ~SyncEngine();

    // Pushes every dirty record. Per-record network failures are counted, not fatal.
    [[nodiscard]] SyncResult<PushSummary> pushLocal(std::string_view userId) noexcept;

    ApplyOutcome applyRemote(const cipherbook::core::EncryptedVaultRecord& remote) noexcept;
    ApplyOutcome applyRemote(const cipherbook::core::NoteRecord& remote) noexcept;

    // Initial push, then a remote subscription feeding applyRemote().
    [[nodiscard]] SyncResult<PushSummary> start(std::string_view userId) noexcept;
    void stop() noexcept;
    [[nodiscard]] bool isRunning() const noexcept;

private:
    cipherbook::storage::ILocalStore* m_local{ nullptr };
    IRemoteStore* m_remote{ nullptr };
    cipherbook::core::Logger m_log;

    std::atomic<bool> m_pushInFlight{ false };

    mutable std::mutex m_subMutex;
    std::unique_ptr<Subscription> m_remoteSub;
};

} // namespace cipherbook::sync

#endif // INCLUDE_CIPHERBOOK_SYNC_SYNCENGINE_HPP
