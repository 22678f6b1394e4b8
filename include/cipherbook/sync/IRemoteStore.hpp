#ifndef INCLUDE_CIPHERBOOK_SYNC_IREMOTESTORE_HPP
#define INCLUDE_CIPHERBOOK_SYNC_IREMOTESTORE_HPP

#include "cipherbook/core/VaultRecord.hpp"
#include "cipherbook/sync/Subscription.hpp"
#include <exception>
#include <functional>
#include <memory>
#include <string_view>

namespace cipherbook::sync
{

struct RemoteHandlers final
{
    std::function<void(const cipherbook::core::EncryptedVaultRecord&)> onVaultItem;
    std::function<void(const cipherbook::core::NoteRecord&)> onNote;
    std::function<void(const std::exception&)> onError;
};

// Document backend keyed by user id and record id. Only ever sees encrypted vault items.
class IRemoteStore
{
public:
    IRemoteStore() = default;
    IRemoteStore(const IRemoteStore&) = delete;
    IRemoteStore& operator=(const IRemoteStore&) = delete;
    IRemoteStore(IRemoteStore&&) = delete;
    IRemoteStore& operator=(IRemoteStore&&) = delete;
    virtual ~IRemoteStore() = default;

    // Upsert by id. Throw NetworkError on transport failure.
    virtual void pushVaultItem(std::string_view userId, const cipherbook::core::EncryptedVaultRecord& record) = 0;
    virtual void pushNote(std::string_view userId, const cipherbook::core::NoteRecord& record) = 0;

    // Delivers remote mutations until the subscription is cancelled. Handlers may run on any thread.
    [[nodiscard]] virtual std::unique_ptr<Subscription> watch(std::string_view userId, RemoteHandlers handlers) = 0;
};

} // namespace cipherbook::sync

#endif // INCLUDE_CIPHERBOOK_SYNC_IREMOTESTORE_HPP
