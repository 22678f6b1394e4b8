#ifndef INCLUDE_CIPHERBOOK_SYNC_ICONNECTIVITYSOURCE_HPP
#define INCLUDE_CIPHERBOOK_SYNC_ICONNECTIVITYSOURCE_HPP

#include "cipherbook/sync/Subscription.hpp"
#include <functional>
#include <memory>

namespace cipherbook::sync
{

class IConnectivitySource
{
public:
    IConnectivitySource() = default;
    IConnectivitySource(const IConnectivitySource&) = delete;
    IConnectivitySource& operator=(const IConnectivitySource&) = delete;
    IConnectivitySource(IConnectivitySource&&) = delete;
    IConnectivitySource& operator=(IConnectivitySource&&) = delete;
    virtual ~IConnectivitySource() = default;

    [[nodiscard]] virtual bool isOnline() const = 0;

    // Called with the new state on every flip, possibly from another thread.
    [[nodiscard]] virtual std::unique_ptr<Subscription> subscribe(std::function<void(bool online)> callback) = 0;
};

} // namespace cipherbook::sync

#endif // INCLUDE_CIPHERBOOK_SYNC_ICONNECTIVITYSOURCE_HPP
