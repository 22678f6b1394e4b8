#ifndef INCLUDE_CIPHERBOOK_SYNC_SUBSCRIPTION_HPP
#define INCLUDE_CIPHERBOOK_SYNC_SUBSCRIPTION_HPP

namespace cipherbook::sync
{

// Handle for a callback registration. Destroying it cancels; cancel() is idempotent.
class Subscription
{
public:
    Subscription() = default;
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    Subscription(Subscription&&) = delete;
    Subscription& operator=(Subscription&&) = delete;
    virtual ~Subscription() = default;

    virtual void cancel() noexcept = 0;
};

} // namespace cipherbook::sync

#endif // INCLUDE_CIPHERBOOK_SYNC_SUBSCRIPTION_HPP
