#ifndef INCLUDE_CIPHERBOOK_SYNC_OFFLINECOORDINATOR_HPP
#define INCLUDE_CIPHERBOOK_SYNC_OFFLINECOORDINATOR_HPP

#include "cipherbook/core/Logger.hpp"
#include "cipherbook/sync/IConnectivitySource.hpp"
#include "cipherbook/sync/RetryPolicy.hpp"
#include "cipherbook/sync/Subscription.hpp"
#include "cipherbook/sync/SyncEngine.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace cipherbook::sync
{

enum class CoordinatorState : std::uint8_t
{
    Stopped,
    Idle,
    // Local changes exist that could not be pushed yet.
    Pending,
    Syncing,
};

// Drives a SyncEngine from connectivity changes, explicit requests and retry ticks.
// Every input becomes an event on one queue; events are handled strictly one at a time
// by whichever thread found the queue idle.
class OfflineCoordinator final
{
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using NowProvider = std::function<TimePoint()>;

    OfflineCoordinator(SyncEngine& engine, IConnectivitySource& connectivity, RetryPolicy retry = RetryPolicy{},
                       NowProvider nowProvider = Clock::now,
                       cipherbook::core::Logger logger = cipherbook::core::Logger{ "OfflineCoordinator" });

    OfflineCoordinator(const OfflineCoordinator&) = delete;
    OfflineCoordinator& operator=(const OfflineCoordinator&) = delete;
    OfflineCoordinator(OfflineCoordinator&&) = delete;
    OfflineCoordinator& operator=(OfflineCoordinator&&) = delete;
    ~OfflineCoordinator();

    void startSync(std::string userId);

    // Waits for queued events to finish unless called from inside one of them.
    void stopSync();

    void pushLocalChanges();

    // Retries a pending sync once its backoff has elapsed. Meant for the application's timer.
    void retryIfDue();

    [[nodiscard]] CoordinatorState state() const;
    [[nodiscard]] bool isPending() const;
    [[nodiscard]] std::optional<std::string> currentUserId() const;
    [[nodiscard]] std::uint32_t failedAttempts() const;
    [[nodiscard]] std::optional<TimePoint> nextRetryAt() const;

private:
    enum class EventKind : std::uint8_t
    {
        Start,
        Stop,
        Connectivity,
        PushRequest,
        RetryTick,
    };

    struct Event final
    {
        EventKind kind{ EventKind::PushRequest };
        bool online{ false };
        std::string userId;
    };

    void post(Event event);
    void handle(const Event& event);

    void onStart(const std::string& userId);
    void onStop();
    void onConnectivity(bool online);
    void onPushRequest();
    void onRetryTick();
    void runSync();

    SyncEngine* m_engine{ nullptr };
    IConnectivitySource* m_connectivity{ nullptr };
    RetryPolicy m_retry;
    NowProvider m_now;
    cipherbook::core::Logger m_log;

    std::mutex m_queueMutex;
    std::condition_variable m_drained;
    std::deque<Event> m_queue;
    bool m_draining{ false };
    std::thread::id m_drainThread{};

    // Only the draining thread writes these; readers take the lock.
    mutable std::mutex m_stateMutex;
    CoordinatorState m_state{ CoordinatorState::Stopped };
    std::optional<std::string> m_userId;
    bool m_online{ false };
    std::uint32_t m_attempts{ 0U };
    std::optional<TimePoint> m_nextAttemptAt;

    std::unique_ptr<Subscription> m_connectivitySub;
};

} // namespace cipherbook::sync

#endif // INCLUDE_CIPHERBOOK_SYNC_OFFLINECOORDINATOR_HPP
