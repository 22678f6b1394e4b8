#include "cipherbook/sync/OfflineCoordinator.hpp"
#include <exception>
#include <string>
#include <utility>
#include <variant>

namespace cipherbook::sync
{

OfflineCoordinator::OfflineCoordinator(SyncEngine& engine, IConnectivitySource& connectivity, RetryPolicy retry,
                                       NowProvider nowProvider, cipherbook::core::Logger logger)
    : m_engine(&engine), m_connectivity(&connectivity), m_retry(retry), m_now(std::move(nowProvider)),
      m_log(std::move(logger))
{
}

OfflineCoordinator::~OfflineCoordinator()
{
    stopSync();
}

void OfflineCoordinator::startSync(std::string userId)
{
    post(Event{ .kind = EventKind::Start, .online = false, .userId = std::move(userId) });
}

void OfflineCoordinator::stopSync()
{
    post(Event{ .kind = EventKind::Stop, .online = false, .userId = {} });

    std::unique_lock<std::mutex> lock{ m_queueMutex };
    if (m_draining && m_drainThread == std::this_thread::get_id())
    {
        // Inside a handler: the Stop event runs as soon as the current one returns.
        return;
    }
    m_drained.wait(lock, [this]() { return !m_draining; });
}

void OfflineCoordinator::pushLocalChanges()
{
    post(Event{ .kind = EventKind::PushRequest, .online = false, .userId = {} });
}

void OfflineCoordinator::retryIfDue()
{
    post(Event{ .kind = EventKind::RetryTick, .online = false, .userId = {} });
}

CoordinatorState OfflineCoordinator::state() const
{
    std::lock_guard<std::mutex> lock{ m_stateMutex };
    return m_state;
}

bool OfflineCoordinator::isPending() const
{
    return state() == CoordinatorState::Pending;
}

std::optional<std::string> OfflineCoordinator::currentUserId() const
{
    std::lock_guard<std::mutex> lock{ m_stateMutex };
    return m_userId;
}

std::uint32_t OfflineCoordinator::failedAttempts() const
{
    std::lock_guard<std::mutex> lock{ m_stateMutex };
    return m_attempts;
}

std::optional<OfflineCoordinator::TimePoint> OfflineCoordinator::nextRetryAt() const
{
    std::lock_guard<std::mutex> lock{ m_stateMutex };
    return m_nextAttemptAt;
}

void OfflineCoordinator::post(Event event)
{
    std::unique_lock<std::mutex> lock{ m_queueMutex };
    m_queue.push_back(std::move(event));
    if (m_draining)
    {
        return;
    }

    m_draining = true;
    m_drainThread = std::this_thread::get_id();
    while (!m_queue.empty())
    {
        Event next{ std::move(m_queue.front()) };
        m_queue.pop_front();
        lock.unlock();
        try
        {
            handle(next);
        }
        catch (const std::exception& e)
        {
            m_log.error(std::string{ "coordinator event failed: " } + e.what());
        }
        lock.lock();
    }
    m_draining = false;
    m_drainThread = std::thread::id{};
    lock.unlock();
    m_drained.notify_all();
}

void OfflineCoordinator::handle(const Event& event)
{
    switch (event.kind)
    {
    case EventKind::Start:
        onStart(event.userId);
        break;
    case EventKind::Stop:
        onStop();
        break;
    case EventKind::Connectivity:
        onConnectivity(event.online);
        break;
    case EventKind::PushRequest:
        onPushRequest();
        break;
    case EventKind::RetryTick:
        onRetryTick();
        break;
    }
}

void OfflineCoordinator::onStart(const std::string& userId)
{
    if (state() != CoordinatorState::Stopped)
    {
        const auto current{ currentUserId() };
        if (current && *current == userId)
        {
            onPushRequest();
            return;
        }
        m_log.warn("startSync for another user; restarting the session");
        onStop();
    }

    {
        std::lock_guard<std::mutex> lock{ m_stateMutex };
        m_userId = userId;
        m_state = CoordinatorState::Idle;
        m_attempts = 0U;
        m_nextAttemptAt.reset();
    }

    bool online{ false };
    try
    {
        // Flips observed during subscribe() are queued behind this event.
        m_connectivitySub = m_connectivity->subscribe(
            [this](bool isOnline) { post(Event{ .kind = EventKind::Connectivity, .online = isOnline, .userId = {} }); });
        online = m_connectivity->isOnline();
    }
    catch (const std::exception& e)
    {
        m_log.error(std::string{ "connectivity watch failed: " } + e.what());
        onStop();
        return;
    }
    {
        std::lock_guard<std::mutex> lock{ m_stateMutex };
        m_online = online;
    }
    m_log.info(online ? "sync session started online" : "sync session started offline");

    if (online)
    {
        runSync();
        return;
    }
    std::lock_guard<std::mutex> lock{ m_stateMutex };
    m_state = CoordinatorState::Pending;
}

void OfflineCoordinator::onStop()
{
    if (m_connectivitySub)
    {
        m_connectivitySub->cancel();
        m_connectivitySub.reset();
    }
    m_engine->stop();

    std::lock_guard<std::mutex> lock{ m_stateMutex };
    if (m_state != CoordinatorState::Stopped)
    {
        m_log.info("sync session stopped");
    }
    m_state = CoordinatorState::Stopped;
    m_userId.reset();
    m_attempts = 0U;
    m_nextAttemptAt.reset();
}

void OfflineCoordinator::onConnectivity(bool online)
{
    bool resume{ false };
    {
        std::lock_guard<std::mutex> lock{ m_stateMutex };
        if (m_state == CoordinatorState::Stopped)
        {
            return;
        }
        m_online = online;
        if (!online)
        {
            m_state = CoordinatorState::Pending;
        }
        else
        {
            resume = (m_state == CoordinatorState::Pending);
        }
    }

    m_log.info(online ? "connectivity restored" : "connectivity lost");
    if (resume)
    {
        runSync();
    }
}

void OfflineCoordinator::onPushRequest()
{
    {
        std::lock_guard<std::mutex> lock{ m_stateMutex };
        if (m_state == CoordinatorState::Stopped)
        {
            return;
        }
        if (!m_online)
        {
            m_state = CoordinatorState::Pending;
            return;
        }
    }
    runSync();
}

void OfflineCoordinator::onRetryTick()
{
    {
        std::lock_guard<std::mutex> lock{ m_stateMutex };
        if (m_state != CoordinatorState::Pending || !m_online)
        {
            return;
        }
        if (m_nextAttemptAt && m_now() < *m_nextAttemptAt)
        {
            return;
        }
    }
    runSync();
}

void OfflineCoordinator::runSync()
{
    std::string userId{};
    {
        std::lock_guard<std::mutex> lock{ m_stateMutex };
        if (!m_userId)
        {
            return;
        }
        userId = *m_userId;
        m_state = CoordinatorState::Syncing;
    }

    const auto result{ m_engine->isRunning() ? m_engine->pushLocal(userId) : m_engine->start(userId) };

    bool ok{ false };
    if (const auto* summary = std::get_if<PushSummary>(&result))
    {
        ok = (summary->failed == 0U);
    }

    std::lock_guard<std::mutex> lock{ m_stateMutex };
    if (m_state == CoordinatorState::Stopped)
    {
        return;
    }
    if (ok)
    {
        m_state = CoordinatorState::Idle;
        m_attempts = 0U;
        m_nextAttemptAt.reset();
        return;
    }

    m_state = CoordinatorState::Pending;
    if (const auto* err = std::get_if<SyncError>(&result); err != nullptr && *err == SyncError::AlreadyRunning)
    {
        // Another pass owns the push; try again on the next tick without counting a failure.
        m_nextAttemptAt.reset();
        return;
    }
    ++m_attempts;
    const auto delay{ backoffDelay(m_retry, m_attempts) };
    m_nextAttemptAt = m_now() + delay;
    m_log.warn("sync attempt " + std::to_string(m_attempts) + " failed; retry in " + std::to_string(delay.count()) +
               " ms");
}

} // namespace cipherbook::sync
