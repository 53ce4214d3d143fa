#include "daemon/scheduler.hpp"

#include <exception>
#include <string>

#include <QObject>
#include <QString>
#include <QThread>
#include <QTimer>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace triage {

Scheduler::Scheduler(StatusStore &statuses,
                     SnapshotCache &cache,
                     EventHub &hub,
                     int ticksPerRefresh,
                     std::chrono::milliseconds period)
    : m_statuses(statuses)
    , m_cache(cache)
    , m_hub(hub)
    , m_ticksPerRefresh(ticksPerRefresh)
    , m_period(period)
    , m_remaining(ticksPerRefresh)
{
}

Scheduler::~Scheduler()
{
    stop();
}

void Scheduler::start()
{
    if (m_thread) {
        return;
    }

    m_thread = std::make_unique<QThread>();
    m_thread->setObjectName(QStringLiteral("triage-scheduler"));

    // The timer lives on the scheduler thread so ticks never queue behind
    // request handling on the main event loop.
    auto *timer = new QTimer();
    timer->setInterval(m_period);
    timer->moveToThread(m_thread.get());
    QObject::connect(timer, &QTimer::timeout, timer, [this]() { tick(); });
    QObject::connect(m_thread.get(), &QThread::started,
                     timer, qOverload<>(&QTimer::start));
    QObject::connect(m_thread.get(), &QThread::finished,
                     timer, &QObject::deleteLater);
    m_thread->start();

    TLOG_INFO(QStringLiteral("Scheduler"),
              QStringLiteral("start"),
              QStringLiteral("scheduler_started"),
              QStringLiteral("startup"),
              QStringLiteral("qtimer_thread"),
              triage::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"periodMs", m_period.count()},
                             {"ticksPerRefresh", m_ticksPerRefresh}}));
}

void Scheduler::stop()
{
    if (!m_thread) {
        return;
    }
    m_thread->quit();
    m_thread->wait();
    m_thread.reset();
}

bool Scheduler::isRunning() const
{
    return m_thread && m_thread->isRunning();
}

void Scheduler::tick()
{
    try {
        if (m_statuses.mode() != OperatingMode::Auto) {
            m_remaining = m_ticksPerRefresh;
            return;
        }

        --m_remaining;
        m_hub.publishTick(m_remaining);
        if (m_remaining > 0) {
            return;
        }

        std::string error;
        if (!m_cache.refresh(&error)) {
            TLOG_WARN(QStringLiteral("Scheduler"),
                      QStringLiteral("tick"),
                      QStringLiteral("scheduled_refresh_failed"),
                      QStringLiteral("provider_error"),
                      QStringLiteral("broadcast_cached"),
                      triage::logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"error", error}}));
        }
        m_cache.broadcastSnapshot();
        m_remaining = m_ticksPerRefresh;
    } catch (const std::exception &ex) {
        m_remaining = m_ticksPerRefresh;
        TLOG_ERROR(QStringLiteral("Scheduler"),
                   QStringLiteral("tick"),
                   QStringLiteral("tick_failed"),
                   QStringLiteral("exception"),
                   QStringLiteral("continue_loop"),
                   triage::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"what", ex.what()}}));
    }
}

} // namespace triage
