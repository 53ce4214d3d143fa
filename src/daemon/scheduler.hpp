#pragma once

#include <chrono>
#include <memory>

#include "common/config.hpp"
#include "daemon/event_hub.hpp"
#include "daemon/snapshot_cache.hpp"
#include "daemon/status_store.hpp"

class QThread;

namespace triage {

// Scheduler drives automatic refresh. Once per period it samples the mode:
// MANUAL holds the countdown at its start value, AUTO counts down, publishes
// a tick, and at zero refreshes the cache and broadcasts a snapshot.
class Scheduler {
public:
    Scheduler(StatusStore &statuses,
              SnapshotCache &cache,
              EventHub &hub,
              int ticksPerRefresh = kAutoRefreshTicks,
              std::chrono::milliseconds period = kPollInterval);
    ~Scheduler();

    Scheduler(const Scheduler &) = delete;
    Scheduler &operator=(const Scheduler &) = delete;

    // Runs the loop on a dedicated thread until stop().
    void start();
    void stop();
    bool isRunning() const;

    // One loop iteration. Only the scheduler thread calls this outside tests.
    void tick();

    int remaining() const
    {
        return m_remaining;
    }

private:
    StatusStore &m_statuses;
    SnapshotCache &m_cache;
    EventHub &m_hub;
    const int m_ticksPerRefresh;
    const std::chrono::milliseconds m_period;

    int m_remaining;
    std::unique_ptr<QThread> m_thread;
};

} // namespace triage
