#pragma once

#include <memory>

#include <QObject>

#include "common/config.hpp"

namespace triage {

class AutomationGateway;
class EventHub;
class JsonFileProvider;
class PersistenceGateway;
class ProcessTaskLauncher;
class Scheduler;
class SnapshotCache;
class StatusStore;
class TriageApiServer;
class TriageStore;

/**
 * TriageDaemon wires the sync core together:
 * - durable state in TriageStore, loaded through PersistenceGateway
 * - the status table, snapshot cache and event hub
 * - the auto-refresh scheduler and the local API server
 *
 * It is owned from main() and driven by Qt's event loop.
 */
class TriageDaemon : public QObject
{
    Q_OBJECT
public:
    explicit TriageDaemon(DaemonConfig config, QObject *parent = nullptr);
    ~TriageDaemon() override;

    // Performs the initial refresh, then starts the scheduler and API server.
    bool start();

private:
    DaemonConfig m_config;

    std::unique_ptr<TriageStore> m_store;
    std::unique_ptr<PersistenceGateway> m_persistence;
    std::unique_ptr<StatusStore> m_statuses;
    std::unique_ptr<EventHub> m_hub;
    std::unique_ptr<JsonFileProvider> m_provider;
    std::unique_ptr<SnapshotCache> m_cache;
    std::unique_ptr<ProcessTaskLauncher> m_launcher;
    std::unique_ptr<AutomationGateway> m_automation;
    std::unique_ptr<Scheduler> m_scheduler;
    std::unique_ptr<TriageApiServer> m_apiServer;
};

} // namespace triage
