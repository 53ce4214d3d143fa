#include "daemon/triage_daemon.hpp"

#include <QDebug>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "daemon/automation_gateway.hpp"
#include "daemon/event_hub.hpp"
#include "daemon/item_provider.hpp"
#include "daemon/persistence_gateway.hpp"
#include "daemon/scheduler.hpp"
#include "daemon/snapshot_cache.hpp"
#include "daemon/status_store.hpp"
#include "daemon/triage_api_server.hpp"
#include "daemon/triage_store.hpp"

namespace triage {

TriageDaemon::TriageDaemon(DaemonConfig config, QObject *parent)
    : QObject(parent)
    , m_config(std::move(config))
{
    m_store = std::make_unique<TriageStore>(m_config.databasePath());

    std::string integrityMessage;
    if (!m_store->integrityCheck(&integrityMessage)) {
        qWarning() << "Triage: SQLite integrity check failed, database may be corrupt:"
                   << QString::fromStdString(integrityMessage);
    }

    m_persistence = std::make_unique<PersistenceGateway>(*m_store,
                                                         m_config.legacyStatePath());
    m_statuses = std::make_unique<StatusStore>(*m_persistence,
                                               m_persistence->loadInitialState());
    m_hub = std::make_unique<EventHub>();
    m_provider = std::make_unique<JsonFileProvider>(m_config.registryFile);
    m_cache = std::make_unique<SnapshotCache>(*m_provider, *m_statuses, *m_hub);
    m_launcher = std::make_unique<ProcessTaskLauncher>(m_config.executorProgram,
                                                       m_config.executorArgs);
    m_automation = std::make_unique<AutomationGateway>(*m_launcher, *m_hub);
    m_scheduler = std::make_unique<Scheduler>(*m_statuses, *m_cache, *m_hub);
}

TriageDaemon::~TriageDaemon()
{
    // Stop producers before the components they reference go away.
    if (m_scheduler) {
        m_scheduler->stop();
    }
    m_apiServer.reset();
}

bool TriageDaemon::start()
{
    TLOG_INFO(QStringLiteral("TriageDaemon"),
              QStringLiteral("start"),
              QStringLiteral("daemon_starting"),
              QStringLiteral("process_start"),
              QStringLiteral("env_config"),
              triage::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"dataDir", m_config.dataDir},
                              {"registryFile", m_config.registryFile},
                              {"socket", m_config.socketName},
                              {"mode", toModeString(m_statuses->mode())},
                              {"statuses", m_statuses->size()}}));

    std::string error;
    if (!m_cache->refresh(&error)) {
        qWarning() << "Triage: initial refresh failed, serving empty registry:"
                   << QString::fromStdString(error);
    }

    if (!m_apiServer) {
        m_apiServer = std::make_unique<TriageApiServer>(*m_statuses, *m_cache, *m_hub,
                                                        *m_automation, *m_provider);
        if (!m_apiServer->start(QString::fromStdString(m_config.socketName))) {
            return false;
        }
    }

    m_scheduler->start();
    return true;
}

} // namespace triage
