#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <QByteArray>
#include <QLocalServer>
#include <QLocalSocket>
#include <QObject>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "daemon/automation_gateway.hpp"
#include "daemon/event_hub.hpp"
#include "daemon/item_provider.hpp"
#include "daemon/snapshot_cache.hpp"
#include "daemon/status_store.hpp"

namespace triage {

/**
 * TriageApiServer is the request boundary of the daemon. It accepts
 * JSON-RPC-like requests over a local UNIX socket, enforces input validation
 * and the MANUAL-mode policy for mutating actions, and serves long-lived
 * `subscribe` connections that stream push-channel messages.
 */
class TriageApiServer : public QObject
{
    Q_OBJECT
public:
    TriageApiServer(StatusStore &statuses,
                    SnapshotCache &cache,
                    EventHub &hub,
                    AutomationGateway &automation,
                    ItemProvider &provider,
                    QObject *parent = nullptr);
    ~TriageApiServer() override;

    bool start(const QString &socketName);

    // Process a single request payload without a socket round-trip.
    // who names the caller in request logs; empty means the daemon itself.
    QByteArray handleRequestPayload(const QByteArray &payload,
                                    const QString &who = QString());

    std::size_t activeStreams() const;

    void setStreamBacklogLimit(qint64 bytes);
    qint64 streamBacklogBytes() const;
    std::size_t droppedStreamMessages() const;

private slots:
    void handleNewConnection();
    void handleClientReadyRead();

private:
    struct StreamState {
        std::mutex mutex;
        QLocalSocket *socket = nullptr;
        // Bytes handed to the socket that it has not written out yet.
        std::atomic<qint64> backlog{0};
        std::atomic<std::size_t> dropped{0};
    };

    struct StreamWorker {
        SubscriptionHandle handle;
        std::shared_ptr<StreamState> state;
        std::thread thread;
    };

    void startStream(QLocalSocket *socket);
    void stopStream(QLocalSocket *socket);

    nlohmann::json dispatchMethod(const std::string &method,
                                  const nlohmann::json &params,
                                  std::size_t payloadSize);

    void logCompleted(const std::string &method,
                      std::chrono::steady_clock::time_point start,
                      const QString &corrId) const;

    QByteArray makeErrorResponse(const QString &message, int id = -1,
                                 const char *kind = "validation") const;
    QByteArray makeResultResponse(const nlohmann::json &result, int id) const;

    StatusStore &m_statuses;
    SnapshotCache &m_cache;
    EventHub &m_hub;
    AutomationGateway &m_automation;
    ItemProvider &m_provider;
    QLocalServer m_server;

    std::vector<std::unique_ptr<StreamWorker>> m_streams;
    qint64 m_streamBacklogLimit = kMaxStreamBacklogBytes;
};

} // namespace triage
