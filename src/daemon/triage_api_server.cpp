#include "daemon/triage_api_server.hpp"

#include <algorithm>
#include <utility>

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMetaObject>
#include <QUuid>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace triage {

namespace {

constexpr const char *kEmptyContent = "No body content.";

std::string requireId(const nlohmann::json &params)
{
    const auto it = params.find("id");
    if (it == params.end() || !it->is_string()) {
        throw ValidationError("missing id");
    }
    const std::string id = trimmed(it->get<std::string>());
    if (id.empty()) {
        throw ValidationError("missing id");
    }
    return id;
}

std::string stringParam(const nlohmann::json &params, const char *key)
{
    const auto it = params.find(key);
    if (it == params.end() || !it->is_string()) {
        return std::string();
    }
    return it->get<std::string>();
}

nlohmann::json itemsToJson(const std::vector<RegistryItem> &items)
{
    nlohmann::json array = nlohmann::json::array();
    for (const auto &item : items) {
        array.push_back(item);
    }
    return array;
}

} // namespace

TriageApiServer::TriageApiServer(StatusStore &statuses,
                                 SnapshotCache &cache,
                                 EventHub &hub,
                                 AutomationGateway &automation,
                                 ItemProvider &provider,
                                 QObject *parent)
    : QObject(parent)
    , m_statuses(statuses)
    , m_cache(cache)
    , m_hub(hub)
    , m_automation(automation)
    , m_provider(provider)
{
}

TriageApiServer::~TriageApiServer()
{
    for (auto &worker : m_streams) {
        {
            std::lock_guard<std::mutex> lock(worker->state->mutex);
            worker->state->socket = nullptr;
        }
        worker->handle->cancel();
        if (worker->thread.joinable()) {
            worker->thread.join();
        }
    }
    m_streams.clear();
}

bool TriageApiServer::start(const QString &socketName)
{
    if (socketName.contains('/')) {
        const QFileInfo socketInfo(socketName);
        if (!QDir().mkpath(socketInfo.absolutePath())) {
            qWarning() << "Failed to create runtime socket directory"
                       << socketInfo.absolutePath();
            return false;
        }

        if (QFile::exists(socketName)) {
            if (!QLocalServer::removeServer(socketName)) {
                qWarning() << "Failed to remove existing Triage socket" << socketName;
                return false;
            }
        }
    } else {
        QLocalServer::removeServer(socketName);
    }

    if (!m_server.listen(socketName)) {
        qWarning() << "Failed to listen on Triage socket" << socketName
                   << m_server.errorString();
        return false;
    }

    connect(&m_server, &QLocalServer::newConnection,
            this, &TriageApiServer::handleNewConnection);

    qInfo() << "Triage API server listening on" << socketName;
    return true;
}

void TriageApiServer::handleNewConnection()
{
    while (m_server.hasPendingConnections()) {
        QLocalSocket *socket = m_server.nextPendingConnection();
        if (!socket) {
            continue;
        }
        connect(socket, &QLocalSocket::readyRead,
                this, &TriageApiServer::handleClientReadyRead);
        connect(socket, &QLocalSocket::disconnected, this, [this, socket]() {
            stopStream(socket);
            socket->deleteLater();
        });
    }
}

void TriageApiServer::handleClientReadyRead()
{
    auto *socket = qobject_cast<QLocalSocket *>(sender());
    if (!socket) {
        return;
    }

    const QByteArray payload = socket->readAll();
    if (payload.isEmpty()) {
        return;
    }

    const auto parsed = nlohmann::json::parse(payload.toStdString(), nullptr, false);
    const bool subscribe = parsed.is_object() && parsed.contains("method")
        && parsed["method"].is_string() && parsed["method"] == "subscribe";
    if (subscribe) {
        // The socket now belongs to the stream; ignore any further input.
        disconnect(socket, &QLocalSocket::readyRead,
                   this, &TriageApiServer::handleClientReadyRead);
        startStream(socket);
        return;
    }

    socket->write(handleRequestPayload(payload,
                                       triage::logging::peerWho(socket->socketDescriptor())));
    socket->flush();
    socket->disconnectFromServer();
}

void TriageApiServer::startStream(QLocalSocket *socket)
{
    auto worker = std::make_unique<StreamWorker>();
    worker->handle = m_hub.subscribe();
    worker->state = std::make_shared<StreamState>();
    worker->state->socket = socket;

    const SubscriptionHandle handle = worker->handle;
    const std::shared_ptr<StreamState> state = worker->state;
    const qint64 backlogLimit = m_streamBacklogLimit;
    connect(socket, &QLocalSocket::bytesWritten, socket, [state](qint64 written) {
        state->backlog -= written;
    });
    worker->thread = std::thread([this, handle, state]() {
        // Only this subscriber gets the initial snapshot, and a slow upstream
        // refresh here never stalls the request loop.
        const auto items = m_cache.itemsForServe();
        if (!items.empty()) {
            m_hub.sendTo(handle, EventKind::Snapshot, itemsToJson(items));
        }

        pumpSubscription(m_hub, handle, [state, backlogLimit](const std::string &chunk) {
            std::lock_guard<std::mutex> lock(state->mutex);
            QLocalSocket *target = state->socket;
            if (!target) {
                return false;
            }
            const QByteArray bytes = QByteArray::fromStdString(chunk);
            // A client that stopped reading loses events instead of growing the write buffer.
            if (state->backlog.load() + bytes.size() > backlogLimit) {
                ++state->dropped;
                return true;
            }
            state->backlog += bytes.size();
            QMetaObject::invokeMethod(target, [target, bytes]() {
                target->write(bytes);
                target->flush();
            }, Qt::QueuedConnection);
            return true;
        });
    });

    TLOG_INFO(QStringLiteral("TriageApiServer"),
              QStringLiteral("startStream"),
              QStringLiteral("subscriber_connected"),
              QStringLiteral("client_subscribe"),
              QStringLiteral("reader_thread"),
              triage::logging::peerWho(socket->socketDescriptor()),
              QString(),
              (nlohmann::json{{"subscribers", m_hub.subscriberCount()}}));
    m_streams.push_back(std::move(worker));
}

void TriageApiServer::stopStream(QLocalSocket *socket)
{
    auto it = std::find_if(m_streams.begin(), m_streams.end(),
                           [socket](const std::unique_ptr<StreamWorker> &worker) {
                               return worker->state->socket == socket;
                           });
    if (it == m_streams.end()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock((*it)->state->mutex);
        (*it)->state->socket = nullptr;
    }
    (*it)->handle->cancel();
    if ((*it)->thread.joinable()) {
        (*it)->thread.join();
    }
    const std::size_t dropped = (*it)->state->dropped.load();
    m_streams.erase(it);

    TLOG_INFO(QStringLiteral("TriageApiServer"),
              QStringLiteral("stopStream"),
              QStringLiteral("subscriber_disconnected"),
              QStringLiteral("client_disconnect"),
              QStringLiteral("cancel_subscription"),
              triage::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"subscribers", m_hub.subscriberCount()},
                              {"dropped", dropped}}));
}

std::size_t TriageApiServer::activeStreams() const
{
    return m_streams.size();
}

void TriageApiServer::setStreamBacklogLimit(qint64 bytes)
{
    m_streamBacklogLimit = bytes;
}

qint64 TriageApiServer::streamBacklogBytes() const
{
    qint64 total = 0;
    for (const auto &worker : m_streams) {
        total += worker->state->backlog.load();
    }
    return total;
}

std::size_t TriageApiServer::droppedStreamMessages() const
{
    std::size_t total = 0;
    for (const auto &worker : m_streams) {
        total += worker->state->dropped.load();
    }
    return total;
}

QByteArray TriageApiServer::handleRequestPayload(const QByteArray &payload, const QString &who)
{
    const QString caller = who.isEmpty() ? triage::logging::defaultWho() : who;
    const QString corrId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    triage::logging::CorrelationScope corrScope(corrId);
    const auto parsed = nlohmann::json::parse(payload.toStdString(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        TLOG_WARN(QStringLiteral("TriageApiServer"),
                  QStringLiteral("handleRequest"),
                  QStringLiteral("api_request_error"),
                  QStringLiteral("parse_payload"),
                  QStringLiteral("json_parse"),
                  caller,
                  corrId,
                  nlohmann::json::object());
        return makeErrorResponse("Invalid JSON payload");
    }

    int id = -1;
    if (parsed.contains("id") && parsed["id"].is_number_integer()) {
        id = parsed["id"].get<int>();
    }

    if (!parsed.contains("method") || !parsed["method"].is_string()) {
        return makeErrorResponse("Missing method", id);
    }

    const std::string method = parsed["method"].get<std::string>();
    nlohmann::json params = nlohmann::json::object();
    if (parsed.contains("params")) {
        if (!parsed["params"].is_object()) {
            return makeErrorResponse("Invalid params", id);
        }
        params = parsed["params"];
    }

    TLOG_INFO(QStringLiteral("TriageApiServer"),
              QStringLiteral("handleRequest"),
              QStringLiteral("api_request_received"),
              QStringLiteral("client_call"),
              QStringLiteral("json_rpc"),
              caller,
              corrId,
              (nlohmann::json{{"method", method}}));

    const auto start = std::chrono::steady_clock::now();
    try {
        nlohmann::json result = dispatchMethod(method, params,
                                               static_cast<std::size_t>(payload.size()));
        logCompleted(method, start, corrId);
        return makeResultResponse(result, id);
    } catch (const ValidationError &ex) {
        return makeErrorResponse(QString::fromStdString(ex.what()), id, "validation");
    } catch (const AuthorizationError &ex) {
        TLOG_WARN(QStringLiteral("TriageApiServer"),
                  QStringLiteral("handleRequest"),
                  QStringLiteral("api_request_rejected"),
                  QStringLiteral("mode_policy"),
                  QStringLiteral("json_rpc"),
                  caller,
                  corrId,
                  (nlohmann::json{{"method", method}}));
        return makeErrorResponse(QString::fromStdString(ex.what()), id, "authorization");
    } catch (const ProviderError &ex) {
        TLOG_ERROR(QStringLiteral("TriageApiServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_error"),
                   QStringLiteral("provider_error"),
                   QStringLiteral("json_rpc"),
                   caller,
                   corrId,
                   (nlohmann::json{{"method", method}, {"what", ex.what()}}));
        return makeErrorResponse(QString::fromStdString(ex.what()), id, "provider");
    } catch (const LaunchError &ex) {
        return makeErrorResponse(QString::fromStdString(ex.what()), id, "launch");
    } catch (const std::exception &ex) {
        TLOG_ERROR(QStringLiteral("TriageApiServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_error"),
                   QStringLiteral("exception"),
                   QStringLiteral("json_rpc"),
                   caller,
                   corrId,
                   (nlohmann::json{{"method", method}, {"what", ex.what()}}));
        return makeErrorResponse(QString::fromStdString(ex.what()), id, "internal");
    }
}

nlohmann::json TriageApiServer::dispatchMethod(const std::string &method,
                                               const nlohmann::json &params,
                                               std::size_t payloadSize)
{
    if (method == "get_registry") {
        const bool forceRefresh = m_statuses.mode() == OperatingMode::Manual
            && params.contains("refresh") && isTruthy(params["refresh"]);
        if (forceRefresh) {
            m_cache.refresh();
            m_cache.broadcastSnapshot();
        }
        return nlohmann::json{{"items", itemsToJson(m_cache.itemsForServe())}};
    }

    if (method == "get_item") {
        const std::string requested = requireId(params);
        const ItemDetail detail = m_provider.getDetail(requested);

        RegistryItem item;
        item.id = detail.id.empty() ? requested : detail.id;
        item.kind = detail.kind;
        item.title = detail.title;
        if (detail.raw.is_object() && detail.raw.contains("snippet")
            && detail.raw["snippet"].is_string()) {
            item.snippet = detail.raw["snippet"].get<std::string>();
        }
        if (trimmed(item.snippet).empty()) {
            item.snippet = defaultSnippet(item.kind);
        }

        const auto upsert = m_cache.upsertSingle(item);
        if (upsert.added) {
            m_cache.broadcastSnapshot();
        }

        std::string content = trimmed(detail.content);
        if (content.empty()) {
            content = kEmptyContent;
        }

        nlohmann::json result{
            {"id", item.id},
            {"type", item.kind},
            {"title", m_cache.titleFor(item.id)},
            {"content", content}
        };
        if (hasLifecycle(item.kind)) {
            result["status"] = m_statuses.get(item.id);
        }
        return result;
    }

    if (method == "delete_item") {
        const std::string itemId = requireId(params);
        if (m_statuses.mode() != OperatingMode::Manual) {
            throw AuthorizationError("delete requires MANUAL mode");
        }
        m_provider.deleteItem(itemId);
        m_cache.refresh();
        m_cache.broadcastSnapshot();
        return nlohmann::json{{"ok", true}};
    }

    if (method == "get_mode") {
        return nlohmann::json{{"mode", toModeString(m_statuses.mode())}};
    }

    if (method == "set_mode") {
        const auto mode = parseModeString(stringParam(params, "mode"));
        if (!mode.has_value()) {
            throw ValidationError("invalid mode");
        }
        m_statuses.setMode(*mode);
        return nlohmann::json{{"mode", toModeString(*mode)}};
    }

    if (method == "set_status" || method == "cycle_status") {
        const std::string itemId = requireId(params);
        const auto kind = m_cache.kindFor(itemId);
        if (kind.has_value() && !hasLifecycle(*kind)) {
            throw ValidationError("status applies to notes only");
        }
        std::string status;
        if (method == "set_status") {
            status = stringParam(params, "status");
            if (status.empty()) {
                throw ValidationError("missing status");
            }
        } else {
            const std::string direction = stringParam(params, "direction");
            if (direction == "forward" || direction.empty()) {
                status = m_statuses.cycle(itemId, CycleDirection::Forward);
            } else if (direction == "back") {
                status = m_statuses.cycle(itemId, CycleDirection::Back);
            } else {
                throw ValidationError("invalid direction");
            }
        }

        m_statuses.set(itemId, status);

        const std::string title = m_cache.titleFor(itemId);
        if (!title.empty()) {
            m_hub.publishStatusChanged(itemId, status, title);
        }
        m_cache.broadcastSnapshot();
        return nlohmann::json{{"id", itemId}, {"status", status}};
    }

    if (method == "dispatch_automation") {
        if (payloadSize > kMaxAutomationPayloadBytes) {
            throw ValidationError("invalid request payload");
        }
        if (m_statuses.mode() != OperatingMode::Manual) {
            throw AuthorizationError("automation dispatch requires MANUAL mode");
        }
        const std::string task = trimmed(stringParam(params, "task"));
        if (task.empty()) {
            throw ValidationError("task is required");
        }
        std::string error;
        if (!m_automation.dispatch(task, &error)) {
            throw LaunchError("automation dispatch failed: " + error);
        }
        return nlohmann::json{{"status", "accepted"}};
    }

    if (method == "subscribe") {
        throw ValidationError("subscribe requires a socket connection");
    }

    TLOG_WARN(QStringLiteral("TriageApiServer"),
              QStringLiteral("handleRequest"),
              QStringLiteral("api_request_error"),
              QStringLiteral("unknown_method"),
              QStringLiteral("json_rpc"),
              triage::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"method", method}}));
    throw ValidationError("Unknown method");
}

void TriageApiServer::logCompleted(const std::string &method,
                                   std::chrono::steady_clock::time_point start,
                                   const QString &corrId) const
{
    TLOG_INFO(QStringLiteral("TriageApiServer"),
              QStringLiteral("handleRequest"),
              QStringLiteral("api_request_completed"),
              QStringLiteral("client_call"),
              QStringLiteral("json_rpc"),
              triage::logging::defaultWho(),
              corrId,
              (nlohmann::json{{"method", method},
                             {"durationMs",
                              std::chrono::duration_cast<std::chrono::milliseconds>(
                                  std::chrono::steady_clock::now() - start).count()}}));
}

QByteArray TriageApiServer::makeErrorResponse(const QString &message, int id,
                                              const char *kind) const
{
    nlohmann::json response;
    response["error"] = message.toStdString();
    response["kind"] = kind;
    response["id"] = id;
    return QByteArray::fromStdString(response.dump());
}

QByteArray TriageApiServer::makeResultResponse(const nlohmann::json &result,
                                               int id) const
{
    nlohmann::json response;
    response["result"] = result;
    response["id"] = id;
    return QByteArray::fromStdString(
        response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

} // namespace triage
