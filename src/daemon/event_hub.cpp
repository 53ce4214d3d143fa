#include "daemon/event_hub.hpp"

#include <algorithm>

#include <QString>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace triage {

std::string eventName(EventKind kind)
{
    switch (kind) {
    case EventKind::Snapshot:
        return std::string();
    case EventKind::Tick:
        return "tick";
    case EventKind::StatusChanged:
        return "status";
    case EventKind::Automation:
        return "automation";
    }
    return std::string();
}

std::string formatPushMessage(const PushMessage &message)
{
    std::string out;
    out.reserve(message.data.size() + message.event.size() + 16);
    if (!message.event.empty()) {
        out += "event: ";
        out += message.event;
        out += "\n";
    }
    out += "data: ";
    out += message.data;
    out += "\n\n";
    return out;
}

Subscription::Subscription(std::size_t capacity)
    : m_capacity(capacity)
{
}

bool Subscription::tryPush(PushMessage message)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_cancelled || m_queue.size() >= m_capacity) {
            return false;
        }
        m_queue.push_back(std::move(message));
    }
    m_ready.notify_one();
    return true;
}

std::optional<PushMessage> Subscription::next()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_ready.wait(lock, [this] { return m_cancelled || !m_queue.empty(); });
    if (m_cancelled) {
        return std::nullopt;
    }
    PushMessage message = std::move(m_queue.front());
    m_queue.pop_front();
    return message;
}

std::optional<PushMessage> Subscription::tryNext()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_cancelled || m_queue.empty()) {
        return std::nullopt;
    }
    PushMessage message = std::move(m_queue.front());
    m_queue.pop_front();
    return message;
}

void Subscription::cancel()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancelled = true;
        m_queue.clear();
    }
    m_ready.notify_all();
}

bool Subscription::isCancelled() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cancelled;
}

std::size_t Subscription::pending() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

EventHub::EventHub(std::size_t capacity)
    : m_capacity(capacity)
{
}

SubscriptionHandle EventHub::subscribe()
{
    auto handle = std::make_shared<Subscription>(m_capacity);
    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_subscribers.push_back(handle);
        count = m_subscribers.size();
    }
    TLOG_DEBUG(QStringLiteral("EventHub"),
               QStringLiteral("subscribe"),
               QStringLiteral("subscriber_added"),
               QStringLiteral("client_connect"),
               QStringLiteral("bounded_queue"),
               triage::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"subscribers", count}}));
    return handle;
}

void EventHub::unsubscribe(const SubscriptionHandle &handle)
{
    if (!handle) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_subscribers.erase(
            std::remove(m_subscribers.begin(), m_subscribers.end(), handle),
            m_subscribers.end());
    }
    handle->cancel();
}

std::optional<PushMessage> EventHub::encode(EventKind kind,
                                            const nlohmann::json &payload) const
{
    try {
        return PushMessage{eventName(kind), payload.dump()};
    } catch (const nlohmann::json::exception &ex) {
        TLOG_ERROR(QStringLiteral("EventHub"),
                   QStringLiteral("encode"),
                   QStringLiteral("broadcast_skipped"),
                   QStringLiteral("serialization_error"),
                   QStringLiteral("json_dump"),
                   triage::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"event", eventName(kind)}, {"error", ex.what()}}));
        return std::nullopt;
    }
}

void EventHub::publish(EventKind kind, const nlohmann::json &payload)
{
    const auto message = encode(kind, payload);
    if (!message.has_value()) {
        return;
    }

    // Queues are filled outside the registry lock.
    std::vector<SubscriptionHandle> targets;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        targets = m_subscribers;
    }

    for (const auto &target : targets) {
        target->tryPush(*message);
    }
}

bool EventHub::sendTo(const SubscriptionHandle &handle, EventKind kind,
                      const nlohmann::json &payload)
{
    if (!handle) {
        return false;
    }
    auto message = encode(kind, payload);
    if (!message.has_value()) {
        return false;
    }
    return handle->tryPush(std::move(*message));
}

void EventHub::publishSnapshot(const std::vector<RegistryItem> &items)
{
    nlohmann::json payload = nlohmann::json::array();
    for (const auto &item : items) {
        payload.push_back(item);
    }
    publish(EventKind::Snapshot, payload);
}

void EventHub::publishTick(int secondsRemaining)
{
    publish(EventKind::Tick, nlohmann::json{{"seconds_remaining", secondsRemaining}});
}

void EventHub::publishStatusChanged(const std::string &id,
                                    const std::string &status,
                                    const std::string &title)
{
    publish(EventKind::StatusChanged,
            nlohmann::json{{"id", id}, {"status", status}, {"title", title}});
}

void EventHub::publishAutomation(const std::string &state,
                                 const std::string &task,
                                 const std::string &error)
{
    nlohmann::json payload{{"state", state}, {"task", task}};
    if (!error.empty()) {
        payload["error"] = error;
    }
    publish(EventKind::Automation, payload);
}

std::size_t EventHub::subscriberCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_subscribers.size();
}

void pumpSubscription(EventHub &hub,
                      const SubscriptionHandle &handle,
                      const std::function<bool(const std::string &)> &sink)
{
    while (auto message = handle->next()) {
        if (!sink(formatPushMessage(*message))) {
            break;
        }
    }
    hub.unsubscribe(handle);
}

} // namespace triage
