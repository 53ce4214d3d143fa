#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/models.hpp"

namespace triage {

enum class EventKind {
    Snapshot,
    Tick,
    StatusChanged,
    Automation
};

// One push-channel message. An empty event name means a snapshot.
struct PushMessage {
    std::string event;
    std::string data;
};

std::string eventName(EventKind kind);

// Encodes a message as `event: <kind>\ndata: <json>\n\n`, omitting the
// event line for snapshots.
std::string formatPushMessage(const PushMessage &message);

// Bounded queue owned by one live connection.
class Subscription {
public:
    explicit Subscription(std::size_t capacity);

    // Never blocks. Returns false when the queue is full or cancelled.
    bool tryPush(PushMessage message);

    // Blocks until a message arrives or the subscription is cancelled.
    std::optional<PushMessage> next();
    std::optional<PushMessage> tryNext();

    void cancel();
    bool isCancelled() const;
    std::size_t pending() const;
    std::size_t capacity() const
    {
        return m_capacity;
    }

private:
    const std::size_t m_capacity;
    mutable std::mutex m_mutex;
    std::condition_variable m_ready;
    std::deque<PushMessage> m_queue;
    bool m_cancelled = false;
};

using SubscriptionHandle = std::shared_ptr<Subscription>;

/**
 * EventHub fans events out to every live subscription.
 *
 * Delivery is at-most-once: a subscriber whose queue is full misses the
 * event. Publishing never waits on a subscriber.
 */
class EventHub {
public:
    explicit EventHub(std::size_t capacity = kSubscriberCapacity);

    SubscriptionHandle subscribe();
    void unsubscribe(const SubscriptionHandle &handle);

    void publish(EventKind kind, const nlohmann::json &payload);
    // Delivers to a single subscriber, e.g. the initial snapshot on connect.
    bool sendTo(const SubscriptionHandle &handle, EventKind kind,
                const nlohmann::json &payload);

    void publishSnapshot(const std::vector<RegistryItem> &items);
    void publishTick(int secondsRemaining);
    void publishStatusChanged(const std::string &id,
                              const std::string &status,
                              const std::string &title);
    void publishAutomation(const std::string &state,
                           const std::string &task,
                           const std::string &error = std::string());

    std::size_t subscriberCount() const;

private:
    std::optional<PushMessage> encode(EventKind kind, const nlohmann::json &payload) const;

    const std::size_t m_capacity;
    mutable std::mutex m_mutex;
    std::vector<SubscriptionHandle> m_subscribers;
};

// Reader loop for one connection: forwards queued messages, already formatted
// for the wire, to `sink` until the subscription is cancelled or the sink
// reports a broken transport. Deregisters the subscription before returning.
void pumpSubscription(EventHub &hub,
                      const SubscriptionHandle &handle,
                      const std::function<bool(const std::string &)> &sink);

} // namespace triage
