#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "common/config.hpp"
#include "common/models.hpp"
#include "daemon/event_hub.hpp"
#include "daemon/item_provider.hpp"
#include "daemon/status_store.hpp"

namespace triage {

/**
 * SnapshotCache holds the last successfully fetched item list and its expiry.
 *
 * A refresh fetches from the provider without holding the cache lock, then
 * swaps items and expiry in one exclusive section. A failed refresh leaves the
 * previous snapshot in place; readers are served stale data rather than an error.
 */
class SnapshotCache {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    struct UpsertResult {
        bool added = false;
        bool statusDefaulted = false;
    };

    SnapshotCache(ItemProvider &provider,
                  StatusStore &statuses,
                  EventHub &hub,
                  std::chrono::steady_clock::duration ttl = kCacheTtl,
                  Clock clock = Clock());

    // Copy of the cached items and whether they are within the TTL.
    std::pair<std::vector<RegistryItem>, bool> read() const;

    // Returns false and fills *error when the provider fails.
    bool refresh(std::string *error = nullptr);

    // Attaches lifecycle status to notes without creating records.
    std::vector<RegistryItem> decorate(std::vector<RegistryItem> items) const;

    UpsertResult upsertSingle(const RegistryItem &item);

    // Decorated items for a caller; refreshes first when stale or empty and
    // falls back to the cached list if that refresh fails.
    std::vector<RegistryItem> itemsForServe();

    void broadcastSnapshot();

    std::string titleFor(const std::string &id) const;
    std::optional<ItemKind> kindFor(const std::string &id) const;

private:
    std::chrono::steady_clock::time_point now() const;

    ItemProvider &m_provider;
    StatusStore &m_statuses;
    EventHub &m_hub;
    const std::chrono::steady_clock::duration m_ttl;
    Clock m_clock;

    mutable std::shared_mutex m_mutex;
    std::vector<RegistryItem> m_items;
    std::chrono::steady_clock::time_point m_expiresAt{};
};

} // namespace triage
