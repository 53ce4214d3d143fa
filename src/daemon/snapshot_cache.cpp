#include "daemon/snapshot_cache.hpp"

#include <mutex>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace triage {

namespace {

std::string sanitizeTitle(const std::string &raw)
{
    const std::string title = trimmed(raw);
    return title.empty() ? std::string("Untitled") : title;
}

} // namespace

SnapshotCache::SnapshotCache(ItemProvider &provider,
                             StatusStore &statuses,
                             EventHub &hub,
                             std::chrono::steady_clock::duration ttl,
                             Clock clock)
    : m_provider(provider)
    , m_statuses(statuses)
    , m_hub(hub)
    , m_ttl(ttl)
    , m_clock(std::move(clock))
{
}

std::chrono::steady_clock::time_point SnapshotCache::now() const
{
    return m_clock ? m_clock() : std::chrono::steady_clock::now();
}

std::pair<std::vector<RegistryItem>, bool> SnapshotCache::read() const
{
    const auto current = now();
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return {m_items, current < m_expiresAt};
}

bool SnapshotCache::refresh(std::string *error)
{
    const auto start = std::chrono::steady_clock::now();

    std::vector<RegistryItem> items;
    try {
        items = m_provider.listAll();
    } catch (const ProviderError &ex) {
        TLOG_ERROR(QStringLiteral("SnapshotCache"),
                   QStringLiteral("refresh"),
                   QStringLiteral("provider_fetch_failed"),
                   QStringLiteral("upstream_error"),
                   QStringLiteral("keep_previous_snapshot"),
                   triage::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"error", ex.what()}}));
        if (error) {
            *error = ex.what();
        }
        return false;
    }

    for (auto &item : items) {
        item.status.reset();
    }

    const ReconcileResult changes = m_statuses.reconcile(items);

    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_items = items;
        m_expiresAt = now() + m_ttl;
    }

    if (!changes.empty()) {
        m_statuses.persistReconcile(changes);
        for (const auto &item : changes.defaulted) {
            m_hub.publishStatusChanged(item.id, item.status.value_or(kDefaultStatus),
                                       item.title);
        }
    }

    TLOG_INFO(QStringLiteral("SnapshotCache"),
              QStringLiteral("refresh"),
              QStringLiteral("cache_refreshed"),
              QStringLiteral("provider_fetch"),
              QStringLiteral("swap_snapshot"),
              triage::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"count", items.size()},
                             {"defaulted", changes.defaulted.size()},
                             {"removed", changes.removed.size()},
                             {"durationMs",
                              std::chrono::duration_cast<std::chrono::milliseconds>(
                                  std::chrono::steady_clock::now() - start).count()}}));
    return true;
}

std::vector<RegistryItem> SnapshotCache::decorate(std::vector<RegistryItem> items) const
{
    const StatusMap statuses = m_statuses.peekAll();
    for (auto &item : items) {
        if (!hasLifecycle(item.kind)) {
            item.status.reset();
            continue;
        }
        const auto it = statuses.find(item.id);
        item.status = it != statuses.end() ? it->second : std::string(kDefaultStatus);
    }
    return items;
}

SnapshotCache::UpsertResult SnapshotCache::upsertSingle(const RegistryItem &item)
{
    UpsertResult result;
    if (item.id.empty()) {
        return result;
    }

    RegistryItem cached = item;
    cached.title = sanitizeTitle(item.title);
    cached.status.reset();

    if (hasLifecycle(cached.kind)) {
        result.statusDefaulted = m_statuses.ensureDefault(cached.id);
    }

    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        bool replaced = false;
        for (auto &existing : m_items) {
            if (existing.id == cached.id) {
                existing = cached;
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            m_items.push_back(cached);
            result.added = true;
        }
        m_expiresAt = now() + m_ttl;
    }

    if (result.statusDefaulted) {
        m_hub.publishStatusChanged(cached.id, kDefaultStatus, cached.title);
    }
    return result;
}

std::vector<RegistryItem> SnapshotCache::itemsForServe()
{
    auto [items, fresh] = read();
    if (!fresh || items.empty()) {
        // A failed refresh is already logged; serve whatever is cached.
        refresh();
        items = read().first;
    }
    return decorate(std::move(items));
}

void SnapshotCache::broadcastSnapshot()
{
    m_hub.publishSnapshot(decorate(read().first));
}

std::string SnapshotCache::titleFor(const std::string &id) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    for (const auto &item : m_items) {
        if (item.id == id) {
            return item.title;
        }
    }
    return std::string();
}

std::optional<ItemKind> SnapshotCache::kindFor(const std::string &id) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    for (const auto &item : m_items) {
        if (item.id == id) {
            return item.kind;
        }
    }
    return std::nullopt;
}

} // namespace triage
