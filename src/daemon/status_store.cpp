#include "daemon/status_store.hpp"

#include <algorithm>
#include <iterator>
#include <mutex>
#include <set>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace triage {

StatusStore::StatusStore(PersistenceGateway &persistence, PersistedState initial)
    : m_persistence(persistence)
    , m_mode(initial.mode)
    , m_statuses(std::move(initial.statuses))
{
}

std::string StatusStore::get(const std::string &id)
{
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        const auto it = m_statuses.find(id);
        if (it != m_statuses.end()) {
            return it->second;
        }
    }

    std::string status = kDefaultStatus;
    bool created = false;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        const auto inserted = m_statuses.emplace(id, kDefaultStatus);
        created = inserted.second;
        status = inserted.first->second;
    }

    if (created) {
        m_persistence.writeStatus(id, status);
    }
    return status;
}

void StatusStore::set(const std::string &id, const std::string &status)
{
    if (id.empty()) {
        throw ValidationError("missing id");
    }
    if (!isValidStatus(status)) {
        throw InvalidStatus(status);
    }

    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_statuses[id] = status;
    }

    m_persistence.writeStatus(id, status);
}

std::string StatusStore::cycle(const std::string &id, CycleDirection direction) const
{
    std::string current;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        const auto it = m_statuses.find(id);
        if (it != m_statuses.end()) {
            current = it->second;
        }
    }
    return cycleStatus(current, direction);
}

std::string StatusStore::cycleStatus(const std::string &current, CycleDirection direction)
{
    const auto count = static_cast<int>(kStatusOrder.size());
    const auto found = std::find(kStatusOrder.begin(), kStatusOrder.end(), current);
    const int index = found == kStatusOrder.end()
        ? 0
        : static_cast<int>(std::distance(kStatusOrder.begin(), found));

    int next = 0;
    switch (direction) {
    case CycleDirection::Forward:
        next = (index + 1) % count;
        break;
    case CycleDirection::Back:
        next = (index - 1 + count) % count;
        break;
    }
    return kStatusOrder[static_cast<std::size_t>(next)];
}

ReconcileResult StatusStore::reconcile(const std::vector<RegistryItem> &liveItems)
{
    std::set<std::string> liveNoteIds;
    for (const auto &item : liveItems) {
        if (hasLifecycle(item.kind)) {
            liveNoteIds.insert(item.id);
        }
    }

    ReconcileResult result;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        for (const auto &item : liveItems) {
            if (!hasLifecycle(item.kind)) {
                continue;
            }
            if (m_statuses.emplace(item.id, kDefaultStatus).second) {
                RegistryItem defaulted = item;
                defaulted.status = kDefaultStatus;
                result.defaulted.push_back(std::move(defaulted));
            }
        }

        for (auto it = m_statuses.begin(); it != m_statuses.end();) {
            if (liveNoteIds.count(it->first) == 0) {
                result.removed.push_back(it->first);
                it = m_statuses.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto &id : result.removed) {
        TLOG_INFO(QStringLiteral("StatusStore"),
                  QStringLiteral("reconcile"),
                  QStringLiteral("stale_status_removed"),
                  QStringLiteral("item_no_longer_listed"),
                  QStringLiteral("reconcile"),
                  triage::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"id", id}}));
    }
    return result;
}

void StatusStore::persistReconcile(const ReconcileResult &result)
{
    for (const auto &item : result.defaulted) {
        m_persistence.writeStatus(item.id, item.status.value_or(kDefaultStatus));
    }
    for (const auto &id : result.removed) {
        m_persistence.removeStatus(id);
    }
}

bool StatusStore::ensureDefault(const std::string &id)
{
    bool created = false;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        created = m_statuses.emplace(id, kDefaultStatus).second;
    }
    if (created) {
        m_persistence.writeStatus(id, kDefaultStatus);
    }
    return created;
}

std::optional<std::string> StatusStore::peek(const std::string &id) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    const auto it = m_statuses.find(id);
    if (it == m_statuses.end()) {
        return std::nullopt;
    }
    return it->second;
}

StatusMap StatusStore::peekAll() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_statuses;
}

std::size_t StatusStore::size() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_statuses.size();
}

OperatingMode StatusStore::mode() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_mode;
}

void StatusStore::setMode(OperatingMode mode)
{
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_mode = mode;
    }
    m_persistence.writeMode(mode);
}

} // namespace triage
