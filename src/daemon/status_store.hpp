#pragma once

#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "common/enums.hpp"
#include "common/models.hpp"
#include "daemon/persistence_gateway.hpp"

namespace triage {

/**
 * StatusStore owns the authoritative status table for note items together
 * with the operating mode. Both live behind one reader/writer lock; durable
 * writes go through PersistenceGateway after the lock is released.
 */
class StatusStore {
public:
    StatusStore(PersistenceGateway &persistence, PersistedState initial);

    // Recorded status, or Pending. A missing record is created and persisted.
    std::string get(const std::string &id);

    // Throws ValidationError for an empty id and InvalidStatus for an
    // unrecognized status. Persists before returning.
    void set(const std::string &id, const std::string &status);

    // Next status in lifecycle order. Does not store the result.
    std::string cycle(const std::string &id, CycleDirection direction) const;

    // Defaults new live notes to Pending and drops records of notes that
    // are no longer live. Non-note items are ignored. In-memory only.
    ReconcileResult reconcile(const std::vector<RegistryItem> &liveItems);
    void persistReconcile(const ReconcileResult &result);

    // Creates a Pending record if none exists. Returns true when created.
    bool ensureDefault(const std::string &id);

    std::optional<std::string> peek(const std::string &id) const;
    StatusMap peekAll() const;
    std::size_t size() const;

    OperatingMode mode() const;
    void setMode(OperatingMode mode);

    static std::string cycleStatus(const std::string &current, CycleDirection direction);

private:
    PersistenceGateway &m_persistence;

    mutable std::shared_mutex m_mutex;
    OperatingMode m_mode;
    StatusMap m_statuses;
};

} // namespace triage
