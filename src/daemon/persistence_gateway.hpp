#pragma once

#include <string>

#include "common/models.hpp"
#include "daemon/durable_store.hpp"

namespace triage {

/**
 * PersistenceGateway is the only writer to durable storage.
 *
 * Writes are synchronous and best-effort: a failed write is logged and
 * otherwise ignored, so the in-memory mutation that triggered it stands.
 * At startup it migrates the legacy JSON state file exactly once.
 */
class PersistenceGateway {
public:
    PersistenceGateway(DurableStore &store, std::string legacyStatePath);

    // Migrates a present legacy file, then reads mode and statuses.
    // Missing or unreadable durable data yields AUTO with no statuses.
    PersistedState loadInitialState();

    void writeMode(OperatingMode mode);
    void writeStatus(const std::string &id, const std::string &status);
    void removeStatus(const std::string &id);

    // Returns true when a legacy file was translated and renamed.
    bool migrateLegacy();

    const std::string &legacyStatePath() const
    {
        return m_legacyStatePath;
    }

private:
    DurableStore &m_store;
    std::string m_legacyStatePath;
};

} // namespace triage
