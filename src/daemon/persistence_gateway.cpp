#include "daemon/persistence_gateway.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace triage {

namespace {

void logPersistenceFailure(const char *where, const std::string &what,
                           const nlohmann::json &context)
{
    TLOG_ERROR(QStringLiteral("PersistenceGateway"),
               QString::fromLatin1(where),
               QStringLiteral("persist_failed"),
               QString::fromStdString(what),
               QStringLiteral("sqlite"),
               triage::logging::defaultWho(),
               QString(),
               context);
}

} // namespace

PersistenceGateway::PersistenceGateway(DurableStore &store, std::string legacyStatePath)
    : m_store(store)
    , m_legacyStatePath(std::move(legacyStatePath))
{
}

PersistedState PersistenceGateway::loadInitialState()
{
    const auto start = std::chrono::steady_clock::now();

    std::error_code error;
    if (std::filesystem::exists(m_legacyStatePath, error)) {
        TLOG_INFO(QStringLiteral("PersistenceGateway"),
                  QStringLiteral("loadInitialState"),
                  QStringLiteral("legacy_state_found"),
                  QStringLiteral("startup"),
                  QStringLiteral("migrate_to_sqlite"),
                  triage::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"path", m_legacyStatePath}}));
        migrateLegacy();
    }

    PersistedState state;
    try {
        if (const auto mode = m_store.getMode()) {
            if (const auto parsed = parseModeString(*mode)) {
                state.mode = *parsed;
            }
        }
    } catch (const PersistenceError &ex) {
        logPersistenceFailure("loadInitialState", "load_mode",
                              nlohmann::json{{"error", ex.what()}});
    }

    try {
        state.statuses = m_store.getAllStatuses();
    } catch (const PersistenceError &ex) {
        logPersistenceFailure("loadInitialState", "load_statuses",
                              nlohmann::json{{"error", ex.what()}});
    }

    TLOG_INFO(QStringLiteral("PersistenceGateway"),
              QStringLiteral("loadInitialState"),
              QStringLiteral("state_restored"),
              QStringLiteral("startup"),
              QStringLiteral("sqlite"),
              triage::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"mode", toModeString(state.mode)},
                             {"items", state.statuses.size()},
                             {"durationMs",
                              std::chrono::duration_cast<std::chrono::milliseconds>(
                                  std::chrono::steady_clock::now() - start).count()}}));
    return state;
}

void PersistenceGateway::writeMode(OperatingMode mode)
{
    try {
        m_store.setMode(toModeString(mode));
    } catch (const PersistenceError &ex) {
        logPersistenceFailure("writeMode", "write_mode",
                              nlohmann::json{{"error", ex.what()}});
    }
}

void PersistenceGateway::writeStatus(const std::string &id, const std::string &status)
{
    try {
        m_store.setStatus(id, status);
    } catch (const PersistenceError &ex) {
        logPersistenceFailure("writeStatus", "write_status",
                              nlohmann::json{{"id", id}, {"error", ex.what()}});
    }
}

void PersistenceGateway::removeStatus(const std::string &id)
{
    try {
        m_store.removeStatus(id);
    } catch (const PersistenceError &ex) {
        logPersistenceFailure("removeStatus", "remove_status",
                              nlohmann::json{{"id", id}, {"error", ex.what()}});
    }
}

bool PersistenceGateway::migrateLegacy()
{
    std::ifstream in(m_legacyStatePath);
    if (!in) {
        TLOG_ERROR(QStringLiteral("PersistenceGateway"),
                   QStringLiteral("migrateLegacy"),
                   QStringLiteral("legacy_read_failed"),
                   QStringLiteral("open_failed"),
                   QStringLiteral("ifstream"),
                   triage::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", m_legacyStatePath}}));
        return false;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    in.close();

    const auto parsed = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        // Left in place so an operator can inspect it.
        TLOG_ERROR(QStringLiteral("PersistenceGateway"),
                   QStringLiteral("migrateLegacy"),
                   QStringLiteral("legacy_state_corrupt"),
                   QStringLiteral("json_parse"),
                   QStringLiteral("abandon_migration"),
                   triage::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", m_legacyStatePath}}));
        return false;
    }

    const auto modeIt = parsed.find("mode");
    if (modeIt != parsed.end() && modeIt->is_string()) {
        if (const auto mode = parseModeString(modeIt->get<std::string>())) {
            writeMode(*mode);
        }
    }

    std::size_t migrated = 0;
    const auto statusesIt = parsed.find("statuses");
    if (statusesIt != parsed.end() && statusesIt->is_object()) {
        for (auto it = statusesIt->begin(); it != statusesIt->end(); ++it) {
            // Historic Keep/Delete tokens and anything unrecognized restart at Pending.
            const std::string token = it.value().is_string()
                ? it.value().get<std::string>()
                : std::string();
            writeStatus(it.key(), normalizeStatus(token));
            ++migrated;
        }
    }

    const std::string backupPath = m_legacyStatePath + kLegacyBackupSuffix;
    std::error_code error;
    std::filesystem::rename(m_legacyStatePath, backupPath, error);
    if (error) {
        TLOG_ERROR(QStringLiteral("PersistenceGateway"),
                   QStringLiteral("migrateLegacy"),
                   QStringLiteral("legacy_backup_failed"),
                   QString::fromStdString(error.message()),
                   QStringLiteral("rename"),
                   triage::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", m_legacyStatePath}}));
        return false;
    }

    TLOG_INFO(QStringLiteral("PersistenceGateway"),
              QStringLiteral("migrateLegacy"),
              QStringLiteral("legacy_state_migrated"),
              QStringLiteral("startup"),
              QStringLiteral("rename_backup"),
              triage::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"backup", backupPath}, {"statuses", migrated}}));
    return true;
}

} // namespace triage
