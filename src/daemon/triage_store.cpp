#include "daemon/triage_store.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>

#include <sqlite3.h>

#include "common/errors.hpp"

namespace triage {

namespace {

constexpr const char *kModeMetaKey = "mode";

constexpr const char *kCreateMetaTable =
    "CREATE TABLE IF NOT EXISTS meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

constexpr const char *kCreateStatusesTable =
    "CREATE TABLE IF NOT EXISTS statuses ("
    "    id TEXT PRIMARY KEY,"
    "    status TEXT NOT NULL,"
    "    updated_at INTEGER NOT NULL"
    ");";

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw PersistenceError(std::string("sqlite prepare failed: ")
                                   + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

int64_t nowEpochSeconds()
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw PersistenceError(message);
    }
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

} // namespace

struct TriageStore::Impl {
    sqlite3 *db = nullptr;
    mutable std::mutex mutex;
};

TriageStore::TriageStore(const std::string &databasePath)
    : impl(std::make_unique<Impl>())
{
    const std::filesystem::path path(databasePath);
    if (path.has_parent_path()) {
        std::error_code error;
        std::filesystem::create_directories(path.parent_path(), error);
        if (error) {
            throw PersistenceError("failed to create data directory: " + error.message());
        }
    }

    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(databasePath.c_str(), &impl->db, flags, nullptr) != SQLITE_OK) {
        const std::string message = impl->db ? sqlite3_errmsg(impl->db) : "out of memory";
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw PersistenceError("failed to open triage database: " + message);
    }

    try {
        execOrThrow(impl->db, "PRAGMA journal_mode=WAL;");
        execOrThrow(impl->db, "PRAGMA synchronous=NORMAL;");
        execOrThrow(impl->db, kCreateMetaTable);
        execOrThrow(impl->db, kCreateStatusesTable);
    } catch (const PersistenceError &) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw;
    }
}

TriageStore::~TriageStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
    }
}

std::optional<std::string> TriageStore::getMode() const
{
    return getMeta(kModeMetaKey);
}

void TriageStore::setMode(const std::string &mode)
{
    setMeta(kModeMetaKey, mode);
}

StatusMap TriageStore::getAllStatuses() const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, "SELECT id, status FROM statuses;");

    StatusMap statuses;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        statuses[columnText(stmt.get(), 0)] = columnText(stmt.get(), 1);
    }
    if (rc != SQLITE_DONE) {
        throw PersistenceError(std::string("failed to read statuses: ")
                               + sqlite3_errmsg(impl->db));
    }
    return statuses;
}

void TriageStore::setStatus(const std::string &id, const std::string &status)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO statuses (id, status, updated_at) "
                   "VALUES (?, ?, ?);");
    bindText(stmt.get(), 1, id);
    bindText(stmt.get(), 2, status);
    sqlite3_bind_int64(stmt.get(), 3, nowEpochSeconds());

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw PersistenceError("failed to set status for " + id + ": "
                               + sqlite3_errmsg(impl->db));
    }
}

void TriageStore::removeStatus(const std::string &id)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, "DELETE FROM statuses WHERE id = ?;");
    bindText(stmt.get(), 1, id);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw PersistenceError("failed to remove status for " + id + ": "
                               + sqlite3_errmsg(impl->db));
    }
}

std::optional<std::string> TriageStore::getMeta(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "SELECT value FROM meta WHERE key = ? LIMIT 1;");
    bindText(stmt.get(), 1, key);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }

    return columnText(stmt.get(), 0);
}

void TriageStore::setMeta(const std::string &key, const std::string &value)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);");
    bindText(stmt.get(), 1, key);
    bindText(stmt.get(), 2, value);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw PersistenceError("failed to set meta value " + key);
    }
}

bool TriageStore::integrityCheck(std::string *message) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, "PRAGMA integrity_check;");

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        if (message) {
            *message = "integrity_check failed to return a result";
        }
        return false;
    }

    const std::string result = columnText(stmt.get(), 0);
    if (message) {
        *message = result;
    }
    return result == "ok";
}

} // namespace triage
