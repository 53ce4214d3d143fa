#pragma once

#include <memory>
#include <optional>
#include <string>

#include "daemon/durable_store.hpp"

namespace triage {

// TriageStore is the SQLite access layer for durable daemon state:
// the meta table (operating mode) and the per-item status table.
// A single connection is shared; statements are serialized internally.
class TriageStore : public DurableStore {
public:
    explicit TriageStore(const std::string &databasePath);
    ~TriageStore() override;

    std::optional<std::string> getMode() const override;
    void setMode(const std::string &mode) override;

    StatusMap getAllStatuses() const override;
    void setStatus(const std::string &id, const std::string &status) override;
    void removeStatus(const std::string &id) override;

    std::optional<std::string> getMeta(const std::string &key) const;
    void setMeta(const std::string &key, const std::string &value);

    bool integrityCheck(std::string *message) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace triage
