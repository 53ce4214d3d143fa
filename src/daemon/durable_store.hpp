#pragma once

#include <optional>
#include <string>

#include "common/models.hpp"

namespace triage {

// Key/value persistence for the operating mode and per-item status.
// Implementations throw PersistenceError on failure.
class DurableStore {
public:
    virtual ~DurableStore() = default;

    virtual std::optional<std::string> getMode() const = 0;
    virtual void setMode(const std::string &mode) = 0;

    virtual StatusMap getAllStatuses() const = 0;
    virtual void setStatus(const std::string &id, const std::string &status) = 0;
    virtual void removeStatus(const std::string &id) = 0;
};

} // namespace triage
