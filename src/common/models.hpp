#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace triage {

struct RegistryItem {
    std::string id;
    ItemKind kind = ItemKind::Note;
    std::string title;
    std::string snippet;
    std::optional<std::string> status;
};

// Full payload returned by a provider for a single item.
struct ItemDetail {
    std::string id;
    ItemKind kind = ItemKind::Note;
    std::string title;
    std::string content;
    nlohmann::json raw;
};

using StatusMap = std::map<std::string, std::string>;

struct PersistedState {
    OperatingMode mode = OperatingMode::Auto;
    StatusMap statuses;
};

// Outcome of reconciling the status table against a fresh item list.
struct ReconcileResult {
    std::vector<RegistryItem> defaulted;
    std::vector<std::string> removed;

    bool empty() const
    {
        return defaulted.empty() && removed.empty();
    }
};

} // namespace triage
