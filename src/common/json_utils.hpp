#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace triage {

// Lifecycle order for note items. Cycling wraps around at both ends.
inline constexpr std::array<const char *, 7> kStatusOrder = {
    "Pending",
    "Execute",
    "Active",
    "Blocked",
    "Review",
    "Complete",
    "Error",
};

inline constexpr const char *kDefaultStatus = "Pending";

inline bool isValidStatus(const std::string &status)
{
    return std::find(kStatusOrder.begin(), kStatusOrder.end(), status)
        != kStatusOrder.end();
}

inline std::string normalizeStatus(const std::string &status)
{
    return isValidStatus(status) ? status : std::string(kDefaultStatus);
}

inline std::string toKindString(ItemKind kind)
{
    switch (kind) {
    case ItemKind::Note:
        return "note";
    case ItemKind::Document:
        return "document";
    case ItemKind::Sheet:
        return "sheet";
    }
    return "note";
}

// Only notes move through the status lifecycle.
inline bool hasLifecycle(ItemKind kind)
{
    switch (kind) {
    case ItemKind::Note:
        return true;
    case ItemKind::Document:
    case ItemKind::Sheet:
        return false;
    }
    return false;
}

// Listing text shown when the upstream entry carries no snippet.
inline std::string defaultSnippet(ItemKind kind)
{
    switch (kind) {
    case ItemKind::Note:
        return "Note";
    case ItemKind::Document:
        return "Document";
    case ItemKind::Sheet:
        return "Sheet";
    }
    return std::string();
}

inline std::optional<ItemKind> parseKindString(const std::string &value)
{
    if (value == "note") {
        return ItemKind::Note;
    }
    if (value == "document") {
        return ItemKind::Document;
    }
    if (value == "sheet") {
        return ItemKind::Sheet;
    }
    return std::nullopt;
}

inline std::string toModeString(OperatingMode mode)
{
    switch (mode) {
    case OperatingMode::Auto:
        return "AUTO";
    case OperatingMode::Manual:
        return "MANUAL";
    }
    return "AUTO";
}

inline std::optional<OperatingMode> parseModeString(const std::string &value)
{
    if (value == "AUTO") {
        return OperatingMode::Auto;
    }
    if (value == "MANUAL") {
        return OperatingMode::Manual;
    }
    return std::nullopt;
}

inline std::string trimmed(const std::string &value)
{
    auto begin = value.begin();
    auto end = value.end();
    while (begin != end && std::isspace(static_cast<unsigned char>(*begin))) {
        ++begin;
    }
    while (end != begin && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(begin, end);
}

// Accepts the loose truthy spellings dashboards send for flags like ?refresh=.
inline bool isTruthy(const nlohmann::json &value)
{
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number_integer()) {
        return value.get<long long>() != 0;
    }
    if (!value.is_string()) {
        return false;
    }
    std::string lowered = trimmed(value.get<std::string>());
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered == "1" || lowered == "true" || lowered == "t" || lowered == "yes"
        || lowered == "y" || lowered == "force" || lowered == "refresh";
}

inline void to_json(nlohmann::json &j, const ItemKind &kind)
{
    j = toKindString(kind);
}

inline void from_json(const nlohmann::json &j, ItemKind &kind)
{
    kind = ItemKind::Note;
    if (j.is_string()) {
        if (const auto parsed = parseKindString(j.get<std::string>())) {
            kind = *parsed;
        }
    }
}

inline void to_json(nlohmann::json &j, const RegistryItem &item)
{
    j = nlohmann::json{
        {"id", item.id},
        {"type", item.kind},
        {"title", item.title},
        {"snippet", item.snippet}
    };
    if (item.status.has_value()) {
        j["status"] = *item.status;
    }
}

inline void from_json(const nlohmann::json &j, RegistryItem &item)
{
    item.id = j.value("id", "");
    if (j.contains("type")) {
        item.kind = j.at("type").get<ItemKind>();
    } else {
        item.kind = ItemKind::Note;
    }
    item.title = j.value("title", "");
    item.snippet = j.value("snippet", "");
    if (j.contains("status") && j.at("status").is_string()) {
        item.status = j.at("status").get<std::string>();
    } else {
        item.status.reset();
    }
}

} // namespace triage
