#include "daemon/item_provider.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include <QString>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace triage {

namespace {

std::string entryId(const nlohmann::json &entry)
{
    if (!entry.is_object()) {
        return std::string();
    }
    const auto it = entry.find("id");
    return it != entry.end() && it->is_string() ? it->get<std::string>() : std::string();
}

} // namespace

JsonFileProvider::JsonFileProvider(std::string path)
    : m_path(std::move(path))
{
}

nlohmann::json JsonFileProvider::readDocument() const
{
    std::ifstream in(m_path);
    if (!in) {
        throw ProviderError("unable to open registry file " + m_path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    auto document = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded() || !document.is_object()
        || !document.contains("items") || !document["items"].is_array()) {
        throw ProviderError("malformed registry file " + m_path);
    }
    return document;
}

void JsonFileProvider::writeDocument(const nlohmann::json &document) const
{
    const std::string tmpPath = m_path + ".tmp";
    {
        std::ofstream out(tmpPath, std::ios::trunc);
        if (!out) {
            throw ProviderError("unable to write registry file " + m_path);
        }
        out << document.dump(2);
        if (!out) {
            throw ProviderError("unable to write registry file " + m_path);
        }
    }

    std::error_code error;
    std::filesystem::rename(tmpPath, m_path, error);
    if (error) {
        throw ProviderError("unable to replace registry file " + m_path + ": "
                            + error.message());
    }
}

std::vector<RegistryItem> JsonFileProvider::listAll()
{
    std::lock_guard<std::mutex> lock(m_fileMutex);
    const auto document = readDocument();

    std::vector<RegistryItem> items;
    for (const auto &entry : document["items"]) {
        if (entryId(entry).empty()) {
            continue;
        }
        RegistryItem item;
        try {
            item = entry.get<RegistryItem>();
        } catch (const nlohmann::json::exception &ex) {
            TLOG_WARN(QStringLiteral("JsonFileProvider"),
                      QStringLiteral("listAll"),
                      QStringLiteral("registry_entry_skipped"),
                      QStringLiteral("malformed_entry"),
                      QStringLiteral("json_get"),
                      triage::logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"id", entryId(entry)}, {"error", ex.what()}}));
            continue;
        }
        // Status is owned by the daemon, never by the upstream listing.
        item.status.reset();
        if (item.snippet.empty()) {
            item.snippet = defaultSnippet(item.kind);
        }
        items.push_back(std::move(item));
    }
    return items;
}

ItemDetail JsonFileProvider::getDetail(const std::string &id)
{
    std::lock_guard<std::mutex> lock(m_fileMutex);
    const auto document = readDocument();

    for (const auto &entry : document["items"]) {
        if (entryId(entry) != id) {
            continue;
        }
        try {
            const RegistryItem item = entry.get<RegistryItem>();
            ItemDetail detail;
            detail.id = item.id;
            detail.kind = item.kind;
            detail.title = item.title;
            detail.content = entry.value("content", "");
            detail.raw = entry;
            return detail;
        } catch (const nlohmann::json::exception &ex) {
            throw ProviderError("malformed registry entry " + id + ": " + ex.what());
        }
    }
    throw ProviderError("item not found: " + id);
}

void JsonFileProvider::deleteItem(const std::string &id)
{
    std::lock_guard<std::mutex> lock(m_fileMutex);
    auto document = readDocument();

    auto &items = document["items"];
    bool removed = false;
    for (auto it = items.begin(); it != items.end(); ++it) {
        if (entryId(*it) == id) {
            items.erase(it);
            removed = true;
            break;
        }
    }
    if (!removed) {
        throw ProviderError("unable to delete " + id + ": not found");
    }
    writeDocument(document);
}

} // namespace triage
