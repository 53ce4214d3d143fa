#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace triage {

// Upstream source of registry items. Implementations throw ProviderError.
class ItemProvider {
public:
    virtual ~ItemProvider() = default;

    virtual std::vector<RegistryItem> listAll() = 0;
    virtual ItemDetail getDetail(const std::string &id) = 0;
    virtual void deleteItem(const std::string &id) = 0;
};

// Provider backed by a JSON document of the form
// {"items": [{"id", "type", "title", "snippet", "content"}, ...]}.
// The file is re-read on every call so external edits show up on refresh.
class JsonFileProvider : public ItemProvider {
public:
    explicit JsonFileProvider(std::string path);

    std::vector<RegistryItem> listAll() override;
    ItemDetail getDetail(const std::string &id) override;
    void deleteItem(const std::string &id) override;

private:
    nlohmann::json readDocument() const;
    void writeDocument(const nlohmann::json &document) const;

    std::string m_path;
    std::mutex m_fileMutex;
};

} // namespace triage
