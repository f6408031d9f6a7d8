#include "kitquote/catalog_store.h"
#include "kitquote/error.h"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <mutex>
#include <utility>

namespace KitQuote {

void CatalogStore::Put(OperatorCatalog catalog) {
    if (catalog.owner_id.empty()) { throw InputError("Catalog owner_id is empty"); }
    std::unique_lock lock(mutex_);
    std::string owner = catalog.owner_id;
    catalogs_[owner]  = std::move(catalog);
}

std::map<std::string, OperatorCatalog> CatalogStore::ReadDirectory(const std::string& dir) {
    if (!std::filesystem::is_directory(dir)) {
        throw IOError("Catalog directory does not exist: " + dir);
    }
    std::map<std::string, OperatorCatalog> loaded;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (!entry.is_regular_file()) { continue; }
        if (entry.path().extension() != ".json") { continue; }
        try {
            OperatorCatalog catalog = OperatorCatalog::LoadFromJson(entry.path().string());
            std::string owner       = catalog.owner_id;
            if (loaded.count(owner)) {
                spdlog::warn("  Duplicate catalog for owner {} in {}, keeping the last one",
                             owner, entry.path().string());
            }
            loaded[owner] = std::move(catalog);
        } catch (const Error& e) {
            spdlog::warn("  Failed to load {}: {}", entry.path().string(), e.what());
        }
    }
    return loaded;
}

std::size_t CatalogStore::LoadFromDirectory(const std::string& dir) {
    std::map<std::string, OperatorCatalog> loaded = ReadDirectory(dir);
    const std::size_t count = loaded.size();
    std::unique_lock lock(mutex_);
    for (auto& [owner, catalog] : loaded) { catalogs_[owner] = std::move(catalog); }
    return count;
}

std::size_t CatalogStore::ReloadFromDirectory(const std::string& dir) {
    std::map<std::string, OperatorCatalog> loaded = ReadDirectory(dir);
    const std::size_t count = loaded.size();
    std::unique_lock lock(mutex_);
    catalogs_ = std::move(loaded);
    return count;
}

std::size_t CatalogStore::Size() const {
    std::shared_lock lock(mutex_);
    return catalogs_.size();
}

std::vector<std::string> CatalogStore::OwnerIds() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(catalogs_.size());
    for (const auto& [owner, catalog] : catalogs_) { ids.push_back(owner); }
    return ids;
}

std::optional<CommerceConfig> CatalogStore::FindCommerceConfig(const std::string& owner_id) const {
    std::shared_lock lock(mutex_);
    auto it = catalogs_.find(owner_id);
    if (it == catalogs_.end()) { return std::nullopt; }
    return it->second.commerce;
}

std::vector<CatalogProduct> CatalogStore::ListProducts(const std::string& owner_id) const {
    std::shared_lock lock(mutex_);
    auto it = catalogs_.find(owner_id);
    if (it == catalogs_.end()) { return {}; }
    return it->second.products;
}

std::vector<KitBuilderConfig> CatalogStore::ListKitBuilders(const std::string& owner_id) const {
    std::shared_lock lock(mutex_);
    auto it = catalogs_.find(owner_id);
    if (it == catalogs_.end()) { return {}; }
    return it->second.kit_builders;
}

std::optional<KitBuilderConfig> CatalogStore::FindKitBuilder(const std::string& owner_id,
                                                             const std::string& key) const {
    std::shared_lock lock(mutex_);
    auto it = catalogs_.find(owner_id);
    if (it == catalogs_.end()) { return std::nullopt; }
    const KitBuilderConfig* kit = key.empty() ? it->second.DefaultKitBuilder()
                                              : it->second.FindKitBuilder(key);
    if (!kit) { return std::nullopt; }
    return *kit;
}

} // namespace KitQuote
