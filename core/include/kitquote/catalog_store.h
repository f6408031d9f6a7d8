#pragma once

/// \file catalog_store.h
/// \brief In-memory CatalogProvider backed by one JSON document per operator.

#include "catalog.h"

#include <cstddef>
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

namespace KitQuote {

class CatalogStore : public CatalogProvider {
public:
    /// Insert or replace the catalog of catalog.owner_id.
    void Put(OperatorCatalog catalog);

    /// Load every *.json file in \p dir. Files that fail to parse are logged and skipped.
    /// Throws IOError if \p dir is not a directory. Returns the number of catalogs loaded.
    std::size_t LoadFromDirectory(const std::string& dir);

    /// Replace the contents with a fresh load of \p dir.
    std::size_t ReloadFromDirectory(const std::string& dir);

    std::size_t Size() const;

    std::vector<std::string> OwnerIds() const;

    std::optional<CommerceConfig> FindCommerceConfig(const std::string& owner_id) const override;

    std::vector<CatalogProduct> ListProducts(const std::string& owner_id) const override;

    std::vector<KitBuilderConfig> ListKitBuilders(const std::string& owner_id) const override;

    std::optional<KitBuilderConfig> FindKitBuilder(const std::string& owner_id,
                                                   const std::string& key) const override;

private:
    static std::map<std::string, OperatorCatalog> ReadDirectory(const std::string& dir);

    mutable std::shared_mutex mutex_;
    std::map<std::string, OperatorCatalog> catalogs_;
};

} // namespace KitQuote
