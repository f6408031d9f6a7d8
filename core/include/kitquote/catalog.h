#pragma once

/// \file catalog.h
/// \brief Operator catalog: priced products, kit builders and the role mapping.

#include "common.h"
#include "commerce.h"
#include "coverage.h"

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace KitQuote {

inline constexpr const char* kDefaultKitKey   = "roof-kit";
inline constexpr const char* kDefaultCurrency = "AUD";

/// One sellable pack of a product.
struct CatalogVariant {
    double size  = 0.0; ///< Liters or meters; 0 for kits.
    double price = 0.0;
    std::string currency = kDefaultCurrency;
    std::optional<int64_t> platform_variant_id;
    std::string image_url; ///< Empty = none configured.
    std::string color;
    std::string title; ///< Display title override, empty = product name.
};

struct CatalogProduct {
    std::string id;
    std::string name;
    std::string description;
    std::string handle; ///< Platform product handle used by role mapping; may be empty.
    int sort_order = 0;
    std::optional<int64_t> platform_product_id;
    std::vector<CatalogVariant> variants;

    /// Cheapest variant with \p size, or nullptr.
    const CatalogVariant* CheapestVariant(double size) const;

    /// Cheapest variant of any size, or nullptr when there are none.
    const CatalogVariant* CheapestVariant() const;
};

/// Currency of the first variant that has one, kDefaultCurrency otherwise.
std::string CatalogCurrency(std::span<const CatalogProduct> products);

/// Operator assignment of a catalog handle to a role.
struct CatalogEntry {
    std::string handle;
    Role role = Role::Sealant;
    std::optional<double> coverage_per_m2; ///< Overrides the role's default rate.
    std::string display_name;
};

/// Open role -> ordered catalog-handle list. Handles are stored normalized
/// (trimmed, lowercased) and deduplicated per role.
class RoleMapping {
public:
    /// Append \p handle to \p role. Blank and duplicate handles are ignored.
    void Assign(Role role, const std::string& handle);

    const std::vector<std::string>& HandlesFor(Role role) const;

    bool HasHandles(Role role) const { return !HandlesFor(role).empty(); }

    /// True if \p handle (any case/whitespace) is mapped to \p role.
    bool Contains(Role role, const std::string& handle) const;

    bool Empty() const;

    static RoleMapping FromEntries(std::span<const CatalogEntry> entries);

private:
    std::array<std::vector<std::string>, kRoleCount> handles_;
};

/// A named kit configuration (e.g. "roof-kit", "caravan-kit").
struct KitBuilderConfig {
    std::string key = kDefaultKitKey;
    std::string name;
    std::vector<CatalogEntry> entries;
    /// Older role -> handles assignment; used for roles without entries.
    RoleMapping legacy_role_handles;
    std::string checkout_button_color;
    std::string qty_badge_background_color;

    /// Mapping from entries, falling back per role to legacy_role_handles.
    RoleMapping BuildRoleMapping() const;

    /// First entry per role with a coverage override wins.
    CoverageOverrides BuildCoverageOverrides() const;
};

/// Everything configured for one operator.
struct OperatorCatalog {
    std::string owner_id;
    std::optional<CommerceConfig> commerce;
    std::vector<CatalogProduct> products; ///< Ordered by sort_order.
    std::vector<KitBuilderConfig> kit_builders;

    const KitBuilderConfig* FindKitBuilder(const std::string& key) const;

    /// "roof-kit" if present, else the first kit builder, else nullptr.
    const KitBuilderConfig* DefaultKitBuilder() const;

    std::string Currency() const { return CatalogCurrency(products); }

    /// Loads an operator catalog from a JSON file.
    static OperatorCatalog LoadFromJson(const std::string& path);

    /// Parses an operator catalog from a JSON string.
    static OperatorCatalog FromJsonString(const std::string& json_str);

    /// Saves this catalog to a JSON file.
    void SaveToJson(const std::string& path) const;

    std::string ToJsonString() const;
};

/// Source of operator configuration consumed by the checkout assembler.
class CatalogProvider {
public:
    virtual ~CatalogProvider() = default;

    virtual std::optional<CommerceConfig> FindCommerceConfig(const std::string& owner_id) const = 0;

    virtual std::vector<CatalogProduct> ListProducts(const std::string& owner_id) const = 0;

    virtual std::vector<KitBuilderConfig> ListKitBuilders(const std::string& owner_id) const = 0;

    /// Kit builder by key; an empty key selects the default kit.
    virtual std::optional<KitBuilderConfig> FindKitBuilder(const std::string& owner_id,
                                                           const std::string& key) const = 0;
};

} // namespace KitQuote
