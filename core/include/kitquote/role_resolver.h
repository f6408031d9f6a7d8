#pragma once

/// \file role_resolver.h
/// \brief Role -> catalog resolution and the multi-role bill of materials.

#include "common.h"
#include "bucket_optimizer.h"
#include "catalog.h"
#include "coverage.h"

#include <cstddef>
#include <map>
#include <span>
#include <string>
#include <vector>

namespace KitQuote {

/// Priced pack sizes available per role. Sized roles are deduplicated by size (cheapest
/// kept) and ordered largest first; BrushKit keeps one entry per mapped product.
using RoleVariantTable = std::map<Role, std::vector<PackVariant>>;

/// Below this area the brush-only kit is chosen over the brush + roller kit.
inline constexpr double kRollerKitMinAreaM2 = 5.0;

struct LineItem {
    Role role   = Role::Sealant;
    double size = 0.0; ///< Pack size in the role's unit; 0 for kits.
    std::string label;
    int quantity              = 0;
    std::size_t variant_index = 0; ///< Position in the role's variant list (kits only).
};

/// Bill of materials for one area.
struct Breakdown {
    std::vector<LineItem> line_items;
    double sealant_liters = 0.0; ///< Required sealant, the headline quantity.
    int total_item_count  = 0;
    CoverageRequirement requirement;
    /// Roles that required material but had no variants; they contribute no items.
    std::vector<Role> unmapped_roles;
};

/// Display label of a pack: "15L", "20m Roll", "0.5L Bottle", "Brush Kit", ...
std::string PackLabel(Role role, double size, double area_m2);

/// Keep the cheapest variant per size, largest size first.
std::vector<PackVariant> DedupeBySize(std::span<const PackVariant> variants);

/// Area -> per-role volumes -> optimal packs for every role in \p variants_by_role.
Breakdown ComputeBreakdown(double area_m2, const RoleVariantTable& variants_by_role,
                           const CoverageOverrides& overrides = CoverageOverrides{},
                           const OptimizerPolicy& policy      = OptimizerPolicy{});

/// Catalog product and variant behind a line item.
struct ResolvedPack {
    const CatalogProduct* product = nullptr;
    const CatalogVariant* variant = nullptr;

    explicit operator bool() const { return product && variant; }
};

/// Resolves abstract roles to an operator's catalog through a RoleMapping.
class RoleResolver {
public:
    RoleResolver(std::vector<CatalogProduct> products, RoleMapping mapping);

    const RoleMapping& mapping() const { return mapping_; }
    const std::vector<CatalogProduct>& products() const { return products_; }

    /// Sellable products filling \p role, in mapping order. When no handle is mapped to the
    /// sealant role, products without a handle are sealant products.
    std::vector<const CatalogProduct*> ProductsFor(Role role) const;

    /// Priced variants of \p role as stored in the RoleVariantTable.
    std::vector<PackVariant> VariantsFor(Role role) const;

    RoleVariantTable BuildVariantTable() const;

    /// Cheapest catalog variant matching \p item. Empty when nothing matches.
    ResolvedPack Resolve(const LineItem& item) const;

private:
    std::vector<CatalogProduct> products_;
    RoleMapping mapping_;
};

} // namespace KitQuote
