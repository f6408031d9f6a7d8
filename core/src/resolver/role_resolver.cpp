#include "kitquote/role_resolver.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace KitQuote {

std::string PackLabel(Role role, double size, double area_m2) {
    switch (role) {
    case Role::Geotextile:
        return FormatSize(size) + "m Roll";
    case Role::RapidCure:
        return FormatSize(size) + "L Bottle";
    case Role::BrushKit:
        return area_m2 < kRollerKitMinAreaM2 ? "Brush Kit" : "Brush + Roller Kit";
    default:
        return FormatSize(size) + "L";
    }
}

std::vector<PackVariant> DedupeBySize(std::span<const PackVariant> variants) {
    std::map<double, double> cheapest;
    for (const PackVariant& v : variants) {
        auto [it, inserted] = cheapest.try_emplace(v.size, v.price);
        if (!inserted && v.price < it->second) { it->second = v.price; }
    }
    std::vector<PackVariant> out;
    out.reserve(cheapest.size());
    for (auto it = cheapest.rbegin(); it != cheapest.rend(); ++it) {
        out.push_back(PackVariant{it->first, it->second});
    }
    return out;
}

Breakdown ComputeBreakdown(double area_m2, const RoleVariantTable& variants_by_role,
                           const CoverageOverrides& overrides, const OptimizerPolicy& policy) {
    Breakdown breakdown;
    breakdown.requirement    = ComputeCoverage(area_m2, CoverageRates::WithOverrides(overrides));
    breakdown.sealant_liters = breakdown.requirement.sealant_liters;

    for (Role role : kAllRoles) {
        if (role == Role::BrushKit) { continue; }
        const double volume = breakdown.requirement.VolumeFor(role);
        if (volume <= 0.0) { continue; }

        auto it = variants_by_role.find(role);
        if (it == variants_by_role.end() || it->second.empty()) {
            breakdown.unmapped_roles.push_back(role);
            continue;
        }
        for (const PackCount& pack : OptimizeBuckets(volume, it->second, policy)) {
            LineItem item;
            item.role     = role;
            item.size     = pack.size;
            item.label    = PackLabel(role, pack.size, area_m2);
            item.quantity = pack.quantity;
            breakdown.line_items.push_back(std::move(item));
        }
    }

    auto brush = variants_by_role.find(Role::BrushKit);
    if (brush != variants_by_role.end() && !brush->second.empty()) {
        const bool brush_only = area_m2 < kRollerKitMinAreaM2;
        LineItem item;
        item.role          = Role::BrushKit;
        item.variant_index = (brush->second.size() >= 2 && !brush_only) ? 1 : 0;
        item.size          = brush->second[item.variant_index].size;
        item.label         = PackLabel(Role::BrushKit, item.size, area_m2);
        item.quantity      = 1;
        breakdown.line_items.push_back(std::move(item));
    }

    for (const LineItem& item : breakdown.line_items) {
        breakdown.total_item_count += item.quantity;
    }

    if (!breakdown.unmapped_roles.empty()) {
        std::string names;
        for (Role role : breakdown.unmapped_roles) {
            if (!names.empty()) { names += ", "; }
            names += ToRoleString(role);
        }
        spdlog::warn("Breakdown: no catalog variants for required role(s) {}; they are omitted",
                     names);
    }
    spdlog::debug("Breakdown: area={} lines={} items={} sealant={}L", area_m2,
                  breakdown.line_items.size(), breakdown.total_item_count,
                  breakdown.sealant_liters);
    return breakdown;
}

RoleResolver::RoleResolver(std::vector<CatalogProduct> products, RoleMapping mapping)
    : products_(std::move(products)), mapping_(std::move(mapping)) {}

std::vector<const CatalogProduct*> RoleResolver::ProductsFor(Role role) const {
    std::vector<const CatalogProduct*> out;
    for (const std::string& handle : mapping_.HandlesFor(role)) {
        for (const CatalogProduct& p : products_) {
            if (p.variants.empty() || NormalizeKey(p.handle) != handle) { continue; }
            out.push_back(&p);
        }
    }
    if (role == Role::Sealant && !mapping_.HasHandles(Role::Sealant)) {
        for (const CatalogProduct& p : products_) {
            if (!p.variants.empty() && NormalizeKey(p.handle).empty()) { out.push_back(&p); }
        }
    }
    return out;
}

std::vector<PackVariant> RoleResolver::VariantsFor(Role role) const {
    const std::vector<const CatalogProduct*> products = ProductsFor(role);
    if (role == Role::BrushKit) {
        std::vector<PackVariant> kits;
        for (const CatalogProduct* p : products) {
            const CatalogVariant* v = p->CheapestVariant();
            kits.push_back(PackVariant{v->size, v->price});
        }
        return kits;
    }

    std::vector<PackVariant> all;
    for (const CatalogProduct* p : products) {
        for (const CatalogVariant& v : p->variants) {
            if (v.size > 0.0) { all.push_back(PackVariant{v.size, v.price}); }
        }
    }
    return DedupeBySize(all);
}

RoleVariantTable RoleResolver::BuildVariantTable() const {
    RoleVariantTable table;
    for (Role role : kAllRoles) {
        std::vector<PackVariant> variants = VariantsFor(role);
        spdlog::debug("Resolver: role={} handles={} variants={}", ToRoleString(role),
                      mapping_.HandlesFor(role).size(), variants.size());
        if (!variants.empty()) { table.emplace(role, std::move(variants)); }
    }
    return table;
}

ResolvedPack RoleResolver::Resolve(const LineItem& item) const {
    const std::vector<const CatalogProduct*> products = ProductsFor(item.role);
    if (item.role == Role::BrushKit) {
        if (item.variant_index >= products.size()) { return ResolvedPack{}; }
        const CatalogProduct* p = products[item.variant_index];
        return ResolvedPack{p, p->CheapestVariant()};
    }

    ResolvedPack best;
    for (const CatalogProduct* p : products) {
        const CatalogVariant* v = p->CheapestVariant(item.size);
        if (!v) { continue; }
        if (!best.variant || v->price < best.variant->price) { best = ResolvedPack{p, v}; }
    }
    return best;
}

} // namespace KitQuote
