#include "kitquote/catalog.h"
#include "kitquote/error.h"
#include "detail/json_utils.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <fstream>
#include <string>
#include <utility>

namespace KitQuote {

using nlohmann::json;

const CatalogVariant* CatalogProduct::CheapestVariant(double size) const {
    const CatalogVariant* best = nullptr;
    for (const CatalogVariant& v : variants) {
        if (v.size != size) { continue; }
        if (!best || v.price < best->price) { best = &v; }
    }
    return best;
}

const CatalogVariant* CatalogProduct::CheapestVariant() const {
    const CatalogVariant* best = nullptr;
    for (const CatalogVariant& v : variants) {
        if (!best || v.price < best->price) { best = &v; }
    }
    return best;
}

void RoleMapping::Assign(Role role, const std::string& handle) {
    const std::string key = NormalizeKey(handle);
    if (key.empty()) { return; }
    auto& list = handles_[static_cast<std::size_t>(role)];
    if (std::find(list.begin(), list.end(), key) == list.end()) { list.push_back(key); }
}

const std::vector<std::string>& RoleMapping::HandlesFor(Role role) const {
    return handles_[static_cast<std::size_t>(role)];
}

bool RoleMapping::Contains(Role role, const std::string& handle) const {
    const std::string key = NormalizeKey(handle);
    if (key.empty()) { return false; }
    const auto& list = HandlesFor(role);
    return std::find(list.begin(), list.end(), key) != list.end();
}

bool RoleMapping::Empty() const {
    return std::all_of(handles_.begin(), handles_.end(),
                       [](const std::vector<std::string>& list) { return list.empty(); });
}

RoleMapping RoleMapping::FromEntries(std::span<const CatalogEntry> entries) {
    RoleMapping mapping;
    for (const CatalogEntry& e : entries) { mapping.Assign(e.role, e.handle); }
    return mapping;
}

RoleMapping KitBuilderConfig::BuildRoleMapping() const {
    const RoleMapping from_entries = RoleMapping::FromEntries(entries);
    RoleMapping merged;
    for (Role role : kAllRoles) {
        const RoleMapping& source =
            from_entries.HasHandles(role) ? from_entries : legacy_role_handles;
        for (const std::string& handle : source.HandlesFor(role)) { merged.Assign(role, handle); }
    }
    return merged;
}

CoverageOverrides KitBuilderConfig::BuildCoverageOverrides() const {
    CoverageOverrides overrides;
    for (const CatalogEntry& e : entries) {
        if (NormalizeKey(e.handle).empty() || !e.coverage_per_m2) { continue; }
        overrides.try_emplace(e.role, *e.coverage_per_m2);
    }
    return overrides;
}

const KitBuilderConfig* OperatorCatalog::FindKitBuilder(const std::string& key) const {
    const std::string wanted = NormalizeKey(key);
    for (const KitBuilderConfig& kit : kit_builders) {
        if (NormalizeKey(kit.key) == wanted) { return &kit; }
    }
    return nullptr;
}

const KitBuilderConfig* OperatorCatalog::DefaultKitBuilder() const {
    if (const KitBuilderConfig* kit = FindKitBuilder(kDefaultKitKey)) { return kit; }
    return kit_builders.empty() ? nullptr : &kit_builders.front();
}

std::string CatalogCurrency(std::span<const CatalogProduct> products) {
    for (const CatalogProduct& p : products) {
        for (const CatalogVariant& v : p.variants) {
            if (!v.currency.empty()) { return v.currency; }
        }
    }
    return kDefaultCurrency;
}

namespace {

CatalogVariant VariantFromJson(const json& j) {
    if (!j.is_object()) { throw FormatError("variant must be an object"); }
    CatalogVariant v;
    std::optional<double> size = detail::GetOptionalDouble(j, "size");
    if (!size) { size = detail::GetOptionalDouble(j, "size_litres"); }
    v.size  = size.value_or(0.0);
    v.price = detail::GetOptionalDouble(j, "price").value_or(0.0);
    if (v.size < 0.0) { throw FormatError("variant size must be >= 0"); }
    if (v.price < 0.0) { throw FormatError("variant price must be >= 0"); }

    v.currency            = detail::GetString(j, "currency", kDefaultCurrency);
    v.platform_variant_id = detail::GetOptionalInt64(j, "platform_variant_id");
    if (!v.platform_variant_id) {
        v.platform_variant_id = detail::GetOptionalInt64(j, "shopify_variant_id");
    }
    v.image_url = Trim(detail::GetString(j, "image_url"));
    v.color     = detail::GetString(j, "color");
    v.title     = detail::GetString(j, "title");
    return v;
}

CatalogProduct ProductFromJson(const json& j) {
    if (!j.is_object()) { throw FormatError("product must be an object"); }
    CatalogProduct p;
    p.id                  = detail::GetString(j, "id");
    p.name                = detail::GetString(j, "name");
    p.description         = detail::GetString(j, "description");
    p.handle              = detail::GetString(j, "handle");
    p.sort_order          = j.value("sort_order", 0);
    p.platform_product_id = detail::GetOptionalInt64(j, "platform_product_id");
    if (p.name.empty()) { throw FormatError("product missing name"); }

    if (j.contains("variants")) {
        const auto& vs = j.at("variants");
        if (!vs.is_array()) { throw FormatError("variants must be an array"); }
        for (const auto& item : vs) { p.variants.push_back(VariantFromJson(item)); }
    }
    return p;
}

RoleMapping RoleHandlesFromJson(const json& j) {
    RoleMapping mapping;
    if (j.is_null()) { return mapping; }
    if (!j.is_object()) { throw FormatError("role_handles must be an object"); }
    for (const auto& [key, handles] : j.items()) {
        std::optional<Role> role = TryParseRole(key);
        if (!role) {
            spdlog::warn("Ignoring role_handles for unknown role: {}", key);
            continue;
        }
        if (!handles.is_array()) { throw FormatError("role_handles values must be arrays"); }
        for (const auto& h : handles) {
            if (h.is_string()) { mapping.Assign(*role, h.get<std::string>()); }
        }
    }
    return mapping;
}

KitBuilderConfig KitBuilderFromJson(const json& j) {
    if (!j.is_object()) { throw FormatError("kit builder must be an object"); }
    KitBuilderConfig kit;
    kit.key  = detail::GetString(j, "key", kDefaultKitKey);
    kit.name = detail::GetString(j, "name", kit.key);
    if (kit.name.empty()) { kit.name = kit.key; }
    kit.checkout_button_color      = detail::GetString(j, "checkout_button_color");
    kit.qty_badge_background_color = detail::GetString(j, "qty_badge_background_color");

    if (j.contains("product_entries")) {
        const auto& es = j.at("product_entries");
        if (!es.is_array()) { throw FormatError("product_entries must be an array"); }
        for (const auto& item : es) {
            if (!item.is_object()) { continue; }
            const std::string role_str = detail::GetString(item, "role");
            std::optional<Role> role   = TryParseRole(role_str);
            if (!role) {
                spdlog::warn("Kit {}: ignoring entry with unknown role '{}'", kit.key, role_str);
                continue;
            }
            CatalogEntry entry;
            entry.handle          = detail::GetString(item, "product_handle");
            entry.role            = *role;
            entry.coverage_per_m2 = detail::GetOptionalDouble(item, "coverage_per_sqm");
            entry.display_name    = detail::GetString(item, "display_name");
            if (NormalizeKey(entry.handle).empty()) { continue; }
            kit.entries.push_back(std::move(entry));
        }
    }
    if (j.contains("role_handles")) {
        kit.legacy_role_handles = RoleHandlesFromJson(j.at("role_handles"));
    }
    return kit;
}

std::optional<CommerceConfig> CommerceFromJson(const json& j) {
    if (j.is_null()) { return std::nullopt; }
    if (!j.is_object()) { throw FormatError("commerce must be an object"); }
    CommerceConfig config;
    config.shop_domain  = NormalizeShopDomain(detail::GetString(j, "shop_domain"));
    config.access_token = Trim(detail::GetString(j, "access_token"));
    const std::string api_version = Trim(detail::GetString(j, "api_version"));
    if (!api_version.empty()) { config.api_version = api_version; }
    if (!config.IsConnected()) { return std::nullopt; }
    return config;
}

OperatorCatalog CatalogFromJson(const json& j) {
    if (!j.is_object()) { throw FormatError("catalog must be an object"); }
    OperatorCatalog catalog;
    catalog.owner_id = detail::GetString(j, "owner_id");
    if (catalog.owner_id.empty()) { throw FormatError("catalog missing owner_id"); }

    if (j.contains("commerce")) { catalog.commerce = CommerceFromJson(j.at("commerce")); }

    if (j.contains("products")) {
        const auto& ps = j.at("products");
        if (!ps.is_array()) { throw FormatError("products must be an array"); }
        for (const auto& item : ps) { catalog.products.push_back(ProductFromJson(item)); }
    }
    std::stable_sort(catalog.products.begin(), catalog.products.end(),
                     [](const CatalogProduct& a, const CatalogProduct& b) {
                         return a.sort_order < b.sort_order;
                     });

    if (j.contains("kit_builders")) {
        const auto& ks = j.at("kit_builders");
        if (!ks.is_array()) { throw FormatError("kit_builders must be an array"); }
        for (const auto& item : ks) { catalog.kit_builders.push_back(KitBuilderFromJson(item)); }
    }
    return catalog;
}

json CatalogToJson(const OperatorCatalog& catalog) {
    json j;
    j["owner_id"] = catalog.owner_id;
    if (catalog.commerce) {
        j["commerce"] = {
            {"shop_domain", catalog.commerce->shop_domain},
            {"access_token", catalog.commerce->access_token},
            {"api_version", catalog.commerce->api_version},
        };
    }

    j["products"] = json::array();
    for (const CatalogProduct& p : catalog.products) {
        json pj = {
            {"id", p.id},
            {"name", p.name},
            {"description", p.description},
            {"handle", p.handle},
            {"sort_order", p.sort_order},
            {"variants", json::array()},
        };
        if (p.platform_product_id) { pj["platform_product_id"] = *p.platform_product_id; }
        for (const CatalogVariant& v : p.variants) {
            json vj = {
                {"size", v.size},   {"price", v.price},         {"currency", v.currency},
                {"color", v.color}, {"image_url", v.image_url}, {"title", v.title},
            };
            if (v.platform_variant_id) { vj["platform_variant_id"] = *v.platform_variant_id; }
            pj["variants"].push_back(vj);
        }
        j["products"].push_back(pj);
    }

    j["kit_builders"] = json::array();
    for (const KitBuilderConfig& kit : catalog.kit_builders) {
        json kj = {
            {"key", kit.key},
            {"name", kit.name},
            {"checkout_button_color", kit.checkout_button_color},
            {"qty_badge_background_color", kit.qty_badge_background_color},
            {"product_entries", json::array()},
        };
        for (const CatalogEntry& e : kit.entries) {
            json ej = {{"product_handle", e.handle}, {"role", ToRoleString(e.role)}};
            if (e.coverage_per_m2) { ej["coverage_per_sqm"] = *e.coverage_per_m2; }
            if (!e.display_name.empty()) { ej["display_name"] = e.display_name; }
            kj["product_entries"].push_back(ej);
        }
        if (!kit.legacy_role_handles.Empty()) {
            json legacy = json::object();
            for (Role role : kAllRoles) {
                if (kit.legacy_role_handles.HasHandles(role)) {
                    legacy[ToRoleString(role)] = kit.legacy_role_handles.HandlesFor(role);
                }
            }
            kj["role_handles"] = legacy;
        }
        j["kit_builders"].push_back(kj);
    }
    return j;
}

} // namespace

OperatorCatalog OperatorCatalog::LoadFromJson(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) { throw IOError("Failed to open file: " + path); }
    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw FormatError("Invalid catalog JSON in " + path + ": " + e.what());
    }
    OperatorCatalog catalog = CatalogFromJson(j);
    spdlog::info("Catalog loaded: owner={}, products={}, kits={}, commerce={}", catalog.owner_id,
                 catalog.products.size(), catalog.kit_builders.size(),
                 catalog.commerce ? catalog.commerce->shop_domain : "not connected");
    return catalog;
}

OperatorCatalog OperatorCatalog::FromJsonString(const std::string& json_str) {
    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::parse_error& e) {
        throw FormatError(std::string("Invalid catalog JSON: ") + e.what());
    }
    OperatorCatalog catalog = CatalogFromJson(j);
    spdlog::debug("Catalog parsed: owner={}, products={}, kits={}", catalog.owner_id,
                  catalog.products.size(), catalog.kit_builders.size());
    return catalog;
}

void OperatorCatalog::SaveToJson(const std::string& path) const {
    json j = CatalogToJson(*this);
    std::ofstream out(path);
    if (!out.is_open()) { throw IOError("Failed to open file: " + path); }
    out << j.dump(4);
    if (!out.good()) { throw IOError("Failed to write json: " + path); }
    spdlog::info("Catalog saved: owner={}, path={}", owner_id, path);
}

std::string OperatorCatalog::ToJsonString() const { return CatalogToJson(*this).dump(4); }

} // namespace KitQuote
