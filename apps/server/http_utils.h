#pragma once

#include "kitquote/catalog.h"
#include "kitquote/checkout.h"
#include "kitquote/error.h"
#include "kitquote/role_resolver.h"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <string>

using namespace KitQuote;
using json = nlohmann::json;

inline json ErrorJson(const std::string& message) { return json{{"error", message}}; }

inline void SetJsonResponse(httplib::Response& res, const json& j, int status = 200) {
    res.set_content(j.dump(), "application/json");
    res.status = status;
}

inline void AddCorsHeaders(const httplib::Request& req, httplib::Response& res) {
    std::string origin = req.has_header("Origin") ? req.get_header_value("Origin") : "";
    if (!origin.empty()) {
        res.set_header("Access-Control-Allow-Origin", origin);
    } else {
        res.set_header("Access-Control-Allow-Origin", "*");
    }
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
    res.set_header("Access-Control-Allow-Credentials", "true");
    res.set_header("Access-Control-Max-Age", "86400");
}

/// HTTP status for a failed outcome: 400 input, 409 configuration, 502 platform.
inline int StatusForError(ErrorCode code) {
    switch (code) {
    case ErrorCode::InvalidInput:
        return 400;
    case ErrorCode::ConfigError:
        return 409;
    case ErrorCode::PlatformError:
        return 502;
    default:
        return 500;
    }
}

/// Parse a JSON request body. An empty body is an empty object.
inline json ParseJsonBody(const httplib::Request& req) {
    if (req.body.empty()) { return json::object(); }
    try {
        json body = json::parse(req.body);
        if (!body.is_object()) { throw InputError("Request body must be a JSON object"); }
        return body;
    } catch (const json::parse_error& e) {
        throw InputError(std::string("Invalid JSON body: ") + e.what());
    }
}

inline json RoleListToJson(const std::vector<Role>& roles) {
    json arr = json::array();
    for (Role role : roles) { arr.push_back(ToRoleString(role)); }
    return arr;
}

inline json KitBuilderToJson(const KitBuilderConfig& kit) {
    json j;
    j["key"]                        = kit.key;
    j["name"]                       = kit.name;
    j["checkout_button_color"]      = kit.checkout_button_color;
    j["qty_badge_background_color"] = kit.qty_badge_background_color;

    json entries = json::array();
    for (const CatalogEntry& e : kit.entries) {
        json ej = {{"product_handle", e.handle}, {"role", ToRoleString(e.role)}};
        ej["coverage_per_sqm"] = e.coverage_per_m2 ? json(*e.coverage_per_m2) : json(nullptr);
        if (!e.display_name.empty()) { ej["display_name"] = e.display_name; }
        entries.push_back(ej);
    }
    j["product_entries"] = entries;

    RoleMapping mapping = kit.BuildRoleMapping();
    json roles          = json::object();
    for (Role role : kAllRoles) { roles[ToRoleString(role)] = mapping.HandlesFor(role); }
    j["role_handles"] = roles;
    return j;
}

inline json BreakdownToJson(const Breakdown& b, const RoleResolver& resolver) {
    json items = json::array();
    for (const LineItem& item : b.line_items) {
        json ij = {
            {"role", ToRoleString(item.role)},
            {"size", item.size},
            {"label", item.label},
            {"quantity", item.quantity},
        };
        ResolvedPack pack = resolver.Resolve(item);
        if (pack) {
            ij["product"]    = pack.product->name;
            ij["unit_price"] = pack.variant->price;
        }
        items.push_back(ij);
    }

    const CoverageRequirement& r = b.requirement;
    return json{
        {"line_items", items},
        {"sealant_liters", b.sealant_liters},
        {"total_item_count", b.total_item_count},
        {"requirement",
         {{"area_m2", r.area_m2},
          {"coverage_area_m2", r.coverage_area_m2},
          {"sealant_liters", r.sealant_liters},
          {"thermal_liters", r.thermal_liters},
          {"sealer_liters", r.sealer_liters},
          {"geotextile_meters", r.geotextile_meters},
          {"rapid_cure_liters", r.rapid_cure_liters}}},
        {"unmapped_roles", RoleListToJson(b.unmapped_roles)},
    };
}

inline json CheckoutResultToJson(const CheckoutResult& result) {
    json items = json::array();
    for (const PreviewLineItem& item : result.line_items) {
        items.push_back({
            {"image_url", item.image_url ? json(*item.image_url) : json(nullptr)},
            {"title", item.title},
            {"variant_label", item.variant_label ? json(*item.variant_label) : json(nullptr)},
            {"quantity", item.quantity},
            {"unit_price", item.unit_price},
            {"line_total", item.line_total},
        });
    }

    const CheckoutSummary& s = result.summary;
    json summary = {
        {"item_count", s.item_count},
        {"subtotal", s.subtotal},
        {"total", s.total},
        {"currency", s.currency},
    };
    if (s.discount_percent) {
        summary["discount_percent"] = *s.discount_percent;
        summary["discount_amount"]  = s.discount_amount.value_or("0.00");
    }

    return json{
        {"checkout_url", result.checkout_url},
        {"path", ToCheckoutPathString(result.path)},
        {"line_items", items},
        {"summary", summary},
        {"unmapped_roles", RoleListToJson(result.unmapped_roles)},
    };
}
