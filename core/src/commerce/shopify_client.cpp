#include "kitquote/shopify_client.h"
#include "kitquote/common.h"
#include "kitquote/error.h"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cmath>
#include <cstddef>
#include <regex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace KitQuote {

using nlohmann::json;

namespace {

struct ProductImageRow {
    std::string title;
    std::string image_src;
    std::string first_variant_price;
};

struct ShopifyResponse {
    bool transport_ok = false;
    int status        = 0;
    std::string body;
    std::string transport_error;

    bool Ok() const { return transport_ok && status >= 200 && status < 300; }
};

httplib::Headers AuthHeaders(const CommerceConfig& config) {
    return httplib::Headers{
        {"X-Shopify-Access-Token", config.access_token},
        {"Accept", "application/json"},
    };
}

std::string AdminPath(const CommerceConfig& config, const std::string& resource) {
    return "/admin/api/" + config.api_version + "/" + resource;
}

void ConfigureClient(httplib::Client& cli, const ShopifyClientOptions& options) {
    cli.set_connection_timeout(options.connect_timeout_seconds, 0);
    cli.set_read_timeout(options.read_timeout_seconds, 0);
    cli.set_write_timeout(options.read_timeout_seconds, 0);
}

ShopifyResponse ToResponse(const httplib::Result& res) {
    ShopifyResponse out;
    if (!res) {
        out.transport_error = httplib::to_string(res.error());
        return out;
    }
    out.transport_ok = true;
    out.status       = res->status;
    out.body         = res->body;
    return out;
}

/// Error text of a non-2xx response: the "errors" member when present, else the status.
std::string ExtractErrorText(const ShopifyResponse& res) {
    if (!res.transport_ok) {
        return res.transport_error.empty() ? "Shopify request failed" : res.transport_error;
    }
    json body = json::parse(res.body, nullptr, /*allow_exceptions=*/false);
    if (!body.is_discarded() && body.is_object() && body.contains("errors")) {
        const json& errors = body.at("errors");
        if (errors.is_string()) { return errors.get<std::string>(); }
        return errors.dump();
    }
    return "Shopify request failed with status " + std::to_string(res.status);
}

json ParseBody(const ShopifyResponse& res, const char* what) {
    try {
        return json::parse(res.body);
    } catch (const json::parse_error& e) {
        throw FormatError(std::string("Malformed Shopify ") + what + " response: " + e.what());
    }
}

json DraftOrderToJson(const DraftOrderRequest& request) {
    json items = json::array();
    for (const DraftLineItem& item : request.line_items) {
        json j = {{"title", item.title}, {"quantity", item.quantity}, {"price", item.price}};
        if (item.variant_id) { j["variant_id"] = *item.variant_id; }
        items.push_back(j);
    }

    json draft = {
        {"line_items", items},
        {"note", request.note},
        {"tags", request.tags},
        {"currency", request.currency},
    };
    if (!request.email.empty()) { draft["email"] = request.email; }
    if (request.applied_discount) {
        const AppliedDiscount& d  = *request.applied_discount;
        draft["applied_discount"] = {
            {"title", d.title}, {"description", d.description}, {"value_type", d.value_type},
            {"value", d.value}, {"amount", d.amount},
        };
    }
    return json{{"draft_order", draft}};
}

std::string EscapeRegex(const std::string& text) {
    static const std::string kSpecial = R"(\^$.|?*+()[]{})";
    std::string out;
    for (char c : text) {
        if (kSpecial.find(c) != std::string::npos) { out.push_back('\\'); }
        out.push_back(c);
    }
    return out;
}

std::regex SizeTitlePattern(double size) {
    return std::regex("(^|[^0-9.])" + EscapeRegex(FormatSize(size)) + R"(\s*L\b)",
                      std::regex::ECMAScript | std::regex::icase);
}

void AppendProducts(const json& body, std::vector<ProductImageRow>& rows) {
    if (!body.is_object()) { throw FormatError("Shopify products response is not an object"); }
    if (!body.contains("products")) { return; }
    const json& products = body.at("products");
    if (!products.is_array()) { throw FormatError("Shopify products must be an array"); }

    for (const json& p : products) {
        if (!p.is_object()) { continue; }
        ProductImageRow row;
        if (p.contains("title") && p.at("title").is_string()) {
            row.title = p.at("title").get<std::string>();
        }
        if (p.contains("image") && p.at("image").is_object()) {
            const json& image = p.at("image");
            if (image.contains("src") && image.at("src").is_string()) {
                row.image_src = image.at("src").get<std::string>();
            }
        }
        if (p.contains("variants") && p.at("variants").is_array() && !p.at("variants").empty() &&
            p.at("variants").front().is_object()) {
            const json& price = p.at("variants").front().value("price", json());
            if (price.is_string()) {
                row.first_variant_price = price.get<std::string>();
            } else if (price.is_number()) {
                row.first_variant_price = std::to_string(price.get<double>());
            }
        }
        rows.push_back(std::move(row));
    }
}

bool PriceClose(const std::string& a, const std::string& b) {
    try {
        return std::fabs(std::stod(a) - std::stod(b)) < 1.0;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

} // namespace

ShopifyClient::ShopifyClient(ShopifyClientOptions options) : options_(std::move(options)) {}

std::string ShopifyClient::BaseUrl(const CommerceConfig& config) const {
    return options_.base_url.empty() ? StorefrontBaseUrl(config.shop_domain) : options_.base_url;
}

DraftOrderResult ShopifyClient::CreateDraftOrder(const CommerceConfig& config,
                                                 const DraftOrderRequest& request) {
    httplib::Client cli(BaseUrl(config));
    ConfigureClient(cli, options_);
    const std::string payload = DraftOrderToJson(request).dump();

    spdlog::debug("Shopify POST draft_orders.json: shop={}, lines={}", config.shop_domain,
                  request.line_items.size());
    ShopifyResponse res = ToResponse(
        cli.Post(AdminPath(config, "draft_orders.json"), AuthHeaders(config), payload,
                 "application/json"));

    DraftOrderResult result;
    if (!res.Ok()) {
        result.error      = ExtractErrorText(res);
        result.error_kind = res.transport_ok ? ClassifyPlatformError(result.error)
                                             : PlatformErrorKind::Transport;
        spdlog::warn("Shopify draft order failed: status={}, kind={}, error={}", res.status,
                     ToPlatformErrorKindString(result.error_kind), result.error);
        return result;
    }

    const json body = ParseBody(res, "draft order");
    if (!body.is_object() || !body.contains("draft_order") ||
        !body.at("draft_order").is_object()) {
        result.error      = "Draft order not returned";
        result.error_kind = PlatformErrorKind::Rejected;
        return result;
    }

    const json& draft = body.at("draft_order");
    if (!draft.contains("id") || !draft.at("id").is_number_integer()) {
        throw FormatError("Shopify draft order has no integer id");
    }
    result.ok             = true;
    result.draft_order_id = draft.at("id").get<int64_t>();
    if (draft.contains("name") && draft.at("name").is_string()) {
        result.name = draft.at("name").get<std::string>();
    }
    if (draft.contains("invoice_url") && draft.at("invoice_url").is_string()) {
        result.checkout_url = draft.at("invoice_url").get<std::string>();
    }
    spdlog::info("Shopify draft order created: id={}, name={}", result.draft_order_id,
                 result.name);
    return result;
}

ImagesBySize ShopifyClient::FetchProductImages(const CommerceConfig& config,
                                               std::span<const ImageQuery> queries) {
    ImagesBySize images;
    if (queries.empty()) { return images; }

    httplib::Client cli(BaseUrl(config));
    ConfigureClient(cli, options_);
    const std::string path = AdminPath(config, "products.json") +
                             "?limit=" + std::to_string(kProductPageLimit) +
                             "&fields=id,title,handle,image,variants";
    ShopifyResponse res = ToResponse(cli.Get(path, AuthHeaders(config)));
    if (!res.Ok()) {
        spdlog::warn("Shopify product listing failed: {}", ExtractErrorText(res));
        return images;
    }
    std::vector<ProductImageRow> rows;
    AppendProducts(ParseBody(res, "products"), rows);

    for (const ImageQuery& query : queries) {
        if (images.count(query.size)) { continue; }
        const std::regex pattern = SizeTitlePattern(query.size);

        const ProductImageRow* match = nullptr;
        for (const ProductImageRow& row : rows) {
            if (!std::regex_search(row.title, pattern)) { continue; }
            if (row.first_variant_price.empty() ||
                PriceClose(row.first_variant_price, query.price)) {
                match = &row;
                break;
            }
        }
        if (!match) {
            for (const ProductImageRow& row : rows) {
                if (std::regex_search(row.title, pattern)) {
                    match = &row;
                    break;
                }
            }
        }
        if (match && !match->image_src.empty()) { images[query.size] = match->image_src; }
    }

    spdlog::debug("Shopify image lookup: {} product(s), {} image(s) matched", rows.size(),
                  images.size());
    return images;
}

} // namespace KitQuote
