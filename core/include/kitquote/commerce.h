#pragma once

/// \file commerce.h
/// \brief Commerce-platform collaborator: credentials, cart links, draft orders, images.

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace KitQuote {

inline constexpr const char* kDefaultApiVersion = "2024-04";

/// Connected store credential of one operator.
struct CommerceConfig {
    std::string shop_domain;  ///< Normalized, e.g. "store.myshopify.com".
    std::string access_token; ///< Admin API access token.
    std::string api_version = kDefaultApiVersion;

    /// True when both the shop domain and the access token are present.
    bool IsConnected() const { return !shop_domain.empty() && !access_token.empty(); }
};

/// Strip whitespace, the http(s) scheme and trailing slashes from a shop domain.
std::string NormalizeShopDomain(const std::string& input);

/// Storefront origin for a shop domain. A bare store name gets ".myshopify.com" appended.
std::string StorefrontBaseUrl(const std::string& shop_domain);

/// Percent-encode for a URL query component.
std::string UrlEncode(const std::string& value);

/// One (variant, quantity) pair of a cart permalink.
struct CartLine {
    int64_t variant_id = 0;
    int quantity       = 0;
};

struct CartUrlOptions {
    std::string discount_code; ///< Pre-provisioned code, empty = none.
    std::string note;          ///< Order note, empty = none.
};

/// Build a cart permalink: https://{shop}/cart/{id}:{qty},...?discount=CODE&note=...
/// Pure function, no I/O.
std::string BuildCartUrl(const std::string& shop_domain, std::span<const CartLine> lines,
                         const CartUrlOptions& opts = CartUrlOptions{});

/// Pre-provisioned promotional code for a discount percentage (10 -> "NZ10").
/// Returns nullopt for percentages without a code.
std::optional<std::string> DiscountCodeForPercent(double percent);

/// Percentage discount attached to a draft order.
struct AppliedDiscount {
    std::string title;
    std::string description;
    std::string value_type = "percentage";
    std::string value;  ///< Percentage, e.g. "10".
    std::string amount; ///< Money, 2 dp.
};

struct DraftLineItem {
    std::string title;
    std::optional<int64_t> variant_id; ///< Empty creates a free-form line.
    int quantity = 0;
    std::string price; ///< Unit price, 2 dp.
};

struct DraftOrderRequest {
    std::vector<DraftLineItem> line_items;
    std::string note;
    std::string tags;
    std::string currency;
    std::string email; ///< Optional customer email, empty = none.
    std::optional<AppliedDiscount> applied_discount;

    /// Copy with every variant id removed, so the platform creates free-form lines.
    DraftOrderRequest WithoutVariantIds() const;
};

/// Structured reason of a failed platform call.
enum class PlatformErrorKind : uint8_t {
    None               = 0,
    VariantUnavailable = 1, ///< A referenced variant/merchandise no longer resolves.
    Rejected           = 2, ///< Any other rejection by the platform.
    Transport          = 3, ///< Connection, TLS or timeout failure.
};

const char* ToPlatformErrorKindString(PlatformErrorKind kind);

/// Map a platform rejection message onto an error kind. Messages containing one of the
/// variant phrases ("no longer available", "not found", "variant", "merchandise", ...)
/// are VariantUnavailable, everything else is Rejected.
PlatformErrorKind ClassifyPlatformError(const std::string& message);

struct DraftOrderResult {
    bool ok                = false;
    int64_t draft_order_id = 0;
    std::string name;
    std::string checkout_url; ///< Invoice URL; may be empty even when ok.
    PlatformErrorKind error_kind = PlatformErrorKind::None;
    std::string error;
};

/// Catalog row used to look up a product image on the platform.
struct ImageQuery {
    double size = 0.0;
    std::string price;
    std::string title;
};

using ImagesBySize = std::map<double, std::string>;

/// Outbound calls the checkout assembler makes. Implementations report expected failures
/// through DraftOrderResult and throw FormatError for malformed responses.
class CommerceClient {
public:
    virtual ~CommerceClient() = default;

    /// Create a draft order and return its checkout (invoice) URL.
    virtual DraftOrderResult CreateDraftOrder(const CommerceConfig& config,
                                              const DraftOrderRequest& request) = 0;

    /// Best-effort product image lookup keyed by pack size. Missing sizes are omitted.
    virtual ImagesBySize FetchProductImages(const CommerceConfig& config,
                                            std::span<const ImageQuery> queries) = 0;
};

} // namespace KitQuote
