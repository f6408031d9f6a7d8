#pragma once

/// \file shopify_client.h
/// \brief CommerceClient over the Shopify Admin REST API.

#include "commerce.h"

#include <string>

namespace KitQuote {

inline constexpr int kProductPageLimit = 250;

struct ShopifyClientOptions {
    int connect_timeout_seconds = 10;
    int read_timeout_seconds    = 30;
    /// Admin API origin such as "http://127.0.0.1:8080". Empty means the shop's own
    /// https origin.
    std::string base_url;
};

/// Each call makes exactly one HTTP request. The image lookup reads a single page of up to
/// kProductPageLimit products.
class ShopifyClient : public CommerceClient {
public:
    explicit ShopifyClient(ShopifyClientOptions options = ShopifyClientOptions{});

    DraftOrderResult CreateDraftOrder(const CommerceConfig& config,
                                      const DraftOrderRequest& request) override;

    ImagesBySize FetchProductImages(const CommerceConfig& config,
                                    std::span<const ImageQuery> queries) override;

private:
    std::string BaseUrl(const CommerceConfig& config) const;

    ShopifyClientOptions options_;
};

} // namespace KitQuote
