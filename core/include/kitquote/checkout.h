#pragma once

/// \file checkout.h
/// \brief Quote -> checkout link assembly for one operator.

#include "common.h"
#include "error.h"
#include "bucket_optimizer.h"
#include "catalog.h"
#include "commerce.h"
#include "pricing.h"
#include "role_resolver.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace KitQuote {

/// Explicit-count mode accepts at most this many sealant sizes.
inline constexpr std::size_t kMaxExplicitCounts = 3;

/// Largest explicit count accepted for one pack size.
inline constexpr int kMaxPackCount = 1000;

inline constexpr const char* kDefaultOrderTags     = "diy,chat";
inline constexpr const char* kDefaultImageEnvPrefix = "DIY_PRODUCT_IMAGE_";

/// Customer request. Either an area or at least one pack count must be given.
struct CheckoutInput {
    std::optional<double> area_m2;
    /// Pack counts for the sealant sizes, largest size first. Negative counts are treated as
    /// 0; counts above kMaxPackCount are rejected.
    std::vector<int> pack_counts;
    std::optional<double> discount_percent;
    std::string email;
    std::string kit_key; ///< Empty = operator's default kit.
};

enum class CheckoutPath : uint8_t {
    CartLink   = 0,
    DraftOrder = 1,
};

const char* ToCheckoutPathString(CheckoutPath path);

struct PreviewLineItem {
    std::optional<std::string> image_url;
    std::string title;
    std::optional<std::string> variant_label;
    int quantity = 0;
    std::string unit_price; ///< en-AU money text.
    std::string line_total;
};

struct CheckoutSummary {
    int item_count = 0;
    std::string subtotal;
    std::string total;
    std::string currency;
    std::optional<double> discount_percent;
    std::optional<std::string> discount_amount;
};

struct CheckoutResult {
    std::string checkout_url;
    CheckoutPath path = CheckoutPath::CartLink;
    std::vector<PreviewLineItem> line_items;
    CheckoutSummary summary;
    std::vector<Role> unmapped_roles;
};

/// Result-or-error of AssembleCheckout.
struct CheckoutOutcome {
    bool ok = false;
    CheckoutResult data;
    ErrorCode code = ErrorCode::Ok;
    std::string error;

    static CheckoutOutcome Success(CheckoutResult result);
    static CheckoutOutcome Failure(const Error& e);
};

struct AssemblerOptions {
    /// Fallback image per pack size, used when the catalog variant has none.
    ImagesBySize default_images;
    /// Also consult DIY_PRODUCT_IMAGE_<size>L when default_images has no entry.
    bool read_environment_images = true;
    /// Look up remaining images on the platform (one call per checkout).
    bool fetch_platform_images = true;
    std::string order_tags = kDefaultOrderTags;
    OptimizerPolicy optimizer;
};

/// Order-line title: the variant title when set, else the product name with the pack label
/// appended unless the name already carries a size.
std::string PackTitle(const LineItem& item, const ResolvedPack& pack);

/// Environment variable name holding the default image of \p size ("DIY_PRODUCT_IMAGE_15L").
std::string DefaultImageEnvName(double size);

/// Turns a quote request into a checkout link, via a cart permalink when every line has a
/// platform variant id and a draft order otherwise.
class CheckoutAssembler {
public:
    CheckoutAssembler(const CatalogProvider& catalogs, CommerceClient& client,
                      AssemblerOptions options = AssemblerOptions{});

    /// Expected configuration, input and platform failures are returned in the outcome.
    /// FormatError from a malformed platform response propagates.
    CheckoutOutcome AssembleCheckout(const std::string& owner_id,
                                     const CheckoutInput& input) const;

    /// Same as AssembleCheckout but every failure is thrown.
    CheckoutResult Assemble(const std::string& owner_id, const CheckoutInput& input) const;

    const AssemblerOptions& options() const { return options_; }

private:
    void ResolveImages(const CommerceConfig& config, std::vector<PricedLine>& lines) const;

    std::string CreateDraftOrderUrl(const CommerceConfig& config,
                                    const DraftOrderRequest& request) const;

    const CatalogProvider& catalogs_;
    CommerceClient& client_;
    AssemblerOptions options_;
};

} // namespace KitQuote
