#include "kitquote/checkout.h"
#include "kitquote/coverage.h"
#include "detail/round_utils.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <set>
#include <utility>

namespace KitQuote {

namespace {

struct ItemSelection {
    std::vector<LineItem> items;
    double headline_liters = 0.0;
    std::vector<Role> unmapped_roles;
};

ItemSelection SelectByArea(double area_m2, const RoleVariantTable& table,
                           const KitBuilderConfig* kit, const OptimizerPolicy& policy) {
    const CoverageOverrides overrides = kit ? kit->BuildCoverageOverrides() : CoverageOverrides{};
    Breakdown breakdown = ComputeBreakdown(area_m2, table, overrides, policy);

    ItemSelection selection;
    selection.items           = std::move(breakdown.line_items);
    selection.headline_liters = breakdown.sealant_liters;
    selection.unmapped_roles  = std::move(breakdown.unmapped_roles);
    return selection;
}

ItemSelection SelectByCounts(const std::vector<int>& counts, const RoleVariantTable& table) {
    ItemSelection selection;
    auto it = table.find(Role::Sealant);
    if (it == table.end()) { return selection; }

    const std::vector<PackVariant>& sizes = it->second; // largest first
    const std::size_t n = std::min(counts.size(), sizes.size());
    for (std::size_t i = 0; i < n; ++i) {
        const int qty = std::max(counts[i], 0);
        if (qty == 0) { continue; }
        LineItem item;
        item.role     = Role::Sealant;
        item.size     = sizes[i].size;
        item.label    = PackLabel(Role::Sealant, item.size, 0.0);
        item.quantity = qty;
        selection.headline_liters += item.size * qty;
        selection.items.push_back(std::move(item));
    }
    return selection;
}

std::string BuildOrderNote(double headline_liters, const std::vector<PricedLine>& lines) {
    std::string parts;
    for (const PricedLine& line : lines) {
        if (!parts.empty()) { parts += ", "; }
        parts += fmt::format("{}x {}", line.quantity, line.title);
    }
    return fmt::format("DIY quote: {}L total ({})",
                       FormatSize(detail::RoundTo2dp(headline_liters)), parts);
}

CheckoutResult BuildPreview(const std::vector<PricedLine>& lines, const PricingSummary& pricing,
                            const std::string& currency) {
    CheckoutResult result;
    for (const PricedLine& line : lines) {
        PreviewLineItem preview;
        if (!line.image_url.empty()) { preview.image_url = line.image_url; }
        preview.title         = line.title;
        preview.variant_label = ExtractVariantLabel(line.title);
        preview.quantity      = line.quantity;
        preview.unit_price    = FormatMoney(line.unit_price);
        preview.line_total    = FormatMoney(line.unit_price * line.quantity);
        result.summary.item_count += line.quantity;
        result.line_items.push_back(std::move(preview));
    }
    result.summary.subtotal = FormatMoney(pricing.subtotal);
    result.summary.total    = FormatMoney(pricing.total);
    result.summary.currency = currency;
    if (pricing.HasDiscount()) {
        result.summary.discount_percent = pricing.discount_percent;
        result.summary.discount_amount  = FormatMoney(pricing.discount_amount);
    }
    return result;
}

} // namespace

const char* ToCheckoutPathString(CheckoutPath path) {
    switch (path) {
    case CheckoutPath::CartLink:
        return "cart_link";
    case CheckoutPath::DraftOrder:
        return "draft_order";
    }
    return "unknown";
}

CheckoutOutcome CheckoutOutcome::Success(CheckoutResult result) {
    CheckoutOutcome outcome;
    outcome.ok   = true;
    outcome.data = std::move(result);
    return outcome;
}

CheckoutOutcome CheckoutOutcome::Failure(const Error& e) {
    CheckoutOutcome outcome;
    outcome.code  = e.code();
    outcome.error = e.what();
    return outcome;
}

std::string PackTitle(const LineItem& item, const ResolvedPack& pack) {
    if (!pack.variant->title.empty()) { return pack.variant->title; }
    if (item.role == Role::BrushKit || ExtractVariantLabel(pack.product->name)) {
        return pack.product->name;
    }
    return pack.product->name + " " + item.label;
}

std::string DefaultImageEnvName(double size) {
    std::string name = kDefaultImageEnvPrefix + FormatSize(size) + "L";
    std::replace(name.begin(), name.end(), '.', '_');
    return name;
}

CheckoutAssembler::CheckoutAssembler(const CatalogProvider& catalogs, CommerceClient& client,
                                     AssemblerOptions options)
    : catalogs_(catalogs), client_(client), options_(std::move(options)) {}

CheckoutOutcome CheckoutAssembler::AssembleCheckout(const std::string& owner_id,
                                                    const CheckoutInput& input) const {
    try {
        return CheckoutOutcome::Success(Assemble(owner_id, input));
    } catch (const ConfigError& e) {
        spdlog::warn("Checkout[{}]: configuration error: {}", owner_id, e.what());
        return CheckoutOutcome::Failure(e);
    } catch (const InputError& e) {
        spdlog::info("Checkout[{}]: rejected input: {}", owner_id, e.what());
        return CheckoutOutcome::Failure(e);
    } catch (const PlatformError& e) {
        spdlog::error("Checkout[{}]: platform error: {}", owner_id, e.what());
        return CheckoutOutcome::Failure(e);
    }
}

CheckoutResult CheckoutAssembler::Assemble(const std::string& owner_id,
                                           const CheckoutInput& input) const {
    const std::optional<CommerceConfig> config = catalogs_.FindCommerceConfig(owner_id);
    if (!config || !config->IsConnected()) {
        throw ConfigError(
            "Shopify is not connected. Connect your store in Settings > Integrations.");
    }
    const std::vector<CatalogProduct> products = catalogs_.ListProducts(owner_id);
    if (products.empty()) {
        throw ConfigError("No product pricing configured. Add products in Settings > Pricing.");
    }

    if (input.area_m2 && (!std::isfinite(*input.area_m2) || *input.area_m2 < 0.0)) {
        throw InputError(fmt::format("area_m2 must be a non-negative number, got {}",
                                     *input.area_m2));
    }
    if (input.pack_counts.size() > kMaxExplicitCounts) {
        throw InputError(fmt::format("At most {} pack counts are accepted, got {}",
                                     kMaxExplicitCounts, input.pack_counts.size()));
    }
    for (int count : input.pack_counts) {
        if (count > kMaxPackCount) {
            throw InputError(fmt::format("Pack count {} exceeds the maximum of {}", count,
                                         kMaxPackCount));
        }
    }

    const std::optional<KitBuilderConfig> kit = catalogs_.FindKitBuilder(owner_id, input.kit_key);
    if (!kit && !input.kit_key.empty()) {
        throw InputError("Unknown kit builder: " + input.kit_key);
    }
    RoleResolver resolver(products, kit ? kit->BuildRoleMapping() : RoleMapping{});
    const RoleVariantTable table = resolver.BuildVariantTable();

    const bool by_area    = input.area_m2 && *input.area_m2 > 0.0;
    const bool any_counts = std::any_of(input.pack_counts.begin(), input.pack_counts.end(),
                                        [](int c) { return c > 0; });
    ItemSelection selection;
    if (by_area) {
        selection = SelectByArea(*input.area_m2, table, kit ? &*kit : nullptr,
                                 options_.optimizer);
    } else if (any_counts) {
        selection = SelectByCounts(input.pack_counts, table);
    } else {
        throw InputError("Provide area_m2 or at least one pack count.");
    }

    std::vector<PricedLine> lines;
    for (const LineItem& item : selection.items) {
        if (item.quantity <= 0) { continue; }
        const ResolvedPack pack = resolver.Resolve(item);
        if (!pack) {
            spdlog::warn("Checkout[{}]: no catalog variant for {} {}", owner_id,
                         ToRoleString(item.role), item.label);
            continue;
        }
        PricedLine line;
        line.role       = item.role;
        line.size       = item.size;
        line.title      = PackTitle(item, pack);
        line.quantity   = item.quantity;
        line.unit_price = detail::RoundTo2dp(pack.variant->price);
        line.variant_id = pack.variant->platform_variant_id;
        line.image_url  = pack.variant->image_url;
        lines.push_back(std::move(line));
    }
    if (lines.empty()) {
        throw InputError("No priced items match the request. Check the product catalog.");
    }

    ResolveImages(*config, lines);

    const PricingSummary pricing = ComputePricing(lines, input.discount_percent);
    if (input.discount_percent && !pricing.HasDiscount()) {
        spdlog::info("Checkout[{}]: discount {}% outside [{}, {}], ignored", owner_id,
                     *input.discount_percent, kMinDiscountPercent, kMaxDiscountPercent);
    }
    const std::string currency = CatalogCurrency(products);
    const std::string note     = BuildOrderNote(selection.headline_liters, lines);

    CheckoutResult result = BuildPreview(lines, pricing, currency);
    result.unmapped_roles = std::move(selection.unmapped_roles);

    const bool all_variant_ids = std::all_of(lines.begin(), lines.end(),
                                             [](const PricedLine& l) { return l.variant_id; });
    if (all_variant_ids && !config->shop_domain.empty()) {
        std::vector<CartLine> cart;
        for (const PricedLine& line : lines) {
            cart.push_back(CartLine{*line.variant_id, line.quantity});
        }
        CartUrlOptions opts;
        opts.note = note;
        if (pricing.HasDiscount()) {
            opts.discount_code = DiscountCodeForPercent(*pricing.discount_percent).value_or("");
        }
        result.checkout_url = BuildCartUrl(config->shop_domain, cart, opts);
        result.path         = CheckoutPath::CartLink;
    } else {
        DraftOrderRequest request;
        for (const PricedLine& line : lines) {
            request.line_items.push_back(DraftLineItem{line.title, line.variant_id, line.quantity,
                                                       fmt::format("{:.2f}", line.unit_price)});
        }
        request.note     = note;
        request.tags     = options_.order_tags;
        request.currency = currency;
        request.email    = Trim(input.email);
        if (pricing.HasDiscount()) {
            const std::string pct = FormatSize(*pricing.discount_percent);
            AppliedDiscount discount;
            discount.title       = pct + "% off";
            discount.description = "DIY quote discount " + pct + "%";
            discount.value       = pct;
            discount.amount      = fmt::format("{:.2f}", pricing.discount_amount);
            request.applied_discount = std::move(discount);
        }
        result.checkout_url = CreateDraftOrderUrl(*config, request);
        result.path         = CheckoutPath::DraftOrder;
    }

    spdlog::info("Checkout[{}]: {} link, {} line(s), {} item(s), total {} {}", owner_id,
                 ToCheckoutPathString(result.path), result.line_items.size(),
                 result.summary.item_count, result.summary.total, currency);
    return result;
}

void CheckoutAssembler::ResolveImages(const CommerceConfig& config,
                                      std::vector<PricedLine>& lines) const {
    std::vector<ImageQuery> queries;
    std::set<double> queried;
    for (PricedLine& line : lines) {
        if (!line.image_url.empty() || line.size <= 0.0) { continue; }
        auto it = options_.default_images.find(line.size);
        if (it != options_.default_images.end() && !it->second.empty()) {
            line.image_url = it->second;
            continue;
        }
        if (options_.read_environment_images) {
            const char* env = std::getenv(DefaultImageEnvName(line.size).c_str());
            if (env && *env) {
                line.image_url = env;
                continue;
            }
        }
        if (queried.insert(line.size).second) {
            queries.push_back(ImageQuery{line.size, fmt::format("{:.2f}", line.unit_price),
                                         line.title});
        }
    }
    if (queries.empty() || !options_.fetch_platform_images) { return; }

    ImagesBySize found;
    try {
        found = client_.FetchProductImages(config, queries);
    } catch (const Error& e) {
        spdlog::warn("Checkout: product image lookup failed, continuing without images: {}",
                     e.what());
        return;
    }
    for (PricedLine& line : lines) {
        if (!line.image_url.empty()) { continue; }
        auto it = found.find(line.size);
        if (it != found.end()) { line.image_url = it->second; }
    }
}

std::string CheckoutAssembler::CreateDraftOrderUrl(const CommerceConfig& config,
                                                   const DraftOrderRequest& request) const {
    DraftOrderResult created = client_.CreateDraftOrder(config, request);
    if (!created.ok && created.error_kind == PlatformErrorKind::VariantUnavailable) {
        spdlog::warn("Checkout: variant rejected ({}), retrying with free-form lines",
                     created.error);
        created = client_.CreateDraftOrder(config, request.WithoutVariantIds());
    }
    if (!created.ok) {
        throw PlatformError(created.error.empty() ? "Failed to create checkout link."
                                                  : created.error);
    }
    if (created.checkout_url.empty()) {
        throw PlatformError("Shopify did not return a checkout link for the draft order.");
    }
    spdlog::debug("Checkout: draft order {} ({}) created", created.name, created.draft_order_id);
    return created.checkout_url;
}

} // namespace KitQuote
