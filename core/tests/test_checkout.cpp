#include <gtest/gtest.h>
#include "kitquote/checkout.h"
#include "kitquote/catalog_store.h"

#include <algorithm>
#include <climits>
#include <cstdlib>
#include <optional>
#include <span>
#include <string>
#include <vector>

using namespace KitQuote;

namespace {

constexpr const char* kOwner = "owner-1";

class FakeCommerceClient : public CommerceClient {
public:
    std::vector<DraftOrderResult> draft_results; ///< Returned in order; the last one repeats.
    std::vector<DraftOrderRequest> draft_requests;
    bool draft_throws_format_error = false;

    ImagesBySize images;
    bool images_throw = false;
    int image_calls   = 0;

    DraftOrderResult CreateDraftOrder(const CommerceConfig&,
                                      const DraftOrderRequest& request) override {
        draft_requests.push_back(request);
        if (draft_throws_format_error) { throw FormatError("draft_order.id is not an integer"); }
        if (draft_results.empty()) { return DraftOrderResult{}; }
        std::size_t i = std::min(draft_requests.size(), draft_results.size()) - 1;
        return draft_results[i];
    }

    ImagesBySize FetchProductImages(const CommerceConfig&,
                                    std::span<const ImageQuery>) override {
        ++image_calls;
        if (images_throw) { throw IOError("connection timed out"); }
        return images;
    }

    int TotalCalls() const { return static_cast<int>(draft_requests.size()) + image_calls; }
};

DraftOrderResult Created(const std::string& url) {
    DraftOrderResult r;
    r.ok             = true;
    r.draft_order_id = 42;
    r.name           = "#D42";
    r.checkout_url   = url;
    return r;
}

DraftOrderResult Failed(PlatformErrorKind kind, const std::string& message) {
    DraftOrderResult r;
    r.error_kind = kind;
    r.error      = message;
    return r;
}

CatalogVariant Variant(double size, double price, std::optional<int64_t> id,
                       const std::string& image = "") {
    CatalogVariant v;
    v.size                = size;
    v.price               = price;
    v.platform_variant_id = id;
    v.image_url           = image;
    return v;
}

CatalogProduct Product(const std::string& name, const std::string& handle,
                       std::vector<CatalogVariant> variants) {
    CatalogProduct p;
    p.id       = name;
    p.name     = name;
    p.handle   = handle;
    p.variants = std::move(variants);
    return p;
}

/// Sealant-only operator without kit builders: products without a handle are sealant.
OperatorCatalog SealantCatalog() {
    OperatorCatalog catalog;
    catalog.owner_id = kOwner;
    CommerceConfig config;
    config.shop_domain  = "test-store.myshopify.com";
    config.access_token = "shpat_test";
    catalog.commerce    = config;
    catalog.products.push_back(Product(
        "Roof Sealant", "",
        {Variant(15, 39.99, 1001, "https://cdn.example.com/15.png"), Variant(10, 29.99, 1002),
         Variant(5, 15.99, 1003)}));
    return catalog;
}

AssemblerOptions QuietOptions() {
    AssemblerOptions options;
    options.default_images          = {{10.0, "https://cdn.example.com/default-10.png"}};
    options.read_environment_images = false;
    return options;
}

CheckoutInput AreaInput(double area, std::optional<double> discount = std::nullopt) {
    CheckoutInput input;
    input.area_m2          = area;
    input.discount_percent = discount;
    return input;
}

} // namespace

TEST(CheckoutAssembler, NotConnectedIsConfigErrorWithoutCalls) {
    OperatorCatalog catalog = SealantCatalog();
    catalog.commerce.reset();
    CatalogStore store;
    store.Put(catalog);
    FakeCommerceClient client;
    CheckoutAssembler assembler(store, client, QuietOptions());

    CheckoutOutcome outcome = assembler.AssembleCheckout(kOwner, AreaInput(100));
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.code, ErrorCode::ConfigError);
    EXPECT_NE(outcome.error.find("not connected"), std::string::npos);
    EXPECT_EQ(client.TotalCalls(), 0);
}

TEST(CheckoutAssembler, EmptyCatalogIsConfigError) {
    OperatorCatalog catalog = SealantCatalog();
    catalog.products.clear();
    CatalogStore store;
    store.Put(catalog);
    FakeCommerceClient client;
    CheckoutAssembler assembler(store, client, QuietOptions());

    CheckoutOutcome outcome = assembler.AssembleCheckout(kOwner, AreaInput(100));
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.code, ErrorCode::ConfigError);
    EXPECT_NE(outcome.error.find("No product pricing"), std::string::npos);
    EXPECT_EQ(client.TotalCalls(), 0);
}

TEST(CheckoutAssembler, UnknownOwnerIsConfigError) {
    CatalogStore store;
    FakeCommerceClient client;
    CheckoutAssembler assembler(store, client, QuietOptions());
    EXPECT_EQ(assembler.AssembleCheckout("nobody", AreaInput(10)).code, ErrorCode::ConfigError);
}

TEST(CheckoutAssembler, MissingAreaAndCountsIsInputError) {
    CatalogStore store;
    store.Put(SealantCatalog());
    FakeCommerceClient client;
    CheckoutAssembler assembler(store, client, QuietOptions());

    CheckoutInput input;
    input.pack_counts = {0, 0, 0};
    CheckoutOutcome outcome = assembler.AssembleCheckout(kOwner, input);
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.code, ErrorCode::InvalidInput);
    EXPECT_EQ(client.TotalCalls(), 0);

    EXPECT_EQ(assembler.AssembleCheckout(kOwner, AreaInput(-5)).code, ErrorCode::InvalidInput);

    input.pack_counts = {1, 1, 1, 1};
    EXPECT_EQ(assembler.AssembleCheckout(kOwner, input).code, ErrorCode::InvalidInput);
}

TEST(CheckoutAssembler, CartLinkForAreaQuote) {
    CatalogStore store;
    store.Put(SealantCatalog());
    FakeCommerceClient client;
    CheckoutAssembler assembler(store, client, QuietOptions());

    CheckoutOutcome outcome = assembler.AssembleCheckout(kOwner, AreaInput(100, 10.0));
    ASSERT_TRUE(outcome.ok) << outcome.error;
    EXPECT_EQ(client.TotalCalls(), 0);

    const CheckoutResult& result = outcome.data;
    EXPECT_EQ(result.path, CheckoutPath::CartLink);
    EXPECT_EQ(result.checkout_url,
              "https://test-store.myshopify.com/cart/1001:1,1002:1?discount=NZ10&note=" +
                  UrlEncode("DIY quote: 22.5L total (1x Roof Sealant 15L, 1x Roof Sealant 10L)"));

    ASSERT_EQ(result.line_items.size(), 2u);
    const PreviewLineItem& first = result.line_items[0];
    EXPECT_EQ(first.title, "Roof Sealant 15L");
    EXPECT_EQ(first.variant_label, "15L");
    EXPECT_EQ(first.quantity, 1);
    EXPECT_EQ(first.unit_price, "39.99");
    EXPECT_EQ(first.line_total, "39.99");
    EXPECT_EQ(first.image_url, "https://cdn.example.com/15.png");
    EXPECT_EQ(result.line_items[1].image_url, "https://cdn.example.com/default-10.png");

    EXPECT_EQ(result.summary.item_count, 2);
    EXPECT_EQ(result.summary.subtotal, "69.98");
    EXPECT_EQ(result.summary.total, "62.98");
    EXPECT_EQ(result.summary.currency, "AUD");
    EXPECT_EQ(result.summary.discount_percent, 10.0);
    EXPECT_EQ(result.summary.discount_amount, "7.00");
}

TEST(CheckoutAssembler, DiscountWithoutCodeStillPricesTheSummary) {
    CatalogStore store;
    store.Put(SealantCatalog());
    FakeCommerceClient client;
    CheckoutAssembler assembler(store, client, QuietOptions());

    CheckoutOutcome outcome = assembler.AssembleCheckout(kOwner, AreaInput(100, 12.0));
    ASSERT_TRUE(outcome.ok) << outcome.error;
    EXPECT_EQ(outcome.data.checkout_url.find("discount="), std::string::npos);
    EXPECT_EQ(outcome.data.summary.discount_amount, "8.40");
}

TEST(CheckoutAssembler, OutOfRangeDiscountIsIgnored) {
    CatalogStore store;
    store.Put(SealantCatalog());
    FakeCommerceClient client;
    CheckoutAssembler assembler(store, client, QuietOptions());

    CheckoutOutcome outcome = assembler.AssembleCheckout(kOwner, AreaInput(100, 50.0));
    ASSERT_TRUE(outcome.ok) << outcome.error;
    EXPECT_FALSE(outcome.data.summary.discount_percent.has_value());
    EXPECT_EQ(outcome.data.summary.total, "69.98");
}

TEST(CheckoutAssembler, ExplicitCountsMapOntoSealantSizes) {
    CatalogStore store;
    store.Put(SealantCatalog());
    FakeCommerceClient client;
    client.images = {{5.0, "https://cdn.example.com/shop-5.png"}};
    CheckoutAssembler assembler(store, client, QuietOptions());

    CheckoutInput input;
    input.pack_counts = {2, 0, 1};
    CheckoutOutcome outcome = assembler.AssembleCheckout(kOwner, input);
    ASSERT_TRUE(outcome.ok) << outcome.error;

    EXPECT_EQ(outcome.data.checkout_url,
              "https://test-store.myshopify.com/cart/1001:2,1003:1?note=" +
                  UrlEncode("DIY quote: 35L total (2x Roof Sealant 15L, 1x Roof Sealant 5L)"));
    ASSERT_EQ(outcome.data.line_items.size(), 2u);
    EXPECT_EQ(outcome.data.line_items[1].image_url, "https://cdn.example.com/shop-5.png");
    EXPECT_EQ(outcome.data.summary.item_count, 3);
    EXPECT_EQ(client.image_calls, 1);
}

TEST(CheckoutAssembler, NegativeCountsAreTreatedAsZero) {
    CatalogStore store;
    store.Put(SealantCatalog());
    FakeCommerceClient client;
    AssemblerOptions options      = QuietOptions();
    options.fetch_platform_images = false;
    CheckoutAssembler assembler(store, client, options);

    CheckoutInput input;
    input.pack_counts = {-3, 1};
    CheckoutOutcome outcome = assembler.AssembleCheckout(kOwner, input);
    ASSERT_TRUE(outcome.ok) << outcome.error;
    ASSERT_EQ(outcome.data.line_items.size(), 1u);
    EXPECT_EQ(outcome.data.line_items[0].title, "Roof Sealant 10L");
}

TEST(CheckoutAssembler, ImageLookupFailureIsIgnored) {
    CatalogStore store;
    store.Put(SealantCatalog());
    FakeCommerceClient client;
    client.images_throw = true;
    CheckoutAssembler assembler(store, client, QuietOptions());

    CheckoutInput input;
    input.pack_counts = {0, 0, 1};
    CheckoutOutcome outcome = assembler.AssembleCheckout(kOwner, input);
    ASSERT_TRUE(outcome.ok) << outcome.error;
    EXPECT_EQ(client.image_calls, 1);
    EXPECT_FALSE(outcome.data.line_items[0].image_url.has_value());
}

TEST(CheckoutAssembler, EnvironmentImageBeatsPlatformLookup) {
    CatalogStore store;
    store.Put(SealantCatalog());
    FakeCommerceClient client;
    client.images = {{5.0, "https://cdn.example.com/shop-5.png"}};
    AssemblerOptions options        = QuietOptions();
    options.read_environment_images = true;
    CheckoutAssembler assembler(store, client, options);

    ASSERT_EQ(DefaultImageEnvName(5.0), "DIY_PRODUCT_IMAGE_5L");
    ::setenv("DIY_PRODUCT_IMAGE_5L", "https://cdn.example.com/env-5.png", 1);
    CheckoutInput input;
    input.pack_counts = {0, 0, 1};
    CheckoutOutcome outcome = assembler.AssembleCheckout(kOwner, input);
    ::unsetenv("DIY_PRODUCT_IMAGE_5L");

    ASSERT_TRUE(outcome.ok) << outcome.error;
    EXPECT_EQ(outcome.data.line_items[0].image_url, "https://cdn.example.com/env-5.png");
    EXPECT_EQ(client.image_calls, 0);
}

TEST(CheckoutAssembler, DraftOrderWhenAVariantIdIsMissing) {
    OperatorCatalog catalog = SealantCatalog();
    catalog.products[0].variants[1].platform_variant_id.reset();
    CatalogStore store;
    store.Put(catalog);
    FakeCommerceClient client;
    client.draft_results = {Created("https://test-store.myshopify.com/invoices/abc")};
    CheckoutAssembler assembler(store, client, QuietOptions());

    CheckoutInput input = AreaInput(100, 15.0);
    input.email         = "  diy@example.com ";
    CheckoutOutcome outcome = assembler.AssembleCheckout(kOwner, input);
    ASSERT_TRUE(outcome.ok) << outcome.error;
    EXPECT_EQ(outcome.data.path, CheckoutPath::DraftOrder);
    EXPECT_EQ(outcome.data.checkout_url, "https://test-store.myshopify.com/invoices/abc");

    ASSERT_EQ(client.draft_requests.size(), 1u);
    const DraftOrderRequest& request = client.draft_requests[0];
    ASSERT_EQ(request.line_items.size(), 2u);
    EXPECT_EQ(request.line_items[0].variant_id, 1001);
    EXPECT_FALSE(request.line_items[1].variant_id.has_value());
    EXPECT_EQ(request.line_items[1].title, "Roof Sealant 10L");
    EXPECT_EQ(request.line_items[1].price, "29.99");
    EXPECT_EQ(request.tags, "diy,chat");
    EXPECT_EQ(request.currency, "AUD");
    EXPECT_EQ(request.email, "diy@example.com");
    EXPECT_EQ(request.note,
              "DIY quote: 22.5L total (1x Roof Sealant 15L, 1x Roof Sealant 10L)");
    ASSERT_TRUE(request.applied_discount.has_value());
    EXPECT_EQ(request.applied_discount->value_type, "percentage");
    EXPECT_EQ(request.applied_discount->value, "15");
    EXPECT_EQ(request.applied_discount->amount, "10.50");
}

TEST(CheckoutAssembler, VariantErrorRetriesOnceWithoutVariantIds) {
    OperatorCatalog catalog = SealantCatalog();
    catalog.products[0].variants[1].platform_variant_id.reset();
    CatalogStore store;
    store.Put(catalog);
    FakeCommerceClient client;
    client.draft_results = {
        Failed(PlatformErrorKind::VariantUnavailable, "Variant 1001 is no longer available"),
        Created("https://test-store.myshopify.com/invoices/retry"),
    };
    CheckoutAssembler assembler(store, client, QuietOptions());

    CheckoutOutcome outcome = assembler.AssembleCheckout(kOwner, AreaInput(100));
    ASSERT_TRUE(outcome.ok) << outcome.error;
    EXPECT_EQ(outcome.data.checkout_url, "https://test-store.myshopify.com/invoices/retry");

    ASSERT_EQ(client.draft_requests.size(), 2u);
    EXPECT_TRUE(client.draft_requests[0].line_items[0].variant_id.has_value());
    for (const DraftLineItem& item : client.draft_requests[1].line_items) {
        EXPECT_FALSE(item.variant_id.has_value());
    }
}

TEST(CheckoutAssembler, SecondVariantErrorIsPlatformError) {
    OperatorCatalog catalog = SealantCatalog();
    catalog.products[0].variants[1].platform_variant_id.reset();
    CatalogStore store;
    store.Put(catalog);
    FakeCommerceClient client;
    client.draft_results = {
        Failed(PlatformErrorKind::VariantUnavailable, "Merchandise not found"),
    };
    CheckoutAssembler assembler(store, client, QuietOptions());

    CheckoutOutcome outcome = assembler.AssembleCheckout(kOwner, AreaInput(100));
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.code, ErrorCode::PlatformError);
    EXPECT_EQ(outcome.error, "Merchandise not found");
    EXPECT_EQ(client.draft_requests.size(), 2u);
}

TEST(CheckoutAssembler, OtherRejectionsAreNotRetried) {
    OperatorCatalog catalog = SealantCatalog();
    catalog.products[0].variants[1].platform_variant_id.reset();
    CatalogStore store;
    store.Put(catalog);
    FakeCommerceClient client;
    client.draft_results = {Failed(PlatformErrorKind::Rejected, "Invalid API key")};
    CheckoutAssembler assembler(store, client, QuietOptions());

    CheckoutOutcome outcome = assembler.AssembleCheckout(kOwner, AreaInput(100));
    EXPECT_EQ(outcome.code, ErrorCode::PlatformError);
    EXPECT_EQ(client.draft_requests.size(), 1u);
}

TEST(CheckoutAssembler, MissingCheckoutUrlIsPlatformError) {
    OperatorCatalog catalog = SealantCatalog();
    catalog.products[0].variants[1].platform_variant_id.reset();
    CatalogStore store;
    store.Put(catalog);
    FakeCommerceClient client;
    client.draft_results = {Created("")};
    CheckoutAssembler assembler(store, client, QuietOptions());

    CheckoutOutcome outcome = assembler.AssembleCheckout(kOwner, AreaInput(100));
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.code, ErrorCode::PlatformError);
}

TEST(CheckoutAssembler, MalformedPlatformResponsePropagates) {
    OperatorCatalog catalog = SealantCatalog();
    catalog.products[0].variants[1].platform_variant_id.reset();
    CatalogStore store;
    store.Put(catalog);
    FakeCommerceClient client;
    client.draft_throws_format_error = true;
    CheckoutAssembler assembler(store, client, QuietOptions());

    EXPECT_THROW(assembler.AssembleCheckout(kOwner, AreaInput(100)), FormatError);
}

TEST(CheckoutAssembler, KitBuilderAddsRolesAndReportsUnmapped) {
    OperatorCatalog catalog = SealantCatalog();
    catalog.products[0].handle = "roof-sealant";
    catalog.products.push_back(
        Product("Thermal Coat", "thermal-coat", {Variant(15, 99.0, 2001)}));
    catalog.products.push_back(Product("Brush Kit", "brush", {Variant(0, 19.0, 6001)}));

    KitBuilderConfig kit;
    kit.key     = "roof-kit";
    kit.name    = "Roof Kit";
    kit.entries = {
        {"roof-sealant", Role::Sealant, std::nullopt, ""},
        {"thermal-coat", Role::Thermal, std::nullopt, ""},
        {"brush", Role::BrushKit, std::nullopt, ""},
    };
    catalog.kit_builders.push_back(kit);

    CatalogStore store;
    store.Put(catalog);
    FakeCommerceClient client;
    AssemblerOptions options      = QuietOptions();
    options.fetch_platform_images = false;
    CheckoutAssembler assembler(store, client, options);

    CheckoutOutcome outcome = assembler.AssembleCheckout(kOwner, AreaInput(100));
    ASSERT_TRUE(outcome.ok) << outcome.error;
    const CheckoutResult& result = outcome.data;

    ASSERT_EQ(result.line_items.size(), 4u);
    EXPECT_EQ(result.line_items[2].title, "Thermal Coat 15L");
    EXPECT_EQ(result.line_items[2].quantity, 4);
    EXPECT_EQ(result.line_items[3].title, "Brush Kit");
    EXPECT_FALSE(result.line_items[3].variant_label.has_value());
    EXPECT_EQ(result.summary.item_count, 7);
    EXPECT_EQ(result.checkout_url.rfind(
                  "https://test-store.myshopify.com/cart/1001:1,1002:1,2001:4,6001:1?note=", 0),
              0u);

    std::vector<Role> unmapped = {Role::Sealer, Role::Geotextile, Role::RapidCure};
    EXPECT_EQ(result.unmapped_roles, unmapped);

    CheckoutInput unknown = AreaInput(100);
    unknown.kit_key       = "boat-kit";
    EXPECT_EQ(assembler.AssembleCheckout(kOwner, unknown).code, ErrorCode::InvalidInput);
}

TEST(CheckoutAssembler, VariantTitleOverridesProductName) {
    OperatorCatalog catalog = SealantCatalog();
    catalog.products[0].variants[0].title = "UltraSeal Bucket 15 L";
    CatalogStore store;
    store.Put(catalog);
    FakeCommerceClient client;
    CheckoutAssembler assembler(store, client, QuietOptions());

    CheckoutInput input;
    input.pack_counts = {1};
    CheckoutOutcome outcome = assembler.AssembleCheckout(kOwner, input);
    ASSERT_TRUE(outcome.ok) << outcome.error;
    EXPECT_EQ(outcome.data.line_items[0].title, "UltraSeal Bucket 15 L");
    EXPECT_EQ(outcome.data.line_items[0].variant_label, "15 L");
}

TEST(CheckoutPath, Names) {
    EXPECT_STREQ(ToCheckoutPathString(CheckoutPath::CartLink), "cart_link");
    EXPECT_STREQ(ToCheckoutPathString(CheckoutPath::DraftOrder), "draft_order");
    EXPECT_EQ(DefaultImageEnvName(0.5), "DIY_PRODUCT_IMAGE_0_5L");
}

TEST(CheckoutAssembler, HugeAreaIsInputError) {
    CatalogStore store;
    store.Put(SealantCatalog());
    FakeCommerceClient client;
    CheckoutAssembler assembler(store, client, QuietOptions());

    for (double area : {1e20, 1e7}) {
        CheckoutOutcome outcome;
        EXPECT_NO_THROW(outcome = assembler.AssembleCheckout(kOwner, AreaInput(area)));
        EXPECT_FALSE(outcome.ok) << "area " << area;
        EXPECT_EQ(outcome.code, ErrorCode::InvalidInput) << "area " << area;
    }
    EXPECT_EQ(client.TotalCalls(), 0);
}

TEST(CheckoutAssembler, PackCountAboveLimitIsInputError) {
    CatalogStore store;
    store.Put(SealantCatalog());
    FakeCommerceClient client;
    CheckoutAssembler assembler(store, client, QuietOptions());

    CheckoutInput input;
    input.pack_counts = {INT_MAX, INT_MAX};
    CheckoutOutcome outcome = assembler.AssembleCheckout(kOwner, input);
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.code, ErrorCode::InvalidInput);

    input.pack_counts = {kMaxPackCount + 1};
    EXPECT_EQ(assembler.AssembleCheckout(kOwner, input).code, ErrorCode::InvalidInput);
    EXPECT_EQ(client.TotalCalls(), 0);

    input.pack_counts = {kMaxPackCount, kMaxPackCount, kMaxPackCount};
    outcome = assembler.AssembleCheckout(kOwner, input);
    ASSERT_TRUE(outcome.ok) << outcome.error;
    EXPECT_EQ(outcome.data.summary.item_count, 3 * kMaxPackCount);
}
