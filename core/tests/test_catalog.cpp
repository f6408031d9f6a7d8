#include <gtest/gtest.h>
#include "kitquote/catalog.h"
#include "kitquote/catalog_store.h"
#include "kitquote/error.h"

#include <filesystem>
#include <fstream>
#include <string>

using namespace KitQuote;

static const char* kCatalogJson = R"({
    "owner_id": "owner-1",
    "commerce": {
        "shop_domain": "https://Test-Store.myshopify.com/",
        "access_token": " shpat_123 "
    },
    "products": [
        {
            "id": "p-thermal",
            "name": "Thermal Top Coat",
            "handle": "thermal-coat",
            "sort_order": 2,
            "variants": [{"size": 15, "price": "99.00", "platform_variant_id": "2001"}]
        },
        {
            "id": "p-sealant",
            "name": "Roof Sealant",
            "handle": "Roof-Sealant",
            "sort_order": 1,
            "variants": [
                {"size_litres": 15, "price": 39.99, "shopify_variant_id": 1001,
                 "image_url": " https://cdn.example.com/15.png "},
                {"size": 10, "price": 29.99, "currency": "NZD"}
            ]
        }
    ],
    "kit_builders": [
        {
            "key": "caravan-kit",
            "name": "Caravan Kit",
            "product_entries": [
                {"product_handle": "roof-sealant", "role": "waterproof-sealant"}
            ]
        },
        {
            "key": "roof-kit",
            "name": "Roof Kit",
            "checkout_button_color": "#ff6600",
            "product_entries": [
                {"product_handle": "roof-sealant", "role": "waterproof-sealant",
                 "coverage_per_sqm": 2.0},
                {"product_handle": "thermal-coat", "role": "Protective-Top-Coat"},
                {"product_handle": "mystery", "role": "glitter"},
                {"product_handle": "  ", "role": "sealer"}
            ],
            "role_handles": {
                "waterproof-sealant": ["legacy-sealant"],
                "geo-textile": ["Geo-Roll", "geo-roll"]
            }
        }
    ]
})";

TEST(Catalog, ParsesProductsVariantsAndCommerce) {
    OperatorCatalog catalog = OperatorCatalog::FromJsonString(kCatalogJson);
    EXPECT_EQ(catalog.owner_id, "owner-1");

    ASSERT_TRUE(catalog.commerce.has_value());
    EXPECT_EQ(catalog.commerce->shop_domain, "Test-Store.myshopify.com");
    EXPECT_EQ(catalog.commerce->access_token, "shpat_123");
    EXPECT_EQ(catalog.commerce->api_version, kDefaultApiVersion);

    // Sorted by sort_order.
    ASSERT_EQ(catalog.products.size(), 2u);
    EXPECT_EQ(catalog.products[0].id, "p-sealant");
    EXPECT_EQ(catalog.products[1].id, "p-thermal");

    const CatalogProduct& sealant = catalog.products[0];
    ASSERT_EQ(sealant.variants.size(), 2u);
    EXPECT_DOUBLE_EQ(sealant.variants[0].size, 15.0);
    EXPECT_EQ(sealant.variants[0].platform_variant_id, 1001);
    EXPECT_EQ(sealant.variants[0].image_url, "https://cdn.example.com/15.png");
    EXPECT_FALSE(sealant.variants[1].platform_variant_id.has_value());

    const CatalogProduct& thermal = catalog.products[1];
    EXPECT_DOUBLE_EQ(thermal.variants[0].price, 99.0);
    EXPECT_EQ(thermal.variants[0].platform_variant_id, 2001);
}

TEST(Catalog, CurrencyComesFromFirstVariant) {
    OperatorCatalog catalog = OperatorCatalog::FromJsonString(kCatalogJson);
    EXPECT_EQ(catalog.Currency(), "AUD");

    OperatorCatalog empty;
    EXPECT_EQ(empty.Currency(), kDefaultCurrency);
}

TEST(Catalog, KitBuilderSelection) {
    OperatorCatalog catalog = OperatorCatalog::FromJsonString(kCatalogJson);
    ASSERT_NE(catalog.DefaultKitBuilder(), nullptr);
    EXPECT_EQ(catalog.DefaultKitBuilder()->key, "roof-kit");
    ASSERT_NE(catalog.FindKitBuilder(" Caravan-Kit "), nullptr);
    EXPECT_EQ(catalog.FindKitBuilder("boat-kit"), nullptr);
}

TEST(Catalog, EntriesSkipUnknownRolesAndBlankHandles) {
    OperatorCatalog catalog    = OperatorCatalog::FromJsonString(kCatalogJson);
    const KitBuilderConfig* kit = catalog.FindKitBuilder("roof-kit");
    ASSERT_NE(kit, nullptr);
    ASSERT_EQ(kit->entries.size(), 2u);
    EXPECT_EQ(kit->entries[1].role, Role::Thermal);
    EXPECT_EQ(kit->checkout_button_color, "#ff6600");
}

TEST(Catalog, EntriesWinOverLegacyHandlesPerRole) {
    OperatorCatalog catalog    = OperatorCatalog::FromJsonString(kCatalogJson);
    const KitBuilderConfig* kit = catalog.FindKitBuilder("roof-kit");
    ASSERT_NE(kit, nullptr);

    RoleMapping mapping = kit->BuildRoleMapping();
    ASSERT_EQ(mapping.HandlesFor(Role::Sealant).size(), 1u);
    EXPECT_EQ(mapping.HandlesFor(Role::Sealant)[0], "roof-sealant");
    // Legacy handles fill roles without entries, normalized and deduplicated.
    ASSERT_EQ(mapping.HandlesFor(Role::Geotextile).size(), 1u);
    EXPECT_TRUE(mapping.Contains(Role::Geotextile, "GEO-ROLL"));
    EXPECT_FALSE(mapping.HasHandles(Role::Sealer));
}

TEST(Catalog, CoverageOverridesFromEntries) {
    OperatorCatalog catalog    = OperatorCatalog::FromJsonString(kCatalogJson);
    CoverageOverrides overrides = catalog.FindKitBuilder("roof-kit")->BuildCoverageOverrides();
    ASSERT_EQ(overrides.size(), 1u);
    EXPECT_DOUBLE_EQ(overrides.at(Role::Sealant), 2.0);
}

TEST(Catalog, CommerceWithoutTokenIsNotConnected) {
    OperatorCatalog catalog = OperatorCatalog::FromJsonString(
        R"({"owner_id": "o", "commerce": {"shop_domain": "store.myshopify.com"}})");
    EXPECT_FALSE(catalog.commerce.has_value());
}

TEST(Catalog, MalformedJsonThrowsFormatError) {
    EXPECT_THROW(OperatorCatalog::FromJsonString("{not json"), FormatError);
    EXPECT_THROW(OperatorCatalog::FromJsonString(R"({"products": []})"), FormatError);
    EXPECT_THROW(OperatorCatalog::FromJsonString(
                     R"({"owner_id": "o", "products": [{"name": "x", "variants": 3}]})"),
                 FormatError);
    EXPECT_THROW(OperatorCatalog::FromJsonString(
                     R"({"owner_id": "o", "products": [{"name": "x",
                         "variants": [{"size": 5, "price": "abc"}]}]})"),
                 FormatError);
}

TEST(Catalog, JsonStringRoundTripKeepsMapping) {
    OperatorCatalog catalog  = OperatorCatalog::FromJsonString(kCatalogJson);
    OperatorCatalog reparsed = OperatorCatalog::FromJsonString(catalog.ToJsonString());
    EXPECT_EQ(reparsed.products.size(), catalog.products.size());
    ASSERT_NE(reparsed.FindKitBuilder("roof-kit"), nullptr);
    RoleMapping mapping = reparsed.FindKitBuilder("roof-kit")->BuildRoleMapping();
    EXPECT_TRUE(mapping.Contains(Role::Geotextile, "geo-roll"));
    EXPECT_TRUE(mapping.Contains(Role::Thermal, "thermal-coat"));
}

TEST(RoleMapping, AssignIgnoresBlankAndDuplicateHandles) {
    RoleMapping mapping;
    EXPECT_TRUE(mapping.Empty());
    mapping.Assign(Role::Sealer, " Primer ");
    mapping.Assign(Role::Sealer, "primer");
    mapping.Assign(Role::Sealer, "   ");
    EXPECT_FALSE(mapping.Empty());
    ASSERT_EQ(mapping.HandlesFor(Role::Sealer).size(), 1u);
    EXPECT_EQ(mapping.HandlesFor(Role::Sealer)[0], "primer");
}

TEST(CatalogStore, PutAndQuery) {
    CatalogStore store;
    store.Put(OperatorCatalog::FromJsonString(kCatalogJson));
    EXPECT_EQ(store.Size(), 1u);
    EXPECT_TRUE(store.FindCommerceConfig("owner-1").has_value());
    EXPECT_EQ(store.ListProducts("owner-1").size(), 2u);
    EXPECT_EQ(store.ListKitBuilders("owner-1").size(), 2u);

    std::optional<KitBuilderConfig> kit = store.FindKitBuilder("owner-1", "");
    ASSERT_TRUE(kit.has_value());
    EXPECT_EQ(kit->key, "roof-kit");
    EXPECT_FALSE(store.FindKitBuilder("owner-1", "boat-kit").has_value());

    EXPECT_FALSE(store.FindCommerceConfig("nobody").has_value());
    EXPECT_TRUE(store.ListProducts("nobody").empty());
}

TEST(CatalogStore, PutRejectsEmptyOwner) {
    CatalogStore store;
    EXPECT_THROW(store.Put(OperatorCatalog{}), InputError);
}

TEST(CatalogStore, LoadsDirectoryAndSkipsBrokenFiles) {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "kitquote_catalog_store_test";
    fs::remove_all(dir);
    fs::create_directories(dir);
    {
        std::ofstream(dir / "owner-1.json") << kCatalogJson;
        std::ofstream(dir / "broken.json") << "{";
        std::ofstream(dir / "notes.txt") << "ignored";
    }

    CatalogStore store;
    EXPECT_EQ(store.LoadFromDirectory(dir.string()), 1u);
    EXPECT_EQ(store.OwnerIds(), std::vector<std::string>{"owner-1"});

    fs::remove(dir / "owner-1.json");
    EXPECT_EQ(store.ReloadFromDirectory(dir.string()), 0u);
    EXPECT_EQ(store.Size(), 0u);

    fs::remove_all(dir);
    EXPECT_THROW(store.LoadFromDirectory(dir.string()), IOError);
}
