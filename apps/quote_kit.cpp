#include "kitquote/catalog.h"
#include "kitquote/checkout.h"
#include "kitquote/error.h"
#include "kitquote/logging.h"
#include "kitquote/pricing.h"
#include "kitquote/role_resolver.h"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <optional>
#include <string>
#include <vector>

using namespace KitQuote;

namespace {

struct Options {
    std::string catalog_path;
    double area_m2 = -1.0;
    std::string kit_key;
    std::optional<double> discount_percent;
    bool json_output      = false;
    std::string log_level = "warn";
};

void PrintUsage(const char* exe) {
    std::printf(
        "Usage: %s --catalog owner.json --area M2 [options]\n"
        "Options:\n"
        "  --catalog PATH      Operator catalog JSON (required)\n"
        "  --area M2           Roof area in square meters (required)\n"
        "  --kit KEY           Kit builder key (default: roof-kit, else the first kit)\n"
        "  --discount PCT      Discount percent, applied when within [1, 20]\n"
        "  --json              Print the quote as JSON\n"
        "  --log-level LEVEL   Log level: trace/debug/info/warn/error/off (default: warn)\n",
        exe);
}

bool ParseDouble(const char* s, double& out) {
    if (!s) { return false; }
    try {
        size_t idx   = 0;
        double value = std::stod(s, &idx);
        if (idx != std::string(s).size()) { return false; }
        out = value;
        return true;
    } catch (const std::exception&) { return false; }
}

bool ParseArgs(int argc, char** argv, Options& opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--catalog" && i + 1 < argc) {
            opt.catalog_path = argv[++i];
            continue;
        }
        if (arg == "--area" && i + 1 < argc) {
            if (!ParseDouble(argv[++i], opt.area_m2) || opt.area_m2 < 0.0) {
                std::fprintf(stderr, "Invalid --area value\n");
                return false;
            }
            continue;
        }
        if (arg == "--kit" && i + 1 < argc) {
            opt.kit_key = argv[++i];
            continue;
        }
        if (arg == "--discount" && i + 1 < argc) {
            double pct = 0.0;
            if (!ParseDouble(argv[++i], pct)) {
                std::fprintf(stderr, "Invalid --discount value\n");
                return false;
            }
            opt.discount_percent = pct;
            continue;
        }
        if (arg == "--json") {
            opt.json_output = true;
            continue;
        }
        if (arg == "--log-level" && i + 1 < argc) {
            opt.log_level = argv[++i];
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return false;
        }
        std::fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
        PrintUsage(argv[0]);
        return false;
    }
    return true;
}

struct QuoteLine {
    LineItem item;
    std::string product;
    PricedLine priced;
};

void PrintTable(const Breakdown& b, const std::vector<QuoteLine>& lines,
                const PricingSummary& pricing, const std::string& currency) {
    const CoverageRequirement& r = b.requirement;
    std::printf("Area %.2f m2 (coverage %.2f m2)\n", r.area_m2, r.coverage_area_m2);
    std::printf("  sealant %.2f L, top coat %.2f L, sealer %.2f L, geo-textile %.0f m, "
                "rapid-cure %.2f L\n\n",
                r.sealant_liters, r.thermal_liters, r.sealer_liters, r.geotextile_meters,
                r.rapid_cure_liters);

    for (const QuoteLine& line : lines) {
        std::printf("  %3dx %-40s %10s %10s\n", line.priced.quantity, line.priced.title.c_str(),
                    FormatMoney(line.priced.unit_price).c_str(),
                    FormatMoney(line.priced.unit_price * line.priced.quantity).c_str());
    }
    std::printf("\n  Items     %d\n", b.total_item_count);
    std::printf("  Subtotal  %s %s\n", FormatMoney(pricing.subtotal).c_str(), currency.c_str());
    if (pricing.HasDiscount()) {
        std::printf("  Discount  -%s (%g%%)\n", FormatMoney(pricing.discount_amount).c_str(),
                    *pricing.discount_percent);
    }
    std::printf("  Total     %s %s\n", FormatMoney(pricing.total).c_str(), currency.c_str());
    for (Role role : b.unmapped_roles) {
        std::printf("  (no product configured for %s)\n", ToRoleString(role).c_str());
    }
}

void PrintJson(const Breakdown& b, const std::vector<QuoteLine>& lines,
               const PricingSummary& pricing, const std::string& currency) {
    nlohmann::json items = nlohmann::json::array();
    for (const QuoteLine& line : lines) {
        items.push_back({
            {"role", ToRoleString(line.item.role)},
            {"label", line.item.label},
            {"product", line.product},
            {"title", line.priced.title},
            {"quantity", line.priced.quantity},
            {"unit_price", FormatMoney(line.priced.unit_price)},
        });
    }
    nlohmann::json unmapped = nlohmann::json::array();
    for (Role role : b.unmapped_roles) { unmapped.push_back(ToRoleString(role)); }

    nlohmann::json j = {
        {"area_m2", b.requirement.area_m2},
        {"sealant_liters", b.sealant_liters},
        {"total_item_count", b.total_item_count},
        {"line_items", items},
        {"subtotal", FormatMoney(pricing.subtotal)},
        {"total", FormatMoney(pricing.total)},
        {"currency", currency},
        {"unmapped_roles", unmapped},
    };
    if (pricing.HasDiscount()) {
        j["discount_percent"] = *pricing.discount_percent;
        j["discount_amount"]  = FormatMoney(pricing.discount_amount);
    }
    std::printf("%s\n", j.dump(2).c_str());
}

} // namespace

int main(int argc, char** argv) {
    Options opt;

    if (!ParseArgs(argc, argv, opt)) { return 1; }

    InitLogging(ParseLogLevel(opt.log_level));

    if (opt.catalog_path.empty() || opt.area_m2 < 0.0) {
        PrintUsage(argv[0]);
        return 1;
    }

    try {
        OperatorCatalog catalog = OperatorCatalog::LoadFromJson(opt.catalog_path);
        const KitBuilderConfig* kit =
            opt.kit_key.empty() ? catalog.DefaultKitBuilder() : catalog.FindKitBuilder(opt.kit_key);
        if (!kit && !opt.kit_key.empty()) {
            throw InputError("Unknown kit builder: " + opt.kit_key);
        }

        RoleResolver resolver(catalog.products, kit ? kit->BuildRoleMapping() : RoleMapping{});
        Breakdown breakdown =
            ComputeBreakdown(opt.area_m2, resolver.BuildVariantTable(),
                             kit ? kit->BuildCoverageOverrides() : CoverageOverrides{});

        std::vector<QuoteLine> lines;
        std::vector<PricedLine> priced;
        for (const LineItem& item : breakdown.line_items) {
            ResolvedPack pack = resolver.Resolve(item);
            if (!pack) { continue; }
            QuoteLine line;
            line.item              = item;
            line.product           = pack.product->name;
            line.priced.role       = item.role;
            line.priced.size       = item.size;
            line.priced.title      = PackTitle(item, pack);
            line.priced.quantity   = item.quantity;
            line.priced.unit_price = pack.variant->price;
            line.priced.variant_id = pack.variant->platform_variant_id;
            priced.push_back(line.priced);
            lines.push_back(std::move(line));
        }
        PricingSummary pricing = ComputePricing(priced, opt.discount_percent);

        if (opt.json_output) {
            PrintJson(breakdown, lines, pricing, catalog.Currency());
        } else {
            PrintTable(breakdown, lines, pricing, catalog.Currency());
        }
    } catch (const Error& e) {
        spdlog::error("Failed: {} ({})", e.what(), ToErrorCodeString(e.code()));
        return 1;
    }

    return 0;
}
