#pragma once

/// \file pricing.h
/// \brief Order pricing, discount policy and money formatting.

#include "common.h"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace KitQuote {

/// Accepted discount range, inclusive. Values outside it are ignored, not rejected.
inline constexpr double kMinDiscountPercent = 1.0;
inline constexpr double kMaxDiscountPercent = 20.0;

/// One priced, sellable order line.
struct PricedLine {
    Role role   = Role::Sealant;
    double size = 0.0;
    std::string title;
    int quantity      = 0;
    double unit_price = 0.0; ///< Rounded to 2 dp.
    std::optional<int64_t> variant_id;
    std::string image_url; ///< Empty until resolved.
};

struct PricingSummary {
    double subtotal = 0.0;
    std::optional<double> discount_percent; ///< Set only when the discount was applied.
    double discount_amount = 0.0;
    double total           = 0.0;

    bool HasDiscount() const { return discount_percent.has_value(); }
};

/// True if \p percent lies in [kMinDiscountPercent, kMaxDiscountPercent].
bool IsAcceptedDiscount(double percent);

/// subtotal = sum(unit * qty); discount = round2(subtotal * pct / 100);
/// total = round2(subtotal - discount). An out-of-range percent applies no discount.
PricingSummary ComputePricing(std::span<const PricedLine> lines,
                              std::optional<double> discount_percent);

/// en-AU money text with grouping and 2 decimals: 1234.5 -> "1,234.50".
std::string FormatMoney(double amount);

/// Size label found in a product title ("15L", "2m", "0.5 L"), or nullopt.
std::optional<std::string> ExtractVariantLabel(const std::string& title);

} // namespace KitQuote
