#include "kitquote/pricing.h"
#include "detail/round_utils.h"

#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <cstddef>
#include <regex>
#include <string>

namespace KitQuote {

using detail::RoundTo2dp;

bool IsAcceptedDiscount(double percent) {
    return std::isfinite(percent) && percent >= kMinDiscountPercent &&
           percent <= kMaxDiscountPercent;
}

PricingSummary ComputePricing(std::span<const PricedLine> lines,
                              std::optional<double> discount_percent) {
    PricingSummary summary;
    double subtotal = 0.0;
    for (const PricedLine& line : lines) {
        subtotal += line.unit_price * static_cast<double>(line.quantity);
    }
    summary.subtotal = RoundTo2dp(subtotal);

    if (discount_percent && IsAcceptedDiscount(*discount_percent)) {
        summary.discount_percent = *discount_percent;
        summary.discount_amount  = RoundTo2dp(summary.subtotal * *discount_percent / 100.0);
    }
    summary.total = RoundTo2dp(summary.subtotal - summary.discount_amount);
    return summary;
}

std::string FormatMoney(double amount) {
    std::string text = fmt::format("{:.2f}", std::fabs(RoundTo2dp(amount)));
    const std::size_t dot = text.find('.');
    std::string grouped;
    for (std::size_t i = 0; i < dot; ++i) {
        if (i > 0 && (dot - i) % 3 == 0) { grouped.push_back(','); }
        grouped.push_back(text[i]);
    }
    grouped += text.substr(dot);
    if (RoundTo2dp(amount) < 0.0) { grouped.insert(grouped.begin(), '-'); }
    return grouped;
}

std::optional<std::string> ExtractVariantLabel(const std::string& title) {
    static const std::regex kUnitPattern(R"((\d+(?:\.\d+)?)\s*(L|m)\b)",
                                         std::regex::ECMAScript | std::regex::icase);
    std::smatch match;
    if (!std::regex_search(title, match, kUnitPattern)) { return std::nullopt; }
    return match[0].str();
}

} // namespace KitQuote
