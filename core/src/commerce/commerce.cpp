#include "kitquote/commerce.h"
#include "kitquote/common.h"

#include <spdlog/fmt/fmt.h>

#include <array>
#include <cmath>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace KitQuote {
namespace {

constexpr std::array<std::pair<int, const char*>, 3> kFixedDiscountCodes = {{
    {10, "NZ10"},
    {15, "NZ15"},
    {20, "NZ20"},
}};

constexpr std::array<std::string_view, 8> kVariantErrorPhrases = {
    "no longer available", "not found",       "could not be found", "unavailable",
    "variant",             "invalid variant", "does not exist",     "merchandise",
};

} // namespace

std::string NormalizeShopDomain(const std::string& input) {
    std::string out = Trim(input);
    for (std::string_view scheme : {std::string_view("https://"), std::string_view("http://")}) {
        if (out.size() >= scheme.size() &&
            NormalizeKey(out.substr(0, scheme.size())) == scheme) {
            out.erase(0, scheme.size());
            break;
        }
    }
    while (!out.empty() && out.back() == '/') { out.pop_back(); }
    return out;
}

std::string StorefrontBaseUrl(const std::string& shop_domain) {
    std::string host = NormalizeShopDomain(shop_domain);
    const std::size_t slash = host.find('/');
    if (slash != std::string::npos) { host.erase(slash); }
    if (host.find('.') == std::string::npos) { return "https://" + host + ".myshopify.com"; }
    return "https://" + host;
}

std::string UrlEncode(const std::string& value) {
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                                (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' ||
                                c == '~';
        if (unreserved) {
            out.push_back(static_cast<char>(c));
        } else {
            out += fmt::format("%{:02X}", static_cast<unsigned int>(c));
        }
    }
    return out;
}

std::string BuildCartUrl(const std::string& shop_domain, std::span<const CartLine> lines,
                         const CartUrlOptions& opts) {
    std::string cart;
    for (const CartLine& line : lines) {
        if (!cart.empty()) { cart.push_back(','); }
        cart += fmt::format("{}:{}", line.variant_id, line.quantity);
    }

    std::string url = StorefrontBaseUrl(shop_domain) + "/cart/" + cart;

    std::string query;
    const std::string code = Trim(opts.discount_code);
    if (!code.empty()) { query += "discount=" + UrlEncode(code); }
    const std::string note = Trim(opts.note);
    if (!note.empty()) {
        if (!query.empty()) { query.push_back('&'); }
        query += "note=" + UrlEncode(note);
    }
    if (!query.empty()) { url += "?" + query; }
    return url;
}

std::optional<std::string> DiscountCodeForPercent(double percent) {
    if (!std::isfinite(percent) || std::floor(percent) != percent) { return std::nullopt; }
    for (const auto& [pct, code] : kFixedDiscountCodes) {
        if (static_cast<double>(pct) == percent) { return std::string(code); }
    }
    return std::nullopt;
}

DraftOrderRequest DraftOrderRequest::WithoutVariantIds() const {
    DraftOrderRequest copy = *this;
    for (DraftLineItem& item : copy.line_items) { item.variant_id.reset(); }
    return copy;
}

const char* ToPlatformErrorKindString(PlatformErrorKind kind) {
    switch (kind) {
    case PlatformErrorKind::None:
        return "none";
    case PlatformErrorKind::VariantUnavailable:
        return "variant_unavailable";
    case PlatformErrorKind::Rejected:
        return "rejected";
    case PlatformErrorKind::Transport:
        return "transport";
    }
    return "rejected";
}

PlatformErrorKind ClassifyPlatformError(const std::string& message) {
    const std::string lower = NormalizeKey(message);
    for (std::string_view phrase : kVariantErrorPhrases) {
        if (lower.find(phrase) != std::string::npos) {
            return PlatformErrorKind::VariantUnavailable;
        }
    }
    return PlatformErrorKind::Rejected;
}

} // namespace KitQuote
