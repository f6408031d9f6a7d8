#pragma once

#include "kitquote/bucket_optimizer.h"
#include "kitquote/checkout.h"
#include "kitquote/error.h"

#include <nlohmann/json.hpp>

#include <array>
#include <cmath>
#include <optional>
#include <string>
#include <vector>

using namespace KitQuote;
using json = nlohmann::json;

inline double GetNumber(const json& params, const char* key) {
    if (!params.contains(key)) { throw InputError(std::string("Missing required field: ") + key); }
    const json& v = params.at(key);
    if (v.is_number()) { return v.get<double>(); }
    if (v.is_string()) {
        try {
            return std::stod(v.get<std::string>());
        } catch (const std::exception&) {
            throw InputError(std::string(key) + " is not a number: " + v.get<std::string>());
        }
    }
    throw InputError(std::string(key) + " must be a number");
}

inline std::optional<double> GetOptionalNumber(const json& params, const char* key) {
    if (!params.contains(key) || params.at(key).is_null()) { return std::nullopt; }
    return GetNumber(params, key);
}

/// Area from "area_m2" or the older "roof_size_sqm".
inline std::optional<double> ParseArea(const json& params) {
    std::optional<double> area = GetOptionalNumber(params, "area_m2");
    if (!area) { area = GetOptionalNumber(params, "roof_size_sqm"); }
    if (area && (!std::isfinite(*area) || *area < 0.0)) {
        throw InputError("area_m2 must be >= 0");
    }
    return area;
}

inline std::string GetOptionalString(const json& params, const char* key) {
    if (!params.contains(key) || params.at(key).is_null()) { return std::string(); }
    if (!params.at(key).is_string()) { throw InputError(std::string(key) + " must be a string"); }
    return params.at(key).get<std::string>();
}

/// Whole-number pack count. Negative values become 0, like the assembler treats them.
inline int ParsePackCount(double value, const char* key) {
    if (!std::isfinite(value) || std::floor(value) != value) {
        throw InputError(std::string(key) + " must be a whole number");
    }
    if (value > static_cast<double>(kMaxPackCount)) {
        throw InputError(std::string(key) + " must be <= " + std::to_string(kMaxPackCount));
    }
    return value < 0.0 ? 0 : static_cast<int>(value);
}

inline CheckoutInput BuildCheckoutInput(const json& params) {
    CheckoutInput input;
    input.area_m2 = ParseArea(params);

    if (params.contains("counts")) {
        const json& counts = params.at("counts");
        if (!counts.is_array()) { throw InputError("counts must be an array"); }
        for (const auto& c : counts) {
            if (!c.is_number()) { throw InputError("counts must contain numbers"); }
            input.pack_counts.push_back(ParsePackCount(c.get<double>(), "counts"));
        }
    } else {
        static constexpr std::array<const char*, 3> kCountKeys = {"count_15l", "count_10l",
                                                                  "count_5l"};
        for (const char* key : kCountKeys) {
            std::optional<double> c = GetOptionalNumber(params, key);
            input.pack_counts.push_back(c ? ParsePackCount(*c, key) : 0);
        }
    }

    input.discount_percent = GetOptionalNumber(params, "discount_percent");
    input.email            = GetOptionalString(params, "email");
    input.kit_key          = GetOptionalString(params, "kit_key");
    return input;
}

struct OptimizeRequest {
    double volume = 0.0;
    std::vector<PackVariant> variants;
    OptimizerPolicy policy;
};

inline OptimizeRequest BuildOptimizeRequest(const json& params) {
    OptimizeRequest req;
    req.volume = GetNumber(params, "volume");

    if (!params.contains("variants") || !params.at("variants").is_array()) {
        throw InputError("variants must be an array");
    }
    for (const auto& v : params.at("variants")) {
        if (!v.is_object()) { throw InputError("variant must be an object"); }
        req.variants.push_back(PackVariant{GetNumber(v, "size"), GetNumber(v, "price")});
    }
    if (std::optional<double> cap = GetOptionalNumber(params, "max_non_largest_packs")) {
        if (!std::isfinite(*cap) || *cap > kMaxNonLargestPacksLimit) {
            throw InputError("max_non_largest_packs must be <= " +
                             std::to_string(kMaxNonLargestPacksLimit));
        }
        req.policy.max_non_largest_packs = *cap < 0.0 ? -1 : static_cast<int>(std::lround(*cap));
    }
    return req;
}
