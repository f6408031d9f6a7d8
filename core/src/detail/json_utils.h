/// \file detail/json_utils.h
/// \brief Internal JSON-related utility functions shared across core modules.

#pragma once

#include "kitquote/error.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace KitQuote::detail {

/// Read an optional string member; null and missing give \p fallback.
inline std::string GetString(const nlohmann::json& obj, const char* key,
                             const std::string& fallback = std::string()) {
    if (!obj.contains(key) || obj.at(key).is_null()) { return fallback; }
    const nlohmann::json& v = obj.at(key);
    if (!v.is_string()) { throw FormatError(std::string(key) + " must be a string"); }
    return v.get<std::string>();
}

/// Read an optional numeric member. Numeric strings are accepted.
inline std::optional<double> GetOptionalDouble(const nlohmann::json& obj, const char* key) {
    if (!obj.contains(key) || obj.at(key).is_null()) { return std::nullopt; }
    const nlohmann::json& v = obj.at(key);
    if (v.is_number()) { return v.get<double>(); }
    if (v.is_string()) {
        try {
            return std::stod(v.get<std::string>());
        } catch (const std::exception&) {
            throw FormatError(std::string(key) + " is not a number: " + v.get<std::string>());
        }
    }
    throw FormatError(std::string(key) + " must be a number");
}

/// Read an optional 64-bit id member. Platform ids may arrive as strings.
inline std::optional<int64_t> GetOptionalInt64(const nlohmann::json& obj, const char* key) {
    if (!obj.contains(key) || obj.at(key).is_null()) { return std::nullopt; }
    const nlohmann::json& v = obj.at(key);
    if (v.is_number_integer()) { return v.get<int64_t>(); }
    if (v.is_string() && !v.get<std::string>().empty()) {
        try {
            return std::stoll(v.get<std::string>());
        } catch (const std::exception&) {
            throw FormatError(std::string(key) + " is not an integer: " + v.get<std::string>());
        }
    }
    throw FormatError(std::string(key) + " must be an integer");
}

} // namespace KitQuote::detail
