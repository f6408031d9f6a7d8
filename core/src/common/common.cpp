#include "kitquote/common.h"
#include "kitquote/error.h"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>

namespace KitQuote {

std::string ToRoleString(Role role) {
    switch (role) {
    case Role::Sealant:
        return "waterproof-sealant";
    case Role::Thermal:
        return "protective-top-coat";
    case Role::Sealer:
        return "sealer";
    case Role::Geotextile:
        return "geo-textile";
    case Role::RapidCure:
        return "rapid-cure-spray";
    case Role::BrushKit:
        return "brush-roller";
    }
    return "waterproof-sealant";
}

std::optional<Role> TryParseRole(const std::string& str) {
    const std::string key = NormalizeKey(str);
    for (Role role : kAllRoles) {
        if (key == ToRoleString(role)) { return role; }
    }
    return std::nullopt;
}

Role FromRoleString(const std::string& str) {
    std::optional<Role> role = TryParseRole(str);
    if (!role) { throw FormatError("Invalid role string: " + str); }
    return *role;
}

const char* RoleUnit(Role role) {
    switch (role) {
    case Role::Geotextile:
        return "m";
    case Role::BrushKit:
        return "";
    default:
        return "L";
    }
}

std::string Trim(const std::string& str) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto begin     = std::find_if(str.begin(), str.end(), not_space);
    auto end       = std::find_if(str.rbegin(), str.rend(), not_space).base();
    if (begin >= end) { return std::string(); }
    return std::string(begin, end);
}

std::string NormalizeKey(const std::string& str) {
    std::string out = Trim(str);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string FormatSize(double size) { return fmt::format("{:g}", size); }

const char* ToErrorCodeString(ErrorCode code) {
    switch (code) {
    case ErrorCode::Ok:
        return "ok";
    case ErrorCode::InvalidInput:
        return "invalid_input";
    case ErrorCode::IOError:
        return "io_error";
    case ErrorCode::FormatError:
        return "format_error";
    case ErrorCode::ConfigError:
        return "config_error";
    case ErrorCode::PlatformError:
        return "platform_error";
    case ErrorCode::InternalError:
        return "internal_error";
    }
    return "internal_error";
}

} // namespace KitQuote
