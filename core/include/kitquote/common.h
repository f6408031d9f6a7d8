/// \file common.h
/// \brief Common enumerations and types used throughout KitQuote.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace KitQuote {

/// Abstract material role of a kit. The set is closed; which catalog products
/// fill a role is operator configuration (see RoleMapping).
enum class Role : uint8_t {
    Sealant    = 0, ///< Waterproof sealant, liters, applied to the coverage area.
    Thermal    = 1, ///< Protective/thermal top coat, liters, applied to the full area.
    Sealer     = 2, ///< Sealer/primer, liters, applied to the coverage area.
    Geotextile = 3, ///< Geo-textile reinforcement rolls, meters, applied to the coverage area.
    RapidCure  = 4, ///< Rapid-cure additive, liters per liter of sealant.
    BrushKit   = 5, ///< Brush or brush + roller kit, one per order.
};

inline constexpr std::size_t kRoleCount = 6;

/// All roles in computation order.
inline constexpr std::array<Role, kRoleCount> kAllRoles = {
    Role::Sealant, Role::Thermal, Role::Sealer, Role::Geotextile, Role::RapidCure, Role::BrushKit,
};

/// Convert Role to its canonical key ("waterproof-sealant", "geo-textile", ...).
std::string ToRoleString(Role role);

/// Parse a Role key. Case and surrounding whitespace are ignored.
/// Throws FormatError on unknown keys.
Role FromRoleString(const std::string& str);

/// Non-throwing variant of FromRoleString().
std::optional<Role> TryParseRole(const std::string& str);

/// Pack unit of a role: "L" for liquids, "m" for rolls, "" for kits.
const char* RoleUnit(Role role);

/// Strip surrounding whitespace.
std::string Trim(const std::string& str);

/// Trim surrounding whitespace and lowercase. Used for handle and key matching.
std::string NormalizeKey(const std::string& str);

/// Shortest decimal rendering of a pack size (15 -> "15", 0.5 -> "0.5").
std::string FormatSize(double size);

} // namespace KitQuote
