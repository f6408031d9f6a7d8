/// \file detail/round_utils.h
/// \brief Internal decimal rounding helpers shared by the calculator and pricing.

#pragma once

#include <cmath>

namespace KitQuote::detail {

/// Values this close to a grid point are treated as lying on it.
constexpr double kRoundingEpsilon = 1e-9;

/// Round up to 2 decimal places. 22.500000000000004 -> 22.5, 22.501 -> 22.51.
inline double CeilTo2dp(double value) {
    return std::ceil(value * 100.0 - kRoundingEpsilon) / 100.0;
}

/// Round up to a whole unit, tolerating floating-point noise.
inline double CeilToWhole(double value) { return std::ceil(value - kRoundingEpsilon); }

/// Round half away from zero to 2 decimal places (money).
inline double RoundTo2dp(double value) {
    const double scaled = value * 100.0;
    const double nudged = scaled + (scaled >= 0.0 ? kRoundingEpsilon : -kRoundingEpsilon);
    return std::round(nudged) / 100.0;
}

} // namespace KitQuote::detail
