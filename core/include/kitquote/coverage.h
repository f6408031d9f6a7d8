#pragma once

/// \file coverage.h
/// \brief Coverage calculator: surface area to required material volume per role.

#include "common.h"

#include <map>

namespace KitQuote {

/// Per-role coverage-rate overrides (L/m², m/m², or L per sealant liter for rapid-cure).
using CoverageOverrides = std::map<Role, double>;

/// Application rates for one roof profile. Defaults are the corrugated/painted profile.
struct CoverageRates {
    double sealant_l_per_m2           = 1.5;
    double thermal_l_per_m2           = 0.5;
    double sealer_l_per_m2            = 1.0 / 8.0;
    double geotextile_m_per_m2        = 1.0;
    double rapid_cure_l_per_sealant_l = 0.02;

    /// Share of the total area that is seams/cracks (sealant, sealer, geo-textile).
    double coverage_fraction = 0.15;

    /// Rate applied for \p role. BrushKit has no rate and returns 0.
    double RateFor(Role role) const;

    /// Replace the rate of every role present in \p overrides.
    /// Throws InputError on negative or non-finite rates. BrushKit overrides are ignored.
    void ApplyOverrides(const CoverageOverrides& overrides);

    /// Default rates with \p overrides applied.
    static CoverageRates WithOverrides(const CoverageOverrides& overrides);
};

/// Required quantity per role for one area.
struct CoverageRequirement {
    double area_m2          = 0.0;
    double coverage_area_m2 = 0.0; ///< coverage_fraction * area, rounded up to 2 dp.

    double sealant_liters    = 0.0;
    double thermal_liters    = 0.0;
    double sealer_liters     = 0.0;
    double geotextile_meters = 0.0; ///< Whole meters.
    double rapid_cure_liters = 0.0;

    /// Required quantity in the role's pack unit. BrushKit returns 0.
    double VolumeFor(Role role) const;
};

/// Compute per-role requirements for \p area_m2 (must be finite and >= 0).
CoverageRequirement ComputeCoverage(double area_m2, const CoverageRates& rates = CoverageRates{});

} // namespace KitQuote
