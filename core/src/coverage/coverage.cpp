#include "kitquote/coverage.h"
#include "kitquote/error.h"
#include "detail/round_utils.h"

#include <spdlog/spdlog.h>

#include <cmath>
#include <string>

namespace KitQuote {

using detail::CeilTo2dp;
using detail::CeilToWhole;

double CoverageRates::RateFor(Role role) const {
    switch (role) {
    case Role::Sealant:
        return sealant_l_per_m2;
    case Role::Thermal:
        return thermal_l_per_m2;
    case Role::Sealer:
        return sealer_l_per_m2;
    case Role::Geotextile:
        return geotextile_m_per_m2;
    case Role::RapidCure:
        return rapid_cure_l_per_sealant_l;
    case Role::BrushKit:
        return 0.0;
    }
    return 0.0;
}

void CoverageRates::ApplyOverrides(const CoverageOverrides& overrides) {
    for (const auto& [role, rate] : overrides) {
        if (!std::isfinite(rate) || rate < 0.0) {
            throw InputError("Invalid coverage override for " + ToRoleString(role) + ": " +
                             std::to_string(rate));
        }
        switch (role) {
        case Role::Sealant:
            sealant_l_per_m2 = rate;
            break;
        case Role::Thermal:
            thermal_l_per_m2 = rate;
            break;
        case Role::Sealer:
            sealer_l_per_m2 = rate;
            break;
        case Role::Geotextile:
            geotextile_m_per_m2 = rate;
            break;
        case Role::RapidCure:
            rapid_cure_l_per_sealant_l = rate;
            break;
        case Role::BrushKit:
            spdlog::debug("Ignoring coverage override for {}", ToRoleString(role));
            break;
        }
    }
}

CoverageRates CoverageRates::WithOverrides(const CoverageOverrides& overrides) {
    CoverageRates rates;
    rates.ApplyOverrides(overrides);
    return rates;
}

double CoverageRequirement::VolumeFor(Role role) const {
    switch (role) {
    case Role::Sealant:
        return sealant_liters;
    case Role::Thermal:
        return thermal_liters;
    case Role::Sealer:
        return sealer_liters;
    case Role::Geotextile:
        return geotextile_meters;
    case Role::RapidCure:
        return rapid_cure_liters;
    case Role::BrushKit:
        return 0.0;
    }
    return 0.0;
}

CoverageRequirement ComputeCoverage(double area_m2, const CoverageRates& rates) {
    if (!std::isfinite(area_m2) || area_m2 < 0.0) {
        throw InputError("Area must be a finite number >= 0");
    }

    CoverageRequirement req;
    req.area_m2          = area_m2;
    req.coverage_area_m2 = CeilTo2dp(area_m2 * rates.coverage_fraction);

    req.sealant_liters    = CeilTo2dp(req.coverage_area_m2 * rates.sealant_l_per_m2);
    req.thermal_liters    = CeilTo2dp(area_m2 * rates.thermal_l_per_m2);
    req.sealer_liters     = CeilTo2dp(req.coverage_area_m2 * rates.sealer_l_per_m2);
    req.geotextile_meters = CeilToWhole(req.coverage_area_m2 * rates.geotextile_m_per_m2);
    // Rapid-cure is dosed on the sealant that is required, not on what is bought.
    req.rapid_cure_liters = CeilTo2dp(req.sealant_liters * rates.rapid_cure_l_per_sealant_l);

    spdlog::debug("Coverage: area={} coverage_area={} sealant={}L thermal={}L sealer={}L "
                  "geo={}m rapid_cure={}L",
                  area_m2, req.coverage_area_m2, req.sealant_liters, req.thermal_liters,
                  req.sealer_liters, req.geotextile_meters, req.rapid_cure_liters);
    return req;
}

} // namespace KitQuote
