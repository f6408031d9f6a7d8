#include "bindings.h"

#include "kitquote/common.h"
#include "kitquote/coverage.h"

#include <string>

namespace py = pybind11;

namespace KitQuote::pybind {
namespace {

std::string RequirementRepr(const CoverageRequirement& r) {
    return "<CoverageRequirement area_m2=" + FormatSize(r.area_m2) +
           " sealant_liters=" + FormatSize(r.sealant_liters) +
           " thermal_liters=" + FormatSize(r.thermal_liters) + ">";
}

} // namespace

void BindCommon(py::module_& m) {
    py::enum_<Role>(m, "Role", "Material role of a kit.")
        .value("Sealant", Role::Sealant)
        .value("Thermal", Role::Thermal)
        .value("Sealer", Role::Sealer)
        .value("Geotextile", Role::Geotextile)
        .value("RapidCure", Role::RapidCure)
        .value("BrushKit", Role::BrushKit)
        .export_values();

    m.def("role_to_string", &ToRoleString, py::arg("role"), "Canonical role key.");
    m.def("role_from_string", &FromRoleString, py::arg("key"),
          "Parse a role key (case-insensitive).");

    py::class_<CoverageRates>(m, "CoverageRates", "Application rates per role.")
        .def(py::init<>(), "Create default (corrugated roof) rates.")
        .def_readwrite("sealant_l_per_m2", &CoverageRates::sealant_l_per_m2)
        .def_readwrite("thermal_l_per_m2", &CoverageRates::thermal_l_per_m2)
        .def_readwrite("sealer_l_per_m2", &CoverageRates::sealer_l_per_m2)
        .def_readwrite("geotextile_m_per_m2", &CoverageRates::geotextile_m_per_m2)
        .def_readwrite("rapid_cure_l_per_sealant_l", &CoverageRates::rapid_cure_l_per_sealant_l)
        .def_readwrite("coverage_fraction", &CoverageRates::coverage_fraction,
                       "Share of the area treated as seams/cracks.")
        .def("rate_for", &CoverageRates::RateFor, py::arg("role"))
        .def_static("with_overrides", &CoverageRates::WithOverrides, py::arg("overrides"),
                    "Default rates with per-role overrides applied.");

    py::class_<CoverageRequirement>(m, "CoverageRequirement", "Required quantity per role.")
        .def_readonly("area_m2", &CoverageRequirement::area_m2)
        .def_readonly("coverage_area_m2", &CoverageRequirement::coverage_area_m2)
        .def_readonly("sealant_liters", &CoverageRequirement::sealant_liters)
        .def_readonly("thermal_liters", &CoverageRequirement::thermal_liters)
        .def_readonly("sealer_liters", &CoverageRequirement::sealer_liters)
        .def_readonly("geotextile_meters", &CoverageRequirement::geotextile_meters)
        .def_readonly("rapid_cure_liters", &CoverageRequirement::rapid_cure_liters)
        .def("volume_for", &CoverageRequirement::VolumeFor, py::arg("role"))
        .def("__repr__", &RequirementRepr);

    m.def("compute_coverage", &ComputeCoverage, py::arg("area_m2"),
          py::arg("rates") = CoverageRates{}, "Per-role requirements for an area.");
}

} // namespace KitQuote::pybind
