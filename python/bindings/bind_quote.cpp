#include "bindings.h"

#include "kitquote/bucket_optimizer.h"
#include "kitquote/commerce.h"
#include "kitquote/role_resolver.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace py = pybind11;

namespace KitQuote::pybind {

void BindQuote(py::module_& m) {
    py::class_<PackVariant>(m, "PackVariant", "Purchasable pack size and price.")
        .def(py::init<>())
        .def(py::init([](double size, double price) { return PackVariant{size, price}; }),
             py::arg("size"), py::arg("price"))
        .def_readwrite("size", &PackVariant::size)
        .def_readwrite("price", &PackVariant::price);

    py::class_<PackCount>(m, "PackCount", "Number of packs of one size.")
        .def_readonly("size", &PackCount::size)
        .def_readonly("quantity", &PackCount::quantity);

    py::class_<OptimizerPolicy>(m, "OptimizerPolicy", "Optimizer tuning.")
        .def(py::init<>())
        .def_readwrite("max_non_largest_packs", &OptimizerPolicy::max_non_largest_packs,
                       "Cap per non-largest size; negative disables it.")
        .def_readwrite("scale", &OptimizerPolicy::scale, "Volume discretization factor.");

    m.def(
        "optimize_buckets",
        [](double volume, const std::vector<PackVariant>& variants,
           const OptimizerPolicy& policy) { return OptimizeBuckets(volume, variants, policy); },
        py::arg("volume"), py::arg("variants"), py::arg("policy") = OptimizerPolicy{},
        "Minimum-cost packs covering a volume, largest size first.");

    py::class_<LineItem>(m, "LineItem", "One bill-of-materials line.")
        .def_readonly("role", &LineItem::role)
        .def_readonly("size", &LineItem::size)
        .def_readonly("label", &LineItem::label)
        .def_readonly("quantity", &LineItem::quantity)
        .def_readonly("variant_index", &LineItem::variant_index);

    py::class_<Breakdown>(m, "Breakdown", "Bill of materials for one area.")
        .def_readonly("line_items", &Breakdown::line_items)
        .def_readonly("sealant_liters", &Breakdown::sealant_liters)
        .def_readonly("total_item_count", &Breakdown::total_item_count)
        .def_readonly("requirement", &Breakdown::requirement)
        .def_readonly("unmapped_roles", &Breakdown::unmapped_roles);

    m.def("compute_breakdown", &ComputeBreakdown, py::arg("area_m2"),
          py::arg("variants_by_role"), py::arg("overrides") = CoverageOverrides{},
          py::arg("policy") = OptimizerPolicy{},
          "Area -> per-role packs. variants_by_role maps Role to [PackVariant].");

    m.def(
        "build_cart_url",
        [](const std::string& shop_domain, const std::vector<std::pair<int64_t, int>>& lines,
           const std::string& discount_code, const std::string& note) {
            std::vector<CartLine> cart;
            for (const auto& [id, qty] : lines) { cart.push_back(CartLine{id, qty}); }
            CartUrlOptions opts;
            opts.discount_code = discount_code;
            opts.note          = note;
            return BuildCartUrl(shop_domain, cart, opts);
        },
        py::arg("shop_domain"), py::arg("lines"), py::arg("discount_code") = "",
        py::arg("note") = "", "Cart permalink for (variant_id, quantity) pairs.");
}

} // namespace KitQuote::pybind
