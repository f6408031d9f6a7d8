#pragma once

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace KitQuote::pybind {

void BindCommon(pybind11::module_& m);
void BindQuote(pybind11::module_& m);

} // namespace KitQuote::pybind
