#include <pybind11/pybind11.h>

#include "bindings.h"

PYBIND11_MODULE(kitquote, m) {
    m.doc() = "KitQuote core bindings";

    KitQuote::pybind::BindCommon(m);
    KitQuote::pybind::BindQuote(m);
}
