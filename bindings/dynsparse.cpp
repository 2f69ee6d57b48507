#include <pybind11/pybind11.h>

namespace py = pybind11;

// Forward declarations
void bind_types(py::module_& m);
void bind_tensor(py::module_& m);
void bind_pruning(py::module_& m);
void bind_training(py::module_& m);

PYBIND11_MODULE(_dynsparse, m) {
    m.doc() = "dynsparse - RigL dynamic sparse training engine";

    bind_types(m);
    bind_tensor(m);
    bind_pruning(m);
    bind_training(m);

    m.attr("__version__") = "0.1.0";
}
