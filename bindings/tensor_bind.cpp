#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include "dynsparse/tensor.hpp"
#include "dynsparse/types.hpp"
#include <cstring>
#include <stdexcept>

namespace py = pybind11;
using namespace dynsparse;

namespace {

// Convert numpy dtype to DType
DType numpy_to_dtype(py::dtype dt) {
    if (dt.is(py::dtype::of<float>())) return DType::Float32;
    if (dt.is(py::dtype::of<double>())) return DType::Float64;
    if (dt.is(py::dtype::of<int64_t>())) return DType::Int64;
    if (dt.is(py::dtype::of<int32_t>())) return DType::Int32;
    if (dt.is(py::dtype::of<uint8_t>())) return DType::UInt8;
    if (dt.is(py::dtype::of<bool>())) return DType::Bool;
    throw std::runtime_error("Unsupported numpy dtype");
}

} // anonymous namespace

/// Create Tensor from numpy array (copies)
Tensor tensor_from_numpy(py::array arr) {
    py::array contiguous = py::array::ensure(arr, py::array::c_style);
    if (!contiguous) {
        throw std::runtime_error(
            "Failed to convert numpy array to contiguous C-style array");
    }

    std::vector<int64_t> shape;
    shape.reserve(static_cast<size_t>(contiguous.ndim()));
    for (py::ssize_t i = 0; i < contiguous.ndim(); ++i) {
        shape.push_back(static_cast<int64_t>(contiguous.shape(i)));
    }

    Tensor tensor(shape, numpy_to_dtype(contiguous.dtype()));

    size_t tensor_bytes = tensor.size_bytes();
    if (static_cast<size_t>(contiguous.nbytes()) != tensor_bytes) {
        throw std::runtime_error(
            "Size mismatch: numpy array has " + std::to_string(contiguous.nbytes()) +
            " bytes, tensor expects " + std::to_string(tensor_bytes) + " bytes");
    }
    if (tensor_bytes > 0) {
        std::memcpy(tensor.data(), contiguous.data(), tensor_bytes);
    }
    return tensor;
}

/// Create numpy array from Tensor (copies)
py::array tensor_to_numpy(const Tensor& tensor) {
    std::vector<py::ssize_t> shape(tensor.shape().begin(), tensor.shape().end());
    py::array result(py::dtype(dtype_name(tensor.dtype())), shape);

    size_t tensor_bytes = tensor.size_bytes();
    if (tensor_bytes != static_cast<size_t>(result.nbytes())) {
        throw std::runtime_error("Size mismatch during tensor-to-numpy conversion");
    }
    if (tensor_bytes > 0 && tensor.data() != nullptr) {
        std::memcpy(result.mutable_data(), tensor.data(), tensor_bytes);
    }
    return result;
}

/// Overwrite the contents of `tensor` in place, keeping its identity
void tensor_assign(Tensor& tensor, py::array arr) {
    Tensor source = tensor_from_numpy(arr);
    if (source.dtype() != tensor.dtype() || source.shape() != tensor.shape()) {
        throw std::runtime_error(
            "assign: expected " + dtype_name(tensor.dtype()) + dims_to_string(tensor.shape()) +
            ", got " + dtype_name(source.dtype()) + dims_to_string(source.shape()));
    }
    if (tensor.size_bytes() > 0) {
        std::memcpy(tensor.data(), source.data(), tensor.size_bytes());
    }
}

void bind_tensor(py::module_& m) {
    py::class_<Tensor>(m, "Tensor", "Tensor data container")
        .def(py::init([](py::array arr) {
            return tensor_from_numpy(arr);
        }), py::arg("data"), "Create tensor from numpy array")

        .def(py::init([](const std::vector<int64_t>& shape, DType dtype) {
            return Tensor(shape, dtype);
        }), py::arg("shape"), py::arg("dtype") = DType::Float32,
           "Create zero-filled tensor with given shape and dtype")

        .def_property_readonly("shape", [](const Tensor& t) {
            return std::vector<int64_t>(t.shape().begin(), t.shape().end());
        }, "Tensor shape")

        .def_property_readonly("dtype", &Tensor::dtype, "Data type")
        .def_property_readonly("ndim", &Tensor::ndim, "Number of dimensions")
        .def_property_readonly("num_elements", &Tensor::num_elements, "Total elements")
        .def_property_readonly("size_bytes", &Tensor::size_bytes, "Size in bytes")

        .def("numpy", &tensor_to_numpy, "Convert to numpy array")
        .def("assign", &tensor_assign, py::arg("data"),
             "Overwrite contents in place (same shape and dtype)")
        .def("clone", &Tensor::clone, "Create a deep copy")
        .def("zero", &Tensor::zero, "Fill tensor with zeros")
        .def("count_nonzero", &Tensor::count_nonzero, "Number of nonzero elements")
        .def("equals", &Tensor::equals, py::arg("other"),
             "Same shape, dtype and contents")

        .def("__repr__", [](const Tensor& t) {
            return "Tensor(shape=" + dims_to_string(t.shape()) +
                   ", dtype=" + dtype_name(t.dtype()) + ")";
        });

    m.def("from_numpy", &tensor_from_numpy,
          py::arg("array"),
          "Create Tensor from numpy array");

    m.def("to_numpy", &tensor_to_numpy,
          py::arg("tensor"),
          "Convert Tensor to numpy array");
}
