#pragma once

#include "dynsparse/types.hpp"
#include <memory>
#include <vector>
#include <cstring>
#include <string>

namespace dynsparse {

/// Dense, owned, type-tagged tensor storage
class Tensor {
public:
    /// Create empty tensor
    Tensor() = default;

    /// Create zero-filled tensor with owned memory
    Tensor(const std::vector<int64_t>& shape, DType dtype);

    Tensor(const Tensor& other);
    Tensor(Tensor&& other) noexcept;
    Tensor& operator=(const Tensor& other);
    Tensor& operator=(Tensor&& other) noexcept;
    ~Tensor() = default;

    /// Create a Float32 tensor from values (row-major)
    static Tensor from_vector(const std::vector<int64_t>& shape,
                              const std::vector<float>& values);

    // Accessors
    const std::vector<int64_t>& shape() const { return shape_; }
    DType dtype() const { return dtype_; }
    size_t ndim() const { return shape_.size(); }
    int64_t size(size_t dim) const {
        if (dim >= shape_.size()) {
            throw std::out_of_range("Dimension index " + std::to_string(dim) +
                " out of range for tensor with " + std::to_string(shape_.size()) + " dimensions");
        }
        return shape_[dim];
    }

    int64_t num_elements() const;
    size_t size_bytes() const;

    /// Raw data pointer
    void* data() { return data_; }
    const void* data() const { return data_; }

    /// Typed data access
    template<typename T>
    T* data_ptr() { return static_cast<T*>(data_); }

    template<typename T>
    const T* data_ptr() const { return static_cast<const T*>(data_); }

    /// Create a deep copy
    Tensor clone() const;

    /// Check if tensor holds data
    bool is_valid() const { return data_ != nullptr; }

    /// Fill tensor with value
    template<typename T>
    void fill(T value);

    /// Zero out the tensor
    void zero();

    /// Copy the contents out as a flat vector
    template<typename T>
    std::vector<T> to_vector() const;

    /// Number of elements that are not exactly zero (Float32 only)
    int64_t count_nonzero() const;

    /// Same shape, dtype and bytes
    bool equals(const Tensor& other) const;

private:
    void* data_ = nullptr;
    std::vector<int64_t> shape_;
    DType dtype_ = DType::Float32;
    std::shared_ptr<void> owned_data_;
};

// Template implementation
template<typename T>
void Tensor::fill(T value) {
    if (sizeof(T) != dtype_size(dtype_)) {
        throw std::invalid_argument(
            "Type size mismatch in fill(): sizeof(T)=" + std::to_string(sizeof(T)) +
            " but dtype size=" + std::to_string(dtype_size(dtype_)) +
            ". Use the correct type for dtype " + dtype_name(dtype_));
    }
    if (!is_valid()) {
        return;
    }
    T* ptr = data_ptr<T>();
    int64_t n = num_elements();
    for (int64_t i = 0; i < n; ++i) {
        ptr[i] = value;
    }
}

template<typename T>
std::vector<T> Tensor::to_vector() const {
    if (sizeof(T) != dtype_size(dtype_)) {
        throw std::invalid_argument(
            "Type size mismatch in to_vector() for dtype " + dtype_name(dtype_));
    }
    std::vector<T> out(static_cast<size_t>(num_elements()));
    if (!out.empty()) {
        std::memcpy(out.data(), data_, size_bytes());
    }
    return out;
}

} // namespace dynsparse
