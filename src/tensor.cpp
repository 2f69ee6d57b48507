#include "dynsparse/tensor.hpp"
#include "dynsparse/types.hpp"
#include <cstdlib>
#include <algorithm>
#include <stdexcept>
#include <limits>

#ifdef _WIN32
#include <malloc.h>
#define aligned_alloc(alignment, size) _aligned_malloc(size, alignment)
#define aligned_free(ptr) _aligned_free(ptr)
#else
#define aligned_free(ptr) std::free(ptr)
#endif

namespace dynsparse {

namespace {

constexpr size_t kAlignment = 64;

/// Reject negative dimensions
void validate_shape(const std::vector<int64_t>& shape) {
    for (size_t i = 0; i < shape.size(); ++i) {
        if (shape[i] < 0) {
            throw std::invalid_argument(
                "Negative dimension at axis " + std::to_string(i) +
                ": " + std::to_string(shape[i]));
        }
    }
}

/// aligned_alloc requires the size to be a multiple of the alignment
std::shared_ptr<void> allocate_aligned(size_t bytes) {
    size_t padded = (bytes + kAlignment - 1) / kAlignment * kAlignment;
    void* ptr = aligned_alloc(kAlignment, padded);
    if (!ptr) {
        throw std::bad_alloc();
    }
    return std::shared_ptr<void>(ptr, [](void* p) { aligned_free(p); });
}

} // anonymous namespace

Tensor::Tensor(const std::vector<int64_t>& shape, DType dtype)
    : shape_(shape)
    , dtype_(dtype)
{
    validate_shape(shape_);

    size_t bytes = size_bytes();
    if (bytes > 0) {
        owned_data_ = allocate_aligned(bytes);
        data_ = owned_data_.get();
        std::memset(data_, 0, bytes);
    }
}

Tensor::Tensor(const Tensor& other)
    : shape_(other.shape_)
    , dtype_(other.dtype_)
{
    if (other.is_valid()) {
        size_t bytes = size_bytes();
        owned_data_ = allocate_aligned(bytes);
        data_ = owned_data_.get();
        std::memcpy(data_, other.data_, bytes);
    }
}

Tensor::Tensor(Tensor&& other) noexcept
    : data_(other.data_)
    , shape_(std::move(other.shape_))
    , dtype_(other.dtype_)
    , owned_data_(std::move(other.owned_data_))
{
    other.data_ = nullptr;
}

Tensor& Tensor::operator=(const Tensor& other) {
    if (this != &other) {
        Tensor tmp(other);
        std::swap(data_, tmp.data_);
        std::swap(shape_, tmp.shape_);
        std::swap(dtype_, tmp.dtype_);
        std::swap(owned_data_, tmp.owned_data_);
    }
    return *this;
}

Tensor& Tensor::operator=(Tensor&& other) noexcept {
    if (this != &other) {
        data_ = other.data_;
        shape_ = std::move(other.shape_);
        dtype_ = other.dtype_;
        owned_data_ = std::move(other.owned_data_);
        other.data_ = nullptr;
    }
    return *this;
}

Tensor Tensor::from_vector(const std::vector<int64_t>& shape,
                           const std::vector<float>& values) {
    Tensor t(shape, DType::Float32);
    if (static_cast<int64_t>(values.size()) != t.num_elements()) {
        throw std::invalid_argument(
            "from_vector: " + std::to_string(values.size()) +
            " values for shape " + dims_to_string(shape));
    }
    if (!values.empty()) {
        std::memcpy(t.data(), values.data(), values.size() * sizeof(float));
    }
    return t;
}

int64_t Tensor::num_elements() const {
    if (shape_.empty()) return 0;
    return checked_product(shape_);
}

size_t Tensor::size_bytes() const {
    int64_t elements = num_elements();
    size_t elem_size = dtype_size(dtype_);
    if (elements > 0 && static_cast<size_t>(elements) > std::numeric_limits<size_t>::max() / elem_size) {
        throw std::overflow_error("Tensor size in bytes would overflow");
    }
    return static_cast<size_t>(elements) * elem_size;
}

Tensor Tensor::clone() const {
    return Tensor(*this);
}

void Tensor::zero() {
    if (is_valid()) {
        std::memset(data_, 0, size_bytes());
    }
}

int64_t Tensor::count_nonzero() const {
    if (dtype_ != DType::Float32) {
        throw std::invalid_argument(
            "count_nonzero() expects float32, got " + dtype_name(dtype_));
    }
    if (!is_valid()) return 0;
    const float* p = data_ptr<float>();
    return static_cast<int64_t>(std::count_if(p, p + num_elements(),
        [](float v) { return v != 0.0f; }));
}

bool Tensor::equals(const Tensor& other) const {
    if (shape_ != other.shape_ || dtype_ != other.dtype_) {
        return false;
    }
    if (!is_valid() || !other.is_valid()) {
        return is_valid() == other.is_valid();
    }
    return std::memcmp(data_, other.data_, size_bytes()) == 0;
}

} // namespace dynsparse
