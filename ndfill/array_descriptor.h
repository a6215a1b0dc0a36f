#pragma once

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>

#include "ndfill/dtype.h"
#include "ndfill/order.h"
#include "ndfill/shape.h"
#include "ndfill/strides.h"

namespace ndfill {

// A strided view over a linear buffer of elements.
//
// The descriptor shares ownership of the buffer and owns its metadata. Copies of a descriptor refer to the same buffer, so writing
// through any of them (even a const one) is visible to all of them.
//
// Every element addressed by the view, i.e. offset + sum(index[k] * strides[k]) for all valid multi-indices, is guaranteed to lie
// in [0, buffer_size); the constructor rejects descriptors violating this.
class ArrayDescriptor {
public:
    // Creates a view. `buffer_size` is the number of elements allocated in `data`, and `offset` and `strides` are counted in elements.
    ArrayDescriptor(
            Dtype dtype,
            std::shared_ptr<void> data,
            int64_t buffer_size,
            Shape shape,
            Strides strides,
            int64_t offset,
            Order order = Order::kRowMajor);

    ~ArrayDescriptor() = default;

    ArrayDescriptor(const ArrayDescriptor&) = default;
    ArrayDescriptor(ArrayDescriptor&&) = default;
    ArrayDescriptor& operator=(const ArrayDescriptor&) = default;
    ArrayDescriptor& operator=(ArrayDescriptor&&) = default;

    Dtype dtype() const { return dtype_; }

    const std::shared_ptr<void>& data() const { return data_; }

    int64_t buffer_size() const { return buffer_size_; }

    const Shape& shape() const { return shape_; }

    const Strides& strides() const { return strides_; }

    int64_t offset() const { return offset_; }

    Order order() const { return order_; }

    int64_t ndim() const { return shape_.ndim(); }

    int64_t GetTotalSize() const { return shape_.GetTotalSize(); }

    int64_t GetItemSize() const { return ndfill::GetItemSize(dtype_); }

    std::string ToString() const;

private:
    Dtype dtype_;
    std::shared_ptr<void> data_;
    int64_t buffer_size_;
    Shape shape_;
    Strides strides_;
    int64_t offset_;
    Order order_;
};

std::ostream& operator<<(std::ostream& os, const ArrayDescriptor& array);

namespace internal {

// Returns the address of the element at the all-zero index.
void* GetRawOffsetData(const ArrayDescriptor& array);

}  // namespace internal
}  // namespace ndfill
