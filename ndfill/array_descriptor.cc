#include "ndfill/array_descriptor.h"

#include <cstdint>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

#include "ndfill/error.h"

namespace ndfill {

ArrayDescriptor::ArrayDescriptor(
        Dtype dtype, std::shared_ptr<void> data, int64_t buffer_size, Shape shape, Strides strides, int64_t offset, Order order)
    : dtype_{dtype},
      data_{std::move(data)},
      buffer_size_{buffer_size},
      shape_{std::move(shape)},
      strides_{std::move(strides)},
      offset_{offset},
      order_{order} {
    if (!IsValidDtype(dtype_)) {
        throw DtypeError{"invalid dtype: ", static_cast<std::underlying_type_t<Dtype>>(dtype_)};
    }
    if (order_ != Order::kRowMajor && order_ != Order::kColumnMajor) {
        throw OrderError{"invalid order: ", static_cast<int>(order_)};
    }
    if (shape_.ndim() != strides_.ndim()) {
        throw DimensionError{"Shape ", shape_, " and strides ", strides_, " must have the same number of dimensions."};
    }
    CheckValidShape(shape_);
    if (buffer_size_ < 0) {
        throw DimensionError{"Buffer size must not be negative: ", buffer_size_};
    }
    if (offset_ < 0) {
        throw IndexError{"Offset must not be negative: ", offset_};
    }
    if (data_ == nullptr && buffer_size_ > 0) {
        throw DimensionError{"Null data buffer cannot hold ", buffer_size_, " elements."};
    }

    int64_t first{};
    int64_t last{};
    std::tie(first, last) = GetDataRange(shape_, strides_);
    if (first == last) {
        // Empty views address no element.
        return;
    }
    // Both sides stay in range: offset_ and buffer_size_ are non-negative.
    if (first < -offset_ || last > buffer_size_ - offset_) {
        throw IndexError{"View with shape ", shape_, ", strides ", strides_, " and offset ", offset_,
                         " addresses elements outside of the buffer of size ", buffer_size_, "."};
    }
}

std::string ArrayDescriptor::ToString() const {
    std::ostringstream os;
    os << *this;
    return os.str();
}

std::ostream& operator<<(std::ostream& os, const ArrayDescriptor& array) {
    return os << "ArrayDescriptor(dtype=" << array.dtype() << ", shape=" << array.shape() << ", strides=" << array.strides()
              << ", offset=" << array.offset() << ", order=" << array.order() << ", buffer_size=" << array.buffer_size() << ")";
}

namespace internal {

void* GetRawOffsetData(const ArrayDescriptor& array) {
    uint8_t* raw_data = static_cast<uint8_t*>(array.data().get());
    return raw_data + array.offset() * array.GetItemSize();
}

}  // namespace internal
}  // namespace ndfill
