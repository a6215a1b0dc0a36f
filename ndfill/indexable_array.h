#pragma once

#include <algorithm>
#include <cstdint>
#include <tuple>
#include <type_traits>

#include "ndfill/array_descriptor.h"
#include "ndfill/constant.h"
#include "ndfill/dims.h"
#include "ndfill/dtype.h"
#include "ndfill/index_iterator.h"
#include "ndfill/macro.h"
#include "ndfill/strides.h"

namespace ndfill {
namespace indexable_array_detail {

// Returns the range of elements addressed by the descriptor as [first, last).
template <typename T>
std::tuple<const T*, const T*> GetDataRange(const ArrayDescriptor& a) {
    std::tuple<int64_t, int64_t> range = ndfill::GetDataRange(a.shape(), a.strides());
    const T* base = static_cast<const T*>(internal::GetRawOffsetData(a));
    return std::tuple<const T*, const T*>{base + std::get<0>(range), base + std::get<1>(range)};
}

}  // namespace indexable_array_detail

// Typed accessor to the elements of a strided view. Strides are counted in elements.
//
// T may be const-qualified for read-only access.
template <typename T, int8_t kNdim = kDynamicNdim>
class IndexableArray {
    static_assert(kNdim > 0, "Static arrays need at least one dimension.");

public:
    using ElementType = T;

    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-member-init)
    explicit IndexableArray(const ArrayDescriptor& array) : data_{static_cast<T*>(internal::GetRawOffsetData(array))} {
        NDFILL_ASSERT(TypeToDtype<std::remove_const_t<T>> == array.dtype());
        NDFILL_ASSERT(array.ndim() == kNdim);
        std::copy(array.strides().begin(), array.strides().end(), strides_);
#if NDFILL_DEBUG
        std::tie(first_, last_) = indexable_array_detail::GetDataRange<std::remove_const_t<T>>(array);
#endif  // NDFILL_DEBUG
    }

    constexpr int8_t ndim() const { return kNdim; }

    const int64_t* strides() const { return strides_; }

    T* data() const { return data_; }

    T& operator[](const int64_t* index) const {
        T* data_ptr = data_;
        for (int8_t dim = 0; dim < kNdim; ++dim) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
            data_ptr += strides_[dim] * index[dim];
        }
#if NDFILL_DEBUG
        NDFILL_ASSERT(first_ <= data_ptr);
        NDFILL_ASSERT(data_ptr < last_);
#endif  // NDFILL_DEBUG
        return *data_ptr;
    }

    T& operator[](const IndexIterator<kNdim>& it) const { return operator[](it.index()); }

private:
    T* data_;
#if NDFILL_DEBUG
    const std::remove_const_t<T>* first_{nullptr};
    const std::remove_const_t<T>* last_{nullptr};
#endif  // NDFILL_DEBUG
    int64_t strides_[kNdim];
};

// Runtime determined dynamic dimension specialization.
template <typename T>
class IndexableArray<T, kDynamicNdim> {
public:
    using ElementType = T;

    explicit IndexableArray(const ArrayDescriptor& array)
        : data_{static_cast<T*>(internal::GetRawOffsetData(array))}, strides_(array.strides().begin(), array.strides().end()) {
        NDFILL_ASSERT(TypeToDtype<std::remove_const_t<T>> == array.dtype());
#if NDFILL_DEBUG
        std::tie(first_, last_) = indexable_array_detail::GetDataRange<std::remove_const_t<T>>(array);
#endif  // NDFILL_DEBUG
    }

    int64_t ndim() const { return static_cast<int64_t>(strides_.size()); }

    const int64_t* strides() const { return strides_.data(); }

    T* data() const { return data_; }

    T& operator[](const int64_t* index) const {
        T* data_ptr = data_;
        for (int64_t dim = 0; dim < ndim(); ++dim) {
            data_ptr += strides_[dim] * index[dim];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
#if NDFILL_DEBUG
        NDFILL_ASSERT(first_ <= data_ptr);
        NDFILL_ASSERT(data_ptr < last_);
#endif  // NDFILL_DEBUG
        return *data_ptr;
    }

    T& operator[](const IndexIterator<kDynamicNdim>& it) const { return operator[](it.index()); }

private:
    T* data_;
#if NDFILL_DEBUG
    const std::remove_const_t<T>* first_{nullptr};
    const std::remove_const_t<T>* last_{nullptr};
#endif  // NDFILL_DEBUG
    Dims strides_;
};

}  // namespace ndfill
