#pragma once

#include <algorithm>
#include <cstdint>
#include <ostream>

#include "ndfill/constant.h"
#include "ndfill/dims.h"
#include "ndfill/index_iterator.h"
#include "ndfill/macro.h"
#include "ndfill/shape.h"

namespace ndfill {

// Holds a shape and hands out iterators over its multi-indices.
// Iterators refer to the shape held by the indexer, which must outlive them.
template <int8_t kNdim = kDynamicNdim>
class Indexer {
public:
    explicit Indexer(const Shape& shape) : total_size_{shape.GetTotalSize()} {
        NDFILL_ASSERT(shape.ndim() == kNdim);
        std::copy_n(shape.begin(), kNdim, shape_);
    }

    IndexIterator<kNdim> It() const { return IndexIterator<kNdim>{shape_, total_size_}; }

    constexpr int8_t ndim() const { return kNdim; }

    int64_t total_size() const { return total_size_; }

    const int64_t* shape() const { return shape_; }

private:
    int64_t total_size_{};
    int64_t shape_[kNdim]{};
};

template <>
class Indexer<kDynamicNdim> {
public:
    explicit Indexer(const Shape& shape) : total_size_{shape.GetTotalSize()}, shape_(shape.begin(), shape.end()) {}

    IndexIterator<kDynamicNdim> It() const { return IndexIterator<kDynamicNdim>{shape_.data(), ndim(), total_size_}; }

    int64_t ndim() const { return static_cast<int64_t>(shape_.size()); }

    int64_t total_size() const { return total_size_; }

    const int64_t* shape() const { return shape_.data(); }

private:
    int64_t total_size_{};
    Dims shape_;
};

template <int8_t Ndim>
inline std::ostream& operator<<(std::ostream& os, const Indexer<Ndim>& indexer) {
    Shape shape{indexer.shape(), indexer.shape() + indexer.ndim()};
    return os << "Indexer(shape=" << shape << ")";
}

}  // namespace ndfill
