#pragma once

#include <cstdint>

#include "ndfill/constant.h"
#include "ndfill/dims.h"
#include "ndfill/macro.h"

namespace ndfill {
namespace index_iterator_detail {

// Advances a multi-index by one position in row-major order.
// Wraps around to all zeros after the last position.
template <typename Index>
inline void Increment(Index& index, const int64_t* shape, int64_t ndim) {
    for (int64_t j = ndim; --j >= 0;) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (++index[j] < shape[j]) {
            return;
        }
        index[j] = 0;
    }
}

}  // namespace index_iterator_detail

// Iterates over the multi-indices of a shape in row-major order, i.e. the last dimension varies fastest.
//
// The iterator keeps both the linear (raw) index and the decomposed multi-index.
template <int8_t kNdim = kDynamicNdim>
class IndexIterator {
    static_assert(kNdim > 0, "Static iterators need at least one dimension.");

public:
    explicit IndexIterator(const int64_t* shape, int64_t total_size) : shape_{shape}, total_size_{total_size} {}

    IndexIterator<kNdim>& operator++() {
        NDFILL_ASSERT(raw_index_ < total_size_);
        ++raw_index_;
        index_iterator_detail::Increment(index_, shape_, kNdim);
        return *this;
    }

    explicit operator bool() const { return raw_index_ < total_size_; }

    constexpr int8_t ndim() const { return kNdim; }

    int64_t raw_index() const { return raw_index_; }

    const int64_t* index() const { return index_; }

private:
    const int64_t* shape_;
    int64_t total_size_{};
    int64_t raw_index_{0};
    int64_t index_[kNdim]{};
};

// Runtime determined dynamic dimension specialization.
//
// The number of dimensions is not bounded, so the multi-index is held in a Dims.
// A 0-dimensional shape yields a single position.
template <>
class IndexIterator<kDynamicNdim> {
public:
    explicit IndexIterator(const int64_t* shape, int64_t ndim, int64_t total_size)
        : shape_{shape}, total_size_{total_size}, index_(ndim, int64_t{0}) {}

    IndexIterator<kDynamicNdim>& operator++() {
        NDFILL_ASSERT(raw_index_ < total_size_);
        ++raw_index_;
        index_iterator_detail::Increment(index_, shape_, ndim());
        return *this;
    }

    explicit operator bool() const { return raw_index_ < total_size_; }

    int64_t ndim() const { return static_cast<int64_t>(index_.size()); }

    int64_t raw_index() const { return raw_index_; }

    const int64_t* index() const { return index_.data(); }

private:
    const int64_t* shape_;
    int64_t total_size_{};
    int64_t raw_index_{0};
    Dims index_;
};

}  // namespace ndfill
