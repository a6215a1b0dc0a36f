#include "ndfill/strides.h"

#include <cstdint>
#include <limits>
#include <tuple>

#include "ndfill/error.h"
#include "ndfill/macro.h"

namespace ndfill {

std::tuple<int64_t, int64_t> GetDataRange(const Shape& shape, const Strides& strides) {
    NDFILL_ASSERT(shape.ndim() == strides.ndim());
    if (shape.GetTotalSize() == 0) {
        return std::tuple<int64_t, int64_t>{0, 0};
    }

    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    int64_t first = 0;
    int64_t last = 0;
    for (int64_t i = 0; i < shape.ndim(); ++i) {
        int64_t steps = shape[i] - 1;
        int64_t stride = strides[i];
        if (steps == 0 || stride == 0) {
            continue;
        }
        // |stride| as unsigned, which also holds the magnitude of the lowest int64_t.
        uint64_t magnitude = stride < 0 ? uint64_t{0} - static_cast<uint64_t>(stride) : static_cast<uint64_t>(stride);
        if (static_cast<uint64_t>(steps) > static_cast<uint64_t>(kMax) / magnitude) {
            throw DimensionError{"Shape ", shape, " with strides ", strides, " spans more elements than int64 can address."};
        }
        int64_t extent = steps * stride;
        if (extent < 0) {
            if (first < -kMax - extent) {
                throw DimensionError{"Shape ", shape, " with strides ", strides, " spans more elements than int64 can address."};
            }
            first += extent;
        } else {
            // Leaves room for the exclusive upper bound.
            if (last > kMax - 1 - extent) {
                throw DimensionError{"Shape ", shape, " with strides ", strides, " spans more elements than int64 can address."};
            }
            last += extent;
        }
    }
    NDFILL_ASSERT(first <= 0);
    NDFILL_ASSERT(0 <= last);
    return std::tuple<int64_t, int64_t>{first, last + 1};
}

}  // namespace ndfill
