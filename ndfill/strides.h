#pragma once

#include <cstdint>
#include <tuple>

#include "ndfill/dims.h"
#include "ndfill/shape.h"

namespace ndfill {

// Strides of an array, counted in elements rather than bytes.
class Strides : public DimsBase<Strides> {
public:
    using DimsBase::DimsBase;

    static const char* GetName() { return "Strides"; }
};

// Returns a pair of lower and upper element offsets, relative to the all-zero index, of the data addressed by the given shape and strides.
// The upper bound is exclusive. This formula always holds for non-empty shapes: lower <= 0 < 1 <= upper.
// Empty shapes address no data and yield (0, 0).
// Throws DimensionError if the offsets do not fit in int64_t.
std::tuple<int64_t, int64_t> GetDataRange(const Shape& shape, const Strides& strides);

}  // namespace ndfill
