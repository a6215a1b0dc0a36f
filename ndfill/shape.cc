#include "ndfill/shape.h"

#include <algorithm>
#include <cstdint>
#include <limits>

#include "ndfill/error.h"

namespace ndfill {

int64_t Shape::GetTotalSize() const {
    CheckValidShape(*this);
    if (std::find(begin(), end(), int64_t{0}) != end()) {
        return 0;
    }
    int64_t total_size = 1;
    for (int64_t dim : *this) {
        if (total_size > std::numeric_limits<int64_t>::max() / dim) {
            throw DimensionError{"Total size of shape ", *this, " does not fit in int64."};
        }
        total_size *= dim;
    }
    return total_size;
}

void CheckValidShape(const Shape& shape) {
    if (std::any_of(shape.begin(), shape.end(), [](int64_t dim) { return dim < 0; })) {
        throw DimensionError{"Shape ", shape, " has a negative dimension."};
    }
}

void CheckEqual(const Shape& lhs, const Shape& rhs) {
    if (lhs != rhs) {
        throw ShapeMismatchError{"Shapes do not match: ", lhs, ", ", rhs, "."};
    }
}

}  // namespace ndfill
