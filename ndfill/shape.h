#pragma once

#include <cstdint>

#include "ndfill/dims.h"

namespace ndfill {

class Shape : public DimsBase<Shape> {
public:
    using DimsBase::DimsBase;

    static const char* GetName() { return "Shape"; }

    // Returns the number of elements. Throws DimensionError for a negative dimension, or if the count overflows int64_t.
    int64_t GetTotalSize() const;
};

// Throws DimensionError if any dimension is negative.
void CheckValidShape(const Shape& shape);

// Throws ShapeMismatchError if the two shapes differ.
void CheckEqual(const Shape& lhs, const Shape& rhs);

}  // namespace ndfill
