#pragma once

#include "ndfill/array_descriptor.h"
#include "ndfill/dtype.h"
#include "ndfill/order.h"
#include "ndfill/scalar.h"
#include "ndfill/shape.h"

namespace ndfill {

// Returns a read-only view of the given shape whose every element reads the value cast to dtype.
//
// The view is backed by a newly allocated single-element buffer and has zero strides in all dimensions.
// Throws DimensionError if the shape has a negative dimension, and UnsupportedCastKindError if the value has no representation in dtype.
ArrayDescriptor BroadcastScalar(Scalar value, Dtype dtype, const Shape& shape, Order order = Order::kRowMajor);

}  // namespace ndfill
