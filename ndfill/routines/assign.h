#pragma once

#include <tuple>

#include "ndfill/array_descriptor.h"
#include "ndfill/axes.h"
#include "ndfill/order.h"
#include "ndfill/strides.h"

namespace ndfill {
namespace internal {

// Returns the axes in the order they are traversed, outermost first.
//
// The axes start in the order implied by the memory order (the last axis innermost for row-major, the first one for column-major),
// and are then stably sorted by decreasing absolute stride.
Axes GetTraversalAxes(const Strides& strides, Order order);

// Returns views of src and dst whose row-major traversal visits the elements in the order given by axes, outermost first.
//
// Unit-length dimensions are dropped, and a dimension is merged into the preceding one whenever it is contiguous with it in both
// arrays. The views address the same elements as the originals.
std::tuple<ArrayDescriptor, ArrayDescriptor> SquashDims(const ArrayDescriptor& src, const ArrayDescriptor& dst, const Axes& axes);

}  // namespace internal

// Copies every element of src into the element of dst at the same index, casting to the dtype of dst.
//
// Elements are visited in the order given by internal::GetTraversalAxes on the strides of dst; if several indices of dst address the
// same element, the last one visited wins.
// Throws ShapeMismatchError if the shapes differ, and UnsupportedCastKindError for complex src and non-complex dst, both before any
// write. A floating-point element that does not fit an integer dst throws UnsupportedCastKindError, leaving the elements visited
// before it written.
void Assign(const ArrayDescriptor& src, const ArrayDescriptor& dst);

}  // namespace ndfill
