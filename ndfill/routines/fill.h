#pragma once

#include "ndfill/array_descriptor.h"
#include "ndfill/casting.h"
#include "ndfill/scalar.h"

namespace ndfill {

// Fills every element addressed by x with the value and returns x.
//
// The value is checked against the dtype of x with the mostly-safe casting rule; see IsScalarMostlySafeCompatible.
// Throws UnsafeCastError without writing anything if the check fails. Arrays with no elements are left as is, whatever the value.
const ArrayDescriptor& Fill(const ArrayDescriptor& x, Scalar value);

// Fills every element addressed by x with the value under the given casting rule and returns x.
const ArrayDescriptor& Fill(const ArrayDescriptor& x, Scalar value, CastingMode casting);

}  // namespace ndfill
