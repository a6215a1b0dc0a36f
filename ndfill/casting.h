#pragma once

#include <ostream>
#include <string>

#include <absl/types/optional.h>

#include "ndfill/dtype.h"
#include "ndfill/scalar.h"

namespace ndfill {

// Rules deciding which dtype conversions are permitted.
enum class CastingMode {
    kNo = 1,  // Only identical dtypes.
    kEquiv,  // Only identical dtypes; byte order is not modeled.
    kSafe,  // Conversions which preserve every value.
    kMostlySafe,  // Safe conversions plus floating-point downcasts within real or complex kinds.
    kSameKind,  // Mostly-safe conversions plus any conversion within a kind or toward floating-point kinds.
    kUnsafe,  // Any conversion.
};

std::ostream& operator<<(std::ostream& os, CastingMode casting);

// Returns the name of the casting mode, e.g. "mostly-safe".
const char* GetCastingModeName(CastingMode casting);

// Gets the casting mode of given name.
// Throws CastingError for unknown names.
CastingMode GetCastingMode(const std::string& name);

bool IsSafeCast(Dtype from, Dtype to);

bool IsMostlySafeCast(Dtype from, Dtype to);

bool IsSameKindCast(Dtype from, Dtype to);

bool IsAllowedCast(Dtype from, Dtype to, CastingMode casting);

// Returns the smallest dtype able to represent the value exactly.
//
// Non-negative integers map to unsigned dtypes and negative ones to signed dtypes. Floating-point values map to float32 if converting to
// float32 loses nothing (NaN and infinities included) and to float64 otherwise. Complex values map to complex64 or complex128 alike.
Dtype GetMinDtype(Scalar value);

// Returns the smallest signed integer dtype able to represent the integral value, or nullopt if there is none, i.e. for non-integral
// values and for unsigned values above the range of int64.
absl::optional<Dtype> GetMinSignedIntegerDtype(Scalar value);

// Returns true if the value may be written into an array of the dtype under the casting mode.
//
// The value is treated as having its minimal dtype (see GetMinDtype). If the target is a signed integer dtype, non-negative integers
// are treated as having the minimal signed dtype instead.
bool IsScalarCompatible(Scalar value, Dtype dtype, CastingMode casting);

inline bool IsScalarMostlySafeCompatible(Scalar value, Dtype dtype) { return IsScalarCompatible(value, dtype, CastingMode::kMostlySafe); }

}  // namespace ndfill
