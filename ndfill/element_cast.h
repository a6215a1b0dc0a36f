#pragma once

#include <cmath>
#include <complex>
#include <limits>
#include <type_traits>

#include "ndfill/dtype.h"
#include "ndfill/error.h"
#include "ndfill/scalar.h"

namespace ndfill {
namespace element_cast_detail {

template <typename To, typename From, typename Enable = void>
struct ElementCastImpl {
    static To Cast(From value) { return static_cast<To>(value); }
};

// Rounds to nearest. Finite values at or beyond the midpoint between the largest float and 2^128 become infinities; values below it
// round to the largest finite float.
template <>
struct ElementCastImpl<float, double, void> {
    static float Cast(double value) {
        const double overflow_threshold = std::ldexp(2.0 - std::ldexp(1.0, -24), 127);
        if (value >= overflow_threshold) {
            return std::numeric_limits<float>::infinity();
        }
        if (value <= -overflow_threshold) {
            return -std::numeric_limits<float>::infinity();
        }
        return static_cast<float>(value);
    }
};

// Floating-point to integer. The value is truncated toward zero and must fit the integer type.
template <typename To, typename From>
struct ElementCastImpl<
        To,
        From,
        std::enable_if_t<std::is_floating_point<From>::value && std::is_integral<To>::value && !std::is_same<To, bool>::value>> {
    static To Cast(From value) {
        if (!std::isfinite(value)) {
            throw UnsupportedCastKindError{"Cannot cast non-finite value ", Scalar{value}, " to ", TypeToDtype<To>, "."};
        }
        // Bounds of the integer type as [lower, upper), both exactly representable as double.
        const double lower = std::is_signed<To>::value ? -std::ldexp(1.0, std::numeric_limits<To>::digits) : 0.0;
        const double upper = std::ldexp(1.0, std::numeric_limits<To>::digits);
        const double truncated = std::trunc(static_cast<double>(value));
        if (truncated < lower || truncated >= upper) {
            throw UnsupportedCastKindError{"Value ", Scalar{value}, " is out of the range of ", TypeToDtype<To>, "."};
        }
        return static_cast<To>(truncated);
    }
};

template <typename To, typename From>
struct ElementCastImpl<std::complex<To>, std::complex<From>, void> {
    static std::complex<To> Cast(std::complex<From> value) {
        return {ElementCastImpl<To, From>::Cast(value.real()), ElementCastImpl<To, From>::Cast(value.imag())};
    }
};

// Real to complex. The imaginary part is zero.
template <typename To, typename From>
struct ElementCastImpl<std::complex<To>, From, void> {
    static std::complex<To> Cast(From value) { return {ElementCastImpl<To, From>::Cast(value), To{0}}; }
};

template <typename To, typename From>
struct ElementCastImpl<To, std::complex<From>, void> {
    static To Cast(std::complex<From> value) {
        throw UnsupportedCastKindError{"Cannot cast complex value ", Scalar{value}, " to non-complex dtype ", TypeToDtype<To>, "."};
    }
};

}  // namespace element_cast_detail

// Converts a single element between the C++ types of two dtypes.
//
// Conversions without any representation in the target type throw UnsupportedCastKindError: complex to real, and non-finite or
// out-of-range floating-point values to integers. Other conversions never throw, but may lose precision or wrap around.
template <typename To, typename From>
std::remove_const_t<To> ElementCast(From value) {
    return element_cast_detail::ElementCastImpl<std::remove_const_t<To>, std::remove_const_t<From>>::Cast(value);
}

}  // namespace ndfill
