#pragma once

#include <cmath>
#include <complex>

namespace ndfill {

template <typename T>
inline bool IsNan(T /*value*/) {
    return false;
}

inline bool IsNan(float value) { return std::isnan(value); }
inline bool IsNan(double value) { return std::isnan(value); }

// A complex value is NaN if either part is.
template <typename T>
inline bool IsNan(std::complex<T> value) {
    return IsNan(value.real()) || IsNan(value.imag());
}

}  // namespace ndfill
