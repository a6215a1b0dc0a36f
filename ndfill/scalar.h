#pragma once

#include <complex>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>

#include "ndfill/dtype.h"
#include "ndfill/error.h"
#include "ndfill/macro.h"

namespace ndfill {

// Type safe, dynamically typed scalar value.
//
// Signed integers and unsigned integers of up to 32 bits are held as int64_t with kind kInt. Only uint64_t values are held with kind
// kUInt, so that the full unsigned 64-bit range is representable.
class Scalar {
public:
    // Suppress 'runtime/explicit' from cpplint, and 'google-explicit-constructor' and 'cppcoreguidelines-pro-type-member-init' from
    // clang-tidy.
    Scalar(bool v) : bool_{v}, kind_{DtypeKind::kBool} {}  // NOLINT
    Scalar(int8_t v) : int_{int64_t{v}}, kind_{DtypeKind::kInt} {}  // NOLINT
    Scalar(int16_t v) : int_{int64_t{v}}, kind_{DtypeKind::kInt} {}  // NOLINT
    Scalar(int32_t v) : int_{int64_t{v}}, kind_{DtypeKind::kInt} {}  // NOLINT
    Scalar(int64_t v) : int_{v}, kind_{DtypeKind::kInt} {}  // NOLINT
    Scalar(uint8_t v) : int_{int64_t{v}}, kind_{DtypeKind::kInt} {}  // NOLINT
    Scalar(uint16_t v) : int_{int64_t{v}}, kind_{DtypeKind::kInt} {}  // NOLINT
    Scalar(uint32_t v) : int_{int64_t{v}}, kind_{DtypeKind::kInt} {}  // NOLINT
    Scalar(uint64_t v) : uint_{v}, kind_{DtypeKind::kUInt} {}  // NOLINT
    Scalar(float v) : float_{double{v}}, kind_{DtypeKind::kFloat} {}  // NOLINT
    Scalar(double v) : float_{v}, kind_{DtypeKind::kFloat} {}  // NOLINT
    Scalar(std::complex<float> v) : complex_{double{v.real()}, double{v.imag()}}, kind_{DtypeKind::kComplex} {}  // NOLINT
    Scalar(std::complex<double> v) : complex_{v.real(), v.imag()}, kind_{DtypeKind::kComplex} {}  // NOLINT

    ~Scalar() = default;

    Scalar(const Scalar&) = default;
    Scalar(Scalar&&) = default;
    Scalar& operator=(const Scalar&) = default;
    Scalar& operator=(Scalar&&) = default;

    DtypeKind kind() const { return kind_; }

    std::string ToString() const;

    // Returns true if the value is less than zero. Booleans and complex values are never negative.
    bool IsNegative() const;

    bool operator==(Scalar other) const;

    bool operator!=(Scalar other) const { return !operator==(other); }

    explicit operator bool() const { return UnwrapAndCast<bool>(); }
    explicit operator int64_t() const { return UnwrapAndCast<int64_t>(); }
    explicit operator uint64_t() const { return UnwrapAndCast<uint64_t>(); }
    explicit operator double() const { return UnwrapAndCast<double>(); }

    // Real and imaginary parts. Non-complex values have a zero imaginary part.
    double real() const { return kind_ == DtypeKind::kComplex ? complex_.real : UnwrapAndCast<double>(); }
    double imag() const { return kind_ == DtypeKind::kComplex ? complex_.imag : 0.0; }

    // Invokes a function with the held value in its widest C++ representation, i.e. one of bool, int64_t, uint64_t, double or
    // std::complex<double>.
    template <typename F>
    auto Visit(F&& f) const {
        switch (kind_) {
            case DtypeKind::kBool:
                return std::forward<F>(f)(bool_);
            case DtypeKind::kInt:
                return std::forward<F>(f)(int_);
            case DtypeKind::kUInt:
                return std::forward<F>(f)(uint_);
            case DtypeKind::kFloat:
                return std::forward<F>(f)(float_);
            case DtypeKind::kComplex:
                return std::forward<F>(f)(std::complex<double>{complex_.real, complex_.imag});
            default:
                NDFILL_NEVER_REACH();
        }
    }

private:
    // Complex values are unwrapped to their real part; use real() and imag() to read them.
    template <typename T>
    T UnwrapAndCast() const {
        switch (kind_) {
            case DtypeKind::kBool:
                return static_cast<T>(bool_);
            case DtypeKind::kInt:
                return static_cast<T>(int_);
            case DtypeKind::kUInt:
                return static_cast<T>(uint_);
            case DtypeKind::kFloat:
                return static_cast<T>(float_);
            case DtypeKind::kComplex:
                return static_cast<T>(complex_.real);
            default:
                NDFILL_NEVER_REACH();
        }
        return T{};
    }

    struct ComplexParts {
        double real;
        double imag;
    };

    union {
        bool bool_;
        int64_t int_;
        uint64_t uint_;
        double float_;
        ComplexParts complex_;
    };

    DtypeKind kind_{};
};

std::ostream& operator<<(std::ostream& os, Scalar value);

}  // namespace ndfill
