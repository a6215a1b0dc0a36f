#include "ndfill/scalar.h"

#include <cmath>
#include <complex>
#include <cstdint>
#include <ostream>
#include <sstream>
#include <string>

#include "ndfill/macro.h"

namespace ndfill {

bool Scalar::IsNegative() const {
    switch (kind_) {
        case DtypeKind::kBool:
        case DtypeKind::kUInt:
        case DtypeKind::kComplex:
            return false;
        case DtypeKind::kInt:
            return int_ < 0;
        case DtypeKind::kFloat:
            return float_ < 0;
        default:
            NDFILL_NEVER_REACH();
    }
    return false;
}

bool Scalar::operator==(Scalar other) const {
    if (kind_ == DtypeKind::kComplex || other.kind_ == DtypeKind::kComplex) {
        return real() == other.real() && imag() == other.imag();
    }
    if (kind_ == DtypeKind::kFloat || other.kind_ == DtypeKind::kFloat) {
        return UnwrapAndCast<double>() == other.UnwrapAndCast<double>();
    }
    // Both are booleans or integers. A negative value never equals an unsigned 64-bit one.
    if (IsNegative() != other.IsNegative()) {
        return false;
    }
    return UnwrapAndCast<uint64_t>() == other.UnwrapAndCast<uint64_t>();
}

std::string Scalar::ToString() const {
    std::ostringstream os;
    os << *this;
    return os.str();
}

std::ostream& operator<<(std::ostream& os, Scalar value) {
    switch (value.kind()) {
        case DtypeKind::kBool:
            os << (static_cast<bool>(value) ? "True" : "False");
            break;
        case DtypeKind::kInt:
            os << static_cast<int64_t>(value);
            break;
        case DtypeKind::kUInt:
            os << static_cast<uint64_t>(value);
            break;
        case DtypeKind::kFloat:
            os << static_cast<double>(value);
            break;
        case DtypeKind::kComplex:
            os << "(" << value.real() << (value.imag() < 0 ? "-" : "+") << std::abs(value.imag()) << "j)";
            break;
        default:
            NDFILL_NEVER_REACH();
    }
    return os;
}

}  // namespace ndfill
