#include "ndfill/casting.h"

#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <ostream>
#include <string>
#include <type_traits>

#include <absl/types/optional.h>
#include <gsl/gsl>

#include "ndfill/dtype.h"
#include "ndfill/error.h"
#include "ndfill/macro.h"
#include "ndfill/scalar.h"

namespace ndfill {
namespace {

// Integers convert without loss into floating-point dtypes of strictly greater real part width.
bool IsSafeIntegerToFloatingPointCast(Dtype from, Dtype to) {
    int64_t real_item_size = GetKind(to) == DtypeKind::kComplex ? GetItemSize(to) / 2 : GetItemSize(to);
    return real_item_size > GetItemSize(from);
}

Dtype MinUnsignedIntegerDtype(uint64_t value) {
    if (value <= std::numeric_limits<uint8_t>::max()) {
        return Dtype::kUInt8;
    }
    if (value <= std::numeric_limits<uint16_t>::max()) {
        return Dtype::kUInt16;
    }
    if (value <= std::numeric_limits<uint32_t>::max()) {
        return Dtype::kUInt32;
    }
    return Dtype::kUInt64;
}

Dtype MinSignedIntegerDtype(int64_t value) {
    if (std::numeric_limits<int8_t>::min() <= value && value <= std::numeric_limits<int8_t>::max()) {
        return Dtype::kInt8;
    }
    if (std::numeric_limits<int16_t>::min() <= value && value <= std::numeric_limits<int16_t>::max()) {
        return Dtype::kInt16;
    }
    if (std::numeric_limits<int32_t>::min() <= value && value <= std::numeric_limits<int32_t>::max()) {
        return Dtype::kInt32;
    }
    return Dtype::kInt64;
}

// Returns true if the value survives a round trip through float.
bool IsExactInFloat32(double value) {
    if (std::isnan(value) || std::isinf(value)) {
        return true;
    }
    if (std::fabs(value) > static_cast<double>(std::numeric_limits<float>::max())) {
        return false;
    }
    return static_cast<double>(gsl::narrow_cast<float>(value)) == value;
}

}  // namespace

std::ostream& operator<<(std::ostream& os, CastingMode casting) { return os << GetCastingModeName(casting); }

const char* GetCastingModeName(CastingMode casting) {
    switch (casting) {
        case CastingMode::kNo:
            return "none";
        case CastingMode::kEquiv:
            return "equiv";
        case CastingMode::kSafe:
            return "safe";
        case CastingMode::kMostlySafe:
            return "mostly-safe";
        case CastingMode::kSameKind:
            return "same-kind";
        case CastingMode::kUnsafe:
            return "unsafe";
        default:
            throw CastingError{"invalid casting mode: ", static_cast<std::underlying_type_t<CastingMode>>(casting)};
    }
}

CastingMode GetCastingMode(const std::string& name) {
    // We define an ad-hoc POD struct to comply with the coding guideline.
    struct Pair {
        const char* name;
        CastingMode casting;
    };

    static const Pair kMapping[] = {
            {"none", CastingMode::kNo},
            {"equiv", CastingMode::kEquiv},
            {"safe", CastingMode::kSafe},
            {"mostly-safe", CastingMode::kMostlySafe},
            {"same-kind", CastingMode::kSameKind},
            {"unsafe", CastingMode::kUnsafe},
    };
    static_assert(std::is_pod<decltype(kMapping)>::value, "static variable must be POD to comply with the coding guideline");

    const char* cname = name.c_str();
    for (const Pair& pair : kMapping) {
        if (0 == std::strcmp(pair.name, cname)) {
            return pair.casting;
        }
    }
    throw CastingError{"unknown casting mode name: \"", name, '"'};
}

bool IsSafeCast(Dtype from, Dtype to) {
    if (from == to) {
        return true;
    }
    DtypeKind from_kind = GetKind(from);
    DtypeKind to_kind = GetKind(to);
    switch (from_kind) {
        case DtypeKind::kBool:
            return true;
        case DtypeKind::kInt:
            switch (to_kind) {
                case DtypeKind::kInt:
                    return GetItemSize(to) >= GetItemSize(from);
                case DtypeKind::kFloat:
                case DtypeKind::kComplex:
                    return IsSafeIntegerToFloatingPointCast(from, to);
                default:
                    return false;
            }
        case DtypeKind::kUInt:
            switch (to_kind) {
                case DtypeKind::kUInt:
                    return GetItemSize(to) >= GetItemSize(from);
                case DtypeKind::kInt:
                    // The sign bit needs one more byte.
                    return GetItemSize(to) > GetItemSize(from);
                case DtypeKind::kFloat:
                case DtypeKind::kComplex:
                    return IsSafeIntegerToFloatingPointCast(from, to);
                default:
                    return false;
            }
        case DtypeKind::kFloat:
            switch (to_kind) {
                case DtypeKind::kFloat:
                    return GetItemSize(to) >= GetItemSize(from);
                case DtypeKind::kComplex:
                    return GetItemSize(to) / 2 >= GetItemSize(from);
                default:
                    return false;
            }
        case DtypeKind::kComplex:
            return to_kind == DtypeKind::kComplex && GetItemSize(to) >= GetItemSize(from);
        default:
            NDFILL_NEVER_REACH();
    }
    return false;
}

bool IsMostlySafeCast(Dtype from, Dtype to) {
    if (IsSafeCast(from, to)) {
        return true;
    }
    DtypeKind from_kind = GetKind(from);
    DtypeKind to_kind = GetKind(to);
    // Downcasts within real or complex floating-point kinds, and real floating-point into any complex dtype.
    return (from_kind == DtypeKind::kFloat && IsFloatingPointKind(to_kind)) ||
           (from_kind == DtypeKind::kComplex && to_kind == DtypeKind::kComplex);
}

bool IsSameKindCast(Dtype from, Dtype to) {
    if (IsMostlySafeCast(from, to)) {
        return true;
    }
    DtypeKind from_kind = GetKind(from);
    DtypeKind to_kind = GetKind(to);
    if (from_kind == to_kind) {
        return true;
    }
    bool from_integral = from_kind == DtypeKind::kInt || from_kind == DtypeKind::kUInt;
    bool to_integral = to_kind == DtypeKind::kInt || to_kind == DtypeKind::kUInt;
    if (from_integral && to_integral) {
        return true;
    }
    return (from_integral || from_kind == DtypeKind::kBool) && IsFloatingPointKind(to_kind);
}

bool IsAllowedCast(Dtype from, Dtype to, CastingMode casting) {
    switch (casting) {
        case CastingMode::kNo:
        case CastingMode::kEquiv:
            return from == to;
        case CastingMode::kSafe:
            return IsSafeCast(from, to);
        case CastingMode::kMostlySafe:
            return IsMostlySafeCast(from, to);
        case CastingMode::kSameKind:
            return IsSameKindCast(from, to);
        case CastingMode::kUnsafe:
            return true;
        default:
            throw CastingError{"invalid casting mode: ", static_cast<std::underlying_type_t<CastingMode>>(casting)};
    }
}

Dtype GetMinDtype(Scalar value) {
    switch (value.kind()) {
        case DtypeKind::kBool:
            return Dtype::kBool;
        case DtypeKind::kInt: {
            auto v = static_cast<int64_t>(value);
            if (v < 0) {
                return MinSignedIntegerDtype(v);
            }
            return MinUnsignedIntegerDtype(static_cast<uint64_t>(v));
        }
        case DtypeKind::kUInt:
            return MinUnsignedIntegerDtype(static_cast<uint64_t>(value));
        case DtypeKind::kFloat:
            return IsExactInFloat32(static_cast<double>(value)) ? Dtype::kFloat32 : Dtype::kFloat64;
        case DtypeKind::kComplex:
            return IsExactInFloat32(value.real()) && IsExactInFloat32(value.imag()) ? Dtype::kComplex64 : Dtype::kComplex128;
        default:
            NDFILL_NEVER_REACH();
    }
    return Dtype::kFloat64;
}

absl::optional<Dtype> GetMinSignedIntegerDtype(Scalar value) {
    switch (value.kind()) {
        case DtypeKind::kInt:
            return MinSignedIntegerDtype(static_cast<int64_t>(value));
        case DtypeKind::kUInt: {
            auto v = static_cast<uint64_t>(value);
            if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return absl::nullopt;
            }
            return MinSignedIntegerDtype(static_cast<int64_t>(v));
        }
        default:
            return absl::nullopt;
    }
}

bool IsScalarCompatible(Scalar value, Dtype dtype, CastingMode casting) {
    Dtype from = GetMinDtype(value);
    if (GetKind(dtype) == DtypeKind::kInt) {
        if (absl::optional<Dtype> signed_dtype = GetMinSignedIntegerDtype(value)) {
            from = *signed_dtype;
        }
    }
    return IsAllowedCast(from, dtype, casting);
}

}  // namespace ndfill
