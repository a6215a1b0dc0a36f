#include "ndfill/dtype.h"

#include <ostream>
#include <string>
#include <type_traits>
#include <vector>

namespace ndfill {

std::ostream& operator<<(std::ostream& os, Dtype dtype) { return os << GetDtypeName(dtype); }

// Accepts both full names such as "float32" and single-character codes such as "f".
Dtype GetDtype(const std::string& name) {
    for (Dtype dtype : GetAllDtypes()) {
        if (name == GetDtypeName(dtype) || (name.size() == 1 && name[0] == GetCharCode(dtype))) {
            return dtype;
        }
    }
    throw DtypeError{"unknown dtype name: \"", name, '"'};
}

std::vector<Dtype> GetAllDtypes() {
    using Underlying = std::underlying_type_t<Dtype>;
    std::vector<Dtype> dtypes;
    for (Underlying value = static_cast<Underlying>(Dtype::kBool); value <= static_cast<Underlying>(Dtype::kComplex128); ++value) {
        dtypes.emplace_back(static_cast<Dtype>(value));
    }
    return dtypes;
}

void CheckEqual(Dtype lhs, Dtype rhs) {
    if (lhs != rhs) {
        throw DtypeError{"dtype mismatched: ", lhs, " != ", rhs};
    }
}

}  // namespace ndfill
