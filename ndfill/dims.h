#pragma once

#include <cstdint>
#include <initializer_list>
#include <ostream>
#include <sstream>
#include <string>

#include <absl/container/inlined_vector.h>

#include "ndfill/constant.h"
#include "ndfill/error.h"

namespace ndfill {

using Dims = absl::InlinedVector<int64_t, kInlineNdim>;

namespace internal {

// Writes the values as a Python tuple, e.g. "()", "(3,)" or "(2, 3)".
void PrintDims(std::ostream& os, const Dims& dims);

}  // namespace internal

// Per-dimension list of integers with bounds-checked subscripts.
//
// Derived must provide a static GetName() naming it in error messages.
template <typename Derived>
class DimsBase : public Dims {
public:
    DimsBase() = default;

    template <typename InputIt>
    DimsBase(InputIt first, InputIt last) : Dims(first, last) {}

    DimsBase(std::initializer_list<int64_t> dims) : Dims(dims) {}

    int64_t ndim() const noexcept { return static_cast<int64_t>(size()); }

    const int64_t& operator[](int64_t index) const {
        CheckIndex(index);
        return Dims::operator[](static_cast<size_t>(index));
    }

    int64_t& operator[](int64_t index) {
        CheckIndex(index);
        return Dims::operator[](static_cast<size_t>(index));
    }

    std::string ToString() const {
        std::ostringstream os;
        internal::PrintDims(os, *this);
        return os.str();
    }

private:
    void CheckIndex(int64_t index) const {
        if (index < 0 || index >= ndim()) {
            throw IndexError{Derived::GetName(), " index ", index, " out of bounds for ", ndim(), " dimensions."};
        }
    }
};

template <typename Derived>
std::ostream& operator<<(std::ostream& os, const DimsBase<Derived>& dims) {
    internal::PrintDims(os, dims);
    return os;
}

}  // namespace ndfill
