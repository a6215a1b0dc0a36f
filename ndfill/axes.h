#pragma once

#include <cstdint>

#include "ndfill/dims.h"

namespace ndfill {

class Axes : public DimsBase<Axes> {
public:
    using DimsBase::DimsBase;

    static const char* GetName() { return "Axes"; }
};

namespace internal {

// Returns true if axes is a permutation of [0, ndim).
bool IsAxesPermutation(const Axes& axes, int64_t ndim);

}  // namespace internal
}  // namespace ndfill
