#include "ndfill/axes.h"

#include <cstdint>
#include <vector>

namespace ndfill {
namespace internal {

bool IsAxesPermutation(const Axes& axes, int64_t ndim) {
    if (axes.ndim() != ndim) {
        return false;
    }
    std::vector<bool> seen(static_cast<size_t>(ndim), false);
    for (int64_t axis : axes) {
        if (axis < 0 || axis >= ndim || seen[static_cast<size_t>(axis)]) {
            return false;
        }
        seen[static_cast<size_t>(axis)] = true;
    }
    return true;
}

}  // namespace internal
}  // namespace ndfill
