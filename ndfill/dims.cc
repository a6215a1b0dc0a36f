#include "ndfill/dims.h"

#include <ostream>

namespace ndfill {
namespace internal {

void PrintDims(std::ostream& os, const Dims& dims) {
    os << '(';
    const char* separator = "";
    for (int64_t dim : dims) {
        os << separator << dim;
        separator = ", ";
    }
    if (dims.size() == 1) {
        os << ',';
    }
    os << ')';
}

}  // namespace internal
}  // namespace ndfill
