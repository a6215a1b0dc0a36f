#pragma once

#include <cstddef>
#include <cstdint>

namespace ndfill {

// Number of dimensions stored inline in Shape, Strides and Axes. Higher ranks spill to the heap.
constexpr size_t kInlineNdim = 8;

// Reserved dimension for dynamic-length arrays.
constexpr int8_t kDynamicNdim = -1;

}  // namespace ndfill
