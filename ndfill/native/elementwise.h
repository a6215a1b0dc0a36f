#pragma once

#include <cstdint>
#include <tuple>
#include <utility>

#include "ndfill/array_descriptor.h"
#include "ndfill/constant.h"
#include "ndfill/index_iterator.h"
#include "ndfill/indexable_array.h"
#include "ndfill/indexer.h"
#include "ndfill/shape.h"

namespace ndfill {
namespace native {
namespace elementwise_detail {

template <int8_t Ndim, typename Op, typename... Ts>
void ElementwiseKernel(Op op, const Indexer<Ndim>& indexer, const IndexableArray<Ts, Ndim>&... args) {
    for (auto it = indexer.It(); it; ++it) {
        op(it.raw_index(), args[it]...);
    }
}

template <int8_t Ndim, typename Op, typename... Ts, typename... Arrays>
void LaunchElementwiseKernel(Op&& op, const Shape& shape, const Arrays&... args) {
    ElementwiseKernel<Ndim, Op, Ts...>(std::forward<Op>(op), Indexer<Ndim>{shape}, IndexableArray<Ts, Ndim>{args}...);
}

}  // namespace elementwise_detail

// Invokes op(i, args[index]...) for every multi-index of the common shape of the arrays. All arrays must have the same shape.
//
// Indices are visited in row-major order of the given views; i counts the visited elements. Callers choose the traversal by passing
// permuted or squashed views.
template <typename... Ts, typename... Arrays, typename Op>
void Elementwise(Op&& op, const Arrays&... args) {
    static_assert(sizeof...(Ts) == sizeof...(Arrays), "Data types must be specified per ArrayDescriptor.");

    const Shape& shape = std::get<0>(std::tie(args...)).shape();

    switch (shape.ndim()) {
        case 1:
            elementwise_detail::LaunchElementwiseKernel<1, Op, Ts...>(std::forward<Op>(op), shape, args...);
            break;
        case 2:
            elementwise_detail::LaunchElementwiseKernel<2, Op, Ts...>(std::forward<Op>(op), shape, args...);
            break;
        case 3:
            elementwise_detail::LaunchElementwiseKernel<3, Op, Ts...>(std::forward<Op>(op), shape, args...);
            break;
        case 4:
            elementwise_detail::LaunchElementwiseKernel<4, Op, Ts...>(std::forward<Op>(op), shape, args...);
            break;
        default:
            elementwise_detail::LaunchElementwiseKernel<kDynamicNdim, Op, Ts...>(std::forward<Op>(op), shape, args...);
            break;
    }
}

}  // namespace native
}  // namespace ndfill
