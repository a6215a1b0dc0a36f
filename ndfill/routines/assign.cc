#include "ndfill/routines/assign.h"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <numeric>
#include <tuple>
#include <utility>

#include "ndfill/array_descriptor.h"
#include "ndfill/axes.h"
#include "ndfill/dtype.h"
#include "ndfill/element_cast.h"
#include "ndfill/error.h"
#include "ndfill/macro.h"
#include "ndfill/native/elementwise.h"
#include "ndfill/order.h"
#include "ndfill/shape.h"
#include "ndfill/strides.h"

namespace ndfill {
namespace internal {

Axes GetTraversalAxes(const Strides& strides, Order order) {
    Axes axes{};
    axes.resize(strides.size());
    switch (order) {
        case Order::kRowMajor:
            std::iota(axes.begin(), axes.end(), int64_t{0});
            break;
        case Order::kColumnMajor:
            std::iota(axes.rbegin(), axes.rend(), int64_t{0});
            break;
        default:
            throw OrderError{"invalid order: ", static_cast<int>(order)};
    }
    std::stable_sort(axes.begin(), axes.end(), [&strides](int64_t a, int64_t b) {
        return std::abs(strides[a]) > std::abs(strides[b]);
    });
    return axes;
}

std::tuple<ArrayDescriptor, ArrayDescriptor> SquashDims(const ArrayDescriptor& src, const ArrayDescriptor& dst, const Axes& axes) {
    NDFILL_ASSERT(src.shape() == dst.shape());
    NDFILL_ASSERT(IsAxesPermutation(axes, src.ndim()));

    Shape shape{};
    Strides src_strides{};
    Strides dst_strides{};
    for (int64_t axis : axes) {
        int64_t dim = src.shape()[axis];
        if (dim == 1) {
            continue;
        }
        int64_t src_stride = src.strides()[axis];
        int64_t dst_stride = dst.strides()[axis];
        if (!shape.empty() && src_strides.back() == src_stride * dim && dst_strides.back() == dst_stride * dim) {
            shape.back() *= dim;
            src_strides.back() = src_stride;
            dst_strides.back() = dst_stride;
        } else {
            shape.emplace_back(dim);
            src_strides.emplace_back(src_stride);
            dst_strides.emplace_back(dst_stride);
        }
    }

    return std::tuple<ArrayDescriptor, ArrayDescriptor>{
            ArrayDescriptor{src.dtype(), src.data(), src.buffer_size(), shape, std::move(src_strides), src.offset(), src.order()},
            ArrayDescriptor{dst.dtype(), dst.data(), dst.buffer_size(), std::move(shape), std::move(dst_strides), dst.offset(), dst.order()}};
}

}  // namespace internal

void Assign(const ArrayDescriptor& src, const ArrayDescriptor& dst) {
    CheckEqual(src.shape(), dst.shape());
    if (GetKind(src.dtype()) == DtypeKind::kComplex && GetKind(dst.dtype()) != DtypeKind::kComplex) {
        throw UnsupportedCastKindError{"Cannot assign complex dtype ", src.dtype(), " to non-complex dtype ", dst.dtype(), "."};
    }
    if (dst.GetTotalSize() == 0) {
        return;
    }

    std::tuple<ArrayDescriptor, ArrayDescriptor> views = internal::SquashDims(src, dst, internal::GetTraversalAxes(dst.strides(), dst.order()));
    const ArrayDescriptor& src_view = std::get<0>(views);
    const ArrayDescriptor& dst_view = std::get<1>(views);

    auto do_assign = [&](auto in_pt, auto out_pt) {
        using InT = typename decltype(in_pt)::type;
        using OutT = typename decltype(out_pt)::type;
        struct Impl {
            void operator()(int64_t /*i*/, InT a, OutT& out) { out = ElementCast<OutT>(a); }
        };
        native::Elementwise<const InT, OutT>(Impl{}, src_view, dst_view);
    };
    VisitDtype(dst.dtype(), [&](auto out_pt) { VisitDtype(src.dtype(), do_assign, out_pt); });
}

}  // namespace ndfill
