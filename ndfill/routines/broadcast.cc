#include "ndfill/routines/broadcast.h"

#include <cstdint>
#include <memory>
#include <utility>

#include "ndfill/array_descriptor.h"
#include "ndfill/dtype.h"
#include "ndfill/element_cast.h"
#include "ndfill/order.h"
#include "ndfill/scalar.h"
#include "ndfill/shape.h"
#include "ndfill/strides.h"

namespace ndfill {

ArrayDescriptor BroadcastScalar(Scalar value, Dtype dtype, const Shape& shape, Order order) {
    CheckValidShape(shape);

    Strides strides{};
    strides.resize(shape.size(), int64_t{0});

    return VisitDtype(dtype, [&](auto pt) {
        using T = typename decltype(pt)::type;
        std::shared_ptr<T> data = std::make_shared<T>(value.Visit([](auto v) { return ElementCast<T>(v); }));
        return ArrayDescriptor{dtype, std::move(data), 1, shape, strides, 0, order};
    });
}

}  // namespace ndfill
