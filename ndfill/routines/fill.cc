#include "ndfill/routines/fill.h"

#include "ndfill/array_descriptor.h"
#include "ndfill/casting.h"
#include "ndfill/dtype.h"
#include "ndfill/error.h"
#include "ndfill/routines/assign.h"
#include "ndfill/routines/broadcast.h"
#include "ndfill/scalar.h"

namespace ndfill {

const ArrayDescriptor& Fill(const ArrayDescriptor& x, Scalar value) { return Fill(x, value, CastingMode::kMostlySafe); }

const ArrayDescriptor& Fill(const ArrayDescriptor& x, Scalar value, CastingMode casting) {
    if (x.GetTotalSize() == 0) {
        return x;
    }

    Dtype dtype = x.dtype();
    if (!IsScalarCompatible(value, dtype, casting)) {
        throw UnsafeCastError{"The value cannot be safely cast to the array data type under casting rule '", casting,
                              "'. Data type: ", dtype, ". Value: `", value, "`."};
    }

    ArrayDescriptor v = BroadcastScalar(value, dtype, x.shape(), x.order());
    Assign(v, x);
    return x;
}

}  // namespace ndfill
