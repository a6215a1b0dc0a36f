#include "ndfill/order.h"

#include <ostream>
#include <string>

#include "ndfill/error.h"

namespace ndfill {

Order GetOrder(const std::string& name) {
    if (name == "row-major" || name == "C") {
        return Order::kRowMajor;
    }
    if (name == "column-major" || name == "F") {
        return Order::kColumnMajor;
    }
    throw OrderError{"unknown order name: \"", name, '"'};
}

const char* GetOrderName(Order order) {
    switch (order) {
        case Order::kRowMajor:
            return "row-major";
        case Order::kColumnMajor:
            return "column-major";
        default:
            throw OrderError{"invalid order: ", static_cast<int>(order)};
    }
}

std::ostream& operator<<(std::ostream& os, Order order) { return os << GetOrderName(order); }

}  // namespace ndfill
