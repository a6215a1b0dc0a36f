#pragma once

#include <ostream>
#include <string>

namespace ndfill {

// Memory layout hint of an array.
//
// Addressing is fully determined by strides and offset; the order only affects the preferred traversal sequence.
enum class Order {
    kRowMajor = 1,  // C-style, last dimension varies fastest.
    kColumnMajor,  // Fortran-style, first dimension varies fastest.
};

// Gets the order of given name. Accepts "row-major", "column-major", and their NumPy aliases "C" and "F".
Order GetOrder(const std::string& name);

const char* GetOrderName(Order order);

std::ostream& operator<<(std::ostream& os, Order order);

}  // namespace ndfill
