#pragma once

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>

namespace ndfill {
namespace error_detail {

inline void MakeMessageImpl(std::ostringstream& /*os*/) {}

// These two forward declarations are required to make the specializations visible from the generic version.
template <typename... Args>
void MakeMessageImpl(std::ostringstream& os, int8_t first, const Args&... args);

template <typename... Args>
void MakeMessageImpl(std::ostringstream& os, uint8_t first, const Args&... args);

template <typename Arg, typename... Args>
void MakeMessageImpl(std::ostringstream& os, const Arg& first, const Args&... args) {
    os << first;
    MakeMessageImpl(os, args...);
}

template <typename... Args>
void MakeMessageImpl(std::ostringstream& os, int8_t first, const Args&... args) {
    os << static_cast<int>(first);
    MakeMessageImpl(os, args...);
}

template <typename... Args>
void MakeMessageImpl(std::ostringstream& os, uint8_t first, const Args&... args) {
    os << static_cast<unsigned int>(first);
    MakeMessageImpl(os, args...);
}

template <typename... Args>
std::string MakeMessage(const Args&... args) {
    std::ostringstream os;
    os << std::boolalpha;
    MakeMessageImpl(os, args...);
    return os.str();
}

}  // namespace error_detail

// All the exceptions defined in ndfill must inherit this class.
class NdfillError : public std::runtime_error {
public:
    template <typename... Args>
    explicit NdfillError(const Args&... args) : runtime_error{error_detail::MakeMessage(args...)} {}
};

// Error on out of range indices, and on descriptors addressing memory outside of their buffers.
class IndexError : public NdfillError {
public:
    using NdfillError::NdfillError;
};

// Error on invalid shapes and strides.
class DimensionError : public NdfillError {
public:
    using NdfillError::NdfillError;
};

// Error on shape mismatch between the source and the destination of an assignment.
class ShapeMismatchError : public DimensionError {
public:
    using DimensionError::DimensionError;
};

// Error on invalid or mismatching dtypes.
class DtypeError : public NdfillError {
public:
    using NdfillError::NdfillError;
};

// Error on a scalar which cannot be cast to an array dtype under the requested casting rule.
class UnsafeCastError : public DtypeError {
public:
    using DtypeError::DtypeError;
};

// Error on a value which has no representation in the target dtype at all.
class UnsupportedCastKindError : public DtypeError {
public:
    using DtypeError::DtypeError;
};

// Error on unknown casting mode names.
class CastingError : public NdfillError {
public:
    using NdfillError::NdfillError;
};

// Error on unknown memory order names.
class OrderError : public NdfillError {
public:
    using NdfillError::NdfillError;
};

}  // namespace ndfill
