#include "ndfill/element_cast.h"

#include <cmath>
#include <complex>
#include <cstdint>
#include <limits>

#include <gtest/gtest.h>

#include "ndfill/error.h"

namespace ndfill {
namespace {

TEST(ElementCastTest, Identity) {
    EXPECT_EQ(true, ElementCast<bool>(true));
    EXPECT_EQ(int8_t{-128}, ElementCast<int8_t>(int8_t{-128}));
    EXPECT_EQ(uint64_t{18446744073709551615ULL}, ElementCast<uint64_t>(uint64_t{18446744073709551615ULL}));
    EXPECT_EQ(0.1, ElementCast<double>(0.1));
    EXPECT_EQ((std::complex<float>{1.5f, -2.f}), ElementCast<std::complex<float>>(std::complex<float>{1.5f, -2.f}));
}

TEST(ElementCastTest, IntegerToFloatingPoint) {
    EXPECT_EQ(3.f, ElementCast<float>(int64_t{3}));
    EXPECT_EQ(-7., ElementCast<double>(int16_t{-7}));
    EXPECT_EQ(1., ElementCast<double>(true));
}

TEST(ElementCastTest, FloatingPointToInteger) {
    EXPECT_EQ(int32_t{3}, ElementCast<int32_t>(3.0));
    EXPECT_EQ(int32_t{-2}, ElementCast<int32_t>(-2.9));
    EXPECT_EQ(uint8_t{0}, ElementCast<uint8_t>(-0.5));
    EXPECT_EQ(uint8_t{255}, ElementCast<uint8_t>(255.9f));
    EXPECT_EQ(int8_t{-128}, ElementCast<int8_t>(-128.0));
    EXPECT_EQ(std::numeric_limits<int64_t>::min(), ElementCast<int64_t>(-9223372036854775808.0));
}

TEST(ElementCastTest, FloatingPointToIntegerOutOfRange) {
    EXPECT_THROW(ElementCast<uint8_t>(256.0), UnsupportedCastKindError);
    EXPECT_THROW(ElementCast<uint8_t>(-1.0), UnsupportedCastKindError);
    EXPECT_THROW(ElementCast<int8_t>(128.0), UnsupportedCastKindError);
    EXPECT_THROW(ElementCast<int64_t>(9223372036854775808.0), UnsupportedCastKindError);
    EXPECT_THROW(ElementCast<int32_t>(std::numeric_limits<double>::quiet_NaN()), UnsupportedCastKindError);
    EXPECT_THROW(ElementCast<int32_t>(std::numeric_limits<float>::infinity()), UnsupportedCastKindError);
}

TEST(ElementCastTest, FloatingPointToBool) {
    EXPECT_EQ(false, ElementCast<bool>(0.0));
    EXPECT_EQ(true, ElementCast<bool>(-0.25f));
}

TEST(ElementCastTest, FloatingPointNarrowing) {
    EXPECT_EQ(0.1f, ElementCast<float>(0.1));
    EXPECT_EQ(std::numeric_limits<float>::infinity(), ElementCast<float>(1e300));
    EXPECT_EQ(-std::numeric_limits<float>::infinity(), ElementCast<float>(-1e300));
    EXPECT_EQ(std::numeric_limits<float>::infinity(), ElementCast<float>(std::numeric_limits<double>::infinity()));
}

TEST(ElementCastTest, FloatingPointNarrowingNearFloatMax) {
    const float max = std::numeric_limits<float>::max();
    // Midpoint between the largest float and 2^128; ties round to even, i.e. to infinity.
    const double midpoint = std::ldexp(2.0 - std::ldexp(1.0, -24), 127);

    EXPECT_EQ(max, ElementCast<float>(3.4028235e38));
    EXPECT_EQ(-max, ElementCast<float>(-3.4028235e38));
    EXPECT_EQ(max, ElementCast<float>(std::nextafter(midpoint, 0.0)));
    EXPECT_EQ(-max, ElementCast<float>(-std::nextafter(midpoint, 0.0)));
    EXPECT_EQ(std::numeric_limits<float>::infinity(), ElementCast<float>(midpoint));
    EXPECT_EQ(-std::numeric_limits<float>::infinity(), ElementCast<float>(-midpoint));
    EXPECT_TRUE(std::isnan(ElementCast<float>(std::numeric_limits<double>::quiet_NaN())));
}

TEST(ElementCastTest, RealToComplex) {
    EXPECT_EQ((std::complex<double>{2.5, 0.0}), ElementCast<std::complex<double>>(2.5));
    EXPECT_EQ((std::complex<float>{-4.f, 0.f}), ElementCast<std::complex<float>>(int64_t{-4}));
    EXPECT_EQ((std::complex<float>{1.f, 0.f}), ElementCast<std::complex<float>>(true));
}

TEST(ElementCastTest, ComplexToComplex) {
    EXPECT_EQ((std::complex<float>{0.5f, -1.f}), ElementCast<std::complex<float>>(std::complex<double>{0.5, -1.0}));
    EXPECT_EQ((std::complex<double>{0.5, 3.0}), ElementCast<std::complex<double>>(std::complex<float>{0.5f, 3.f}));
}

TEST(ElementCastTest, ComplexToReal) {
    EXPECT_THROW(ElementCast<double>(std::complex<double>{1.0, 0.0}), UnsupportedCastKindError);
    EXPECT_THROW(ElementCast<int32_t>(std::complex<float>{1.f, 2.f}), UnsupportedCastKindError);
    EXPECT_THROW(ElementCast<bool>(std::complex<double>{}), UnsupportedCastKindError);
}

TEST(ElementCastTest, Constness) {
    const double value = 1.25;
    EXPECT_EQ(1.25f, ElementCast<const float>(value));
}

}  // namespace
}  // namespace ndfill
