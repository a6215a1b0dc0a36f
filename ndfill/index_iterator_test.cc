#include "ndfill/index_iterator.h"

#include <array>
#include <cstdint>

#include <gtest/gtest.h>

namespace ndfill {
namespace {

TEST(IndexIteratorTest, Rank1) {
    const std::array<int64_t, 1> shape = {3};
    IndexIterator<1> it(shape.data(), 3);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(1, it.ndim());
        EXPECT_EQ(i, it.raw_index());
        EXPECT_EQ(i, it.index()[0]);
        EXPECT_TRUE(static_cast<bool>(it));
        ++it;
    }
    EXPECT_FALSE(static_cast<bool>(it));
}

TEST(IndexIteratorTest, Rank3) {
    const std::array<int64_t, 3> shape = {2, 3, 4};
    IndexIterator<3> it(shape.data(), 2 * 3 * 4);
    for (int i = 0; i < shape[0]; ++i) {
        for (int j = 0; j < shape[1]; ++j) {
            for (int k = 0; k < shape[2]; ++k) {
                EXPECT_EQ(3, it.ndim());
                EXPECT_EQ(i * shape[1] * shape[2] + j * shape[2] + k, it.raw_index());
                EXPECT_EQ(i, it.index()[0]);
                EXPECT_EQ(j, it.index()[1]);
                EXPECT_EQ(k, it.index()[2]);
                EXPECT_TRUE(static_cast<bool>(it));
                ++it;
            }
        }
    }
    EXPECT_FALSE(static_cast<bool>(it));
}

TEST(IndexIteratorTest, UnitDimensions) {
    const std::array<int64_t, 3> shape = {1, 2, 1};
    IndexIterator<3> it(shape.data(), 2);
    EXPECT_EQ(0, it.index()[1]);
    ++it;
    EXPECT_EQ(0, it.index()[0]);
    EXPECT_EQ(1, it.index()[1]);
    EXPECT_EQ(0, it.index()[2]);
    ++it;
    EXPECT_FALSE(static_cast<bool>(it));
}

TEST(IndexIteratorTest, Empty) {
    const std::array<int64_t, 2> shape = {2, 0};
    IndexIterator<2> it(shape.data(), 0);
    EXPECT_FALSE(static_cast<bool>(it));
}

TEST(DynamicIndexIteratorTest, Rank0) {
    IndexIterator<> it(nullptr, 0, 1);
    EXPECT_EQ(0, it.ndim());
    EXPECT_EQ(0, it.raw_index());
    EXPECT_TRUE(static_cast<bool>(it));
    ++it;
    EXPECT_FALSE(static_cast<bool>(it));
}

TEST(DynamicIndexIteratorTest, Rank3) {
    const std::array<int64_t, 3> shape = {2, 3, 4};
    IndexIterator<> it(shape.data(), 3, 2 * 3 * 4);
    for (int i = 0; i < shape[0]; ++i) {
        for (int j = 0; j < shape[1]; ++j) {
            for (int k = 0; k < shape[2]; ++k) {
                EXPECT_EQ(3, it.ndim());
                EXPECT_EQ(i * shape[1] * shape[2] + j * shape[2] + k, it.raw_index());
                EXPECT_EQ(i, it.index()[0]);
                EXPECT_EQ(j, it.index()[1]);
                EXPECT_EQ(k, it.index()[2]);
                ++it;
            }
        }
    }
    EXPECT_FALSE(static_cast<bool>(it));
}

}  // namespace
}  // namespace ndfill
