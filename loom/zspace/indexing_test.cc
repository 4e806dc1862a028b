/* Copyright 2025 The Loom Authors.

Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at

    http://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.
==============================================================================*/

#include "loom/zspace/indexing.h"

#include <cstdint>
#include <limits>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace loom {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

TEST(IntPowTest, SmallValues) {
  EXPECT_EQ(intPow(2, 0), 1);
  EXPECT_EQ(intPow(2, 1), 2);
  EXPECT_EQ(intPow(2, 10), 1024);
  EXPECT_EQ(intPow(-3, 3), -27);
  EXPECT_EQ(intPow(0, 0), 1);
  EXPECT_EQ(intPow(0, 5), 0);
}

TEST(IntPowTest, ProductOfPowersIsPowerOfSum) {
  for (int64_t base : {-3, -1, 2, 5, 7}) {
    for (int64_t i = 0; i < 6; ++i) {
      for (int64_t j = 0; j < 6; ++j) {
        EXPECT_EQ(intPow(base, i) * intPow(base, j), intPow(base, i + j))
            << "base=" << base << " i=" << i << " j=" << j;
      }
    }
  }
}

TEST(IntPowTest, LargestPowers) {
  EXPECT_EQ(intPow(2, 62), int64_t{1} << 62);
  EXPECT_EQ(intPow(-2, 63), std::numeric_limits<int64_t>::min());
  EXPECT_EQ(intPow(-1, 1001), -1);
}

TEST(IntPowDeathTest, NegativeExponent) {
  EXPECT_DEATH(intPow(2, -1), "non-negative exponent");
}

TEST(IntPowDeathTest, Overflow) {
  EXPECT_DEATH(intPow(2, 63), "overflows int64_t");
  EXPECT_DEATH(intPow(10, 40), "overflows int64_t");
}

TEST(IntLogTest, InvertsIntPow) {
  for (int64_t base : {2, 3, 10, 17}) {
    for (int64_t k = 0; k < 12; ++k) {
      EXPECT_EQ(intLog(intPow(base, k), base), k)
          << "base=" << base << " k=" << k;
    }
  }
}

TEST(IntLogTest, RoundsDown) {
  EXPECT_EQ(intLog(1, 2), 0);
  EXPECT_EQ(intLog(7, 2), 2);
  EXPECT_EQ(intLog(8, 2), 3);
  EXPECT_EQ(intLog(99, 10), 1);
  EXPECT_EQ(intLog(INT64_MAX, 2), 62);
}

TEST(IntLogDeathTest, InvalidArguments) {
  EXPECT_DEATH(intLog(8, 1), "base greater than 1");
  EXPECT_DEATH(intLog(0, 2), "positive value");
  EXPECT_DEATH(intLog(-4, 2), "positive value");
}

TEST(ResolveIndexTest, NegativeIndices) {
  EXPECT_EQ(resolveIndex(0, 3), 0);
  EXPECT_EQ(resolveIndex(2, 3), 2);
  EXPECT_EQ(resolveIndex(-1, 3), 2);
  EXPECT_EQ(resolveIndex(-3, 3), 0);
  EXPECT_EQ(resolveDim(-2, 4), 2);
}

TEST(ResolveIndexDeathTest, OutOfRange) {
  EXPECT_DEATH(resolveIndex(3, 3), "out of range");
  EXPECT_DEATH(resolveIndex(-4, 3), "out of range");
}

TEST(ResolvePermutationTest, ResolvesNegativeEntries) {
  EXPECT_THAT(resolvePermutation({2, 0, 1}, 3), ElementsAre(2, 0, 1));
  EXPECT_THAT(resolvePermutation({-1, 0, -2}, 3), ElementsAre(2, 0, 1));
  EXPECT_THAT(resolvePermutation({}, 0), IsEmpty());
}

TEST(ResolvePermutationDeathTest, InvalidPermutations) {
  EXPECT_DEATH(resolvePermutation({0, 1}, 3), "wrong length");
  EXPECT_DEATH(resolvePermutation({0, 0, 2}, 3), "duplicate permutation");
  EXPECT_DEATH(resolvePermutation({0, 1, 3}, 3), "out of range");
}

TEST(ApplyPermutationTest, ReordersValues) {
  EXPECT_THAT(applyPermutation({10, 20, 30}, {2, 0, 1}),
              ElementsAre(30, 10, 20));
  EXPECT_THAT(applyPermutation({10, 20}, {-1, 0}), ElementsAre(20, 10));
}

TEST(CommonBroadcastShapeTest, RightAligned) {
  EXPECT_THAT(commonBroadcastShape({{2, 3}, {3}}), ElementsAre(2, 3));
  EXPECT_THAT(commonBroadcastShape({{2, 1}, {1, 3}}), ElementsAre(2, 3));
  EXPECT_THAT(commonBroadcastShape({{}, {4, 5}}), ElementsAre(4, 5));
  EXPECT_THAT(commonBroadcastShape({{5, 1, 2}, {3, 1}, {1}}),
              ElementsAre(5, 3, 2));
  EXPECT_THAT(commonBroadcastShape({{}, {}}), IsEmpty());
}

TEST(CommonBroadcastShapeTest, Compatibility) {
  EXPECT_TRUE(areBroadcastCompatible({{2, 3}, {1, 3}}));
  EXPECT_FALSE(areBroadcastCompatible({{2, 3}, {2}}));
}

TEST(CommonBroadcastShapeDeathTest, IncompatibleAxes) {
  EXPECT_DEATH(commonBroadcastShape({{2, 3}, {4, 3}}),
               "cannot broadcast shapes");
}

TEST(ShapeTest, SizeAndStrides) {
  EXPECT_EQ(shapeToSize({}), 1);
  EXPECT_EQ(shapeToSize({2, 3, 4}), 24);
  EXPECT_EQ(shapeToSize({2, 0}), 0);
  EXPECT_THAT(shapeToStrides({2, 3, 4}), ElementsAre(12, 4, 1));
  EXPECT_THAT(shapeToStrides({}), IsEmpty());
}

}  // namespace
}  // namespace loom
