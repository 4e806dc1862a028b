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

#include "loom/zspace/cellwise.h"

#include <cstdint>

#include "loom/zspace/ztensor.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace loom {
namespace cellwise {
namespace {

using ::testing::ElementsAre;

TEST(CellwiseTest, UnaryOps) {
  ZTensor tensor = ZTensor::vector({-2, 0, 3});
  EXPECT_EQ(neg(tensor), ZTensor::vector({2, 0, -3}));
  EXPECT_EQ(abs(tensor), ZTensor::vector({2, 0, 3}));
  EXPECT_EQ(mapCells(tensor, [](int64_t x) { return x * x; }),
            ZTensor::vector({4, 0, 9}));
}

TEST(CellwiseTest, BroadcastsRowAgainstMatrix) {
  ZTensor matrix = ZTensor::matrix({{1, 2, 3}, {4, 5, 6}});
  ZTensor row = ZTensor::vector({10, 20, 30});
  EXPECT_EQ(add(matrix, row), ZTensor::matrix({{11, 22, 33}, {14, 25, 36}}));
  EXPECT_EQ(sub(row, matrix), ZTensor::matrix({{9, 18, 27}, {6, 15, 24}}));
}

TEST(CellwiseTest, BroadcastsColumnAgainstRow) {
  ZTensor column = ZTensor::matrix({{1}, {2}});
  ZTensor row = ZTensor::vector({10, 20, 30});
  ZTensor result = mul(column, row);
  EXPECT_THAT(result.getShape(), ElementsAre(2, 3));
  EXPECT_THAT(result.getData(), ElementsAre(10, 20, 30, 20, 40, 60));
}

TEST(CellwiseTest, ScalarOverloads) {
  ZTensor tensor = ZTensor::vector({7, -7, 8});
  EXPECT_EQ(add(tensor, 1), ZTensor::vector({8, -6, 9}));
  EXPECT_EQ(sub(tensor, 1), ZTensor::vector({6, -8, 7}));
  EXPECT_EQ(mul(tensor, 2), ZTensor::vector({14, -14, 16}));
  EXPECT_EQ(div(tensor, 2), ZTensor::vector({3, -3, 4}));
  EXPECT_EQ(mod(tensor, 2), ZTensor::vector({1, -1, 0}));
  EXPECT_EQ(pow(ZTensor::vector({2, 3}), 3), ZTensor::vector({8, 27}));
  EXPECT_EQ(log(ZTensor::vector({8, 9, 1}), 2), ZTensor::vector({3, 3, 0}));
  EXPECT_EQ(minimum(tensor, 0), ZTensor::vector({0, -7, 0}));
  EXPECT_EQ(maximum(tensor, 0), ZTensor::vector({7, 0, 8}));
}

TEST(CellwiseTest, MinimumMaximum) {
  ZTensor lhs = ZTensor::vector({1, 5, 3});
  ZTensor rhs = ZTensor::vector({4, 2, 3});
  EXPECT_EQ(minimum(lhs, rhs), ZTensor::vector({1, 2, 3}));
  EXPECT_EQ(maximum(lhs, rhs), ZTensor::vector({4, 5, 3}));
}

TEST(CellwiseTest, InPlaceOps) {
  ZTensor tensor = ZTensor::matrix({{1, 2}, {3, 4}});
  addInPlace(tensor, ZTensor::vector({10, 20}));
  EXPECT_EQ(tensor, ZTensor::matrix({{11, 22}, {13, 24}}));
  subInPlace(tensor, 1);
  EXPECT_EQ(tensor, ZTensor::matrix({{10, 21}, {12, 23}}));
  mulInPlace(tensor, 2);
  divInPlace(tensor, ZTensor::matrix({{2}, {4}}));
  EXPECT_EQ(tensor, ZTensor::matrix({{10, 21}, {6, 11}}));
  modInPlace(tensor, 4);
  EXPECT_EQ(tensor, ZTensor::matrix({{2, 1}, {2, 3}}));
  powInPlace(tensor, 2);
  EXPECT_EQ(tensor, ZTensor::matrix({{4, 1}, {4, 9}}));
  logInPlace(tensor, 2);
  EXPECT_EQ(tensor, ZTensor::matrix({{2, 0}, {2, 3}}));
  maximumInPlace(tensor, 1);
  minimumInPlace(tensor, ZTensor::vector({5, 2}));
  EXPECT_EQ(tensor, ZTensor::matrix({{2, 1}, {2, 2}}));
  negInPlace(tensor);
  EXPECT_EQ(tensor, ZTensor::matrix({{-2, -1}, {-2, -2}}));
  absInPlace(tensor);
  EXPECT_EQ(tensor, ZTensor::matrix({{2, 1}, {2, 2}}));
}

TEST(CellwiseTest, AllCells) {
  ZTensor lhs = ZTensor::vector({1, 2, 3});
  EXPECT_TRUE(allCells(lhs, ZTensor::scalar(0),
                       [](int64_t a, int64_t b) { return a > b; }));
  EXPECT_FALSE(allCells(lhs, ZTensor::vector({1, 2, 4}),
                        [](int64_t a, int64_t b) { return a == b; }));
}

TEST(CellwiseDeathTest, Preconditions) {
  EXPECT_DEATH(add(ZTensor::vector({1, 2}), ZTensor::vector({1, 2, 3})),
               "cannot broadcast shapes");
  EXPECT_DEATH(div(ZTensor::vector({1, 2}), 0), "division by zero");
  EXPECT_DEATH(mod(ZTensor::vector({1, 2}), ZTensor::vector({1, 0})),
               "division by zero");
  EXPECT_DEATH(pow(ZTensor::vector({2}), -1), "non-negative exponent");

  ZTensor tensor = ZTensor::vector({1, 2});
  EXPECT_DEATH(addInPlace(tensor, ZTensor::matrix({{1, 2}, {3, 4}})),
               "change the shape");
}

}  // namespace
}  // namespace cellwise
}  // namespace loom
