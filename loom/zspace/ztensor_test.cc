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

#include "loom/zspace/ztensor.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace loom {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

TEST(ZTensorTest, DefaultIsScalarZero) {
  ZTensor tensor;
  EXPECT_TRUE(tensor.isScalar());
  EXPECT_EQ(tensor.getSize(), 1);
  EXPECT_EQ(tensor.item(), 0);
  EXPECT_EQ(tensor, ZTensor::scalar(0));
}

TEST(ZTensorTest, MatrixAccess) {
  ZTensor tensor = ZTensor::matrix({{1, 2, 3}, {4, 5, 6}});
  EXPECT_THAT(tensor.getShape(), ElementsAre(2, 3));
  EXPECT_EQ(tensor.getRank(), 2);
  EXPECT_EQ(tensor.getSize(), 6);
  EXPECT_EQ(tensor.getDimSize(-1), 3);
  EXPECT_EQ(tensor.get({1, 0}), 4);
  EXPECT_EQ(tensor.get({-1, -1}), 6);

  tensor.set({0, 1}, 20);
  EXPECT_THAT(tensor.getData(), ElementsAre(1, 20, 3, 4, 5, 6));
}

TEST(ZTensorTest, EmptyMatrix) {
  ZTensor tensor = ZTensor::matrix({});
  EXPECT_THAT(tensor.getShape(), ElementsAre(0, 0));
  EXPECT_THAT(tensor.getData(), IsEmpty());
  EXPECT_EQ(tensor.toString(), "[]");
}

TEST(ZTensorTest, Print) {
  EXPECT_EQ(ZTensor::scalar(7).toString(), "7");
  EXPECT_EQ(ZTensor::vector({1, 2}).toString(), "[1, 2]");
  EXPECT_EQ(ZTensor::matrix({{1, 0}, {0, 1}}).toString(), "[[1, 0], [0, 1]]");
  EXPECT_EQ(ZTensor::zeros({2, 0}).toString(), "[[], []]");
}

TEST(ZTensorTest, ReorderDim) {
  ZTensor tensor = ZTensor::matrix({{1, 2, 3}, {4, 5, 6}});
  EXPECT_EQ(tensor.reorderDim({1, 0}, 0),
            ZTensor::matrix({{4, 5, 6}, {1, 2, 3}}));
  EXPECT_EQ(tensor.reorderDim({2, 0, 1}, 1),
            ZTensor::matrix({{3, 1, 2}, {6, 4, 5}}));
}

TEST(ZTensorTest, Matmul) {
  ZTensor lhs = ZTensor::matrix({{1, 2}, {3, 4}, {5, 6}});
  EXPECT_EQ(matmul(lhs, ZTensor::vector({1, -1})),
            ZTensor::vector({-1, -1, -1}));
  EXPECT_EQ(matmul(lhs, ZTensor::matrix({{1, 0}, {0, 1}})), lhs);
}

TEST(ZTensorDeathTest, ShapeMismatch) {
  EXPECT_DEATH(ZTensor({2, 2}, {1, 2, 3}), "doesn't match its shape");
  EXPECT_DEATH(ZTensor::matrix({{1, 2}, {3}}), "different lengths");
  EXPECT_DEATH(ZTensor::scalar(3).get({0}), "index rank");
  EXPECT_DEATH(ZTensor::vector({1, 2}).item(), "single element");
}

}  // namespace
}  // namespace loom
