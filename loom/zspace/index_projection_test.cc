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

#include "loom/zspace/index_projection.h"

#include <cstdint>
#include <vector>

#include "loom/zspace/affine_map.h"
#include "loom/zspace/point.h"
#include "loom/zspace/range.h"
#include <gtest/gtest.h>

namespace loom {
namespace {

// Bounding range of the projections of every point of `range`, by brute
// force.
Range bruteForceProjection(const IndexProjectionFunction& ipf,
                           const Range& range) {
  std::vector<Range> projections;
  Point shape = range.getShape();
  for (int64_t i = 0; i < shape[0]; ++i) {
    for (int64_t j = 0; j < shape[1]; ++j) {
      projections.push_back(ipf.apply(range.getStart().add(Point{i, j})));
    }
  }
  return Range::boundingRange(projections);
}

TEST(IndexProjectionFunctionTest, DefaultShapeIsOnes) {
  IndexProjectionFunction ipf(AffineMap::identity(2));
  EXPECT_EQ(ipf.getOutputShape(), Point::ones(2));
  EXPECT_EQ(ipf.apply(Point{3, 4}),
            Range::fromStartShape(Point{3, 4}, Point{1, 1}));
}

TEST(IndexProjectionFunctionTest, ApplyPoint) {
  // A batch-major matmul style projection: index [i, k] selects row i and a
  // whole row of 5 columns.
  IndexProjectionFunction ipf(AffineMap::fromMatrix({{1, 0}, {0, 0}}),
                              Point{1, 5});
  EXPECT_EQ(ipf.apply(Point{2, 7}),
            Range(Point{2, 0}, Point{3, 5}));
}

TEST(IndexProjectionFunctionTest, ApplyRange) {
  IndexProjectionFunction ipf(AffineMap::fromMatrix({{1, 0}, {0, 0}}),
                              Point{1, 5});
  Range index(Point{0, 0}, Point{4, 3});
  EXPECT_EQ(ipf.apply(index), Range(Point{0, 0}, Point{4, 5}));
}

TEST(IndexProjectionFunctionTest, ApplyEmptyRange) {
  IndexProjectionFunction ipf(AffineMap::identity(2), Point{2, 2});
  Range empty(Point{3, 1}, Point{3, 4});
  EXPECT_EQ(ipf.apply(empty), Range(Point{3, 1}, Point{3, 1}));
}

TEST(IndexProjectionFunctionTest, ReversedAxisGivesTrueBoundingRange) {
  IndexProjectionFunction ipf(
      AffineMap::fromMatrix({{-1, 0}, {1, 1}}, Point{10, 0}), Point{1, 2});
  Range index(Point{0, 0}, Point{3, 2});
  Range expected = bruteForceProjection(ipf, index);
  EXPECT_EQ(ipf.apply(index), expected);
  EXPECT_EQ(expected, Range(Point{8, 0}, Point{11, 5}));
}

TEST(IndexProjectionFunctionTest, MixedSignsMatchBruteForce) {
  IndexProjectionFunction ipf(
      AffineMap::fromMatrix({{2, -3}, {-1, 4}}, Point{1, -2}), Point{2, 1});
  for (const Range& index :
       {Range(Point{0, 0}, Point{1, 1}), Range(Point{-2, 1}, Point{3, 4}),
        Range(Point{5, -5}, Point{7, 0})}) {
    EXPECT_EQ(ipf.apply(index), bruteForceProjection(ipf, index))
        << index.toString();
  }
}

TEST(IndexProjectionFunctionTest, Translate) {
  IndexProjectionFunction ipf(AffineMap::identity(2), Point{1, 3});
  IndexProjectionFunction translated = ipf.translate(Point{5, 6});
  EXPECT_EQ(translated.getOutputShape(), ipf.getOutputShape());
  EXPECT_EQ(translated.apply(Point{1, 1}),
            ipf.apply(Point{1, 1}).translate(Point{5, 6}));
}

TEST(IndexProjectionFunctionDeathTest, ShapeRankMismatch) {
  EXPECT_DEATH(IndexProjectionFunction(AffineMap::identity(2), Point{1}),
               "doesn't match affine map output rank");
}

TEST(IndexProjectionFunctionDeathTest, NegativeShape) {
  EXPECT_DEATH(IndexProjectionFunction(AffineMap::identity(1), Point{-5}),
               "is negative");
}

}  // namespace
}  // namespace loom
