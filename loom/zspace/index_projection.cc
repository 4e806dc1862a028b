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
#include <optional>
#include <string>
#include <utility>

#include "llvm/Support/raw_ostream.h"
#include "loom/common/logging.h"
#include "loom/zspace/affine_map.h"
#include "loom/zspace/indexing.h"
#include "loom/zspace/point.h"
#include "loom/zspace/range.h"

namespace loom {

IndexProjectionFunction::IndexProjectionFunction(
    AffineMap affineMap, std::optional<Point> outputShape)
    : affineMap(std::move(affineMap)) {
  int64_t outputRank = this->affineMap.getOutputRank();
  this->outputShape =
      outputShape ? std::move(*outputShape) : Point::ones(outputRank);
  LOOM_CHECK_EQ(this->outputShape.getRank(), outputRank)
      << "projection shape " << this->outputShape
      << " doesn't match affine map output rank";
  LOOM_CHECK(this->outputShape.ge(Point::zeros(outputRank)))
      << "projection shape " << this->outputShape << " is negative";
}

Range IndexProjectionFunction::apply(const Point& point) const {
  return Range::fromStartShape(affineMap.apply(point), outputShape);
}

Range IndexProjectionFunction::apply(const Range& range) const {
  LOOM_CHECK_EQ(range.getRank(), getInputRank())
      << "projected range " << range << " has the wrong rank";
  if (range.isEmpty()) {
    return Range::fromStartShape(affineMap.apply(range.getStart()),
                                 Point::zeros(getOutputRank()));
  }
  const Point& start = range.getStart();
  Point inclusiveEnd = range.getInclusiveEnd();
  const Point& offset = affineMap.getOffset();

  DimVector lo;
  DimVector hi;
  for (int64_t row = 0; row < getOutputRank(); ++row) {
    int64_t rowLo = offset[row];
    int64_t rowHi = offset[row];
    for (int64_t col = 0; col < getInputRank(); ++col) {
      int64_t coefficient = affineMap.getCoefficient(row, col);
      if (coefficient >= 0) {
        rowLo += coefficient * start[col];
        rowHi += coefficient * inclusiveEnd[col];
      } else {
        rowLo += coefficient * inclusiveEnd[col];
        rowHi += coefficient * start[col];
      }
    }
    lo.push_back(rowLo);
    hi.push_back(rowHi);
  }
  return Range(Point(lo), Point(hi).add(outputShape));
}

IndexProjectionFunction IndexProjectionFunction::translate(
    const Point& offset) const {
  return IndexProjectionFunction(affineMap.translate(offset), outputShape);
}

void IndexProjectionFunction::print(llvm::raw_ostream& os) const {
  os << "ipf(" << affineMap << ", shape=" << outputShape << ")";
}

std::string IndexProjectionFunction::toString() const {
  std::string result;
  llvm::raw_string_ostream os(result);
  print(os);
  return os.str();
}

}  // namespace loom
