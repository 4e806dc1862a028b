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

#include "loom/zspace/affine_map.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/Support/raw_ostream.h"
#include "loom/common/logging.h"
#include "loom/zspace/cellwise.h"
#include "loom/zspace/indexing.h"
#include "loom/zspace/point.h"
#include "loom/zspace/ztensor.h"

namespace loom {

AffineMap::AffineMap() : projection(ZTensor::zeros({0, 0})) {}

AffineMap::AffineMap(ZTensor projection, std::optional<Point> offset)
    : projection(std::move(projection)) {
  LOOM_CHECK_EQ(this->projection.getRank(), 2)
      << "affine projection must be a matrix, got "
      << this->projection.toString();
  int64_t outputRank = this->projection.getDimSize(0);
  this->offset = offset ? std::move(*offset) : Point::zeros(outputRank);
  LOOM_CHECK_EQ(this->offset.getRank(), outputRank)
      << "affine offset " << this->offset
      << " doesn't match projection rows";
}

AffineMap AffineMap::fromMatrix(llvm::ArrayRef<DimVector> rows,
                                std::optional<Point> offset) {
  return AffineMap(ZTensor::matrix(rows), std::move(offset));
}

AffineMap AffineMap::identity(int64_t rank) {
  ZTensor projection = ZTensor::zeros({rank, rank});
  for (int64_t i = 0; i < rank; ++i) {
    projection.set({i, i}, 1);
  }
  return AffineMap(std::move(projection));
}

Point AffineMap::apply(const Point& point) const {
  LOOM_CHECK_EQ(point.getRank(), getInputRank())
      << "affine map input " << point << " has the wrong rank";
  ZTensor result = matmul(projection, point.toTensor());
  cellwise::addInPlace(result, offset.toTensor());
  return Point::fromTensor(result);
}

AffineMap AffineMap::translate(const Point& offset) const {
  return AffineMap(projection, this->offset.add(offset));
}

AffineMap AffineMap::permuteInput(llvm::ArrayRef<int64_t> permutation) const {
  return AffineMap(projection.reorderDim(permutation, 1), offset);
}

AffineMap AffineMap::permuteOutput(llvm::ArrayRef<int64_t> permutation) const {
  return AffineMap(projection.reorderDim(permutation, 0),
                   offset.permute(permutation));
}

void AffineMap::print(llvm::raw_ostream& os) const {
  os << "affine(A=" << projection << ", b=" << offset << ")";
}

std::string AffineMap::toString() const {
  std::string result;
  llvm::raw_string_ostream os(result);
  print(os);
  return os.str();
}

}  // namespace loom
