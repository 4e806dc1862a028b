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

#ifndef LOOM_ZSPACE_AFFINE_MAP_H_
#define LOOM_ZSPACE_AFFINE_MAP_H_

#include <cstdint>
#include <optional>
#include <string>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/Support/raw_ostream.h"
#include "loom/zspace/indexing.h"
#include "loom/zspace/point.h"
#include "loom/zspace/ztensor.h"

namespace loom {

// An integer affine map `x -> A·x + b` from an `inputRank` space to an
// `outputRank` space, where `A` is an `outputRank x inputRank` matrix.
class AffineMap {
 public:
  // The map between two rank-0 spaces.
  AffineMap();

  // Dies if `projection` isn't a matrix or if `offset` doesn't have one entry
  // per row. A missing `offset` is all zeros.
  explicit AffineMap(ZTensor projection,
                     std::optional<Point> offset = std::nullopt);

  static AffineMap fromMatrix(llvm::ArrayRef<DimVector> rows,
                              std::optional<Point> offset = std::nullopt);

  static AffineMap identity(int64_t rank);

  const ZTensor& getProjection() const { return projection; }
  const Point& getOffset() const { return offset; }
  int64_t getInputRank() const { return projection.getDimSize(1); }
  int64_t getOutputRank() const { return projection.getDimSize(0); }

  // The coefficient `A[row, col]`.
  int64_t getCoefficient(int64_t row, int64_t col) const {
    return projection.get({row, col});
  }

  // Dies if `point` doesn't have rank `getInputRank()`.
  Point apply(const Point& point) const;

  // Returns the map `x -> A·x + (b + offset)`.
  AffineMap translate(const Point& offset) const;

  // Reorders the columns of `A`.
  AffineMap permuteInput(llvm::ArrayRef<int64_t> permutation) const;

  // Reorders the rows of `A` and the entries of `b`.
  AffineMap permuteOutput(llvm::ArrayRef<int64_t> permutation) const;

  bool operator==(const AffineMap& other) const {
    return projection == other.projection && offset == other.offset;
  }
  bool operator!=(const AffineMap& other) const { return !(*this == other); }

  // Prints the map as `affine(A=[[1, 0], [0, 1]], b=[0, 0])`.
  void print(llvm::raw_ostream& os) const;
  std::string toString() const;

 private:
  ZTensor projection;
  Point offset;
};

inline llvm::raw_ostream& operator<<(llvm::raw_ostream& os,
                                     const AffineMap& map) {
  map.print(os);
  return os;
}

}  // namespace loom

#endif  // LOOM_ZSPACE_AFFINE_MAP_H_
