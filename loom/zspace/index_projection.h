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

#ifndef LOOM_ZSPACE_INDEX_PROJECTION_H_
#define LOOM_ZSPACE_INDEX_PROJECTION_H_

#include <optional>
#include <string>

#include "llvm/Support/raw_ostream.h"
#include "loom/zspace/affine_map.h"
#include "loom/zspace/point.h"
#include "loom/zspace/range.h"

namespace loom {

// Projects coordinates of an operation's index space onto ranges of a tensor.
//
// A point `p` projects to the range of shape `outputShape` starting at
// `affineMap.apply(p)`.
class IndexProjectionFunction {
 public:
  IndexProjectionFunction() = default;

  // Dies if `outputShape` doesn't have the output rank of `affineMap`. A
  // missing `outputShape` is all ones.
  explicit IndexProjectionFunction(
      AffineMap affineMap, std::optional<Point> outputShape = std::nullopt);

  const AffineMap& getAffineMap() const { return affineMap; }
  const Point& getOutputShape() const { return outputShape; }
  int64_t getInputRank() const { return affineMap.getInputRank(); }
  int64_t getOutputRank() const { return affineMap.getOutputRank(); }

  Range apply(const Point& point) const;

  // Returns the bounding range of the projections of every point of `range`.
  //
  // Each output coordinate is an affine function of the input, so its extreme
  // values over the box are reached by taking, per input axis, the start or
  // the inclusive end depending on the sign of the coefficient. An empty
  // `range` projects to an empty range anchored at `affineMap.apply(start)`.
  Range apply(const Range& range) const;

  IndexProjectionFunction translate(const Point& offset) const;

  bool operator==(const IndexProjectionFunction& other) const {
    return affineMap == other.affineMap && outputShape == other.outputShape;
  }
  bool operator!=(const IndexProjectionFunction& other) const {
    return !(*this == other);
  }

  void print(llvm::raw_ostream& os) const;
  std::string toString() const;

 private:
  AffineMap affineMap;
  Point outputShape;
};

inline llvm::raw_ostream& operator<<(llvm::raw_ostream& os,
                                     const IndexProjectionFunction& ipf) {
  ipf.print(os);
  return os;
}

}  // namespace loom

#endif  // LOOM_ZSPACE_INDEX_PROJECTION_H_
