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

#ifndef LOOM_ZSPACE_RANGE_H_
#define LOOM_ZSPACE_RANGE_H_

#include <cstdint>
#include <string>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/Support/raw_ostream.h"
#include "loom/zspace/point.h"

namespace loom {

// An axis-aligned, half-open box `[start, end)` of integer coordinates.
//
// The size of a range is the product of its shape, so a range with a zero
// extent along any axis is empty, while the rank-0 range has size 1.
class Range {
 public:
  // The rank-0 range.
  Range() = default;

  // Dies if `start` and `end` have different ranks or if `end < start` along
  // any axis.
  Range(Point start, Point end);

  static Range fromShape(const Point& shape);
  static Range fromStartShape(const Point& start, const Point& shape);

  // Returns the smallest range containing all of `ranges`.
  //
  // Dies if `ranges` is empty or the ranks differ.
  static Range boundingRange(llvm::ArrayRef<Range> ranges);

  const Point& getStart() const { return start; }
  const Point& getEnd() const { return end; }
  int64_t getRank() const { return start.getRank(); }
  Point getShape() const { return end.sub(start); }
  int64_t getSize() const { return getShape().product(); }
  bool isEmpty() const { return getSize() == 0; }

  // The last point inside the range, `end - 1`.
  Point getInclusiveEnd() const { return end.sub(1); }

  bool contains(const Point& point) const;

  // A non-empty range is contained if both its corners are. An empty range is
  // contained if its start lies within `[start, end]`.
  bool contains(const Range& other) const;

  // Returns the intersection of both ranges, which may be empty. An empty
  // intersection is anchored at the clamped start.
  Range intersect(const Range& other) const;

  // True if the ranges share at least one point.
  bool overlaps(const Range& other) const;

  Range translate(const Point& offset) const;

  bool operator==(const Range& other) const {
    return start == other.start && end == other.end;
  }
  bool operator!=(const Range& other) const { return !(*this == other); }

  // Prints the range as `zr[0:2, 0:3]`.
  void print(llvm::raw_ostream& os) const;
  std::string toString() const;

 private:
  Point start;
  Point end;
};

inline llvm::raw_ostream& operator<<(llvm::raw_ostream& os,
                                     const Range& range) {
  range.print(os);
  return os;
}

}  // namespace loom

#endif  // LOOM_ZSPACE_RANGE_H_
