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

#include "loom/zspace/range.h"

#include <cstdint>
#include <string>
#include <utility>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/Support/raw_ostream.h"
#include "loom/common/logging.h"
#include "loom/zspace/point.h"

namespace loom {

Range::Range(Point start, Point end)
    : start(std::move(start)), end(std::move(end)) {
  LOOM_CHECK_EQ(this->start.getRank(), this->end.getRank())
      << "range start and end have different ranks";
  LOOM_CHECK(this->end.ge(this->start))
      << "range end " << this->end << " is before start " << this->start;
}

Range Range::fromShape(const Point& shape) {
  return Range(Point::zeros(shape.getRank()), shape);
}

Range Range::fromStartShape(const Point& start, const Point& shape) {
  return Range(start, start.add(shape));
}

Range Range::boundingRange(llvm::ArrayRef<Range> ranges) {
  LOOM_CHECK(!ranges.empty()) << "no ranges to bound";
  Point start = ranges.front().getStart();
  Point end = ranges.front().getEnd();
  for (const Range& range : ranges.drop_front()) {
    LOOM_CHECK_EQ(range.getRank(), start.getRank())
        << "cannot bound ranges of different ranks";
    start = minimum(start, range.getStart());
    end = maximum(end, range.getEnd());
  }
  return Range(std::move(start), std::move(end));
}

bool Range::contains(const Point& point) const {
  LOOM_CHECK_EQ(point.getRank(), getRank()) << "point rank mismatch";
  return point.ge(start) && point.lt(end);
}

bool Range::contains(const Range& other) const {
  LOOM_CHECK_EQ(other.getRank(), getRank()) << "range rank mismatch";
  if (other.isEmpty()) {
    return other.start.ge(start) && other.start.le(end);
  }
  return contains(other.start) && contains(other.getInclusiveEnd());
}

Range Range::intersect(const Range& other) const {
  LOOM_CHECK_EQ(other.getRank(), getRank()) << "range rank mismatch";
  Point lo = maximum(start, other.start);
  Point hi = minimum(end, other.end);
  // Clamp disjoint axes to zero extent.
  return Range(lo, maximum(lo, hi));
}

bool Range::overlaps(const Range& other) const {
  return !intersect(other).isEmpty();
}

Range Range::translate(const Point& offset) const {
  return Range(start.add(offset), end.add(offset));
}

void Range::print(llvm::raw_ostream& os) const {
  os << "zr[";
  for (int64_t i = 0; i < getRank(); ++i) {
    if (i > 0) {
      os << ", ";
    }
    os << start[i] << ":" << end[i];
  }
  os << "]";
}

std::string Range::toString() const {
  std::string result;
  llvm::raw_string_ostream os(result);
  print(os);
  return os.str();
}

}  // namespace loom
