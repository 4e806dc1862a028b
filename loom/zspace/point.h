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

#ifndef LOOM_ZSPACE_POINT_H_
#define LOOM_ZSPACE_POINT_H_

#include <cstdint>
#include <initializer_list>
#include <string>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/Support/raw_ostream.h"
#include "loom/zspace/indexing.h"
#include "loom/zspace/ztensor.h"

namespace loom {

// An immutable integer coordinate of fixed rank.
//
// Equality (`==`) is exact. The named comparisons (`lt`, `le`, ...) form a
// partial order: they hold only if they hold for every coordinate. Comparing
// or combining points of different rank is a programming error.
class Point {
 public:
  // The rank-0 point.
  Point() = default;
  Point(std::initializer_list<int64_t> coords) : coords(coords) {}
  explicit Point(llvm::ArrayRef<int64_t> coords)
      : coords(coords.begin(), coords.end()) {}

  static Point zeros(int64_t rank);
  static Point ones(int64_t rank);
  static Point full(int64_t rank, int64_t value);

  // Creates a point from a rank-1 tensor. Dies on any other rank; the empty
  // point comes from a tensor of shape [0].
  static Point fromTensor(const ZTensor& tensor);
  ZTensor toTensor() const;

  int64_t getRank() const { return coords.size(); }
  llvm::ArrayRef<int64_t> getCoords() const { return coords; }

  int64_t operator[](int64_t dim) const { return coords[dim]; }

  // Like `operator[]`, but `dim` may be negative.
  int64_t get(int64_t dim) const;

  Point add(const Point& other) const;
  Point add(int64_t value) const;
  Point sub(const Point& other) const;
  Point sub(int64_t value) const;
  Point mul(const Point& other) const;
  Point mul(int64_t value) const;
  Point div(const Point& other) const;
  Point div(int64_t value) const;
  Point mod(const Point& other) const;
  Point mod(int64_t value) const;
  Point neg() const;
  Point abs() const;

  // Returns a copy with the coordinates reordered by `permutation`.
  Point permute(llvm::ArrayRef<int64_t> permutation) const;

  // Product of all coordinates (1 for the rank-0 point).
  int64_t product() const { return shapeToSize(coords); }

  bool eq(const Point& other) const;
  // True if every coordinate differs.
  bool ne(const Point& other) const;
  bool lt(const Point& other) const;
  bool le(const Point& other) const;
  bool gt(const Point& other) const;
  bool ge(const Point& other) const;

  bool operator==(const Point& other) const { return coords == other.coords; }
  bool operator!=(const Point& other) const { return coords != other.coords; }

  Point operator+(const Point& other) const { return add(other); }
  Point operator-(const Point& other) const { return sub(other); }

  // Prints the point as `[1, 2]`.
  void print(llvm::raw_ostream& os) const;
  std::string toString() const;

 private:
  DimVector coords;
};

// Componentwise minimum and maximum of two points of the same rank.
Point minimum(const Point& lhs, const Point& rhs);
Point maximum(const Point& lhs, const Point& rhs);

inline llvm::raw_ostream& operator<<(llvm::raw_ostream& os,
                                     const Point& point) {
  point.print(os);
  return os;
}

}  // namespace loom

#endif  // LOOM_ZSPACE_POINT_H_
