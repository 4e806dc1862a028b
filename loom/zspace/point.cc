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

#include "loom/zspace/point.h"

#include <cstdint>
#include <string>

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/STLFunctionalExtras.h"
#include "llvm/Support/raw_ostream.h"
#include "loom/common/logging.h"
#include "loom/zspace/cellwise.h"
#include "loom/zspace/indexing.h"
#include "loom/zspace/ztensor.h"

namespace loom {

namespace {

void checkSameRank(const Point& lhs, const Point& rhs) {
  LOOM_CHECK_EQ(lhs.getRank(), rhs.getRank())
      << "point rank mismatch: " << lhs << " vs. " << rhs;
}

Point zip(const Point& lhs, const Point& rhs,
          ZTensor (*op)(const ZTensor&, const ZTensor&)) {
  checkSameRank(lhs, rhs);
  return Point::fromTensor(op(lhs.toTensor(), rhs.toTensor()));
}

Point zip(const Point& lhs, int64_t rhs,
          ZTensor (*op)(const ZTensor&, int64_t)) {
  return Point::fromTensor(op(lhs.toTensor(), rhs));
}

bool compare(const Point& lhs, const Point& rhs,
             llvm::function_ref<bool(int64_t, int64_t)> pred) {
  checkSameRank(lhs, rhs);
  return cellwise::allCells(lhs.toTensor(), rhs.toTensor(), pred);
}

}  // namespace

Point Point::zeros(int64_t rank) { return full(rank, 0); }

Point Point::ones(int64_t rank) { return full(rank, 1); }

Point Point::full(int64_t rank, int64_t value) {
  Point result;
  result.coords.assign(rank, value);
  return result;
}

Point Point::fromTensor(const ZTensor& tensor) {
  LOOM_CHECK_EQ(tensor.getRank(), 1) << "a point requires a rank-1 tensor";
  return Point(tensor.getData());
}

ZTensor Point::toTensor() const { return ZTensor::vector(coords); }

int64_t Point::get(int64_t dim) const {
  return coords[resolveDim(dim, getRank())];
}

Point Point::add(const Point& other) const {
  return zip(*this, other, cellwise::add);
}
Point Point::add(int64_t value) const {
  return zip(*this, value, cellwise::add);
}

Point Point::sub(const Point& other) const {
  return zip(*this, other, cellwise::sub);
}
Point Point::sub(int64_t value) const {
  return zip(*this, value, cellwise::sub);
}

Point Point::mul(const Point& other) const {
  return zip(*this, other, cellwise::mul);
}
Point Point::mul(int64_t value) const {
  return zip(*this, value, cellwise::mul);
}

Point Point::div(const Point& other) const {
  return zip(*this, other, cellwise::div);
}
Point Point::div(int64_t value) const {
  return zip(*this, value, cellwise::div);
}

Point Point::mod(const Point& other) const {
  return zip(*this, other, cellwise::mod);
}
Point Point::mod(int64_t value) const {
  return zip(*this, value, cellwise::mod);
}

Point Point::neg() const { return fromTensor(cellwise::neg(toTensor())); }

Point Point::abs() const { return fromTensor(cellwise::abs(toTensor())); }

Point Point::permute(llvm::ArrayRef<int64_t> permutation) const {
  return Point(applyPermutation(coords, permutation));
}

bool Point::eq(const Point& other) const {
  return compare(*this, other, [](int64_t a, int64_t b) { return a == b; });
}

bool Point::ne(const Point& other) const {
  return compare(*this, other, [](int64_t a, int64_t b) { return a != b; });
}

bool Point::lt(const Point& other) const {
  return compare(*this, other, [](int64_t a, int64_t b) { return a < b; });
}

bool Point::le(const Point& other) const {
  return compare(*this, other, [](int64_t a, int64_t b) { return a <= b; });
}

bool Point::gt(const Point& other) const {
  return compare(*this, other, [](int64_t a, int64_t b) { return a > b; });
}

bool Point::ge(const Point& other) const {
  return compare(*this, other, [](int64_t a, int64_t b) { return a >= b; });
}

void Point::print(llvm::raw_ostream& os) const {
  os << "[";
  llvm::interleaveComma(coords, os);
  os << "]";
}

std::string Point::toString() const {
  std::string result;
  llvm::raw_string_ostream os(result);
  print(os);
  return os.str();
}

Point minimum(const Point& lhs, const Point& rhs) {
  return zip(lhs, rhs, cellwise::minimum);
}

Point maximum(const Point& lhs, const Point& rhs) {
  return zip(lhs, rhs, cellwise::maximum);
}

}  // namespace loom
