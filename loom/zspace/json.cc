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

#include "loom/zspace/json.h"

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/JSON.h"
#include "loom/zspace/affine_map.h"
#include "loom/zspace/index_projection.h"
#include "loom/zspace/indexing.h"
#include "loom/zspace/point.h"
#include "loom/zspace/range.h"
#include "loom/zspace/ztensor.h"

namespace loom {

using ::llvm::json::Array;
using ::llvm::json::Object;
using ::llvm::json::ObjectMapper;
using ::llvm::json::Path;
using ::llvm::json::Value;

namespace {

Value tensorToJSON(const ZTensor& tensor, int64_t dim, int64_t& offset) {
  if (dim == tensor.getRank()) {
    return tensor.getData()[offset++];
  }
  Array values;
  for (int64_t i = 0; i < tensor.getDimSize(dim); ++i) {
    values.push_back(tensorToJSON(tensor, dim + 1, offset));
  }
  return values;
}

// Appends the cells of `value` to `data`, checking that it has the nested
// array structure of `shape` from `dim` on.
bool collectTensorCells(const Value& value, llvm::ArrayRef<int64_t> shape,
                        size_t dim, llvm::SmallVectorImpl<int64_t>& data,
                        Path path) {
  if (dim == shape.size()) {
    if (auto cell = value.getAsInteger()) {
      data.push_back(*cell);
      return true;
    }
    path.report("expected integer");
    return false;
  }
  const Array* array = value.getAsArray();
  if (!array) {
    path.report("expected array");
    return false;
  }
  if (static_cast<int64_t>(array->size()) != shape[dim]) {
    path.report("ragged tensor");
    return false;
  }
  for (size_t i = 0; i < array->size(); ++i) {
    if (!collectTensorCells((*array)[i], shape, dim + 1, data,
                            path.index(i))) {
      return false;
    }
  }
  return true;
}

}  // namespace

Value toJSON(const Point& point) {
  return Array(point.getCoords());
}

bool fromJSON(const Value& value, Point& point, Path path) {
  std::vector<int64_t> coords;
  if (!llvm::json::fromJSON(value, coords, path)) {
    return false;
  }
  point = Point(coords);
  return true;
}

Value toJSON(const ZTensor& tensor) {
  int64_t offset = 0;
  return tensorToJSON(tensor, 0, offset);
}

bool fromJSON(const Value& value, ZTensor& tensor, Path path) {
  DimVector shape;
  const Value* current = &value;
  while (const Array* array = current->getAsArray()) {
    shape.push_back(array->size());
    if (array->empty()) {
      break;
    }
    current = &array->front();
  }
  llvm::SmallVector<int64_t, 8> data;
  if (!collectTensorCells(value, shape, 0, data, path)) {
    return false;
  }
  tensor = ZTensor(shape, data);
  return true;
}

Value toJSON(const Range& range) {
  return Object{{"start", range.getStart()}, {"end", range.getEnd()}};
}

bool fromJSON(const Value& value, Range& range, Path path) {
  ObjectMapper mapper(value, path);
  Point start;
  Point end;
  if (!mapper || !mapper.map("start", start) || !mapper.map("end", end)) {
    return false;
  }
  if (start.getRank() != end.getRank()) {
    path.field("end").report("range start and end have different ranks");
    return false;
  }
  for (int64_t i = 0; i < start.getRank(); ++i) {
    if (end[i] < start[i]) {
      path.field("end").report("range end is before start");
      return false;
    }
  }
  range = Range(std::move(start), std::move(end));
  return true;
}

Value toJSON(const AffineMap& map) {
  return Object{{"A", map.getProjection()}, {"b", map.getOffset()}};
}

bool fromJSON(const Value& value, AffineMap& map, Path path) {
  ObjectMapper mapper(value, path);
  ZTensor projection;
  if (!mapper || !mapper.map("A", projection)) {
    return false;
  }
  // `[]` has no row to infer the column count from.
  if (projection.getRank() == 1 && projection.getSize() == 0) {
    projection = ZTensor::zeros({0, 0});
  }
  if (projection.getRank() != 2) {
    path.field("A").report("expected a matrix");
    return false;
  }
  std::optional<Point> offset;
  if (!mapOptionalField(value, "b", offset, path)) {
    return false;
  }
  if (offset && offset->getRank() != projection.getDimSize(0)) {
    path.field("b").report("offset length doesn't match the rows of A");
    return false;
  }
  map = AffineMap(std::move(projection), std::move(offset));
  return true;
}

Value toJSON(const IndexProjectionFunction& ipf) {
  return Object{{"affineMap", ipf.getAffineMap()},
                {"shape", ipf.getOutputShape()}};
}

bool fromJSON(const Value& value, IndexProjectionFunction& ipf, Path path) {
  ObjectMapper mapper(value, path);
  AffineMap map;
  if (!mapper || !mapper.map("affineMap", map)) {
    return false;
  }
  std::optional<Point> shape;
  if (!mapOptionalField(value, "shape", shape, path)) {
    return false;
  }
  if (shape && shape->getRank() != map.getOutputRank()) {
    path.field("shape").report(
        "shape length doesn't match the affine map output rank");
    return false;
  }
  if (shape && !shape->ge(Point::zeros(shape->getRank()))) {
    path.field("shape").report("shape has a negative dimension");
    return false;
  }
  ipf = IndexProjectionFunction(std::move(map), std::move(shape));
  return true;
}

}  // namespace loom
