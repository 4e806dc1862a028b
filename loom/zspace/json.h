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

// JSON codecs for the integer vector space types, in the `toJSON`/`fromJSON`
// form expected by `llvm::json`.
//
//   Point:       [1, 2]
//   ZTensor:     nested arrays, or a bare integer for a scalar
//   Range:       {"start": [0, 0], "end": [2, 3]}
//   AffineMap:   {"A": [[1, 0], [0, 1]], "b": [0, 0]}        ("b" optional)
//   IPF:         {"affineMap": {...}, "shape": [1, 3]}       ("shape" optional)
//
// Decoding never dies on malformed input: errors are reported on the
// `llvm::json::Path`.

#ifndef LOOM_ZSPACE_JSON_H_
#define LOOM_ZSPACE_JSON_H_

#include <optional>
#include <utility>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"
#include "loom/zspace/affine_map.h"
#include "loom/zspace/index_projection.h"
#include "loom/zspace/point.h"
#include "loom/zspace/range.h"
#include "loom/zspace/ztensor.h"

namespace loom {

llvm::json::Value toJSON(const Point& point);
bool fromJSON(const llvm::json::Value& value, Point& point,
              llvm::json::Path path);

llvm::json::Value toJSON(const ZTensor& tensor);
bool fromJSON(const llvm::json::Value& value, ZTensor& tensor,
              llvm::json::Path path);

llvm::json::Value toJSON(const Range& range);
bool fromJSON(const llvm::json::Value& value, Range& range,
              llvm::json::Path path);

llvm::json::Value toJSON(const AffineMap& map);
bool fromJSON(const llvm::json::Value& value, AffineMap& map,
              llvm::json::Path path);

llvm::json::Value toJSON(const IndexProjectionFunction& ipf);
bool fromJSON(const llvm::json::Value& value, IndexProjectionFunction& ipf,
              llvm::json::Path path);

// Decodes the field `key` of the object `value` into `out`. A missing or null
// field leaves `out` empty.
template <typename T>
bool mapOptionalField(const llvm::json::Value& value, llvm::StringLiteral key,
                      std::optional<T>& out, llvm::json::Path path) {
  using ::llvm::json::fromJSON;
  out = std::nullopt;
  const llvm::json::Object* object = value.getAsObject();
  if (!object) {
    path.report("expected object");
    return false;
  }
  const llvm::json::Value* field = object->get(key);
  if (!field || field->getAsNull()) {
    return true;
  }
  T parsed;
  if (!fromJSON(*field, parsed, path.field(key))) {
    return false;
  }
  out = std::move(parsed);
  return true;
}

}  // namespace loom

#endif  // LOOM_ZSPACE_JSON_H_
