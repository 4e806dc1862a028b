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


#ifndef LOOM_VALIDATION_VALIDATION_UTILS_H_
#define LOOM_VALIDATION_VALIDATION_UTILS_H_

#include <cstdint>
#include <string>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "loom/graph/graph.h"
#include "loom/graph/node.h"
#include "loom/validation/validation_issue.h"
#include "loom/zspace/range.h"

namespace loom {

// Returns the node `nodeId` names if it is of `kind`.
//
// Otherwise reports a NodeReferenceError, located at `jsonPath` and followed by
// `contexts`, and returns nullptr.
const Node* validateNodeReference(
    const Graph& graph, llvm::StringRef nodeId, NodeKind kind,
    llvm::StringRef jsonPath, ValidationIssueCollector& collector,
    llvm::ArrayRef<ValidationContext> contexts = {});

// A context locating `node` in the document, with the node as its data.
ValidationContext nodeContext(const Node& node, llvm::StringRef name);

// The JSON path of selection `index` of `slot` in the `mapName` map of the
// body of `node`, e.g. "$.nodes[@.id=='op'].body.inputs.x[0]".
std::string selectionJsonPath(const Node& node, llvm::StringRef mapName,
                              llvm::StringRef slot, int64_t index);

// Whether `outer` contains `inner`. Ranges of different ranks never contain
// one another.
bool rangeContains(const Range& outer, const Range& inner);

}  // namespace loom

#endif  // LOOM_VALIDATION_VALIDATION_UTILS_H_
