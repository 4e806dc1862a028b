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


#include "loom/validation/validation_utils.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/JSON.h"
#include "loom/graph/document.h"
#include "loom/graph/graph.h"
#include "loom/graph/node.h"
#include "loom/validation/validation_issue.h"
#include "loom/zspace/range.h"

namespace loom {

const Node* validateNodeReference(const Graph& graph, llvm::StringRef nodeId,
                                  NodeKind kind, llvm::StringRef jsonPath,
                                  ValidationIssueCollector& collector,
                                  llvm::ArrayRef<ValidationContext> contexts) {
  ValidationContext reference{"Reference", jsonPath.str(), std::nullopt,
                              llvm::json::Value(nodeId)};
  const Node* node = graph.lookupNode(nodeId);
  if (!node) {
    ValidationIssue issue(kNodeReferenceError,
                          "Referenced node does not exist");
    issue.addParam("nodeId", nodeId)
        .addParam("nodeType", getNodeKindName(kind))
        .addContext(std::move(reference))
        .addContexts(contexts);
    collector.addIssue(std::move(issue));
    return nullptr;
  }
  if (node->getKind() != kind) {
    ValidationIssue issue(kNodeReferenceError,
                          "Referenced node has the wrong type");
    issue.addParam("nodeId", nodeId)
        .addParam("expectedType", getNodeKindName(kind))
        .addParam("actualType", getNodeKindName(node->getKind()))
        .addContext(std::move(reference))
        .addContexts(contexts);
    collector.addIssue(std::move(issue));
    return nullptr;
  }
  return node;
}

ValidationContext nodeContext(const Node& node, llvm::StringRef name) {
  return ValidationContext{name.str(), node.getJsonPath(), std::nullopt,
                           toJSON(node)};
}

std::string selectionJsonPath(const Node& node, llvm::StringRef mapName,
                              llvm::StringRef slot, int64_t index) {
  return llvm::formatv("{0}.body.{1}.{2}[{3}]", node.getJsonPath(), mapName,
                       slot, index)
      .str();
}

bool rangeContains(const Range& outer, const Range& inner) {
  return outer.getRank() == inner.getRank() && outer.contains(inner);
}

}  // namespace loom
