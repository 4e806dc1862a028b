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

#ifndef LOOM_GRAPH_GRAPH_H_
#define LOOM_GRAPH_GRAPH_H_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "loom/graph/node.h"

namespace loom {

// An append-only collection of uniquely identified nodes.
//
// Nodes keep a stable address for the lifetime of the graph, and iteration
// follows insertion order.
class Graph {
 public:
  explicit Graph(std::string id = "");

  Graph(Graph&&) = default;
  Graph& operator=(Graph&&) = default;

  llvm::StringRef getId() const { return id; }
  int64_t size() const { return nodes.size(); }

  // Adds `node` to the graph. Dies if a node with the same id exists.
  const Node& addNode(Node node);

  bool hasNode(llvm::StringRef nodeId) const;

  // Returns the node with the given id, or nullptr if there is none.
  const Node* lookupNode(llvm::StringRef nodeId) const;

  // Returns the node with the given id if it is of `kind`, nullptr otherwise.
  const Node* lookupNode(llvm::StringRef nodeId, NodeKind kind) const;

  // Returns the body of the node with the given id if it has type `BodyT`.
  template <typename BodyT>
  const BodyT* lookupBody(llvm::StringRef nodeId) const {
    const Node* node = lookupNode(nodeId);
    return node ? node->getBodyIf<BodyT>() : nullptr;
  }

  llvm::SmallVector<const Node*> getNodes() const;
  llvm::SmallVector<const Node*> getNodes(NodeKind kind) const;

  // Returns the Application nodes whose operation is `operationId`, ordered
  // by id.
  llvm::SmallVector<const Node*> getApplications(
      llvm::StringRef operationId) const;

 private:
  std::string id;
  std::vector<std::unique_ptr<Node>> nodes;
  llvm::StringMap<const Node*> nodesById;
};

}  // namespace loom

#endif  // LOOM_GRAPH_GRAPH_H_
