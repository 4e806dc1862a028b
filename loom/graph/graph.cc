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

#include "loom/graph/graph.h"

#include <memory>
#include <string>
#include <utility>

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include "loom/common/logging.h"
#include "loom/graph/node.h"

namespace loom {

Graph::Graph(std::string id) : id(std::move(id)) {}

const Node& Graph::addNode(Node node) {
  LOOM_CHECK(!hasNode(node.getId()))
      << "duplicate node id: " << node.getId();
  nodes.push_back(std::make_unique<Node>(std::move(node)));
  const Node* added = nodes.back().get();
  nodesById[added->getId()] = added;
  return *added;
}

bool Graph::hasNode(llvm::StringRef nodeId) const {
  return nodesById.count(nodeId);
}

const Node* Graph::lookupNode(llvm::StringRef nodeId) const {
  return nodesById.lookup(nodeId);
}

const Node* Graph::lookupNode(llvm::StringRef nodeId, NodeKind kind) const {
  const Node* node = lookupNode(nodeId);
  return node && node->getKind() == kind ? node : nullptr;
}

llvm::SmallVector<const Node*> Graph::getNodes() const {
  llvm::SmallVector<const Node*> result;
  result.reserve(nodes.size());
  for (const std::unique_ptr<Node>& node : nodes) {
    result.push_back(node.get());
  }
  return result;
}

llvm::SmallVector<const Node*> Graph::getNodes(NodeKind kind) const {
  llvm::SmallVector<const Node*> result;
  for (const std::unique_ptr<Node>& node : nodes) {
    if (node->getKind() == kind) {
      result.push_back(node.get());
    }
  }
  return result;
}

llvm::SmallVector<const Node*> Graph::getApplications(
    llvm::StringRef operationId) const {
  llvm::SmallVector<const Node*> result;
  for (const std::unique_ptr<Node>& node : nodes) {
    if (const auto* application = node->getBodyIf<ApplicationBody>();
        application && application->operationId == operationId) {
      result.push_back(node.get());
    }
  }
  llvm::sort(result, [](const Node* lhs, const Node* rhs) {
    return lhs->getId() < rhs->getId();
  });
  return result;
}

}  // namespace loom
