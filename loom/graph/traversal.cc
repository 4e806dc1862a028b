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


#include "loom/graph/traversal.h"

#include <cstdint>
#include <vector>

#include "llvm/ADT/DenseMap.h"
#include "llvm/ADT/DenseSet.h"
#include "llvm/ADT/SmallVector.h"
#include "loom/common/logging.h"
#include "loom/graph/graph.h"
#include "loom/graph/node.h"
#include "loom/graph/simple_cycles.h"

namespace loom {

namespace {

void collectReferencedTensors(const Graph& graph, const SelectionMap& slots,
                              llvm::DenseSet<const Node*>& inGraph) {
  for (const auto& [name, selections] : slots) {
    for (const TensorSelection& selection : selections) {
      if (const Node* tensor = graph.lookupNode(selection.tensorId)) {
        inGraph.insert(tensor);
      }
    }
  }
}

}  // namespace

OperationLinkGraph buildOperationLinkGraph(const Graph& graph) {
  llvm::DenseSet<const Node*> inGraph;
  llvm::SmallVector<const Node*> signatures =
      graph.getNodes(NodeKind::kOperationSignature);
  for (const Node* node : signatures) {
    const auto& signature = node->getBodyAs<OperationSignatureBody>();
    inGraph.insert(node);
    collectReferencedTensors(graph, signature.inputs, inGraph);
    collectReferencedTensors(graph, signature.outputs, inGraph);
  }

  OperationLinkGraph result;
  llvm::DenseMap<const Node*, int64_t> vertexIds;
  for (const Node* node : graph.getNodes()) {
    if (inGraph.count(node)) {
      vertexIds[node] = result.vertices.size();
      result.vertices.push_back(node);
    }
  }
  result.edges.resize(result.vertices.size());

  for (const Node* node : signatures) {
    const auto& signature = node->getBodyAs<OperationSignatureBody>();
    int64_t signatureId = vertexIds.lookup(node);
    for (const auto& [name, selections] : signature.inputs) {
      for (const TensorSelection& selection : selections) {
        if (const Node* tensor = graph.lookupNode(selection.tensorId)) {
          result.edges[vertexIds.lookup(tensor)].push_back(signatureId);
        }
      }
    }
    for (const auto& [name, selections] : signature.outputs) {
      for (const TensorSelection& selection : selections) {
        if (const Node* tensor = graph.lookupNode(selection.tensorId)) {
          result.edges[signatureId].push_back(vertexIds.lookup(tensor));
        }
      }
    }
  }
  return result;
}

std::vector<llvm::SmallVector<const Node*>> findOperationSimpleCycles(
    const Graph& graph) {
  OperationLinkGraph linkGraph = buildOperationLinkGraph(graph);
  std::vector<llvm::SmallVector<const Node*>> cycles;
  for (const VertexCycle& cycle : findSimpleCycles(linkGraph.edges)) {
    if (cycle.size() <= 1) {
      continue;
    }
    llvm::SmallVector<const Node*>& nodes = cycles.emplace_back();
    for (int64_t vertex : cycle) {
      nodes.push_back(linkGraph.vertices[vertex]);
    }
  }
  LOOM_VLOG(1) << "found " << cycles.size() << " operation cycles among "
               << linkGraph.vertices.size() << " nodes";
  return cycles;
}

}  // namespace loom
