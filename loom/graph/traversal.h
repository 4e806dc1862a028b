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


#ifndef LOOM_GRAPH_TRAVERSAL_H_
#define LOOM_GRAPH_TRAVERSAL_H_

#include <vector>

#include "llvm/ADT/SmallVector.h"
#include "loom/graph/graph.h"
#include "loom/graph/node.h"
#include "loom/graph/simple_cycles.h"

namespace loom {

// The data flow between operation signatures and tensors: an edge from every
// input tensor to the signature that reads it, and from every signature to the
// tensors it writes. Vertices are numbered in graph insertion order.
struct OperationLinkGraph {
  llvm::SmallVector<const Node*> vertices;
  AdjacencyList edges;
};

// Builds the link graph of `graph`. Selections naming a missing node are
// skipped.
OperationLinkGraph buildOperationLinkGraph(const Graph& graph);

// Returns every simple cycle of tensors and operation signatures in `graph`,
// each as the nodes along the cycle. Self-loops are not reported.
std::vector<llvm::SmallVector<const Node*>> findOperationSimpleCycles(
    const Graph& graph);

}  // namespace loom

#endif  // LOOM_GRAPH_TRAVERSAL_H_
