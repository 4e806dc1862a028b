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


#ifndef LOOM_GRAPH_SIMPLE_CYCLES_H_
#define LOOM_GRAPH_SIMPLE_CYCLES_H_

#include <cstdint>
#include <vector>

#include "llvm/ADT/SmallVector.h"

namespace loom {

// A directed graph over the vertices [0, size()); entry `v` lists the
// successors of `v`. Parallel edges are allowed.
using AdjacencyList = std::vector<llvm::SmallVector<int64_t>>;

// A cycle as the sequence of vertices along its edges.
using VertexCycle = llvm::SmallVector<int64_t>;

// Enumerates every elementary circuit of `graph` using Johnson's algorithm.
//
// Each cycle starts at its least vertex, and cycles are ordered by that vertex.
// A self-loop is reported as a cycle of one vertex. Dies if an edge names a
// vertex outside the graph.
std::vector<VertexCycle> findSimpleCycles(const AdjacencyList& graph);

}  // namespace loom

#endif  // LOOM_GRAPH_SIMPLE_CYCLES_H_
