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


#include "loom/graph/simple_cycles.h"

#include <algorithm>
#include <cstdint>
#include <vector>

#include "llvm/ADT/BitVector.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SetVector.h"
#include "llvm/ADT/SmallVector.h"
#include "loom/common/logging.h"

namespace loom {

namespace {

// Returns `graph` with sorted, deduplicated successor lists.
AdjacencyList normalize(const AdjacencyList& graph) {
  int64_t size = graph.size();
  AdjacencyList result(size);
  for (int64_t v = 0; v < size; ++v) {
    for (int64_t w : graph[v]) {
      LOOM_CHECK(w >= 0 && w < size)
          << "edge " << v << " -> " << w << " leaves a graph of " << size
          << " vertices";
      result[v].push_back(w);
    }
    llvm::sort(result[v]);
    result[v].erase(std::unique(result[v].begin(), result[v].end()),
                    result[v].end());
  }
  return result;
}

AdjacencyList reverseEdges(const AdjacencyList& graph) {
  AdjacencyList result(graph.size());
  for (int64_t v = 0, e = graph.size(); v < e; ++v) {
    for (int64_t w : graph[v]) {
      result[w].push_back(v);
    }
  }
  return result;
}

// Marks every vertex >= `root` reachable from `root` through vertices >= `root`.
llvm::BitVector reachableFrom(const AdjacencyList& graph, int64_t root) {
  llvm::BitVector seen(graph.size());
  llvm::SmallVector<int64_t> worklist = {root};
  seen.set(root);
  while (!worklist.empty()) {
    int64_t v = worklist.pop_back_val();
    for (int64_t w : graph[v]) {
      if (w >= root && !seen.test(w)) {
        seen.set(w);
        worklist.push_back(w);
      }
    }
  }
  return seen;
}

// The strongly connected component of `root` in the subgraph induced by the
// vertices >= `root`.
llvm::BitVector componentOf(const AdjacencyList& graph,
                            const AdjacencyList& reversed, int64_t root) {
  llvm::BitVector component = reachableFrom(graph, root);
  component &= reachableFrom(reversed, root);
  return component;
}

// The circuit search of Johnson's algorithm, rooted at the least vertex of one
// strongly connected component.
class CircuitSearch {
 public:
  CircuitSearch(const AdjacencyList& graph, const llvm::BitVector& component,
                int64_t start, std::vector<VertexCycle>& cycles)
      : graph(graph),
        component(component),
        start(start),
        cycles(cycles),
        blocked(graph.size()),
        blockedBy(graph.size()) {}

  void run() { circuit(start); }

 private:
  bool circuit(int64_t v) {
    bool found = false;
    stack.push_back(v);
    blocked.set(v);
    for (int64_t w : graph[v]) {
      if (!component.test(w)) {
        continue;
      }
      if (w == start) {
        cycles.push_back(stack);
        found = true;
      } else if (!blocked.test(w) && circuit(w)) {
        found = true;
      }
    }
    if (found) {
      unblock(v);
    } else {
      for (int64_t w : graph[v]) {
        if (component.test(w)) {
          blockedBy[w].insert(v);
        }
      }
    }
    stack.pop_back();
    return found;
  }

  void unblock(int64_t v) {
    blocked.reset(v);
    llvm::SmallVector<int64_t> pending(blockedBy[v].begin(),
                                       blockedBy[v].end());
    blockedBy[v].clear();
    for (int64_t w : pending) {
      if (blocked.test(w)) {
        unblock(w);
      }
    }
  }

  const AdjacencyList& graph;
  const llvm::BitVector& component;
  int64_t start;
  std::vector<VertexCycle>& cycles;

  llvm::BitVector blocked;
  std::vector<llvm::SmallSetVector<int64_t, 4>> blockedBy;
  VertexCycle stack;
};

}  // namespace

std::vector<VertexCycle> findSimpleCycles(const AdjacencyList& graph) {
  AdjacencyList normalized = normalize(graph);
  AdjacencyList reversed = reverseEdges(normalized);
  std::vector<VertexCycle> cycles;
  for (int64_t start = 0, e = normalized.size(); start < e; ++start) {
    llvm::BitVector component = componentOf(normalized, reversed, start);
    bool hasSelfLoop = llvm::is_contained(normalized[start], start);
    if (component.count() == 1 && !hasSelfLoop) {
      continue;
    }
    CircuitSearch(normalized, component, start, cycles).run();
  }
  return cycles;
}

}  // namespace loom
