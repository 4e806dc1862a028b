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

#ifndef LOOM_GRAPH_DOCUMENT_H_
#define LOOM_GRAPH_DOCUMENT_H_

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"
#include "loom/graph/graph.h"
#include "loom/graph/node.h"

namespace loom {

// Graph documents have the form
//
//   {"id": "<graph id>",
//    "nodes": [{"id": "<node id>", "type": "<type uri>", "label": "...",
//               "body": {...}}, ...]}
//
// where the body layout depends on the node type.

llvm::json::Value toJSON(const TensorSelection& selection);
bool fromJSON(const llvm::json::Value& value, TensorSelection& selection,
              llvm::json::Path path);

llvm::json::Value toJSON(const Node& node);
llvm::json::Value toJSON(const Graph& graph);

// Decodes a graph document. Fails on malformed bodies, unknown node types and
// duplicate node ids; the error names the offending JSON path.
llvm::Expected<Graph> parseGraph(const llvm::json::Value& document);

// Parses `text` as JSON and decodes it as a graph document.
llvm::Expected<Graph> parseGraphText(llvm::StringRef text);

}  // namespace loom

#endif  // LOOM_GRAPH_DOCUMENT_H_
