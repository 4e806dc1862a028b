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

#include "loom/graph/document.h"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"
#include "loom/common/logging.h"
#include "loom/graph/graph.h"
#include "loom/graph/node.h"
#include "loom/zspace/json.h"

namespace loom {

using ::llvm::json::Array;
using ::llvm::json::Object;
using ::llvm::json::ObjectMapper;
using ::llvm::json::Path;
using ::llvm::json::Value;

namespace {

template <typename T>
Value slotsToJSON(const std::map<std::string, std::vector<T>>& slots) {
  Object object;
  for (const auto& [name, values] : slots) {
    object[name] = values;
  }
  return object;
}

Value bodyToJSON(const TensorBody& body) {
  return Object{{"dtype", body.dtype}, {"range", body.range}};
}

Value bodyToJSON(const OperationSignatureBody& body) {
  Object object{{"kernel", body.kernel},
                {"inputs", slotsToJSON(body.inputs)},
                {"outputs", slotsToJSON(body.outputs)}};
  if (!body.params.empty()) {
    object["params"] = Object(body.params);
  }
  if (body.signatureId) {
    object["signatureId"] = *body.signatureId;
  }
  if (body.indexId) {
    object["indexId"] = *body.indexId;
  }
  return object;
}

Value bodyToJSON(const ApplicationBody& body) {
  Object object{{"operationId", body.operationId},
                {"inputs", slotsToJSON(body.inputs)},
                {"outputs", slotsToJSON(body.outputs)}};
  if (body.indexId) {
    object["indexId"] = *body.indexId;
  }
  return object;
}

Value bodyToJSON(const IndexBody& body) {
  return Object{{"range", body.range}};
}

Value bodyToJSON(const IPFSignatureBody& body) {
  return Object{{"inputs", slotsToJSON(body.inputs)},
                {"outputs", slotsToJSON(body.outputs)}};
}

Value bodyToJSON(const NoteBody& body) {
  return Object{{"message", body.message}};
}

bool decodeBody(const Value& value, TensorBody& body, Path path) {
  ObjectMapper mapper(value, path);
  return mapper && mapper.map("dtype", body.dtype) &&
         mapper.map("range", body.range);
}

bool decodeBody(const Value& value, OperationSignatureBody& body, Path path) {
  ObjectMapper mapper(value, path);
  if (!mapper || !mapper.map("kernel", body.kernel) ||
      !mapOptionalField(value, "signatureId", body.signatureId, path) ||
      !mapOptionalField(value, "indexId", body.indexId, path) ||
      !mapper.mapOptional("inputs", body.inputs) ||
      !mapper.mapOptional("outputs", body.outputs)) {
    return false;
  }
  if (const Value* params = value.getAsObject()->get("params")) {
    const Object* paramsObject = params->getAsObject();
    if (!paramsObject) {
      path.field("params").report("expected object");
      return false;
    }
    body.params = *paramsObject;
  }
  return true;
}

bool decodeBody(const Value& value, ApplicationBody& body, Path path) {
  ObjectMapper mapper(value, path);
  return mapper && mapper.map("operationId", body.operationId) &&
         mapOptionalField(value, "indexId", body.indexId, path) &&
         mapper.mapOptional("inputs", body.inputs) &&
         mapper.mapOptional("outputs", body.outputs);
}

bool decodeBody(const Value& value, IndexBody& body, Path path) {
  ObjectMapper mapper(value, path);
  return mapper && mapper.map("range", body.range);
}

bool decodeBody(const Value& value, IPFSignatureBody& body, Path path) {
  ObjectMapper mapper(value, path);
  return mapper && mapper.mapOptional("inputs", body.inputs) &&
         mapper.mapOptional("outputs", body.outputs);
}

bool decodeBody(const Value& value, NoteBody& body, Path path) {
  ObjectMapper mapper(value, path);
  return mapper && mapper.map("message", body.message);
}

template <typename BodyT>
bool decodeBodyAs(const Value& value, NodeBody& body, Path path) {
  BodyT typed;
  if (!decodeBody(value, typed, path)) {
    return false;
  }
  body = std::move(typed);
  return true;
}

bool decodeBodyOfKind(NodeKind kind, const Value& value, NodeBody& body,
                      Path path) {
  switch (kind) {
    case NodeKind::kTensor:
      return decodeBodyAs<TensorBody>(value, body, path);
    case NodeKind::kOperationSignature:
      return decodeBodyAs<OperationSignatureBody>(value, body, path);
    case NodeKind::kApplication:
      return decodeBodyAs<ApplicationBody>(value, body, path);
    case NodeKind::kIndex:
      return decodeBodyAs<IndexBody>(value, body, path);
    case NodeKind::kIPFSignature:
      return decodeBodyAs<IPFSignatureBody>(value, body, path);
    case NodeKind::kNote:
      return decodeBodyAs<NoteBody>(value, body, path);
  }
  llvm_unreachable("unknown NodeKind");
}

bool decodeNode(const Value& value, Graph& graph, Path path) {
  ObjectMapper mapper(value, path);
  std::string id;
  std::string type;
  std::optional<std::string> label;
  if (!mapper || !mapper.map("id", id) || !mapper.map("type", type) ||
      !mapOptionalField(value, "label", label, path)) {
    return false;
  }
  std::optional<NodeKind> kind = parseNodeKindTypeUri(type);
  if (!kind) {
    path.field("type").report("unknown node type");
    return false;
  }
  if (graph.hasNode(id)) {
    path.field("id").report("duplicate node id");
    return false;
  }
  const Value* bodyValue = value.getAsObject()->get("body");
  if (!bodyValue) {
    path.field("body").report("missing value");
    return false;
  }
  NodeBody body;
  if (!decodeBodyOfKind(*kind, *bodyValue, body, path.field("body"))) {
    return false;
  }
  graph.addNode(Node(std::move(id), std::move(body), std::move(label)));
  return true;
}

bool decodeGraph(const Value& value, Graph& graph, Path path) {
  ObjectMapper mapper(value, path);
  std::string id;
  if (!mapper || !mapper.mapOptional("id", id)) {
    return false;
  }
  graph = Graph(std::move(id));
  Path nodesPath = path.field("nodes");
  const Array* nodes = value.getAsObject()->getArray("nodes");
  if (!nodes) {
    nodesPath.report("expected array");
    return false;
  }
  for (size_t i = 0; i < nodes->size(); ++i) {
    if (!decodeNode((*nodes)[i], graph, nodesPath.index(i))) {
      return false;
    }
  }
  return true;
}

}  // namespace

Value toJSON(const TensorSelection& selection) {
  return Object{{"tensorId", selection.tensorId}, {"range", selection.range}};
}

bool fromJSON(const Value& value, TensorSelection& selection, Path path) {
  ObjectMapper mapper(value, path);
  return mapper && mapper.map("tensorId", selection.tensorId) &&
         mapper.map("range", selection.range);
}

Value toJSON(const Node& node) {
  Object object{{"id", node.getId()},
                {"type", getNodeKindTypeUri(node.getKind())}};
  if (node.getLabel()) {
    object["label"] = *node.getLabel();
  }
  object["body"] = std::visit(
      [](const auto& body) { return bodyToJSON(body); }, node.getBody());
  return object;
}

Value toJSON(const Graph& graph) {
  Array nodes;
  for (const Node* node : graph.getNodes()) {
    nodes.push_back(toJSON(*node));
  }
  return Object{{"id", graph.getId()}, {"nodes", std::move(nodes)}};
}

llvm::Expected<Graph> parseGraph(const Value& document) {
  Path::Root root("graph");
  Graph graph;
  if (!decodeGraph(document, graph, root)) {
    return root.getError();
  }
  LOOM_VLOG(1) << "parsed graph '" << graph.getId() << "' with "
               << graph.size() << " nodes";
  return std::move(graph);
}

llvm::Expected<Graph> parseGraphText(llvm::StringRef text) {
  llvm::Expected<Value> document = llvm::json::parse(text);
  if (!document) {
    return document.takeError();
  }
  return parseGraph(*document);
}

}  // namespace loom
