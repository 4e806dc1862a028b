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

#ifndef LOOM_GRAPH_NODE_H_
#define LOOM_GRAPH_NODE_H_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"
#include "loom/common/logging.h"
#include "loom/zspace/index_projection.h"
#include "loom/zspace/point.h"
#include "loom/zspace/range.h"

namespace loom {

// Prefix of the type URI of every core node kind.
inline constexpr llvm::StringLiteral kLoomCoreNodeTypePrefix =
    "https://tensortapestry.org/schemas/loom/core.0.0.1.xsd#nodes/";

// The kinds of nodes a graph can hold. The order matches the alternatives of
// `NodeBody`.
enum class NodeKind {
  kTensor,
  kOperationSignature,
  kApplication,
  kIndex,
  kIPFSignature,
  kNote,
};

// Returns the short name of `kind`, e.g. "Tensor".
llvm::StringRef getNodeKindName(NodeKind kind);

// Returns the type URI of `kind`.
std::string getNodeKindTypeUri(NodeKind kind);

// Returns the kind with the given type URI, if any.
std::optional<NodeKind> parseNodeKindTypeUri(llvm::StringRef typeUri);

// A sub-range of a tensor.
struct TensorSelection {
  std::string tensorId;
  Range range;

  bool operator==(const TensorSelection& other) const {
    return tensorId == other.tensorId && range == other.range;
  }
  bool operator!=(const TensorSelection& other) const {
    return !(*this == other);
  }
};

// Slot name to the ordered selections bound to that slot.
using SelectionMap = std::map<std::string, std::vector<TensorSelection>>;

// Slot name to the ordered projections of that slot.
using IPFMap = std::map<std::string, std::vector<IndexProjectionFunction>>;

struct TensorBody {
  static constexpr NodeKind kKind = NodeKind::kTensor;

  std::string dtype;
  Range range;

  const Range& getRange() const { return range; }
  Point getShape() const { return range.getShape(); }
  int64_t getSize() const { return range.getSize(); }
};

// The whole-operation access pattern of a kernel invocation.
struct OperationSignatureBody {
  static constexpr NodeKind kKind = NodeKind::kOperationSignature;

  std::string kernel;
  llvm::json::Object params;
  // The IPF signature node describing how the index space projects onto the
  // selections.
  std::optional<std::string> signatureId;
  // The index node holding the index space of the operation.
  std::optional<std::string> indexId;
  SelectionMap inputs;
  SelectionMap outputs;
};

// One shard of an operation.
struct ApplicationBody {
  static constexpr NodeKind kKind = NodeKind::kApplication;

  std::string operationId;
  std::optional<std::string> indexId;
  SelectionMap inputs;
  SelectionMap outputs;
};

struct IndexBody {
  static constexpr NodeKind kKind = NodeKind::kIndex;

  Range range;

  const Range& getRange() const { return range; }
  Point getShape() const { return range.getShape(); }
  int64_t getSize() const { return range.getSize(); }
};

struct IPFSignatureBody {
  static constexpr NodeKind kKind = NodeKind::kIPFSignature;

  IPFMap inputs;
  IPFMap outputs;
};

struct NoteBody {
  static constexpr NodeKind kKind = NodeKind::kNote;

  std::string message;
};

using NodeBody = std::variant<TensorBody, OperationSignatureBody,
                              ApplicationBody, IndexBody, IPFSignatureBody,
                              NoteBody>;

// A node of a graph: a unique id, an optional label, and a kind specific body.
class Node {
 public:
  Node(std::string id, NodeBody body,
       std::optional<std::string> label = std::nullopt);

  llvm::StringRef getId() const { return id; }
  const std::optional<std::string>& getLabel() const { return label; }
  NodeKind getKind() const { return static_cast<NodeKind>(body.index()); }
  const NodeBody& getBody() const { return body; }

  // Returns the body if this node is of kind `BodyT::kKind`, nullptr otherwise.
  template <typename BodyT>
  const BodyT* getBodyIf() const {
    return std::get_if<BodyT>(&body);
  }

  // Returns the body, which must be of kind `BodyT::kKind`.
  template <typename BodyT>
  const BodyT& getBodyAs() const {
    const BodyT* typed = getBodyIf<BodyT>();
    LOOM_CHECK(typed) << "node " << id << " is a "
                      << getNodeKindName(getKind()) << ", not a "
                      << getNodeKindName(BodyT::kKind);
    return *typed;
  }

  // JSON path locating this node in a graph document.
  std::string getJsonPath() const;

 private:
  std::string id;
  std::optional<std::string> label;
  NodeBody body;
};

}  // namespace loom

#endif  // LOOM_GRAPH_NODE_H_
