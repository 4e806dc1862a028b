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

#include "loom/graph/node.h"

#include <optional>
#include <string>
#include <utility>

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/FormatVariadic.h"

namespace loom {

llvm::StringRef getNodeKindName(NodeKind kind) {
  switch (kind) {
    case NodeKind::kTensor:
      return "Tensor";
    case NodeKind::kOperationSignature:
      return "OperationSignature";
    case NodeKind::kApplication:
      return "Application";
    case NodeKind::kIndex:
      return "Index";
    case NodeKind::kIPFSignature:
      return "IPFSignature";
    case NodeKind::kNote:
      return "Note";
  }
  llvm_unreachable("unknown NodeKind");
}

std::string getNodeKindTypeUri(NodeKind kind) {
  return (kLoomCoreNodeTypePrefix + getNodeKindName(kind)).str();
}

std::optional<NodeKind> parseNodeKindTypeUri(llvm::StringRef typeUri) {
  if (!typeUri.consume_front(kLoomCoreNodeTypePrefix)) {
    return std::nullopt;
  }
  return llvm::StringSwitch<std::optional<NodeKind>>(typeUri)
      .Case("Tensor", NodeKind::kTensor)
      .Case("OperationSignature", NodeKind::kOperationSignature)
      .Case("Application", NodeKind::kApplication)
      .Case("Index", NodeKind::kIndex)
      .Case("IPFSignature", NodeKind::kIPFSignature)
      .Case("Note", NodeKind::kNote)
      .Default(std::nullopt);
}

Node::Node(std::string id, NodeBody body, std::optional<std::string> label)
    : id(std::move(id)), label(std::move(label)), body(std::move(body)) {}

std::string Node::getJsonPath() const {
  return llvm::formatv("$.nodes[@.id=='{0}']", id).str();
}

}  // namespace loom
