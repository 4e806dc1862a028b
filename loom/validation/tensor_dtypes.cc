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


#include "loom/validation/tensor_dtypes.h"

#include <optional>
#include <string>
#include <utility>

#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/JSON.h"
#include "loom/graph/graph.h"
#include "loom/graph/node.h"
#include "loom/validation/environment.h"
#include "loom/validation/validation_issue.h"
#include "loom/validation/validation_utils.h"

namespace loom {

void TensorDTypesConstraint::checkRequirements(
    const ValidationEnvironment& env) const {
  env.assertNodeKindRegistered(NodeKind::kTensor, getName());
}

void TensorDTypesConstraint::validateConstraint(
    const ValidationEnvironment& env, const Graph& graph,
    ValidationIssueCollector& collector) const {
  for (const Node* node : graph.getNodes(NodeKind::kTensor)) {
    const auto& tensor = node->getBodyAs<TensorBody>();
    if (env.isValidDType(tensor.dtype)) {
      continue;
    }
    ValidationIssue issue(
        kNodeValidationError,
        llvm::formatv("Tensor has an invalid dtype \"{0}\"", tensor.dtype));
    issue.addParam("nodeId", node->getId())
        .addParam("dtype", tensor.dtype)
        .addParam("validDTypes", llvm::join(env.getValidDTypes(), ", "))
        .addContext({"DType", node->getJsonPath() + ".body.dtype",
                     std::nullopt, llvm::json::Value(tensor.dtype)})
        .addContext(nodeContext(*node, "Tensor Node"));
    collector.addIssue(std::move(issue));
  }
}

}  // namespace loom
