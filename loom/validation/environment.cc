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


#include "loom/validation/environment.h"

#include <memory>
#include <string>
#include <utility>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "loom/common/logging.h"
#include "loom/graph/graph.h"
#include "loom/graph/node.h"
#include "loom/validation/constraint.h"
#include "loom/validation/ipf_signature_agreement.h"
#include "loom/validation/operation_reference_agreement.h"
#include "loom/validation/tensor_dtypes.h"
#include "loom/validation/validation_issue.h"

namespace loom {

ValidationEnvironment::ValidationEnvironment() {
  for (llvm::StringRef dtype : kDefaultValidDTypes) {
    validDTypes.insert(dtype.str());
  }
}

ValidationEnvironment ValidationEnvironment::createDefault() {
  ValidationEnvironment env;
  for (NodeKind kind :
       {NodeKind::kTensor, NodeKind::kOperationSignature,
        NodeKind::kApplication, NodeKind::kIndex, NodeKind::kIPFSignature,
        NodeKind::kNote}) {
    env.registerNodeKind(kind);
  }
  env.addConstraint(std::make_unique<TensorDTypesConstraint>());
  env.addConstraint(std::make_unique<OperationReferenceAgreementConstraint>());
  env.addConstraint(std::make_unique<IPFSignatureAgreementConstraint>());
  return env;
}

void ValidationEnvironment::registerNodeKind(NodeKind kind) {
  nodeKinds.insert(kind);
}

bool ValidationEnvironment::isNodeKindRegistered(NodeKind kind) const {
  return nodeKinds.count(kind);
}

void ValidationEnvironment::assertNodeKindRegistered(
    NodeKind kind, llvm::StringRef requiredBy) const {
  LOOM_CHECK(isNodeKindRegistered(kind))
      << requiredBy << " requires the unregistered node kind "
      << getNodeKindName(kind);
}

void ValidationEnvironment::addConstraint(
    std::unique_ptr<Constraint> constraint) {
  constraint->checkRequirements(*this);
  constraints.push_back(std::move(constraint));
}

const Constraint* ValidationEnvironment::lookupConstraint(
    llvm::StringRef name) const {
  for (const std::unique_ptr<Constraint>& constraint : constraints) {
    if (constraint->getName() == name) {
      return constraint.get();
    }
  }
  return nullptr;
}

void ValidationEnvironment::setValidDTypes(
    llvm::ArrayRef<std::string> dtypes) {
  validDTypes = std::set<std::string>(dtypes.begin(), dtypes.end());
}

bool ValidationEnvironment::isValidDType(llvm::StringRef dtype) const {
  return validDTypes.count(dtype.str());
}

void ValidationEnvironment::validate(
    const Graph& graph, ValidationIssueCollector& collector) const {
  for (const Node* node : graph.getNodes()) {
    LOOM_CHECK(isNodeKindRegistered(node->getKind()))
        << "node " << node->getId() << " has the unregistered kind "
        << getNodeKindName(node->getKind());
  }
  for (const std::unique_ptr<Constraint>& constraint : constraints) {
    int64_t before = collector.size();
    constraint->validateConstraint(*this, graph, collector);
    LOOM_VLOG(1) << constraint->getName() << ": "
                 << collector.size() - before << " issues";
  }
}

llvm::Error ValidationEnvironment::validate(const Graph& graph) const {
  ValidationIssueCollector collector;
  validate(graph, collector);
  return collector.check();
}

}  // namespace loom
