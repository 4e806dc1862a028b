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


#include "loom/validation/ipf_signature_agreement.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/JSON.h"
#include "loom/graph/graph.h"
#include "loom/graph/node.h"
#include "loom/validation/environment.h"
#include "loom/validation/validation_issue.h"
#include "loom/validation/validation_utils.h"
#include "loom/zspace/index_projection.h"
#include "loom/zspace/json.h"
#include "loom/zspace/range.h"

namespace loom {

namespace {

constexpr llvm::StringLiteral kInputs = "inputs";
constexpr llvm::StringLiteral kOutputs = "outputs";

template <typename T>
std::string formatSlotNames(const std::map<std::string, T>& slots) {
  llvm::SmallVector<llvm::StringRef> names;
  for (const auto& [name, _] : slots) {
    names.push_back(name);
  }
  return "[" + llvm::join(names, ", ") + "]";
}

template <typename T, typename U>
bool haveSameSlots(const std::map<std::string, T>& lhs,
                   const std::map<std::string, U>& rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (auto lhsIt = lhs.begin(), rhsIt = rhs.begin(); lhsIt != lhs.end();
       ++lhsIt, ++rhsIt) {
    if (lhsIt->first != rhsIt->first) {
      return false;
    }
  }
  return true;
}

// Checks that one IPF map has the slots of the signature's selection map, with
// one projection per selection.
bool validateIPFSlots(const Node& ipfNode, llvm::StringRef mapName,
                      const IPFMap& ipfs, const SelectionMap& selections,
                      const ValidationContext& operationContext,
                      ValidationIssueCollector& collector) {
  if (!haveSameSlots(ipfs, selections)) {
    ValidationIssue issue(
        kNodeValidationError,
        llvm::formatv("IPF Signature {0} keys {1} != Operation Signature {0} "
                      "keys {2}",
                      mapName, formatSlotNames(ipfs),
                      formatSlotNames(selections)));
    issue.addContext(nodeContext(ipfNode, "IPF Signature Node"))
        .addContext(operationContext);
    collector.addIssue(std::move(issue));
    return false;
  }
  bool valid = true;
  for (const auto& [slot, slotIpfs] : ipfs) {
    int64_t expectedSize = selections.at(slot).size();
    if (static_cast<int64_t>(slotIpfs.size()) != expectedSize) {
      ValidationIssue issue(
          kNodeValidationError,
          llvm::formatv("IPF Signature {0} key \"{1}\" size ({2}) != "
                        "Operation Signature size ({3})",
                        mapName, slot, slotIpfs.size(), expectedSize));
      issue.addContext(nodeContext(ipfNode, "IPF Signature Node"))
          .addContext(operationContext);
      collector.addIssue(std::move(issue));
      valid = false;
    }
  }
  return valid;
}

// Checks that every projection of one IPF map reads the index space.
bool validateIPFInputRanks(const Node& ipfNode, llvm::StringRef mapName,
                           const IPFMap& ipfs, const Range& indexRange,
                           ValidationIssueCollector& collector) {
  bool valid = true;
  for (const auto& [slot, slotIpfs] : ipfs) {
    for (int64_t index = 0, e = slotIpfs.size(); index < e; ++index) {
      const IndexProjectionFunction& ipf = slotIpfs[index];
      if (ipf.getInputRank() == indexRange.getRank()) {
        continue;
      }
      ValidationIssue issue(
          kNodeValidationError,
          llvm::formatv("IPF Signature {0} key \"{1}[{2}]\" input rank {3} != "
                        "index rank {4}",
                        mapName, slot, index, ipf.getInputRank(),
                        indexRange.getRank()));
      issue.addContext({"Index Projection",
                        llvm::formatv("{0}.body.{1}.{2}[{3}]",
                                      ipfNode.getJsonPath(), mapName, slot,
                                      index)
                            .str(),
                        std::nullopt, toJSON(ipf)})
          .addContext(nodeContext(ipfNode, "IPF Signature Node"));
      collector.addIssue(std::move(issue));
      valid = false;
    }
  }
  return valid;
}

// Checks that the selections of `node` are the projections of `indexRange`.
// Slots that `node` lacks, or whose arity differs from the IPF map, are left to
// the operation reference agreement.
void validateProjections(const Node& node, llvm::StringRef nodeDescription,
                         llvm::StringRef mapName, const IPFMap& ipfs,
                         const SelectionMap& selections,
                         const Range& indexRange,
                         ValidationIssueCollector& collector) {
  for (const auto& [slot, slotIpfs] : ipfs) {
    auto it = selections.find(slot);
    if (it == selections.end() || it->second.size() != slotIpfs.size()) {
      continue;
    }
    for (int64_t index = 0, e = slotIpfs.size(); index < e; ++index) {
      const IndexProjectionFunction& ipf = slotIpfs[index];
      const Range& actual = it->second[index].range;
      Range expected = ipf.apply(indexRange);
      if (actual == expected) {
        continue;
      }
      ValidationIssue issue(
          kNodeValidationError,
          llvm::formatv("{0} {1} key \"{2}[{3}]\" range {4} != IPF projection "
                        "{5}",
                        nodeDescription, mapName, slot, index,
                        actual.toString(), expected.toString()));
      issue
          .addContext({"Selection Range",
                       selectionJsonPath(node, mapName, slot, index),
                       std::nullopt, toJSON(actual)})
          .addContext({"Index Projection", std::nullopt, std::nullopt,
                       toJSON(ipf)})
          .addContext({"Index Range", std::nullopt, std::nullopt,
                       toJSON(indexRange)})
          .addContext(nodeContext(node, (nodeDescription + " Node").str()));
      collector.addIssue(std::move(issue));
    }
  }
}

void validateApplication(const Graph& graph, const Node& applicationNode,
                         const IPFSignatureBody& ipfSignature,
                         const Node& indexNode,
                         ValidationIssueCollector& collector) {
  const auto& application = applicationNode.getBodyAs<ApplicationBody>();
  if (!application.indexId) {
    return;
  }
  ValidationContext applicationContext =
      nodeContext(applicationNode, "Application Node");
  const Node* applicationIndexNode = validateNodeReference(
      graph, *application.indexId, NodeKind::kIndex,
      applicationNode.getJsonPath() + ".body.indexId", collector,
      applicationContext);
  if (!applicationIndexNode) {
    return;
  }
  const Range& indexRange = indexNode.getBodyAs<IndexBody>().getRange();
  const Range& applicationIndexRange =
      applicationIndexNode->getBodyAs<IndexBody>().getRange();
  if (!rangeContains(indexRange, applicationIndexRange)) {
    ValidationIssue issue(
        kNodeValidationError,
        llvm::formatv("Application index range {0} is outside signature "
                      "index range {1}",
                      applicationIndexRange.toString(),
                      indexRange.toString()));
    issue.addContext(nodeContext(*applicationIndexNode, "Application Index"))
        .addContext(nodeContext(indexNode, "Signature Index"))
        .addContext(std::move(applicationContext));
    collector.addIssue(std::move(issue));
    return;
  }
  validateProjections(applicationNode, "Application", kInputs,
                      ipfSignature.inputs, application.inputs,
                      applicationIndexRange, collector);
  validateProjections(applicationNode, "Application", kOutputs,
                      ipfSignature.outputs, application.outputs,
                      applicationIndexRange, collector);
}

void validateOperationSignature(const Graph& graph, const Node& signatureNode,
                                ValidationIssueCollector& collector) {
  const auto& signature = signatureNode.getBodyAs<OperationSignatureBody>();
  if (!signature.signatureId || !signature.indexId) {
    return;
  }
  ValidationContext operationContext =
      nodeContext(signatureNode, "Operation Node");
  const Node* ipfNode = validateNodeReference(
      graph, *signature.signatureId, NodeKind::kIPFSignature,
      signatureNode.getJsonPath() + ".body.signatureId", collector,
      operationContext);
  const Node* indexNode = validateNodeReference(
      graph, *signature.indexId, NodeKind::kIndex,
      signatureNode.getJsonPath() + ".body.indexId", collector,
      operationContext);
  if (!ipfNode || !indexNode) {
    return;
  }
  const auto& ipfSignature = ipfNode->getBodyAs<IPFSignatureBody>();
  const Range& indexRange = indexNode->getBodyAs<IndexBody>().getRange();

  bool valid = true;
  valid &= validateIPFSlots(*ipfNode, kInputs, ipfSignature.inputs,
                            signature.inputs, operationContext, collector);
  valid &= validateIPFSlots(*ipfNode, kOutputs, ipfSignature.outputs,
                            signature.outputs, operationContext, collector);
  valid &= validateIPFInputRanks(*ipfNode, kInputs, ipfSignature.inputs,
                                 indexRange, collector);
  valid &= validateIPFInputRanks(*ipfNode, kOutputs, ipfSignature.outputs,
                                 indexRange, collector);
  if (!valid) {
    return;
  }

  validateProjections(signatureNode, "Operation Signature", kInputs,
                      ipfSignature.inputs, signature.inputs, indexRange,
                      collector);
  validateProjections(signatureNode, "Operation Signature", kOutputs,
                      ipfSignature.outputs, signature.outputs, indexRange,
                      collector);

  for (const Node* applicationNode :
       graph.getApplications(signatureNode.getId())) {
    validateApplication(graph, *applicationNode, ipfSignature, *indexNode,
                        collector);
  }
}

}  // namespace

void IPFSignatureAgreementConstraint::checkRequirements(
    const ValidationEnvironment& env) const {
  env.assertNodeKindRegistered(NodeKind::kOperationSignature, getName());
  env.assertNodeKindRegistered(NodeKind::kApplication, getName());
  env.assertNodeKindRegistered(NodeKind::kIPFSignature, getName());
  env.assertNodeKindRegistered(NodeKind::kIndex, getName());
}

void IPFSignatureAgreementConstraint::validateConstraint(
    const ValidationEnvironment& env, const Graph& graph,
    ValidationIssueCollector& collector) const {
  for (const Node* node : graph.getNodes(NodeKind::kOperationSignature)) {
    validateOperationSignature(graph, *node, collector);
  }
}

}  // namespace loom
