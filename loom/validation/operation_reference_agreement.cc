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


#include "loom/validation/operation_reference_agreement.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/JSON.h"
#include "loom/common/logging.h"
#include "loom/graph/document.h"
#include "loom/graph/graph.h"
#include "loom/graph/node.h"
#include "loom/graph/traversal.h"
#include "loom/validation/environment.h"
#include "loom/validation/validation_issue.h"
#include "loom/validation/validation_utils.h"
#include "loom/zspace/json.h"
#include "loom/zspace/range.h"

namespace loom {

namespace {

constexpr llvm::StringLiteral kInputs = "inputs";
constexpr llvm::StringLiteral kOutputs = "outputs";

llvm::SmallVector<std::string> getSlotNames(const SelectionMap& selections) {
  llvm::SmallVector<std::string> names;
  for (const auto& [name, _] : selections) {
    names.push_back(name);
  }
  return names;
}

std::string formatSlotNames(llvm::ArrayRef<std::string> names) {
  return "[" + llvm::join(names, ", ") + "]";
}

std::string slotLabel(llvm::StringRef slot, int64_t index) {
  return llvm::formatv("{0}[{1}]", slot, index).str();
}

// Checks every selection of one slot map of a signature against the tensor it
// names.
bool validateSignatureSelections(const Graph& graph, const Node& signatureNode,
                                 llvm::StringRef mapName,
                                 const SelectionMap& selections,
                                 ValidationIssueCollector& collector) {
  bool valid = true;
  ValidationContext operationContext =
      nodeContext(signatureNode, "Operation Node");
  for (const auto& [slot, slotSelections] : selections) {
    for (int64_t index = 0, e = slotSelections.size(); index < e; ++index) {
      const TensorSelection& selection = slotSelections[index];
      std::string path = selectionJsonPath(signatureNode, mapName, slot, index);
      const Node* tensorNode =
          validateNodeReference(graph, selection.tensorId, NodeKind::kTensor,
                                path, collector, operationContext);
      if (!tensorNode) {
        valid = false;
        continue;
      }
      const Range& tensorRange = tensorNode->getBodyAs<TensorBody>().getRange();
      ValidationContext selectionContext{"Selection Range", path, std::nullopt,
                                         toJSON(selection.range)};

      if (selection.range.getRank() != tensorRange.getRank()) {
        ValidationIssue issue(
            kNodeValidationError,
            "Tensor selection has the wrong number of dimensions");
        issue.addParam("nodeType", getNodeKindName(signatureNode.getKind()))
            .addParam("expectedDimensions", tensorRange.getRank())
            .addParam("actualDimensions", selection.range.getRank())
            .addContext(std::move(selectionContext))
            .addContext(nodeContext(*tensorNode, "Tensor Node"))
            .addContext(operationContext);
        collector.addIssue(std::move(issue));
        valid = false;
        continue;
      }

      if (!tensorRange.contains(selection.range)) {
        ValidationIssue issue(kNodeValidationError,
                              "Tensor selection is out of bounds");
        issue.addParam("nodeType", getNodeKindName(signatureNode.getKind()))
            .addContext(std::move(selectionContext))
            .addContext(nodeContext(*tensorNode, "Tensor Node"))
            .addContext(operationContext);
        collector.addIssue(std::move(issue));
        valid = false;
      }
    }
  }
  return valid;
}

// Checks that one slot map of a shard agrees with the signature's: the same
// slot names, as many selections per slot, and each selection a sub-range of
// the same tensor.
bool validateShardSelections(const Node& signatureNode,
                             const Node& applicationNode,
                             llvm::StringRef mapName,
                             const SelectionMap& shardSelections,
                             const SelectionMap& signatureSelections,
                             ValidationIssueCollector& collector) {
  ValidationContext applicationContext =
      nodeContext(applicationNode, "Application Node");

  llvm::SmallVector<std::string> shardSlots = getSlotNames(shardSelections);
  llvm::SmallVector<std::string> signatureSlots =
      getSlotNames(signatureSelections);
  if (shardSlots != signatureSlots) {
    ValidationIssue issue(
        kNodeValidationError,
        llvm::formatv("Application Node {0} keys {1} != Operation Signature "
                      "{0} keys {2}",
                      mapName, formatSlotNames(shardSlots),
                      formatSlotNames(signatureSlots)));
    issue.addContext(std::move(applicationContext));
    collector.addIssue(std::move(issue));
    return false;
  }

  bool valid = true;
  for (const auto& [slot, shardSlotSelections] : shardSelections) {
    const std::vector<TensorSelection>& signatureSlotSelections =
        signatureSelections.at(slot);
    if (shardSlotSelections.size() != signatureSlotSelections.size()) {
      ValidationIssue issue(
          kNodeValidationError,
          llvm::formatv("Application {0} key \"{1}\" selection size ({2}) != "
                        "Signature size ({3})",
                        mapName, slot, shardSlotSelections.size(),
                        signatureSlotSelections.size()));
      issue.addContext(applicationContext);
      collector.addIssue(std::move(issue));
      valid = false;
      continue;
    }

    for (int64_t index = 0, e = shardSlotSelections.size(); index < e;
         ++index) {
      const TensorSelection& shardSelection = shardSlotSelections[index];
      const TensorSelection& signatureSelection =
          signatureSlotSelections[index];
      ValidationContext shardContext{
          "Application Tensor Selection",
          selectionJsonPath(applicationNode, mapName, slot, index),
          std::nullopt, toJSON(shardSelection)};
      ValidationContext signatureContext{
          "Operation Tensor Selection",
          selectionJsonPath(signatureNode, mapName, slot, index), std::nullopt,
          toJSON(signatureSelection)};

      std::optional<ValidationIssue> issue;
      if (shardSelection.tensorId != signatureSelection.tensorId) {
        issue.emplace(
            kNodeValidationError,
            "Application Tensor Selection Tensor Id != Signature Tensor Id");
      } else if (!rangeContains(signatureSelection.range,
                                shardSelection.range)) {
        issue.emplace(kNodeValidationError,
                      llvm::formatv("Application Tensor Selection range {0} "
                                    "is outside signature range {1}",
                                    shardSelection.range.toString(),
                                    signatureSelection.range.toString()));
      }
      if (issue) {
        issue->addContext(std::move(shardContext))
            .addContext(std::move(signatureContext))
            .addContext(applicationContext);
        collector.addIssue(std::move(*issue));
        valid = false;
      }
    }
  }
  return valid;
}

// The ranges that each shard selects at position `index` of `slot`.
struct ShardRanges {
  llvm::SmallVector<const Node*> shards;
  llvm::SmallVector<Range> ranges;

  ValidationContext toContext() const {
    llvm::json::Array data;
    for (int64_t i = 0, e = shards.size(); i < e; ++i) {
      data.push_back(llvm::json::Object{{"applicationId", shards[i]->getId()},
                                        {"range", ranges[i]}});
    }
    return ValidationContext{"Application Shard Ranges", std::nullopt,
                             std::nullopt, std::move(data)};
  }
};

ShardRanges collectShardRanges(llvm::ArrayRef<const Node*> shards,
                               llvm::StringRef mapName, llvm::StringRef slot,
                               int64_t index) {
  ShardRanges result;
  for (const Node* shard : shards) {
    const auto& application = shard->getBodyAs<ApplicationBody>();
    const SelectionMap& selections =
        mapName == kInputs ? application.inputs : application.outputs;
    result.shards.push_back(shard);
    result.ranges.push_back(selections.at(slot.str())[index].range);
  }
  return result;
}

ValidationIssue makeBoundingRangeIssue(llvm::StringRef mapName,
                                       llvm::StringRef label,
                                       const Range& signatureRange,
                                       const Range& boundingRange) {
  return ValidationIssue(
      kNodeValidationError,
      llvm::formatv("Operation Signature {0} key \"{1}\" range {2} != shard "
                    "bounding range {3}",
                    mapName, label, signatureRange.toString(),
                    boundingRange.toString()));
}

// Checks that the shards of every input selection span the signature's range.
bool validateInputCoverage(const Node& signatureNode,
                           const OperationSignatureBody& signature,
                           llvm::ArrayRef<const Node*> shards,
                           ValidationIssueCollector& collector) {
  bool valid = true;
  for (const auto& [slot, selections] : signature.inputs) {
    for (int64_t index = 0, e = selections.size(); index < e; ++index) {
      const Range& signatureRange = selections[index].range;
      ShardRanges shardRanges =
          collectShardRanges(shards, kInputs, slot, index);
      Range boundingRange = Range::boundingRange(shardRanges.ranges);
      if (boundingRange != signatureRange) {
        ValidationIssue issue = makeBoundingRangeIssue(
            kInputs, slotLabel(slot, index), signatureRange, boundingRange);
        issue.addContext(shardRanges.toContext())
            .addContext(nodeContext(signatureNode, "Operation Node"));
        collector.addIssue(std::move(issue));
        valid = false;
      }
    }
  }
  return valid;
}

// Checks that the shards of every output selection tile the signature's range:
// no two shards overlap, together they span the range, and their sizes add up
// to its size.
bool validateOutputCoverage(const Node& signatureNode,
                            const OperationSignatureBody& signature,
                            llvm::ArrayRef<const Node*> shards,
                            ValidationIssueCollector& collector) {
  bool valid = true;
  for (const auto& [slot, selections] : signature.outputs) {
    for (int64_t index = 0, e = selections.size(); index < e; ++index) {
      std::string label = slotLabel(slot, index);
      const Range& signatureRange = selections[index].range;
      ShardRanges shardRanges =
          collectShardRanges(shards, kOutputs, slot, index);

      llvm::json::Array overlappingPairs;
      for (int64_t i = 0, n = shardRanges.ranges.size(); i < n; ++i) {
        for (int64_t j = i + 1; j < n; ++j) {
          if (shardRanges.ranges[i].overlaps(shardRanges.ranges[j])) {
            overlappingPairs.push_back(
                llvm::json::Array{shardRanges.shards[i]->getId(),
                                  shardRanges.shards[j]->getId()});
          }
        }
      }
      bool overlapping = !overlappingPairs.empty();
      if (overlapping) {
        ValidationIssue issue(
            kNodeValidationError,
            llvm::formatv("Overlapping Application output key \"{0}\" ranges",
                          label));
        issue
            .addContext({"Overlapping Shards", std::nullopt, std::nullopt,
                         llvm::json::Value(std::move(overlappingPairs))})
            .addContext(shardRanges.toContext())
            .addContext(nodeContext(signatureNode, "Operation Node"));
        collector.addIssue(std::move(issue));
        valid = false;
      }

      Range boundingRange = Range::boundingRange(shardRanges.ranges);
      if (boundingRange != signatureRange) {
        ValidationIssue issue = makeBoundingRangeIssue(
            kOutputs, label, signatureRange, boundingRange);
        issue.addContext(shardRanges.toContext())
            .addContext(nodeContext(signatureNode, "Operation Node"));
        collector.addIssue(std::move(issue));
        valid = false;
        continue;
      }

      // Disjoint shards spanning the range tile it iff their sizes add up.
      if (overlapping) {
        continue;
      }
      int64_t totalSize = 0;
      for (const Range& range : shardRanges.ranges) {
        totalSize += range.getSize();
      }
      if (totalSize != signatureRange.getSize()) {
        ValidationIssue issue(
            kNodeValidationError,
            llvm::formatv("Application output key \"{0}\" ranges leave a gap: "
                          "total size {1} != signature range size {2}",
                          label, totalSize, signatureRange.getSize()));
        issue.addContext(shardRanges.toContext())
            .addContext(nodeContext(signatureNode, "Operation Node"));
        collector.addIssue(std::move(issue));
        valid = false;
      }
    }
  }
  return valid;
}

bool validateOperationSignature(const Graph& graph, const Node& signatureNode,
                                ValidationIssueCollector& collector) {
  const auto& signature = signatureNode.getBodyAs<OperationSignatureBody>();
  bool valid = true;
  valid &= validateSignatureSelections(graph, signatureNode, kInputs,
                                       signature.inputs, collector);
  valid &= validateSignatureSelections(graph, signatureNode, kOutputs,
                                       signature.outputs, collector);

  llvm::SmallVector<const Node*> shards =
      graph.getApplications(signatureNode.getId());
  if (shards.empty()) {
    ValidationIssue issue(
        kNodeValidationError,
        llvm::formatv("Operation Signature \"{0}\" has no Application shards",
                      signatureNode.getId()));
    issue.addContext(nodeContext(signatureNode, "Operation Node"));
    collector.addIssue(std::move(issue));
    return false;
  }

  bool shardsValid = true;
  for (const Node* shard : shards) {
    const auto& application = shard->getBodyAs<ApplicationBody>();
    shardsValid &= validateShardSelections(signatureNode, *shard, kInputs,
                                           application.inputs,
                                           signature.inputs, collector);
    shardsValid &= validateShardSelections(signatureNode, *shard, kOutputs,
                                           application.outputs,
                                           signature.outputs, collector);
  }
  if (!shardsValid) {
    // Coverage is meaningless for shards that disagree with the signature.
    return false;
  }

  valid &= validateInputCoverage(signatureNode, signature, shards, collector);
  valid &= validateOutputCoverage(signatureNode, signature, shards, collector);
  return valid;
}

llvm::json::Value describeCycle(llvm::ArrayRef<const Node*> cycle) {
  llvm::json::Array description;
  for (const Node* node : cycle) {
    llvm::json::Object item{{"id", node->getId()},
                            {"type", getNodeKindTypeUri(node->getKind())}};
    if (node->getLabel()) {
      item["label"] = *node->getLabel();
    }
    description.push_back(std::move(item));
  }
  return description;
}

}  // namespace

void OperationReferenceAgreementConstraint::checkRequirements(
    const ValidationEnvironment& env) const {
  env.assertNodeKindRegistered(NodeKind::kTensor, getName());
  env.assertNodeKindRegistered(NodeKind::kOperationSignature, getName());
  env.assertNodeKindRegistered(NodeKind::kApplication, getName());
}

void OperationReferenceAgreementConstraint::validateConstraint(
    const ValidationEnvironment& env, const Graph& graph,
    ValidationIssueCollector& collector) const {
  bool valid = true;
  for (const Node* node : graph.getNodes(NodeKind::kApplication)) {
    const auto& application = node->getBodyAs<ApplicationBody>();
    if (!validateNodeReference(graph, application.operationId,
                               NodeKind::kOperationSignature,
                               node->getJsonPath() + ".body.operationId",
                               collector,
                               nodeContext(*node, "Application Node"))) {
      valid = false;
    }
  }

  for (const Node* node : graph.getNodes(NodeKind::kOperationSignature)) {
    valid &= validateOperationSignature(graph, *node, collector);
  }

  if (!valid) {
    LOOM_VLOG(1) << "skipping the cycle search of graph '" << graph.getId()
                 << "' after reference errors";
    return;
  }

  for (const llvm::SmallVector<const Node*>& cycle :
       findOperationSimpleCycles(graph)) {
    ValidationIssue issue(kReferenceCycleError, "Reference Cycle detected");
    issue.addContext(
        {"Cycle", std::nullopt, std::nullopt, describeCycle(cycle)});
    collector.addIssue(std::move(issue));
  }
}

}  // namespace loom
