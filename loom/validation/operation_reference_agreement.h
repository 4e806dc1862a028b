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


#ifndef LOOM_VALIDATION_OPERATION_REFERENCE_AGREEMENT_H_
#define LOOM_VALIDATION_OPERATION_REFERENCE_AGREEMENT_H_

#include "llvm/ADT/StringRef.h"
#include "loom/graph/graph.h"
#include "loom/validation/constraint.h"
#include "loom/validation/environment.h"
#include "loom/validation/validation_issue.h"

namespace loom {

// Checks that every operation signature agrees with the tensors it selects and
// with the application shards that implement it:
//
// - every application names an existing operation signature;
// - every signature selection names a tensor, with a range of the tensor's
//   rank inside the tensor's range;
// - every signature has at least one shard;
// - every shard has the signature's slots, with as many selections per slot,
//   each selecting the same tensor inside the signature's range;
// - the shards of an input selection jointly span the signature's range;
// - the shards of an output selection tile the signature's range exactly,
//   without overlapping;
// - if all of the above hold, the data flow between signatures and tensors
//   has no cycles.
class OperationReferenceAgreementConstraint : public Constraint {
 public:
  llvm::StringRef getName() const override {
    return "OperationReferenceAgreement";
  }

  void checkRequirements(const ValidationEnvironment& env) const override;

  void validateConstraint(const ValidationEnvironment& env, const Graph& graph,
                          ValidationIssueCollector& collector) const override;
};

}  // namespace loom

#endif  // LOOM_VALIDATION_OPERATION_REFERENCE_AGREEMENT_H_
