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


#ifndef LOOM_VALIDATION_TENSOR_DTYPES_H_
#define LOOM_VALIDATION_TENSOR_DTYPES_H_

#include "llvm/ADT/StringRef.h"
#include "loom/graph/graph.h"
#include "loom/validation/constraint.h"
#include "loom/validation/environment.h"
#include "loom/validation/validation_issue.h"

namespace loom {

// Checks that every tensor has one of the environment's element types.
class TensorDTypesConstraint : public Constraint {
 public:
  llvm::StringRef getName() const override { return "TensorDTypes"; }

  void checkRequirements(const ValidationEnvironment& env) const override;

  void validateConstraint(const ValidationEnvironment& env, const Graph& graph,
                          ValidationIssueCollector& collector) const override;
};

}  // namespace loom

#endif  // LOOM_VALIDATION_TENSOR_DTYPES_H_
