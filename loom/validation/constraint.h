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


#ifndef LOOM_VALIDATION_CONSTRAINT_H_
#define LOOM_VALIDATION_CONSTRAINT_H_

#include "llvm/ADT/StringRef.h"
#include "loom/graph/graph.h"
#include "loom/validation/validation_issue.h"

namespace loom {

class ValidationEnvironment;

// A graph-wide validation rule.
//
// Constraints never die on malformed graphs: every violation is reported to
// the collector and validation moves on.
class Constraint {
 public:
  virtual ~Constraint() = default;

  virtual llvm::StringRef getName() const = 0;

  // Dies unless `env` provides everything this constraint relies on, such as
  // the node kinds it reads.
  virtual void checkRequirements(const ValidationEnvironment& env) const {}

  // Appends every violation of this constraint in `graph` to `collector`.
  virtual void validateConstraint(const ValidationEnvironment& env,
                                  const Graph& graph,
                                  ValidationIssueCollector& collector) const = 0;
};

}  // namespace loom

#endif  // LOOM_VALIDATION_CONSTRAINT_H_
