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


#ifndef LOOM_VALIDATION_ENVIRONMENT_H_
#define LOOM_VALIDATION_ENVIRONMENT_H_

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "loom/graph/graph.h"
#include "loom/graph/node.h"
#include "loom/validation/constraint.h"
#include "loom/validation/validation_issue.h"

namespace loom {

// The default set of tensor element types.
inline constexpr llvm::StringLiteral kDefaultValidDTypes[] = {"int32",
                                                              "float32"};

// Everything a validation pass is configured with: the node kinds a graph may
// hold, the constraints to check and the accepted tensor element types.
class ValidationEnvironment {
 public:
  // An environment with no node kinds and no constraints, accepting the
  // default element types.
  ValidationEnvironment();

  ValidationEnvironment(ValidationEnvironment&&) = default;
  ValidationEnvironment& operator=(ValidationEnvironment&&) = default;

  // An environment registering every core node kind and constraint.
  static ValidationEnvironment createDefault();

  void registerNodeKind(NodeKind kind);
  bool isNodeKindRegistered(NodeKind kind) const;

  // Dies unless `kind` is registered. `requiredBy` names the caller in the
  // failure message.
  void assertNodeKindRegistered(NodeKind kind,
                                llvm::StringRef requiredBy) const;

  // Adds `constraint` after checking its requirements against this
  // environment.
  void addConstraint(std::unique_ptr<Constraint> constraint);

  // Returns the constraint named `name`, or nullptr if there is none.
  const Constraint* lookupConstraint(llvm::StringRef name) const;

  int64_t getNumConstraints() const { return constraints.size(); }

  void setValidDTypes(llvm::ArrayRef<std::string> dtypes);
  const std::set<std::string>& getValidDTypes() const { return validDTypes; }
  bool isValidDType(llvm::StringRef dtype) const;

  // Checks `graph` against every constraint, in the order they were added,
  // and appends the issues to `collector`.
  //
  // Dies if `graph` holds a node of an unregistered kind.
  void validate(const Graph& graph, ValidationIssueCollector& collector) const;

  // Like above, but returns the issues as a `ValidationError`.
  llvm::Error validate(const Graph& graph) const;

 private:
  std::set<NodeKind> nodeKinds;
  std::vector<std::unique_ptr<Constraint>> constraints;
  std::set<std::string> validDTypes;
};

}  // namespace loom

#endif  // LOOM_VALIDATION_ENVIRONMENT_H_
