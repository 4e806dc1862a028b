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


#ifndef LOOM_VALIDATION_TESTING_UTILS_H_
#define LOOM_VALIDATION_TESTING_UTILS_H_

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "llvm/ADT/StringRef.h"
#include "loom/graph/graph.h"
#include "loom/graph/node.h"
#include "loom/validation/constraint.h"
#include "loom/validation/environment.h"
#include "loom/validation/validation_issue.h"
#include "loom/zspace/point.h"
#include "loom/zspace/range.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace loom {

inline void PrintTo(const ValidationIssue& issue, std::ostream* os) {
  *os << issue.toDisplayString();
}

MATCHER_P2(IssueIs, kind, summaryMatcher,
           std::string(negation ? "isn't " : "is ") + "an issue of kind " +
               ::testing::PrintToString(std::string(kind))) {
  return arg.getKind() == kind &&
         ::testing::ExplainMatchResult(summaryMatcher, arg.getSummary().str(),
                                       result_listener);
}

inline Range makeRange(std::initializer_list<int64_t> start,
                       std::initializer_list<int64_t> end) {
  return Range(Point(start), Point(end));
}

class ValidationTestBase : public ::testing::Test {
 protected:
  const Node& addTensor(std::string id, Range range,
                        std::string dtype = "int32") {
    return graph.addNode(
        Node(std::move(id), TensorBody{std::move(dtype), std::move(range)}));
  }

  const Node& addIndex(std::string id, Range range) {
    return graph.addNode(Node(std::move(id), IndexBody{std::move(range)}));
  }

  const Node& addOperation(std::string id, SelectionMap inputs,
                           SelectionMap outputs) {
    OperationSignatureBody body;
    body.kernel = "kernel";
    body.inputs = std::move(inputs);
    body.outputs = std::move(outputs);
    return graph.addNode(Node(std::move(id), std::move(body)));
  }

  const Node& addApplication(
      std::string id, std::string operationId, SelectionMap inputs,
      SelectionMap outputs,
      std::optional<std::string> indexId = std::nullopt) {
    ApplicationBody body;
    body.operationId = std::move(operationId);
    body.indexId = std::move(indexId);
    body.inputs = std::move(inputs);
    body.outputs = std::move(outputs);
    return graph.addNode(Node(std::move(id), std::move(body)));
  }

  // Runs only `constraint` over the graph.
  std::vector<ValidationIssue> validate(const Constraint& constraint) {
    ValidationIssueCollector collector;
    constraint.validateConstraint(env, graph, collector);
    return std::vector<ValidationIssue>(collector.getIssues().begin(),
                                        collector.getIssues().end());
  }

  ValidationEnvironment env = ValidationEnvironment::createDefault();
  Graph graph;
};

}  // namespace loom

#endif  // LOOM_VALIDATION_TESTING_UTILS_H_
