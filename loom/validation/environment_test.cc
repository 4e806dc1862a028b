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

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "loom/graph/graph.h"
#include "loom/graph/node.h"
#include "loom/validation/constraint.h"
#include "loom/validation/tensor_dtypes.h"
#include "loom/validation/testing_utils.h"
#include "loom/validation/validation_issue.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace loom {
namespace {

using ::testing::ElementsAre;
using ::testing::UnorderedElementsAre;

// Reports one issue naming itself for every graph.
class NamedConstraint : public Constraint {
 public:
  explicit NamedConstraint(std::string name) : name(std::move(name)) {}

  llvm::StringRef getName() const override { return name; }

  void validateConstraint(const ValidationEnvironment& env, const Graph& graph,
                          ValidationIssueCollector& collector) const override {
    collector.addIssue(ValidationIssue(kNodeValidationError, name));
  }

 private:
  std::string name;
};

TEST(ValidationEnvironmentTest, EmptyEnvironment) {
  ValidationEnvironment env;
  EXPECT_FALSE(env.isNodeKindRegistered(NodeKind::kTensor));
  EXPECT_EQ(env.getNumConstraints(), 0);
  EXPECT_THAT(env.getValidDTypes(), UnorderedElementsAre("int32", "float32"));
}

TEST(ValidationEnvironmentTest, DefaultEnvironment) {
  ValidationEnvironment env = ValidationEnvironment::createDefault();
  for (NodeKind kind :
       {NodeKind::kTensor, NodeKind::kOperationSignature,
        NodeKind::kApplication, NodeKind::kIndex, NodeKind::kIPFSignature,
        NodeKind::kNote}) {
    EXPECT_TRUE(env.isNodeKindRegistered(kind)) << getNodeKindName(kind).str();
  }
  EXPECT_EQ(env.getNumConstraints(), 3);
  EXPECT_NE(env.lookupConstraint("TensorDTypes"), nullptr);
  EXPECT_NE(env.lookupConstraint("OperationReferenceAgreement"), nullptr);
  EXPECT_NE(env.lookupConstraint("IPFSignatureAgreement"), nullptr);
  EXPECT_EQ(env.lookupConstraint("Unknown"), nullptr);
}

TEST(ValidationEnvironmentTest, ValidDTypes) {
  ValidationEnvironment env;
  EXPECT_TRUE(env.isValidDType("int32"));
  EXPECT_FALSE(env.isValidDType("int8"));
  env.setValidDTypes({"int8", "int16"});
  EXPECT_TRUE(env.isValidDType("int8"));
  EXPECT_FALSE(env.isValidDType("int32"));
}

TEST(ValidationEnvironmentTest, ConstraintsRunInOrder) {
  ValidationEnvironment env;
  env.addConstraint(std::make_unique<NamedConstraint>("first"));
  env.addConstraint(std::make_unique<NamedConstraint>("second"));

  ValidationIssueCollector collector;
  env.validate(Graph("g"), collector);
  EXPECT_THAT(collector.getIssues(),
              ElementsAre(IssueIs(kNodeValidationError, "first"),
                          IssueIs(kNodeValidationError, "second")));
}

TEST(ValidationEnvironmentTest, ValidGraph) {
  ValidationEnvironment env = ValidationEnvironment::createDefault();
  Graph graph("g");
  graph.addNode(Node("N", NoteBody{"nothing to check"}));
  llvm::Error error = env.validate(graph);
  EXPECT_FALSE(static_cast<bool>(error));
}

TEST(ValidationEnvironmentTest, InvalidGraph) {
  ValidationEnvironment env = ValidationEnvironment::createDefault();
  Graph graph("g");
  graph.addNode(Node("T", TensorBody{"complex64", makeRange({0}, {2})}));

  llvm::Error error = env.validate(graph);
  ASSERT_TRUE(error.isA<ValidationError>());
  llvm::handleAllErrors(std::move(error), [](const ValidationError& failure) {
    EXPECT_THAT(failure.getIssues(),
                ElementsAre(IssueIs(
                    kNodeValidationError,
                    "Tensor has an invalid dtype \"complex64\"")));
  });
}

TEST(ValidationEnvironmentDeathTest, UnregisteredNodeKind) {
  ValidationEnvironment env;
  env.registerNodeKind(NodeKind::kTensor);
  Graph graph("g");
  graph.addNode(Node("N", NoteBody{"unexpected"}));
  ValidationIssueCollector collector;
  EXPECT_DEATH(env.validate(graph, collector),
               "node N has the unregistered kind Note");
}

TEST(ValidationEnvironmentDeathTest, MissingRequirement) {
  ValidationEnvironment env;
  EXPECT_DEATH(env.addConstraint(std::make_unique<TensorDTypesConstraint>()),
               "TensorDTypes requires the unregistered node kind Tensor");
}

}  // namespace
}  // namespace loom
