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

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "loom/graph/node.h"
#include "loom/validation/environment.h"
#include "loom/validation/testing_utils.h"
#include "loom/validation/validation_issue.h"
#include "loom/zspace/affine_map.h"
#include "loom/zspace/index_projection.h"
#include "loom/zspace/point.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace loom {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Pair;
using ::testing::SizeIs;

IndexProjectionFunction elementwise() {
  return IndexProjectionFunction(AffineMap::identity(2));
}

// Index space [0:2, 0:3] with X and Y 2x3 tensors, one element of each per
// index point.
class IPFSignatureAgreementTest : public ValidationTestBase {
 protected:
  void SetUp() override {
    addTensor("X", makeRange({0, 0}, {2, 3}));
    addTensor("Y", makeRange({0, 0}, {2, 3}));
    addIndex("I", makeRange({0, 0}, {2, 3}));
  }

  void addIPFSignature(std::string id, IPFMap inputs, IPFMap outputs) {
    graph.addNode(Node(std::move(id),
                       IPFSignatureBody{std::move(inputs), std::move(outputs)}));
  }

  void addElementwiseIPFSignature() {
    addIPFSignature("S", {{"x", {elementwise()}}}, {{"y", {elementwise()}}});
  }

  void addIndexedOperation(std::optional<std::string> signatureId,
                           std::optional<std::string> indexId,
                           Range outputRange = makeRange({0, 0}, {2, 3})) {
    OperationSignatureBody body;
    body.kernel = "kernel";
    body.signatureId = std::move(signatureId);
    body.indexId = std::move(indexId);
    body.inputs = {{"x", {{"X", makeRange({0, 0}, {2, 3})}}}};
    body.outputs = {{"y", {{"Y", std::move(outputRange)}}}};
    graph.addNode(Node("Op", std::move(body)));
  }

  // Adds a shard of Op over `indexRange` selecting `inputRange` of X and the
  // same rows of Y.
  void addIndexedShard(std::string id, Range indexRange, Range inputRange) {
    std::string indexId = id + "_index";
    addIndex(indexId, std::move(indexRange));
    Range outputRange = inputRange;
    addApplication(std::move(id), "Op", {{"x", {{"X", std::move(inputRange)}}}},
                   {{"y", {{"Y", std::move(outputRange)}}}}, indexId);
  }

  std::vector<ValidationIssue> validate() {
    return ValidationTestBase::validate(constraint);
  }

  IPFSignatureAgreementConstraint constraint;
};

TEST_F(IPFSignatureAgreementTest, ShardsFollowTheProjection) {
  addElementwiseIPFSignature();
  addIndexedOperation("S", "I");
  addIndexedShard("A0", makeRange({0, 0}, {1, 3}), makeRange({0, 0}, {1, 3}));
  addIndexedShard("A1", makeRange({1, 0}, {2, 3}), makeRange({1, 0}, {2, 3}));
  EXPECT_THAT(validate(), IsEmpty());
}

TEST_F(IPFSignatureAgreementTest, UnindexedOperationsAreSkipped) {
  addIndexedOperation(std::nullopt, "Missing");
  EXPECT_THAT(validate(), IsEmpty());
}

TEST_F(IPFSignatureAgreementTest, SignatureDisagreesWithProjection) {
  addIPFSignature("S", {{"x", {elementwise()}}},
                  {{"y", {IndexProjectionFunction(AffineMap::identity(2),
                                                  Point{1, 2})}}});
  addIndexedOperation("S", "I");
  EXPECT_THAT(validate(),
              ElementsAre(IssueIs(kNodeValidationError,
                                  "Operation Signature outputs key \"y[0]\" "
                                  "range zr[0:2, 0:3] != IPF projection "
                                  "zr[0:2, 0:4]")));
}

TEST_F(IPFSignatureAgreementTest, ProjectionMismatchContexts) {
  addElementwiseIPFSignature();
  addIndexedOperation("S", "I", makeRange({0, 0}, {2, 2}));

  std::vector<ValidationIssue> issues = validate();
  ASSERT_THAT(issues, SizeIs(1));
  ASSERT_THAT(issues[0].getContexts(), SizeIs(4));
  EXPECT_EQ(issues[0].getContexts()[0].name, "Selection Range");
  EXPECT_EQ(issues[0].getContexts()[0].jsonPath,
            "$.nodes[@.id=='Op'].body.outputs.y[0]");
  EXPECT_EQ(issues[0].getContexts()[1].name, "Index Projection");
  EXPECT_EQ(issues[0].getContexts()[2].name, "Index Range");
  EXPECT_EQ(issues[0].getContexts()[3].name, "Operation Signature Node");
}

TEST_F(IPFSignatureAgreementTest, SlotNamesDisagree) {
  addIPFSignature("S", {{"z", {elementwise()}}}, {{"y", {elementwise()}}});
  addIndexedOperation("S", "I");
  EXPECT_THAT(validate(),
              ElementsAre(IssueIs(kNodeValidationError,
                                  "IPF Signature inputs keys [z] != Operation "
                                  "Signature inputs keys [x]")));
}

TEST_F(IPFSignatureAgreementTest, SlotSizesDisagree) {
  addIPFSignature("S", {{"x", {elementwise(), elementwise()}}},
                  {{"y", {elementwise()}}});
  addIndexedOperation("S", "I");
  EXPECT_THAT(validate(),
              ElementsAre(IssueIs(kNodeValidationError,
                                  "IPF Signature inputs key \"x\" size (2) != "
                                  "Operation Signature size (1)")));
}

TEST_F(IPFSignatureAgreementTest, ProjectionReadsAnotherRank) {
  addIPFSignature("S", {{"x", {IndexProjectionFunction(AffineMap::identity(1))}}},
                  {{"y", {elementwise()}}});
  addIndexedOperation("S", "I");
  EXPECT_THAT(validate(),
              ElementsAre(IssueIs(kNodeValidationError,
                                  "IPF Signature inputs key \"x[0]\" input "
                                  "rank 1 != index rank 2")));
}

TEST_F(IPFSignatureAgreementTest, MissingSignatureAndWrongIndexKind) {
  addIndexedOperation("Missing", "X");

  std::vector<ValidationIssue> issues = validate();
  ASSERT_THAT(issues, ElementsAre(IssueIs(kNodeReferenceError,
                                          "Referenced node does not exist"),
                                  IssueIs(kNodeReferenceError,
                                          "Referenced node has the wrong "
                                          "type")));
  EXPECT_THAT(issues[0].getParams(),
              ElementsAre(Pair("nodeId", "Missing"),
                          Pair("nodeType", "IPFSignature")));
  EXPECT_EQ(issues[1].getContexts()[0].jsonPath,
            "$.nodes[@.id=='Op'].body.indexId");
}

TEST_F(IPFSignatureAgreementTest, ShardIndexOutsideSignatureIndex) {
  addElementwiseIPFSignature();
  addIndexedOperation("S", "I");
  addIndexedShard("A0", makeRange({0, 0}, {3, 3}), makeRange({0, 0}, {2, 3}));
  EXPECT_THAT(validate(),
              ElementsAre(IssueIs(kNodeValidationError,
                                  "Application index range zr[0:3, 0:3] is "
                                  "outside signature index range "
                                  "zr[0:2, 0:3]")));
}

TEST_F(IPFSignatureAgreementTest, ShardDisagreesWithProjection) {
  addElementwiseIPFSignature();
  addIndexedOperation("S", "I");
  addIndexedShard("A0", makeRange({0, 0}, {1, 3}), makeRange({1, 0}, {2, 3}));

  std::vector<ValidationIssue> issues = validate();
  ASSERT_THAT(issues,
              ElementsAre(IssueIs(kNodeValidationError,
                                  "Application inputs key \"x[0]\" range "
                                  "zr[1:2, 0:3] != IPF projection "
                                  "zr[0:1, 0:3]"),
                          IssueIs(kNodeValidationError,
                                  "Application outputs key \"y[0]\" range "
                                  "zr[1:2, 0:3] != IPF projection "
                                  "zr[0:1, 0:3]")));
  EXPECT_EQ(issues[0].getContexts().back().name, "Application Node");
}

TEST_F(IPFSignatureAgreementTest, DanglingShardIndex) {
  addElementwiseIPFSignature();
  addIndexedOperation("S", "I");
  addApplication("A0", "Op", {{"x", {{"X", makeRange({0, 0}, {2, 3})}}}},
                 {{"y", {{"Y", makeRange({0, 0}, {2, 3})}}}}, "Missing");

  std::vector<ValidationIssue> issues = validate();
  ASSERT_THAT(issues, ElementsAre(IssueIs(kNodeReferenceError,
                                          "Referenced node does not exist")));
  EXPECT_EQ(issues[0].getContexts()[0].jsonPath,
            "$.nodes[@.id=='A0'].body.indexId");
}

TEST_F(IPFSignatureAgreementTest, UnindexedShardsAreSkipped) {
  addElementwiseIPFSignature();
  addIndexedOperation("S", "I");
  addApplication("A0", "Op", {{"x", {{"X", makeRange({1, 0}, {2, 3})}}}},
                 {{"y", {{"Y", makeRange({0, 0}, {2, 3})}}}});
  EXPECT_THAT(validate(), IsEmpty());
}

TEST(IPFSignatureAgreementDeathTest, RequiresIndexKinds) {
  ValidationEnvironment env;
  env.registerNodeKind(NodeKind::kOperationSignature);
  env.registerNodeKind(NodeKind::kApplication);
  EXPECT_DEATH(
      env.addConstraint(std::make_unique<IPFSignatureAgreementConstraint>()),
      "IPFSignatureAgreement requires the unregistered node kind "
      "IPFSignature");
}

}  // namespace
}  // namespace loom
