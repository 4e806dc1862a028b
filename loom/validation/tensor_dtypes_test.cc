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


#include "loom/validation/tensor_dtypes.h"

#include <string>
#include <vector>

#include "llvm/Support/JSON.h"
#include "loom/validation/testing_utils.h"
#include "loom/validation/validation_issue.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace loom {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Pair;

class TensorDTypesTest : public ValidationTestBase {
 protected:
  std::vector<ValidationIssue> validate() {
    return ValidationTestBase::validate(constraint);
  }

  TensorDTypesConstraint constraint;
};

TEST_F(TensorDTypesTest, DefaultDTypes) {
  addTensor("A", makeRange({0}, {4}), "int32");
  addTensor("B", makeRange({0}, {4}), "float32");
  EXPECT_THAT(validate(), IsEmpty());
}

TEST_F(TensorDTypesTest, InvalidDType) {
  addTensor("A", makeRange({0}, {4}), "int32");
  addTensor("B", makeRange({0}, {4}), "bfloat16");

  std::vector<ValidationIssue> issues = validate();
  ASSERT_THAT(issues, ElementsAre(IssueIs(
                          kNodeValidationError,
                          "Tensor has an invalid dtype \"bfloat16\"")));
  EXPECT_THAT(issues[0].getParams(),
              ElementsAre(Pair("dtype", "bfloat16"), Pair("nodeId", "B"),
                          Pair("validDTypes", "float32, int32")));
  ASSERT_EQ(issues[0].getContexts().size(), 2u);
  EXPECT_EQ(issues[0].getContexts()[0].jsonPath,
            "$.nodes[@.id=='B'].body.dtype");
  EXPECT_EQ(issues[0].getContexts()[0].data, llvm::json::Value("bfloat16"));
  EXPECT_EQ(issues[0].getContexts()[1].name, "Tensor Node");
}

TEST_F(TensorDTypesTest, ConfiguredDTypes) {
  env.setValidDTypes({"bfloat16"});
  addTensor("A", makeRange({0}, {4}), "int32");
  addTensor("B", makeRange({0}, {4}), "bfloat16");
  EXPECT_THAT(validate(),
              ElementsAre(IssueIs(kNodeValidationError,
                                  "Tensor has an invalid dtype \"int32\"")));
}

}  // namespace
}  // namespace loom
