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


#include "loom/validation/validation_issue.h"

#include <cstdint>
#include <optional>
#include <string>

#include "llvm/Support/Error.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/JSON.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace loom {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Pair;

TEST(ValidationIssueTest, SummaryOnly) {
  ValidationIssue issue(kNodeValidationError, "bad thing");
  EXPECT_EQ(issue.getKind(), "NodeValidationError");
  EXPECT_EQ(issue.toDisplayString(), "* Error [NodeValidationError]: bad thing");
}

TEST(ValidationIssueTest, ParamsAreSorted) {
  ValidationIssue issue(kNodeValidationError, "dims");
  issue.addParam("z", "last").addParam("actualDimensions", 3);
  EXPECT_THAT(issue.getParams(), ElementsAre(Pair("actualDimensions", "3"),
                                             Pair("z", "last")));
  EXPECT_EQ(issue.toDisplayString(),
            "* Error [NodeValidationError]: dims\n"
            "   └> actualDimensions: 3\n"
            "   └> z: last");
}

TEST(ValidationIssueTest, FullDisplay) {
  ValidationIssue issue(kNodeReferenceError, "Referenced node does not exist");
  issue.addParam("nodeId", "X")
      .setMessage("look here")
      .addContext({"Reference", std::string("$.nodes[0]"), std::nullopt,
                   llvm::json::Value(llvm::json::Array{1, 2})});
  EXPECT_EQ(issue.toDisplayString(),
            "* Error [NodeReferenceError]: Referenced node does not exist\n"
            "   └> nodeId: X\n"
            "\n"
            "  look here\n"
            "\n"
            "  - Reference:: $.nodes[0]\n"
            "\n"
            "    |> [\n"
            "    |>   1,\n"
            "    |>   2\n"
            "    |> ]");
}

TEST(ValidationIssueTest, ContextMessageIsDedented) {
  ValidationContext context{"Note", std::nullopt,
                            std::string("\n    first\n      second\n"),
                            std::nullopt};
  EXPECT_EQ(context.toDisplayString(),
            "- Note::\n"
            "\n"
            "  first\n"
            "    second");
}

TEST(ValidationIssueTest, IssuesToDisplayString) {
  EXPECT_EQ(issuesToDisplayString({}), "No Validation Issues");
  EXPECT_EQ(issuesToDisplayString({ValidationIssue(kNodeValidationError, "one"),
                                   ValidationIssue(kReferenceCycleError,
                                                   "two")}),
            "Validation failed with 2 issues:\n"
            "\n"
            "* Error [NodeValidationError]: one\n"
            "\n"
            "* Error [ReferenceCycleError]: two\n");
}

TEST(ValidationIssueTest, ToJson) {
  ValidationIssue issue(kNodeValidationError, "bad");
  issue.addParam("k", "v").addContext(
      {"Ctx", std::string("$.x"), std::nullopt, llvm::json::Value(7)});
  EXPECT_EQ(llvm::formatv("{0}", toJSON(issue)).str(),
            R"({"contexts":[{"data":7,"jsonpath":"$.x","name":"Ctx"}],)"
            R"("kind":"NodeValidationError","params":{"k":"v"},)"
            R"("summary":"bad"})");
}

TEST(ValidationIssueCollectorTest, CheckSucceedsWhenEmpty) {
  ValidationIssueCollector collector;
  EXPECT_TRUE(collector.empty());
  llvm::Error error = collector.check();
  EXPECT_FALSE(static_cast<bool>(error));
}

TEST(ValidationIssueCollectorTest, CheckCarriesEveryIssue) {
  ValidationIssueCollector collector;
  collector.addIssue(ValidationIssue(kNodeValidationError, "one"));
  collector.addIssue(ValidationIssue(kNodeReferenceError, "two"));
  EXPECT_EQ(collector.size(), 2);

  int64_t carried = 0;
  llvm::handleAllErrors(collector.check(), [&](const ValidationError& error) {
    carried = error.getIssues().size();
  });
  EXPECT_EQ(carried, 2);

  std::string message = llvm::toString(collector.check());
  EXPECT_THAT(message, HasSubstr("Validation failed with 2 issues"));
  EXPECT_THAT(message, HasSubstr("* Error [NodeReferenceError]: two"));
}

}  // namespace
}  // namespace loom
