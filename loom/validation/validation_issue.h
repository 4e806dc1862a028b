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


#ifndef LOOM_VALIDATION_VALIDATION_ISSUE_H_
#define LOOM_VALIDATION_VALIDATION_ISSUE_H_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/raw_ostream.h"

namespace loom {

// Issue kinds.
inline constexpr llvm::StringLiteral kNodeValidationError =
    "NodeValidationError";
inline constexpr llvm::StringLiteral kNodeReferenceError = "NodeReferenceError";
inline constexpr llvm::StringLiteral kReferenceCycleError =
    "ReferenceCycleError";

// A named piece of evidence attached to an issue: where in the graph document
// it was found and, optionally, a snapshot of the offending value.
struct ValidationContext {
  std::string name;
  std::optional<std::string> jsonPath;
  std::optional<std::string> message;
  std::optional<llvm::json::Value> data;

  // Formats the context as
  //
  //   - name:: jsonPath
  //
  //     message
  //
  //     |> data
  std::string toDisplayString() const;
};

// A description of a validation failure.
class ValidationIssue {
 public:
  ValidationIssue(llvm::StringRef kind, std::string summary);

  ValidationIssue& addParam(llvm::StringRef key, llvm::StringRef value);
  ValidationIssue& addParam(llvm::StringRef key, int64_t value);
  ValidationIssue& setMessage(std::string message);
  ValidationIssue& addContext(ValidationContext context);
  ValidationIssue& addContexts(llvm::ArrayRef<ValidationContext> contexts);

  llvm::StringRef getKind() const { return kind; }
  const std::map<std::string, std::string>& getParams() const {
    return params;
  }
  llvm::StringRef getSummary() const { return summary; }
  const std::optional<std::string>& getMessage() const { return message; }
  llvm::ArrayRef<ValidationContext> getContexts() const { return contexts; }

  std::string toDisplayString() const;

 private:
  std::string kind;
  std::map<std::string, std::string> params;
  std::string summary;
  std::optional<std::string> message;
  std::vector<ValidationContext> contexts;
};

// Formats `issues` as a numbered report, or "No Validation Issues".
std::string issuesToDisplayString(llvm::ArrayRef<ValidationIssue> issues);

llvm::json::Value toJSON(const ValidationContext& context);
llvm::json::Value toJSON(const ValidationIssue& issue);

// The aggregate failure of a validation pass.
class ValidationError : public llvm::ErrorInfo<ValidationError> {
 public:
  static char ID;

  explicit ValidationError(std::vector<ValidationIssue> issues);

  llvm::ArrayRef<ValidationIssue> getIssues() const { return issues; }

  void log(llvm::raw_ostream& os) const override;
  std::error_code convertToErrorCode() const override;

 private:
  std::vector<ValidationIssue> issues;
};

// Accumulates the issues of a validation pass, in the order they are found.
class ValidationIssueCollector {
 public:
  void addIssue(ValidationIssue issue);

  llvm::ArrayRef<ValidationIssue> getIssues() const { return issues; }
  bool empty() const { return issues.empty(); }
  int64_t size() const { return issues.size(); }

  // Returns a `ValidationError` carrying every collected issue, or success if
  // there are none.
  llvm::Error check() const;

 private:
  std::vector<ValidationIssue> issues;
};

}  // namespace loom

#endif  // LOOM_VALIDATION_VALIDATION_ISSUE_H_
