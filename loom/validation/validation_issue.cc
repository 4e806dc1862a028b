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

#include <algorithm>
#include <cstdint>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/raw_ostream.h"

namespace loom {

namespace {

// Strips the indentation shared by every non-blank line of `text`, then
// prefixes each non-blank line with `prefix`.
std::string reindent(llvm::StringRef text, llvm::StringRef prefix) {
  llvm::SmallVector<llvm::StringRef> lines;
  text.split(lines, '\n');
  size_t common = llvm::StringRef::npos;
  for (llvm::StringRef line : lines) {
    if (!line.trim().empty()) {
      common = std::min(common, line.size() - line.ltrim().size());
    }
  }
  if (common == llvm::StringRef::npos) {
    common = 0;
  }
  std::string result;
  llvm::raw_string_ostream os(result);
  llvm::interleave(
      lines, os,
      [&](llvm::StringRef line) {
        if (!line.trim().empty()) {
          os << prefix << line.drop_front(common);
        }
      },
      "\n");
  return os.str();
}

}  // namespace

std::string ValidationContext::toDisplayString() const {
  std::string result;
  llvm::raw_string_ostream os(result);
  os << "- " << name << "::";
  if (jsonPath) {
    os << " " << *jsonPath;
  }
  if (message) {
    llvm::StringRef trimmed = llvm::StringRef(*message).rtrim().ltrim('\n');
    if (!trimmed.empty()) {
      os << "\n\n" << reindent(trimmed, "  ");
    }
  }
  if (data) {
    os << "\n\n" << reindent(llvm::formatv("{0:2}", *data).str(), "  |> ");
  }
  return os.str();
}

ValidationIssue::ValidationIssue(llvm::StringRef kind, std::string summary)
    : kind(kind.str()), summary(std::move(summary)) {}

ValidationIssue& ValidationIssue::addParam(llvm::StringRef key,
                                           llvm::StringRef value) {
  params[key.str()] = value.str();
  return *this;
}

ValidationIssue& ValidationIssue::addParam(llvm::StringRef key,
                                           int64_t value) {
  params[key.str()] = std::to_string(value);
  return *this;
}

ValidationIssue& ValidationIssue::setMessage(std::string message) {
  this->message = std::move(message);
  return *this;
}

ValidationIssue& ValidationIssue::addContext(ValidationContext context) {
  contexts.push_back(std::move(context));
  return *this;
}

ValidationIssue& ValidationIssue::addContexts(
    llvm::ArrayRef<ValidationContext> contexts) {
  this->contexts.insert(this->contexts.end(), contexts.begin(),
                        contexts.end());
  return *this;
}

std::string ValidationIssue::toDisplayString() const {
  std::string result;
  llvm::raw_string_ostream os(result);
  os << "* Error [" << kind << "]: " << summary;
  for (const auto& [key, value] : params) {
    os << "\n   └> " << key << ": " << value;
  }
  if (message) {
    os << "\n\n" << reindent(*message, "  ");
  }
  for (const ValidationContext& context : contexts) {
    os << "\n\n" << reindent(context.toDisplayString(), "  ");
  }
  return os.str();
}

std::string issuesToDisplayString(llvm::ArrayRef<ValidationIssue> issues) {
  if (issues.empty()) {
    return "No Validation Issues";
  }
  std::string result;
  llvm::raw_string_ostream os(result);
  os << "Validation failed with " << issues.size() << " issues:\n\n";
  llvm::interleave(
      issues, os,
      [&](const ValidationIssue& issue) { os << issue.toDisplayString(); },
      "\n\n");
  os << "\n";
  return os.str();
}

llvm::json::Value toJSON(const ValidationContext& context) {
  llvm::json::Object object{{"name", context.name}};
  if (context.jsonPath) {
    object["jsonpath"] = *context.jsonPath;
  }
  if (context.message) {
    object["message"] = *context.message;
  }
  if (context.data) {
    object["data"] = *context.data;
  }
  return object;
}

llvm::json::Value toJSON(const ValidationIssue& issue) {
  llvm::json::Object object{{"kind", issue.getKind()},
                            {"summary", issue.getSummary()}};
  if (!issue.getParams().empty()) {
    llvm::json::Object params;
    for (const auto& [key, value] : issue.getParams()) {
      params[key] = value;
    }
    object["params"] = std::move(params);
  }
  if (issue.getMessage()) {
    object["message"] = *issue.getMessage();
  }
  if (!issue.getContexts().empty()) {
    llvm::json::Array contexts;
    for (const ValidationContext& context : issue.getContexts()) {
      contexts.push_back(toJSON(context));
    }
    object["contexts"] = std::move(contexts);
  }
  return object;
}

char ValidationError::ID = 0;

ValidationError::ValidationError(std::vector<ValidationIssue> issues)
    : issues(std::move(issues)) {}

void ValidationError::log(llvm::raw_ostream& os) const {
  os << issuesToDisplayString(issues);
}

std::error_code ValidationError::convertToErrorCode() const {
  return llvm::inconvertibleErrorCode();
}

void ValidationIssueCollector::addIssue(ValidationIssue issue) {
  issues.push_back(std::move(issue));
}

llvm::Error ValidationIssueCollector::check() const {
  if (issues.empty()) {
    return llvm::Error::success();
  }
  return llvm::make_error<ValidationError>(issues);
}

}  // namespace loom
