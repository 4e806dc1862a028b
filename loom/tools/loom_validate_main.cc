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


// Validates the shard geometry of a graph document.
//
// Usage:
//   loom_validate <graph.json> [--format=text|json] [--dump-dir=<dir>]
//   cat graph.json | loom_validate -
//
// Exits with 0 if the graph is valid, 1 if it has issues and 2 if it cannot be
// read.

#include <memory>
#include <string>
#include <utility>

#include "llvm/Support/CommandLine.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/raw_ostream.h"
#include "loom/common/file_utils.h"
#include "loom/common/logging.h"
#include "loom/graph/document.h"
#include "loom/graph/graph.h"
#include "loom/validation/environment.h"
#include "loom/validation/validation_issue.h"

namespace {

enum class ReportFormat { kText, kJson };

enum ExitCode { kValid = 0, kInvalid = 1, kInputError = 2 };

llvm::cl::opt<std::string> inputFilename(llvm::cl::Positional,
                                         llvm::cl::desc("<graph document>"),
                                         llvm::cl::init("-"));

llvm::cl::opt<ReportFormat> formatOption(
    "format", llvm::cl::desc("Report format"),
    llvm::cl::values(
        clEnumValN(ReportFormat::kText, "text", "Human readable issue list"),
        clEnumValN(ReportFormat::kJson, "json", "JSON issue list")),
    llvm::cl::init(ReportFormat::kText));

llvm::cl::opt<std::string> dumpDirectoryOption(
    "dump-dir",
    llvm::cl::desc("Directory to save the JSON report to, in addition to "
                   "printing it"),
    llvm::cl::init(""));

llvm::cl::opt<int> vlogOption("vlog",
                              llvm::cl::desc("Verbosity of LOOM_VLOG logs"),
                              llvm::cl::init(0));

llvm::json::Value makeReport(const loom::Graph& graph,
                             const loom::ValidationIssueCollector& collector) {
  llvm::json::Array issues;
  for (const loom::ValidationIssue& issue : collector.getIssues()) {
    issues.push_back(toJSON(issue));
  }
  return llvm::json::Object{{"graph", graph.getId()},
                            {"valid", collector.empty()},
                            {"issues", std::move(issues)}};
}

}  // namespace

int main(int argc, char** argv) {
  llvm::InitLLVM initLLVM(argc, argv);
  llvm::cl::ParseCommandLineOptions(argc, argv,
                                    "Loom shard geometry validator\n");
  loom::log::setVlogLevel(vlogOption);

  llvm::Expected<std::unique_ptr<llvm::MemoryBuffer>> buffer =
      loom::readInputFile(inputFilename.getValue());
  if (!buffer) {
    LOOM_LOG(ERROR) << llvm::toString(buffer.takeError());
    return kInputError;
  }
  llvm::Expected<loom::Graph> graph =
      loom::parseGraphText((*buffer)->getBuffer());
  if (!graph) {
    LOOM_LOG(ERROR) << "invalid graph document " << inputFilename.getValue()
                    << ": " << llvm::toString(graph.takeError());
    return kInputError;
  }

  loom::ValidationEnvironment env =
      loom::ValidationEnvironment::createDefault();
  loom::ValidationIssueCollector collector;
  env.validate(*graph, collector);

  llvm::json::Value report = makeReport(*graph, collector);
  switch (formatOption.getValue()) {
    case ReportFormat::kText:
      if (collector.empty()) {
        llvm::outs() << "graph '" << graph->getId() << "' is valid\n";
      } else {
        llvm::outs() << loom::issuesToDisplayString(collector.getIssues())
                     << "\n";
      }
      break;
    case ReportFormat::kJson:
      llvm::outs() << llvm::formatv("{0:2}", report) << "\n";
      break;
  }
  loom::saveReport(report, dumpDirectoryOption.getValue(),
                   "validation_report");

  LOOM_VLOG(1) << "found " << collector.size() << " issues in "
               << graph->size() << " nodes";
  return collector.empty() ? kValid : kInvalid;
}
