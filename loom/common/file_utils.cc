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

#include "loom/common/file_utils.h"

#include <memory>
#include <optional>
#include <string>
#include <system_error>

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"
#include "loom/common/logging.h"

namespace loom {

namespace {

void fileSavingError(llvm::StringRef filePath, llvm::StringRef message) {
  LOOM_LOG(ERROR) << llvm::formatv("error when writing file {0}: {1}",
                                   filePath, message);
}

void saveReportInternal(const llvm::json::Value& report,
                        llvm::StringRef dumpDirectory,
                        llvm::StringRef fileName) {
  if (dumpDirectory.empty()) {
    return;
  }
  if (std::error_code errorCode =
          llvm::sys::fs::create_directories(dumpDirectory)) {
    fileSavingError(dumpDirectory, errorCode.message());
    return;
  }
  llvm::SmallString<128> filePath(dumpDirectory);
  llvm::sys::path::append(filePath, fileName);
  filePath.append(".json");

  std::error_code errorCode;
  llvm::raw_fd_ostream fileStream(filePath, errorCode);
  if (errorCode) {
    fileSavingError(filePath.str(), errorCode.message());
    return;
  }
  fileStream << llvm::formatv("{0:2}", report) << "\n";
  fileStream.close();
  if (fileStream.has_error()) {
    fileSavingError(filePath.str(), fileStream.error().message());
    fileStream.clear_error();
    return;
  }
  LOOM_VLOG(1) << "saved report to " << filePath;
}

}  // namespace

llvm::Expected<std::unique_ptr<llvm::MemoryBuffer>> readInputFile(
    llvm::StringRef path) {
  llvm::ErrorOr<std::unique_ptr<llvm::MemoryBuffer>> buffer =
      llvm::MemoryBuffer::getFileOrSTDIN(path);
  if (std::error_code errorCode = buffer.getError()) {
    return llvm::createStringError(
        errorCode, llvm::formatv("cannot read {0}: {1}", path,
                                 errorCode.message())
                       .str());
  }
  return std::move(*buffer);
}

void saveReport(const llvm::json::Value& report, llvm::StringRef dumpDirectory,
                llvm::StringRef fileName, std::optional<int> dumpIndex) {
  if (!dumpIndex) {
    return saveReportInternal(report, dumpDirectory, fileName);
  }
  return saveReportInternal(
      report, dumpDirectory,
      llvm::formatv("{0:02}.{1}", *dumpIndex, fileName).str());
}

}  // namespace loom
