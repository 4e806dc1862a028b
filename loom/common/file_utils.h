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

#ifndef LOOM_COMMON_FILE_UTILS_H_
#define LOOM_COMMON_FILE_UTILS_H_

#include <memory>
#include <optional>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/MemoryBuffer.h"

namespace loom {

// Reads the whole of `path` into memory. A path of "-" reads standard input.
llvm::Expected<std::unique_ptr<llvm::MemoryBuffer>> readInputFile(
    llvm::StringRef path);

// Saves `report` as pretty-printed JSON to the given `dumpDirectory` with name
// `fileName`.
//
// NOTE:
// - if there is an existing file in `dumpDirectory` with the same name, it will
//   be overwritten.
// - if `dumpDirectory` is an empty string, nothing will be saved.
// - if `dumpDirectory` path doesn't exist yet, it will try to create it.
// - if `dumpIndex` is present, it will be included as a prefix in the filename.
// - any error will be logged to standard error.
// - do not include a file extension in `fileName`, `.json` will be appended
//   internally.
void saveReport(const llvm::json::Value& report, llvm::StringRef dumpDirectory,
                llvm::StringRef fileName,
                std::optional<int> dumpIndex = std::nullopt);

}  // namespace loom

#endif  // LOOM_COMMON_FILE_UTILS_H_
