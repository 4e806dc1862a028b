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

#include "loom/common/logging.h"

#include <atomic>
#include <chrono>  // NOLINT(build/c++11)
#include <cstdint>
#include <ctime>

#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/ManagedStatic.h"
#include "llvm/Support/Mutex.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

namespace loom {
namespace log {

namespace {

llvm::ManagedStatic<llvm::sys::Mutex> sinkMutex;
llvm::raw_ostream* sinkOverride = nullptr;

std::atomic<int> vlogLevel{0};

constexpr char kSeverityTags[] = {'I', 'W', 'E', 'F'};

void writePrefix(llvm::raw_ostream& os, LogSeverity severity,
                 const char* file, int line) {
  auto now = std::chrono::system_clock::now();
  std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  int64_t millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                       now.time_since_epoch())
                       .count() %
                   1000;
  std::tm local;
  localtime_r(&seconds, &local);
  os << llvm::formatv("loom {0} {1:02}:{2:02}:{3:02}.{4:03} {5}:{6}] ",
                      kSeverityTags[severity], local.tm_hour, local.tm_min,
                      local.tm_sec, millis, llvm::sys::path::filename(file),
                      line);
}

}  // namespace

void setVlogLevel(int level) { vlogLevel.store(level); }

int getVlogLevel() { return vlogLevel.load(); }

void setLogSink(llvm::raw_ostream* sink) {
  llvm::sys::ScopedLock lock(*sinkMutex);
  sinkOverride = sink;
}

llvm::raw_ostream& nullStream() {
  thread_local llvm::raw_null_ostream stream;
  return stream;
}

LogLine::LogLine(LogSeverity severity, const char* file, int line,
                 const char* failedCondition)
    : severity(severity), os(text) {
  writePrefix(os, severity, file, line);
  if (failedCondition) {
    os << "Check failed: " << failedCondition << " ";
  }
}

LogLine::~LogLine() {
  if (severity == FATAL) {
    return;
  }
  os.flush();
  llvm::sys::ScopedLock lock(*sinkMutex);
  llvm::raw_ostream& out = sinkOverride ? *sinkOverride
                           : severity == INFO ? llvm::outs()
                                              : llvm::errs();
  out << text << "\n";
  out.flush();
}

FatalLogLine::FatalLogLine(const char* file, int line,
                           const char* failedCondition)
    : LogLine(FATAL, file, line, failedCondition) {}

FatalLogLine::~FatalLogLine() {
  os.flush();
  llvm::report_fatal_error(llvm::StringRef(text));
}

}  // namespace log
}  // namespace loom
