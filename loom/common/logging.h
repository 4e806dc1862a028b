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

#ifndef LOOM_COMMON_LOGGING_H_
#define LOOM_COMMON_LOGGING_H_

#include <string>

#include "llvm/Support/raw_ostream.h"

// Streaming log and check macros.
//
//   LOOM_LOG(WARNING) << "dropping " << n << " nodes";
//   LOOM_VLOG(1) << "visited " << node.getId();
//   LOOM_CHECK_EQ(lhs.getRank(), rhs.getRank()) << "mismatched ranks";
//
// Every line is prefixed with `loom <S> hh:mm:ss.mmm file.cc:line] `, where
// <S> is one of I, W, E and F. INFO goes to stdout, WARNING and ERROR go to
// stderr, unless a sink is installed with `setLogSink`. FATAL and failed
// checks end the process through `llvm::report_fatal_error`.

namespace loom {
namespace log {

enum LogSeverity { INFO, WARNING, ERROR, FATAL };

// Buffers one log line and emits it on destruction.
class LogLine {
 public:
  LogLine(LogSeverity severity, const char* file, int line,
          const char* failedCondition);
  ~LogLine();

  llvm::raw_ostream& stream() { return os; }

 protected:
  LogSeverity severity;
  std::string text;
  llvm::raw_string_ostream os;
};

class FatalLogLine : public LogLine {
 public:
  FatalLogLine(const char* file, int line, const char* failedCondition);
  [[noreturn]] ~FatalLogLine();
};

// Messages logged with LOOM_VLOG(n) are emitted iff n <= level. Defaults to 0.
void setVlogLevel(int level);
int getVlogLevel();

// Sends every non-fatal line to `sink` instead of stdout and stderr. A null
// sink restores the default routing. `sink` must outlive its installation.
void setLogSink(llvm::raw_ostream* sink);

llvm::raw_ostream& nullStream();

}  // namespace log
}  // namespace loom

#define LOOM_LOG(severity) LOOM_LOG_LINE_##severity(nullptr)

#define LOOM_VLOG_IS_ON(level) ((level) <= ::loom::log::getVlogLevel())

#define LOOM_VLOG(level)                                  \
  !LOOM_VLOG_IS_ON(level) ? ::loom::log::nullStream() \
                          : LOOM_LOG(INFO)

#define LOOM_CHECK(condition)         \
  (condition) ? ::loom::log::nullStream() \
              : LOOM_LOG_LINE_FATAL(#condition)

#define LOOM_CHECK_EQ(lhs, rhs) LOOM_CHECK_OP(==, lhs, rhs)
#define LOOM_CHECK_NE(lhs, rhs) LOOM_CHECK_OP(!=, lhs, rhs)
#define LOOM_CHECK_LE(lhs, rhs) LOOM_CHECK_OP(<=, lhs, rhs)
#define LOOM_CHECK_LT(lhs, rhs) LOOM_CHECK_OP(<, lhs, rhs)
#define LOOM_CHECK_GE(lhs, rhs) LOOM_CHECK_OP(>=, lhs, rhs)
#define LOOM_CHECK_GT(lhs, rhs) LOOM_CHECK_OP(>, lhs, rhs)

#define LOOM_CHECK_OP(op, lhs, rhs) \
  LOOM_CHECK((lhs) op (rhs)) << "(" << (lhs) << " vs. " << (rhs) << ") "

#define LOOM_LOG_LINE_INFO(condition)                                      \
  ::loom::log::LogLine(::loom::log::INFO, __FILE__, __LINE__, condition) \
      .stream()
#define LOOM_LOG_LINE_WARNING(condition)                                      \
  ::loom::log::LogLine(::loom::log::WARNING, __FILE__, __LINE__, condition) \
      .stream()
#define LOOM_LOG_LINE_ERROR(condition)                                      \
  ::loom::log::LogLine(::loom::log::ERROR, __FILE__, __LINE__, condition) \
      .stream()
#define LOOM_LOG_LINE_FATAL(condition) \
  ::loom::log::FatalLogLine(__FILE__, __LINE__, condition).stream()

#endif  // LOOM_COMMON_LOGGING_H_
