// Copyright 2026 The Distgen Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// A rudimentary logging interface similar to a subset of "base/logging.h".
// Everything goes to stderr. LOG(FATAL) and failed CHECKs abort.

#ifndef THIRD_PARTY_DISTGEN_LOGGING_H_
#define THIRD_PARTY_DISTGEN_LOGGING_H_

#include <stdlib.h>

#include <atomic>
#include <iostream>
#include <string_view>

#include "absl/strings/string_view.h"

namespace distgen {

enum class LogSeverity { kInfo, kWarning, kError, kFatal };

// Verbosity threshold for VLOG(). Set from --v in main().
inline std::atomic<int> &VerbosityLevel() {
  static std::atomic<int> level{0};
  return level;
}

class TinyLogger {
 public:
  TinyLogger(absl::string_view file, int line, LogSeverity severity)
      : fatal_{severity == LogSeverity::kFatal} {
    std::cerr << SeverityChar(severity) << " " << file << ":" << line << "] ";
  }
  ~TinyLogger() {
    std::cerr << std::endl;
    if (fatal_) abort();
  }
  template <typename Type>
  TinyLogger &operator<<(const Type &data) {
    std::cerr << data;
    return *this;
  }

 private:
  static char SeverityChar(LogSeverity severity) {
    switch (severity) {
      case LogSeverity::kInfo:
        return 'I';
      case LogSeverity::kWarning:
        return 'W';
      case LogSeverity::kError:
        return 'E';
      case LogSeverity::kFatal:
        return 'F';
    }
    return '?';
  }

  const bool fatal_;
};

}  // namespace distgen

#define DISTGEN_SEVERITY_INFO ::distgen::LogSeverity::kInfo
#define DISTGEN_SEVERITY_WARNING ::distgen::LogSeverity::kWarning
#define DISTGEN_SEVERITY_ERROR ::distgen::LogSeverity::kError
#define DISTGEN_SEVERITY_FATAL ::distgen::LogSeverity::kFatal

#define LOG_IMPL(severity) \
  ::distgen::TinyLogger { __FILE__, __LINE__, (severity) }
#undef LOG
#define LOG(severity) LOG_IMPL(DISTGEN_SEVERITY_##severity)
#undef VLOG
   // NOTE: The `if` is intentionally dangling to allow trailing `<<`s.
   // clang-format off
#define VLOG(logging_level) \
  if ((logging_level) <= ::distgen::VerbosityLevel().load()) LOG(INFO)
   // clang-format on

#undef CHECK_COND
   // clang-format off
#define CHECK_COND(a, b, cond) \
  if (!((a)cond(b)))                                                   \
    LOG_IMPL(DISTGEN_SEVERITY_FATAL) << "Check failed: " << #a << #cond \
                                     << #b << " [" << (a) << #cond      \
                                     << (b) << "] "
   // clang-format on
#undef CHECK_EQ
#define CHECK_EQ(a, b) CHECK_COND(a, b, ==)
#undef CHECK_NE
#define CHECK_NE(a, b) CHECK_COND(a, b, !=)
#undef CHECK_GT
#define CHECK_GT(a, b) CHECK_COND(a, b, >)
#undef CHECK_GE
#define CHECK_GE(a, b) CHECK_COND(a, b, >=)
#undef CHECK_LT
#define CHECK_LT(a, b) CHECK_COND(a, b, <)
#undef CHECK_LE
#define CHECK_LE(a, b) CHECK_COND(a, b, <=)
#undef CHECK
#define CHECK(condition) CHECK_NE(!!(condition), false)

// Easy variable value logging: LOG(INFO) << VV(foo) << VV(bar);
#define VV(x) #x "=" << (x) << " "

#endif  // THIRD_PARTY_DISTGEN_LOGGING_H_
