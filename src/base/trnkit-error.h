// base/trnkit-error.h

// Copyright 2026  trnkit authors

// See ../../COPYING for clarification regarding multiple authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//  http://www.apache.org/licenses/LICENSE-2.0
//
// THIS CODE IS PROVIDED *AS IS* BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, EITHER EXPRESS OR IMPLIED, INCLUDING WITHOUT LIMITATION ANY IMPLIED
// WARRANTIES OR CONDITIONS OF TITLE, FITNESS FOR A PARTICULAR PURPOSE,
// MERCHANTABLITY OR NON-INFRINGEMENT.
// See the Apache 2 License for the specific language governing permissions and
// limitations under the License.

#ifndef TRNKIT_BASE_TRNKIT_ERROR_H_
#define TRNKIT_BASE_TRNKIT_ERROR_H_ 1

#include <sstream>
#include <stdexcept>
#include <string>

#include "base/trnkit-types.h"
#include "base/trnkit-utils.h"

namespace trnkit {

/// \addtogroup error_group
/// @{

/// Set by ParseOptions::Read() from argv[0], with the directory removed.
/// Every log line names the program, since scoring scripts usually run
/// several trnkit programs with their stderr going to one log.
void SetProgramName(const char *basename);

/// Verbose level from the --verbose option; TRNKIT_VLOG(v) messages are
/// printed if v <= this.  Use {Get,Set}VerboseLevel().
extern int32 g_trnkit_verbose_level;

inline int32 GetVerboseLevel() { return g_trnkit_verbose_level; }

inline void SetVerboseLevel(int32 i) { g_trnkit_verbose_level = i; }

/// Where a log message came from and how serious it is.
struct LogMessageEnvelope {
  /// Verbose messages use the positive values (their TRNKIT_VLOG level).
  enum Severity {
    kAssertFailed = -3,
    kError = -2,
    kWarning = -1,
    kInfo = 0
  };
  int severity;
  const char *func;
  const char *file;  // Shortened to the last directory, e.g. "trn/x.cc".
  int32 line;
};

/// Thrown by TRNKIT_ERR once the message has been logged.  what() gives
/// the class name; TrnkitMessage() gives the text, e.g. for a tool that
/// wants to report a bad trn line again.
class TrnkitFatalError : public std::runtime_error {
 public:
  explicit TrnkitFatalError(const std::string &message)
      : std::runtime_error(message) { }

  const char *what() const noexcept override {
    return "trnkit::TrnkitFatalError";
  }

  const char *TrnkitMessage() const { return std::runtime_error::what(); }
};

/// Builds a message from "<<" insertions and logs it when assigned to a Log
/// or LogAndThrow; this is what the TRNKIT_* macros below expand to.
class MessageLogger {
 public:
  /// "func" and "file" are not copied.
  MessageLogger(LogMessageEnvelope::Severity severity, const char *func,
                const char *file, int32 line);

  template <typename T> MessageLogger &operator<<(const T &val) {
    ss_ << val;
    return *this;
  }

  struct Log {
    void operator=(const MessageLogger &logger) { logger.Emit(); }
  };

  struct LogAndThrow {
    [[noreturn]] void operator=(const MessageLogger &logger) {
      logger.Emit();
      throw TrnkitFatalError(logger.ss_.str());
    }
  };

 private:
  void Emit() const;

  LogMessageEnvelope envelope_;
  std::ostringstream ss_;
};

#define TRNKIT_MESSAGE_(severity)                                       \
  ::trnkit::MessageLogger(severity, __func__, __FILE__, __LINE__)

#define TRNKIT_ERR ::trnkit::MessageLogger::LogAndThrow() =             \
    TRNKIT_MESSAGE_(::trnkit::LogMessageEnvelope::kError)
#define TRNKIT_WARN ::trnkit::MessageLogger::Log() =                    \
    TRNKIT_MESSAGE_(::trnkit::LogMessageEnvelope::kWarning)
#define TRNKIT_LOG ::trnkit::MessageLogger::Log() =                     \
    TRNKIT_MESSAGE_(::trnkit::LogMessageEnvelope::kInfo)
#define TRNKIT_VLOG(v) if ((v) <= ::trnkit::GetVerboseLevel())          \
    ::trnkit::MessageLogger::Log() = TRNKIT_MESSAGE_(                   \
        static_cast< ::trnkit::LogMessageEnvelope::Severity>(v))

[[noreturn]] void TrnkitAssertFailure_(const char *func, const char *file,
                                       int32 line, const char *cond_str);

#ifndef NDEBUG
#define TRNKIT_ASSERT(cond) do {                                        \
    if (!(cond))                                                        \
      ::trnkit::TrnkitAssertFailure_(__func__, __FILE__, __LINE__, #cond); \
  } while (0)
#else
#define TRNKIT_ASSERT(cond) (void)0
#endif

/// A log handler receives every message instead of stderr, e.g. to collect
/// per-line trn warnings in a test or a host program.  It must be
/// thread-safe if trn files are read with --num-threads > 1.
typedef void (*LogHandler)(const LogMessageEnvelope &envelope,
                           const char *message);

/// Installs "handler" (NULL restores printing to stderr) and returns the
/// previous one.  Not thread-safe.
LogHandler SetLogHandler(LogHandler handler);

/// The line the default handler prints for a message, without the newline,
/// e.g. "WARNING (copy-trn[1.0.0]:Next():trn/trn-reader.cc:120) text".
std::string FormatLogMessage(const LogMessageEnvelope &envelope,
                             const char *message);

/// @} end "addtogroup error_group"

}  // namespace trnkit

#endif  // TRNKIT_BASE_TRNKIT_ERROR_H_
