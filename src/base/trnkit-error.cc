// base/trnkit-error.cc

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

#include <cstdio>
#include <cstdlib>
#include <iostream>

#include "base/trnkit-error.h"

#ifndef TRNKIT_VERSION
#define TRNKIT_VERSION "unknown"
#endif

namespace trnkit {

int32 g_trnkit_verbose_level = 0;
static std::string g_program_name;
static LogHandler g_log_handler = NULL;

void SetProgramName(const char *basename) {
  g_program_name = basename;
}

// "/x/y/src/trn/trn-reader.cc" -> "trn/trn-reader.cc".
static const char *ShortFileName(const char *path) {
  if (path == NULL)
    return "";
  const char *last = path, *before_last = path;
  for (const char *p = path; *p != '\0'; p++) {
    if (*p == '/' || *p == '\\') {
      before_last = last;
      last = p + 1;
    }
  }
  return before_last;
}

static const char *SeverityName(int severity) {
  switch (severity) {
    case LogMessageEnvelope::kInfo: return "LOG";
    case LogMessageEnvelope::kWarning: return "WARNING";
    case LogMessageEnvelope::kAssertFailed: return "ASSERTION_FAILED";
    default: return "ERROR";
  }
}

std::string FormatLogMessage(const LogMessageEnvelope &envelope,
                             const char *message) {
  std::ostringstream os;
  if (envelope.severity > LogMessageEnvelope::kInfo)
    os << "VLOG[" << envelope.severity << "]";
  else
    os << SeverityName(envelope.severity);
  os << " (" << g_program_name << "[" TRNKIT_VERSION "]:" << envelope.func
     << "():" << envelope.file << ':' << envelope.line << ") " << message;
  return os.str();
}

MessageLogger::MessageLogger(LogMessageEnvelope::Severity severity,
                             const char *func, const char *file,
                             int32 line) {
  envelope_.severity = severity;
  envelope_.func = func;
  envelope_.file = ShortFileName(file);
  envelope_.line = line;
}

void MessageLogger::Emit() const {
  std::string message = ss_.str();
  if (g_log_handler != NULL) {
    g_log_handler(envelope_, message.c_str());
    return;
  }
  // One write per message, so lines from parsing threads do not interleave.
  std::cerr << FormatLogMessage(envelope_, message.c_str()) + "\n";
  std::cerr.flush();
}

void TrnkitAssertFailure_(const char *func, const char *file, int32 line,
                          const char *cond_str) {
  MessageLogger::Log() =
      MessageLogger(LogMessageEnvelope::kAssertFailed, func, file, line)
      << "Assertion failed: (" << cond_str << ")";
  std::fflush(NULL);
  std::abort();
}

LogHandler SetLogHandler(LogHandler handler) {
  LogHandler old_handler = g_log_handler;
  g_log_handler = handler;
  return old_handler;
}

}  // namespace trnkit
