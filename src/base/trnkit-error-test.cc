// base/trnkit-error-test.cc

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

#include "base/trnkit-common.h"

namespace trnkit {

void MyFunction2() { TRNKIT_ERR << "Ignore this error"; }

void MyFunction1() { MyFunction2(); }

void UnitTestError() {
  std::cerr << "Ignore next error:\n";
  MyFunction1();
}

static bool StartsWith(const std::string &s, const std::string &prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

static bool EndsWith(const std::string &s, const std::string &suffix) {
  return s.size() >= suffix.size() &&
      s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void TestFormatLogMessage() {
  SetProgramName("trnkit-error-test");
  LogMessageEnvelope envelope;
  envelope.severity = LogMessageEnvelope::kWarning;
  envelope.func = "Next";
  envelope.file = "trn/trn-reader.cc";
  envelope.line = 12;
  std::string line = FormatLogMessage(envelope, "bad line");
  TRNKIT_ASSERT(StartsWith(line, "WARNING (trnkit-error-test["));
  TRNKIT_ASSERT(EndsWith(line, "]:Next():trn/trn-reader.cc:12) bad line"));

  envelope.severity = 2;
  TRNKIT_ASSERT(StartsWith(FormatLogMessage(envelope, "x"), "VLOG[2] ("));
  envelope.severity = LogMessageEnvelope::kError;
  TRNKIT_ASSERT(StartsWith(FormatLogMessage(envelope, "x"), "ERROR ("));
  envelope.severity = LogMessageEnvelope::kInfo;
  TRNKIT_ASSERT(StartsWith(FormatLogMessage(envelope, "x"), "LOG ("));
}

static std::vector<int> g_severities;
static std::vector<std::string> g_messages;
static std::vector<std::string> g_files;

void RecordingHandler(const LogMessageEnvelope &envelope,
                      const char *message) {
  g_severities.push_back(envelope.severity);
  g_messages.push_back(message);
  g_files.push_back(envelope.file);
}

void TestLogHandler() {
  LogHandler old_handler = SetLogHandler(RecordingHandler);
  int32 old_verbose = GetVerboseLevel();
  SetVerboseLevel(1);
  TRNKIT_LOG << "info " << 1;
  TRNKIT_WARN << "warning " << 2;
  TRNKIT_VLOG(1) << "verbose " << 3;
  TRNKIT_VLOG(2) << "not shown";
  bool threw = false;
  try {
    TRNKIT_ERR << "error " << 4;
  } catch (const TrnkitFatalError &e) {
    threw = true;
    TRNKIT_ASSERT(std::string(e.TrnkitMessage()) == "error 4");
    TRNKIT_ASSERT(std::string(e.what()) == "trnkit::TrnkitFatalError");
  }
  SetLogHandler(old_handler);
  SetVerboseLevel(old_verbose);

  TRNKIT_ASSERT(threw);
  TRNKIT_ASSERT(g_severities.size() == 4);
  TRNKIT_ASSERT(g_severities[0] == LogMessageEnvelope::kInfo);
  TRNKIT_ASSERT(g_severities[1] == LogMessageEnvelope::kWarning);
  TRNKIT_ASSERT(g_severities[2] == 1);
  TRNKIT_ASSERT(g_severities[3] == LogMessageEnvelope::kError);
  TRNKIT_ASSERT(g_messages[0] == "info 1");
  TRNKIT_ASSERT(g_messages[2] == "verbose 3");
  // The file name keeps one directory.
  TRNKIT_ASSERT(g_files[1] == "base/trnkit-error-test.cc");
}

}  // namespace trnkit

int main() {
  trnkit::TestFormatLogMessage();
  trnkit::TestLogHandler();

  trnkit::SetProgramName("trnkit-error-test");
  try {
    trnkit::UnitTestError();
    TRNKIT_ASSERT(0);  // should not happen.
    exit(1);
  } catch (trnkit::TrnkitFatalError &e) {
    std::cout << "The error we generated was: '" << e.TrnkitMessage() << "'\n";
  }
}
