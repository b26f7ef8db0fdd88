// trn/trn-parser-test.cc

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

#include "trn/trn-parser.h"
#include "trn/transcript-utils.h"

namespace trnkit {

static TranscriptEntry Tok(const std::string &token) {
  return TranscriptEntry(token);
}

static TranscriptEntry Alt(const std::vector<TranscriptEntry::Branch> &b) {
  return TranscriptEntry(b);
}

static TranscriptEntry::Branch Br(const char *a = NULL, const char *b = NULL) {
  TranscriptEntry::Branch ans;
  if (a != NULL) ans.push_back(Tok(a));
  if (b != NULL) ans.push_back(Tok(b));
  return ans;
}

// Parses "line" (with warnings off), checks that parsing it again gives the
// same result, and returns the status.
static TrnParseStatus Parse(const std::string &line, std::string *utt_id,
                            Transcript *transcript, size_t *pos = NULL) {
  TrnParseStatus status = ParseTrnLine(line, false, utt_id, transcript, pos);
  std::string utt_id2;
  Transcript transcript2;
  size_t pos2;
  TRNKIT_ASSERT(ParseTrnLine(line, false, &utt_id2, &transcript2, &pos2) ==
                status);
  TRNKIT_ASSERT(utt_id2 == *utt_id && transcript2 == *transcript);
  if (pos != NULL)
    TRNKIT_ASSERT(pos2 == *pos);
  return status;
}

void UnitTestParsePlain() {
  std::string utt_id;
  Transcript transcript;
  TRNKIT_ASSERT(Parse("hello world (utt1)", &utt_id, &transcript) ==
                kTrnParseOk);
  TRNKIT_ASSERT(utt_id == "utt1");
  Transcript ref;
  ref.push_back(Tok("hello"));
  ref.push_back(Tok("world"));
  TRNKIT_ASSERT(transcript == ref);

  // Parentheses inside the transcript are ordinary characters.
  TRNKIT_ASSERT(Parse("a(b) c (utt7)", &utt_id, &transcript) == kTrnParseOk);
  TRNKIT_ASSERT(utt_id == "utt7");
  ref.clear();
  ref.push_back(Tok("a(b)"));
  ref.push_back(Tok("c"));
  TRNKIT_ASSERT(transcript == ref);

  // '/' and '}' outside an alternate are part of tokens.
  TRNKIT_ASSERT(Parse("word} (utt4)", &utt_id, &transcript) == kTrnParseOk);
  TRNKIT_ASSERT(transcript.size() == 1 && transcript[0] == Tok("word}"));
  TRNKIT_ASSERT(Parse("and/or } (u)", &utt_id, &transcript) == kTrnParseOk);
  TRNKIT_ASSERT(transcript.size() == 2 && transcript[0] == Tok("and/or") &&
                transcript[1] == Tok("}"));

  // Empty transcript.
  TRNKIT_ASSERT(Parse("(utt8)", &utt_id, &transcript) == kTrnParseOk);
  TRNKIT_ASSERT(utt_id == "utt8" && transcript.empty());
}

void UnitTestParseUttId() {
  std::string utt_id;
  Transcript transcript;
  // The id is taken verbatim, spaces included.
  TRNKIT_ASSERT(Parse("x ( spk 1 utt )", &utt_id, &transcript) ==
                kTrnParseOk);
  TRNKIT_ASSERT(utt_id == " spk 1 utt " && transcript.size() == 1);
  // Text after the last ')' is ignored.
  TRNKIT_ASSERT(Parse("x (a) trailing", &utt_id, &transcript) == kTrnParseOk);
  TRNKIT_ASSERT(utt_id == "a");
  TRNKIT_ASSERT(transcript.size() == 1 && transcript[0] == Tok("x"));
  // Only the last '(' counts.
  TRNKIT_ASSERT(Parse("x (a (b)", &utt_id, &transcript) == kTrnParseOk);
  TRNKIT_ASSERT(utt_id == "b");
  TRNKIT_ASSERT(transcript.size() == 2 && transcript[1] == Tok("(a"));
  TRNKIT_ASSERT(Parse("x ()", &utt_id, &transcript) == kTrnParseOk);
  TRNKIT_ASSERT(utt_id.empty() && transcript.size() == 1);
}

void UnitTestParseWhitespace() {
  std::string utt_id;
  Transcript transcript;
  TRNKIT_ASSERT(Parse("  a\tb \f c\v(utt9)\r\n", &utt_id, &transcript) ==
                kTrnParseOk);
  TRNKIT_ASSERT(utt_id == "utt9");
  TRNKIT_ASSERT(transcript.size() == 3 && transcript[2] == Tok("c"));

  size_t pos = 0;
  TRNKIT_ASSERT(Parse("", &utt_id, &transcript, &pos) == kTrnBlankLine);
  TRNKIT_ASSERT(pos == std::string::npos);
  TRNKIT_ASSERT(Parse("   ", &utt_id, &transcript) == kTrnBlankLine);
  TRNKIT_ASSERT(Parse(" \t\r\n", &utt_id, &transcript) == kTrnBlankLine);
  TRNKIT_ASSERT(utt_id.empty() && transcript.empty());
}

void UnitTestParseAlternates() {
  std::string utt_id;
  Transcript transcript;
  TRNKIT_ASSERT(Parse("a {b / c} d (utt2)", &utt_id, &transcript) ==
                kTrnParseOk);
  TRNKIT_ASSERT(utt_id == "utt2");
  std::vector<TranscriptEntry::Branch> branches;
  branches.push_back(Br("b"));
  branches.push_back(Br("c"));
  Transcript ref;
  ref.push_back(Tok("a"));
  ref.push_back(Alt(branches));
  ref.push_back(Tok("d"));
  TRNKIT_ASSERT(transcript == ref);

  // Braces and slashes need no surrounding spaces.
  TRNKIT_ASSERT(Parse("a{b/c}d (u)", &utt_id, &transcript) == kTrnParseOk);
  TRNKIT_ASSERT(transcript == ref);

  TRNKIT_ASSERT(Parse("a {b/c/d} (utt3)", &utt_id, &transcript) ==
                kTrnParseOk);
  branches.push_back(Br("d"));
  ref.clear();
  ref.push_back(Tok("a"));
  ref.push_back(Alt(branches));
  TRNKIT_ASSERT(transcript == ref);

  // Multi-token branches.
  TRNKIT_ASSERT(Parse("{uh huh / yes} (u)", &utt_id, &transcript) ==
                kTrnParseOk);
  TRNKIT_ASSERT(transcript.size() == 1 &&
                transcript[0].branches[0] == Br("uh", "huh") &&
                transcript[0].branches[1] == Br("yes"));

  TRNKIT_ASSERT(Parse("{a} b (u)", &utt_id, &transcript) == kTrnParseOk);
  TRNKIT_ASSERT(transcript.size() == 2 &&
                transcript[0].branches.size() == 1 &&
                transcript[0].branches[0] == Br("a"));

  // An empty branch that is not the last one is allowed.
  TRNKIT_ASSERT(Parse("{ / a} (u)", &utt_id, &transcript) == kTrnParseOk);
  TRNKIT_ASSERT(transcript.size() == 1 &&
                transcript[0].branches.size() == 2 &&
                transcript[0].branches[0].empty() &&
                transcript[0].branches[1] == Br("a"));
}

void UnitTestParseNested() {
  std::string utt_id;
  Transcript transcript;
  TRNKIT_ASSERT(Parse("x {a {b / c} / d} y (u)", &utt_id, &transcript) ==
                kTrnParseOk);
  std::vector<TranscriptEntry::Branch> inner;
  inner.push_back(Br("b"));
  inner.push_back(Br("c"));
  std::vector<TranscriptEntry::Branch> outer(2);
  outer[0].push_back(Tok("a"));
  outer[0].push_back(Alt(inner));
  outer[1] = Br("d");
  Transcript ref;
  ref.push_back(Tok("x"));
  ref.push_back(Alt(outer));
  ref.push_back(Tok("y"));
  TRNKIT_ASSERT(transcript == ref);
}

void UnitTestParseUnterminated() {
  std::string utt_id;
  Transcript transcript;
  TRNKIT_ASSERT(Parse("a {b (utt5)", &utt_id, &transcript) == kTrnParseOk);
  TRNKIT_ASSERT(utt_id == "utt5");
  TRNKIT_ASSERT(transcript.size() == 1 && transcript[0] == Tok("a"));

  // Everything from the unclosed '{' on goes, closed inner alternates too.
  TRNKIT_ASSERT(Parse("a {b {c / d} e / f g (u)", &utt_id, &transcript) ==
                kTrnParseOk);
  TRNKIT_ASSERT(transcript.size() == 1 && transcript[0] == Tok("a"));

  // Only the unclosed alternate is dropped.
  TRNKIT_ASSERT(Parse("{a / b} c {d (u)", &utt_id, &transcript) ==
                kTrnParseOk);
  TRNKIT_ASSERT(transcript.size() == 2 && transcript[0].IsAlternate() &&
                transcript[1] == Tok("c"));
}

void UnitTestParseErrors() {
  std::string utt_id;
  Transcript transcript;
  size_t pos;
  TRNKIT_ASSERT(Parse("a {} (utt6)", &utt_id, &transcript, &pos) ==
                kTrnEmptyAlternate);
  TRNKIT_ASSERT(utt_id == "utt6" && transcript.empty() && pos == 3);

  TRNKIT_ASSERT(Parse("a {b / } (u)", &utt_id, &transcript, &pos) ==
                kTrnEmptyAlternate);
  TRNKIT_ASSERT(pos == 7 && transcript.empty());

  TRNKIT_ASSERT(Parse("a { / } (u)", &utt_id, &transcript, &pos) ==
                kTrnEmptyAlternate);
  TRNKIT_ASSERT(Parse("{a {} / b} (u)", &utt_id, &transcript, &pos) ==
                kTrnEmptyAlternate);
  TRNKIT_ASSERT(pos == 4);

  TRNKIT_ASSERT(Parse("no parens here", &utt_id, &transcript, &pos) ==
                kTrnFormatError);
  TRNKIT_ASSERT(pos == std::string::npos);
  TRNKIT_ASSERT(utt_id.empty() && transcript.empty());
  TRNKIT_ASSERT(Parse("missing close (utt", &utt_id, &transcript, &pos) ==
                kTrnFormatError);
  TRNKIT_ASSERT(pos == 14);
  TRNKIT_ASSERT(Parse("a ) b ( c", &utt_id, &transcript, &pos) ==
                kTrnFormatError);
  TRNKIT_ASSERT(pos == 6);
}

static int32 g_num_warnings = 0;

void CountingHandler(const LogMessageEnvelope &envelope,
                     const char *message) {
  if (envelope.severity == LogMessageEnvelope::kWarning) {
    g_num_warnings++;
    TRNKIT_ASSERT(std::string(message).find("utt=\"u1\"") !=
                  std::string::npos);
  }
}

void UnitTestParseWarnings() {
  LogHandler old_handler = SetLogHandler(CountingHandler);
  std::string utt_id;
  Transcript transcript;
  ParseTrnLine("a {b / c} {d / e} (u1)", true, &utt_id, &transcript);
  TRNKIT_ASSERT(g_num_warnings == 1);  // one per utterance.
  ParseTrnLine("a {b / c} (u1)", false, &utt_id, &transcript);
  ParseTrnLine("a {b / c (u1)", true, &utt_id, &transcript);
  ParseTrnLine("a b (u1)", true, &utt_id, &transcript);
  TRNKIT_ASSERT(g_num_warnings == 1);
  // The inner alternate is closed even though the outer one never is.
  ParseTrnLine("a {b {c} (u1)", true, &utt_id, &transcript);
  TRNKIT_ASSERT(g_num_warnings == 2);
  TRNKIT_ASSERT(transcript.size() == 1 && transcript[0] == Tok("a"));
  // Nested alternates still give one warning per utterance.
  ParseTrnLine("{a {b / c} / d} (u1)", true, &utt_id, &transcript);
  TRNKIT_ASSERT(g_num_warnings == 3);
  SetLogHandler(old_handler);
}

void UnitTestParseWriteRoundTrip() {
  const char *lines[] = { "hello world (utt1)", "a{b/c}d (u)",
                          "{ / a} x (u)", "x {a {b / c} / d} y (u)",
                          "a(b) c (utt7)", "(empty)", "and/or } ( id 2 )",
                          "a {b (u)" };
  for (size_t i = 0; i < sizeof(lines) / sizeof(lines[0]); i++) {
    std::string utt_id, utt_id2;
    Transcript transcript, transcript2;
    TRNKIT_ASSERT(Parse(lines[i], &utt_id, &transcript) == kTrnParseOk);
    std::ostringstream os;
    WriteTrnLine(utt_id, transcript, os);
    TRNKIT_ASSERT(Parse(os.str(), &utt_id2, &transcript2) == kTrnParseOk);
    TRNKIT_ASSERT(utt_id == utt_id2 && transcript == transcript2);
  }
}

}  // namespace trnkit

int main() {
  using namespace trnkit;
  UnitTestParsePlain();
  UnitTestParseUttId();
  UnitTestParseWhitespace();
  UnitTestParseAlternates();
  UnitTestParseNested();
  UnitTestParseUnterminated();
  UnitTestParseErrors();
  UnitTestParseWarnings();
  UnitTestParseWriteRoundTrip();
  std::cout << "Test OK.\n";
}
