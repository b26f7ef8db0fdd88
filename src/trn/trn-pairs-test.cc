// trn/trn-pairs-test.cc

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

#include "trn/trn-pairs.h"
#include "trn/trn-parser.h"

namespace trnkit {

// Parses "text" (one record per line) into a map.
static TrnMap MakeMap(const std::string &text) {
  TrnMap ans;
  std::istringstream is(text);
  std::string line, utt_id;
  Transcript transcript;
  while (std::getline(is, line)) {
    TrnParseStatus status = ParseTrnLine(line, false, &utt_id, &transcript);
    if (status == kTrnBlankLine)
      continue;
    TRNKIT_ASSERT(status == kTrnParseOk);
    ans[utt_id] = transcript;
  }
  return ans;
}

static std::vector<std::string> g_warnings;

void RecordWarnings(const LogMessageEnvelope &envelope,
                    const char *message) {
  if (envelope.severity == LogMessageEnvelope::kWarning)
    g_warnings.push_back(message);
}

void UnitTestPairTrnTranscripts() {
  TrnMap ref = MakeMap("the cat (b)\na dog  barks (a)\n"),
      hyp = MakeMap("a dog (a)\nthe hat (b)\n");
  std::vector<std::string> keys, ref_texts, hyp_texts;
  TRNKIT_ASSERT(PairTrnTranscripts(ref, hyp, &keys, &ref_texts, &hyp_texts));
  TRNKIT_ASSERT(keys.size() == 2 && keys[0] == "a" && keys[1] == "b");
  TRNKIT_ASSERT(ref_texts[0] == "a dog barks" && ref_texts[1] == "the cat");
  TRNKIT_ASSERT(hyp_texts[0] == "a dog" && hyp_texts[1] == "the hat");

  // Empty hypotheses are fine.
  hyp = MakeMap("(a)\n(b)\n");
  TRNKIT_ASSERT(PairTrnTranscripts(ref, hyp, &keys, &ref_texts, &hyp_texts));
  TRNKIT_ASSERT(hyp_texts.size() == 2 && hyp_texts[0].empty());
}

void UnitTestPairTrnTranscriptsMismatch() {
  LogHandler old_handler = SetLogHandler(RecordWarnings);
  std::vector<std::string> keys, ref_texts, hyp_texts;

  g_warnings.clear();
  TrnMap ref = MakeMap("x (a)\n(b)\n(c)\n"), hyp = MakeMap("x (a)\n");
  TRNKIT_ASSERT(!PairTrnTranscripts(ref, hyp, &keys, &ref_texts, &hyp_texts));
  TRNKIT_ASSERT(keys.empty() && ref_texts.empty());
  TRNKIT_ASSERT(g_warnings.size() == 1);
  TRNKIT_ASSERT(g_warnings[0] ==
                "One or more reference transcriptions are empty: b, c");

  g_warnings.clear();
  ref = MakeMap("x (a)\ny (c)\nz (d)\n");
  hyp = MakeMap("x (a)\ny (b)\nz (e)\n");
  TRNKIT_ASSERT(!PairTrnTranscripts(ref, hyp, &keys, &ref_texts, &hyp_texts));
  TRNKIT_ASSERT(g_warnings.size() == 3);
  TRNKIT_ASSERT(g_warnings[0] == "ref and hyp file have different utterances!");
  TRNKIT_ASSERT(g_warnings[1] == "Missing from hyp: c d");
  TRNKIT_ASSERT(g_warnings[2] == "Missing from ref: b e");

  g_warnings.clear();
  hyp = MakeMap("x (a)\ny (c)\n");
  TRNKIT_ASSERT(!PairTrnTranscripts(ref, hyp, &keys, &ref_texts, &hyp_texts));
  TRNKIT_ASSERT(g_warnings.size() == 2);
  TRNKIT_ASSERT(g_warnings[1] == "Missing from hyp: d");

  SetLogHandler(old_handler);
}

void UnitTestPairTrnTranscriptsAlternates() {
  TrnMap ref = MakeMap("a {b / c} (u)\n"), hyp = MakeMap("a b (u)\n");
  std::vector<std::string> keys, ref_texts, hyp_texts;
  bool threw = false;
  try {
    PairTrnTranscripts(ref, hyp, &keys, &ref_texts, &hyp_texts);
  } catch (const TrnkitFatalError &e) {
    threw = true;
    TRNKIT_ASSERT(std::string(e.TrnkitMessage()).find("alternate") !=
                  std::string::npos);
  }
  TRNKIT_ASSERT(threw);
}

}  // namespace trnkit

int main() {
  using namespace trnkit;
  UnitTestPairTrnTranscripts();
  UnitTestPairTrnTranscriptsMismatch();
  UnitTestPairTrnTranscriptsAlternates();
  std::cout << "Test OK.\n";
}
