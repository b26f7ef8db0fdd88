// trn/transcript-utils-test.cc

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

#include "trn/transcript-utils.h"
#include "trn/trn-parser.h"

namespace trnkit {

static Transcript ParseOrDie(const std::string &line) {
  std::string utt_id;
  Transcript transcript;
  if (ParseTrnLine(line, false, &utt_id, &transcript) != kTrnParseOk)
    TRNKIT_ERR << "Could not parse " << line;
  return transcript;
}

void UnitTestTranscriptToTokens() {
  std::vector<std::string> tokens;
  Transcript plain = ParseOrDie("the cat sat (u)");
  TRNKIT_ASSERT(!TranscriptHasAlternates(plain));
  TRNKIT_ASSERT(TranscriptToTokens(plain, &tokens));
  TRNKIT_ASSERT(tokens.size() == 3 && tokens[1] == "cat");
  TRNKIT_ASSERT(JoinTranscript(tokens) == "the cat sat");

  Transcript alt = ParseOrDie("the {cat / kat} sat (u)");
  TRNKIT_ASSERT(TranscriptHasAlternates(alt));
  TRNKIT_ASSERT(!TranscriptToTokens(alt, &tokens));
  TRNKIT_ASSERT(tokens.empty());

  Transcript empty;
  TRNKIT_ASSERT(TranscriptToTokens(empty, &tokens) && tokens.empty());
  TRNKIT_ASSERT(JoinTranscript(tokens) == "");
}

void UnitTestResolveAlternates() {
  Transcript resolved;
  std::vector<std::string> tokens;
  ResolveAlternatesFirstBranch(
      ParseOrDie("x {a {b / c} d / e} y (u)"), &resolved);
  TRNKIT_ASSERT(!TranscriptHasAlternates(resolved));
  TRNKIT_ASSERT(TranscriptToTokens(resolved, &tokens));
  TRNKIT_ASSERT(JoinTranscript(tokens) == "x a b d y");

  // An empty first branch resolves to nothing.
  ResolveAlternatesFirstBranch(ParseOrDie("x { / uh} y (u)"), &resolved);
  TRNKIT_ASSERT(TranscriptToTokens(resolved, &tokens));
  TRNKIT_ASSERT(JoinTranscript(tokens) == "x y");
}

void UnitTestWriteTrnLine() {
  {
    std::ostringstream os;
    WriteTrnLine("utt1", ParseOrDie("a{b/c d}e (u)"), os);
    TRNKIT_ASSERT(os.str() == "a {b / c d} e (utt1)\n");
  }
  {
    std::ostringstream os;
    WriteTrnLine("utt2", Transcript(), os);
    TRNKIT_ASSERT(os.str() == "(utt2)\n");
  }
  {
    std::ostringstream os;
    WriteTrnLine("u", ParseOrDie("{ / x {y / z}} (u)"), os);
    TRNKIT_ASSERT(os.str() == "{ / x {y / z}} (u)\n");
  }
}

}  // namespace trnkit

int main() {
  using namespace trnkit;
  UnitTestTranscriptToTokens();
  UnitTestResolveAlternates();
  UnitTestWriteTrnLine();
  std::cout << "Test OK.\n";
}
