// fstext/transcript-fst-test.cc

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

#include "fstext/transcript-fst.h"
#include "trn/trn-parser.h"

namespace trnkit {

static Transcript ParseOrDie(const std::string &line) {
  std::string utt_id;
  Transcript transcript;
  if (ParseTrnLine(line, false, &utt_id, &transcript) != kTrnParseOk)
    TRNKIT_ERR << "Could not parse " << line;
  return transcript;
}

// Returns true if "fst" accepts the word sequence "words".
static bool Accepts(const fst::VectorFst<fst::StdArc> &fst,
                    const fst::SymbolTable &symbols,
                    const std::string &words) {
  std::istringstream is(words);
  std::string word;
  std::vector<fst::StdArc::Label> labels;
  while (is >> word) {
    int64 label = symbols.Find(word);
    if (label == fst::kNoSymbol)
      return false;
    labels.push_back(label);
  }
  fst::VectorFst<fst::StdArc> linear;
  linear.AddState();
  linear.SetStart(0);
  for (size_t i = 0; i < labels.size(); i++) {
    linear.AddState();
    linear.AddArc(i, fst::StdArc(labels[i], labels[i],
                                 fst::TropicalWeight::One(), i + 1));
  }
  linear.SetFinal(labels.size(), fst::TropicalWeight::One());
  fst::ArcSort(&linear, fst::OLabelCompare<fst::StdArc>());
  fst::VectorFst<fst::StdArc> composed;
  fst::Compose(linear, fst, &composed);
  fst::Connect(&composed);
  return composed.NumStates() > 0;
}

void TestTranscriptToFstLinear() {
  fst::SymbolTable symbols("words");
  fst::VectorFst<fst::StdArc> fst;
  TranscriptToFst(ParseOrDie("the cat sat (u)"), &symbols, &fst);
  TRNKIT_ASSERT(symbols.Find("<eps>") == 0);
  TRNKIT_ASSERT(symbols.NumSymbols() == 4);
  TRNKIT_ASSERT(fst.NumStates() == 4);
  TRNKIT_ASSERT(Accepts(fst, symbols, "the cat sat"));
  TRNKIT_ASSERT(!Accepts(fst, symbols, "the cat"));

  // Reusing the table keeps the labels of known words.
  int64 cat = symbols.Find("cat");
  TranscriptToFst(ParseOrDie("cat dog (u)"), &symbols, &fst);
  TRNKIT_ASSERT(symbols.Find("cat") == cat);
  TRNKIT_ASSERT(symbols.NumSymbols() == 5);
  TRNKIT_ASSERT(Accepts(fst, symbols, "cat dog"));

  TranscriptToFst(Transcript(), &symbols, &fst);
  TRNKIT_ASSERT(fst.NumStates() == 1);
  TRNKIT_ASSERT(fst.Final(fst.Start()) == fst::TropicalWeight::One());
}

void TestTranscriptToFstAlternates() {
  fst::SymbolTable symbols("words");
  fst::VectorFst<fst::StdArc> fst;
  TranscriptToFst(ParseOrDie("a {b / c} d (u)"), &symbols, &fst);
  // start -a-> s -b,c-> t -d-> final
  TRNKIT_ASSERT(fst.NumStates() == 4);
  TRNKIT_ASSERT(fst.NumArcs(fst.Start()) == 1);
  TRNKIT_ASSERT(Accepts(fst, symbols, "a b d"));
  TRNKIT_ASSERT(Accepts(fst, symbols, "a c d"));
  TRNKIT_ASSERT(!Accepts(fst, symbols, "a b c d"));

  TranscriptToFst(ParseOrDie("x {a {b / c} / uh huh} y (u)"), &symbols,
                  &fst);
  TRNKIT_ASSERT(fst.Properties(fst::kAcceptor, true) == fst::kAcceptor);
  TRNKIT_ASSERT(Accepts(fst, symbols, "x a b y"));
  TRNKIT_ASSERT(Accepts(fst, symbols, "x a c y"));
  TRNKIT_ASSERT(Accepts(fst, symbols, "x uh huh y"));
  TRNKIT_ASSERT(!Accepts(fst, symbols, "x y"));
  TRNKIT_ASSERT(!Accepts(fst, symbols, "x a y"));
}

void TestTranscriptToFstEmptyBranch() {
  fst::SymbolTable symbols("words");
  fst::VectorFst<fst::StdArc> fst;
  TranscriptToFst(ParseOrDie("x { / uh} y (u)"), &symbols, &fst);
  TRNKIT_ASSERT(Accepts(fst, symbols, "x y"));
  TRNKIT_ASSERT(Accepts(fst, symbols, "x uh y"));
}

void TestWriteFstText() {
  fst::SymbolTable symbols("words");
  fst::VectorFst<fst::StdArc> fst;
  TranscriptToFst(ParseOrDie("a {b / c} (u)"), &symbols, &fst);
  {
    std::ostringstream os;
    WriteFstText(fst, &symbols, os);
    TRNKIT_ASSERT(os.str() == "0\t2\ta\n1\n2\t1\tb\n2\t1\tc\n");
  }
  {
    std::ostringstream os;
    WriteFstText(fst, NULL, os);
    TRNKIT_ASSERT(os.str() == "0\t2\t1\n1\n2\t1\t2\n2\t1\t3\n");
  }
}

void TestBadSymbolTable() {
  fst::SymbolTable symbols("words");
  symbols.AddSymbol("a");  // gets label 0.
  symbols.AddSymbol("<eps>");
  fst::VectorFst<fst::StdArc> fst;
  bool threw = false;
  try {
    TranscriptToFst(ParseOrDie("a (u)"), &symbols, &fst);
  } catch (const TrnkitFatalError &) {
    threw = true;
  }
  TRNKIT_ASSERT(threw);
}

}  // namespace trnkit

int main() {
  using namespace trnkit;
  TestTranscriptToFstLinear();
  TestTranscriptToFstAlternates();
  TestTranscriptToFstEmptyBranch();
  TestWriteFstText();
  TestBadSymbolTable();
  std::cout << "Test OK.\n";
}
