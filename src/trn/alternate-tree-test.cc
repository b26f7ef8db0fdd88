// trn/alternate-tree-test.cc

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

#include "trn/alternate-tree.h"

namespace trnkit {

static TranscriptEntry Tok(const std::string &token) {
  return TranscriptEntry(token);
}

void UnitTestAlternateTreeFlat() {
  Transcript transcript;
  AlternateTree tree(&transcript);
  TRNKIT_ASSERT(!tree.InAlternate() && tree.Depth() == 0);
  tree.AddToken("a");
  tree.AddToken("b");
  TRNKIT_ASSERT(transcript.size() == 2 && transcript[1] == Tok("b"));
  TRNKIT_ASSERT(tree.StartBranch() == kTrnNoOpenAlternate);
  TRNKIT_ASSERT(tree.CloseScope() == kTrnNoOpenAlternate);
  TRNKIT_ASSERT(tree.NumAlternates() == 0);
}

void UnitTestAlternateTreeBranches() {
  // a {b / c d} e
  Transcript transcript;
  AlternateTree tree(&transcript);
  tree.AddToken("a");
  tree.OpenScope();
  TRNKIT_ASSERT(tree.InAlternate() && tree.Depth() == 1);
  tree.AddToken("b");
  TRNKIT_ASSERT(transcript.size() == 1);  // nothing leaks out while open.
  TRNKIT_ASSERT(tree.StartBranch() == kTrnParseOk);
  tree.AddToken("c");
  tree.AddToken("d");
  TRNKIT_ASSERT(tree.CloseScope() == kTrnParseOk);
  TRNKIT_ASSERT(!tree.InAlternate());
  tree.AddToken("e");

  TRNKIT_ASSERT(tree.NumAlternates() == 1);
  TRNKIT_ASSERT(transcript.size() == 3);
  const TranscriptEntry &alt = transcript[1];
  TRNKIT_ASSERT(alt.IsAlternate() && alt.branches.size() == 2);
  TRNKIT_ASSERT(alt.branches[0].size() == 1 && alt.branches[0][0] == Tok("b"));
  TRNKIT_ASSERT(alt.branches[1].size() == 2 && alt.branches[1][1] == Tok("d"));
  TRNKIT_ASSERT(transcript[2] == Tok("e"));
}

void UnitTestAlternateTreeNested() {
  // {a {b / c} / d}
  Transcript transcript;
  AlternateTree tree(&transcript);
  tree.OpenScope();
  tree.AddToken("a");
  tree.OpenScope();
  TRNKIT_ASSERT(tree.Depth() == 2);
  tree.AddToken("b");
  TRNKIT_ASSERT(tree.StartBranch() == kTrnParseOk);
  tree.AddToken("c");
  TRNKIT_ASSERT(tree.CloseScope() == kTrnParseOk);
  TRNKIT_ASSERT(tree.Depth() == 1 && transcript.empty());
  TRNKIT_ASSERT(tree.NumAlternates() == 1);
  TRNKIT_ASSERT(tree.StartBranch() == kTrnParseOk);
  tree.AddToken("d");
  TRNKIT_ASSERT(tree.CloseScope() == kTrnParseOk);
  // Both closes are counted; only the outer alternate reaches the transcript.
  TRNKIT_ASSERT(tree.NumAlternates() == 2);

  TRNKIT_ASSERT(transcript.size() == 1);
  const TranscriptEntry &outer = transcript[0];
  TRNKIT_ASSERT(outer.IsAlternate() && outer.branches.size() == 2);
  TRNKIT_ASSERT(outer.branches[0].size() == 2);
  TRNKIT_ASSERT(outer.branches[0][0] == Tok("a"));
  const TranscriptEntry &inner = outer.branches[0][1];
  TRNKIT_ASSERT(inner.IsAlternate() && inner.branches.size() == 2);
  TRNKIT_ASSERT(inner.branches[1][0] == Tok("c"));
  TRNKIT_ASSERT(outer.branches[1][0] == Tok("d"));
}

void UnitTestAlternateTreeEmpty() {
  {
    // {}
    Transcript transcript;
    AlternateTree tree(&transcript);
    tree.OpenScope();
    TRNKIT_ASSERT(tree.CloseScope() == kTrnEmptyAlternate);
    TRNKIT_ASSERT(tree.InAlternate() && transcript.empty());
  }
  {
    // {a / }
    Transcript transcript;
    AlternateTree tree(&transcript);
    tree.OpenScope();
    tree.AddToken("a");
    TRNKIT_ASSERT(tree.StartBranch() == kTrnParseOk);
    TRNKIT_ASSERT(tree.CloseScope() == kTrnEmptyAlternate);
  }
  {
    // { / a}: only the branch being closed has to be nonempty.
    Transcript transcript;
    AlternateTree tree(&transcript);
    tree.OpenScope();
    TRNKIT_ASSERT(tree.StartBranch() == kTrnParseOk);
    tree.AddToken("a");
    TRNKIT_ASSERT(tree.CloseScope() == kTrnParseOk);
    TRNKIT_ASSERT(transcript.size() == 1);
    TRNKIT_ASSERT(transcript[0].branches.size() == 2);
    TRNKIT_ASSERT(transcript[0].branches[0].empty());
  }
}

void UnitTestAlternateTreeDiscard() {
  // a {b {c
  Transcript transcript;
  AlternateTree tree(&transcript);
  tree.AddToken("a");
  tree.OpenScope();
  tree.AddToken("b");
  tree.OpenScope();
  tree.AddToken("c");
  tree.DiscardOpen();
  TRNKIT_ASSERT(!tree.InAlternate());
  TRNKIT_ASSERT(transcript.size() == 1 && transcript[0] == Tok("a"));
  TRNKIT_ASSERT(tree.NumAlternates() == 0);

  // a {b {c}: the inner alternate was closed, then dropped with the outer.
  Transcript transcript2;
  AlternateTree tree2(&transcript2);
  tree2.AddToken("a");
  tree2.OpenScope();
  tree2.AddToken("b");
  tree2.OpenScope();
  tree2.AddToken("c");
  TRNKIT_ASSERT(tree2.CloseScope() == kTrnParseOk);
  tree2.DiscardOpen();
  TRNKIT_ASSERT(transcript2.size() == 1 && tree2.NumAlternates() == 1);
}

void UnitTestTrnParseStatusToString() {
  TRNKIT_ASSERT(std::string(TrnParseStatusToString(kTrnEmptyAlternate)) ==
                "empty alternate found (\"{ }\")");
  TRNKIT_ASSERT(std::string(TrnParseStatusToString(kTrnFormatError)).find(
      "(utt_id)") != std::string::npos);
}

}  // namespace trnkit

int main() {
  using namespace trnkit;
  UnitTestAlternateTreeFlat();
  UnitTestAlternateTreeBranches();
  UnitTestAlternateTreeNested();
  UnitTestAlternateTreeEmpty();
  UnitTestAlternateTreeDiscard();
  UnitTestTrnParseStatusToString();
  std::cout << "Test OK.\n";
}
