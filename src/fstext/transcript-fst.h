// fstext/transcript-fst.h

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

#ifndef TRNKIT_FSTEXT_TRANSCRIPT_FST_H_
#define TRNKIT_FSTEXT_TRANSCRIPT_FST_H_

#include <fst/fstlib.h>

#include <ostream>

#include "base/trnkit-common.h"
#include "trn/transcript.h"

namespace trnkit {

/**
   Turns a transcript into an unweighted acceptor, e.g. for aligning or
   scoring against hypotheses where any branch of an alternate is correct.

   Each token becomes one arc whose label is symbol_table->AddSymbol(token),
   so tokens not yet in the table are added.  An alternate becomes a set of
   parallel paths, one per branch, that leave from the same state and meet in
   the same state; an empty branch (as in "{ / a}") becomes an epsilon arc.
   Symbol 0 is epsilon, so the table must already map "<eps>" to 0 (an
   empty table gets it added); otherwise this function calls TRNKIT_ERR.

   All weights are One().  An empty transcript gives a one-state acceptor
   whose start state is final.  "fst" is cleared first.
 */
void TranscriptToFst(const Transcript &transcript,
                     fst::SymbolTable *symbol_table,
                     fst::VectorFst<fst::StdArc> *fst);

/// Writes "fst" in OpenFst's text format for acceptors (as fstprint
/// --acceptor would), one "src<tab>dest<tab>label" line per arc, start state
/// first, and a "state" line per final state.  Weights equal to One() are not
/// printed.  Labels are printed as symbols if "symbols" is non-NULL.
/// TRNKIT_ERRs on stream failure.
void WriteFstText(const fst::VectorFst<fst::StdArc> &fst,
                  const fst::SymbolTable *symbols,
                  std::ostream &os);

}  // namespace trnkit

#endif  // TRNKIT_FSTEXT_TRANSCRIPT_FST_H_
