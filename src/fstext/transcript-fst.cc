// fstext/transcript-fst.cc

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

#include <fst/script/print-impl.h>

namespace trnkit {

typedef fst::StdArc::StateId StateId;
typedef fst::StdArc::Label Label;
typedef fst::StdArc::Weight Weight;

// Adds arcs spelling out "entries" from state "from" to state "to".
static void AddTranscriptPath(const std::vector<TranscriptEntry> &entries,
                              StateId from, StateId to,
                              fst::SymbolTable *symbol_table,
                              fst::VectorFst<fst::StdArc> *fst) {
  if (entries.empty()) {
    fst->AddArc(from, fst::StdArc(0, 0, Weight::One(), to));
    return;
  }
  StateId cur_state = from;
  for (size_t i = 0; i < entries.size(); i++) {
    StateId next_state = (i + 1 == entries.size() ? to : fst->AddState());
    const TranscriptEntry &entry = entries[i];
    if (entry.IsToken()) {
      Label label = symbol_table->AddSymbol(entry.token);
      fst->AddArc(cur_state,
                  fst::StdArc(label, label, Weight::One(), next_state));
    } else {
      TRNKIT_ASSERT(!entry.branches.empty());
      for (size_t j = 0; j < entry.branches.size(); j++)
        AddTranscriptPath(entry.branches[j], cur_state, next_state,
                          symbol_table, fst);
    }
    cur_state = next_state;
  }
}

void TranscriptToFst(const Transcript &transcript,
                     fst::SymbolTable *symbol_table,
                     fst::VectorFst<fst::StdArc> *fst) {
  TRNKIT_ASSERT(symbol_table != NULL && fst != NULL);
  if (symbol_table->NumSymbols() == 0)
    symbol_table->AddSymbol("<eps>", 0);
  else if (symbol_table->Find("<eps>") != 0)
    TRNKIT_ERR << "Symbol table " << symbol_table->Name()
               << " does not map <eps> to 0";

  fst->DeleteStates();
  StateId start_state = fst->AddState();
  fst->SetStart(start_state);
  if (transcript.empty()) {
    fst->SetFinal(start_state, Weight::One());
    return;
  }
  StateId final_state = fst->AddState();
  fst->SetFinal(final_state, Weight::One());
  AddTranscriptPath(transcript, start_state, final_state, symbol_table, fst);
}

void WriteFstText(const fst::VectorFst<fst::StdArc> &fst,
                  const fst::SymbolTable *symbols,
                  std::ostream &os) {
  bool acceptor = true, write_one = false;
  fst::FstPrinter<fst::StdArc> printer(fst, symbols, symbols, NULL,
                                       acceptor, write_one, "\t");
  printer.Print(&os, "<unknown>");
  if (os.fail())
    TRNKIT_ERR << "Stream failure detected writing FST to stream";
}

}  // namespace trnkit
