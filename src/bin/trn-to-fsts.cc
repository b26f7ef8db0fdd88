// bin/trn-to-fsts.cc

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

#include <memory>

#include "base/trnkit-common.h"
#include "fstext/transcript-fst.h"
#include "trn/trn-reader.h"
#include "util/parse-options.h"

int main(int argc, char *argv[]) {
  try {
    using namespace trnkit;

    const char *usage =
        "Convert each transcript of a NIST trn file to an acceptor in which\n"
        "every branch of an alternate is a parallel path.  Writes a text\n"
        "archive: the utterance id on a line of its own, the acceptor in\n"
        "OpenFst text format, then an empty line.  Words are numbered in\n"
        "order of first appearance, with <eps> as 0.\n"
        "\n"
        "Usage: trn-to-fsts [options] <trn-rxfilename> <fsts-wxfilename>\n"
        " e.g.: trn-to-fsts --write-symbols=words.txt ref.trn ref.fsts\n";

    ParseOptions po(usage);
    TrnReaderOptions opts;
    std::string symbols_wxfilename, symbols_rxfilename;
    bool use_symbols = false;
    opts.warn_alternates = false;
    opts.Register(&po);
    po.Register("read-symbols", &symbols_rxfilename, "If set, start from "
                "this symbol table (OpenFst text format; <eps> must be 0).");
    po.Register("write-symbols", &symbols_wxfilename, "If set, write the "
                "symbol table to this file.");
    po.Register("use-symbols", &use_symbols, "If true, write arc labels as "
                "words rather than integers.");

    po.Read(argc, argv);

    if (po.NumArgs() != 2) {
      po.PrintUsage();
      exit(1);
    }

    std::string trn_rxfilename = po.GetArg(1),
        fsts_wxfilename = po.GetArg(2);

    std::unique_ptr<fst::SymbolTable> symbols;
    if (symbols_rxfilename.empty()) {
      symbols.reset(new fst::SymbolTable("words"));
    } else {
      symbols.reset(fst::SymbolTable::ReadText(symbols_rxfilename));
      if (!symbols)
        TRNKIT_ERR << "Could not read symbol table from "
                   << symbols_rxfilename;
    }

    int64 num_done = 0;
    SequentialTrnReader reader(trn_rxfilename, opts);
    Output ko(fsts_wxfilename);
    fst::VectorFst<fst::StdArc> fst;
    for (; !reader.Done(); reader.Next(), num_done++) {
      TranscriptToFst(reader.Value(), symbols.get(), &fst);
      ko.Stream() << reader.Key() << '\n';
      WriteFstText(fst, (use_symbols ? symbols.get() : NULL), ko.Stream());
      ko.Stream() << '\n';
    }
    if (!ko.Close())
      TRNKIT_ERR << "Error writing to " << PrintableWxfilename(fsts_wxfilename);

    if (!symbols_wxfilename.empty() &&
        !symbols->WriteText(symbols_wxfilename))
      TRNKIT_ERR << "Error writing symbol table to " << symbols_wxfilename;

    TRNKIT_LOG << "Converted " << num_done << " transcripts to acceptors; "
               << "vocabulary size is " << (symbols->NumSymbols() - 1);
    return (num_done != 0 ? 0 : 1);
  } catch(const std::exception &e) {
    std::cerr << e.what();
    return -1;
  }
}
