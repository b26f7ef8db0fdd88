// bin/copy-trn.cc

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
#include "trn/transcript-utils.h"
#include "trn/trn-reader.h"
#include "util/parse-options.h"

int main(int argc, char *argv[]) {
  try {
    using namespace trnkit;

    const char *usage =
        "Read a NIST trn transcript file and write it back in canonical form\n"
        "(single spaces, \"{a / b}\" alternates, blank lines and unterminated\n"
        "alternates removed).  Fails on the first malformed line.\n"
        "\n"
        "Usage: copy-trn [options] <trn-rxfilename> <trn-wxfilename>\n"
        " e.g.: copy-trn --num-threads=4 ref.trn -\n";

    ParseOptions po(usage);
    TrnReaderOptions opts;
    opts.Register(&po);

    po.Read(argc, argv);

    if (po.NumArgs() != 2) {
      po.PrintUsage();
      exit(1);
    }

    std::string trn_rxfilename = po.GetArg(1),
        trn_wxfilename = po.GetArg(2);

    Timer timer;
    int64 num_done = 0, num_alternates = 0;
    SequentialTrnReader reader(trn_rxfilename, opts);
    Output ko(trn_wxfilename);
    for (; !reader.Done(); reader.Next(), num_done++) {
      if (TranscriptHasAlternates(reader.Value()))
        num_alternates++;
      WriteTrnLine(reader.Key(), reader.Value(), ko.Stream());
    }
    if (!ko.Close())
      TRNKIT_ERR << "Error writing to " << PrintableWxfilename(trn_wxfilename);

    TRNKIT_LOG << "Copied " << num_done << " utterances (" << num_alternates
               << " with alternates) from " << reader.NumLinesRead()
               << " lines in " << timer.Elapsed() << " seconds.";
    return (num_done != 0 ? 0 : 1);
  } catch(const std::exception &e) {
    std::cerr << e.what();
    return -1;
  }
}
