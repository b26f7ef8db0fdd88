// bin/trn-pair-text.cc

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
#include "trn/trn-pairs.h"
#include "trn/trn-reader.h"
#include "util/parse-options.h"

int main(int argc, char *argv[]) {
  try {
    using namespace trnkit;

    const char *usage =
        "Read a reference and a hypothesis trn file, check that they cover\n"
        "the same utterances and that no reference is empty, and write the\n"
        "flattened transcripts, sorted by utterance id, one per line, ready\n"
        "for a word-error-rate tool.  Alternates must already be resolved.\n"
        "Exits with status 1 if the checks fail.\n"
        "\n"
        "Usage: trn-pair-text [options] <ref-trn-rxfilename> "
        "<hyp-trn-rxfilename> <ref-text-wxfilename> <hyp-text-wxfilename>\n"
        " e.g.: trn-pair-text ref.trn hyp.trn ref.txt hyp.txt\n";

    ParseOptions po(usage);
    TrnReaderOptions opts;
    bool write_keys = false;
    opts.Register(&po);
    po.Register("write-keys", &write_keys, "If true, start each output line "
                "with the utterance id.");

    po.Read(argc, argv);

    if (po.NumArgs() != 4) {
      po.PrintUsage();
      exit(1);
    }

    std::string ref_rxfilename = po.GetArg(1),
        hyp_rxfilename = po.GetArg(2),
        ref_wxfilename = po.GetArg(3),
        hyp_wxfilename = po.GetArg(4);

    TrnMap ref_map, hyp_map;
    ReadTrnMap(ref_rxfilename, opts, &ref_map);
    ReadTrnMap(hyp_rxfilename, opts, &hyp_map);

    std::vector<std::string> keys, ref_texts, hyp_texts;
    if (!PairTrnTranscripts(ref_map, hyp_map, &keys, &ref_texts,
                            &hyp_texts))
      return 1;

    Output ref_ko(ref_wxfilename), hyp_ko(hyp_wxfilename);
    for (size_t i = 0; i < keys.size(); i++) {
      if (write_keys) {
        ref_ko.Stream() << keys[i] << ' ';
        hyp_ko.Stream() << keys[i] << ' ';
      }
      ref_ko.Stream() << ref_texts[i] << '\n';
      hyp_ko.Stream() << hyp_texts[i] << '\n';
    }
    if (!ref_ko.Close())
      TRNKIT_ERR << "Error writing to " << PrintableWxfilename(ref_wxfilename);
    if (!hyp_ko.Close())
      TRNKIT_ERR << "Error writing to " << PrintableWxfilename(hyp_wxfilename);

    TRNKIT_LOG << "Wrote " << keys.size() << " reference/hypothesis pairs.";
    return 0;
  } catch(const std::exception &e) {
    std::cerr << e.what();
    return -1;
  }
}
