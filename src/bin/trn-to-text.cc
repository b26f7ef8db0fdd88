// bin/trn-to-text.cc

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
#include "util/text-utils.h"

int main(int argc, char *argv[]) {
  try {
    using namespace trnkit;

    const char *usage =
        "Convert a NIST trn transcript file to a text file with one\n"
        "utterance per line, \"<utt-id> <word1> <word2> ...\", in file order.\n"
        "Utterance ids must not contain whitespace.\n"
        "\n"
        "Usage: trn-to-text [options] <trn-rxfilename> <text-wxfilename>\n"
        " e.g.: trn-to-text --alternates=first ref.trn data/test/text\n";

    ParseOptions po(usage);
    TrnReaderOptions opts;
    std::string alternates = "error";
    opts.Register(&po);
    po.Register("alternates", &alternates, "What to do with transcripts "
                "that contain alternates (\"{a / b}\"): \"error\" to fail, "
                "\"first\" to keep the first branch of each.");

    po.Read(argc, argv);

    if (po.NumArgs() != 2) {
      po.PrintUsage();
      exit(1);
    }
    if (alternates != "error" && alternates != "first")
      TRNKIT_ERR << "--alternates option invalid: expected "
                 << "\"error\"|\"first\", got " << alternates;

    std::string trn_rxfilename = po.GetArg(1),
        text_wxfilename = po.GetArg(2);

    int64 num_done = 0, num_resolved = 0;
    SequentialTrnReader reader(trn_rxfilename, opts);
    Output ko(text_wxfilename);
    std::vector<std::string> tokens;
    for (; !reader.Done(); reader.Next(), num_done++) {
      const std::string &utt = reader.Key();
      if (!IsToken(utt))
        TRNKIT_ERR << "Utterance id \"" << utt << "\" is empty or contains "
                   << "whitespace; cannot write it as a text key.";
      if (!TranscriptToTokens(reader.Value(), &tokens)) {
        if (alternates == "error")
          TRNKIT_ERR << "Transcript for utterance " << utt << " contains "
                     << "alternates; use --alternates=first to keep the "
                     << "first branch.";
        Transcript resolved;
        ResolveAlternatesFirstBranch(reader.Value(), &resolved);
        TranscriptToTokens(resolved, &tokens);
        num_resolved++;
      }
      ko.Stream() << utt;
      if (!tokens.empty())
        ko.Stream() << ' ' << JoinTranscript(tokens);
      ko.Stream() << '\n';
    }
    if (!ko.Close())
      TRNKIT_ERR << "Error writing to " << PrintableWxfilename(text_wxfilename);

    TRNKIT_LOG << "Converted " << num_done << " utterances; resolved "
               << "alternates in " << num_resolved << " of them.";
    return (num_done != 0 ? 0 : 1);
  } catch(const std::exception &e) {
    std::cerr << e.what();
    return -1;
  }
}
