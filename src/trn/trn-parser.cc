// trn/trn-parser.cc

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

#include "trn/trn-parser.h"

#include "util/text-utils.h"

namespace trnkit {

TrnParseStatus ParseTrnLine(const std::string &line,
                            bool warn_alternates,
                            std::string *utt_id,
                            Transcript *transcript,
                            size_t *error_pos) {
  TRNKIT_ASSERT(utt_id != NULL && transcript != NULL);
  utt_id->clear();
  transcript->clear();
  if (error_pos != NULL)
    *error_pos = std::string::npos;

  // [begin, end) is the line without surrounding whitespace; this also
  // removes any trailing newline.
  size_t begin = 0, end = line.size();
  while (begin < end && IsWhiteSpace(line[begin]))
    begin++;
  while (end > begin && IsWhiteSpace(line[end - 1]))
    end--;
  if (begin == end)
    return kTrnBlankLine;

  size_t last_open = line.rfind('(', end - 1),
      last_close = line.rfind(')', end - 1);
  if (last_open == std::string::npos || last_close == std::string::npos ||
      last_open > last_close) {
    if (error_pos != NULL)
      *error_pos = last_open;
    return kTrnFormatError;
  }
  utt_id->assign(line, last_open + 1, last_close - last_open - 1);

  AlternateTree tree(transcript);
  std::string token;
  for (size_t i = begin; i < last_open; i++) {
    char c = line[i];
    if (c == '{') {
      if (!token.empty()) {
        tree.AddToken(token);
        token.clear();
      }
      tree.OpenScope();
    } else if ((c == '/' || c == '}') && tree.InAlternate()) {
      if (!token.empty()) {
        tree.AddToken(token);
        token.clear();
      }
      TrnParseStatus status = (c == '/' ? tree.StartBranch() :
                               tree.CloseScope());
      if (status != kTrnParseOk) {
        transcript->clear();
        if (error_pos != NULL)
          *error_pos = i;
        return status;
      }
    } else if (IsWhiteSpace(c)) {
      if (!token.empty()) {
        tree.AddToken(token);
        token.clear();
      }
    } else {
      token += c;
    }
  }
  // A token inside an unterminated alternate goes with it.
  if (!token.empty() && !tree.InAlternate())
    tree.AddToken(token);
  tree.DiscardOpen();

  if (warn_alternates && tree.NumAlternates() > 0) {
    TRNKIT_WARN << "Found an alternate in transcription for utt=\""
                << *utt_id << "\". Transcript will contain an array of "
                << "alternates at that point, and will not be compatible "
                << "with flat-token consumers until resolved. To suppress "
                << "this warning, set --warn-alternates=false";
  }
  return kTrnParseOk;
}

}  // namespace trnkit
