// trn/trn-parser.h

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

#ifndef TRNKIT_TRN_TRN_PARSER_H_
#define TRNKIT_TRN_TRN_PARSER_H_

#include <string>

#include "base/trnkit-common.h"
#include "trn/alternate-tree.h"
#include "trn/transcript.h"

namespace trnkit {

/// \addtogroup trn_group
/// @{

/**
   Parses one line of a NIST trn file, e.g.

     the {cat / kat} sat on the mat (spk1-utt0001)

   The rules follow sclite's reading of the format, including its oddities:

   - The utterance id is everything between the last '(' and the last ')' on
     the line, spaces included.  Text after the last ')' is ignored.  If there
     is no '(' or no ')', or the last '(' comes after the last ')', the line is
     malformed (kTrnFormatError).
   - Everything before the last '(' is the transcript.  Tokens are separated
     by whitespace; '(' and ')' inside it are ordinary characters.
   - '{' always opens an alternate; inside an alternate '/' starts a new
     branch and '}' closes it.  Alternates may nest.
   - '/' and '}' with no alternate open are ordinary characters, so "word}"
     is one token.
   - Closing an alternate whose current branch is empty, e.g. "{}" or
     "{a / }", is an error (kTrnEmptyAlternate).
   - An alternate still open at the end of the line is dropped silently,
     together with everything inside it.
   - A line that is empty after trimming whitespace gives kTrnBlankLine; this
     is not an error, there is just no record.

   On kTrnParseOk, "utt_id" and "transcript" are set.  On kTrnEmptyAlternate,
   "utt_id" is set and "transcript" is empty.  If "error_pos" is not NULL, it
   is set to the offset in "line" of the character at which an error was
   detected (the closing '}' for kTrnEmptyAlternate, the last '(' or
   std::string::npos for kTrnFormatError), and to std::string::npos
   otherwise.

   If "warn_alternates" is true and any alternate was closed while scanning
   the line, even one nested in an alternate that was later dropped, one
   warning naming the utterance is printed, since such transcripts cannot be
   flattened to tokens (see TranscriptToTokens()) until the alternates are
   resolved.

   The function has no state across calls and may be called from several
   threads at once.
 */
TrnParseStatus ParseTrnLine(const std::string &line,
                            bool warn_alternates,
                            std::string *utt_id,
                            Transcript *transcript,
                            size_t *error_pos = NULL);

/// @} end "addtogroup trn_group"

}  // namespace trnkit

#endif  // TRNKIT_TRN_TRN_PARSER_H_
