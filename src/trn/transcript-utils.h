// trn/transcript-utils.h

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

#ifndef TRNKIT_TRN_TRANSCRIPT_UTILS_H_
#define TRNKIT_TRN_TRANSCRIPT_UTILS_H_

#include <ostream>
#include <string>
#include <vector>

#include "base/trnkit-common.h"
#include "trn/transcript.h"

namespace trnkit {

/// \addtogroup trn_group
/// @{

/// Returns true if any entry of "transcript" is an alternate.
bool TranscriptHasAlternates(const Transcript &transcript);

/// Outputs the tokens of "transcript" in order.  Returns false, and leaves
/// "tokens" empty, if the transcript contains an alternate: alternates must
/// be resolved before a transcript can be used as a plain word sequence.
bool TranscriptToTokens(const Transcript &transcript,
                        std::vector<std::string> *tokens);

/// Replaces every alternate in "transcript" by the entries of its first
/// branch, recursively, so the result has no alternates.  An alternate whose
/// first branch is empty (possible for e.g. "{ / a}") contributes nothing.
/// "resolved" may not be the same object as "transcript".
void ResolveAlternatesFirstBranch(const Transcript &transcript,
                                  Transcript *resolved);

/// Joins tokens with single spaces, the form in which word-error-rate tools
/// take their input.
std::string JoinTranscript(const std::vector<std::string> &tokens);

/// Writes one trn line: the transcript in trn syntax (e.g. "a {b / c d} e"),
/// a space if the transcript is
/// nonempty, "(utt_id)" and a newline.  For any record produced by
/// ParseTrnLine(), parsing the written line gives the same record back.
void WriteTrnLine(const std::string &utt_id, const Transcript &transcript,
                  std::ostream &os);

/// @} end "addtogroup trn_group"

}  // namespace trnkit

#endif  // TRNKIT_TRN_TRANSCRIPT_UTILS_H_
