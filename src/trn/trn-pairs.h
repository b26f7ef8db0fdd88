// trn/trn-pairs.h

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

#ifndef TRNKIT_TRN_TRN_PAIRS_H_
#define TRNKIT_TRN_TRN_PAIRS_H_

#include <string>
#include <vector>

#include "base/trnkit-common.h"
#include "trn/transcript.h"

namespace trnkit {

/// \addtogroup trn_group
/// @{

/**
   Lines up a reference and a hypothesis trn file for scoring.  On success,
   "keys" holds the utterance ids in ascending order and "ref_texts" /
   "hyp_texts" the corresponding transcripts, flattened to space-joined plain
   tokens (see JoinTranscript()).

   Returns false, after warnings, if
    - any reference transcript is empty (all such ids are listed), or
    - the two maps do not have the same utterance ids; the ids missing from
      each side are listed, sorted.
   The outputs are cleared in that case.

   A transcript that still holds an alternate cannot be flattened; that is
   a fatal error (TRNKIT_ERR), so resolve alternates first, e.g. with
   ResolveAlternatesFirstBranch().
 */
bool PairTrnTranscripts(const TrnMap &ref_map,
                        const TrnMap &hyp_map,
                        std::vector<std::string> *keys,
                        std::vector<std::string> *ref_texts,
                        std::vector<std::string> *hyp_texts);

/// @} end "addtogroup trn_group"

}  // namespace trnkit

#endif  // TRNKIT_TRN_TRN_PAIRS_H_
