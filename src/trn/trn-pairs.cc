// trn/trn-pairs.cc

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

#include "trn/trn-pairs.h"
#include "trn/transcript-utils.h"
#include "util/text-utils.h"

namespace trnkit {

static std::string JoinIds(const std::vector<std::string> &ids,
                           const char *delim) {
  std::string ans;
  JoinVectorToString(ids, delim, false, &ans);
  return ans;
}

static std::string FlattenForScoring(const std::string &utt_id,
                                     const Transcript &transcript,
                                     const char *which) {
  std::vector<std::string> tokens;
  if (!TranscriptToTokens(transcript, &tokens))
    TRNKIT_ERR << "The " << which << " transcript for utterance " << utt_id
               << " contains an alternate; resolve alternates before "
               << "scoring.";
  return JoinTranscript(tokens);
}

bool PairTrnTranscripts(const TrnMap &ref_map,
                        const TrnMap &hyp_map,
                        std::vector<std::string> *keys,
                        std::vector<std::string> *ref_texts,
                        std::vector<std::string> *hyp_texts) {
  TRNKIT_ASSERT(keys != NULL && ref_texts != NULL && hyp_texts != NULL);
  keys->clear();
  ref_texts->clear();
  hyp_texts->clear();

  std::vector<std::string> empty_refs;
  for (TrnMap::const_iterator iter = ref_map.begin(); iter != ref_map.end();
       ++iter)
    if (iter->second.empty())
      empty_refs.push_back(iter->first);
  if (!empty_refs.empty()) {
    TRNKIT_WARN << "One or more reference transcriptions are empty: "
                << JoinIds(empty_refs, ", ");
    return false;
  }

  // TrnMap is ordered, so walking both maps together finds the ids that are
  // on one side only, each list already sorted.
  std::vector<std::string> missing_from_hyp, missing_from_ref;
  TrnMap::const_iterator ref_iter = ref_map.begin(),
      hyp_iter = hyp_map.begin();
  while (ref_iter != ref_map.end() || hyp_iter != hyp_map.end()) {
    if (hyp_iter == hyp_map.end() ||
        (ref_iter != ref_map.end() && ref_iter->first < hyp_iter->first)) {
      missing_from_hyp.push_back(ref_iter->first);
      ++ref_iter;
    } else if (ref_iter == ref_map.end() ||
               hyp_iter->first < ref_iter->first) {
      missing_from_ref.push_back(hyp_iter->first);
      ++hyp_iter;
    } else {
      ++ref_iter;
      ++hyp_iter;
    }
  }
  if (!missing_from_hyp.empty() || !missing_from_ref.empty()) {
    TRNKIT_WARN << "ref and hyp file have different utterances!";
    if (!missing_from_hyp.empty())
      TRNKIT_WARN << "Missing from hyp: "
                  << JoinIds(missing_from_hyp, " ");
    if (!missing_from_ref.empty())
      TRNKIT_WARN << "Missing from ref: "
                  << JoinIds(missing_from_ref, " ");
    return false;
  }

  keys->reserve(ref_map.size());
  ref_texts->reserve(ref_map.size());
  hyp_texts->reserve(ref_map.size());
  for (ref_iter = ref_map.begin(), hyp_iter = hyp_map.begin();
       ref_iter != ref_map.end(); ++ref_iter, ++hyp_iter) {
    keys->push_back(ref_iter->first);
    ref_texts->push_back(FlattenForScoring(ref_iter->first, ref_iter->second,
                                           "reference"));
    hyp_texts->push_back(FlattenForScoring(hyp_iter->first, hyp_iter->second,
                                           "hypothesis"));
  }
  return true;
}

}  // namespace trnkit
