// trn/transcript-utils.cc

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

#include "trn/transcript-utils.h"

#include "util/text-utils.h"

namespace trnkit {

bool TranscriptHasAlternates(const Transcript &transcript) {
  for (size_t i = 0; i < transcript.size(); i++)
    if (transcript[i].IsAlternate())
      return true;
  return false;
}

bool TranscriptToTokens(const Transcript &transcript,
                        std::vector<std::string> *tokens) {
  tokens->clear();
  tokens->reserve(transcript.size());
  for (size_t i = 0; i < transcript.size(); i++) {
    if (transcript[i].IsAlternate()) {
      tokens->clear();
      return false;
    }
    tokens->push_back(transcript[i].token);
  }
  return true;
}

static void AppendResolved(const std::vector<TranscriptEntry> &entries,
                           Transcript *resolved) {
  for (size_t i = 0; i < entries.size(); i++) {
    const TranscriptEntry &entry = entries[i];
    if (entry.IsToken()) {
      resolved->push_back(entry);
    } else {
      TRNKIT_ASSERT(!entry.branches.empty());
      AppendResolved(entry.branches[0], resolved);
    }
  }
}

void ResolveAlternatesFirstBranch(const Transcript &transcript,
                                  Transcript *resolved) {
  TRNKIT_ASSERT(resolved != &transcript);
  resolved->clear();
  AppendResolved(transcript, resolved);
}

std::string JoinTranscript(const std::vector<std::string> &tokens) {
  std::string ans;
  JoinVectorToString(tokens, " ", false, &ans);
  return ans;
}

static void WriteEntries(const std::vector<TranscriptEntry> &entries,
                         std::ostream &os) {
  for (size_t i = 0; i < entries.size(); i++) {
    if (i != 0) os << ' ';
    const TranscriptEntry &entry = entries[i];
    if (entry.IsToken()) {
      os << entry.token;
    } else {
      os << '{';
      for (size_t b = 0; b < entry.branches.size(); b++) {
        if (b != 0) os << " / ";
        WriteEntries(entry.branches[b], os);
      }
      os << '}';
    }
  }
}

void WriteTrnLine(const std::string &utt_id, const Transcript &transcript,
                  std::ostream &os) {
  WriteEntries(transcript, os);
  if (!transcript.empty()) os << ' ';
  os << '(' << utt_id << ")\n";
}

}  // namespace trnkit
