// trn/alternate-tree.cc

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

#include "trn/alternate-tree.h"

namespace trnkit {

const char *TrnParseStatusToString(TrnParseStatus status) {
  switch (status) {
    case kTrnParseOk:
      return "ok";
    case kTrnBlankLine:
      return "blank line";
    case kTrnFormatError:
      return "line does not end in an utterance id, e.g. \"(utt_id)\"";
    case kTrnEmptyAlternate:
      return "empty alternate found (\"{ }\")";
    case kTrnNoOpenAlternate:
      return "alternate separator with no open alternate";
    default:
      return "unknown status";
  }
}

AlternateTree::AlternateTree(Transcript *transcript):
    transcript_(transcript), num_alternates_(0) {
  TRNKIT_ASSERT(transcript != NULL);
}

std::vector<TranscriptEntry> *AlternateTree::CurrentBranch() {
  if (frames_.empty())
    return transcript_;
  return &(frames_.back().branches.back());
}

void AlternateTree::OpenScope() {
  frames_.push_back(Frame());
}

TrnParseStatus AlternateTree::StartBranch() {
  if (frames_.empty())
    return kTrnNoOpenAlternate;
  frames_.back().branches.push_back(TranscriptEntry::Branch());
  return kTrnParseOk;
}

TrnParseStatus AlternateTree::CloseScope() {
  if (frames_.empty())
    return kTrnNoOpenAlternate;
  if (frames_.back().branches.back().empty())
    return kTrnEmptyAlternate;
  std::vector<TranscriptEntry::Branch> branches;
  branches.swap(frames_.back().branches);
  frames_.pop_back();
  num_alternates_++;
  std::vector<TranscriptEntry> *dest = CurrentBranch();
  dest->push_back(TranscriptEntry());
  dest->back().type = TranscriptEntry::kAlternate;
  dest->back().branches.swap(branches);
  return kTrnParseOk;
}

void AlternateTree::AddToken(const std::string &token) {
  TRNKIT_ASSERT(!token.empty());
  CurrentBranch()->push_back(TranscriptEntry(token));
}

}  // namespace trnkit
