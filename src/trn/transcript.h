// trn/transcript.h

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

#ifndef TRNKIT_TRN_TRANSCRIPT_H_
#define TRNKIT_TRN_TRANSCRIPT_H_

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "base/trnkit-common.h"

namespace trnkit {

/// \addtogroup trn_group
/// @{

/// One position in a transcript: either a plain token (a word, taken
/// verbatim from the trn line), or an alternate, i.e. a list of competing
/// branches written as {a / b c / d} in the trn file.  A branch is itself a
/// sequence of entries, so alternates may nest.
struct TranscriptEntry {
  enum EntryType {
    kToken = 0,
    kAlternate = 1
  };
  typedef std::vector<TranscriptEntry> Branch;

  EntryType type;
  std::string token;             // Only meaningful if type == kToken.
  std::vector<Branch> branches;  // Only meaningful if type == kAlternate.

  TranscriptEntry(): type(kToken) { }

  explicit TranscriptEntry(const std::string &tok): type(kToken), token(tok) { }

  explicit TranscriptEntry(const std::vector<Branch> &alt):
      type(kAlternate), branches(alt) { }

  bool IsToken() const { return type == kToken; }
  bool IsAlternate() const { return type == kAlternate; }

  bool operator == (const TranscriptEntry &other) const {
    if (type != other.type) return false;
    if (type == kToken) return token == other.token;
    return branches == other.branches;
  }
  bool operator != (const TranscriptEntry &other) const {
    return !(*this == other);
  }
};

/// A transcript is the sequence of entries of one trn line, in left-to-right
/// order.
typedef std::vector<TranscriptEntry> Transcript;

/// An utterance record: (utterance id, transcript).
typedef std::pair<std::string, Transcript> TrnRecord;

/// Utterance id -> transcript, for consumers that need set semantics.
typedef std::map<std::string, Transcript> TrnMap;

/// @} end "addtogroup trn_group"

}  // namespace trnkit

#endif  // TRNKIT_TRN_TRANSCRIPT_H_
