// trn/alternate-tree.h

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

#ifndef TRNKIT_TRN_ALTERNATE_TREE_H_
#define TRNKIT_TRN_ALTERNATE_TREE_H_

#include <string>
#include <vector>

#include "base/trnkit-common.h"
#include "trn/transcript.h"

namespace trnkit {

/// \addtogroup trn_group
/// @{

/// Result of parsing a trn line, or of one step of building its alternates.
enum TrnParseStatus {
  kTrnParseOk = 0,       ///< A record was produced.
  kTrnBlankLine,         ///< Line was empty or whitespace; no record, no error.
  kTrnFormatError,       ///< Line does not end in an utterance id "(id)".
  kTrnEmptyAlternate,    ///< An alternate was closed on an empty branch.
  kTrnNoOpenAlternate    ///< '/' or '}' with no alternate open.  Never
                         ///  returned by ParseTrnLine(): the parser treats
                         ///  such characters as part of a token.
};

/// Returns a human-readable description of "status", for error messages.
const char *TrnParseStatusToString(TrnParseStatus status);

/**
   AlternateTree keeps track of the alternates that are open while one trn
   line is scanned.  It is a stack of frames: frame i is the alternate opened
   inside frame i-1, and frame 0 is opened directly in the transcript.  Each
   frame holds the branches collected so far; the last one is the current
   branch.  When a frame is closed, its branches become one kAlternate entry,
   appended to the current branch of the frame below, or to the transcript if
   there is none.

   Nothing that belongs to a still-open frame reaches the transcript, so an
   alternate that is never closed is dropped just by destroying the object
   (or calling DiscardOpen()).

   The object does not own the transcript and is meant to live for the
   duration of a single line.
 */
class AlternateTree {
 public:
  /// "transcript" receives tokens and closed alternates at the top level.
  /// It is not cleared.
  explicit AlternateTree(Transcript *transcript);

  /// Opens a nested alternate inside the current scope (or at the top level
  /// if none is open), with a single empty branch.  Always succeeds.
  void OpenScope();

  /// Starts a new, empty branch of the innermost open alternate.  Returns
  /// kTrnNoOpenAlternate, and does nothing, if no alternate is open.
  TrnParseStatus StartBranch();

  /// Closes the innermost open alternate.  Returns kTrnNoOpenAlternate if
  /// none is open, and kTrnEmptyAlternate (leaving the state unchanged) if
  /// its current branch has no entries; otherwise kTrnParseOk.
  TrnParseStatus CloseScope();

  /// Appends a completed token to the current branch of the innermost open
  /// alternate, or to the transcript if none is open.  "token" must be
  /// nonempty.
  void AddToken(const std::string &token);

  /// Drops all open alternates and their contents.
  void DiscardOpen() { frames_.clear(); }

  /// True if at least one alternate is open.
  bool InAlternate() const { return !frames_.empty(); }

  /// Number of alternates currently open (0 means top level).
  int32 Depth() const { return static_cast<int32>(frames_.size()); }

  /// Number of successful CloseScope() calls, at any depth.  Alternates
  /// closed inside an alternate that is later discarded are counted too.
  int32 NumAlternates() const { return num_alternates_; }

 private:
  struct Frame {
    std::vector<TranscriptEntry::Branch> branches;
    Frame(): branches(1) { }
  };

  // Where new entries go: the current branch of the innermost frame, or the
  // transcript.
  std::vector<TranscriptEntry> *CurrentBranch();

  Transcript *transcript_;
  std::vector<Frame> frames_;
  int32 num_alternates_;

  TRNKIT_DISALLOW_COPY_AND_ASSIGN(AlternateTree);
};

/// @} end "addtogroup trn_group"

}  // namespace trnkit

#endif  // TRNKIT_TRN_ALTERNATE_TREE_H_
