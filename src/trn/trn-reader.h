// trn/trn-reader.h

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

#ifndef TRNKIT_TRN_TRN_READER_H_
#define TRNKIT_TRN_TRN_READER_H_

#include <istream>
#include <string>
#include <vector>

#include "base/trnkit-common.h"
#include "itf/options-itf.h"
#include "trn/alternate-tree.h"
#include "trn/transcript.h"
#include "util/trnkit-io.h"

namespace trnkit {

/// \addtogroup trn_group
/// @{

struct TrnReaderOptions {
  bool warn_alternates;
  int32 num_threads;
  int32 chunk_size;

  TrnReaderOptions(): warn_alternates(true), num_threads(1),
                      chunk_size(1000) { }

  void Register(OptionsItf *opts) {
    opts->Register("warn-alternates", &warn_alternates, "If true, print a "
                   "warning for every utterance whose transcript contains an "
                   "alternate (\"{a / b}\").");
    opts->Register("num-threads", &num_threads, "Number of threads used to "
                   "parse trn lines.  With more than one, lines are read in "
                   "windows of num-threads * chunk-size and parsed in "
                   "parallel; records still come out in input order.");
    opts->Register("chunk-size", &chunk_size, "Number of lines each parsing "
                   "thread is given at a time (only relevant if "
                   "--num-threads > 1)");
  }
  void Check() const {
    TRNKIT_ASSERT(num_threads >= 1 && chunk_size >= 1);
  }
};

/// Where and why a line of a trn file could not be parsed.
struct TrnParseError {
  TrnParseStatus status;
  int64 line_number;       // 1-based.
  size_t position;         // Offset in "line", or std::string::npos.
  std::string line;
  std::string utt_id;      // Empty unless the id could be located.

  TrnParseError(): status(kTrnParseOk), line_number(0),
                   position(std::string::npos) { }
};

/**
   SequentialTrnReader reads the utterance records of a trn file one by one,
   in the style of a sequential table reader:

     SequentialTrnReader reader(rxfilename, opts);
     for (; !reader.Done(); reader.Next()) {
       const std::string &utt = reader.Key();
       const Transcript &transcript = reader.Value();
       ...
     }

   Blank lines are skipped.  The first line that cannot be parsed (see
   ParseTrnLine()) is fatal: Next() (or the constructor / Open(), for the
   first record) calls TRNKIT_ERR with the file name, line number, cause and
   the line itself, and no further records are returned.  A trn file is used
   all or nothing, so there is no "skip bad lines" mode.

   With opts.num_threads == 1, lines are read and parsed one at a time as the
   caller advances.  With more threads, a window of
   num_threads * chunk_size lines is read, split into chunks that are parsed
   in parallel, and the window's records are handed out in input order before
   the next window is read.  Once a chunk fails, chunks after it are not
   parsed and no more are dispatched; the error reported is the first one in
   input order, so the outcome does not depend on the number of threads.

   Duplicate utterance ids are returned as they are.
 */
class SequentialTrnReader {
 public:
  SequentialTrnReader();

  /// Opens "rxfilename" ("-" for the standard input); TRNKIT_ERRs if it
  /// cannot be opened.
  explicit SequentialTrnReader(const std::string &rxfilename,
                               const TrnReaderOptions &opts =
                               TrnReaderOptions());

  /// Returns false (after a warning) if the file cannot be opened.  Parse
  /// errors in the first record are fatal, as for Next().
  bool Open(const std::string &rxfilename,
            const TrnReaderOptions &opts = TrnReaderOptions());

  /// Reads from a stream the caller owns and keeps alive until Close().
  /// "name" is only used in messages.
  void Open(std::istream *is, const std::string &name,
            const TrnReaderOptions &opts = TrnReaderOptions());

  bool IsOpen() const { return is_ != NULL; }

  /// True when all records have been returned.
  bool Done() const;

  /// Utterance id of the current record.  Only valid if !Done().
  const std::string &Key() const;

  /// Transcript of the current record.  Only valid if !Done().
  const Transcript &Value() const;

  /// Moves to the next record.
  void Next();

  void Close();

  /// Number of lines consumed from the input so far, including blank ones.
  int64 NumLinesRead() const { return num_lines_read_; }

  ~SequentialTrnReader() { Close(); }

 private:
  // Refills records_ (resetting pos_ to 0) unless the input is exhausted.
  void FillRecords();
  // Reads and parses lines until one record has been found.
  void FillRecordsSequential();
  // Reads one window of lines and parses it with a TaskSequencer.
  void FillRecordsParallel();
  // Calls TRNKIT_ERR.
  void ReportError(const TrnParseError &error) const;

  TrnReaderOptions opts_;
  Input input_;
  std::istream *is_;
  std::string name_;
  bool eof_;
  int64 num_lines_read_;
  std::vector<TrnRecord> records_;
  size_t pos_;

  TRNKIT_DISALLOW_COPY_AND_ASSIGN(SequentialTrnReader);
};

/// Reads all records of "rxfilename" into "records", in file order.
/// TRNKIT_ERRs if the file cannot be opened or a line cannot be parsed.
void ReadTrn(const std::string &rxfilename, const TrnReaderOptions &opts,
             std::vector<TrnRecord> *records);

/// Like ReadTrn(), but outputs a map from utterance id to transcript.  If an
/// id appears more than once, the last record wins.
void ReadTrnMap(const std::string &rxfilename, const TrnReaderOptions &opts,
                TrnMap *trn_map);

/// Formats "error" as a human-readable message for the file "name".
std::string TrnParseErrorMessage(const std::string &name,
                                 const TrnParseError &error);

/// @} end "addtogroup trn_group"

}  // namespace trnkit

#endif  // TRNKIT_TRN_TRN_READER_H_
