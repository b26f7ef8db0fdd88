// trn/trn-reader.cc

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

#include <algorithm>
#include <atomic>
#include <limits>
#include <sstream>

#include "trn/trn-reader.h"
#include "trn/trn-parser.h"
#include "util/text-utils.h"
#include "util/trnkit-thread.h"

namespace trnkit {

std::string TrnParseErrorMessage(const std::string &name,
                                 const TrnParseError &error) {
  std::ostringstream ostr;
  ostr << "Error parsing line " << error.line_number << " of trn file "
       << name << ": " << TrnParseStatusToString(error.status);
  if (!error.utt_id.empty())
    ostr << ", for utterance \"" << error.utt_id << "\"";
  if (error.position < error.line.size())
    ostr << ", at column " << (error.position + 1) << " ("
         << CharToString(error.line[error.position]) << ")";
  ostr << ". Line is: " << error.line;
  return ostr.str();
}

namespace {

// Parses lines [begin, end) of one window.  operator () may run concurrently
// with other chunks; the destructor runs in submission order, so it is what
// hands the records (or the error) over to the reader.
class TrnChunkParser {
 public:
  TrnChunkParser(const std::vector<std::string> *lines,
                 size_t begin, size_t end,
                 int64 first_line_number,
                 int64 chunk_index,
                 bool warn_alternates,
                 std::atomic<int64> *first_failed_chunk,
                 std::vector<TrnRecord> *records_out,
                 TrnParseError *error_out):
      lines_(lines), begin_(begin), end_(end),
      first_line_number_(first_line_number), chunk_index_(chunk_index),
      warn_alternates_(warn_alternates),
      first_failed_chunk_(first_failed_chunk),
      records_out_(records_out), error_out_(error_out) { }

  void operator () () {
    // A chunk that started after an earlier one failed has nothing to
    // contribute.  Chunks before the failed one are always parsed, so the
    // error reported is the first one in the input.
    if (first_failed_chunk_->load() < chunk_index_)
      return;
    for (size_t i = begin_; i < end_; i++) {
      const std::string &line = (*lines_)[i];
      records_.push_back(TrnRecord());
      size_t pos;
      TrnParseStatus status = ParseTrnLine(line, warn_alternates_,
                                           &(records_.back().first),
                                           &(records_.back().second), &pos);
      if (status == kTrnParseOk)
        continue;
      if (status == kTrnBlankLine) {
        records_.pop_back();
        continue;
      }
      error_.status = status;
      error_.line_number = first_line_number_ + static_cast<int64>(i - begin_);
      error_.position = pos;
      error_.line = line;
      error_.utt_id = records_.back().first;
      records_.pop_back();
      SetFailed();
      return;
    }
  }

  ~TrnChunkParser() {
    if (error_out_->status != kTrnParseOk)
      return;  // An earlier chunk failed; nothing after it is output.
    for (size_t i = 0; i < records_.size(); i++) {
      records_out_->push_back(TrnRecord());
      records_out_->back().first.swap(records_[i].first);
      records_out_->back().second.swap(records_[i].second);
    }
    if (error_.status != kTrnParseOk)
      *error_out_ = error_;
  }

 private:
  void SetFailed() {
    int64 cur = first_failed_chunk_->load();
    while (chunk_index_ < cur &&
           !first_failed_chunk_->compare_exchange_weak(cur, chunk_index_)) { }
  }

  const std::vector<std::string> *lines_;
  size_t begin_;
  size_t end_;
  int64 first_line_number_;
  int64 chunk_index_;
  bool warn_alternates_;
  std::atomic<int64> *first_failed_chunk_;
  std::vector<TrnRecord> *records_out_;
  TrnParseError *error_out_;

  std::vector<TrnRecord> records_;
  TrnParseError error_;
};

}  // namespace

SequentialTrnReader::SequentialTrnReader():
    is_(NULL), eof_(true), num_lines_read_(0), pos_(0) { }

SequentialTrnReader::SequentialTrnReader(const std::string &rxfilename,
                                         const TrnReaderOptions &opts):
    is_(NULL), eof_(true), num_lines_read_(0), pos_(0) {
  if (!Open(rxfilename, opts))
    TRNKIT_ERR << "Error opening trn file "
               << PrintableRxfilename(rxfilename);
}

bool SequentialTrnReader::Open(const std::string &rxfilename,
                               const TrnReaderOptions &opts) {
  if (IsOpen())
    Close();
  if (!input_.Open(rxfilename))
    return false;
  Open(&(input_.Stream()), PrintableRxfilename(rxfilename), opts);
  return true;
}

void SequentialTrnReader::Open(std::istream *is, const std::string &name,
                               const TrnReaderOptions &opts) {
  TRNKIT_ASSERT(is != NULL);
  opts.Check();
  if (IsOpen() && is != is_)
    Close();
  opts_ = opts;
  is_ = is;
  name_ = name;
  eof_ = false;
  num_lines_read_ = 0;
  records_.clear();
  pos_ = 0;
  FillRecords();
}

bool SequentialTrnReader::Done() const {
  TRNKIT_ASSERT(IsOpen());
  return pos_ >= records_.size();
}

const std::string &SequentialTrnReader::Key() const {
  TRNKIT_ASSERT(!Done());
  return records_[pos_].first;
}

const Transcript &SequentialTrnReader::Value() const {
  TRNKIT_ASSERT(!Done());
  return records_[pos_].second;
}

void SequentialTrnReader::Next() {
  TRNKIT_ASSERT(!Done());
  pos_++;
  if (pos_ >= records_.size())
    FillRecords();
}

void SequentialTrnReader::Close() {
  if (input_.IsOpen())
    input_.Close();
  is_ = NULL;
  eof_ = true;
  records_.clear();
  pos_ = 0;
}

void SequentialTrnReader::FillRecords() {
  records_.clear();
  pos_ = 0;
  if (eof_)
    return;
  if (opts_.num_threads == 1)
    FillRecordsSequential();
  else
    FillRecordsParallel();
}

void SequentialTrnReader::FillRecordsSequential() {
  std::string line;
  while (std::getline(*is_, line)) {
    num_lines_read_++;
    records_.push_back(TrnRecord());
    size_t pos;
    TrnParseStatus status = ParseTrnLine(line, opts_.warn_alternates,
                                         &(records_.back().first),
                                         &(records_.back().second), &pos);
    if (status == kTrnParseOk)
      return;
    if (status == kTrnBlankLine) {
      records_.pop_back();
      continue;
    }
    TrnParseError error;
    error.status = status;
    error.line_number = num_lines_read_;
    error.position = pos;
    error.line = line;
    error.utt_id = records_.back().first;
    records_.clear();
    eof_ = true;
    ReportError(error);
  }
  eof_ = true;
}

void SequentialTrnReader::FillRecordsParallel() {
  size_t chunk_size = opts_.chunk_size,
      window_size = chunk_size * opts_.num_threads;
  // Read until the window holds at least one non-blank line, so an empty
  // records_ means end of input.
  std::vector<std::string> lines;
  int64 first_line_number = num_lines_read_ + 1;
  bool have_content = false;
  std::string line;
  while (lines.size() < window_size || !have_content) {
    if (!std::getline(*is_, line)) {
      eof_ = true;
      break;
    }
    num_lines_read_++;
    if (!have_content) {
      for (size_t i = 0; i < line.size(); i++) {
        if (!IsWhiteSpace(line[i])) {
          have_content = true;
          break;
        }
      }
    }
    lines.push_back(line);
  }
  if (!have_content)
    return;

  std::atomic<int64> first_failed_chunk(std::numeric_limits<int64>::max());
  TrnParseError error;
  TaskSequencerConfig sequencer_config;
  sequencer_config.num_threads = opts_.num_threads;
  {
    TaskSequencer<TrnChunkParser> sequencer(sequencer_config);
    int64 chunk_index = 0;
    for (size_t begin = 0; begin < lines.size();
         begin += chunk_size, chunk_index++) {
      if (first_failed_chunk.load() != std::numeric_limits<int64>::max())
        break;  // Stop dispatching once anything has failed.
      size_t end = std::min(begin + chunk_size, lines.size());
      sequencer.Run(new TrnChunkParser(&lines, begin, end,
                                       first_line_number +
                                       static_cast<int64>(begin),
                                       chunk_index, opts_.warn_alternates,
                                       &first_failed_chunk, &records_,
                                       &error));
    }
    sequencer.Wait();
  }
  if (error.status != kTrnParseOk) {
    records_.clear();
    eof_ = true;
    ReportError(error);
  }
}

void SequentialTrnReader::ReportError(const TrnParseError &error) const {
  TRNKIT_ERR << TrnParseErrorMessage(name_, error);
}

void ReadTrn(const std::string &rxfilename, const TrnReaderOptions &opts,
             std::vector<TrnRecord> *records) {
  TRNKIT_ASSERT(records != NULL);
  records->clear();
  SequentialTrnReader reader(rxfilename, opts);
  for (; !reader.Done(); reader.Next()) {
    records->push_back(TrnRecord(reader.Key(), reader.Value()));
  }
  TRNKIT_VLOG(1) << "Read " << records->size() << " records from "
                 << reader.NumLinesRead() << " lines of "
                 << PrintableRxfilename(rxfilename);
}

void ReadTrnMap(const std::string &rxfilename, const TrnReaderOptions &opts,
                TrnMap *trn_map) {
  TRNKIT_ASSERT(trn_map != NULL);
  trn_map->clear();
  SequentialTrnReader reader(rxfilename, opts);
  int64 num_duplicates = 0;
  for (; !reader.Done(); reader.Next()) {
    const std::string &key = reader.Key();
    TrnMap::iterator iter = trn_map->find(key);
    if (iter != trn_map->end()) {
      TRNKIT_VLOG(1) << "Utterance " << key << " appears more than once in "
                     << PrintableRxfilename(rxfilename)
                     << "; keeping the last one.";
      iter->second = reader.Value();
      num_duplicates++;
    } else {
      (*trn_map)[key] = reader.Value();
    }
  }
  if (num_duplicates > 0)
    TRNKIT_LOG << "Replaced " << num_duplicates << " duplicate utterances "
               << "while reading " << PrintableRxfilename(rxfilename);
}

}  // namespace trnkit
