// trn/trn-reader-test.cc

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

#include <cstdio>

#include "trn/trn-reader.h"
#include "trn/transcript-utils.h"

namespace trnkit {

// Returns a trn file with "num_lines" lines: a mix of plain transcripts,
// alternates, blank lines and unterminated alternates.
static std::string MakeTrnText(int32 num_lines) {
  std::ostringstream os;
  for (int32 i = 0; i < num_lines; i++) {
    switch (i % 6) {
      case 0: os << "w" << i << " x (utt" << i << ")\n"; break;
      case 1: os << "a {b / c" << i << "} d (utt" << i << ")\n"; break;
      case 2: os << "   \n"; break;
      case 3: os << "{x {y / z} / w" << i << "} (utt" << i << ")\n"; break;
      case 4: os << "\n"; break;
      default: os << "k {never closed (utt" << i << ")\n";
    }
  }
  return os.str();
}

static void ReadAll(const std::string &text, const TrnReaderOptions &opts,
                    std::vector<TrnRecord> *records) {
  std::istringstream is(text);
  SequentialTrnReader reader;
  reader.Open(&is, "<test>", opts);
  records->clear();
  for (; !reader.Done(); reader.Next())
    records->push_back(TrnRecord(reader.Key(), reader.Value()));
  reader.Close();
}

// Reads "text", which must contain a bad line, and returns the error
// message.
static std::string ReadExpectingError(const std::string &text,
                                      const TrnReaderOptions &opts) {
  try {
    std::vector<TrnRecord> records;
    ReadAll(text, opts, &records);
  } catch (const TrnkitFatalError &e) {
    return e.TrnkitMessage();
  }
  TRNKIT_ERR << "Expected an error reading: " << text;
  return "";
}

void UnitTestTrnReaderBasic() {
  TrnReaderOptions opts;
  opts.warn_alternates = false;
  std::vector<TrnRecord> records;
  ReadAll("hello world (utt1)\n\n  \n a {b / c} d (utt2)\nx (utt1)", opts,
          &records);
  TRNKIT_ASSERT(records.size() == 3);
  TRNKIT_ASSERT(records[0].first == "utt1" && records[0].second.size() == 2);
  TRNKIT_ASSERT(records[1].first == "utt2" &&
                TranscriptHasAlternates(records[1].second));
  // Duplicates are passed through.
  TRNKIT_ASSERT(records[2].first == "utt1" && records[2].second.size() == 1);

  ReadAll("", opts, &records);
  TRNKIT_ASSERT(records.empty());
  ReadAll("\n \n\t\n", opts, &records);
  TRNKIT_ASSERT(records.empty());
}

void UnitTestTrnReaderLazy() {
  TrnReaderOptions opts;
  opts.warn_alternates = false;
  std::istringstream is("a (u1)\n\nb (u2)\nc (u3)\n");
  SequentialTrnReader reader;
  reader.Open(&is, "<test>", opts);
  TRNKIT_ASSERT(!reader.Done() && reader.Key() == "u1");
  TRNKIT_ASSERT(reader.NumLinesRead() == 1);
  reader.Next();
  TRNKIT_ASSERT(reader.Key() == "u2" && reader.NumLinesRead() == 3);
  reader.Next();
  reader.Next();
  TRNKIT_ASSERT(reader.Done());
}

void UnitTestTrnReaderErrors() {
  TrnReaderOptions opts;
  opts.warn_alternates = false;
  std::string msg = ReadExpectingError("a (u1)\n\nb {} (u2)\nc (u3)\n", opts);
  TRNKIT_ASSERT(msg.find("line 3 ") != std::string::npos);
  TRNKIT_ASSERT(msg.find("<test>") != std::string::npos);
  TRNKIT_ASSERT(msg.find("empty alternate") != std::string::npos);
  TRNKIT_ASSERT(msg.find("\"u2\"") != std::string::npos);
  TRNKIT_ASSERT(msg.find("column 4") != std::string::npos);
  TRNKIT_ASSERT(msg.find("b {} (u2)") != std::string::npos);

  msg = ReadExpectingError("a (u1)\nno id here\n", opts);
  TRNKIT_ASSERT(msg.find("line 2 ") != std::string::npos);
  TRNKIT_ASSERT(msg.find("utterance id") != std::string::npos);
  TRNKIT_ASSERT(msg.find("no id here") != std::string::npos);

  // The error stops the read at the bad line, even with records after it.
  std::istringstream is("a (u1)\nbad\nc (u3)\n");
  SequentialTrnReader reader;
  reader.Open(&is, "<test>", opts);
  TRNKIT_ASSERT(reader.Key() == "u1");
  bool threw = false;
  try {
    reader.Next();
  } catch (const TrnkitFatalError &) {
    threw = true;
  }
  TRNKIT_ASSERT(threw && reader.Done());
}

void UnitTestTrnReaderThreaded() {
  std::string text = MakeTrnText(1000 + rand() % 3000);
  TrnReaderOptions opts;
  opts.warn_alternates = false;
  std::vector<TrnRecord> records1;
  ReadAll(text, opts, &records1);
  TRNKIT_ASSERT(!records1.empty());

  for (int32 i = 0; i < 5; i++) {
    TrnReaderOptions threaded_opts(opts);
    threaded_opts.num_threads = 2 + rand() % 6;
    threaded_opts.chunk_size = 1 + rand() % 200;
    std::vector<TrnRecord> records2;
    ReadAll(text, threaded_opts, &records2);
    TRNKIT_ASSERT(records1 == records2);
  }
}

void UnitTestTrnReaderThreadedErrors() {
  // Bad lines in several chunks: the first one in the file is reported,
  // whatever the number of threads.
  std::ostringstream os;
  for (int32 i = 1; i <= 500; i++) {
    if (i == 123 || i == 124 || i == 377)
      os << "bad line " << i << "\n";
    else if (i == 200)
      os << "x {a / } (utt" << i << ")\n";
    else
      os << "w" << i << " (utt" << i << ")\n";
  }
  std::string text = os.str();
  for (int32 i = 0; i < 10; i++) {
    TrnReaderOptions opts;
    opts.warn_alternates = false;
    opts.num_threads = 1 + rand() % 8;
    opts.chunk_size = 1 + rand() % 50;
    std::string msg = ReadExpectingError(text, opts);
    TRNKIT_ASSERT(msg.find("line 123 ") != std::string::npos);
    TRNKIT_ASSERT(msg.find("bad line 123") != std::string::npos);
  }
}

void UnitTestReadTrnMap() {
  const char *filename = "trn-reader-test.trn";
  {
    std::ofstream os(filename);
    os << "a b (u2)\n"
       << "c (u1)\n"
       << "\n"
       << "d e f (u2)\n";
  }
  TrnReaderOptions opts;
  std::vector<TrnRecord> records;
  ReadTrn(filename, opts, &records);
  TRNKIT_ASSERT(records.size() == 3 && records[2].first == "u2");

  TrnMap trn_map;
  opts.num_threads = 2;
  opts.chunk_size = 1;
  ReadTrnMap(filename, opts, &trn_map);
  TRNKIT_ASSERT(trn_map.size() == 2);
  TRNKIT_ASSERT(trn_map["u1"].size() == 1);
  TRNKIT_ASSERT(trn_map["u2"].size() == 3);  // the last one wins.
  std::remove(filename);

  SequentialTrnReader reader;
  TRNKIT_ASSERT(!reader.Open("no-such-dir/no-such-file.trn", opts));
  TRNKIT_ASSERT(!reader.IsOpen());
}

}  // namespace trnkit

int main() {
  using namespace trnkit;
  UnitTestTrnReaderBasic();
  UnitTestTrnReaderLazy();
  UnitTestTrnReaderErrors();
  UnitTestTrnReaderThreaded();
  UnitTestTrnReaderThreadedErrors();
  UnitTestReadTrnMap();
  std::cout << "Test OK.\n";
}
