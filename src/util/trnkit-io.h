// util/trnkit-io.h

// Copyright 2009-2011  Microsoft Corporation;  Jan Silovsky
//                2016  Xiaohui Zhang

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

#ifndef TRNKIT_UTIL_TRNKIT_IO_H_
#define TRNKIT_UTIL_TRNKIT_IO_H_

#include <cctype>  // For isspace.
#include <fstream>
#include <limits>
#include <string>

#include "base/trnkit-common.h"

namespace trnkit {

/// \addtogroup io_group
/// @{

// An rxfilename is a filename to read from, where "-" or "" means the
// standard input.  A wxfilename is a filename to write to, where "-" or ""
// means the standard output.  Pipes ("cmd |") and archive offsets are not
// supported; trn files are always read as plain text.

enum InputType {
  kNoInput,
  kFileInput,
  kStandardInput
};

enum OutputType {
  kNoOutput,
  kFileOutput,
  kStandardOutput
};

/// ClassifyRxfilename interprets filenames for reading.
InputType ClassifyRxfilename(const std::string &rxfilename);

/// ClassifyWxfilename interprets filenames for writing.
OutputType ClassifyWxfilename(const std::string &wxfilename);

/// PrintableRxfilename turns the rxfilename into a more human-readable
/// form for error reporting, i.e. it does quoting and escaping and
/// replaces "" or "-" with "standard input".
std::string PrintableRxfilename(const std::string &rxfilename);

/// PrintableWxfilename turns the wxfilename into a more human-readable
/// form for error reporting, i.e. it does quoting and escaping and
/// replaces "" or "-" with "standard output".
std::string PrintableWxfilename(const std::string &wxfilename);


class Output {
 public:
  // The normal constructor, provided for convenience.
  // Equivalent to calling with default constructor then Open()
  // with these arguments.  Throws with TRNKIT_ERR if it cannot open.
  explicit Output(const std::string &filename);

  Output(): os_(NULL), file_(NULL) {}

  /// This opens the stream, and returns true on success.  It prints a
  /// warning on failure.
  bool Open(const std::string &wxfilename);

  inline bool IsOpen();  // return true if we have an open stream.  Does not
  // imply stream is good for writing.

  std::ostream &Stream();  // will throw if not open; else returns stream.

  // Close flushes and closes the stream, and returns false if anything went
  // wrong (e.g. disk full).  Programs should call it and check the result;
  // the destructor can only warn.
  bool Close();

  ~Output();

 private:
  std::ostream *os_;  // Either &std::cout, or file_.
  std::ofstream *file_;
  std::string filename_;
};


/// class Input reads from a file or the standard input.
class Input {
 public:
  /// The normal constructor.  Opens the stream, and TRNKIT_ERRs on
  /// failure.
  explicit Input(const std::string &rxfilename);

  Input(): is_(NULL), file_(NULL) {}

  /// This opens the stream, and returns true on success.  It prints a
  /// warning on failure.
  bool Open(const std::string &rxfilename);

  /// Returns true if currently open.
  inline bool IsOpen() { return is_ != NULL; }

  /// Closes the stream.
  void Close();

  /// Returns the underlying stream. Throws if !IsOpen()
  std::istream &Stream();

  /// Destructor does not throw: input streams may legitimately fail so we
  /// don't worry about the status when we close them.
  ~Input();

 private:
  std::istream *is_;  // Either &std::cin, or file_.
  std::ifstream *file_;
  TRNKIT_DISALLOW_COPY_AND_ASSIGN(Input);
};

inline bool Output::IsOpen() { return os_ != NULL; }

/// @} end "addtogroup io_group"

}  // end namespace trnkit

#endif  // TRNKIT_UTIL_TRNKIT_IO_H_
