// util/trnkit-io.cc

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

#include "util/trnkit-io.h"

#include <errno.h>
#include <cstdlib>
#include <cstring>

#include "util/text-utils.h"

namespace trnkit {

InputType ClassifyRxfilename(const std::string &filename) {
  if (filename.size() == 0 || filename == "-") {
    return kStandardInput;
  } else if (IsWhiteSpace(filename[0]) ||
             IsWhiteSpace(filename[filename.length() - 1])) {
    return kNoInput;  // leading or trailing space: can't interpret this.
  } else if (filename[filename.length() - 1] == '|' || filename[0] == '|') {
    return kNoInput;  // pipes are not supported.
  } else {
    return kFileInput;
  }
}

OutputType ClassifyWxfilename(const std::string &filename) {
  if (filename.size() == 0 || filename == "-") {
    return kStandardOutput;
  } else if (IsWhiteSpace(filename[0]) ||
             IsWhiteSpace(filename[filename.length() - 1])) {
    return kNoOutput;
  } else if (filename[0] == '|' || filename[filename.length() - 1] == '|') {
    return kNoOutput;
  } else if (filename[filename.length() - 1] == '/') {
    return kNoOutput;  // a directory.
  } else {
    return kFileOutput;
  }
}

std::string PrintableRxfilename(const std::string &rxfilename) {
  if (rxfilename == "" || rxfilename == "-") {
    return "standard input";
  } else {
    std::ostringstream ss;
    ss << '"' << rxfilename << '"';
    return ss.str();
  }
}

std::string PrintableWxfilename(const std::string &wxfilename) {
  if (wxfilename == "" || wxfilename == "-") {
    return "standard output";
  } else {
    std::ostringstream ss;
    ss << '"' << wxfilename << '"';
    return ss.str();
  }
}


Output::Output(const std::string &wxfilename): os_(NULL), file_(NULL) {
  if (!Open(wxfilename)) {
    TRNKIT_ERR << "Error opening output stream "
               << PrintableWxfilename(wxfilename);
  }
}

bool Output::Open(const std::string &wxfn) {
  if (IsOpen()) {
    if (!Close()) {  // Throw here rather than return status, as it's an error
      // about something else: if the user wanted to avoid the exception he/she
      // could have called Close().
      TRNKIT_ERR << "Output::Open(), failed to close output stream: "
                 << PrintableWxfilename(filename_);
    }
  }

  filename_ = wxfn;
  OutputType type = ClassifyWxfilename(wxfn);

  switch (type) {
    case kStandardOutput:
      os_ = &std::cout;
      return std::cout.good();
    case kFileOutput:
      file_ = new std::ofstream(wxfn.c_str(), std::ios_base::out);
      if (!file_->is_open()) {
        TRNKIT_WARN << "Failed opening output file "
                    << PrintableWxfilename(wxfn) << ": " << strerror(errno);
        delete file_;
        file_ = NULL;
        return false;
      }
      os_ = file_;
      return true;
    case kNoOutput:
    default:
      TRNKIT_WARN << "Invalid output filename format "
                  << PrintableWxfilename(wxfn);
      return false;
  }
}

std::ostream &Output::Stream() {  // will throw if not open; else returns
  // stream.
  if (!IsOpen()) TRNKIT_ERR << "Output::Stream() called but not open.";
  return *os_;
}

bool Output::Close() {
  if (!IsOpen()) return false;  // error to call Close if not open.
  bool ans = true;
  os_->flush();
  if (os_->fail()) ans = false;
  if (file_ != NULL) {
    file_->close();
    if (file_->fail()) ans = false;
    delete file_;
    file_ = NULL;
  }
  os_ = NULL;
  return ans;
}

Output::~Output() {
  if (IsOpen()) {
    bool ok = Close();
    if (!ok)
      TRNKIT_WARN << "Error closing output file "
                  << PrintableWxfilename(filename_)
                  << (ClassifyWxfilename(filename_) == kFileOutput ?
                      " (disk full?)" : "");
  }
}


Input::Input(const std::string &rxfilename): is_(NULL), file_(NULL) {
  if (!Open(rxfilename)) {
    TRNKIT_ERR << "Error opening input stream "
               << PrintableRxfilename(rxfilename);
  }
}

bool Input::Open(const std::string &rxfilename) {
  if (IsOpen()) Close();
  InputType type = ClassifyRxfilename(rxfilename);
  switch (type) {
    case kStandardInput:
      is_ = &std::cin;
      return true;
    case kFileInput:
      file_ = new std::ifstream(rxfilename.c_str(), std::ios_base::in);
      if (!file_->is_open()) {
        TRNKIT_WARN << "Failed opening input file "
                    << PrintableRxfilename(rxfilename) << ": "
                    << strerror(errno);
        delete file_;
        file_ = NULL;
        return false;
      }
      is_ = file_;
      return true;
    case kNoInput:
    default:
      TRNKIT_WARN << "Invalid input filename format "
                  << PrintableRxfilename(rxfilename);
      return false;
  }
}

std::istream &Input::Stream() {
  if (!IsOpen()) TRNKIT_ERR << "Input::Stream(), not open.";
  return *is_;
}

void Input::Close() {
  if (file_ != NULL) {
    file_->close();
    delete file_;
    file_ = NULL;
  }
  is_ = NULL;
}

Input::~Input() { if (IsOpen()) Close(); }

}  // end namespace trnkit
