// util/text-utils.cc

// Copyright 2009-2011  Saarland University;  Microsoft Corporation

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

#include "util/text-utils.h"

#include <cctype>
#include <cstdlib>
#include <sstream>

#include "base/trnkit-common.h"


namespace trnkit {


void JoinVectorToString(const std::vector<std::string> &vec_in,
                        const char *delim, bool omit_empty_strings,
                        std::string *str_out) {
  std::string tmp_str;
  bool first = true;
  for (size_t i = 0; i < vec_in.size(); i++) {
    if (omit_empty_strings && vec_in[i].empty())
      continue;
    if (!first)
      tmp_str.append(delim);
    tmp_str.append(vec_in[i]);
    first = false;
  }
  str_out->swap(tmp_str);
}

namespace {
template<typename T>
bool ConvertStringToRealInternal(const std::string &str,
                                 T *out) {
  TRNKIT_ASSERT_IS_FLOATING_TYPE(T);
  std::istringstream iss(str);

  T tmp;
  iss >> tmp;
  if (iss.fail())
    return false;

  // Only trailing whitespace is allowed after the number.
  std::string rem;
  iss >> rem;
  if (!rem.empty())
    return false;

  *out = tmp;
  return true;
}
}  // namespace

template <typename T>
bool ConvertStringToReal(const std::string &str,
                         T *out) {
  return ConvertStringToRealInternal(str, out);
}

template
bool ConvertStringToReal(const std::string &str,
                         float *out);
template
bool ConvertStringToReal(const std::string &str,
                         double *out);


void Trim(std::string *str) {
  size_t first = 0, last = str->size();
  while (first < last && IsWhiteSpace((*str)[first]))
    first++;
  while (last > first && IsWhiteSpace((*str)[last - 1]))
    last--;
  if (first == 0 && last == str->size())
    return;
  *str = str->substr(first, last - first);
}

bool IsToken(const std::string &token) {
  size_t l = token.length();
  if (l == 0) return false;
  for (size_t i = 0; i < l; i++) {
    unsigned char c = token[i];
    if ((!isprint(c) || isspace(c)) && (isascii(c) || c == (unsigned char)255))
      return false;
    // The "&& (isascii(c) || c == 255)" was added so that we won't reject
    // non-ASCII (e.g. UTF-8) characters.
  }
  return true;
}

}  // end namespace trnkit
