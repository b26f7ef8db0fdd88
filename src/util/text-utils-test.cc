// util/text-utils-test.cc

// Copyright 2009-2011  Microsoft Corporation
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

#include "base/trnkit-common.h"
#include "util/text-utils.h"

namespace trnkit {

void TestJoinVectorToString() {
  std::vector<std::string> str_vec;
  std::string str;
  JoinVectorToString(str_vec, " ", false, &str);
  TRNKIT_ASSERT(str.empty());

  str_vec.push_back("a");
  str_vec.push_back("");
  str_vec.push_back("c");
  JoinVectorToString(str_vec, " ", false, &str);
  TRNKIT_ASSERT(str == "a  c");
  JoinVectorToString(str_vec, " ", true, &str);
  TRNKIT_ASSERT(str == "a c");
  JoinVectorToString(str_vec, ", ", true, &str);
  TRNKIT_ASSERT(str == "a, c");

  // Empty strings at either end or in a row leave no stray delimiters.
  str_vec.insert(str_vec.begin(), "");
  str_vec.push_back("");
  str_vec.push_back("");
  JoinVectorToString(str_vec, "/", true, &str);
  TRNKIT_ASSERT(str == "a/c");
  JoinVectorToString(str_vec, "/", false, &str);
  TRNKIT_ASSERT(str == "/a//c//");
}

void TestConvertStringToInteger() {
  int32 i;
  TRNKIT_ASSERT(ConvertStringToInteger("12", &i) && i == 12);
  TRNKIT_ASSERT(ConvertStringToInteger("-3 ", &i) && i == -3);
  TRNKIT_ASSERT(!ConvertStringToInteger("", &i));
  TRNKIT_ASSERT(!ConvertStringToInteger("1x", &i));
  TRNKIT_ASSERT(!ConvertStringToInteger("10000000000", &i));
  uint32 u;
  TRNKIT_ASSERT(!ConvertStringToInteger("-1", &u));
  int64 l;
  TRNKIT_ASSERT(ConvertStringToInteger("10000000000", &l) &&
                l == 10000000000LL);
}

template<class Real>
void TestConvertStringToReal() {
  Real d;
  TRNKIT_ASSERT(ConvertStringToReal("1", &d) && d == 1.0);
  TRNKIT_ASSERT(ConvertStringToReal("-1", &d) && d == -1.0);
  TRNKIT_ASSERT(ConvertStringToReal("0.5 ", &d) && d == 0.5);
  TRNKIT_ASSERT(!ConvertStringToReal("", &d));
  TRNKIT_ASSERT(!ConvertStringToReal("1 2", &d));
  TRNKIT_ASSERT(!ConvertStringToReal("a", &d));
}

void TestTrim() {
  std::string str = " \t a b \r\n";
  Trim(&str);
  TRNKIT_ASSERT(str == "a b");
  str = "\f\v";
  Trim(&str);
  TRNKIT_ASSERT(str.empty());
  str = "x";
  Trim(&str);
  TRNKIT_ASSERT(str == "x");
}

void TestIsToken() {
  TRNKIT_ASSERT(IsToken("utt1"));
  TRNKIT_ASSERT(IsToken("spk-1_utt{2}"));
  TRNKIT_ASSERT(!IsToken(""));
  TRNKIT_ASSERT(!IsToken("a b"));
  TRNKIT_ASSERT(!IsToken("a\tb"));
  TRNKIT_ASSERT(IsWhiteSpace('\v') && !IsWhiteSpace('a'));
}

}  // end namespace trnkit

int main() {
  using namespace trnkit;
  TestJoinVectorToString();
  TestConvertStringToInteger();
  TestConvertStringToReal<float>();
  TestConvertStringToReal<double>();
  TestTrim();
  TestIsToken();
  std::cout << "Test OK\n";
}
