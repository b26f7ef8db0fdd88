// util/parse-options-test.cc

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

#include <cstdio>
#include <fstream>

#include "util/parse-options.h"

namespace trnkit {

struct DummyOptions {
  bool my_bool;
  int32 my_int;
  uint32 my_uint;
  float my_float;
  double my_double;
  std::string my_string;

  DummyOptions(): my_bool(false), my_int(0), my_uint(0), my_float(0.0),
                  my_double(0.0) { }

  void Register(OptionsItf *opts) {
    opts->Register("my-bool", &my_bool, "A bool");
    opts->Register("my-int", &my_int, "An int32");
    opts->Register("my-uint", &my_uint, "A uint32");
    opts->Register("my-float", &my_float, "A float");
    opts->Register("my-double", &my_double, "A double");
    opts->Register("my-string", &my_string, "A string");
  }
};

void UnitTestParseOptions() {
  int argc = 9;
  const char *argv[] = { "a.out", "--my-bool", "--my_int=-5", "--my-uint=7",
                         "--my-float=0.5", "--MY-DOUBLE=2.25",
                         "--my-string=a b", "in.trn", "out.txt" };
  ParseOptions po("my usage msg");
  DummyOptions opts;
  opts.Register(&po);
  po.Read(argc, argv);
  TRNKIT_ASSERT(opts.my_bool == true);
  TRNKIT_ASSERT(opts.my_int == -5);
  TRNKIT_ASSERT(opts.my_uint == 7);
  TRNKIT_ASSERT(opts.my_float == 0.5);
  TRNKIT_ASSERT(opts.my_double == 2.25);
  TRNKIT_ASSERT(opts.my_string == "a b");
  TRNKIT_ASSERT(po.NumArgs() == 2);
  TRNKIT_ASSERT(po.GetArg(1) == "in.trn");
  TRNKIT_ASSERT(po.GetArg(2) == "out.txt");
  TRNKIT_ASSERT(po.GetOptArg(3) == "");
}

void UnitTestParseOptionsDoubleDash() {
  int argc = 5;
  const char *argv[] = { "a.out", "--my-bool=false", "--", "--my-int=3",
                         "x" };
  ParseOptions po("my usage msg");
  DummyOptions opts;
  opts.my_bool = true;
  opts.Register(&po);
  po.Read(argc, argv);
  TRNKIT_ASSERT(opts.my_bool == false);
  TRNKIT_ASSERT(opts.my_int == 0);
  TRNKIT_ASSERT(po.NumArgs() == 2);
  TRNKIT_ASSERT(po.GetArg(1) == "--my-int=3");
}

void UnitTestParseOptionsErrors() {
  const char *bad_args[] = { "--my-int=x", "--my-bool=maybe", "--no-such=1",
                             "--my-int", "--my-bool=" };
  for (size_t i = 0; i < sizeof(bad_args) / sizeof(bad_args[0]); i++) {
    int argc = 2;
    const char *argv[] = { "a.out", bad_args[i] };
    ParseOptions po("my usage msg");
    DummyOptions opts;
    opts.Register(&po);
    bool threw = false;
    try {
      po.Read(argc, argv);
    } catch (const TrnkitFatalError &) {
      threw = true;
    }
    TRNKIT_ASSERT(threw);
  }
}

void UnitTestParseOptionsConfigFile() {
  const char *filename = "parse-options-test.conf";
  {
    std::ofstream os(filename);
    os << "# a comment\n"
       << "--my-int=4  # trailing comment\n"
       << "\n"
       << "--my-string=from-config\n"
       << "--my-bool=true\n";
  }
  {
    // The command line overrides the config file.
    int argc = 3;
    const char *argv[] = { "a.out", "--my-int=6",
                           "--config=parse-options-test.conf" };
    ParseOptions po("my usage msg");
    DummyOptions opts;
    opts.Register(&po);
    po.Read(argc, argv);
    TRNKIT_ASSERT(opts.my_int == 6);
    TRNKIT_ASSERT(opts.my_string == "from-config");
    TRNKIT_ASSERT(opts.my_bool == true);
    TRNKIT_ASSERT(po.NumArgs() == 0);
  }
  {
    std::ofstream os(filename);
    os << "my-int=4\n";
  }
  {
    ParseOptions po("my usage msg");
    DummyOptions opts;
    opts.Register(&po);
    bool threw = false;
    try {
      po.ReadConfigFile(filename);
    } catch (const TrnkitFatalError &) {
      threw = true;
    }
    TRNKIT_ASSERT(threw);
  }
  std::remove(filename);
}

void UnitTestParseOptionsVerbose() {
  int32 old_verbose = GetVerboseLevel();
  int argc = 2;
  const char *argv[] = { "a.out", "--verbose=2" };
  ParseOptions po("my usage msg");
  po.Read(argc, argv);
  TRNKIT_ASSERT(GetVerboseLevel() == 2);
  SetVerboseLevel(old_verbose);
}

}  // end namespace trnkit

int main() {
  using namespace trnkit;
  UnitTestParseOptions();
  UnitTestParseOptionsDoubleDash();
  UnitTestParseOptionsErrors();
  UnitTestParseOptionsConfigFile();
  UnitTestParseOptionsVerbose();
  std::cout << "Test OK\n";
}
