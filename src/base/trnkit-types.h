// base/trnkit-types.h

// Copyright 2009-2011  Microsoft Corporation;  Saarland University;
//                      Jan Silovsky;  Yanmin Qian

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

#ifndef TRNKIT_BASE_TRNKIT_TYPES_H_
#define TRNKIT_BASE_TRNKIT_TYPES_H_ 1

// we can do this a different way if some platform
// we find in the future lacks stdint.h
#include <stdint.h>

namespace trnkit {
// TYPEDEFS ..................................................................
// The core library does not include OpenFst, so the integer types are taken
// from stdint.h rather than from <fst/types.h>.  They are the same types.
typedef int8_t   int8;
typedef int16_t  int16;
typedef int32_t  int32;
typedef int64_t  int64;

typedef uint8_t  uint8;
typedef uint16_t uint16;
typedef uint32_t uint32;
typedef uint64_t uint64;
typedef float    float32;
typedef double   double64;
}  // end namespace trnkit

#endif  // TRNKIT_BASE_TRNKIT_TYPES_H_
