// base/trnkit-utils.h

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

#ifndef TRNKIT_BASE_TRNKIT_UTILS_H_
#define TRNKIT_BASE_TRNKIT_UTILS_H_ 1

#include <limits>
#include <string>

namespace trnkit {

// Prints a character of a trn line in a human-readable form, e.g. "'{'", or
// "[character 9]" for a tab.
std::string CharToString(const char &c);

}  // namespace trnkit

// Deletes the copy constructor and operator=.
#define TRNKIT_DISALLOW_COPY_AND_ASSIGN(type)    \
  type(const type&) = delete;                    \
  type &operator = (const type&) = delete

#define TRNKIT_ASSERT_IS_INTEGER_TYPE(I)                              \
  static_assert(std::numeric_limits<I>::is_specialized &&             \
                std::numeric_limits<I>::is_integer, "integer type required")

#define TRNKIT_ASSERT_IS_FLOATING_TYPE(F)                             \
  static_assert(std::numeric_limits<F>::is_specialized &&             \
                !std::numeric_limits<F>::is_integer,                  \
                "floating-point type required")

#endif  // TRNKIT_BASE_TRNKIT_UTILS_H_
