// Copyright 2019 DeepMind Technologies Ltd. All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef BANDITSIM_BANDITSIM_UTILS_H_
#define BANDITSIM_BANDITSIM_UTILS_H_

#include <cmath>
#include <string>

#include "absl/strings/str_cat.h"

namespace banditsim {

// Fatal errors are routed through a replaceable handler. The default one
// prints the message to stderr and exits the process. Tests install a
// handler that throws so that rejected inputs can be observed.
using ErrorHandler = void (*)(const std::string&);
void SetErrorHandler(ErrorHandler error_handler);

// Reports a fatal error through the current error handler. Never returns.
[[noreturn]] void BanditSimFatalError(const std::string& error_msg);

}  // namespace banditsim

#define BANDITSIM_CHECK_OP(x_exp, op, y_exp)                               \
  do {                                                                    \
    auto x = x_exp;                                                       \
    auto y = y_exp;                                                       \
    if (!((x)op(y)))                                                      \
      banditsim::BanditSimFatalError(absl::StrCat(                        \
          __FILE__, ":", __LINE__, " ", #x_exp " " #op " " #y_exp, "\n",  \
          #x_exp, " = ", x, ", ", #y_exp, " = ", y));                     \
  } while (false)

#define BANDITSIM_CHECK_EQ(x, y) BANDITSIM_CHECK_OP(x, ==, y)
#define BANDITSIM_CHECK_NE(x, y) BANDITSIM_CHECK_OP(x, !=, y)
#define BANDITSIM_CHECK_LT(x, y) BANDITSIM_CHECK_OP(x, <, y)
#define BANDITSIM_CHECK_LE(x, y) BANDITSIM_CHECK_OP(x, <=, y)
#define BANDITSIM_CHECK_GT(x, y) BANDITSIM_CHECK_OP(x, >, y)
#define BANDITSIM_CHECK_GE(x, y) BANDITSIM_CHECK_OP(x, >=, y)

#define BANDITSIM_CHECK_TRUE(x)                                          \
  do {                                                                  \
    if (!(x))                                                           \
      banditsim::BanditSimFatalError(                                   \
          absl::StrCat(__FILE__, ":", __LINE__, " CHECK_TRUE(", #x, ")")); \
  } while (false)

#define BANDITSIM_CHECK_FALSE(x)                                         \
  do {                                                                  \
    if (x)                                                              \
      banditsim::BanditSimFatalError(                                   \
          absl::StrCat(__FILE__, ":", __LINE__, " CHECK_FALSE(", #x, ")")); \
  } while (false)

#define BANDITSIM_CHECK_FLOAT_NEAR(x, y, epsilon)                         \
  do {                                                                  \
    double x_val = x;                                                   \
    double y_val = y;                                                   \
    if (!(std::abs(x_val - y_val) <= (epsilon)))                        \
      banditsim::BanditSimFatalError(absl::StrCat(                      \
          __FILE__, ":", __LINE__, " abs(", #x, " - ", #y, ") <= ",     \
          #epsilon, "\n", #x, " = ", x_val, ", ", #y, " = ", y_val));   \
  } while (false)

#define BANDITSIM_CHECK_FLOAT_EQ(x, y) BANDITSIM_CHECK_FLOAT_NEAR(x, y, 1e-12)

// Debug checks, compiled out in optimized builds.
#ifdef NDEBUG
#define BANDITSIM_DCHECK_EQ(x, y)
#define BANDITSIM_DCHECK_NE(x, y)
#define BANDITSIM_DCHECK_LT(x, y)
#define BANDITSIM_DCHECK_LE(x, y)
#define BANDITSIM_DCHECK_GT(x, y)
#define BANDITSIM_DCHECK_GE(x, y)
#define BANDITSIM_DCHECK_TRUE(x)
#define BANDITSIM_DCHECK_FALSE(x)
#else
#define BANDITSIM_DCHECK_EQ(x, y) BANDITSIM_CHECK_EQ(x, y)
#define BANDITSIM_DCHECK_NE(x, y) BANDITSIM_CHECK_NE(x, y)
#define BANDITSIM_DCHECK_LT(x, y) BANDITSIM_CHECK_LT(x, y)
#define BANDITSIM_DCHECK_LE(x, y) BANDITSIM_CHECK_LE(x, y)
#define BANDITSIM_DCHECK_GT(x, y) BANDITSIM_CHECK_GT(x, y)
#define BANDITSIM_DCHECK_GE(x, y) BANDITSIM_CHECK_GE(x, y)
#define BANDITSIM_DCHECK_TRUE(x) BANDITSIM_CHECK_TRUE(x)
#define BANDITSIM_DCHECK_FALSE(x) BANDITSIM_CHECK_FALSE(x)
#endif  // NDEBUG

#endif  // BANDITSIM_BANDITSIM_UTILS_H_
