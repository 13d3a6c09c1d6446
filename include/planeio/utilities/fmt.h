// Copyright 2025 Jonas Teuwen. All Rights Reserved.
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

#ifndef PLANEIO_INCLUDE_PLANEIO_UTILITIES_FMT_H_
#define PLANEIO_INCLUDE_PLANEIO_UTILITIES_FMT_H_

#include <string>

// libc++ ships std::format from Clang 17 on; everything else goes through fmt.
#if defined(__clang__) && (__clang_major__ >= 17) && __cplusplus >= 202002L && \
    defined(_LIBCPP_VERSION)
#include <format>

namespace planeio::fmt {
using std::format;
}
#else
#include <fmt/core.h>

namespace planeio::fmt {
using ::fmt::format;
}
#endif

namespace planeio::fmt {

/// @brief Shortest text that parses back to the same double
///
/// Header formats store physical scales as text, so "0.1" stays "0.1"
/// instead of "0.100000".
inline std::string FormatRoundTrip(double value) {
  return format("{}", value);
}

}  // namespace planeio::fmt

#endif  // PLANEIO_INCLUDE_PLANEIO_UTILITIES_FMT_H_
