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

#ifndef PLANEIO_INCLUDE_PLANEIO_UTILITIES_CHECKED_MATH_H_
#define PLANEIO_INCLUDE_PLANEIO_UTILITIES_CHECKED_MATH_H_

#include <cstdint>
#include <initializer_list>
#include <limits>
#include <optional>

namespace planeio {

/// @brief a * b for non-negative operands
/// @return Product, or nullopt if an operand is negative or the product
///         does not fit int64_t
constexpr std::optional<int64_t> CheckedMultiply(int64_t a, int64_t b) {
  if (a < 0 || b < 0) {
    return std::nullopt;
  }
  if (a != 0 && b > std::numeric_limits<int64_t>::max() / a) {
    return std::nullopt;
  }
  return a * b;
}

/// @brief Product of non-negative factors, nullopt on overflow
constexpr std::optional<int64_t> CheckedProduct(
    std::initializer_list<int64_t> factors) {
  int64_t product = 1;
  for (int64_t factor : factors) {
    auto next = CheckedMultiply(product, factor);
    if (!next.has_value()) {
      return std::nullopt;
    }
    product = *next;
  }
  return product;
}

}  // namespace planeio

#endif  // PLANEIO_INCLUDE_PLANEIO_UTILITIES_CHECKED_MATH_H_
