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

#ifndef PLANEIO_INCLUDE_PLANEIO_IO_BYTE_ORDER_H_
#define PLANEIO_INCLUDE_PLANEIO_IO_BYTE_ORDER_H_

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>

namespace planeio {
namespace io {

#if __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
inline constexpr bool kHostLittleEndian = false;
#else
inline constexpr bool kHostLittleEndian = true;
#endif

/// @brief Reverse the bytes of an unsigned word
template <typename U>
constexpr U ByteSwapWord(U value) {
  static_assert(std::is_unsigned_v<U>);
  if constexpr (sizeof(U) == 1) {
    return value;
  } else if constexpr (sizeof(U) == 2) {
    return __builtin_bswap16(value);
  } else if constexpr (sizeof(U) == 4) {
    return __builtin_bswap32(value);
  } else {
    static_assert(sizeof(U) == 8);
    return __builtin_bswap64(value);
  }
}

/// @brief Unsigned integer with the same width as T
template <typename T>
using WordOf = std::conditional_t<
    sizeof(T) == 1, uint8_t,
    std::conditional_t<sizeof(T) == 2, uint16_t,
                       std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>>>;

/// @brief Load a T stored in the given byte order
template <typename T>
T LoadValue(const uint8_t* bytes, bool little_endian) {
  WordOf<T> word;
  std::memcpy(&word, bytes, sizeof(T));
  if (little_endian != kHostLittleEndian) {
    word = ByteSwapWord(word);
  }
  T value;
  std::memcpy(&value, &word, sizeof(T));
  return value;
}

/// @brief Store a T in the given byte order
template <typename T>
void StoreValue(T value, uint8_t* bytes, bool little_endian) {
  WordOf<T> word;
  std::memcpy(&word, &value, sizeof(T));
  if (little_endian != kHostLittleEndian) {
    word = ByteSwapWord(word);
  }
  std::memcpy(bytes, &word, sizeof(T));
}

/// @brief Byte-swap every element of a buffer in place
/// @param data Buffer of count elements of element_size bytes
void ByteSwapInPlace(uint8_t* data, size_t count, size_t element_size);

}  // namespace io
}  // namespace planeio

#endif  // PLANEIO_INCLUDE_PLANEIO_IO_BYTE_ORDER_H_
