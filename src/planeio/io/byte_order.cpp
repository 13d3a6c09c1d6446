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

#include "planeio/io/byte_order.h"

#include <cstring>

namespace planeio {
namespace io {

namespace {

template <typename U>
void SwapWords(uint8_t* data, size_t count) {
  for (size_t i = 0; i < count; ++i) {
    U word;
    std::memcpy(&word, data + i * sizeof(U), sizeof(U));
    word = ByteSwapWord(word);
    std::memcpy(data + i * sizeof(U), &word, sizeof(U));
  }
}

}  // namespace

void ByteSwapInPlace(uint8_t* data, size_t count, size_t element_size) {
  switch (element_size) {
    case 2:
      SwapWords<uint16_t>(data, count);
      break;
    case 4:
      SwapWords<uint32_t>(data, count);
      break;
    case 8:
      SwapWords<uint64_t>(data, count);
      break;
    default:
      break;
  }
}

}  // namespace io
}  // namespace planeio
