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

#ifndef PLANEIO_INCLUDE_PLANEIO_DECODE_BIT_BUFFER_H_
#define PLANEIO_INCLUDE_PLANEIO_DECODE_BIT_BUFFER_H_

#include <cstddef>
#include <cstdint>
#include <span>

namespace planeio {
namespace decode {

/// @brief MSB-first bit reader over a byte span
///
/// Bits past the end of the data read as zero.
class BitReader {
 public:
  explicit BitReader(std::span<const uint8_t> data, uint64_t bit_offset = 0)
      : data_(data), position_(bit_offset) {}

  /// @brief Read up to 64 bits as an unsigned value
  uint64_t Read(uint32_t bits) {
    uint64_t value = 0;
    uint32_t remaining = bits;
    while (remaining > 0) {
      const uint64_t byte_index = position_ >> 3;
      const uint32_t bit_in_byte = static_cast<uint32_t>(position_ & 7);
      const uint32_t available = 8 - bit_in_byte;
      const uint32_t take = remaining < available ? remaining : available;
      uint32_t byte = byte_index < data_.size() ? data_[byte_index] : 0;
      byte = (byte >> (available - take)) & ((1u << take) - 1);
      value = (value << take) | byte;
      remaining -= take;
      position_ += take;
    }
    return value;
  }

  void Skip(uint64_t bits) { position_ += bits; }

  void Seek(uint64_t bit_offset) { position_ = bit_offset; }

  [[nodiscard]] uint64_t Position() const noexcept { return position_; }

 private:
  std::span<const uint8_t> data_;
  uint64_t position_;
};

/// @brief MSB-first bit writer over a byte span
///
/// Writes replace only the addressed bits; neighbouring bits are kept.
/// Bits past the end of the span are dropped.
class BitWriter {
 public:
  explicit BitWriter(std::span<uint8_t> data, uint64_t bit_offset = 0)
      : data_(data), position_(bit_offset) {}

  /// @brief Write the low `bits` bits of value
  void Write(uint64_t value, uint32_t bits) {
    uint32_t remaining = bits;
    while (remaining > 0) {
      const uint64_t byte_index = position_ >> 3;
      const uint32_t bit_in_byte = static_cast<uint32_t>(position_ & 7);
      const uint32_t available = 8 - bit_in_byte;
      const uint32_t take = remaining < available ? remaining : available;
      const uint32_t chunk = static_cast<uint32_t>(
          (value >> (remaining - take)) & ((uint64_t{1} << take) - 1));
      if (byte_index < data_.size()) {
        const uint32_t shift = available - take;
        const uint32_t mask = ((1u << take) - 1) << shift;
        data_[byte_index] = static_cast<uint8_t>(
            (data_[byte_index] & ~mask) | (chunk << shift));
      }
      remaining -= take;
      position_ += take;
    }
  }

  void Seek(uint64_t bit_offset) { position_ = bit_offset; }

  [[nodiscard]] uint64_t Position() const noexcept { return position_; }

 private:
  std::span<uint8_t> data_;
  uint64_t position_;
};

}  // namespace decode
}  // namespace planeio

#endif  // PLANEIO_INCLUDE_PLANEIO_DECODE_BIT_BUFFER_H_
