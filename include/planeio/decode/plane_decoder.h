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

#ifndef PLANEIO_INCLUDE_PLANEIO_DECODE_PLANE_DECODER_H_
#define PLANEIO_INCLUDE_PLANEIO_DECODE_PLANE_DECODER_H_

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <type_traits>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "planeio/decode/bit_buffer.h"
#include "planeio/io/byte_order.h"
#include "planeio/pixel_buffer.h"
#include "planeio/pixel_type.h"
#include "planeio/status.h"

namespace planeio {
namespace decode {

/// @brief How samples are laid out in plane bytes
struct PixelEncoding {
  PixelType pixel_type = PixelType::kUInt8;
  uint32_t bits_per_pixel = 8;
  bool little_endian = false;
};

namespace internal {

template <typename T>
absl::Status CheckTarget(std::span<T> target, size_t raw_size,
                         size_t plane_offset, size_t count,
                         const PixelEncoding& encoding) {
  if (!MatchesPixelType<std::remove_const_t<T>>(encoding.pixel_type)) {
    return MAKE_STATUS(ErrorKind::kInvalidArgument,
                       absl::StrFormat("Target element type does not match "
                                       "pixel type %s",
                                       GetName(encoding.pixel_type)));
  }
  constexpr uint32_t kTargetBits = 8 * sizeof(T);
  if (encoding.bits_per_pixel == 0 || encoding.bits_per_pixel > kTargetBits) {
    return MAKE_STATUS(
        ErrorKind::kInvalidArgument,
        absl::StrFormat("Invalid bits per pixel %d for a %d-bit target",
                        encoding.bits_per_pixel, kTargetBits));
  }
  // Float words are reinterpreted whole, never packed.
  if (std::is_floating_point_v<std::remove_const_t<T>> &&
      encoding.bits_per_pixel != kTargetBits) {
    return MAKE_STATUS(
        ErrorKind::kInvalidArgument,
        absl::StrFormat("Floating point targets need %d-bit samples, got %d",
                        kTargetBits, encoding.bits_per_pixel));
  }
  if (plane_offset > target.size() || target.size() - plane_offset < count) {
    return MAKE_STATUS(
        ErrorKind::kBounds,
        absl::StrFormat("Target holds %zu elements, %zu needed at offset %zu",
                        target.size(), count, plane_offset));
  }
  const uint64_t needed_bits =
      static_cast<uint64_t>(count) * encoding.bits_per_pixel;
  if (needed_bits > static_cast<uint64_t>(raw_size) * 8) {
    return MAKE_STATUS(
        ErrorKind::kBounds,
        absl::StrFormat("Plane bytes hold %zu bytes, %d bits needed",
                        raw_size, needed_bits));
  }
  return absl::OkStatus();
}

inline size_t DefaultCount(size_t raw_size, uint32_t bits_per_pixel) {
  return bits_per_pixel == 0
             ? 0
             : static_cast<size_t>(static_cast<uint64_t>(raw_size) * 8 /
                                   bits_per_pixel);
}

}  // namespace internal

/// @brief Whether the fast path applies to T with this encoding
template <typename T>
constexpr bool CanUseFastPath(const PixelEncoding& encoding) {
  return encoding.pixel_type != PixelType::kBit &&
         encoding.bits_per_pixel == 8 * sizeof(T);
}

/// @brief Aligned decode: one memcpy plus an optional bulk byte swap
///
/// Only valid when bits_per_pixel equals the width of T.
///
/// @param target Destination elements
/// @param raw Plane bytes
/// @param plane_offset First target element to fill
/// @param encoding Layout of raw
/// @param count Samples to decode, all complete samples in raw by default
template <typename T>
absl::Status ConvertBytesFast(std::span<T> target, std::span<const uint8_t> raw,
                              size_t plane_offset,
                              const PixelEncoding& encoding,
                              std::optional<size_t> count = std::nullopt) {
  const size_t n =
      count.value_or(internal::DefaultCount(raw.size(), encoding.bits_per_pixel));
  RETURN_IF_ERROR(
      internal::CheckTarget(target, raw.size(), plane_offset, n, encoding), "");
  if (!CanUseFastPath<T>(encoding)) {
    return MAKE_STATUS(ErrorKind::kInvalidArgument,
                       "Fast decode requires full-width samples");
  }
  auto* out = reinterpret_cast<uint8_t*>(target.data() + plane_offset);
  std::memcpy(out, raw.data(), n * sizeof(T));
  if (sizeof(T) > 1 && encoding.little_endian != io::kHostLittleEndian) {
    io::ByteSwapInPlace(out, n, sizeof(T));
  }
  return absl::OkStatus();
}

/// @brief Bit-exact decode of any depth and byte order
///
/// Byte-multiple depths honor the byte order, other depths are read as an
/// MSB-first bit stream. Signed samples narrower than T are sign-extended.
/// Full-width words are reinterpreted for float and double.
template <typename T>
absl::Status ConvertBytesGeneral(std::span<T> target,
                                 std::span<const uint8_t> raw,
                                 size_t plane_offset,
                                 const PixelEncoding& encoding,
                                 std::optional<size_t> count = std::nullopt) {
  const size_t n =
      count.value_or(internal::DefaultCount(raw.size(), encoding.bits_per_pixel));
  RETURN_IF_ERROR(
      internal::CheckTarget(target, raw.size(), plane_offset, n, encoding), "");

  const uint32_t bits = encoding.bits_per_pixel;
  const bool byte_aligned = bits % 8 == 0;
  const uint32_t bytes_per_sample = bits / 8;
  const bool sign_extend = IsSigned(encoding.pixel_type) &&
                           !IsFloatingPoint(encoding.pixel_type) && bits < 64;
  BitReader reader(raw);

  for (size_t i = 0; i < n; ++i) {
    uint64_t word = 0;
    if (byte_aligned) {
      const uint8_t* p = raw.data() + i * bytes_per_sample;
      for (uint32_t b = 0; b < bytes_per_sample; ++b) {
        const uint32_t k =
            encoding.little_endian ? bytes_per_sample - 1 - b : b;
        word = (word << 8) | p[k];
      }
    } else {
      word = reader.Read(bits);
    }

    T value;
    if constexpr (std::is_floating_point_v<T>) {
      using Word = io::WordOf<T>;
      const auto w = static_cast<Word>(word);
      std::memcpy(&value, &w, sizeof(T));
    } else {
      if (sign_extend && ((word >> (bits - 1)) & 1) != 0) {
        word |= ~((uint64_t{1} << bits) - 1);
      }
      value = static_cast<T>(word);
    }
    target[plane_offset + i] = value;
  }
  return absl::OkStatus();
}

/// @brief Decode plane bytes into typed elements
///
/// Takes the fast path when the depth equals the width of T, the general
/// path otherwise. Fails with an invalid-argument error when T does not
/// match the pixel type or is narrower than the samples (floats need exact
/// widths), and with a bounds error when target is too small.
template <typename T>
absl::Status ConvertBytes(std::span<T> target, std::span<const uint8_t> raw,
                          size_t plane_offset, const PixelEncoding& encoding,
                          std::optional<size_t> count = std::nullopt) {
  if (CanUseFastPath<T>(encoding)) {
    return ConvertBytesFast(target, raw, plane_offset, encoding, count);
  }
  return ConvertBytesGeneral(target, raw, plane_offset, encoding, count);
}

/// @brief Decode into a PixelBuffer, dispatching on its pixel type
absl::Status ConvertBytes(PixelBuffer& target, std::span<const uint8_t> raw,
                          size_t plane_offset, const PixelEncoding& encoding,
                          std::optional<size_t> count = std::nullopt);

/// @brief Decode exactly count samples into a new buffer
absl::StatusOr<PixelBuffer> DecodeSamples(std::span<const uint8_t> raw,
                                          const PixelEncoding& encoding,
                                          size_t count);

}  // namespace decode
}  // namespace planeio

#endif  // PLANEIO_INCLUDE_PLANEIO_DECODE_PLANE_DECODER_H_
