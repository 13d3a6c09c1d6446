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

#ifndef PLANEIO_INCLUDE_PLANEIO_DECODE_INTERLEAVED_REGION_H_
#define PLANEIO_INCLUDE_PLANEIO_DECODE_INTERLEAVED_REGION_H_

#include <cstdint>
#include <span>

#include "absl/status/status.h"
#include "planeio/io/buffered_stream.h"
#include "planeio/plane.h"

namespace planeio {
namespace decode {

/// @brief Raster layout of one sample within stored image rows
///
/// Rows hold pixels of samples_per_pixel samples each, every sample
/// bits_per_sample wide. The layout selects sample sample_index of every
/// pixel. All offsets are in bits so packed sub-byte rasters need no
/// special casing.
struct InterleavedLayout {
  /// @brief Offset of the first stored row from the start of the stream
  uint64_t data_offset_bits = 0;

  /// @brief Distance between consecutive stored rows, padding included
  uint64_t row_stride_bits = 0;

  /// @brief Number of rows in the full image
  int64_t height = 0;

  uint32_t bits_per_sample = 8;
  uint32_t samples_per_pixel = 1;
  uint32_t sample_index = 0;

  /// @brief Rows are stored last row first
  bool bottom_up = false;
};

/// @brief Copy a region of one sample into a packed plane bit stream
/// @param stream Source positioned anywhere; the pointer is moved
/// @param layout Stored raster layout
/// @param region Region to copy, already bounds-checked
/// @param out Destination of at least ceil(w*h*bits/8) bytes
absl::Status ReadInterleavedRegion(io::BufferedStream& stream,
                                   const InterleavedLayout& layout,
                                   const PlaneRegion& region,
                                   std::span<uint8_t> out);

/// @brief Copy a packed plane bit stream into a region of one sample
///
/// Bits of other samples and of pixels outside the region are preserved
/// (read-modify-write); bytes past the current end read as zero.
absl::Status WriteInterleavedRegion(io::BufferedStream& stream,
                                    const InterleavedLayout& layout,
                                    const PlaneRegion& region,
                                    std::span<const uint8_t> in);

}  // namespace decode
}  // namespace planeio

#endif  // PLANEIO_INCLUDE_PLANEIO_DECODE_INTERLEAVED_REGION_H_
