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

#include "planeio/decode/interleaved_region.h"

#include <cstdint>
#include <vector>

#include "absl/strings/str_format.h"
#include "planeio/decode/bit_buffer.h"
#include "planeio/status.h"

namespace planeio {
namespace decode {

namespace {

/// @brief Bit offset of the first selected sample of a region row
uint64_t RowStartBits(const InterleavedLayout& layout,
                      const PlaneRegion& region, int64_t row) {
  const int64_t y = region.y + row;
  const int64_t stored_row = layout.bottom_up ? layout.height - 1 - y : y;
  const uint64_t first_sample =
      static_cast<uint64_t>(region.x) * layout.samples_per_pixel +
      layout.sample_index;
  return layout.data_offset_bits +
         static_cast<uint64_t>(stored_row) * layout.row_stride_bits +
         first_sample * layout.bits_per_sample;
}

absl::Status CheckPackedSize(const InterleavedLayout& layout,
                             const PlaneRegion& region, size_t size) {
  if (layout.bits_per_sample == 0 || layout.bits_per_sample > 64 ||
      layout.sample_index >= layout.samples_per_pixel) {
    return MAKE_STATUS(ErrorKind::kInvalidArgument,
                       "Invalid interleaved layout");
  }
  const uint64_t needed = static_cast<uint64_t>(region.Area()) *
                          layout.bits_per_sample;
  if (needed > static_cast<uint64_t>(size) * 8) {
    return MAKE_STATUS(
        ErrorKind::kBounds,
        absl::StrFormat("Plane buffer of %zu bytes cannot hold %d bits", size,
                        needed));
  }
  return absl::OkStatus();
}

}  // namespace

absl::Status ReadInterleavedRegion(io::BufferedStream& stream,
                                   const InterleavedLayout& layout,
                                   const PlaneRegion& region,
                                   std::span<uint8_t> out) {
  RETURN_IF_ERROR(CheckPackedSize(layout, region, out.size()), "");
  if (region.width <= 0 || region.height <= 0) {
    return absl::OkStatus();
  }

  const uint32_t bits = layout.bits_per_sample;
  const uint64_t pixel_stride = uint64_t{layout.samples_per_pixel} * bits;
  const uint64_t span_bits =
      static_cast<uint64_t>(region.width - 1) * pixel_stride + bits;
  const uint64_t row_bits = static_cast<uint64_t>(region.width) * bits;
  const bool contiguous = layout.samples_per_pixel == 1 && bits % 8 == 0;

  std::vector<uint8_t> row_bytes;
  BitWriter writer(out);
  for (int64_t row = 0; row < region.height; ++row) {
    const uint64_t start = RowStartBits(layout, region, row);
    const auto first_byte = static_cast<int64_t>(start / 8);
    const uint64_t shift = start % 8;
    const size_t byte_count = static_cast<size_t>((shift + span_bits + 7) / 8);
    const uint64_t out_bit = static_cast<uint64_t>(row) * row_bits;

    RETURN_IF_ERROR(stream.Seek(first_byte), "");
    if (contiguous && shift == 0) {
      RETURN_IF_ERROR(
          stream.ReadFully(out.subspan(out_bit / 8, byte_count)),
          absl::StrFormat("Failed to read row %d", region.y + row));
      continue;
    }

    row_bytes.resize(byte_count);
    RETURN_IF_ERROR(stream.ReadFully(row_bytes),
                    absl::StrFormat("Failed to read row %d", region.y + row));
    BitReader reader(row_bytes, shift);
    writer.Seek(out_bit);
    for (int64_t i = 0; i < region.width; ++i) {
      writer.Write(reader.Read(bits), bits);
      reader.Skip(pixel_stride - bits);
    }
  }
  return absl::OkStatus();
}

absl::Status WriteInterleavedRegion(io::BufferedStream& stream,
                                    const InterleavedLayout& layout,
                                    const PlaneRegion& region,
                                    std::span<const uint8_t> in) {
  RETURN_IF_ERROR(CheckPackedSize(layout, region, in.size()), "");
  if (region.width <= 0 || region.height <= 0) {
    return absl::OkStatus();
  }

  const uint32_t bits = layout.bits_per_sample;
  const uint64_t pixel_stride = uint64_t{layout.samples_per_pixel} * bits;
  const uint64_t span_bits =
      static_cast<uint64_t>(region.width - 1) * pixel_stride + bits;
  const uint64_t row_bits = static_cast<uint64_t>(region.width) * bits;
  const bool contiguous = layout.samples_per_pixel == 1 && bits % 8 == 0;

  std::vector<uint8_t> row_bytes;
  for (int64_t row = 0; row < region.height; ++row) {
    const uint64_t start = RowStartBits(layout, region, row);
    const auto first_byte = static_cast<int64_t>(start / 8);
    const uint64_t shift = start % 8;
    const size_t byte_count = static_cast<size_t>((shift + span_bits + 7) / 8);
    const uint64_t in_bit = static_cast<uint64_t>(row) * row_bits;

    RETURN_IF_ERROR(stream.Seek(first_byte), "");
    if (contiguous && shift == 0) {
      RETURN_IF_ERROR(stream.Write(in.subspan(in_bit / 8, byte_count)),
                      absl::StrFormat("Failed to write row %d", region.y + row));
      continue;
    }

    // Merge into the bytes already stored; unwritten bytes read as zero.
    row_bytes.assign(byte_count, 0);
    RETURN_IF_ERROR(stream.Read(row_bytes).status(), "");
    BitReader reader(in, in_bit);
    BitWriter writer(row_bytes, shift);
    for (int64_t i = 0; i < region.width; ++i) {
      writer.Write(reader.Read(bits), bits);
      writer.Seek(writer.Position() + pixel_stride - bits);
    }
    RETURN_IF_ERROR(stream.Seek(first_byte), "");
    RETURN_IF_ERROR(stream.Write(row_bytes),
                    absl::StrFormat("Failed to write row %d", region.y + row));
  }
  return absl::OkStatus();
}

}  // namespace decode
}  // namespace planeio
