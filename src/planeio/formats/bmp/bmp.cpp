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

#include "planeio/formats/bmp/bmp.h"

#include <array>
#include <cstdlib>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_format.h"
#include "planeio/image_metadata.h"
#include "planeio/status.h"

namespace planeio {
namespace formats {
namespace bmp {

namespace {

constexpr uint32_t kCompressionRgb = 0;

/// Stored sample order of 32-bit pixels (BGRA) for channels R, G, B, A
constexpr std::array<uint32_t, 4> kQuadSampleIndex = {2, 1, 0, 3};

std::string GetCompressionName(uint32_t compression) {
  switch (compression) {
    case 0:
      return "None";
    case 1:
      return "8-bit run length encoding";
    case 2:
      return "4-bit run length encoding";
    case 3:
      return "Bit fields";
    case 4:
      return "JPEG";
    case 5:
      return "PNG";
    default:
      return absl::StrFormat("Unknown (%d)", compression);
  }
}

uint64_t GetRowStrideBits(uint64_t width, uint32_t bits) {
  return (width * bits + 31) / 32 * 32;
}

}  // namespace

decode::InterleavedLayout BmpMetadata::GetLayout(uint32_t channel) const {
  const ImageMetadata& image = GetImages().front();

  decode::InterleavedLayout layout;
  layout.data_offset_bits = data_offset_ * 8;
  layout.row_stride_bits =
      GetRowStrideBits(static_cast<uint64_t>(image.GetSizeX()), bits_);
  layout.height = image.GetSizeY();
  layout.bottom_up = !top_down_;
  if (bits_ <= 8) {
    layout.bits_per_sample = bits_;
    layout.samples_per_pixel = 1;
    layout.sample_index = 0;
  } else if (bits_ == 24) {
    layout.bits_per_sample = 8;
    layout.samples_per_pixel = 3;
    layout.sample_index = 2 - channel;
  } else {
    layout.bits_per_sample = 8;
    layout.samples_per_pixel = 4;
    layout.sample_index = kQuadSampleIndex[channel];
  }
  return layout;
}

absl::Status BmpParser::CheckHeader(io::BufferedStream& stream) {
  DECLARE_ASSIGN_OR_RETURN_MOVE(std::string, magic, stream.ReadString(2),
                                "BMP header is truncated");
  if (magic != "BM") {
    return MAKE_STATUS(ErrorKind::kFormat, "Missing BMP magic 'BM'");
  }
  return absl::OkStatus();
}

absl::Status BmpParser::TypedParse(Context& /*context*/,
                                   io::BufferedStream& stream,
                                   Metadata& metadata,
                                   const ParserOptions& /*options*/) {
  auto* bmp = dynamic_cast<BmpMetadata*>(&metadata);
  if (bmp == nullptr) {
    return MAKE_STATUS(ErrorKind::kInvalidArgument,
                       "BMP parser needs BmpMetadata");
  }

  stream.SetOrder(true);
  DECLARE_ASSIGN_OR_RETURN_MOVE(int64_t, length, stream.Length(), "");
  if (length < kMinHeaderSize) {
    return MAKE_STATUS(ErrorKind::kFormat, "BMP header is truncated");
  }

  // BITMAPFILEHEADER
  RETURN_IF_ERROR(stream.Seek(10), "");
  DECLARE_ASSIGN_OR_RETURN_MOVE(uint32_t, data_offset, stream.ReadUInt32(),
                                "");

  // BITMAPINFOHEADER
  DECLARE_ASSIGN_OR_RETURN_MOVE(uint32_t, header_size, stream.ReadUInt32(),
                                "");
  if (header_size < 40) {
    return MAKE_STATUS(
        ErrorKind::kUnsupportedFormat,
        absl::StrFormat("BMP info header of %d bytes is not supported",
                        header_size));
  }
  DECLARE_ASSIGN_OR_RETURN_MOVE(int32_t, width, stream.ReadInt32(), "");
  DECLARE_ASSIGN_OR_RETURN_MOVE(int32_t, height, stream.ReadInt32(), "");
  DECLARE_ASSIGN_OR_RETURN_MOVE(uint16_t, planes, stream.ReadUInt16(), "");
  DECLARE_ASSIGN_OR_RETURN_MOVE(uint16_t, bits, stream.ReadUInt16(), "");
  DECLARE_ASSIGN_OR_RETURN_MOVE(uint32_t, compression, stream.ReadUInt32(),
                                "");
  DECLARE_ASSIGN_OR_RETURN_MOVE(uint32_t, image_size, stream.ReadUInt32(),
                                "");
  DECLARE_ASSIGN_OR_RETURN_MOVE(int32_t, x_ppm, stream.ReadInt32(), "");
  DECLARE_ASSIGN_OR_RETURN_MOVE(int32_t, y_ppm, stream.ReadInt32(), "");
  DECLARE_ASSIGN_OR_RETURN_MOVE(uint32_t, colors_used, stream.ReadUInt32(),
                                "");

  if (width <= 0 || height == 0 || planes != 1) {
    return MAKE_STATUS(
        ErrorKind::kFormat,
        absl::StrFormat("Invalid BMP geometry %dx%d with %d planes", width,
                        height, planes));
  }
  if (compression != kCompressionRgb) {
    return MAKE_STATUS(
        ErrorKind::kUnsupportedFormat,
        absl::StrFormat("BMP compression '%s' is not supported",
                        GetCompressionName(compression)));
  }
  if (bits != 1 && bits != 4 && bits != 8 && bits != 24 && bits != 32) {
    return MAKE_STATUS(
        ErrorKind::kUnsupportedFormat,
        absl::StrFormat("BMP depth of %d bits is not supported", bits));
  }

  const bool top_down = height < 0;
  const int64_t rows = std::abs(static_cast<int64_t>(height));
  const uint64_t raster_bytes =
      GetRowStrideBits(static_cast<uint64_t>(width), bits) / 8 *
      static_cast<uint64_t>(rows);
  if (static_cast<uint64_t>(data_offset) + raster_bytes >
      static_cast<uint64_t>(length)) {
    return MAKE_STATUS(
        ErrorKind::kFormat,
        absl::StrFormat("BMP raster of %d bytes at %d exceeds file length %d",
                        raster_bytes, data_offset, length));
  }

  MetadataTable& table = metadata.GetMutableTable();
  table.Set("Compression type", GetCompressionName(compression));
  table.Set("Bits per pixel", static_cast<int64_t>(bits));
  table.Set("Image size", static_cast<int64_t>(image_size));
  table.Set("X resolution (pixels per meter)", static_cast<int64_t>(x_ppm));
  table.Set("Y resolution (pixels per meter)", static_cast<int64_t>(y_ppm));
  table.Set("Top down", static_cast<int64_t>(top_down ? 1 : 0));

  std::shared_ptr<ColorTable> palette;
  if (bits <= 8) {
    const uint32_t max_colors = 1u << bits;
    const uint32_t count = colors_used == 0 ? max_colors : colors_used;
    if (count > max_colors) {
      return MAKE_STATUS(
          ErrorKind::kFormat,
          absl::StrFormat("BMP palette of %d entries exceeds %d-bit depth",
                          count, bits));
    }
    table.Set("Color table size", static_cast<int64_t>(count));
    RETURN_IF_ERROR(stream.Seek(14 + static_cast<int64_t>(header_size)),
                    "");
    DECLARE_ASSIGN_OR_RETURN_MOVE(std::vector<uint8_t>, entries,
                                  stream.ReadBytes(count * 4),
                                  "BMP palette is truncated");
    palette = std::make_shared<ColorTable>(3, 8, count);
    for (uint32_t i = 0; i < count; ++i) {
      palette->Set(0, i, entries[i * 4 + 2]);
      palette->Set(1, i, entries[i * 4 + 1]);
      palette->Set(2, i, entries[i * 4]);
    }
  }

  std::vector<Axis> extra_axes;
  if (bits == 24 || bits == 32) {
    extra_axes.push_back(
        Axis{.type = AxisType::kChannel, .length = bits == 24 ? 3 : 4});
  }
  ImageMetadata image = ImageMetadata::Create(width, rows, PixelType::kUInt8,
                                              std::move(extra_axes));
  image.bits_per_pixel = bits <= 8 ? bits : 8;
  image.little_endian = true;
  image.color_table = std::move(palette);
  for (Axis& axis : image.axes) {
    const int32_t ppm = axis.type == AxisType::kX   ? x_ppm
                        : axis.type == AxisType::kY ? y_ppm
                                                    : 0;
    if (ppm > 0) {
      axis.scale = 1e6 / ppm;
      axis.unit = "um";
    }
  }

  bmp->SetBitsPerPixel(bits);
  bmp->SetDataOffset(data_offset);
  bmp->SetTopDown(top_down);
  metadata.AddImage(std::move(image));
  return absl::OkStatus();
}

absl::Status BmpReader::ReadPlaneBytes(const ImageMetadata& /*image*/,
                                       int64_t plane_index,
                                       const PlaneRegion& region,
                                       std::span<uint8_t> out) {
  auto* metadata = GetMetadataAs<BmpMetadata>();
  if (metadata == nullptr) {
    return MAKE_STATUS(ErrorKind::kInvalidArgument,
                       "BMP reader needs parsed BMP metadata");
  }
  const auto layout = metadata->GetLayout(static_cast<uint32_t>(plane_index));
  RETURN_IF_ERROR(decode::ReadInterleavedRegion(*metadata->GetSource(),
                                                layout, region, out),
                  "");
  return absl::OkStatus();
}

}  // namespace bmp
}  // namespace formats
}  // namespace planeio
