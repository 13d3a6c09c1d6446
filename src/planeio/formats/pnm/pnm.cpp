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

#include "planeio/formats/pnm/pnm.h"

#include <algorithm>
#include <optional>
#include <string>
#include <utility>

#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "planeio/context.h"
#include "planeio/decode/bit_buffer.h"
#include "planeio/io/memory_handle.h"
#include "planeio/status.h"
#include "planeio/utilities/checked_math.h"

namespace planeio {
namespace formats {
namespace pnm {

namespace {

bool IsSpace(uint8_t c) { return absl::ascii_isspace(c); }

/// @brief Read one header token, skipping blanks and '#' comments
///
/// Consumes the single whitespace byte ending the token, so after the last
/// header field the stream sits on the raster.
absl::StatusOr<std::string> ReadToken(io::BufferedStream& stream,
                                      MetadataTable& table) {
  std::string token;
  while (true) {
    DECLARE_ASSIGN_OR_RETURN_MOVE(uint8_t, c, stream.ReadUInt8(),
                                  "PNM header is truncated");
    if (c == '#') {
      DECLARE_ASSIGN_OR_RETURN_MOVE(std::string, comment,
                                    stream.ReadStringUntil("\n"), "");
      absl::StripAsciiWhitespace(&comment);
      if (!comment.empty()) {
        table.Add("Comment", comment);
      }
      continue;
    }
    if (IsSpace(c)) {
      if (!token.empty()) {
        return token;
      }
      continue;
    }
    token.push_back(static_cast<char>(c));
  }
}

absl::StatusOr<int64_t> ReadNumber(io::BufferedStream& stream,
                                   MetadataTable& table,
                                   std::string_view field) {
  DECLARE_ASSIGN_OR_RETURN_MOVE(std::string, token, ReadToken(stream, table),
                                "");
  int64_t value = 0;
  if (!absl::SimpleAtoi(token, &value) || value <= 0) {
    return MAKE_STATUS(ErrorKind::kFormat,
                       absl::StrFormat("Invalid PNM %s '%s'", field, token));
  }
  return value;
}

/// @brief Decode a P1 raster into packed P4 rows
absl::StatusOr<std::vector<uint8_t>> DecodeAsciiBitmap(
    std::span<const uint8_t> text, int64_t width, int64_t height) {
  // P1 samples need no separator, so each takes at least one byte.
  const std::optional<int64_t> total = CheckedMultiply(width, height);
  if (!total.has_value() || *total > static_cast<int64_t>(text.size())) {
    return MAKE_STATUS(
        ErrorKind::kFormat,
        absl::StrFormat("P1 raster of %d bytes cannot hold %dx%d samples",
                        text.size(), width, height));
  }
  const uint64_t row_bits = (static_cast<uint64_t>(width) + 7) / 8 * 8;
  std::vector<uint8_t> raster(row_bits / 8 * static_cast<uint64_t>(height), 0);
  decode::BitWriter writer(raster);

  int64_t count = 0;
  bool in_comment = false;
  for (uint8_t c : text) {
    if (count == *total) {
      break;
    }
    if (in_comment) {
      in_comment = c != '\n';
      continue;
    }
    if (c == '#') {
      in_comment = true;
    } else if (c == '0' || c == '1') {
      writer.Seek((count / width) * row_bits + count % width);
      writer.Write(c == '1' ? 1 : 0, 1);
      ++count;
    } else if (!IsSpace(c)) {
      return MAKE_STATUS(ErrorKind::kFormat,
                         absl::StrFormat("Invalid P1 sample '%c'", c));
    }
  }
  if (count < *total) {
    return MAKE_STATUS(ErrorKind::kFormat,
                       absl::StrFormat("P1 raster holds %d of %d samples",
                                       count, *total));
  }
  return raster;
}

/// @brief Decode a P2/P3 raster into P5/P6 samples
absl::StatusOr<std::vector<uint8_t>> DecodeAsciiSamples(
    std::span<const uint8_t> text, uint64_t count, uint32_t max_value) {
  // Every sample is a digit followed by a separator, except the last.
  if (count > (text.size() + 1) / 2) {
    return MAKE_STATUS(
        ErrorKind::kFormat,
        absl::StrFormat("ASCII raster of %d bytes cannot hold %d samples",
                        text.size(), count));
  }
  const size_t sample_bytes = max_value > 255 ? 2 : 1;
  std::vector<uint8_t> raster;
  raster.reserve(count * sample_bytes);

  size_t i = 0;
  while (raster.size() < count * sample_bytes) {
    while (i < text.size() && (IsSpace(text[i]) || text[i] == '#')) {
      if (text[i] == '#') {
        while (i < text.size() && text[i] != '\n') {
          ++i;
        }
      } else {
        ++i;
      }
    }
    if (i == text.size()) {
      return MAKE_STATUS(ErrorKind::kFormat,
                         absl::StrFormat("ASCII raster holds %d of %d samples",
                                         raster.size() / sample_bytes, count));
    }
    const size_t start = i;
    while (i < text.size() && !IsSpace(text[i])) {
      ++i;
    }
    const std::string_view token(reinterpret_cast<const char*>(&text[start]),
                                 i - start);
    uint32_t value = 0;
    if (!absl::SimpleAtoi(token, &value) || value > max_value) {
      return MAKE_STATUS(ErrorKind::kFormat,
                         absl::StrFormat("Invalid PNM sample '%s'", token));
    }
    if (sample_bytes == 2) {
      raster.push_back(static_cast<uint8_t>(value >> 8));
    }
    raster.push_back(static_cast<uint8_t>(value & 0xff));
  }
  return raster;
}

}  // namespace

// -- PnmMetadata --

decode::InterleavedLayout PnmMetadata::GetLayout(uint32_t channel) const {
  const ImageMetadata& image = GetImages().front();
  const uint64_t width = static_cast<uint64_t>(image.GetSizeX());
  const uint32_t samples = image.GetAxisLength(AxisType::kChannel) == 3 ? 3 : 1;

  decode::InterleavedLayout layout;
  layout.data_offset_bits = data_offset_ * 8;
  layout.height = image.GetSizeY();
  layout.bits_per_sample = image.bits_per_pixel;
  layout.samples_per_pixel = samples;
  layout.sample_index = channel;
  layout.row_stride_bits =
      IsBitmap() ? (width + 7) / 8 * 8
                 : width * samples * image.bits_per_pixel;
  return layout;
}

absl::Status PnmMetadata::ReplaceDataStream(
    std::unique_ptr<io::BufferedStream> stream) {
  absl::Status close_status;
  if (data_stream_ != nullptr) {
    close_status = data_stream_->Close();
  }
  data_stream_ = std::move(stream);
  RETURN_IF_ERROR(close_status, "");
  return absl::OkStatus();
}

absl::Status PnmMetadata::Close(Context& context) {
  absl::Status data_status;
  if (data_stream_ != nullptr) {
    data_status = data_stream_->Close();
    data_stream_.reset();
  }
  auto own_status = Metadata::Close(context);
  RETURN_IF_ERROR(data_status, "");
  RETURN_IF_ERROR(own_status, "");
  return absl::OkStatus();
}

// -- PnmParser --

absl::Status PnmParser::CheckHeader(io::BufferedStream& stream) {
  DECLARE_ASSIGN_OR_RETURN_MOVE(std::string, magic, stream.ReadString(2),
                                "PNM header is truncated");
  if (magic.size() != 2 || magic[0] != 'P' || magic[1] < '1' ||
      magic[1] > '6') {
    return MAKE_STATUS(ErrorKind::kFormat, "Missing PNM magic P1 to P6");
  }
  return absl::OkStatus();
}

absl::Status PnmParser::TypedParse(Context& /*context*/,
                                   io::BufferedStream& stream,
                                   Metadata& metadata,
                                   const ParserOptions& /*options*/) {
  auto* pnm = dynamic_cast<PnmMetadata*>(&metadata);
  if (pnm == nullptr) {
    return MAKE_STATUS(ErrorKind::kInvalidArgument,
                       "PNM parser needs PnmMetadata");
  }

  RETURN_IF_ERROR(stream.Seek(1), "");
  DECLARE_ASSIGN_OR_RETURN_MOVE(uint8_t, digit, stream.ReadUInt8(), "");
  pnm->SetKind(digit - '0');

  MetadataTable& table = metadata.GetMutableTable();
  DECLARE_ASSIGN_OR_RETURN_MOVE(int64_t, width,
                                ReadNumber(stream, table, "width"), "");
  DECLARE_ASSIGN_OR_RETURN_MOVE(int64_t, height,
                                ReadNumber(stream, table, "height"), "");
  int64_t max_value = 1;
  if (!pnm->IsBitmap()) {
    ASSIGN_OR_RETURN(max_value, ReadNumber(stream, table, "maximum value"));
    if (max_value > 65535) {
      return MAKE_STATUS(
          ErrorKind::kFormat,
          absl::StrFormat("PNM maximum value %d exceeds 65535", max_value));
    }
  }
  pnm->SetMaxValue(static_cast<uint32_t>(max_value));
  pnm->SetDataOffset(static_cast<uint64_t>(stream.GetFilePointer()));

  table.Set("Magic", absl::StrCat("P", pnm->GetKind()));
  table.Set("Width", width);
  table.Set("Height", height);
  table.Set("Maximum value", max_value);

  std::vector<Axis> extra_axes;
  if (pnm->GetKind() == 3 || pnm->GetKind() == 6) {
    extra_axes.push_back(Axis{.type = AxisType::kChannel, .length = 3});
  }

  PixelType pixel_type = PixelType::kUInt8;
  if (pnm->IsBitmap()) {
    pixel_type = PixelType::kBit;
  } else if (max_value > 255) {
    pixel_type = PixelType::kUInt16;
  }
  ImageMetadata image =
      ImageMetadata::Create(width, height, pixel_type, std::move(extra_axes));
  image.bits_per_pixel = GetPixelTypeBits(pixel_type);
  image.little_endian = false;
  metadata.AddImage(std::move(image));
  return absl::OkStatus();
}

// -- PnmReader --

absl::Status PnmReader::OnSetMetadata(Context& /*context*/,
                                      const ReaderOptions& options) {
  auto* metadata = GetMetadataAs<PnmMetadata>();
  if (metadata == nullptr) {
    return MAKE_STATUS(ErrorKind::kInvalidArgument,
                       "PNM reader needs parsed PNM metadata");
  }
  if (!metadata->IsAscii()) {
    return absl::OkStatus();
  }

  io::BufferedStream* source = metadata->GetSource();
  DECLARE_ASSIGN_OR_RETURN_MOVE(int64_t, length, source->Length(), "");
  const int64_t offset = static_cast<int64_t>(metadata->GetDataOffset());
  RETURN_IF_ERROR(source->Seek(offset), "");
  DECLARE_ASSIGN_OR_RETURN_MOVE(
      std::vector<uint8_t>, text,
      source->ReadBytes(static_cast<size_t>(std::max<int64_t>(length - offset,
                                                              0))),
      "");

  const ImageMetadata& image = metadata->GetImages().front();
  std::vector<uint8_t> raster;
  if (metadata->IsBitmap()) {
    ASSIGN_OR_RETURN(raster, DecodeAsciiBitmap(text, image.GetSizeX(),
                                               image.GetSizeY()));
  } else {
    const std::optional<int64_t> count = CheckedProduct(
        {image.GetSizeX(), image.GetSizeY(), image.GetPlaneCount()});
    if (!count.has_value()) {
      return MAKE_STATUS(ErrorKind::kFormat, "PNM sample count overflows");
    }
    ASSIGN_OR_RETURN(raster,
                     DecodeAsciiSamples(text, static_cast<uint64_t>(*count),
                                        metadata->GetMaxValue()));
  }
  VLOG(1) << "Decoded P" << metadata->GetKind() << " raster of "
          << raster.size() << " bytes";

  DECLARE_ASSIGN_OR_RETURN_MOVE(
      std::unique_ptr<io::BufferedStream>, cached,
      io::BufferedStream::Open(io::MemoryHandle::FromBytes(std::move(raster)),
                               options.parser.stream),
      "");
  RETURN_IF_ERROR(metadata->ReplaceDataStream(std::move(cached)), "");
  metadata->SetDataOffset(0);
  return absl::OkStatus();
}

absl::Status PnmReader::ReadPlaneBytes(const ImageMetadata& /*image*/,
                                       int64_t plane_index,
                                       const PlaneRegion& region,
                                       std::span<uint8_t> out) {
  auto* metadata = GetMetadataAs<PnmMetadata>();
  const auto layout =
      metadata->GetLayout(static_cast<uint32_t>(plane_index));
  RETURN_IF_ERROR(decode::ReadInterleavedRegion(*metadata->GetDataStream(),
                                                layout, region, out),
                  "");
  return absl::OkStatus();
}

// -- PnmWriter --

absl::Status PnmWriter::OnSetDest(Context& /*context*/,
                                  const WriterOptions& /*options*/) {
  const ImageMetadata& image = GetImage();
  const int64_t channels = image.GetAxisLength(AxisType::kChannel);
  const int64_t planes = image.GetPlaneCount();
  const bool color = channels == 3 && planes == 3;
  if (planes != 1 && !color) {
    return MAKE_STATUS(
        ErrorKind::kInvalidArgument,
        absl::StrFormat("PNM stores one gray or three color planes, got %d",
                        planes));
  }
  if (color && image.pixel_type == PixelType::kBit) {
    return MAKE_STATUS(ErrorKind::kInvalidArgument,
                       "PNM color images need 8 or 16-bit samples");
  }
  if (image.pixel_type != PixelType::kBit &&
      image.bits_per_pixel != GetPixelTypeBits(image.pixel_type)) {
    return MAKE_STATUS(ErrorKind::kInvalidArgument,
                       "PNM samples must use their full width");
  }
  SetStoredByteOrder(false);

  const int64_t width = image.GetSizeX();
  const int64_t height = image.GetSizeY();
  std::string header;
  if (image.pixel_type == PixelType::kBit) {
    header = absl::StrFormat("P4\n%d %d\n", width, height);
  } else {
    const uint32_t max_value = (1u << image.bits_per_pixel) - 1;
    header = absl::StrFormat("P%d\n%d %d\n%d\n", color ? 6 : 5, width, height,
                             max_value);
  }
  io::BufferedStream* stream = GetStream();
  RETURN_IF_ERROR(stream->WriteBytes(header), "Failed to write PNM header");

  const uint32_t samples = color ? 3 : 1;
  const uint64_t row_bits =
      image.pixel_type == PixelType::kBit
          ? (static_cast<uint64_t>(width) + 7) / 8 * 8
          : static_cast<uint64_t>(width) * samples * image.bits_per_pixel;

  layout_ = decode::InterleavedLayout{};
  layout_.data_offset_bits = static_cast<uint64_t>(stream->GetFilePointer()) * 8;
  layout_.row_stride_bits = row_bits;
  layout_.height = height;
  layout_.bits_per_sample = image.bits_per_pixel;
  layout_.samples_per_pixel = samples;
  data_bytes_ = row_bits / 8 * static_cast<uint64_t>(height);
  open_ = true;
  return absl::OkStatus();
}

absl::Status PnmWriter::WritePlaneBytes(const ImageMetadata& /*image*/,
                                        int64_t plane_index,
                                        const PlaneRegion& region,
                                        std::span<const uint8_t> bytes) {
  decode::InterleavedLayout layout = layout_;
  layout.sample_index = static_cast<uint32_t>(plane_index);
  RETURN_IF_ERROR(
      decode::WriteInterleavedRegion(*GetStream(), layout, region, bytes), "");
  return absl::OkStatus();
}

absl::Status PnmWriter::OnClose() {
  if (!open_) {
    return absl::OkStatus();
  }
  open_ = false;
  const uint64_t total = layout_.data_offset_bits / 8 + data_bytes_;
  RETURN_IF_ERROR(GetStream()->SetLength(static_cast<int64_t>(total)),
                  "Failed to size PNM raster");
  return absl::OkStatus();
}

}  // namespace pnm
}  // namespace formats
}  // namespace planeio
