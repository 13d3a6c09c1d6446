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

#include "planeio/formats/ics/ics_writer.h"

#include <algorithm>
#include <utility>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "planeio/decode/interleaved_region.h"
#include "planeio/status.h"
#include "planeio/utilities/fmt.h"

namespace planeio {
namespace formats {
namespace ics {

namespace {

/// @brief Base name of an id without directories and the .ics suffix
std::string GetFileName(std::string_view id) {
  const size_t separator = id.find_last_of("/!");
  std::string_view name =
      separator == std::string_view::npos ? id : id.substr(separator + 1);
  if (absl::EndsWithIgnoreCase(name, ".ics")) {
    name.remove_suffix(4);
  }
  return std::string(name);
}

}  // namespace

absl::StatusOr<std::vector<Axis>> OrderAxesForWriting(
    const ImageMetadata& image, std::string_view order) {
  std::vector<Axis> axes;
  for (char letter : order) {
    auto type = AxisTypeFromLetter(absl::ascii_toupper(
        static_cast<unsigned char>(letter)));
    if (!type.has_value()) {
      return MAKE_STATUS(ErrorKind::kInvalidArgument,
                         absl::StrFormat("Unknown axis letter '%c' in %s",
                                         letter, order));
    }
    const bool seen =
        std::any_of(axes.begin(), axes.end(),
                    [&](const Axis& axis) { return axis.type == *type; });
    if (seen) {
      return MAKE_STATUS(ErrorKind::kInvalidArgument,
                         absl::StrFormat("Axis letter '%c' repeated in %s",
                                         letter, order));
    }
    if (const Axis* axis = image.FindAxis(*type)) {
      axes.push_back(*axis);
    }
  }
  for (const auto& axis : image.axes) {
    const bool placed =
        std::any_of(axes.begin(), axes.end(),
                    [&](const Axis& other) { return other.type == axis.type; });
    if (!placed) {
      axes.push_back(axis);
    }
  }

  auto x = std::find_if(axes.begin(), axes.end(), [](const Axis& axis) {
    return axis.type == AxisType::kX;
  });
  if (x == axes.end() || x + 1 == axes.end() || (x + 1)->type != AxisType::kY) {
    return MAKE_STATUS(
        ErrorKind::kInvalidArgument,
        absl::StrFormat("Output order %s must place Y directly after X",
                        order));
  }
  return axes;
}

std::vector<PixelType> IcsWriter::GetSupportedPixelTypes() const {
  return {PixelType::kInt8,   PixelType::kUInt8,  PixelType::kInt16,
          PixelType::kUInt16, PixelType::kInt32,  PixelType::kUInt32,
          PixelType::kFloat,  PixelType::kDouble};
}

absl::Status IcsWriter::OnSetDest(Context& /*context*/,
                                  const WriterOptions& options) {
  const ImageMetadata& image = GetImage();
  DECLARE_ASSIGN_OR_RETURN_MOVE(
      std::vector<Axis>, file_axes,
      OrderAxesForWriting(image, options.output_order), "");
  DECLARE_ASSIGN_OR_RETURN_MOVE(
      std::optional<IcsLayout>, layout,
      IcsLayout::Create(std::move(file_axes), image.bits_per_pixel), "");
  layout_ = std::move(layout);

  io::BufferedStream* stream = GetStream();
  RETURN_IF_ERROR(stream->WriteBytes(BuildHeader()),
                  "Failed to write ICS header");
  data_offset_ = static_cast<uint64_t>(stream->GetFilePointer());
  return absl::OkStatus();
}

std::string IcsWriter::BuildHeader() const {
  const ImageMetadata& image = GetImage();
  const auto& axes = layout_->GetFileAxes();

  std::vector<std::string> order = {"bits"};
  std::vector<std::string> sizes = {absl::StrCat(image.bits_per_pixel)};
  std::vector<std::string> scales = {"1.0"};
  std::vector<std::string> units = {"bits"};
  for (const auto& axis : axes) {
    order.emplace_back(GetIcsAxisName(axis.type));
    sizes.push_back(absl::StrCat(axis.length));
    scales.push_back(fmt::FormatRoundTrip(axis.scale));
    units.push_back(axis.unit.empty() ? "undefined" : axis.unit);
  }

  const size_t sample_bytes = std::max<size_t>(
      1, (static_cast<size_t>(image.bits_per_pixel) + 7) / 8);
  std::vector<std::string> byte_order;
  for (size_t i = 0; i < sample_bytes; ++i) {
    byte_order.push_back(absl::StrCat(
        image.little_endian ? i + 1 : sample_bytes - i));
  }

  std::string header = "\t\n";
  absl::StrAppend(&header, "ics_version\t2.0\n");
  absl::StrAppend(&header, "filename\t", GetFileName(GetDestId()), "\n");
  absl::StrAppend(&header, "layout\tparameters\t", order.size(), "\n");
  absl::StrAppend(&header, "layout\torder\t", absl::StrJoin(order, "\t"), "\n");
  absl::StrAppend(&header, "layout\tsizes\t", absl::StrJoin(sizes, "\t"), "\n");
  absl::StrAppend(&header, "layout\tcoordinates\tvideo\n");
  absl::StrAppend(&header, "layout\tsignificant_bits\t", image.bits_per_pixel,
                  "\n");
  absl::StrAppend(&header, "representation\tformat\t",
                  IsFloatingPoint(image.pixel_type) ? "real" : "integer",
                  "\n");
  absl::StrAppend(&header, "representation\tsign\t",
                  IsSigned(image.pixel_type) ? "signed" : "unsigned", "\n");
  absl::StrAppend(&header, "representation\tcompression\tuncompressed\n");
  absl::StrAppend(&header, "representation\tbyte_order\t",
                  absl::StrJoin(byte_order, "\t"), "\n");
  absl::StrAppend(&header, "parameter\tscale\t", absl::StrJoin(scales, "\t"),
                  "\n");
  absl::StrAppend(&header, "parameter\tunits\t", absl::StrJoin(units, "\t"),
                  "\n");
  absl::StrAppend(&header, "end\n");
  return header;
}

absl::Status IcsWriter::WritePlaneBytes(const ImageMetadata& image,
                                        int64_t plane_index,
                                        const PlaneRegion& region,
                                        std::span<const uint8_t> bytes) {
  DECLARE_ASSIGN_OR_RETURN_MOVE(
      decode::InterleavedLayout, layout,
      layout_->ForPlane(image, plane_index, data_offset_), "");
  RETURN_IF_ERROR(
      decode::WriteInterleavedRegion(*GetStream(), layout, region, bytes), "");
  return absl::OkStatus();
}

absl::Status IcsWriter::OnClose() {
  if (!layout_.has_value()) {
    return absl::OkStatus();
  }
  const uint64_t total = data_offset_ + layout_->GetTotalBytes();
  RETURN_IF_ERROR(GetStream()->SetLength(static_cast<int64_t>(total)),
                  "Failed to size ICS data block");
  layout_.reset();
  return absl::OkStatus();
}

}  // namespace ics
}  // namespace formats
}  // namespace planeio
