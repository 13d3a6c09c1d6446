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

#include "planeio/writer.h"

#include <algorithm>
#include <utility>

#include "absl/log/log.h"
#include "absl/strings/str_format.h"
#include "planeio/context.h"
#include "planeio/io/byte_order.h"
#include "planeio/status.h"

namespace planeio {

Writer::~Writer() {
  if (stream_ == nullptr) {
    return;
  }
  auto close_status = stream_->Close();
  if (!close_status.ok()) {
    LOG(ERROR) << "Failed to close " << dest_id_ << ": "
               << close_status.message();
  }
}

absl::Status Writer::SetDest(Context& context, std::string_view id,
                             const Metadata& metadata,
                             const WriterOptions& options) {
  if (metadata.GetImageCount() != 1) {
    return MAKE_STATUS(
        ErrorKind::kInvalidArgument,
        absl::StrFormat("%s writers store exactly one series, got %d",
                        GetFormatName(), metadata.GetImageCount()));
  }
  const ImageMetadata& image = metadata.GetImages().front();

  const auto supported = GetSupportedPixelTypes();
  if (std::find(supported.begin(), supported.end(), image.pixel_type) ==
      supported.end()) {
    return MAKE_STATUS(ErrorKind::kInvalidArgument,
                       absl::StrFormat("%s cannot store %s pixels",
                                       GetFormatName(),
                                       GetName(image.pixel_type)));
  }
  if (image.GetPlaneCount() > 1 && !CanDoStacks()) {
    return MAKE_STATUS(ErrorKind::kInvalidArgument,
                       absl::StrFormat("%s cannot store %d planes",
                                       GetFormatName(), image.GetPlaneCount()));
  }
  RETURN_IF_ERROR(image.Validate(), "Invalid series for writing");
  RETURN_IF_ERROR(Close(), "Failed to close previous destination");

  DECLARE_ASSIGN_OR_RETURN_MOVE(
      std::unique_ptr<io::BufferedStream>, stream,
      context.OpenStream(id, io::OpenMode::kTruncate, options.stream),
      absl::StrFormat("Failed to open %s for writing", id));

  image_ = image;
  dest_id_ = std::string(id);
  stream_ = std::move(stream);

  auto hook_status = OnSetDest(context, options);
  if (!hook_status.ok()) {
    auto close_status = stream_->Close();
    stream_.reset();
    if (!close_status.ok()) {
      LOG(ERROR) << "Failed to release " << dest_id_ << ": "
                 << close_status.message();
    }
    return status::AddTrace(hook_status, __func__, __FILE__, __LINE__, "");
  }
  return absl::OkStatus();
}

absl::Status Writer::SavePlane(int series, int64_t plane_index,
                               const Plane& plane) {
  if (stream_ == nullptr) {
    return MAKE_STATUS(ErrorKind::kClosed, "Writer is not open");
  }
  if (series != 0) {
    return MAKE_STATUS(ErrorKind::kBounds,
                       absl::StrFormat("Invalid series %d (series count 1)",
                                       series));
  }
  const int64_t plane_count = image_.GetPlaneCount();
  if (plane_index < 0 || plane_index >= plane_count) {
    return MAKE_STATUS(ErrorKind::kBounds,
                       absl::StrFormat("Plane index %d out of range [0, %d)",
                                       plane_index, plane_count));
  }

  const PlaneRegion& region = plane.region;
  const int64_t size_x = image_.GetSizeX();
  const int64_t size_y = image_.GetSizeY();
  if (region.x < 0 || region.y < 0 || region.width < 0 || region.height < 0 ||
      region.x > size_x || region.y > size_y ||
      region.width > size_x - region.x || region.height > size_y - region.y) {
    return MAKE_STATUS(
        ErrorKind::kBounds,
        absl::StrFormat("Region (%d, %d, %d, %d) exceeds %dx%d plane",
                        region.x, region.y, region.width, region.height,
                        size_x, size_y));
  }

  if (plane.pixel_type != image_.pixel_type ||
      plane.bits_per_pixel != image_.bits_per_pixel) {
    return MAKE_STATUS(
        ErrorKind::kInvalidArgument,
        absl::StrFormat("Plane holds %d-bit %s samples, destination expects "
                        "%d-bit %s",
                        plane.bits_per_pixel, GetName(plane.pixel_type),
                        image_.bits_per_pixel, GetName(image_.pixel_type)));
  }

  const size_t expected = image_.GetPlaneSizeBytes(region.width, region.height);
  if (plane.bytes.size() < expected) {
    return MAKE_STATUS(ErrorKind::kBounds,
                       absl::StrFormat("Plane has %d bytes, region needs %d",
                                       plane.bytes.size(), expected));
  }
  if (expected == 0) {
    return absl::OkStatus();
  }

  std::span<const uint8_t> bytes(plane.bytes.data(), expected);
  const uint32_t bits = image_.bits_per_pixel;
  if (plane.little_endian != image_.little_endian && bits > 8 &&
      bits % 8 == 0) {
    std::vector<uint8_t> swapped(bytes.begin(), bytes.end());
    io::ByteSwapInPlace(swapped.data(), swapped.size() / (bits / 8), bits / 8);
    RETURN_IF_ERROR(WritePlaneBytes(image_, plane_index, region, swapped),
                    absl::StrFormat("Failed to write plane %d", plane_index));
    return absl::OkStatus();
  }

  RETURN_IF_ERROR(WritePlaneBytes(image_, plane_index, region, bytes),
                  absl::StrFormat("Failed to write plane %d", plane_index));
  return absl::OkStatus();
}

absl::Status Writer::SavePlane(int series, int64_t plane_index,
                               std::span<const uint8_t> bytes) {
  if (stream_ == nullptr) {
    return MAKE_STATUS(ErrorKind::kClosed, "Writer is not open");
  }
  Plane plane;
  plane.series = series;
  plane.index = plane_index;
  plane.region = PlaneRegion{0, 0, image_.GetSizeX(), image_.GetSizeY()};
  plane.pixel_type = image_.pixel_type;
  plane.bits_per_pixel = image_.bits_per_pixel;
  plane.little_endian = image_.little_endian;
  plane.bytes.assign(bytes.begin(), bytes.end());
  RETURN_IF_ERROR(SavePlane(series, plane_index, plane), "");
  return absl::OkStatus();
}

absl::Status Writer::Close() {
  if (stream_ == nullptr) {
    return absl::OkStatus();
  }
  auto hook_status = OnClose();
  auto close_status = stream_->Close();
  stream_.reset();
  RETURN_IF_ERROR(hook_status, absl::StrFormat("Failed to finalize %s",
                                               dest_id_));
  RETURN_IF_ERROR(close_status, "");
  return absl::OkStatus();
}

}  // namespace planeio
