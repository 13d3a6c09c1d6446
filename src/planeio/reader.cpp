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

#include "planeio/reader.h"

#include <cmath>
#include <cstring>
#include <limits>
#include <string>
#include <utility>

#include "absl/log/log.h"
#include "absl/strings/str_format.h"
#include "planeio/context.h"
#include "planeio/io/byte_order.h"
#include "planeio/status.h"

namespace planeio {

namespace {

template <typename T>
void NormalizeSamples(std::vector<uint8_t>& bytes, bool little_endian) {
  const size_t count = bytes.size() / sizeof(T);
  for (size_t i = 0; i < count; ++i) {
    uint8_t* sample = bytes.data() + i * sizeof(T);
    T value = io::LoadValue<T>(sample, little_endian);
    if (std::isnan(value)) {
      value = std::numeric_limits<T>::quiet_NaN();
    }
    io::StoreValue<T>(value, sample, io::kHostLittleEndian);
  }
}

}  // namespace

void NormalizeFloatPlane(Plane& plane) {
  if (plane.pixel_type == PixelType::kFloat) {
    NormalizeSamples<float>(plane.bytes, plane.little_endian);
  } else if (plane.pixel_type == PixelType::kDouble) {
    NormalizeSamples<double>(plane.bytes, plane.little_endian);
  } else {
    return;
  }
  plane.little_endian = io::kHostLittleEndian;
}

Reader::~Reader() {
  if (metadata_ == nullptr) {
    return;
  }
  const std::string source_id = metadata_->GetSourceId();
  auto close_status = metadata_->Close(*context_);
  if (!close_status.ok()) {
    LOG(ERROR) << "Failed to close " << source_id << ": "
               << close_status.message();
  }
}

absl::Status Reader::SetSource(Context& context, std::string_view id,
                               const ReaderOptions& options) {
  auto parser = CreateParser();
  DECLARE_ASSIGN_OR_RETURN_MOVE(std::unique_ptr<Metadata>, metadata,
                                parser->Parse(context, id, options.parser), "");
  RETURN_IF_ERROR(SetMetadata(context, std::move(metadata), options), "");
  return absl::OkStatus();
}

absl::Status Reader::SetMetadata(Context& context,
                                 std::unique_ptr<Metadata> metadata,
                                 const ReaderOptions& options) {
  if (metadata == nullptr) {
    return MAKE_STATUS(ErrorKind::kInvalidArgument, "Metadata is null");
  }
  RETURN_IF_ERROR(Close(), "Failed to close previous resource");

  context_ = &context;
  metadata_ = std::move(metadata);
  normalized_ = options.normalized;

  auto hook_status = OnSetMetadata(context, options);
  if (!hook_status.ok()) {
    auto close_status = Close();
    if (!close_status.ok()) {
      LOG(ERROR) << "Failed to release " << GetFormatName()
                 << " resource: " << close_status.message();
    }
    return status::AddTrace(hook_status, __func__, __FILE__, __LINE__, "");
  }
  return absl::OkStatus();
}

absl::StatusOr<const ImageMetadata*> Reader::CheckPlaneParameters(
    int series, int64_t plane_index, const PlaneRegion& region) const {
  if (metadata_ == nullptr) {
    return MAKE_STATUS(ErrorKind::kClosed, "Reader is not open");
  }
  DECLARE_ASSIGN_OR_RETURN_MOVE(const ImageMetadata*, image,
                                metadata_->GetImage(series), "");

  const int64_t plane_count = image->GetPlaneCount();
  if (plane_index < 0 || plane_index >= plane_count) {
    return MAKE_STATUS(ErrorKind::kBounds,
                       absl::StrFormat("Plane index %d out of range [0, %d)",
                                       plane_index, plane_count));
  }

  const int64_t size_x = image->GetSizeX();
  const int64_t size_y = image->GetSizeY();
  if (region.x < 0 || region.y < 0 || region.width < 0 || region.height < 0 ||
      region.x > size_x || region.y > size_y ||
      region.width > size_x - region.x || region.height > size_y - region.y) {
    return MAKE_STATUS(
        ErrorKind::kBounds,
        absl::StrFormat("Region (%d, %d, %d, %d) exceeds %dx%d plane",
                        region.x, region.y, region.width, region.height,
                        size_x, size_y));
  }
  return image;
}

absl::StatusOr<Plane> Reader::OpenPlane(int series, int64_t plane_index) {
  if (metadata_ == nullptr) {
    return MAKE_STATUS(ErrorKind::kClosed, "Reader is not open");
  }
  DECLARE_ASSIGN_OR_RETURN_MOVE(const ImageMetadata*, image,
                                metadata_->GetImage(series), "");
  return OpenPlane(series, plane_index,
                   PlaneRegion{0, 0, image->GetSizeX(), image->GetSizeY()});
}

absl::StatusOr<Plane> Reader::OpenPlane(int series, int64_t plane_index,
                                        const PlaneRegion& region) {
  Plane plane;
  RETURN_IF_ERROR(OpenPlane(series, plane_index, region, plane), "");
  return plane;
}

absl::Status Reader::OpenPlane(int series, int64_t plane_index,
                               const PlaneRegion& region, Plane& plane) {
  DECLARE_ASSIGN_OR_RETURN_MOVE(
      const ImageMetadata*, image,
      CheckPlaneParameters(series, plane_index, region), "");

  const size_t size_bytes =
      image->GetPlaneSizeBytes(region.width, region.height);
  if (size_bytes > kMaxPlaneSizeBytes) {
    return MAKE_STATUS(
        ErrorKind::kResourceExhausted,
        absl::StrFormat("Plane region of %d bytes exceeds the %d byte limit",
                        size_bytes, kMaxPlaneSizeBytes));
  }

  plane.series = series;
  plane.index = plane_index;
  plane.region = region;
  plane.pixel_type = image->pixel_type;
  plane.bits_per_pixel = image->bits_per_pixel;
  plane.little_endian = image->little_endian;
  plane.color_table = image->color_table;
  plane.bytes.assign(size_bytes, 0);

  if (!plane.bytes.empty()) {
    RETURN_IF_ERROR(ReadPlaneBytes(*image, plane_index, region, plane.bytes),
                    absl::StrFormat("Failed to read plane %d of series %d",
                                    plane_index, series));
  }

  if (normalized_ && IsFloatingPoint(plane.pixel_type)) {
    NormalizeFloatPlane(plane);
  }
  return absl::OkStatus();
}

absl::Status Reader::Close() {
  if (metadata_ == nullptr) {
    return absl::OkStatus();
  }
  auto close_status = OnClose();
  auto metadata_status = metadata_->Close(*context_);
  metadata_.reset();
  context_ = nullptr;
  RETURN_IF_ERROR(close_status, "");
  RETURN_IF_ERROR(metadata_status, "");
  return absl::OkStatus();
}

}  // namespace planeio
