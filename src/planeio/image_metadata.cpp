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

#include "planeio/image_metadata.h"

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_format.h"
#include "planeio/status.h"
#include "planeio/utilities/checked_math.h"

namespace planeio {

namespace {

bool IsPlanar(AxisType type) {
  return type == AxisType::kX || type == AxisType::kY;
}

}  // namespace

std::optional<AxisType> AxisTypeFromLetter(char letter) {
  for (AxisType type :
       {AxisType::kX, AxisType::kY, AxisType::kZ, AxisType::kChannel,
        AxisType::kTime, AxisType::kSpectra, AxisType::kOther}) {
    if (GetAxisLetter(type) == letter) {
      return type;
    }
  }
  return std::nullopt;
}

ImageMetadata ImageMetadata::Create(int64_t size_x, int64_t size_y,
                                    PixelType pixel_type,
                                    std::vector<Axis> extra_axes) {
  ImageMetadata image;
  image.axes.push_back(Axis{.type = AxisType::kX, .length = size_x});
  image.axes.push_back(Axis{.type = AxisType::kY, .length = size_y});
  for (auto& axis : extra_axes) {
    image.axes.push_back(std::move(axis));
  }
  image.pixel_type = pixel_type;
  image.bits_per_pixel = GetPixelTypeBits(pixel_type);
  return image;
}

const Axis* ImageMetadata::FindAxis(AxisType type) const {
  for (const auto& axis : axes) {
    if (axis.type == type) {
      return &axis;
    }
  }
  return nullptr;
}

int64_t ImageMetadata::GetAxisLength(AxisType type) const {
  const Axis* axis = FindAxis(type);
  return axis != nullptr ? axis->length : 1;
}

int64_t ImageMetadata::GetPlaneCount() const {
  int64_t count = 1;
  for (const auto& axis : axes) {
    if (!IsPlanar(axis.type)) {
      auto next = CheckedMultiply(count, axis.length);
      if (!next.has_value()) {
        return std::numeric_limits<int64_t>::max();
      }
      count = *next;
    }
  }
  return count;
}

std::string ImageMetadata::GetDimensionOrder() const {
  std::string order;
  order.reserve(axes.size());
  for (const auto& axis : axes) {
    order.push_back(GetAxisLetter(axis.type));
  }
  return order;
}

size_t ImageMetadata::GetPlaneSizeBytes(int64_t width, int64_t height) const {
  const uint64_t bits = static_cast<uint64_t>(width) *
                        static_cast<uint64_t>(height) * bits_per_pixel;
  return static_cast<size_t>((bits + 7) / 8);
}

absl::StatusOr<std::vector<int64_t>> ImageMetadata::GetPlanePosition(
    int64_t plane_index) const {
  const int64_t plane_count = GetPlaneCount();
  if (plane_index < 0 || plane_index >= plane_count) {
    return MAKE_STATUS(ErrorKind::kBounds,
                       absl::StrFormat("Plane index %d out of range [0, %d)",
                                       plane_index, plane_count));
  }

  std::vector<int64_t> position;
  int64_t remainder = plane_index;
  for (const auto& axis : axes) {
    if (IsPlanar(axis.type)) {
      continue;
    }
    position.push_back(remainder % axis.length);
    remainder /= axis.length;
  }
  return position;
}

absl::StatusOr<int64_t> ImageMetadata::GetPlaneIndex(
    std::span<const int64_t> position) const {
  int64_t index = 0;
  int64_t stride = 1;
  size_t i = 0;
  for (const auto& axis : axes) {
    if (IsPlanar(axis.type)) {
      continue;
    }
    if (i >= position.size()) {
      return MAKE_STATUS(ErrorKind::kInvalidArgument,
                         "Plane position has too few coordinates");
    }
    if (position[i] < 0 || position[i] >= axis.length) {
      return MAKE_STATUS(
          ErrorKind::kBounds,
          absl::StrFormat("Position %d out of range for axis %s of length %d",
                          position[i], GetName(axis.type), axis.length));
    }
    index += position[i] * stride;
    stride *= axis.length;
    ++i;
  }
  if (i != position.size()) {
    return MAKE_STATUS(ErrorKind::kInvalidArgument,
                       "Plane position has too many coordinates");
  }
  return index;
}

absl::Status ImageMetadata::Validate() const {
  if (axes.size() < 2 || axes[0].type != AxisType::kX ||
      axes[1].type != AxisType::kY) {
    return MAKE_STATUS(ErrorKind::kFormat,
                       "Series axes must start with X and Y");
  }

  for (size_t i = 0; i < axes.size(); ++i) {
    if (axes[i].length <= 0) {
      return MAKE_STATUS(
          ErrorKind::kFormat,
          absl::StrFormat("Axis %s has non-positive length %d",
                          GetName(axes[i].type), axes[i].length));
    }
    for (size_t j = i + 1; j < axes.size(); ++j) {
      if (axes[i].type == axes[j].type) {
        return MAKE_STATUS(ErrorKind::kFormat,
                           absl::StrFormat("Axis %s appears more than once",
                                           GetName(axes[i].type)));
      }
    }
  }

  const uint32_t max_bits = pixel_type == PixelType::kBit
                                ? 1
                                : static_cast<uint32_t>(
                                      GetPixelTypeSize(pixel_type) * 8);
  if (bits_per_pixel == 0 || bits_per_pixel > max_bits) {
    return MAKE_STATUS(
        ErrorKind::kFormat,
        absl::StrFormat("%d bits per pixel is invalid for %s pixels",
                        bits_per_pixel, GetName(pixel_type)));
  }
  if (IsFloatingPoint(pixel_type) && bits_per_pixel != max_bits) {
    return MAKE_STATUS(ErrorKind::kFormat,
                       "Floating point samples must use their full width");
  }

  std::optional<int64_t> total_bits = static_cast<int64_t>(bits_per_pixel);
  for (const auto& axis : axes) {
    total_bits = CheckedMultiply(*total_bits, axis.length);
    if (!total_bits.has_value()) {
      return MAKE_STATUS(
          ErrorKind::kFormat,
          absl::StrFormat("Series dimensions %s overflow the addressable size",
                          GetDimensionOrder()));
    }
  }

  if (color_table != nullptr && color_table->GetComponentCount() != 3 &&
      color_table->GetComponentCount() != 4) {
    return MAKE_STATUS(ErrorKind::kFormat,
                       "Color tables must have 3 or 4 components");
  }

  return absl::OkStatus();
}

}  // namespace planeio
