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

#include "planeio/formats/ics/ics_metadata.h"

#include <cstdint>
#include <optional>
#include <utility>

#include "absl/strings/ascii.h"
#include "absl/strings/str_format.h"
#include "planeio/runtime/format_descriptor.h"
#include "planeio/status.h"
#include "planeio/utilities/checked_math.h"

namespace planeio {
namespace formats {
namespace ics {

std::string_view GetIcsAxisName(AxisType type) {
  switch (type) {
    case AxisType::kX:
      return "x";
    case AxisType::kY:
      return "y";
    case AxisType::kZ:
      return "z";
    case AxisType::kTime:
      return "t";
    case AxisType::kChannel:
      return "ch";
    case AxisType::kSpectra:
      return "lambda";
    case AxisType::kOther:
      return "other";
  }
  return "other";
}

std::optional<std::string> GetCompanionId(std::string_view id) {
  const std::string suffix = GetSuffix(id);
  if (suffix != "ics" && suffix != "ids") {
    return std::nullopt;
  }
  // ".ics" <-> ".ids": only the middle letter changes.
  std::string companion(id);
  char& middle = companion[companion.size() - 2];
  const bool upper = absl::ascii_isupper(static_cast<unsigned char>(middle));
  const char swapped = suffix == "ics" ? 'd' : 'c';
  middle = upper ? absl::ascii_toupper(static_cast<unsigned char>(swapped))
                 : swapped;
  return companion;
}

absl::StatusOr<IcsLayout> IcsLayout::Create(std::vector<Axis> file_axes,
                                            uint32_t bits) {
  if (bits == 0 || bits > 64) {
    return MAKE_STATUS(ErrorKind::kFormat,
                       absl::StrFormat("Invalid sample size of %d bits", bits));
  }

  size_t x_index = file_axes.size();
  for (size_t i = 0; i < file_axes.size(); ++i) {
    if (file_axes[i].type == AxisType::kX) {
      x_index = i;
      break;
    }
  }
  if (x_index + 1 >= file_axes.size() ||
      file_axes[x_index + 1].type != AxisType::kY) {
    return MAKE_STATUS(ErrorKind::kFormat,
                       "Layout order must hold x directly followed by y");
  }

  // Every offset computed from the layout must fit int64 bits.
  std::optional<int64_t> total_bits = static_cast<int64_t>(bits);
  for (const auto& axis : file_axes) {
    if (axis.length <= 0) {
      return MAKE_STATUS(
          ErrorKind::kFormat,
          absl::StrFormat("Layout size %d of axis %s is not positive",
                          axis.length, GetIcsAxisName(axis.type)));
    }
    total_bits = CheckedMultiply(*total_bits, axis.length);
    if (!total_bits.has_value()) {
      return MAKE_STATUS(ErrorKind::kFormat,
                         "Layout sizes overflow the addressable data size");
    }
  }

  uint64_t spp = 1;
  for (size_t i = 0; i < x_index; ++i) {
    spp *= static_cast<uint64_t>(file_axes[i].length);
  }
  if (spp > UINT32_MAX) {
    return MAKE_STATUS(ErrorKind::kFormat, "Too many interleaved samples");
  }
  return IcsLayout(std::move(file_axes), bits, x_index,
                   static_cast<uint32_t>(spp));
}

std::vector<Axis> IcsLayout::GetDeclaredAxes() const {
  std::vector<Axis> axes;
  axes.reserve(file_axes_.size());
  axes.push_back(file_axes_[x_index_]);
  axes.push_back(file_axes_[x_index_ + 1]);
  for (size_t i = 0; i < file_axes_.size(); ++i) {
    if (i != x_index_ && i != x_index_ + 1) {
      axes.push_back(file_axes_[i]);
    }
  }
  return axes;
}

uint64_t IcsLayout::GetFrameBits() const {
  return static_cast<uint64_t>(file_axes_[x_index_].length) *
         static_cast<uint64_t>(file_axes_[x_index_ + 1].length) * spp_ *
         bits_;
}

uint64_t IcsLayout::GetTotalBytes() const {
  uint64_t bits = GetFrameBits();
  for (size_t i = x_index_ + 2; i < file_axes_.size(); ++i) {
    bits *= static_cast<uint64_t>(file_axes_[i].length);
  }
  return (bits + 7) / 8;
}

absl::StatusOr<decode::InterleavedLayout> IcsLayout::ForPlane(
    const ImageMetadata& image, int64_t plane_index,
    uint64_t data_offset) const {
  DECLARE_ASSIGN_OR_RETURN_MOVE(std::vector<int64_t>, position,
                                image.GetPlanePosition(plane_index), "");

  // Position entries follow the series' non-planar axes in declared order.
  std::vector<AxisType> position_types;
  for (const auto& axis : image.axes) {
    if (axis.type != AxisType::kX && axis.type != AxisType::kY) {
      position_types.push_back(axis.type);
    }
  }

  uint64_t sample_index = 0;
  uint64_t sample_stride = 1;
  uint64_t frame_index = 0;
  uint64_t frame_stride = 1;
  for (size_t i = 0; i < file_axes_.size(); ++i) {
    if (i == x_index_ || i == x_index_ + 1) {
      continue;
    }
    const Axis& axis = file_axes_[i];
    int64_t coordinate = 0;
    for (size_t k = 0; k < position_types.size(); ++k) {
      if (position_types[k] == axis.type) {
        coordinate = position[k];
        break;
      }
    }
    if (i < x_index_) {
      sample_index += static_cast<uint64_t>(coordinate) * sample_stride;
      sample_stride *= static_cast<uint64_t>(axis.length);
    } else {
      frame_index += static_cast<uint64_t>(coordinate) * frame_stride;
      frame_stride *= static_cast<uint64_t>(axis.length);
    }
  }

  decode::InterleavedLayout layout;
  layout.data_offset_bits = data_offset * 8 + frame_index * GetFrameBits();
  layout.row_stride_bits =
      static_cast<uint64_t>(file_axes_[x_index_].length) * spp_ * bits_;
  layout.height = file_axes_[x_index_ + 1].length;
  layout.bits_per_sample = bits_;
  layout.samples_per_pixel = spp_;
  layout.sample_index = static_cast<uint32_t>(sample_index);
  layout.bottom_up = false;
  return layout;
}

absl::Status IcsMetadata::ReplaceDataStream(
    std::unique_ptr<io::BufferedStream> stream) {
  absl::Status close_status;
  if (data_stream_ != nullptr) {
    close_status = data_stream_->Close();
  }
  data_stream_ = std::move(stream);
  RETURN_IF_ERROR(close_status, "Failed to close previous data stream");
  return absl::OkStatus();
}

absl::Status IcsMetadata::Close(Context& context) {
  absl::Status data_status;
  if (data_stream_ != nullptr) {
    data_status = data_stream_->Close();
    data_stream_.reset();
  }
  auto own_status = Metadata::Close(context);
  RETURN_IF_ERROR(data_status, absl::StrFormat("Failed to close %s", data_id_));
  RETURN_IF_ERROR(own_status, "");
  return absl::OkStatus();
}

}  // namespace ics
}  // namespace formats
}  // namespace planeio
