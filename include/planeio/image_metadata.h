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

#ifndef PLANEIO_INCLUDE_PLANEIO_IMAGE_METADATA_H_
#define PLANEIO_INCLUDE_PLANEIO_IMAGE_METADATA_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "planeio/metadata_table.h"
#include "planeio/pixel_type.h"

namespace planeio {

/// @brief Axis kinds of a series
enum class AxisType {
  kX,
  kY,
  kZ,
  kChannel,
  kTime,
  kSpectra,
  kOther,
};

/// @brief Get string representation of an axis type
constexpr const char* GetName(AxisType type) {
  switch (type) {
    case AxisType::kX:
      return "X";
    case AxisType::kY:
      return "Y";
    case AxisType::kZ:
      return "Z";
    case AxisType::kChannel:
      return "Channel";
    case AxisType::kTime:
      return "Time";
    case AxisType::kSpectra:
      return "Spectra";
    case AxisType::kOther:
      return "Other";
  }
  return "unknown";
}

/// @brief Single-letter code used in dimension order strings ("XYZCT")
constexpr char GetAxisLetter(AxisType type) {
  switch (type) {
    case AxisType::kX:
      return 'X';
    case AxisType::kY:
      return 'Y';
    case AxisType::kZ:
      return 'Z';
    case AxisType::kChannel:
      return 'C';
    case AxisType::kTime:
      return 'T';
    case AxisType::kSpectra:
      return 'S';
    case AxisType::kOther:
      return 'O';
  }
  return '?';
}

/// @brief Inverse of GetAxisLetter
std::optional<AxisType> AxisTypeFromLetter(char letter);

/// @brief One named axis of a series
struct Axis {
  AxisType type = AxisType::kOther;
  int64_t length = 1;
  double scale = 1.0;
  std::string unit;
};

/// @brief Indexed-color lookup table
///
/// Stores `components` (3 for RGB, 4 for RGBA) rows of `length` entries,
/// each entry `bits` (8 or 16) wide.
class ColorTable {
 public:
  ColorTable(uint32_t components, uint32_t bits, size_t length)
      : components_(components),
        bits_(bits),
        length_(length),
        entries_(components * length, 0) {}

  [[nodiscard]] uint32_t GetComponentCount() const noexcept {
    return components_;
  }

  [[nodiscard]] uint32_t GetBits() const noexcept { return bits_; }

  [[nodiscard]] size_t GetLength() const noexcept { return length_; }

  /// @brief Get one table entry
  /// @throws std::out_of_range on bad component or index
  [[nodiscard]] uint16_t Get(uint32_t component, size_t index) const {
    return entries_.at(component * length_ + index);
  }

  void Set(uint32_t component, size_t index, uint16_t value) {
    entries_.at(component * length_ + index) = value;
  }

 private:
  uint32_t components_;
  uint32_t bits_;
  size_t length_;
  std::vector<uint16_t> entries_;
};

/// @brief Metadata of one image series
///
/// The first two axes are always X and Y. Every other axis is
/// non-planar: the plane count is the product of their lengths and is
/// never stored. Plane indices rasterize non-planar positions with the
/// first non-planar axis varying fastest.
struct ImageMetadata {
  /// @brief Optional series name
  std::string name;

  /// @brief Ordered axes, X and Y first
  std::vector<Axis> axes;

  /// @brief Element type of decoded pixels
  PixelType pixel_type = PixelType::kUInt8;

  /// @brief Bits per stored sample (<= bits of pixel_type)
  uint32_t bits_per_pixel = 8;

  /// @brief Byte order of multi-byte samples in plane bytes
  bool little_endian = false;

  /// @brief Optional tile size of the on-disk layout
  std::optional<uint32_t> tile_width;
  std::optional<uint32_t> tile_height;

  /// @brief Optional indexed-color table
  std::shared_ptr<const ColorTable> color_table;

  /// @brief Raw per-series key/value pairs
  MetadataTable table;

  /// @brief Create metadata with X, Y and extra axes of the given lengths
  static ImageMetadata Create(int64_t size_x, int64_t size_y,
                              PixelType pixel_type,
                              std::vector<Axis> extra_axes = {});

  /// @brief Find an axis by type
  /// @return Pointer into axes or nullptr
  [[nodiscard]] const Axis* FindAxis(AxisType type) const;

  /// @brief Length of an axis, 1 if the series has no such axis
  [[nodiscard]] int64_t GetAxisLength(AxisType type) const;

  [[nodiscard]] int64_t GetSizeX() const { return GetAxisLength(AxisType::kX); }

  [[nodiscard]] int64_t GetSizeY() const { return GetAxisLength(AxisType::kY); }

  /// @brief Product of all non-X/Y axis lengths
  ///
  /// Saturates at INT64_MAX; Validate rejects series whose size overflows.
  [[nodiscard]] int64_t GetPlaneCount() const;

  /// @brief Axis letters in declared order, e.g. "XYCZT"
  [[nodiscard]] std::string GetDimensionOrder() const;

  /// @brief Number of plane bytes for a w*h region
  [[nodiscard]] size_t GetPlaneSizeBytes(int64_t width, int64_t height) const;

  /// @brief Positions along the non-planar axes for a plane index
  /// @return One entry per non-X/Y axis, in declared order
  [[nodiscard]] absl::StatusOr<std::vector<int64_t>> GetPlanePosition(
      int64_t plane_index) const;

  /// @brief Inverse of GetPlanePosition
  [[nodiscard]] absl::StatusOr<int64_t> GetPlaneIndex(
      std::span<const int64_t> position) const;

  /// @brief Check structural invariants
  [[nodiscard]] absl::Status Validate() const;
};

}  // namespace planeio

#endif  // PLANEIO_INCLUDE_PLANEIO_IMAGE_METADATA_H_
