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

#ifndef PLANEIO_INCLUDE_PLANEIO_FORMATS_ICS_ICS_METADATA_H_
#define PLANEIO_INCLUDE_PLANEIO_FORMATS_ICS_ICS_METADATA_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "planeio/decode/interleaved_region.h"
#include "planeio/image_metadata.h"
#include "planeio/io/buffered_stream.h"
#include "planeio/metadata.h"

namespace planeio::formats::ics {

inline constexpr std::string_view kFormatName = "ICS";

enum class IcsCompression {
  kUncompressed,
  kGzip,
};

/// @brief Axis label written to "layout order"
std::string_view GetIcsAxisName(AxisType type);

/// @brief Swap the .ics/.ids suffix of an id, keeping its case
/// @return Companion id, or nullopt when the id has neither suffix
std::optional<std::string> GetCompanionId(std::string_view id);

/// @brief On-disk raster of an ICS data block
///
/// The data block stores the file axes in "layout order", first axis
/// fastest. Axes before x are interleaved into every pixel; x must be
/// directly followed by y. Everything after y selects a whole
/// interleaved frame.
class IcsLayout {
 public:
  /// @brief Build a layout from axes in file order
  /// @retval DataLoss (format kind) if x and y are missing or apart
  static absl::StatusOr<IcsLayout> Create(std::vector<Axis> file_axes,
                                          uint32_t bits);

  [[nodiscard]] const std::vector<Axis>& GetFileAxes() const noexcept {
    return file_axes_;
  }

  [[nodiscard]] uint32_t GetBits() const noexcept { return bits_; }

  [[nodiscard]] uint32_t GetSamplesPerPixel() const noexcept { return spp_; }

  /// @brief Axes as a series declares them: X, Y, then file order
  [[nodiscard]] std::vector<Axis> GetDeclaredAxes() const;

  /// @brief Bits of one interleaved frame (all samples of one x/y raster)
  [[nodiscard]] uint64_t GetFrameBits() const;

  /// @brief Bytes of the whole data block
  [[nodiscard]] uint64_t GetTotalBytes() const;

  /// @brief Raster of one plane of a series
  /// @param image Series whose declared axes order plane_index
  /// @param plane_index Plane within image
  /// @param data_offset Byte offset of the data block in the stream
  [[nodiscard]] absl::StatusOr<decode::InterleavedLayout> ForPlane(
      const ImageMetadata& image, int64_t plane_index,
      uint64_t data_offset) const;

 private:
  IcsLayout(std::vector<Axis> file_axes, uint32_t bits, size_t x_index,
            uint32_t spp)
      : file_axes_(std::move(file_axes)),
        bits_(bits),
        x_index_(x_index),
        spp_(spp) {}

  std::vector<Axis> file_axes_;
  uint32_t bits_;
  size_t x_index_;
  uint32_t spp_;
};

/// @brief Parse state of an ICS resource
class IcsMetadata : public Metadata {
 public:
  [[nodiscard]] const std::string& GetVersion() const noexcept {
    return version_;
  }

  void SetVersion(std::string version) { version_ = std::move(version); }

  /// @brief Whether pixel data lives in the .ids companion
  [[nodiscard]] bool HasCompanionData() const noexcept {
    return data_id_ != GetSourceId();
  }

  [[nodiscard]] const std::string& GetDataId() const noexcept {
    return data_id_;
  }

  void SetDataId(std::string id) { data_id_ = std::move(id); }

  [[nodiscard]] uint64_t GetDataOffset() const noexcept {
    return data_offset_;
  }

  void SetDataOffset(uint64_t offset) { data_offset_ = offset; }

  [[nodiscard]] IcsCompression GetCompression() const noexcept {
    return compression_;
  }

  void SetCompression(IcsCompression compression) {
    compression_ = compression;
  }

  [[nodiscard]] const std::optional<IcsLayout>& GetLayout() const noexcept {
    return layout_;
  }

  void SetLayout(IcsLayout layout) { layout_ = std::move(layout); }

  /// @brief Stream holding pixel data; the header stream unless replaced
  [[nodiscard]] io::BufferedStream* GetDataStream() const noexcept {
    return data_stream_ != nullptr ? data_stream_.get() : GetSource();
  }

  /// @brief Install a dedicated pixel-data stream, closing any previous one
  absl::Status ReplaceDataStream(std::unique_ptr<io::BufferedStream> stream);

  absl::Status Close(Context& context) override;

 private:
  std::string version_;
  std::string data_id_;
  uint64_t data_offset_ = 0;
  IcsCompression compression_ = IcsCompression::kUncompressed;
  std::optional<IcsLayout> layout_;
  std::unique_ptr<io::BufferedStream> data_stream_;
};

}  // namespace planeio::formats::ics

#endif  // PLANEIO_INCLUDE_PLANEIO_FORMATS_ICS_ICS_METADATA_H_
