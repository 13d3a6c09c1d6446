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

#ifndef PLANEIO_INCLUDE_PLANEIO_WRITER_H_
#define PLANEIO_INCLUDE_PLANEIO_WRITER_H_

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "planeio/image_metadata.h"
#include "planeio/io/buffered_stream.h"
#include "planeio/metadata.h"
#include "planeio/options.h"
#include "planeio/plane.h"

namespace planeio {

class Context;

/// @brief Persists planes of a single series
///
/// SetDest() checks the metadata against what the format can store and
/// truncates the destination. Planes may then be saved in any order, whole
/// or as regions. Close() finalizes the file.
///
/// Example usage:
/// @code
/// Metadata metadata;
/// metadata.AddImage(ImageMetadata::Create(512, 512, PixelType::kUInt16));
/// DECLARE_ASSIGN_OR_RETURN_MOVE(std::unique_ptr<Writer>, writer,
///                               context.OpenWriter("out.ics", metadata));
/// RETURN_IF_ERROR(writer->SavePlane(0, 0, bytes));
/// RETURN_IF_ERROR(writer->Close());
/// @endcode
class Writer {
 public:
  Writer() = default;
  virtual ~Writer();

  Writer(const Writer&) = delete;
  Writer& operator=(const Writer&) = delete;

  /// @brief Open a destination for the single series of metadata
  /// @retval InvalidArgument when the format cannot store the series
  absl::Status SetDest(Context& context, std::string_view id,
                       const Metadata& metadata,
                       const WriterOptions& options = {});

  /// @brief Save a plane or plane region
  ///
  /// plane.region selects the target rectangle. Multi-byte samples are
  /// swapped when plane.little_endian differs from the declared order.
  absl::Status SavePlane(int series, int64_t plane_index, const Plane& plane);

  /// @brief Save a full plane of packed bytes in the declared byte order
  absl::Status SavePlane(int series, int64_t plane_index,
                         std::span<const uint8_t> bytes);

  /// @brief Finalize and release the destination; idempotent
  absl::Status Close();

  [[nodiscard]] bool IsOpen() const noexcept { return stream_ != nullptr; }

  [[nodiscard]] virtual std::vector<PixelType> GetSupportedPixelTypes()
      const = 0;

  /// @brief Whether more than one plane per series can be stored
  [[nodiscard]] virtual bool CanDoStacks() const { return true; }

  [[nodiscard]] virtual std::string_view GetFormatName() const = 0;

 protected:
  /// @brief Hook run once the destination is open
  virtual absl::Status OnSetDest(Context& /*context*/,
                                 const WriterOptions& /*options*/) {
    return absl::OkStatus();
  }

  /// @brief Store packed bytes of a validated region
  /// @param bytes Exactly image.GetPlaneSizeBytes(w, h) bytes in the
  ///              declared byte order
  virtual absl::Status WritePlaneBytes(const ImageMetadata& image,
                                       int64_t plane_index,
                                       const PlaneRegion& region,
                                       std::span<const uint8_t> bytes) = 0;

  /// @brief Hook run before the stream closes
  virtual absl::Status OnClose() { return absl::OkStatus(); }

  [[nodiscard]] io::BufferedStream* GetStream() const noexcept {
    return stream_.get();
  }

  [[nodiscard]] const ImageMetadata& GetImage() const noexcept {
    return image_;
  }

  [[nodiscard]] const std::string& GetDestId() const noexcept {
    return dest_id_;
  }

  /// @brief Fix the byte order of stored samples
  ///
  /// For formats with a mandated byte order. SavePlane() swaps incoming
  /// planes to match.
  void SetStoredByteOrder(bool little_endian) noexcept {
    image_.little_endian = little_endian;
  }

 private:
  ImageMetadata image_;
  std::string dest_id_;
  std::unique_ptr<io::BufferedStream> stream_;
};

}  // namespace planeio

#endif  // PLANEIO_INCLUDE_PLANEIO_WRITER_H_
