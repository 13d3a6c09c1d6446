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

#ifndef PLANEIO_INCLUDE_PLANEIO_FORMATS_ICS_ICS_WRITER_H_
#define PLANEIO_INCLUDE_PLANEIO_FORMATS_ICS_ICS_WRITER_H_

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "planeio/formats/ics/ics_metadata.h"
#include "planeio/writer.h"

namespace planeio::formats::ics {

/// @brief Order the axes of a series for writing
///
/// Letters of order (e.g. "XYZTC") pick axes of the series; letters of
/// axes the series lacks are skipped and axes missing from order keep
/// their declared order at the end. An empty order keeps the declared
/// order.
///
/// @retval InvalidArgument for unknown or repeated letters, or when X is
///         not directly followed by Y
absl::StatusOr<std::vector<Axis>> OrderAxesForWriting(
    const ImageMetadata& image, std::string_view order);

/// @brief Writer for single-file, uncompressed ICS 2.0
///
/// The header is written when the destination opens; planes land at
/// their place in the data block in any order. Close() sizes the file to
/// the full data block.
class IcsWriter : public Writer {
 public:
  IcsWriter() = default;

  [[nodiscard]] std::vector<PixelType> GetSupportedPixelTypes() const override;

  [[nodiscard]] std::string_view GetFormatName() const override {
    return kFormatName;
  }

 protected:
  absl::Status OnSetDest(Context& context,
                         const WriterOptions& options) override;

  absl::Status WritePlaneBytes(const ImageMetadata& image, int64_t plane_index,
                               const PlaneRegion& region,
                               std::span<const uint8_t> bytes) override;

  absl::Status OnClose() override;

 private:
  std::string BuildHeader() const;

  std::optional<IcsLayout> layout_;
  uint64_t data_offset_ = 0;
};

}  // namespace planeio::formats::ics

#endif  // PLANEIO_INCLUDE_PLANEIO_FORMATS_ICS_ICS_WRITER_H_
