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

#ifndef PLANEIO_INCLUDE_PLANEIO_FORMATS_ICS_ICS_READER_H_
#define PLANEIO_INCLUDE_PLANEIO_FORMATS_ICS_ICS_READER_H_

#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

#include "absl/status/status.h"
#include "planeio/formats/ics/ics_metadata.h"
#include "planeio/reader.h"

namespace planeio::formats::ics {

/// @brief Reader for ICS 1.0 and 2.0 data
///
/// Opens the .ids companion for version 1.0 headers. Gzip-compressed
/// data is inflated once when the reader opens and served from memory.
class IcsReader : public Reader {
 public:
  IcsReader() = default;

  [[nodiscard]] std::string_view GetFormatName() const override {
    return kFormatName;
  }

 protected:
  [[nodiscard]] std::unique_ptr<Parser> CreateParser() const override;

  absl::Status OnSetMetadata(Context& context,
                             const ReaderOptions& options) override;

  absl::Status ReadPlaneBytes(const ImageMetadata& image, int64_t plane_index,
                              const PlaneRegion& region,
                              std::span<uint8_t> out) override;
};

}  // namespace planeio::formats::ics

#endif  // PLANEIO_INCLUDE_PLANEIO_FORMATS_ICS_ICS_READER_H_
