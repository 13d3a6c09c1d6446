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

#ifndef PLANEIO_INCLUDE_PLANEIO_PLANE_H_
#define PLANEIO_INCLUDE_PLANEIO_PLANE_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "absl/status/statusor.h"
#include "planeio/decode/plane_decoder.h"
#include "planeio/image_metadata.h"
#include "planeio/pixel_buffer.h"
#include "planeio/pixel_type.h"

namespace planeio {

/// @brief Rectangle within a plane, in pixels
struct PlaneRegion {
  int64_t x = 0;
  int64_t y = 0;
  int64_t width = 0;
  int64_t height = 0;

  [[nodiscard]] int64_t Area() const { return width * height; }

  bool operator==(const PlaneRegion&) const = default;
};

/// @brief Raw bytes of one region of one 2-D slice
///
/// The bytes are a continuous bit stream of width*height samples of
/// bits_per_pixel bits each, without row padding. Multi-byte samples use
/// the recorded byte order.
struct Plane {
  int series = 0;
  int64_t index = 0;
  PlaneRegion region;
  PixelType pixel_type = PixelType::kUInt8;
  uint32_t bits_per_pixel = 8;
  bool little_endian = false;
  std::shared_ptr<const ColorTable> color_table;
  std::vector<uint8_t> bytes;

  /// @brief Encoding of bytes
  [[nodiscard]] decode::PixelEncoding GetEncoding() const {
    return decode::PixelEncoding{.pixel_type = pixel_type,
                                 .bits_per_pixel = bits_per_pixel,
                                 .little_endian = little_endian};
  }

  /// @brief Decode bytes into width*height typed elements
  [[nodiscard]] absl::StatusOr<PixelBuffer> Decode() const;
};

}  // namespace planeio

#endif  // PLANEIO_INCLUDE_PLANEIO_PLANE_H_
