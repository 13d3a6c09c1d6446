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

#ifndef PLANEIO_INCLUDE_PLANEIO_FORMATS_BMP_BMP_H_
#define PLANEIO_INCLUDE_PLANEIO_FORMATS_BMP_BMP_H_

#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

#include "absl/status/status.h"
#include "planeio/decode/interleaved_region.h"
#include "planeio/metadata.h"
#include "planeio/parser.h"
#include "planeio/reader.h"

/**
 * @file bmp.h
 * @brief Windows bitmap parser and reader
 *
 * Uncompressed BITMAPINFOHEADER (and later) bitmaps. Indexed data (1, 4
 * and 8 bits) becomes one packed uint8 plane with a color table. 24 and
 * 32-bit data becomes three or four channel planes in RGB(A) order.
 */

namespace planeio::formats::bmp {

inline constexpr std::string_view kFormatName = "BMP";

/// @brief BITMAPFILEHEADER plus BITMAPINFOHEADER size in bytes
inline constexpr uint32_t kMinHeaderSize = 14 + 40;

class BmpMetadata : public Metadata {
 public:
  [[nodiscard]] uint32_t GetBitsPerPixel() const noexcept { return bits_; }

  void SetBitsPerPixel(uint32_t bits) { bits_ = bits; }

  [[nodiscard]] uint64_t GetDataOffset() const noexcept {
    return data_offset_;
  }

  void SetDataOffset(uint64_t offset) { data_offset_ = offset; }

  /// @brief Rows are stored first row first (negative height)
  [[nodiscard]] bool IsTopDown() const noexcept { return top_down_; }

  void SetTopDown(bool top_down) { top_down_ = top_down; }

  /// @brief Stored raster of one channel
  [[nodiscard]] decode::InterleavedLayout GetLayout(uint32_t channel) const;

 private:
  uint32_t bits_ = 0;
  uint64_t data_offset_ = 0;
  bool top_down_ = false;
};

class BmpParser : public Parser {
 public:
  [[nodiscard]] std::string_view GetFormatName() const override {
    return kFormatName;
  }

 protected:
  absl::Status CheckHeader(io::BufferedStream& stream) override;

  [[nodiscard]] std::unique_ptr<Metadata> CreateMetadata() const override {
    return std::make_unique<BmpMetadata>();
  }

  absl::Status TypedParse(Context& context, io::BufferedStream& stream,
                          Metadata& metadata,
                          const ParserOptions& options) override;
};

class BmpReader : public Reader {
 public:
  [[nodiscard]] std::string_view GetFormatName() const override {
    return kFormatName;
  }

 protected:
  [[nodiscard]] std::unique_ptr<Parser> CreateParser() const override {
    return std::make_unique<BmpParser>();
  }

  absl::Status ReadPlaneBytes(const ImageMetadata& image, int64_t plane_index,
                              const PlaneRegion& region,
                              std::span<uint8_t> out) override;
};

}  // namespace planeio::formats::bmp

#endif  // PLANEIO_INCLUDE_PLANEIO_FORMATS_BMP_BMP_H_
