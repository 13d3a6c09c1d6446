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

#ifndef PLANEIO_INCLUDE_PLANEIO_FORMATS_PNM_PNM_H_
#define PLANEIO_INCLUDE_PLANEIO_FORMATS_PNM_PNM_H_

#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "planeio/decode/interleaved_region.h"
#include "planeio/metadata.h"
#include "planeio/parser.h"
#include "planeio/reader.h"
#include "planeio/writer.h"

/**
 * @file pnm.h
 * @brief Portable anymap (PBM, PGM, PPM) parser, reader and writer
 */

namespace planeio::formats::pnm {

inline constexpr std::string_view kFormatName = "PNM";

/// @brief Parse state of a PNM resource
class PnmMetadata : public Metadata {
 public:
  /// @brief Magic digit, 1 to 6
  [[nodiscard]] int GetKind() const noexcept { return kind_; }

  void SetKind(int kind) { kind_ = kind; }

  /// @brief Whether samples are decimal text (P1, P2, P3)
  [[nodiscard]] bool IsAscii() const noexcept { return kind_ <= 3; }

  /// @brief Whether samples are 1-bit (P1, P4)
  [[nodiscard]] bool IsBitmap() const noexcept {
    return kind_ == 1 || kind_ == 4;
  }

  [[nodiscard]] uint32_t GetMaxValue() const noexcept { return max_value_; }

  void SetMaxValue(uint32_t max_value) { max_value_ = max_value; }

  [[nodiscard]] uint64_t GetDataOffset() const noexcept {
    return data_offset_;
  }

  void SetDataOffset(uint64_t offset) { data_offset_ = offset; }

  /// @brief Stored raster of one channel
  [[nodiscard]] decode::InterleavedLayout GetLayout(uint32_t channel) const;

  /// @brief Stream holding the binary raster
  [[nodiscard]] io::BufferedStream* GetDataStream() const noexcept {
    return data_stream_ != nullptr ? data_stream_.get() : GetSource();
  }

  /// @brief Serve the raster from a decoded in-memory copy
  absl::Status ReplaceDataStream(std::unique_ptr<io::BufferedStream> stream);

  absl::Status Close(Context& context) override;

 private:
  int kind_ = 0;
  uint32_t max_value_ = 1;
  uint64_t data_offset_ = 0;
  std::unique_ptr<io::BufferedStream> data_stream_;
};

class PnmParser : public Parser {
 public:
  [[nodiscard]] std::string_view GetFormatName() const override {
    return kFormatName;
  }

 protected:
  absl::Status CheckHeader(io::BufferedStream& stream) override;

  [[nodiscard]] std::unique_ptr<Metadata> CreateMetadata() const override {
    return std::make_unique<PnmMetadata>();
  }

  absl::Status TypedParse(Context& context, io::BufferedStream& stream,
                          Metadata& metadata,
                          const ParserOptions& options) override;
};

/// @brief Reader for P1 to P6
///
/// ASCII rasters are converted once into the equivalent binary raster
/// (P1 to P4 packing, P2/P3 to P5/P6 samples) when the reader opens.
class PnmReader : public Reader {
 public:
  [[nodiscard]] std::string_view GetFormatName() const override {
    return kFormatName;
  }

 protected:
  [[nodiscard]] std::unique_ptr<Parser> CreateParser() const override {
    return std::make_unique<PnmParser>();
  }

  absl::Status OnSetMetadata(Context& context,
                             const ReaderOptions& options) override;

  absl::Status ReadPlaneBytes(const ImageMetadata& image, int64_t plane_index,
                              const PlaneRegion& region,
                              std::span<uint8_t> out) override;
};

/// @brief Writer for P4 (bit), P5 (gray) and P6 (three channels)
class PnmWriter : public Writer {
 public:
  [[nodiscard]] std::vector<PixelType> GetSupportedPixelTypes() const override {
    return {PixelType::kBit, PixelType::kUInt8, PixelType::kUInt16};
  }

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
  decode::InterleavedLayout layout_;
  uint64_t data_bytes_ = 0;
  bool open_ = false;
};

}  // namespace planeio::formats::pnm

#endif  // PLANEIO_INCLUDE_PLANEIO_FORMATS_PNM_PNM_H_
