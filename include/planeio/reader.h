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

#ifndef PLANEIO_INCLUDE_PLANEIO_READER_H_
#define PLANEIO_INCLUDE_PLANEIO_READER_H_

#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "planeio/image_metadata.h"
#include "planeio/metadata.h"
#include "planeio/options.h"
#include "planeio/parser.h"
#include "planeio/plane.h"

namespace planeio {

class Context;

/// Largest plane buffer a reader allocates (4 GiB); read bigger planes by
/// region.
inline constexpr uint64_t kMaxPlaneSizeBytes = uint64_t{4} << 30;

/// @brief Materializes planes of one open resource
///
/// A reader owns the Metadata (and with it the source stream) it was
/// given, and reuses both for every plane. The Context passed to
/// SetSource or SetMetadata must outlive the reader.
///
/// Series, plane index and region are validated against the axes; any
/// violation is a bounds error and nothing is ever clamped.
///
/// Example usage:
/// @code
/// ReaderOptions options;
/// options.normalized = true;
/// DECLARE_ASSIGN_OR_RETURN_MOVE(std::unique_ptr<Reader>, reader,
///                               context.OpenReader("stack.ics", options));
///
/// DECLARE_ASSIGN_OR_RETURN_MOVE(Plane, plane,
///                               reader->OpenPlane(0, 3, {0, 0, 64, 64}));
/// DECLARE_ASSIGN_OR_RETURN_MOVE(PixelBuffer, pixels, plane.Decode());
/// RETURN_IF_ERROR(reader->Close());
/// @endcode
class Reader {
 public:
  Reader() = default;
  virtual ~Reader();

  Reader(const Reader&) = delete;
  Reader& operator=(const Reader&) = delete;

  /// @brief Parse a resource and open it
  absl::Status SetSource(Context& context, std::string_view id,
                         const ReaderOptions& options = {});

  /// @brief Open already parsed metadata
  /// @param metadata Metadata produced by this format's parser
  absl::Status SetMetadata(Context& context, std::unique_ptr<Metadata> metadata,
                           const ReaderOptions& options = {});

  /// @brief Metadata of the open resource, nullptr when closed
  [[nodiscard]] const Metadata* GetMetadata() const noexcept {
    return metadata_.get();
  }

  [[nodiscard]] bool IsOpen() const noexcept { return metadata_ != nullptr; }

  /// @brief Read a full plane
  absl::StatusOr<Plane> OpenPlane(int series, int64_t plane_index);

  /// @brief Read a region of a plane
  absl::StatusOr<Plane> OpenPlane(int series, int64_t plane_index,
                                  const PlaneRegion& region);

  /// @brief Read a region into a caller-owned plane, reusing its buffer
  virtual absl::Status OpenPlane(int series, int64_t plane_index,
                                 const PlaneRegion& region, Plane& plane);

  /// @brief Re-encode float planes as native-order canonical IEEE values
  virtual void SetNormalized(bool normalized) { normalized_ = normalized; }

  [[nodiscard]] bool IsNormalized() const noexcept { return normalized_; }

  /// @brief Release the resource; idempotent
  absl::Status Close();

  [[nodiscard]] virtual std::string_view GetFormatName() const = 0;

 protected:
  /// @brief Parser of this reader's format
  [[nodiscard]] virtual std::unique_ptr<Parser> CreateParser() const = 0;

  /// @brief Hook run once metadata is installed
  virtual absl::Status OnSetMetadata(Context& /*context*/,
                                     const ReaderOptions& /*options*/) {
    return absl::OkStatus();
  }

  /// @brief Read the packed bytes of a validated region
  /// @param out Zeroed buffer of image.GetPlaneSizeBytes(w, h) bytes
  virtual absl::Status ReadPlaneBytes(const ImageMetadata& image,
                                      int64_t plane_index,
                                      const PlaneRegion& region,
                                      std::span<uint8_t> out) = 0;

  /// @brief Hook run first on Close(); release format resources here
  virtual absl::Status OnClose() { return absl::OkStatus(); }

  /// @brief Check series, plane index and region
  absl::StatusOr<const ImageMetadata*> CheckPlaneParameters(
      int series, int64_t plane_index, const PlaneRegion& region) const;

  /// @brief Open metadata downcast to the format's type
  template <typename M>
  M* GetMetadataAs() const {
    return dynamic_cast<M*>(metadata_.get());
  }

  /// @brief Source stream of the open metadata
  io::BufferedStream* GetSource() const {
    return metadata_ != nullptr ? metadata_->GetSource() : nullptr;
  }

  [[nodiscard]] Context* GetContext() const noexcept { return context_; }

 private:
  Context* context_ = nullptr;
  std::unique_ptr<Metadata> metadata_;
  bool normalized_ = false;
};

/// @brief Canonicalize float or double plane bytes in place
///
/// Converts samples to native byte order and replaces every NaN by the
/// canonical quiet NaN. Updates plane.little_endian.
void NormalizeFloatPlane(Plane& plane);

}  // namespace planeio

#endif  // PLANEIO_INCLUDE_PLANEIO_READER_H_
