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

#ifndef PLANEIO_INCLUDE_PLANEIO_IO_GZIP_HANDLE_H_
#define PLANEIO_INCLUDE_PLANEIO_IO_GZIP_HANDLE_H_

#include <zlib.h>

#include <cstdint>
#include <memory>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "planeio/io/stream_handle.h"

namespace planeio {
namespace io {

/// @brief Forward-only handle decoding a gzip stream
///
/// Decodes the gzip members of an inner handle with zlib. The decoded
/// length is found by one full decoding pass when the handle is opened.
/// Concatenated members are decoded as one stream.
class GzipHandle : public StreamHandle {
 public:
  /// @brief Open a gzip stream
  /// @param source Compressed resource, owned by the new handle
  /// @return Handle or a format error if the data is not valid gzip
  static absl::StatusOr<std::unique_ptr<GzipHandle>> Open(
      std::unique_ptr<Handle> source);

  ~GzipHandle() override;

 protected:
  absl::Status ResetStream() override;
  absl::StatusOr<size_t> ReadStream(std::span<uint8_t> buffer) override;
  absl::Status CloseStream() override;

 private:
  explicit GzipHandle(std::unique_ptr<Handle> source);

  /// @brief Refill the compressed input buffer
  /// @return False at the end of the compressed source
  absl::StatusOr<bool> FillInput();

  std::unique_ptr<Handle> source_;
  z_stream stream_{};
  bool inflate_initialized_ = false;
  bool finished_ = false;
  std::vector<uint8_t> input_;
};

}  // namespace io
}  // namespace planeio

#endif  // PLANEIO_INCLUDE_PLANEIO_IO_GZIP_HANDLE_H_
