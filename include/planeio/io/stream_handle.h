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

#ifndef PLANEIO_INCLUDE_PLANEIO_IO_STREAM_HANDLE_H_
#define PLANEIO_INCLUDE_PLANEIO_IO_STREAM_HANDLE_H_

#include <cstdint>
#include <span>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "planeio/io/handle.h"

namespace planeio {
namespace io {

/// @brief Read-only handle over a forward-only source
///
/// Subclasses provide a source that can only be read sequentially from
/// its start (a decompression stream, a network body). Seeking is lazy:
/// the next read skips forward by decoding and discarding bytes, or, when
/// the target lies behind the decoded position, restarts the source and
/// replays it up to the target. Backward seeks therefore cost time
/// proportional to the target offset.
///
/// Errors reported by the source are returned as-is and never turned into
/// a short read.
class StreamHandle : public Handle {
 public:
  ~StreamHandle() override = default;

  absl::StatusOr<int64_t> Length() override;
  absl::Status Seek(int64_t offset) override;
  absl::StatusOr<int64_t> Tell() override;
  absl::StatusOr<size_t> Read(std::span<uint8_t> buffer) override;
  absl::Status Close() override;
  [[nodiscard]] bool IsClosed() const override { return closed_; }

  /// @brief Number of times the source was restarted to serve a read
  [[nodiscard]] int64_t ResetCount() const noexcept { return reset_count_; }

 protected:
  StreamHandle() = default;

  /// @brief Set the decoded length of the source
  void SetStreamLength(int64_t length) { length_ = length; }

  /// @brief Rewind the source to its first byte
  virtual absl::Status ResetStream() = 0;

  /// @brief Read the next bytes of the source
  /// @return Bytes read, 0 once the source is exhausted
  virtual absl::StatusOr<size_t> ReadStream(std::span<uint8_t> buffer) = 0;

  /// @brief Release the source
  virtual absl::Status CloseStream() = 0;

  /// @brief Whether the source cursor still belongs to this handle
  ///
  /// Handles sharing one source override this; a false value forces a
  /// restart before the next read.
  [[nodiscard]] virtual bool OwnsCursor() const { return true; }

 private:
  /// @brief Restart if needed and discard bytes up to position_
  absl::Status AdvanceToPosition();

  int64_t length_ = 0;
  int64_t position_ = 0;
  int64_t stream_position_ = 0;
  int64_t reset_count_ = 0;
  bool closed_ = false;
  std::vector<uint8_t> scratch_;
};

}  // namespace io
}  // namespace planeio

#endif  // PLANEIO_INCLUDE_PLANEIO_IO_STREAM_HANDLE_H_
