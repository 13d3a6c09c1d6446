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

#ifndef PLANEIO_INCLUDE_PLANEIO_IO_HANDLE_H_
#define PLANEIO_INCLUDE_PLANEIO_IO_HANDLE_H_

#include <cstddef>
#include <cstdint>
#include <span>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace planeio {
namespace io {

/// @brief How a resource is opened
enum class OpenMode {
  kRead,       ///< Read only, resource must exist
  kReadWrite,  ///< Read and write, created when missing
  kTruncate,   ///< Read and write, existing content discarded
};

/// @brief Byte-addressable backing resource
///
/// A Handle knows nothing about formats. It exposes a cursor, bulk reads
/// that may return fewer bytes than requested (0 at the end of the
/// resource), and optional writes. Writing past the current length grows
/// the resource and zero-fills the gap.
///
/// Once Close() has been called every other operation fails with a
/// closed error. Close() itself is idempotent.
///
/// Handles are not thread-safe.
class Handle {
 public:
  Handle() = default;
  virtual ~Handle() = default;

  Handle(const Handle&) = delete;
  Handle& operator=(const Handle&) = delete;

  /// @brief Current length of the resource in bytes
  virtual absl::StatusOr<int64_t> Length() = 0;

  /// @brief Move the cursor
  /// @param offset Absolute byte offset (>= 0, may be past the end)
  virtual absl::Status Seek(int64_t offset) = 0;

  /// @brief Current cursor position
  virtual absl::StatusOr<int64_t> Tell() = 0;

  /// @brief Read up to buffer.size() bytes at the cursor
  /// @return Number of bytes read, 0 at the end of the resource
  virtual absl::StatusOr<size_t> Read(std::span<uint8_t> buffer) = 0;

  /// @brief Write bytes at the cursor
  ///
  /// The default implementation reports a read-only resource.
  virtual absl::Status Write(std::span<const uint8_t> data);

  /// @brief Truncate or extend the resource
  ///
  /// The default implementation reports a read-only resource.
  virtual absl::Status SetLength(int64_t length);

  /// @brief Whether Write and SetLength are supported
  [[nodiscard]] virtual bool CanWrite() const { return false; }

  /// @brief Release the resource
  virtual absl::Status Close() = 0;

  [[nodiscard]] virtual bool IsClosed() const = 0;

  /// @brief Seek then read
  absl::StatusOr<size_t> ReadAt(int64_t offset, std::span<uint8_t> buffer);

 protected:
  /// @brief Closed error when IsClosed(), OK otherwise
  absl::Status CheckOpen() const;
};

}  // namespace io
}  // namespace planeio

#endif  // PLANEIO_INCLUDE_PLANEIO_IO_HANDLE_H_
