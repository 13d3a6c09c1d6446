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

#ifndef PLANEIO_INCLUDE_PLANEIO_IO_MEMORY_HANDLE_H_
#define PLANEIO_INCLUDE_PLANEIO_IO_MEMORY_HANDLE_H_

#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "planeio/io/handle.h"

namespace planeio {
namespace io {

/// @brief Handle over a growable in-memory byte buffer
///
/// The buffer is shared, so several handles (and the Location that mapped
/// it) see the same bytes. Each handle keeps its own cursor.
class MemoryHandle : public Handle {
 public:
  /// @brief Wrap shared storage
  /// @param storage Byte buffer, must not be null
  /// @param writable Whether writes are allowed
  explicit MemoryHandle(std::shared_ptr<std::vector<uint8_t>> storage,
                        bool writable = true)
      : storage_(std::move(storage)), writable_(writable) {}

  /// @brief Create a writable handle owning a copy of bytes
  static std::unique_ptr<MemoryHandle> FromBytes(std::vector<uint8_t> bytes) {
    return std::make_unique<MemoryHandle>(
        std::make_shared<std::vector<uint8_t>>(std::move(bytes)));
  }

  absl::StatusOr<int64_t> Length() override;
  absl::Status Seek(int64_t offset) override;
  absl::StatusOr<int64_t> Tell() override;
  absl::StatusOr<size_t> Read(std::span<uint8_t> buffer) override;
  absl::Status Write(std::span<const uint8_t> data) override;
  absl::Status SetLength(int64_t length) override;
  [[nodiscard]] bool CanWrite() const override { return writable_; }
  absl::Status Close() override;
  [[nodiscard]] bool IsClosed() const override { return closed_; }

  /// @brief Shared storage
  [[nodiscard]] const std::shared_ptr<std::vector<uint8_t>>& GetStorage()
      const noexcept {
    return storage_;
  }

 private:
  std::shared_ptr<std::vector<uint8_t>> storage_;
  bool writable_;
  bool closed_ = false;
  int64_t position_ = 0;
};

}  // namespace io
}  // namespace planeio

#endif  // PLANEIO_INCLUDE_PLANEIO_IO_MEMORY_HANDLE_H_
