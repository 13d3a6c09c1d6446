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

#ifndef PLANEIO_INCLUDE_PLANEIO_IO_ZIP_HANDLE_H_
#define PLANEIO_INCLUDE_PLANEIO_IO_ZIP_HANDLE_H_

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "planeio/io/handle.h"
#include "planeio/io/stream_handle.h"

namespace planeio {
namespace io {

/// @brief Central-directory entry of a zip archive
struct ZipEntryInfo {
  std::string name;
  int64_t uncompressed_size = 0;
  int64_t disk_offset = 0;  ///< Offset of the local header
  bool is_directory = false;
};

/// @brief Zip archive opened with minizip-ng
///
/// The archive bytes are loaded from a handle once and decoded from
/// memory. Entries are read through one shared decompression cursor; the
/// archive remembers which owner (a ZipHandle) opened the current entry.
/// Not thread-safe: handles sharing an archive must be driven from one
/// thread.
class ZipArchive {
 public:
  /// @brief Load an archive from a handle
  /// @param source Archive resource; closed once loaded
  /// @return Archive or a format error if the central directory is invalid
  static absl::StatusOr<std::shared_ptr<ZipArchive>> Open(
      std::unique_ptr<Handle> source);

  ~ZipArchive();

  ZipArchive(const ZipArchive&) = delete;
  ZipArchive& operator=(const ZipArchive&) = delete;

  /// @brief Entries in central-directory order
  [[nodiscard]] const std::vector<ZipEntryInfo>& GetEntries() const noexcept {
    return entries_;
  }

  /// @brief Find an entry by exact name
  /// @return Entry or nullptr
  [[nodiscard]] const ZipEntryInfo* FindEntry(std::string_view name) const;

  /// @brief Position the shared cursor at the start of an entry
  /// @param owner Identity of the caller taking the cursor
  absl::Status OpenEntry(const void* owner, const ZipEntryInfo& entry);

  /// @brief Read from the entry opened by owner
  absl::StatusOr<size_t> ReadEntry(const void* owner,
                                   std::span<uint8_t> buffer);

  /// @brief Whether owner currently holds the shared cursor
  [[nodiscard]] bool IsActive(const void* owner) const noexcept {
    return entry_open_ && active_owner_ == owner;
  }

  /// @brief Give up the cursor if owner holds it
  absl::Status Release(const void* owner);

 private:
  ZipArchive() = default;

  absl::Status CloseEntry();

  std::vector<uint8_t> bytes_;
  std::vector<ZipEntryInfo> entries_;
  void* mem_stream_ = nullptr;  // mz_stream handle
  void* zip_ = nullptr;         // mz_zip handle
  const void* active_owner_ = nullptr;
  bool entry_open_ = false;
  bool entry_finished_ = false;
};

/// @brief Forward-only handle over one zip entry
///
/// Shares ownership of its archive, so the handle stays readable after the
/// id mapping that produced it is replaced or removed.
class ZipHandle : public StreamHandle {
 public:
  /// @brief Open an entry of an archive
  /// @param archive Enclosing archive
  /// @param entry_name Exact entry name
  /// @return Handle or an I/O error if the entry does not exist
  static absl::StatusOr<std::unique_ptr<ZipHandle>> Open(
      const std::shared_ptr<ZipArchive>& archive, std::string_view entry_name);

  ~ZipHandle() override;

  [[nodiscard]] const ZipEntryInfo& GetEntry() const noexcept {
    return entry_;
  }

 protected:
  absl::Status ResetStream() override;
  absl::StatusOr<size_t> ReadStream(std::span<uint8_t> buffer) override;
  absl::Status CloseStream() override;
  [[nodiscard]] bool OwnsCursor() const override;

 private:
  ZipHandle(std::shared_ptr<ZipArchive> archive, ZipEntryInfo entry);

  std::shared_ptr<ZipArchive> archive_;
  ZipEntryInfo entry_;
};

}  // namespace io
}  // namespace planeio

#endif  // PLANEIO_INCLUDE_PLANEIO_IO_ZIP_HANDLE_H_
