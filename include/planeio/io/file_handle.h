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

#ifndef PLANEIO_INCLUDE_PLANEIO_IO_FILE_HANDLE_H_
#define PLANEIO_INCLUDE_PLANEIO_IO_FILE_HANDLE_H_

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "planeio/io/handle.h"

namespace fs = std::filesystem;

namespace planeio {
namespace io {

/// @brief Handle over a local file
///
/// RAII wrapper for FILE* with direct random access. Every read and write
/// seeks to the tracked cursor first, so switching between reading and
/// writing needs no extra flushes. Gaps created by writing past the end
/// read back as zeros.
///
/// Example usage:
/// ```cpp
/// DECLARE_ASSIGN_OR_RETURN_MOVE(std::unique_ptr<FileHandle>, handle,
///                               FileHandle::Open(path, OpenMode::kRead));
/// ASSIGN_OR_RETURN(int64_t size, handle->Length());
/// ```
class FileHandle : public Handle {
 public:
  /// @brief Open a file
  /// @param path Path to file
  /// @param mode Open mode
  /// @return Handle or error
  /// @retval NotFound (IO kind) if the file cannot be opened
  static absl::StatusOr<std::unique_ptr<FileHandle>> Open(const fs::path& path,
                                                          OpenMode mode);

  ~FileHandle() override = default;

  absl::StatusOr<int64_t> Length() override;
  absl::Status Seek(int64_t offset) override;
  absl::StatusOr<int64_t> Tell() override;
  absl::StatusOr<size_t> Read(std::span<uint8_t> buffer) override;
  absl::Status Write(std::span<const uint8_t> data) override;
  absl::Status SetLength(int64_t length) override;
  [[nodiscard]] bool CanWrite() const override { return writable_; }
  absl::Status Close() override;
  [[nodiscard]] bool IsClosed() const override { return file_ == nullptr; }

  /// @brief Path the handle was opened with
  [[nodiscard]] const fs::path& GetPath() const noexcept { return path_; }

 private:
  FileHandle(FILE* file, fs::path path, bool writable)
      : file_(file, fclose), path_(std::move(path)), writable_(writable) {}

  /// @brief Position the FILE cursor at position_
  absl::Status SyncCursor();

  std::unique_ptr<FILE, decltype(&fclose)> file_;
  fs::path path_;
  bool writable_;
  int64_t position_ = 0;
};

}  // namespace io
}  // namespace planeio

#endif  // PLANEIO_INCLUDE_PLANEIO_IO_FILE_HANDLE_H_
