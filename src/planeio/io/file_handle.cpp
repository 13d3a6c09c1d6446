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

#include "planeio/io/file_handle.h"

#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <system_error>

#include "absl/strings/str_format.h"
#include "planeio/status.h"

namespace planeio {
namespace io {

absl::StatusOr<std::unique_ptr<FileHandle>> FileHandle::Open(
    const fs::path& path, OpenMode mode) {
  FILE* file = nullptr;
  switch (mode) {
    case OpenMode::kRead:
      file = fopen(path.string().c_str(), "rb");
      break;
    case OpenMode::kReadWrite:
      file = fopen(path.string().c_str(), "r+b");
      if (file == nullptr && errno == ENOENT) {
        file = fopen(path.string().c_str(), "w+b");
      }
      break;
    case OpenMode::kTruncate:
      file = fopen(path.string().c_str(), "w+b");
      break;
  }
  if (file == nullptr) {
    return MAKE_STATUS_WITH_CODE(
        ErrorKind::kIo, absl::StatusCode::kNotFound,
        absl::StrFormat("Cannot open file: %s (%s)", path.string(),
                        std::strerror(errno)));
  }
  return std::unique_ptr<FileHandle>(
      new FileHandle(file, path, mode != OpenMode::kRead));
}

absl::Status FileHandle::SyncCursor() {
  if (fseeko(file_.get(), static_cast<off_t>(position_), SEEK_SET) != 0) {
    return MAKE_STATUS(
        ErrorKind::kIo,
        absl::StrFormat("Failed to seek to offset %d in %s", position_,
                        path_.string()));
  }
  return absl::OkStatus();
}

absl::StatusOr<int64_t> FileHandle::Length() {
  RETURN_IF_ERROR(CheckOpen(), "");
  if (fseeko(file_.get(), 0, SEEK_END) != 0) {
    return MAKE_STATUS(ErrorKind::kIo, "Failed to seek to end of file");
  }
  const int64_t size = ftello(file_.get());
  if (size < 0) {
    return MAKE_STATUS(ErrorKind::kIo, "Failed to determine file size");
  }
  return size;
}

absl::Status FileHandle::Seek(int64_t offset) {
  RETURN_IF_ERROR(CheckOpen(), "");
  if (offset < 0) {
    return MAKE_STATUS(ErrorKind::kBounds,
                       absl::StrFormat("Negative seek offset %d", offset));
  }
  position_ = offset;
  return absl::OkStatus();
}

absl::StatusOr<int64_t> FileHandle::Tell() {
  RETURN_IF_ERROR(CheckOpen(), "");
  return position_;
}

absl::StatusOr<size_t> FileHandle::Read(std::span<uint8_t> buffer) {
  RETURN_IF_ERROR(CheckOpen(), "");
  if (buffer.empty()) {
    return size_t{0};
  }
  RETURN_IF_ERROR(SyncCursor(), "");
  const size_t n = fread(buffer.data(), 1, buffer.size(), file_.get());
  if (n == 0 && ferror(file_.get()) != 0) {
    clearerr(file_.get());
    return MAKE_STATUS(
        ErrorKind::kIo,
        absl::StrFormat("Failed to read %zu bytes at offset %d from %s",
                        buffer.size(), position_, path_.string()));
  }
  position_ += static_cast<int64_t>(n);
  return n;
}

absl::Status FileHandle::Write(std::span<const uint8_t> data) {
  RETURN_IF_ERROR(CheckOpen(), "");
  if (!writable_) {
    return MAKE_STATUS(ErrorKind::kIo,
                       absl::StrFormat("%s is read-only", path_.string()));
  }
  if (data.empty()) {
    return absl::OkStatus();
  }
  RETURN_IF_ERROR(SyncCursor(), "");
  if (fwrite(data.data(), 1, data.size(), file_.get()) != data.size()) {
    return MAKE_STATUS(
        ErrorKind::kIo,
        absl::StrFormat("Failed to write %zu bytes at offset %d to %s",
                        data.size(), position_, path_.string()));
  }
  position_ += static_cast<int64_t>(data.size());
  return absl::OkStatus();
}

absl::Status FileHandle::SetLength(int64_t length) {
  RETURN_IF_ERROR(CheckOpen(), "");
  if (!writable_) {
    return MAKE_STATUS(ErrorKind::kIo,
                       absl::StrFormat("%s is read-only", path_.string()));
  }
  if (length < 0) {
    return MAKE_STATUS(ErrorKind::kBounds,
                       absl::StrFormat("Negative length %d", length));
  }
  if (fflush(file_.get()) != 0 ||
      ftruncate(fileno(file_.get()), static_cast<off_t>(length)) != 0) {
    return MAKE_STATUS(
        ErrorKind::kIo,
        absl::StrFormat("Failed to set length of %s to %d: %s",
                        path_.string(), length, std::strerror(errno)));
  }
  return absl::OkStatus();
}

absl::Status FileHandle::Close() {
  if (file_ == nullptr) {
    return absl::OkStatus();
  }
  FILE* file = file_.release();
  if (fclose(file) != 0) {
    return MAKE_STATUS(ErrorKind::kIo,
                       absl::StrFormat("Failed to close %s", path_.string()));
  }
  return absl::OkStatus();
}

}  // namespace io
}  // namespace planeio
