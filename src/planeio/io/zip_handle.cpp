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

#include "planeio/io/zip_handle.h"

#include <mz.h>
#include <mz_strm.h>
#include <mz_strm_mem.h>
#include <mz_zip.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <utility>

#include "absl/log/log.h"
#include "absl/strings/str_format.h"
#include "planeio/io/binary_utils.h"
#include "planeio/status.h"

namespace planeio {
namespace io {

//------------------------------------------------------------------------------
// ZipArchive
//------------------------------------------------------------------------------

absl::StatusOr<std::shared_ptr<ZipArchive>> ZipArchive::Open(
    std::unique_ptr<Handle> source) {
  std::shared_ptr<ZipArchive> archive(new ZipArchive());
  ASSIGN_OR_RETURN(archive->bytes_, ReadAll(*source),
                   "Failed to load zip archive");
  RETURN_IF_ERROR(source->Close(), "");

  if (archive->bytes_.size() >
      static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
    return MAKE_STATUS(ErrorKind::kResourceExhausted,
                       "Zip archive is too large to load");
  }

  archive->mem_stream_ = mz_stream_mem_create();
  if (archive->mem_stream_ == nullptr) {
    return MAKE_STATUS(ErrorKind::kIo, "Failed to create memory stream");
  }
  mz_stream_mem_set_buffer(archive->mem_stream_, archive->bytes_.data(),
                           static_cast<int32_t>(archive->bytes_.size()));
  if (mz_stream_mem_open(archive->mem_stream_, nullptr, MZ_OPEN_MODE_READ) !=
      MZ_OK) {
    return MAKE_STATUS(ErrorKind::kIo, "Failed to open memory stream");
  }

  archive->zip_ = mz_zip_create();
  if (archive->zip_ == nullptr) {
    return MAKE_STATUS(ErrorKind::kIo, "Failed to create zip handle");
  }
  if (mz_zip_open(archive->zip_, archive->mem_stream_, MZ_OPEN_MODE_READ) !=
      MZ_OK) {
    mz_zip_delete(&archive->zip_);
    return MAKE_STATUS(ErrorKind::kFormat, "Failed to open zip archive");
  }

  int32_t err = mz_zip_goto_first_entry(archive->zip_);
  while (err == MZ_OK) {
    mz_zip_file* file_info = nullptr;
    if (mz_zip_entry_get_info(archive->zip_, &file_info) != MZ_OK ||
        file_info == nullptr) {
      return MAKE_STATUS(ErrorKind::kFormat, "Failed to read zip entry info");
    }
    archive->entries_.push_back(ZipEntryInfo{
        .name = file_info->filename != nullptr ? file_info->filename : "",
        .uncompressed_size = file_info->uncompressed_size,
        .disk_offset = file_info->disk_offset,
        .is_directory = mz_zip_entry_is_dir(archive->zip_) == MZ_OK,
    });
    err = mz_zip_goto_next_entry(archive->zip_);
  }
  if (err != MZ_END_OF_LIST) {
    return MAKE_STATUS(
        ErrorKind::kFormat,
        absl::StrFormat("Corrupt zip central directory (error %d)", err));
  }

  return archive;
}

ZipArchive::~ZipArchive() {
  if (zip_ != nullptr) {
    if (entry_open_) {
      mz_zip_entry_close(zip_);
    }
    mz_zip_close(zip_);
    mz_zip_delete(&zip_);
  }
  if (mem_stream_ != nullptr) {
    mz_stream_mem_close(mem_stream_);
    mz_stream_mem_delete(&mem_stream_);
  }
}

const ZipEntryInfo* ZipArchive::FindEntry(std::string_view name) const {
  auto it = std::find_if(
      entries_.begin(), entries_.end(),
      [name](const ZipEntryInfo& entry) { return entry.name == name; });
  return it != entries_.end() ? &*it : nullptr;
}

absl::Status ZipArchive::CloseEntry() {
  if (!entry_open_) {
    return absl::OkStatus();
  }
  entry_open_ = false;
  active_owner_ = nullptr;
  const int32_t err = mz_zip_entry_close(zip_);
  // A partially read entry cannot be CRC-checked; only a complete read
  // may report a mismatch.
  if (err == MZ_CRC_ERROR && !entry_finished_) {
    return absl::OkStatus();
  }
  if (err != MZ_OK) {
    return MAKE_STATUS(
        err == MZ_CRC_ERROR ? ErrorKind::kFormat : ErrorKind::kIo,
        absl::StrFormat("Failed to close zip entry (error %d)", err));
  }
  return absl::OkStatus();
}

absl::Status ZipArchive::OpenEntry(const void* owner,
                                   const ZipEntryInfo& entry) {
  RETURN_IF_ERROR(CloseEntry(), "");
  if (mz_zip_locate_entry(zip_, entry.name.c_str(), 0) != MZ_OK) {
    return MAKE_STATUS(
        ErrorKind::kIo,
        absl::StrFormat("Failed to locate '%s' in zip archive", entry.name));
  }
  if (mz_zip_entry_read_open(zip_, 0, nullptr) != MZ_OK) {
    return MAKE_STATUS(
        ErrorKind::kFormat,
        absl::StrFormat("Failed to open '%s' for reading", entry.name));
  }
  entry_open_ = true;
  entry_finished_ = false;
  active_owner_ = owner;
  return absl::OkStatus();
}

absl::StatusOr<size_t> ZipArchive::ReadEntry(const void* owner,
                                             std::span<uint8_t> buffer) {
  if (!IsActive(owner)) {
    return MAKE_STATUS(ErrorKind::kIo, "Zip entry cursor is not held");
  }
  const auto len = static_cast<int32_t>(std::min<size_t>(
      buffer.size(), static_cast<size_t>(std::numeric_limits<int32_t>::max())));
  const int32_t n = mz_zip_entry_read(zip_, buffer.data(), len);
  if (n < 0) {
    return MAKE_STATUS(ErrorKind::kFormat,
                       absl::StrFormat("Failed to read zip entry (error %d)", n));
  }
  if (n == 0) {
    entry_finished_ = true;
  }
  return static_cast<size_t>(n);
}

absl::Status ZipArchive::Release(const void* owner) {
  if (!IsActive(owner)) {
    return absl::OkStatus();
  }
  return CloseEntry();
}

//------------------------------------------------------------------------------
// ZipHandle
//------------------------------------------------------------------------------

ZipHandle::ZipHandle(std::shared_ptr<ZipArchive> archive, ZipEntryInfo entry)
    : archive_(std::move(archive)), entry_(std::move(entry)) {
  SetStreamLength(entry_.uncompressed_size);
}

ZipHandle::~ZipHandle() {
  auto status = archive_->Release(this);
  if (!status.ok()) {
    LOG(ERROR) << "Failed to release zip entry " << entry_.name << ": "
               << status.message();
  }
}

absl::StatusOr<std::unique_ptr<ZipHandle>> ZipHandle::Open(
    const std::shared_ptr<ZipArchive>& archive, std::string_view entry_name) {
  const ZipEntryInfo* entry = archive->FindEntry(entry_name);
  if (entry == nullptr || entry->is_directory) {
    return MAKE_STATUS_WITH_CODE(
        ErrorKind::kIo, absl::StatusCode::kNotFound,
        absl::StrFormat("No file entry '%s' in zip archive", entry_name));
  }
  std::unique_ptr<ZipHandle> handle(new ZipHandle(archive, *entry));
  RETURN_IF_ERROR(archive->OpenEntry(handle.get(), handle->entry_), "");
  return handle;
}

bool ZipHandle::OwnsCursor() const {
  return archive_->IsActive(this);
}

absl::Status ZipHandle::ResetStream() {
  return archive_->OpenEntry(this, entry_);
}

absl::StatusOr<size_t> ZipHandle::ReadStream(std::span<uint8_t> buffer) {
  return archive_->ReadEntry(this, buffer);
}

absl::Status ZipHandle::CloseStream() {
  return archive_->Release(this);
}

}  // namespace io
}  // namespace planeio
