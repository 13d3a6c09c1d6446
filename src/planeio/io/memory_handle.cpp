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

#include "planeio/io/memory_handle.h"

#include <algorithm>
#include <cstring>

#include "absl/strings/str_format.h"
#include "planeio/status.h"

namespace planeio {
namespace io {

absl::StatusOr<int64_t> MemoryHandle::Length() {
  RETURN_IF_ERROR(CheckOpen(), "");
  return static_cast<int64_t>(storage_->size());
}

absl::Status MemoryHandle::Seek(int64_t offset) {
  RETURN_IF_ERROR(CheckOpen(), "");
  if (offset < 0) {
    return MAKE_STATUS(ErrorKind::kBounds,
                       absl::StrFormat("Negative seek offset %d", offset));
  }
  position_ = offset;
  return absl::OkStatus();
}

absl::StatusOr<int64_t> MemoryHandle::Tell() {
  RETURN_IF_ERROR(CheckOpen(), "");
  return position_;
}

absl::StatusOr<size_t> MemoryHandle::Read(std::span<uint8_t> buffer) {
  RETURN_IF_ERROR(CheckOpen(), "");
  const auto size = static_cast<int64_t>(storage_->size());
  if (position_ >= size) {
    return size_t{0};
  }
  const size_t n = std::min(buffer.size(), static_cast<size_t>(size - position_));
  std::memcpy(buffer.data(), storage_->data() + position_, n);
  position_ += static_cast<int64_t>(n);
  return n;
}

absl::Status MemoryHandle::Write(std::span<const uint8_t> data) {
  RETURN_IF_ERROR(CheckOpen(), "");
  if (!writable_) {
    return MAKE_STATUS(ErrorKind::kIo, "Memory buffer is read-only");
  }
  if (data.empty()) {
    return absl::OkStatus();
  }
  const size_t end = static_cast<size_t>(position_) + data.size();
  if (end > storage_->size()) {
    storage_->resize(end, 0);
  }
  std::memcpy(storage_->data() + position_, data.data(), data.size());
  position_ = static_cast<int64_t>(end);
  return absl::OkStatus();
}

absl::Status MemoryHandle::SetLength(int64_t length) {
  RETURN_IF_ERROR(CheckOpen(), "");
  if (!writable_) {
    return MAKE_STATUS(ErrorKind::kIo, "Memory buffer is read-only");
  }
  if (length < 0) {
    return MAKE_STATUS(ErrorKind::kBounds,
                       absl::StrFormat("Negative length %d", length));
  }
  storage_->resize(static_cast<size_t>(length), 0);
  return absl::OkStatus();
}

absl::Status MemoryHandle::Close() {
  closed_ = true;
  return absl::OkStatus();
}

}  // namespace io
}  // namespace planeio
