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

#include "planeio/io/stream_handle.h"

#include <algorithm>
#include <cstddef>

#include "absl/log/log.h"
#include "absl/strings/str_format.h"
#include "planeio/status.h"

namespace planeio {
namespace io {

namespace {

constexpr size_t kSkipChunkSize = 64 * 1024;

}  // namespace

absl::StatusOr<int64_t> StreamHandle::Length() {
  RETURN_IF_ERROR(CheckOpen(), "");
  return length_;
}

absl::Status StreamHandle::Seek(int64_t offset) {
  RETURN_IF_ERROR(CheckOpen(), "");
  if (offset < 0) {
    return MAKE_STATUS(ErrorKind::kBounds,
                       absl::StrFormat("Negative seek offset %d", offset));
  }
  position_ = offset;
  return absl::OkStatus();
}

absl::StatusOr<int64_t> StreamHandle::Tell() {
  RETURN_IF_ERROR(CheckOpen(), "");
  return position_;
}

absl::Status StreamHandle::AdvanceToPosition() {
  if (!OwnsCursor() || position_ < stream_position_) {
    VLOG(1) << "Restarting stream to reach offset " << position_
            << " (decoded position " << stream_position_ << ")";
    RETURN_IF_ERROR(ResetStream(), "Failed to restart stream");
    stream_position_ = 0;
    ++reset_count_;
  }

  if (stream_position_ < position_ && scratch_.empty()) {
    scratch_.resize(kSkipChunkSize);
  }
  while (stream_position_ < position_) {
    const size_t want = static_cast<size_t>(std::min<int64_t>(
        position_ - stream_position_, static_cast<int64_t>(scratch_.size())));
    DECLARE_ASSIGN_OR_RETURN_MOVE(
        size_t, n, ReadStream(std::span<uint8_t>(scratch_.data(), want)),
        "Failed to skip forward");
    if (n == 0) {
      break;
    }
    stream_position_ += static_cast<int64_t>(n);
  }
  return absl::OkStatus();
}

absl::StatusOr<size_t> StreamHandle::Read(std::span<uint8_t> buffer) {
  RETURN_IF_ERROR(CheckOpen(), "");
  if (buffer.empty() || position_ >= length_) {
    return size_t{0};
  }

  RETURN_IF_ERROR(AdvanceToPosition(), "");
  if (stream_position_ != position_) {
    // Source ended before the target offset.
    return size_t{0};
  }

  const size_t want = static_cast<size_t>(std::min<int64_t>(
      static_cast<int64_t>(buffer.size()), length_ - position_));
  DECLARE_ASSIGN_OR_RETURN_MOVE(size_t, n, ReadStream(buffer.first(want)),
                                "");
  stream_position_ += static_cast<int64_t>(n);
  position_ += static_cast<int64_t>(n);
  return n;
}

absl::Status StreamHandle::Close() {
  if (closed_) {
    return absl::OkStatus();
  }
  closed_ = true;
  scratch_.clear();
  return CloseStream();
}

}  // namespace io
}  // namespace planeio
