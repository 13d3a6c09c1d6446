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

#include "planeio/io/gzip_handle.h"

#include <zlib.h>

#include <memory>
#include <utility>
#include <vector>

#include "absl/strings/str_format.h"
#include "planeio/status.h"

namespace planeio {
namespace io {

namespace {

constexpr size_t kInputChunkSize = 64 * 1024;

// 15 window bits plus 16: expect a gzip header and trailer.
constexpr int kGzipWindowBits = 15 + 16;

}  // namespace

GzipHandle::GzipHandle(std::unique_ptr<Handle> source)
    : source_(std::move(source)), input_(kInputChunkSize) {}

GzipHandle::~GzipHandle() {
  if (inflate_initialized_) {
    inflateEnd(&stream_);
  }
}

absl::StatusOr<std::unique_ptr<GzipHandle>> GzipHandle::Open(
    std::unique_ptr<Handle> source) {
  std::unique_ptr<GzipHandle> handle(new GzipHandle(std::move(source)));
  RETURN_IF_ERROR(handle->source_->Seek(0), "");
  if (inflateInit2(&handle->stream_, kGzipWindowBits) != Z_OK) {
    return MAKE_STATUS(ErrorKind::kIo, "Failed to initialize zlib");
  }
  handle->inflate_initialized_ = true;

  // One full pass to learn the decoded length.
  std::vector<uint8_t> scratch(kInputChunkSize);
  int64_t length = 0;
  while (true) {
    DECLARE_ASSIGN_OR_RETURN_MOVE(size_t, n, handle->ReadStream(scratch),
                                  "Failed to measure gzip stream");
    if (n == 0) {
      break;
    }
    length += static_cast<int64_t>(n);
  }
  handle->SetStreamLength(length);
  RETURN_IF_ERROR(handle->ResetStream(), "");
  return handle;
}

absl::StatusOr<bool> GzipHandle::FillInput() {
  DECLARE_ASSIGN_OR_RETURN_MOVE(size_t, n, source_->Read(input_),
                                "Failed to read compressed data");
  stream_.next_in = input_.data();
  stream_.avail_in = static_cast<uInt>(n);
  return n > 0;
}

absl::Status GzipHandle::ResetStream() {
  if (inflateReset(&stream_) != Z_OK) {
    return MAKE_STATUS(ErrorKind::kIo, "Failed to reset zlib stream");
  }
  stream_.next_in = nullptr;
  stream_.avail_in = 0;
  finished_ = false;
  RETURN_IF_ERROR(source_->Seek(0), "");
  return absl::OkStatus();
}

absl::StatusOr<size_t> GzipHandle::ReadStream(std::span<uint8_t> buffer) {
  if (finished_ || buffer.empty()) {
    return size_t{0};
  }

  stream_.next_out = buffer.data();
  stream_.avail_out = static_cast<uInt>(buffer.size());

  while (stream_.avail_out > 0) {
    if (stream_.avail_in == 0) {
      DECLARE_ASSIGN_OR_RETURN_MOVE(bool, more, FillInput(), "");
      if (!more) {
        return MAKE_STATUS(ErrorKind::kFormat, "Truncated gzip stream");
      }
    }

    const int ret = inflate(&stream_, Z_NO_FLUSH);
    if (ret == Z_STREAM_END) {
      // Another member may follow.
      if (stream_.avail_in == 0) {
        DECLARE_ASSIGN_OR_RETURN_MOVE(bool, more, FillInput(), "");
        if (!more) {
          finished_ = true;
          break;
        }
      }
      if (inflateReset(&stream_) != Z_OK) {
        return MAKE_STATUS(ErrorKind::kIo, "Failed to reset zlib stream");
      }
      continue;
    }
    if (ret != Z_OK && !(ret == Z_BUF_ERROR && stream_.avail_in == 0)) {
      return MAKE_STATUS(
          ErrorKind::kFormat,
          absl::StrFormat("Gzip decompression failed with error code: %d (%s)",
                          ret, stream_.msg != nullptr ? stream_.msg : "none"));
    }
  }

  return buffer.size() - stream_.avail_out;
}

absl::Status GzipHandle::CloseStream() {
  if (inflate_initialized_) {
    inflateEnd(&stream_);
    inflate_initialized_ = false;
  }
  return source_->Close();
}

}  // namespace io
}  // namespace planeio
