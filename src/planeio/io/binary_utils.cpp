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

#include "planeio/io/binary_utils.h"

#include <zlib.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "planeio/status.h"

namespace planeio {
namespace io {

namespace {

constexpr size_t kInflateChunkSize = 256 * 1024;

}  // namespace

absl::StatusOr<std::vector<uint8_t>> ReadAll(Handle& handle) {
  DECLARE_ASSIGN_OR_RETURN_MOVE(int64_t, length, handle.Length(), "");
  std::vector<uint8_t> bytes(static_cast<size_t>(length));
  RETURN_IF_ERROR(handle.Seek(0), "");

  size_t filled = 0;
  while (filled < bytes.size()) {
    DECLARE_ASSIGN_OR_RETURN_MOVE(
        size_t, n,
        handle.Read(std::span<uint8_t>(bytes).subspan(filled)), "");
    if (n == 0) {
      return MAKE_STATUS(
          ErrorKind::kIo,
          absl::StrFormat("Resource ended after %zu of %zu bytes", filled,
                          bytes.size()));
    }
    filled += n;
  }
  return bytes;
}

absl::StatusOr<std::vector<uint8_t>> DecompressZlib(
    std::span<const uint8_t> data, size_t expected_size) {
  constexpr size_t kMaxZlibCount = std::numeric_limits<uInt>::max();

  z_stream strm{};
  // 15 window bits plus 32: detect zlib or gzip headers automatically.
  if (inflateInit2(&strm, 15 + 32) != Z_OK) {
    return MAKE_STATUS(ErrorKind::kIo, "Failed to initialize zlib");
  }

  // Output grows with the inflated data, never ahead of it; once
  // expected_size bytes exist, a one byte sentinel detects any surplus.
  std::vector<uint8_t> decompressed;
  uint8_t sentinel = 0;
  size_t consumed = 0;
  size_t produced = 0;
  int ret = Z_OK;
  while (ret != Z_STREAM_END) {
    if (strm.avail_in == 0 && consumed < data.size()) {
      const size_t count = std::min(data.size() - consumed, kMaxZlibCount);
      strm.next_in = const_cast<uint8_t*>(data.data() + consumed);
      strm.avail_in = static_cast<uInt>(count);
      consumed += count;
    }

    const bool full = produced >= expected_size;
    if (full) {
      strm.next_out = &sentinel;
      strm.avail_out = 1;
    } else {
      const size_t grow = std::min(
          {expected_size - produced, kInflateChunkSize, kMaxZlibCount});
      decompressed.resize(produced + grow);
      strm.next_out = decompressed.data() + produced;
      strm.avail_out = static_cast<uInt>(grow);
    }

    const uInt in_before = strm.avail_in;
    const uInt out_before = strm.avail_out;
    ret = inflate(&strm, Z_NO_FLUSH);
    const size_t written = out_before - strm.avail_out;

    if (full && written > 0) {
      inflateEnd(&strm);
      return MAKE_STATUS(
          ErrorKind::kFormat,
          absl::StrFormat("Zlib stream holds more than the %zu bytes expected",
                          expected_size));
    }
    produced += written;

    if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR) {
      inflateEnd(&strm);
      return MAKE_STATUS(
          ErrorKind::kFormat,
          absl::StrFormat("Zlib decompression failed with error code: %d "
                          "(%zu of %zu bytes produced)",
                          ret, produced, expected_size));
    }
    if (ret != Z_STREAM_END && written == 0 && in_before == strm.avail_in &&
        consumed == data.size()) {
      break;
    }
  }
  inflateEnd(&strm);

  if (ret != Z_STREAM_END) {
    return MAKE_STATUS(
        ErrorKind::kFormat,
        absl::StrFormat("Zlib stream is truncated (%zu of %zu bytes produced)",
                        produced, expected_size));
  }
  if (produced != expected_size) {
    return MAKE_STATUS(
        ErrorKind::kFormat,
        absl::StrFormat("Zlib stream holds %zu bytes, %zu expected", produced,
                        expected_size));
  }

  decompressed.resize(produced);
  return decompressed;
}

}  // namespace io
}  // namespace planeio
