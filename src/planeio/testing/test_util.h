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

#ifndef PLANEIO_SRC_PLANEIO_TESTING_TEST_UTIL_H_
#define PLANEIO_SRC_PLANEIO_TESTING_TEST_UTIL_H_

#include <zlib.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "planeio/io/handle.h"
#include "planeio/io/memory_handle.h"
#include "planeio/status.h"

/**
 * @file test_util.h
 * @brief Fixture builders and handle doubles shared by the test suites
 */

namespace planeio::testutil {

/// @brief Bytes 0, 1, ..., n - 1 (mod 256)
inline std::vector<uint8_t> MakeSequence(size_t n) {
  std::vector<uint8_t> bytes(n);
  for (size_t i = 0; i < n; ++i) {
    bytes[i] = static_cast<uint8_t>(i & 0xff);
  }
  return bytes;
}

inline std::vector<uint8_t> ToBytes(std::string_view text) {
  return std::vector<uint8_t>(text.begin(), text.end());
}

/// @brief Deflate with the given zlib window bits (31 for gzip, -15 raw)
inline std::vector<uint8_t> Deflate(std::span<const uint8_t> data,
                                    int window_bits) {
  z_stream stream{};
  if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, window_bits, 8,
                   Z_DEFAULT_STRATEGY) != Z_OK) {
    throw std::runtime_error("deflateInit2 failed");
  }
  std::vector<uint8_t> out(deflateBound(&stream, data.size()) + 32);
  stream.next_in = const_cast<Bytef*>(data.data());
  stream.avail_in = static_cast<uInt>(data.size());
  stream.next_out = out.data();
  stream.avail_out = static_cast<uInt>(out.size());
  const int result = deflate(&stream, Z_FINISH);
  deflateEnd(&stream);
  if (result != Z_STREAM_END) {
    throw std::runtime_error("deflate did not finish");
  }
  out.resize(stream.total_out);
  return out;
}

inline std::vector<uint8_t> GzipBytes(std::span<const uint8_t> data) {
  return Deflate(data, 31);
}

/// @brief One member of a test archive; names ending in '/' are directories
struct ZipMember {
  std::string name;
  std::vector<uint8_t> data;
};

/// @brief Assemble a ZIP archive of deflated members
inline std::vector<uint8_t> ZipBytes(const std::vector<ZipMember>& members) {
  std::vector<uint8_t> out;
  std::vector<uint8_t> central;
  auto put16 = [](std::vector<uint8_t>& v, uint32_t x) {
    v.push_back(static_cast<uint8_t>(x & 0xff));
    v.push_back(static_cast<uint8_t>((x >> 8) & 0xff));
  };
  auto put32 = [&](std::vector<uint8_t>& v, uint32_t x) {
    put16(v, x & 0xffff);
    put16(v, x >> 16);
  };

  for (const auto& member : members) {
    const bool directory = !member.name.empty() && member.name.back() == '/';
    const std::vector<uint8_t> packed =
        directory ? std::vector<uint8_t>{} : Deflate(member.data, -15);
    const uint32_t crc = static_cast<uint32_t>(
        crc32(0L, member.data.data(), static_cast<uInt>(member.data.size())));
    const uint16_t method = directory ? 0 : 8;
    const uint32_t offset = static_cast<uint32_t>(out.size());

    auto header = [&](std::vector<uint8_t>& v, bool is_central) {
      put32(v, is_central ? 0x02014b50 : 0x04034b50);
      if (is_central) {
        put16(v, 20);  // version made by
      }
      put16(v, 20);  // version needed
      put16(v, 0);   // flags
      put16(v, method);
      put16(v, 0);     // time
      put16(v, 0x21);  // date, 1980-01-01
      put32(v, crc);
      put32(v, static_cast<uint32_t>(packed.size()));
      put32(v, static_cast<uint32_t>(member.data.size()));
      put16(v, static_cast<uint32_t>(member.name.size()));
      put16(v, 0);  // extra length
      if (is_central) {
        put16(v, 0);  // comment length
        put16(v, 0);  // disk
        put16(v, 0);  // internal attributes
        put32(v, directory ? 0x10 : 0);
        put32(v, offset);
      }
      v.insert(v.end(), member.name.begin(), member.name.end());
    };

    header(out, false);
    out.insert(out.end(), packed.begin(), packed.end());
    header(central, true);
  }

  const uint32_t central_offset = static_cast<uint32_t>(out.size());
  out.insert(out.end(), central.begin(), central.end());
  put32(out, 0x06054b50);
  put16(out, 0);
  put16(out, 0);
  put16(out, static_cast<uint32_t>(members.size()));
  put16(out, static_cast<uint32_t>(members.size()));
  put32(out, static_cast<uint32_t>(central.size()));
  put32(out, central_offset);
  put16(out, 0);
  return out;
}

/// @brief Handle returning at most chunk_size bytes per read
class ChunkedHandle : public io::Handle {
 public:
  ChunkedHandle(std::unique_ptr<io::Handle> inner, size_t chunk_size)
      : inner_(std::move(inner)), chunk_size_(chunk_size) {}

  absl::StatusOr<int64_t> Length() override { return inner_->Length(); }

  absl::Status Seek(int64_t offset) override { return inner_->Seek(offset); }

  absl::StatusOr<int64_t> Tell() override { return inner_->Tell(); }

  absl::StatusOr<size_t> Read(std::span<uint8_t> buffer) override {
    return inner_->Read(buffer.first(std::min(buffer.size(), chunk_size_)));
  }

  absl::Status Write(std::span<const uint8_t> data) override {
    return inner_->Write(data);
  }

  absl::Status SetLength(int64_t length) override {
    return inner_->SetLength(length);
  }

  [[nodiscard]] bool CanWrite() const override { return inner_->CanWrite(); }

  absl::Status Close() override { return inner_->Close(); }

  [[nodiscard]] bool IsClosed() const override { return inner_->IsClosed(); }

 private:
  std::unique_ptr<io::Handle> inner_;
  size_t chunk_size_;
};

/// @brief Handle whose reads fail once the cursor reaches fail_at
///
/// Reads that start before fail_at are cut short at it.
class FailingHandle : public io::Handle {
 public:
  FailingHandle(std::vector<uint8_t> bytes, int64_t fail_at)
      : inner_(io::MemoryHandle::FromBytes(std::move(bytes))),
        fail_at_(fail_at) {}

  absl::StatusOr<int64_t> Length() override { return inner_->Length(); }

  absl::Status Seek(int64_t offset) override { return inner_->Seek(offset); }

  absl::StatusOr<int64_t> Tell() override { return inner_->Tell(); }

  absl::StatusOr<size_t> Read(std::span<uint8_t> buffer) override {
    DECLARE_ASSIGN_OR_RETURN_MOVE(int64_t, position, inner_->Tell(), "");
    if (position >= fail_at_) {
      return MAKE_STATUS(ErrorKind::kIo, "Injected read failure");
    }
    const auto allowed = static_cast<size_t>(fail_at_ - position);
    return inner_->Read(buffer.first(std::min(buffer.size(), allowed)));
  }

  absl::Status Close() override { return inner_->Close(); }

  [[nodiscard]] bool IsClosed() const override { return inner_->IsClosed(); }

 private:
  std::unique_ptr<io::MemoryHandle> inner_;
  int64_t fail_at_;
};

}  // namespace planeio::testutil

#endif  // PLANEIO_SRC_PLANEIO_TESTING_TEST_UTIL_H_
