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

#include "planeio/io/buffered_stream.h"

#include <algorithm>
#include <cstring>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/str_format.h"
#include "planeio/status.h"

namespace planeio {
namespace io {

BufferedStream::BufferedStream(std::unique_ptr<Handle> handle,
                               const StreamOptions& options)
    : handle_(std::move(handle)),
      options_(options),
      window_(std::max<size_t>(options.buffer_size, 1)) {}

BufferedStream::~BufferedStream() {
  if (!closed_) {
    auto status = Close();
    if (!status.ok()) {
      LOG(ERROR) << "Failed to close stream: " << status.message();
    }
  }
}

absl::StatusOr<std::unique_ptr<BufferedStream>> BufferedStream::Open(
    std::unique_ptr<Handle> handle, const StreamOptions& options) {
  if (handle == nullptr) {
    return MAKE_STATUS(ErrorKind::kInvalidArgument, "Stream handle is null");
  }
  std::unique_ptr<BufferedStream> stream(
      new BufferedStream(std::move(handle), options));
  ASSIGN_OR_RETURN(stream->physical_length_, stream->handle_->Length(),
                   "Failed to query resource length");
  return stream;
}

absl::Status BufferedStream::CheckOpen() const {
  if (closed_) {
    return MAKE_STATUS(ErrorKind::kClosed, "Stream is closed");
  }
  return absl::OkStatus();
}

absl::StatusOr<int64_t> BufferedStream::Length() const {
  RETURN_IF_ERROR(CheckOpen(), "");
  if (length_override_.has_value()) {
    return *length_override_;
  }
  ASSIGN_OR_RETURN(physical_length_, handle_->Length(),
                   "Failed to query resource length");
  return physical_length_;
}

absl::StatusOr<int64_t> BufferedStream::LengthFor(int64_t end) const {
  RETURN_IF_ERROR(CheckOpen(), "");
  if (length_override_.has_value()) {
    return *length_override_;
  }
  if (end > physical_length_) {
    return Length();
  }
  return physical_length_;
}

absl::Status BufferedStream::Seek(int64_t pos) {
  RETURN_IF_ERROR(CheckOpen(), "");
  if (pos < 0) {
    return MAKE_STATUS(ErrorKind::kBounds,
                       absl::StrFormat("Negative seek offset %d", pos));
  }
  pointer_ = pos;
  return absl::OkStatus();
}

absl::StatusOr<int64_t> BufferedStream::SkipBytes(int64_t n) {
  DECLARE_ASSIGN_OR_RETURN_MOVE(int64_t, length, Length(), "");
  if (n <= 0 || pointer_ >= length) {
    return int64_t{0};
  }
  const int64_t skipped = std::min(n, length - pointer_);
  pointer_ += skipped;
  return skipped;
}

absl::Status BufferedStream::SetLength(int64_t length) {
  RETURN_IF_ERROR(CheckOpen(), "");
  if (length < 0) {
    length_override_.reset();
    return absl::OkStatus();
  }
  ASSIGN_OR_RETURN(physical_length_, handle_->Length(),
                   "Failed to query resource length");
  if (length < physical_length_) {
    length_override_ = length;
    return absl::OkStatus();
  }
  length_override_.reset();
  if (handle_->CanWrite()) {
    RETURN_IF_ERROR(handle_->SetLength(length), "Failed to extend resource");
    physical_length_ = length;
  }
  return absl::OkStatus();
}

absl::Status BufferedStream::Refill(int64_t offset) {
  RETURN_IF_ERROR(handle_->Seek(offset), "");
  size_t filled = 0;
  // Short reads are retried; a handle error is returned immediately.
  while (filled < window_.size()) {
    DECLARE_ASSIGN_OR_RETURN_MOVE(
        size_t, n, handle_->Read(std::span<uint8_t>(window_).subspan(filled)),
        "Failed to fill stream buffer");
    if (n == 0) {
      break;
    }
    filled += n;
  }
  window_start_ = offset;
  window_size_ = filled;
  return absl::OkStatus();
}

absl::StatusOr<size_t> BufferedStream::Read(std::span<uint8_t> buffer) {
  DECLARE_ASSIGN_OR_RETURN_MOVE(
      int64_t, length,
      LengthFor(pointer_ + static_cast<int64_t>(buffer.size())), "");
  if (pointer_ >= length || buffer.empty()) {
    return size_t{0};
  }
  const size_t wanted =
      static_cast<size_t>(std::min<int64_t>(buffer.size(), length - pointer_));

  size_t copied = 0;
  while (copied < wanted) {
    const int64_t window_end =
        window_start_ + static_cast<int64_t>(window_size_);
    if (pointer_ < window_start_ || pointer_ >= window_end) {
      RETURN_IF_ERROR(Refill(pointer_), "");
      if (window_size_ == 0) {
        break;
      }
      continue;
    }
    const size_t offset = static_cast<size_t>(pointer_ - window_start_);
    const size_t n = std::min(window_size_ - offset, wanted - copied);
    std::memcpy(buffer.data() + copied, window_.data() + offset, n);
    copied += n;
    pointer_ += static_cast<int64_t>(n);
  }
  return copied;
}

absl::Status BufferedStream::ReadFully(std::span<uint8_t> buffer) {
  const int64_t start = pointer_;
  DECLARE_ASSIGN_OR_RETURN_MOVE(size_t, n, Read(buffer), "");
  if (n < buffer.size()) {
    return MAKE_STATUS(
        ErrorKind::kEndOfFile,
        absl::StrFormat("Read of %zu bytes at offset %d hit end of stream "
                        "after %zu bytes",
                        buffer.size(), start, n));
  }
  return absl::OkStatus();
}

absl::StatusOr<std::vector<uint8_t>> BufferedStream::ReadBytes(size_t n) {
  std::vector<uint8_t> bytes(n);
  RETURN_IF_ERROR(ReadFully(bytes), "");
  return bytes;
}

absl::StatusOr<bool> BufferedStream::ReadBoolean() {
  DECLARE_ASSIGN_OR_RETURN_MOVE(uint8_t, value, ReadUInt8(), "");
  return value != 0;
}

absl::StatusOr<char16_t> BufferedStream::ReadChar() {
  DECLARE_ASSIGN_OR_RETURN_MOVE(uint16_t, value, ReadUInt16(), "");
  return static_cast<char16_t>(value);
}

absl::StatusOr<std::string> BufferedStream::ReadString(size_t n) {
  std::string text(n, '\0');
  RETURN_IF_ERROR(
      ReadFully(std::span<uint8_t>(reinterpret_cast<uint8_t*>(text.data()), n)),
      "");
  return text;
}

absl::StatusOr<std::string> BufferedStream::ReadStringUntil(
    std::string_view last_chars) {
  DECLARE_ASSIGN_OR_RETURN_MOVE(int64_t, length, Length(), "");
  std::string text;
  while (pointer_ < length) {
    const int64_t window_end =
        window_start_ + static_cast<int64_t>(window_size_);
    if (pointer_ < window_start_ || pointer_ >= window_end) {
      RETURN_IF_ERROR(Refill(pointer_), "");
      if (window_size_ == 0) {
        break;
      }
      continue;
    }
    const size_t offset = static_cast<size_t>(pointer_ - window_start_);
    const size_t available = static_cast<size_t>(std::min<int64_t>(
        static_cast<int64_t>(window_size_ - offset), length - pointer_));
    const auto* begin = reinterpret_cast<const char*>(window_.data()) + offset;
    const std::string_view chunk(begin, available);
    const size_t hit = chunk.find_first_of(last_chars);
    const size_t taken = hit == std::string_view::npos ? available : hit + 1;
    text.append(chunk.substr(0, taken));
    pointer_ += static_cast<int64_t>(taken);
    if (hit != std::string_view::npos) {
      break;
    }
  }
  return text;
}

absl::StatusOr<std::string> BufferedStream::ReadCString() {
  DECLARE_ASSIGN_OR_RETURN_MOVE(int64_t, length, LengthFor(pointer_ + 1), "");
  if (pointer_ >= length) {
    return MAKE_STATUS(ErrorKind::kEndOfFile,
                       "No string to read at end of stream");
  }
  DECLARE_ASSIGN_OR_RETURN_MOVE(
      std::string, text, ReadStringUntil(std::string_view("\0", 1)), "");
  if (!text.empty() && text.back() == '\0') {
    text.pop_back();
  }
  return text;
}

absl::StatusOr<std::string> BufferedStream::ReadLine() {
  DECLARE_ASSIGN_OR_RETURN_MOVE(int64_t, length, LengthFor(pointer_ + 1), "");
  if (pointer_ >= length) {
    return MAKE_STATUS(ErrorKind::kEndOfFile,
                       "No line to read at end of stream");
  }
  DECLARE_ASSIGN_OR_RETURN_MOVE(std::string, line, ReadStringUntil("\n"), "");
  if (!line.empty() && line.back() == '\n') {
    line.pop_back();
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return line;
}

absl::StatusOr<std::string> BufferedStream::FindString(
    bool save, size_t block_size,
    std::span<const std::string_view> terminators) {
  DECLARE_ASSIGN_OR_RETURN_MOVE(int64_t, length, Length(), "");
  if (block_size == 0) {
    return MAKE_STATUS(ErrorKind::kInvalidArgument,
                       "Search block size must be positive");
  }

  const int64_t start = pointer_;
  int64_t max_len = std::max<int64_t>(length - start, 0);
  const bool too_long = save && max_len > options_.max_search_size;
  if (too_long) {
    max_len = options_.max_search_size;
  }

  size_t max_term_len = 0;
  for (std::string_view term : terminators) {
    max_term_len = std::max(max_term_len, term.size());
  }

  std::string out;
  std::vector<uint8_t> block(block_size);
  int64_t bytes_dropped = 0;
  int64_t loc = 0;
  while (loc < max_len) {
    // Without save only the tail that may still hold a partial match is kept.
    if (!save && max_term_len > 0 && out.size() >= max_term_len) {
      const size_t drop = out.size() - max_term_len + 1;
      out.erase(0, drop);
      bytes_dropped += static_cast<int64_t>(drop);
    }

    const size_t want =
        static_cast<size_t>(std::min<int64_t>(block_size, max_len - loc));
    DECLARE_ASSIGN_OR_RETURN_MOVE(
        size_t, n, Read(std::span<uint8_t>(block.data(), want)), "");
    if (n == 0) {
      break;
    }
    out.append(reinterpret_cast<const char*>(block.data()), n);

    // Smallest match wins; search only where a new match can start.
    size_t best = std::string::npos;
    size_t best_len = 0;
    for (std::string_view term : terminators) {
      const int64_t from = loc - bytes_dropped - static_cast<int64_t>(term.size());
      const size_t pos =
          out.find(term, from < 0 ? 0 : static_cast<size_t>(from));
      if (pos != std::string::npos && pos < best) {
        best = pos;
        best_len = term.size();
      }
    }
    if (best != std::string::npos) {
      pointer_ = start + bytes_dropped + static_cast<int64_t>(best + best_len);
      if (!save) {
        return std::string();
      }
      out.resize(best + best_len);
      return out;
    }
    loc += static_cast<int64_t>(n);
  }

  if (too_long) {
    return MAKE_STATUS(
        ErrorKind::kResourceExhausted,
        absl::StrFormat("Maximum search length of %d bytes reached",
                        options_.max_search_size));
  }
  return save ? out : std::string();
}

bool BufferedStream::CanWrite() const {
  return !closed_ && handle_->CanWrite();
}

absl::Status BufferedStream::Write(std::span<const uint8_t> data) {
  RETURN_IF_ERROR(CheckOpen(), "");
  if (!handle_->CanWrite()) {
    return MAKE_STATUS(ErrorKind::kIo, "Stream is read-only");
  }
  if (data.empty()) {
    return absl::OkStatus();
  }
  RETURN_IF_ERROR(handle_->Seek(pointer_), "");
  RETURN_IF_ERROR(handle_->Write(data), "Failed to write stream data");
  window_size_ = 0;
  pointer_ += static_cast<int64_t>(data.size());
  physical_length_ = std::max(physical_length_, pointer_);
  if (length_override_.has_value() && pointer_ > *length_override_) {
    if (pointer_ >= physical_length_) {
      length_override_.reset();
    } else {
      length_override_ = pointer_;
    }
  }
  return absl::OkStatus();
}

absl::Status BufferedStream::WriteChars(std::string_view s) {
  std::vector<uint8_t> bytes(s.size() * 2);
  for (size_t i = 0; i < s.size(); ++i) {
    StoreValue<uint16_t>(static_cast<uint8_t>(s[i]), bytes.data() + i * 2,
                         little_endian_);
  }
  return Write(bytes);
}

absl::Status BufferedStream::WriteBytes(std::string_view s) {
  return Write(std::span<const uint8_t>(
      reinterpret_cast<const uint8_t*>(s.data()), s.size()));
}

void BufferedStream::Mark(int64_t read_limit) {
  mark_ = pointer_;
  mark_limit_ = read_limit;
}

absl::Status BufferedStream::Reset() {
  RETURN_IF_ERROR(CheckOpen(), "");
  if (!mark_.has_value()) {
    return MAKE_STATUS(ErrorKind::kIo, "Reset without mark");
  }
  if (pointer_ - *mark_ > mark_limit_) {
    return MAKE_STATUS(
        ErrorKind::kIo,
        absl::StrFormat("Mark invalidated: %d bytes read past a limit of %d",
                        pointer_ - *mark_, mark_limit_));
  }
  pointer_ = *mark_;
  return absl::OkStatus();
}

absl::Status BufferedStream::Close() {
  if (closed_) {
    return absl::OkStatus();
  }
  closed_ = true;
  window_.clear();
  window_.shrink_to_fit();
  window_size_ = 0;
  return handle_->Close();
}

}  // namespace io
}  // namespace planeio
