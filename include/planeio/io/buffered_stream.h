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

#ifndef PLANEIO_INCLUDE_PLANEIO_IO_BUFFERED_STREAM_H_
#define PLANEIO_INCLUDE_PLANEIO_IO_BUFFERED_STREAM_H_

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "planeio/io/byte_order.h"
#include "planeio/io/handle.h"
#include "planeio/options.h"
#include "planeio/status.h"

namespace planeio {
namespace io {

/// @brief Seekable, byte-order-aware buffered reader/writer over a Handle
///
/// The stream owns its handle and closes it on Close(). Reads are served
/// from a window of buffered bytes; a read at a file pointer outside the
/// window refills it with one buffer-sized chunk starting at the miss
/// offset. Refill is the only place reads reach the handle.
///
/// Writes go straight to the handle and invalidate the window. Writing at
/// or past the end grows the resource; any gap reads back as zeros.
///
/// Multi-byte primitives are big-endian unless SetOrder(true) was called.
///
/// Example usage:
/// ```cpp
/// DECLARE_ASSIGN_OR_RETURN_MOVE(std::unique_ptr<BufferedStream>, stream,
///                               BufferedStream::Open(std::move(handle)));
/// stream->SetOrder(true);
/// DECLARE_ASSIGN_OR_RETURN_MOVE(uint32_t, magic, stream->ReadUInt32());
/// ```
class BufferedStream {
 public:
  /// @brief Wrap a handle
  /// @param handle Backing resource, owned by the stream
  /// @param options Window size and search cap
  static absl::StatusOr<std::unique_ptr<BufferedStream>> Open(
      std::unique_ptr<Handle> handle, const StreamOptions& options = {});

  ~BufferedStream();

  BufferedStream(const BufferedStream&) = delete;
  BufferedStream& operator=(const BufferedStream&) = delete;

  // -- Byte order --

  /// @brief Select the byte order of multi-byte primitives
  void SetOrder(bool little_endian) noexcept { little_endian_ = little_endian; }

  [[nodiscard]] bool IsLittleEndian() const noexcept { return little_endian_; }

  // -- Position and length --

  /// @brief Logical length (bounded view when SetLength installed one)
  ///
  /// Queried from the handle, so growth of a resource shared with another
  /// stream is seen. Bytes already buffered are not re-read.
  absl::StatusOr<int64_t> Length() const;

  [[nodiscard]] int64_t GetFilePointer() const noexcept { return pointer_; }

  /// @brief Move the file pointer
  /// @param pos New pointer, may be past the end
  /// @retval OutOfRange (bounds kind) if pos is negative
  absl::Status Seek(int64_t pos);

  /// @brief Advance the pointer by up to n bytes without passing the end
  /// @return Number of bytes skipped
  absl::StatusOr<int64_t> SkipBytes(int64_t n);

  /// @brief Change the logical length
  ///
  /// A negative value drops any bounded view. A value below the physical
  /// length installs a bounded view and leaves the resource untouched.
  /// Otherwise the resource is extended when writable, and the view is
  /// dropped when it is not.
  absl::Status SetLength(int64_t length);

  // -- Bulk reads --

  /// @brief Read up to buffer.size() bytes
  /// @return Bytes read, 0 at the logical end
  absl::StatusOr<size_t> Read(std::span<uint8_t> buffer);

  /// @brief Read exactly buffer.size() bytes
  /// @retval OutOfRange (end-of-file kind) on a short read
  absl::Status ReadFully(std::span<uint8_t> buffer);

  /// @brief Read exactly n bytes into a new vector
  absl::StatusOr<std::vector<uint8_t>> ReadBytes(size_t n);

  // -- Primitive reads --

  absl::StatusOr<int8_t> ReadInt8() { return ReadPrimitive<int8_t>(); }
  absl::StatusOr<uint8_t> ReadUInt8() { return ReadPrimitive<uint8_t>(); }
  absl::StatusOr<int16_t> ReadInt16() { return ReadPrimitive<int16_t>(); }
  absl::StatusOr<uint16_t> ReadUInt16() { return ReadPrimitive<uint16_t>(); }
  absl::StatusOr<int32_t> ReadInt32() { return ReadPrimitive<int32_t>(); }
  absl::StatusOr<uint32_t> ReadUInt32() { return ReadPrimitive<uint32_t>(); }
  absl::StatusOr<int64_t> ReadInt64() { return ReadPrimitive<int64_t>(); }
  absl::StatusOr<uint64_t> ReadUInt64() { return ReadPrimitive<uint64_t>(); }
  absl::StatusOr<float> ReadFloat() { return ReadPrimitive<float>(); }
  absl::StatusOr<double> ReadDouble() { return ReadPrimitive<double>(); }

  /// @brief Read one byte, true when nonzero
  absl::StatusOr<bool> ReadBoolean();

  /// @brief Read one two-byte character
  absl::StatusOr<char16_t> ReadChar();

  // -- Strings --

  /// @brief Read n bytes as a string
  absl::StatusOr<std::string> ReadString(size_t n);

  /// @brief Read up to and including the first of any character in
  /// last_chars, or to the end of the stream
  absl::StatusOr<std::string> ReadStringUntil(std::string_view last_chars);

  /// @brief Read a NUL-terminated string; the terminator is consumed
  /// @retval OutOfRange (end-of-file kind) if the pointer is at the end
  absl::StatusOr<std::string> ReadCString();

  /// @brief Read one line without its "\n" or "\r\n" terminator
  /// @retval OutOfRange (end-of-file kind) if the pointer is at the end
  absl::StatusOr<std::string> ReadLine();

  /// @brief Scan forward for the first of several terminators
  ///
  /// Reads in chunks of block_size bytes. On a match the pointer is left
  /// just after the terminator; otherwise it is left at the end of the
  /// stream.
  ///
  /// @param save Whether to collect and return the scanned text
  /// @param block_size Chunk size of the scan
  /// @param terminators Strings to search for
  /// @return Text from the start position through the terminator (or the
  ///         end of the stream), or an empty string when save is false
  /// @retval ResourceExhausted if save is set and the search cap is
  ///         exceeded before a terminator is found
  absl::StatusOr<std::string> FindString(
      bool save, size_t block_size, std::span<const std::string_view> terminators);

  absl::StatusOr<std::string> FindString(
      std::initializer_list<std::string_view> terminators) {
    return FindString(true, kDefaultBlockSize,
                      std::span<const std::string_view>(terminators.begin(),
                                                        terminators.size()));
  }

  // -- Writes --

  /// @brief Whether the handle accepts writes
  [[nodiscard]] bool CanWrite() const;

  /// @brief Write bytes at the pointer and advance it
  absl::Status Write(std::span<const uint8_t> data);

  absl::Status WriteInt8(int8_t v) { return WritePrimitive(v); }
  absl::Status WriteUInt8(uint8_t v) { return WritePrimitive(v); }
  absl::Status WriteInt16(int16_t v) { return WritePrimitive(v); }
  absl::Status WriteUInt16(uint16_t v) { return WritePrimitive(v); }
  absl::Status WriteInt32(int32_t v) { return WritePrimitive(v); }
  absl::Status WriteUInt32(uint32_t v) { return WritePrimitive(v); }
  absl::Status WriteInt64(int64_t v) { return WritePrimitive(v); }
  absl::Status WriteUInt64(uint64_t v) { return WritePrimitive(v); }
  absl::Status WriteFloat(float v) { return WritePrimitive(v); }
  absl::Status WriteDouble(double v) { return WritePrimitive(v); }
  absl::Status WriteBoolean(bool v) {
    return WritePrimitive<uint8_t>(v ? 1 : 0);
  }

  /// @brief Write one two-byte character
  absl::Status WriteChar(char16_t c) {
    return WritePrimitive(static_cast<uint16_t>(c));
  }

  /// @brief Write every byte of s as a two-byte character
  absl::Status WriteChars(std::string_view s);

  /// @brief Write the bytes of s
  absl::Status WriteBytes(std::string_view s);

  // -- Mark / reset --

  /// @brief Remember the pointer
  /// @param read_limit Bytes that may be consumed before Reset() fails
  void Mark(int64_t read_limit);

  /// @brief Return to the marked pointer
  /// @retval Internal (I/O kind) if there is no mark or the limit was passed
  absl::Status Reset();

  // -- Lifetime --

  /// @brief Close the stream and its handle; idempotent
  absl::Status Close();

  [[nodiscard]] bool IsClosed() const noexcept { return closed_; }

  /// @brief Underlying handle
  [[nodiscard]] Handle& GetHandle() noexcept { return *handle_; }

  [[nodiscard]] const StreamOptions& GetOptions() const noexcept {
    return options_;
  }

  static constexpr size_t kDefaultBlockSize = 256;

 private:
  BufferedStream(std::unique_ptr<Handle> handle, const StreamOptions& options);

  absl::Status CheckOpen() const;

  /// Length for a request ending at end; the handle is only asked again
  /// when end lies past the last known length.
  absl::StatusOr<int64_t> LengthFor(int64_t end) const;

  /// @brief Load the window starting at offset
  absl::Status Refill(int64_t offset);

  template <typename T>
  absl::StatusOr<T> ReadPrimitive() {
    uint8_t bytes[sizeof(T)];
    RETURN_IF_ERROR(ReadFully(std::span<uint8_t>(bytes, sizeof(T))), "");
    return LoadValue<T>(bytes, little_endian_);
  }

  template <typename T>
  absl::Status WritePrimitive(T value) {
    uint8_t bytes[sizeof(T)];
    StoreValue<T>(value, bytes, little_endian_);
    return Write(std::span<const uint8_t>(bytes, sizeof(T)));
  }

  std::unique_ptr<Handle> handle_;
  StreamOptions options_;
  std::vector<uint8_t> window_;
  int64_t window_start_ = 0;
  size_t window_size_ = 0;
  int64_t pointer_ = 0;
  // Last length reported by the handle; refreshed when a read reaches it.
  mutable int64_t physical_length_ = 0;
  std::optional<int64_t> length_override_;
  bool little_endian_ = false;
  std::optional<int64_t> mark_;
  int64_t mark_limit_ = 0;
  bool closed_ = false;
};

}  // namespace io
}  // namespace planeio

#endif  // PLANEIO_INCLUDE_PLANEIO_IO_BUFFERED_STREAM_H_
