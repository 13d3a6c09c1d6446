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

#ifndef PLANEIO_INCLUDE_PLANEIO_IO_BINARY_UTILS_H_
#define PLANEIO_INCLUDE_PLANEIO_IO_BINARY_UTILS_H_

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "absl/status/statusor.h"
#include "planeio/io/handle.h"

namespace planeio {
namespace io {

/// @brief Read a handle from its start to its end
/// @param handle Source handle (cursor is moved)
/// @return All bytes of the resource
absl::StatusOr<std::vector<uint8_t>> ReadAll(Handle& handle);

/// @brief Decompress zlib or gzip wrapped deflate data
///
/// The wrapper is detected from the stream header. Output is allocated as
/// the stream inflates, so a wrong expected_size costs no memory beyond the
/// actual data.
///
/// @param data Compressed bytes
/// @param expected_size Exact decompressed size
/// @return Decompressed bytes or a format error on corrupt, short or
///         oversized data
absl::StatusOr<std::vector<uint8_t>> DecompressZlib(
    std::span<const uint8_t> data, size_t expected_size);

}  // namespace io
}  // namespace planeio

#endif  // PLANEIO_INCLUDE_PLANEIO_IO_BINARY_UTILS_H_
