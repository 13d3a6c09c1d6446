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

#ifndef PLANEIO_INCLUDE_PLANEIO_IO_LOCATION_H_
#define PLANEIO_INCLUDE_PLANEIO_IO_LOCATION_H_

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "planeio/io/handle.h"

namespace planeio {
namespace io {

/// @brief Factory producing a fresh handle for a mapped id
using HandleFactory =
    std::function<absl::StatusOr<std::unique_ptr<Handle>>(OpenMode mode)>;

/// @brief Resolves resource ids to handles
///
/// Ids mapped with MapBytes or MapFactory take precedence. Any other id
/// is treated as a local file path. Mapping operations are thread-safe.
///
/// Mappings are counted: mapping an id again replaces its resource and
/// adds a reference, and Unmap removes the id only when the last
/// reference is dropped. Readers opened on the same container each map
/// and unmap the entries independently.
///
/// Example usage:
/// ```cpp
/// Location location;
/// location.MapBytes("memory.pgm", bytes);
/// auto handle = location.OpenHandle("memory.pgm", OpenMode::kRead);
/// ```
class Location {
 public:
  Location() = default;

  Location(const Location&) = delete;
  Location& operator=(const Location&) = delete;

  /// @brief Map an id to a shared in-memory buffer
  ///
  /// Handles opened for this id share the buffer, so bytes written through
  /// one handle are visible to later readers.
  void MapBytes(std::string id, std::vector<uint8_t> bytes = {});

  /// @brief Map an id to a handle factory
  void MapFactory(std::string id, HandleFactory factory);

  /// @brief Drop one reference to a mapping, removing it at zero
  /// @return True if the id was mapped
  bool Unmap(std::string_view id);

  [[nodiscard]] bool IsMapped(std::string_view id) const;

  /// @brief Copy of the bytes behind a MapBytes id
  /// @retval NotFound (I/O kind) if the id is not mapped to bytes
  absl::StatusOr<std::vector<uint8_t>> GetBytes(std::string_view id) const;

  /// @brief Whether the id is mapped or names an existing local file
  [[nodiscard]] bool Exists(std::string_view id) const;

  /// @brief Open a handle for an id
  /// @retval NotFound (I/O kind) if the resource does not exist
  absl::StatusOr<std::unique_ptr<Handle>> OpenHandle(std::string_view id,
                                                     OpenMode mode) const;

 private:
  using Storage = std::shared_ptr<std::vector<uint8_t>>;
  using Mapping = std::variant<Storage, HandleFactory>;

  struct Entry {
    Mapping mapping;
    int references = 0;
  };

  void Map(std::string id, Mapping mapping);

  mutable absl::Mutex mutex_;
  std::map<std::string, Entry, std::less<>> mappings_;
};

}  // namespace io
}  // namespace planeio

#endif  // PLANEIO_INCLUDE_PLANEIO_IO_LOCATION_H_
