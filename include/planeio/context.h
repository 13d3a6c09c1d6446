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

#ifndef PLANEIO_INCLUDE_PLANEIO_CONTEXT_H_
#define PLANEIO_INCLUDE_PLANEIO_CONTEXT_H_

#include <memory>
#include <string_view>

#include "absl/status/statusor.h"
#include "planeio/io/buffered_stream.h"
#include "planeio/io/handle.h"
#include "planeio/io/location.h"
#include "planeio/metadata.h"
#include "planeio/options.h"
#include "planeio/reader.h"
#include "planeio/runtime/format_registry.h"
#include "planeio/writer.h"

namespace planeio {

/// @brief Entry point tying a format registry to an id namespace
///
/// The context resolves ids to byte sources (in-memory mappings first, then
/// the file system) and identifies formats through its registry. Readers and
/// writers opened from a context keep a pointer to it, so it must outlive
/// them.
///
/// Example usage:
/// @code
/// Context context;
/// context.GetLocation().MapBytes("memory.pgm", pgm_bytes);
/// DECLARE_ASSIGN_OR_RETURN_MOVE(std::unique_ptr<Reader>, reader,
///                               context.OpenReader("memory.pgm"));
/// @endcode
class Context {
 public:
  /// @brief Create a context over the built-in formats
  Context();

  /// @brief Create a context over a custom registry
  explicit Context(std::shared_ptr<const FormatRegistry> registry);

  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;

  [[nodiscard]] const FormatRegistry& GetRegistry() const noexcept {
    return *registry_;
  }

  [[nodiscard]] io::Location& GetLocation() noexcept { return location_; }

  /// @brief Open a buffered stream over an id
  absl::StatusOr<std::unique_ptr<io::BufferedStream>> OpenStream(
      std::string_view id, io::OpenMode mode = io::OpenMode::kRead,
      const StreamOptions& options = {});

  /// @brief Identify an id, recursing through containers
  absl::StatusOr<FormatIdentity> Identify(std::string_view id);

  /// @brief Identify an id and open a reader on it
  /// @retval Unimplemented (unsupported-format kind) when no reader exists
  absl::StatusOr<std::unique_ptr<Reader>> OpenReader(
      std::string_view id, const ReaderOptions& options = {});

  /// @brief Open a writer chosen by the id's suffix
  /// @retval Unimplemented (unsupported-format kind) when no writer exists
  absl::StatusOr<std::unique_ptr<Writer>> OpenWriter(
      std::string_view id, const Metadata& metadata,
      const WriterOptions& options = {});

 private:
  std::shared_ptr<const FormatRegistry> registry_;
  io::Location location_;
};

}  // namespace planeio

#endif  // PLANEIO_INCLUDE_PLANEIO_CONTEXT_H_
