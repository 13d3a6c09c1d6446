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

#ifndef PLANEIO_INCLUDE_PLANEIO_RUNTIME_FORMAT_REGISTRY_H_
#define PLANEIO_INCLUDE_PLANEIO_RUNTIME_FORMAT_REGISTRY_H_

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "planeio/runtime/format_descriptor.h"

/**
 * @file format_registry.h
 * @brief Ordered format registry and recursive identification
 */

namespace planeio {

class Context;

namespace runtime {

/// @brief Outcome of identifying a resource
struct FormatIdentity {
  /// @brief Format matching the resource itself
  std::shared_ptr<const FormatDescriptor> format;

  /// @brief Innermost non-container format (equals format when the
  /// resource is not a container)
  std::shared_ptr<const FormatDescriptor> inner;

  /// @brief Format names from the outside in, e.g. {"GZip", "ICS"}
  std::vector<std::string> chain;

  /// @brief Id of the innermost resource
  std::string inner_id;
};

/// @brief Registry of format descriptors
///
/// Descriptors are kept sorted by descending priority; equal priorities
/// keep registration order. The registry is populated once (see
/// RegisterBuiltinFormats) and read-only afterwards, so a Context shares
/// it as `std::shared_ptr<const FormatRegistry>`.
///
/// Example usage:
/// @code
/// auto registry = std::make_shared<FormatRegistry>();
/// RegisterBuiltinFormats(*registry);
/// Context context(registry);
///
/// ASSIGN_OR_RETURN(auto identity, context.Identify("stack.ics.gz"));
/// // identity.chain == {"GZip", "ICS"}
/// @endcode
class FormatRegistry {
 public:
  /// @brief Deepest container nesting Identify follows
  static constexpr int kMaxContainerDepth = 8;

  FormatRegistry() = default;
  ~FormatRegistry() = default;

  FormatRegistry(const FormatRegistry&) = delete;
  FormatRegistry& operator=(const FormatRegistry&) = delete;

  /// @brief Register a format descriptor
  /// @note Thread-safe. A format with the same name is replaced.
  void RegisterFormat(FormatDescriptor descriptor);

  /// @brief Register multiple format descriptors
  void RegisterFormats(std::vector<FormatDescriptor> descriptors);

  /// @brief Find a format by name (case-insensitive)
  /// @return Descriptor or nullptr
  [[nodiscard]] std::shared_ptr<const FormatDescriptor> GetFormat(
      std::string_view format_name) const;

  /// @brief First format, in priority order, listing the id's suffix
  [[nodiscard]] std::shared_ptr<const FormatDescriptor> GetFormatForSuffix(
      std::string_view id) const;

  /// @brief First format with a writer listing the id's suffix
  [[nodiscard]] std::shared_ptr<const FormatDescriptor> GetWriterFormat(
      std::string_view id) const;

  /// @brief Format names in priority order
  [[nodiscard]] std::vector<std::string> ListFormats() const;

  /// @brief Names of formats supporting a capability, in priority order
  [[nodiscard]] std::vector<std::string> ListFormatsByCapability(
      FormatCapability capability) const;

  /// @brief Largest probe length of any registered format
  [[nodiscard]] size_t GetMaxProbeLength() const;

  /// @brief First format, in priority order, accepting the resource
  ///
  /// Reads one bounded prefix of the resource. Does not unwrap containers.
  ///
  /// @retval Unimplemented (unsupported-format kind) if nothing matches
  absl::StatusOr<std::shared_ptr<const FormatDescriptor>> Match(
      Context& context, std::string_view id) const;

  /// @brief Identify a resource, recursing through containers
  ///
  /// Ids mapped while unwrapping are released before returning.
  ///
  /// @retval Unimplemented (unsupported-format kind) if nothing matches
  /// @retval DataLoss (format kind) if containers nest too deeply
  absl::StatusOr<FormatIdentity> Identify(Context& context,
                                          std::string_view id) const;

  /// @brief Clear all registered formats
  void Clear();

 private:
  absl::StatusOr<FormatIdentity> IdentifyAtDepth(Context& context,
                                                 std::string_view id,
                                                 int depth) const;

  /// @brief Snapshot of the ordered descriptors
  std::vector<std::shared_ptr<const FormatDescriptor>> Snapshot() const;

  std::vector<std::shared_ptr<const FormatDescriptor>> formats_;

  /// @brief Mutex for thread-safe access
  mutable absl::Mutex mutex_;
};

}  // namespace runtime

using runtime::FormatIdentity;
using runtime::FormatRegistry;

}  // namespace planeio

#endif  // PLANEIO_INCLUDE_PLANEIO_RUNTIME_FORMAT_REGISTRY_H_
