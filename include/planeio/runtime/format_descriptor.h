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

#ifndef PLANEIO_INCLUDE_PLANEIO_RUNTIME_FORMAT_DESCRIPTOR_H_
#define PLANEIO_INCLUDE_PLANEIO_RUNTIME_FORMAT_DESCRIPTOR_H_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/statusor.h"

/**
 * @file format_descriptor.h
 * @brief Format descriptors: data plus a function table
 *
 * A format is described by plain data (name, suffixes, probe rules,
 * capabilities) and factories for its parser, reader and writer.
 * Container formats add an unwrap function that exposes their content as
 * new ids in the context.
 */

namespace planeio {

// Forward declarations
class Context;
class Parser;
class Reader;
class Writer;

namespace runtime {

/// @brief Format capability flags
enum class FormatCapability : uint32_t {
  kRead = 1 << 0,          ///< Format has a reader
  kWrite = 1 << 1,         ///< Format has a writer
  kContainer = 1 << 2,     ///< Format wraps another format
  kCompressed = 1 << 3,    ///< Format content may be compressed
  kIndexedColor = 1 << 4,  ///< Format may carry a color table
};

/// @brief Capability flags container
using CapabilityFlags = uint32_t;

/// @brief Check if capability is set
inline bool HasCapability(CapabilityFlags flags, FormatCapability cap) {
  return (flags & static_cast<uint32_t>(cap)) != 0;
}

/// @brief Set a capability flag
inline CapabilityFlags SetCapability(CapabilityFlags flags,
                                     FormatCapability cap) {
  return flags | static_cast<uint32_t>(cap);
}

/// @brief Result of unwrapping a container
struct UnwrapResult {
  /// @brief Id of the wrapped resource to parse
  std::string inner_id;

  /// @brief Every id mapped into the context; the caller unmaps them
  std::vector<std::string> mapped_ids;
};

/// @brief Lower-cased suffix of an id without the dot
///
/// Only the last path component counts; '/' and '!' separate components.
/// Returns an empty string when the component has no dot.
std::string GetSuffix(std::string_view id);

/// @brief Format descriptor
///
/// Describes a format: how to recognise it and how to create its parser,
/// reader and writer.
///
/// Recognition rules, applied in order:
/// 1. a matching suffix accepts when suffix_sufficient is set;
/// 2. a missing suffix rejects when suffix_necessary is set;
/// 3. otherwise the probe decides, or the suffix when there is no probe.
struct FormatDescriptor {
  /// @brief Human-readable format name (e.g., "ICS", "GZip")
  std::string format_name;

  /// @brief Lower-case suffixes without the dot (e.g., {"ics", "ids"})
  std::vector<std::string> suffixes;

  /// @brief Reject resources without a listed suffix
  bool suffix_necessary = false;

  /// @brief Accept resources with a listed suffix without probing
  bool suffix_sufficient = false;

  /// @brief Number of leading bytes the probe needs
  size_t probe_length = 0;

  /// @brief Magic-byte check over the leading bytes of a resource
  ///
  /// Receives up to probe_length bytes (fewer for short resources).
  std::function<bool(std::span<const uint8_t> prefix)> probe;

  /// @brief Container hook mapping the wrapped content into the context
  std::function<absl::StatusOr<UnwrapResult>(Context& context,
                                             std::string_view id)>
      unwrap;

  std::function<std::unique_ptr<Parser>()> create_parser;
  std::function<std::unique_ptr<Reader>()> create_reader;
  std::function<std::unique_ptr<Writer>()> create_writer;

  /// @brief Format capabilities
  CapabilityFlags capabilities = 0;

  /// @brief Higher priorities are checked first
  int priority = 0;

  /// @brief Check if the id carries one of the suffixes
  [[nodiscard]] bool HasSuffix(std::string_view id) const;

  /// @brief Apply the recognition rules
  /// @param id Resource id
  /// @param prefix Leading bytes of the resource
  [[nodiscard]] bool Matches(std::string_view id,
                             std::span<const uint8_t> prefix) const;

  [[nodiscard]] bool IsContainer() const { return static_cast<bool>(unwrap); }

  /// @brief Check if format has a specific capability
  [[nodiscard]] bool HasCapability(FormatCapability capability) const {
    return runtime::HasCapability(capabilities, capability);
  }
};

}  // namespace runtime

// Import runtime types into planeio namespace
using runtime::CapabilityFlags;
using runtime::FormatCapability;
using runtime::FormatDescriptor;
using runtime::GetSuffix;
using runtime::HasCapability;
using runtime::UnwrapResult;

}  // namespace planeio

#endif  // PLANEIO_INCLUDE_PLANEIO_RUNTIME_FORMAT_DESCRIPTOR_H_
