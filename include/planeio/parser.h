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

#ifndef PLANEIO_INCLUDE_PLANEIO_PARSER_H_
#define PLANEIO_INCLUDE_PLANEIO_PARSER_H_

#include <memory>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "planeio/io/buffered_stream.h"
#include "planeio/metadata.h"
#include "planeio/options.h"

namespace planeio {

class Context;

/// @brief Turns a resource into Metadata
///
/// Parse() is a two-phase template. The common phase resolves the id
/// (companion files redirect to their header), opens the stream, checks
/// the magic and hands over to the format's TypedParse(). Afterwards it
/// applies the metadata options and validates every series.
///
/// Parsers keep no state between calls; every option arrives as an
/// argument.
///
/// Example usage:
/// @code
/// auto parser = descriptor->create_parser();
/// ParserOptions options;
/// options.original_metadata_populated = false;
/// ASSIGN_OR_RETURN(auto metadata, parser->Parse(context, "cells.ics",
///                                                options));
/// @endcode
class Parser {
 public:
  virtual ~Parser() = default;

  /// @brief Parse a resource
  /// @param context Context resolving ids
  /// @param id Resource id
  /// @param options Metadata options
  /// @return Metadata owning the open source stream
  /// @retval DataLoss (format kind) on malformed content
  /// @retval Internal or NotFound (I/O kind) on backing-store failures
  absl::StatusOr<std::unique_ptr<Metadata>> Parse(
      Context& context, std::string_view id,
      const ParserOptions& options = {});

  /// @brief Name of the format this parser belongs to
  [[nodiscard]] virtual std::string_view GetFormatName() const = 0;

 protected:
  /// @brief Map the requested id to the id holding the metadata
  ///
  /// The default returns the id unchanged.
  virtual absl::StatusOr<std::string> ResolveMetadataId(Context& context,
                                                        std::string_view id);

  /// @brief Verify the magic of a freshly opened stream
  ///
  /// The stream is positioned at 0. Return a format error when the magic
  /// is absent.
  virtual absl::Status CheckHeader(io::BufferedStream& stream) = 0;

  /// @brief Create the format's metadata type
  [[nodiscard]] virtual std::unique_ptr<Metadata> CreateMetadata() const {
    return std::make_unique<Metadata>();
  }

  /// @brief Fill the raw table and derive the series
  virtual absl::Status TypedParse(Context& context, io::BufferedStream& stream,
                                  Metadata& metadata,
                                  const ParserOptions& options) = 0;
};

}  // namespace planeio

#endif  // PLANEIO_INCLUDE_PLANEIO_PARSER_H_
