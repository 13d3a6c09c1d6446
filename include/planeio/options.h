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

#ifndef PLANEIO_INCLUDE_PLANEIO_OPTIONS_H_
#define PLANEIO_INCLUDE_PLANEIO_OPTIONS_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace planeio {

/// @brief Options for buffered streams
///
/// Example usage:
/// @code
/// StreamOptions options;
/// options.buffer_size = 4096;
/// auto stream = context.OpenStream("image.ics", io::OpenMode::kRead, options);
/// @endcode
struct StreamOptions {
  /// @brief Size of the read window in bytes
  ///
  /// Tuning knob only: any value >= 1 yields identical results.
  size_t buffer_size = 256 * 1024;

  /// @brief Hard cap for string searches that save the scanned text
  int64_t max_search_size = int64_t{512} * 1024 * 1024;
};

/// @brief Policy applied to raw key/value tables when filtering is enabled
struct MetadataFilter {
  /// @brief Values longer than this are dropped
  size_t max_value_length = 8192;

  /// @brief Drop entries whose key or value is empty
  bool drop_empty = true;

  /// @brief Remove ASCII control characters from keys and values
  bool strip_control_characters = true;

  /// @brief Keys starting with any of these prefixes are dropped
  std::vector<std::string> excluded_prefixes;
};

/// @brief Options passed to every parse call
///
/// These are pass-through values. Parsers never keep them between calls.
struct ParserOptions {
  /// @brief Retain the raw original-metadata tables
  bool original_metadata_populated = true;

  /// @brief Apply the filter policy to the raw tables
  bool metadata_filtered = false;

  /// @brief Filter policy used when metadata_filtered is set
  MetadataFilter filter;

  /// @brief Options for the source stream
  StreamOptions stream;
};

/// @brief Options for opening a reader
///
/// Example usage:
/// @code
/// ReaderOptions options;
/// options.normalized = true;  // canonical IEEE floats in native order
/// options.parser.original_metadata_populated = false;
///
/// auto reader = context.OpenReader("stack.ics", options);
/// @endcode
struct ReaderOptions {
  /// @brief Convert float/double planes to canonical native-order IEEE
  bool normalized = false;

  /// @brief Options forwarded to the parser
  ParserOptions parser;
};

/// @brief Options for opening a writer
struct WriterOptions {
  /// @brief Dimension order of the written data, e.g. "XYZTC"
  ///
  /// Empty keeps the declared order of the metadata.
  std::string output_order;

  /// @brief Options for the destination stream
  StreamOptions stream;
};

}  // namespace planeio

#endif  // PLANEIO_INCLUDE_PLANEIO_OPTIONS_H_
