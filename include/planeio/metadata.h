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

#ifndef PLANEIO_INCLUDE_PLANEIO_METADATA_H_
#define PLANEIO_INCLUDE_PLANEIO_METADATA_H_

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "planeio/image_metadata.h"
#include "planeio/io/buffered_stream.h"
#include "planeio/metadata_table.h"
#include "planeio/options.h"

namespace planeio {

class Context;

/// @brief Parsed description of one open resource
///
/// Holds the series list, the raw original-metadata table and the source
/// stream the parser opened. Formats with extra parse state derive from
/// this class; readers recover it with dynamic_cast.
///
/// Ids mapped into the context while parsing (container entries) are
/// recorded here and released by Close().
class Metadata {
 public:
  Metadata() = default;
  virtual ~Metadata() = default;

  Metadata(const Metadata&) = delete;
  Metadata& operator=(const Metadata&) = delete;

  /// @brief Name of the format that produced this metadata
  [[nodiscard]] const std::string& GetFormatName() const noexcept {
    return format_name_;
  }

  void SetFormatName(std::string name) { format_name_ = std::move(name); }

  /// @brief Id the metadata was parsed from
  [[nodiscard]] const std::string& GetSourceId() const noexcept {
    return source_id_;
  }

  void SetSourceId(std::string id) { source_id_ = std::move(id); }

  // -- Series --

  [[nodiscard]] int GetImageCount() const noexcept {
    return static_cast<int>(images_.size());
  }

  /// @brief Get one series
  /// @retval OutOfRange (bounds kind) for an invalid series index
  [[nodiscard]] absl::StatusOr<const ImageMetadata*> GetImage(
      int series) const;

  [[nodiscard]] const std::vector<ImageMetadata>& GetImages() const noexcept {
    return images_;
  }

  std::vector<ImageMetadata>& GetMutableImages() noexcept { return images_; }

  void AddImage(ImageMetadata image) { images_.push_back(std::move(image)); }

  // -- Raw metadata --

  [[nodiscard]] const MetadataTable& GetTable() const noexcept {
    return table_;
  }

  MetadataTable& GetMutableTable() noexcept { return table_; }

  /// @brief Options the resource was parsed with
  [[nodiscard]] const ParserOptions& GetParserOptions() const noexcept {
    return parser_options_;
  }

  void SetParserOptions(const ParserOptions& options) {
    parser_options_ = options;
  }

  // -- Resources --

  /// @brief Source stream, nullptr once closed
  [[nodiscard]] io::BufferedStream* GetSource() const noexcept {
    return source_.get();
  }

  void SetSource(std::unique_ptr<io::BufferedStream> source) {
    source_ = std::move(source);
  }

  /// @brief Record an id mapped into the context on behalf of this resource
  void AddMappedId(std::string id) { mapped_ids_.push_back(std::move(id)); }

  [[nodiscard]] const std::vector<std::string>& GetMappedIds() const noexcept {
    return mapped_ids_;
  }

  /// @brief Close the source stream and release mapped ids; idempotent
  virtual absl::Status Close(Context& context);

 private:
  std::string format_name_;
  std::string source_id_;
  std::vector<ImageMetadata> images_;
  MetadataTable table_;
  ParserOptions parser_options_;
  std::unique_ptr<io::BufferedStream> source_;
  std::vector<std::string> mapped_ids_;
};

}  // namespace planeio

#endif  // PLANEIO_INCLUDE_PLANEIO_METADATA_H_
