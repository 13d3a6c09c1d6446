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

#ifndef PLANEIO_INCLUDE_PLANEIO_FORMATS_CONTAINER_CONTAINER_H_
#define PLANEIO_INCLUDE_PLANEIO_FORMATS_CONTAINER_CONTAINER_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "planeio/metadata.h"
#include "planeio/parser.h"
#include "planeio/reader.h"
#include "planeio/runtime/format_descriptor.h"

/**
 * @file container.h
 * @brief Shared parser and reader for wrapping formats (gzip, zip)
 *
 * A container contributes no pixels of its own. Its parser maps the
 * wrapped content into the context, parses it with the inner format and
 * exposes the inner series. Its reader delegates to the inner reader.
 */

namespace planeio::formats::container {

using UnwrapFunction = std::function<absl::StatusOr<UnwrapResult>(
    Context& context, std::string_view id)>;

/// @brief Metadata of a container holding the parsed inner resource
class ContainerMetadata : public Metadata {
 public:
  /// @brief Format name of the wrapped resource
  [[nodiscard]] const std::string& GetInnerFormatName() const noexcept {
    return inner_format_name_;
  }

  [[nodiscard]] const Metadata* GetInner() const noexcept {
    return inner_.get();
  }

  void SetInner(std::unique_ptr<Metadata> inner, std::string format_name);

  /// @brief Hand the inner metadata to a nested reader
  std::unique_ptr<Metadata> ReleaseInner();

  /// @brief Close the inner resource, then this one
  absl::Status Close(Context& context) override;

 private:
  std::unique_ptr<Metadata> inner_;
  std::string inner_format_name_;
};

class ContainerParser : public Parser {
 public:
  /// @param format_name Container format name
  /// @param magic Leading bytes every resource of the format starts with
  /// @param unwrap Function mapping the wrapped content into the context
  ContainerParser(std::string format_name, std::vector<uint8_t> magic,
                  UnwrapFunction unwrap);

  [[nodiscard]] std::string_view GetFormatName() const override {
    return format_name_;
  }

 protected:
  absl::Status CheckHeader(io::BufferedStream& stream) override;

  [[nodiscard]] std::unique_ptr<Metadata> CreateMetadata() const override {
    return std::make_unique<ContainerMetadata>();
  }

  absl::Status TypedParse(Context& context, io::BufferedStream& stream,
                          Metadata& metadata,
                          const ParserOptions& options) override;

 private:
  std::string format_name_;
  std::vector<uint8_t> magic_;
  UnwrapFunction unwrap_;
};

/// @brief Reader delegating every plane to the reader of the inner format
class ContainerReader : public Reader {
 public:
  ContainerReader(std::string format_name,
                  std::function<std::unique_ptr<Parser>()> create_parser);

  absl::Status OpenPlane(int series, int64_t plane_index,
                         const PlaneRegion& region, Plane& plane) override;
  using Reader::OpenPlane;

  void SetNormalized(bool normalized) override;

  [[nodiscard]] std::string_view GetFormatName() const override {
    return format_name_;
  }

  /// @brief Reader of the wrapped resource, nullptr when closed
  [[nodiscard]] const Reader* GetNestedReader() const noexcept {
    return nested_.get();
  }

 protected:
  [[nodiscard]] std::unique_ptr<Parser> CreateParser() const override {
    return create_parser_();
  }

  absl::Status OnSetMetadata(Context& context,
                             const ReaderOptions& options) override;

  /// @brief Unused; OpenPlane hands every request, checks and normalization
  /// included, to the nested reader. Fails with an invalid-argument error.
  absl::Status ReadPlaneBytes(const ImageMetadata& image, int64_t plane_index,
                              const PlaneRegion& region,
                              std::span<uint8_t> out) override;

  absl::Status OnClose() override;

 private:
  std::string format_name_;
  std::function<std::unique_ptr<Parser>()> create_parser_;
  std::unique_ptr<Reader> nested_;
};

}  // namespace planeio::formats::container

#endif  // PLANEIO_INCLUDE_PLANEIO_FORMATS_CONTAINER_CONTAINER_H_
