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

#ifndef PLANEIO_INCLUDE_PLANEIO_FORMATS_ICS_ICS_PARSER_H_
#define PLANEIO_INCLUDE_PLANEIO_FORMATS_ICS_ICS_PARSER_H_

#include <memory>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "planeio/formats/ics/ics_metadata.h"
#include "planeio/parser.h"

namespace planeio::formats::ics {

/// @brief Parser for ICS headers
///
/// The header is a list of records. Its first two bytes are the field and
/// the record separator; every following record is a category, for most
/// categories a subcategory, and values. Records are stored in the raw
/// table under "category subcategory" with the values joined by spaces.
///
/// A requested .ids id is redirected to its .ics header.
class IcsParser : public Parser {
 public:
  [[nodiscard]] std::string_view GetFormatName() const override {
    return kFormatName;
  }

 protected:
  absl::StatusOr<std::string> ResolveMetadataId(Context& context,
                                                std::string_view id) override;

  absl::Status CheckHeader(io::BufferedStream& stream) override;

  [[nodiscard]] std::unique_ptr<Metadata> CreateMetadata() const override {
    return std::make_unique<IcsMetadata>();
  }

  absl::Status TypedParse(Context& context, io::BufferedStream& stream,
                          Metadata& metadata,
                          const ParserOptions& options) override;
};

}  // namespace planeio::formats::ics

#endif  // PLANEIO_INCLUDE_PLANEIO_FORMATS_ICS_ICS_PARSER_H_
