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

#include "planeio/parser.h"

#include <memory>
#include <string>
#include <utility>

#include "absl/log/log.h"
#include "absl/strings/str_format.h"
#include "planeio/context.h"
#include "planeio/status.h"

namespace planeio {

namespace {

/// @brief Close metadata on a failed parse and hand back the parse error
absl::Status Abandon(Context& context, Metadata& metadata,
                     absl::Status error) {
  auto close_status = metadata.Close(context);
  if (!close_status.ok()) {
    LOG(ERROR) << "Failed to release " << metadata.GetSourceId()
               << " after parse error: " << close_status.message();
  }
  return error;
}

}  // namespace

absl::StatusOr<std::string> Parser::ResolveMetadataId(Context& /*context*/,
                                                      std::string_view id) {
  return std::string(id);
}

absl::StatusOr<std::unique_ptr<Metadata>> Parser::Parse(
    Context& context, std::string_view id, const ParserOptions& options) {
  DECLARE_ASSIGN_OR_RETURN_MOVE(std::string, metadata_id,
                                ResolveMetadataId(context, id), "");

  auto metadata = CreateMetadata();
  metadata->SetFormatName(std::string(GetFormatName()));
  metadata->SetSourceId(metadata_id);
  metadata->SetParserOptions(options);

  DECLARE_ASSIGN_OR_RETURN_MOVE(
      std::unique_ptr<io::BufferedStream>, stream,
      context.OpenStream(metadata_id, io::OpenMode::kRead, options.stream),
      absl::StrFormat("Failed to open %s", metadata_id));
  io::BufferedStream& source = *stream;
  metadata->SetSource(std::move(stream));

  auto parse_status = source.Seek(0);
  if (parse_status.ok()) {
    parse_status = CheckHeader(source);
  }
  if (parse_status.ok()) {
    parse_status = TypedParse(context, source, *metadata, options);
  }
  if (!parse_status.ok()) {
    return Abandon(
        context, *metadata,
        status::AddTrace(parse_status, __func__, __FILE__, __LINE__,
                         absl::StrFormat("Failed to parse %s as %s",
                                         metadata_id, GetFormatName())));
  }

  if (metadata->GetImageCount() == 0) {
    return Abandon(context, *metadata,
                   MAKE_STATUS(ErrorKind::kFormat,
                               absl::StrFormat("%s holds no image series",
                                               metadata_id)));
  }

  auto& images = metadata->GetMutableImages();
  if (options.metadata_filtered) {
    ApplyMetadataFilter(options.filter, metadata->GetMutableTable());
    for (auto& image : images) {
      ApplyMetadataFilter(options.filter, image.table);
    }
  }
  if (!options.original_metadata_populated) {
    metadata->GetMutableTable().clear();
    for (auto& image : images) {
      image.table.clear();
    }
  }

  for (size_t i = 0; i < images.size(); ++i) {
    auto valid = images[i].Validate();
    if (!valid.ok()) {
      return Abandon(
          context, *metadata,
          MAKE_STATUS(ErrorKind::kFormat,
                      absl::StrFormat("Series %d of %s is invalid: %s", i,
                                      metadata_id, valid.message())));
    }
  }

  return metadata;
}

}  // namespace planeio
