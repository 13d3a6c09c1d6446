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

#include "planeio/formats/ics/ics_parser.h"

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "planeio/context.h"
#include "planeio/enums/handlers.h"
#include "planeio/status.h"

namespace planeio {
namespace formats {
namespace ics {

namespace {

using Fields = std::map<std::string, std::vector<std::string>, std::less<>>;

constexpr std::string_view kVersionKey = "ics_version";

/// @brief Categories whose second token is a subcategory
bool HasSubcategory(std::string_view category) {
  return category == "layout" || category == "representation" ||
         category == "parameter" || category == "sensor" ||
         category == "history" || category == "document" ||
         category == "source";
}

const std::vector<std::string>* FindField(const Fields& fields,
                                          std::string_view key) {
  auto it = fields.find(key);
  return it == fields.end() || it->second.empty() ? nullptr : &it->second;
}

absl::StatusOr<PixelType> GetPixelType(enums::SampleFormat format,
                                       bool is_signed, uint32_t bits) {
  if (format == enums::SampleFormat::kComplex) {
    return MAKE_STATUS(ErrorKind::kUnsupportedFormat,
                       "Complex ICS data is not supported");
  }
  if (format == enums::SampleFormat::kReal) {
    if (bits == 32) {
      return PixelType::kFloat;
    }
    if (bits == 64) {
      return PixelType::kDouble;
    }
    return MAKE_STATUS(ErrorKind::kFormat,
                       absl::StrFormat("Real samples of %d bits", bits));
  }
  if (bits == 1 && !is_signed) {
    return PixelType::kBit;
  }
  if (bits <= 8) {
    return is_signed ? PixelType::kInt8 : PixelType::kUInt8;
  }
  if (bits <= 16) {
    return is_signed ? PixelType::kInt16 : PixelType::kUInt16;
  }
  if (bits <= 32) {
    return is_signed ? PixelType::kInt32 : PixelType::kUInt32;
  }
  if (bits <= 64) {
    return is_signed ? PixelType::kInt64 : PixelType::kUInt64;
  }
  return MAKE_STATUS(ErrorKind::kFormat,
                     absl::StrFormat("Integer samples of %d bits", bits));
}

/// @brief Read the header records up to "end"
/// @return Whether an "end" record was seen
absl::StatusOr<bool> ReadRecords(io::BufferedStream& stream, char field_sep,
                                 char record_sep, MetadataTable& table,
                                 Fields& fields) {
  DECLARE_ASSIGN_OR_RETURN_MOVE(int64_t, length, stream.Length(), "");
  const std::string terminator(1, record_sep);
  while (stream.GetFilePointer() < length) {
    DECLARE_ASSIGN_OR_RETURN_MOVE(std::string, line,
                                  stream.ReadStringUntil(terminator), "");
    while (!line.empty() && (line.back() == record_sep || line.back() == '\r')) {
      line.pop_back();
    }

    std::vector<std::string> tokens =
        absl::StrSplit(line, field_sep, absl::SkipEmpty());
    if (tokens.empty()) {
      continue;
    }

    std::string category = absl::AsciiStrToLower(tokens[0]);
    if (category == "end") {
      return true;
    }

    std::string key;
    size_t first_value = 1;
    if (HasSubcategory(category) && tokens.size() >= 2) {
      key = absl::StrCat(category, " ", absl::AsciiStrToLower(tokens[1]));
      first_value = 2;
    } else {
      if (category != kVersionKey && category != "filename") {
        LOG(WARNING) << "Unknown ICS header key '" << tokens[0] << "'";
      }
      key = category;
    }

    std::vector<std::string> values(tokens.begin() + first_value,
                                    tokens.end());
    std::string joined = absl::StrJoin(values, " ");
    if (category == "history") {
      table.Add(key, joined);
    } else {
      table.Set(key, joined);
    }
    fields[key] = std::move(values);
  }
  return false;
}

}  // namespace

absl::StatusOr<std::string> IcsParser::ResolveMetadataId(Context& context,
                                                         std::string_view id) {
  if (GetSuffix(id) != "ids") {
    return std::string(id);
  }
  auto header_id = GetCompanionId(id);
  if (!header_id.has_value() || !context.GetLocation().Exists(*header_id)) {
    return MAKE_STATUS_WITH_CODE(
        ErrorKind::kIo, absl::StatusCode::kNotFound,
        absl::StrFormat("No ICS header next to %s", id));
  }
  return *header_id;
}

absl::Status IcsParser::CheckHeader(io::BufferedStream& stream) {
  std::array<uint8_t, 2> separators{};
  RETURN_IF_ERROR(stream.ReadFully(separators), "ICS header is truncated");
  DECLARE_ASSIGN_OR_RETURN_MOVE(
      std::string, first,
      stream.ReadString(kVersionKey.size()), "ICS header is truncated");
  if (absl::AsciiStrToLower(first) != kVersionKey) {
    return MAKE_STATUS(ErrorKind::kFormat, "Missing ics_version record");
  }
  return absl::OkStatus();
}

absl::Status IcsParser::TypedParse(Context& context, io::BufferedStream& stream,
                                   Metadata& metadata,
                                   const ParserOptions& /*options*/) {
  auto* ics = dynamic_cast<IcsMetadata*>(&metadata);
  if (ics == nullptr) {
    return MAKE_STATUS(ErrorKind::kInvalidArgument,
                       "ICS parser needs IcsMetadata");
  }

  RETURN_IF_ERROR(stream.Seek(0), "");
  DECLARE_ASSIGN_OR_RETURN_MOVE(uint8_t, field_sep, stream.ReadUInt8(), "");
  DECLARE_ASSIGN_OR_RETURN_MOVE(uint8_t, record_sep, stream.ReadUInt8(), "");

  Fields fields;
  DECLARE_ASSIGN_OR_RETURN_MOVE(
      bool, has_end,
      ReadRecords(stream, static_cast<char>(field_sep),
                  static_cast<char>(record_sep), metadata.GetMutableTable(),
                  fields),
      "Failed to read ICS header");

  const auto* version = FindField(fields, kVersionKey);
  ics->SetVersion(version != nullptr ? (*version)[0] : "1.0");
  const bool single_file = ics->GetVersion().rfind("2", 0) == 0;
  if (single_file && !has_end) {
    return MAKE_STATUS(ErrorKind::kFormat,
                       "ICS 2.0 header has no end record");
  }

  // Axes and sizes, "bits" first when present.
  const auto* order = FindField(fields, "layout order");
  const auto* sizes = FindField(fields, "layout sizes");
  if (order == nullptr || sizes == nullptr || order->size() != sizes->size()) {
    return MAKE_STATUS(ErrorKind::kFormat,
                       "ICS layout order and sizes do not match");
  }

  const auto* scales = FindField(fields, "parameter scale");
  const auto* units = FindField(fields, "parameter units");

  uint32_t bits = 8;
  std::vector<Axis> file_axes;
  for (size_t i = 0; i < order->size(); ++i) {
    int64_t size = 0;
    if (!absl::SimpleAtoi((*sizes)[i], &size) || size <= 0) {
      return MAKE_STATUS(ErrorKind::kFormat,
                         absl::StrFormat("Invalid ICS size '%s'", (*sizes)[i]));
    }
    if (i == 0 && absl::EqualsIgnoreCase((*order)[i], "bits")) {
      if (size > 64) {
        return MAKE_STATUS(
            ErrorKind::kFormat,
            absl::StrFormat("Invalid sample size of %d bits", size));
      }
      bits = static_cast<uint32_t>(size);
      continue;
    }

    DECLARE_ASSIGN_OR_RETURN_MOVE(
        AxisType, type, enums::AxisTypeHandler().GetEnumeration((*order)[i]),
        "");
    Axis axis{.type = type, .length = size};
    if (scales != nullptr && i < scales->size()) {
      double scale = 1.0;
      if (absl::SimpleAtod((*scales)[i], &scale)) {
        axis.scale = scale;
      }
    }
    if (units != nullptr && i < units->size() &&
        (*units)[i] != "undefined") {
      axis.unit = (*units)[i];
    }
    file_axes.push_back(std::move(axis));
  }

  // Sample representation.
  enums::SampleFormat format = enums::SampleFormat::kInteger;
  if (const auto* value = FindField(fields, "representation format")) {
    ASSIGN_OR_RETURN(format,
                     enums::SampleFormatHandler().GetEnumeration((*value)[0]));
  }
  bool is_signed = format != enums::SampleFormat::kInteger;
  if (const auto* value = FindField(fields, "representation sign")) {
    is_signed = absl::EqualsIgnoreCase((*value)[0], "signed");
  }
  bool little_endian = false;
  if (const auto* value = FindField(fields, "representation byte_order")) {
    little_endian = (*value)[0] == "1";
  }

  IcsCompression compression = IcsCompression::kUncompressed;
  if (const auto* value = FindField(fields, "representation compression")) {
    const std::string name = absl::AsciiStrToLower((*value)[0]);
    if (name == "gzip") {
      compression = IcsCompression::kGzip;
    } else if (name != "uncompressed") {
      return MAKE_STATUS(
          ErrorKind::kUnsupportedFormat,
          absl::StrFormat("ICS compression '%s' is not supported", name));
    }
  }

  DECLARE_ASSIGN_OR_RETURN_MOVE(PixelType, pixel_type,
                                GetPixelType(format, is_signed, bits), "");
  DECLARE_ASSIGN_OR_RETURN_MOVE(std::optional<IcsLayout>, layout,
                                IcsLayout::Create(std::move(file_axes), bits),
                                "");

  ImageMetadata image;
  if (const auto* filename = FindField(fields, "filename")) {
    image.name = absl::StrJoin(*filename, " ");
  }
  image.axes = layout->GetDeclaredAxes();
  image.pixel_type = pixel_type;
  image.bits_per_pixel = bits;
  image.little_endian = little_endian;
  metadata.AddImage(std::move(image));

  if (single_file) {
    ics->SetDataId(metadata.GetSourceId());
    ics->SetDataOffset(static_cast<uint64_t>(stream.GetFilePointer()));
  } else {
    auto data_id = GetCompanionId(metadata.GetSourceId());
    if (!data_id.has_value() || !context.GetLocation().Exists(*data_id)) {
      return MAKE_STATUS_WITH_CODE(
          ErrorKind::kIo, absl::StatusCode::kNotFound,
          absl::StrFormat("ICS %s data file of %s is missing",
                          ics->GetVersion(), metadata.GetSourceId()));
    }
    ics->SetDataId(*data_id);
    ics->SetDataOffset(0);
  }
  ics->SetCompression(compression);
  ics->SetLayout(std::move(*layout));
  return absl::OkStatus();
}

}  // namespace ics
}  // namespace formats
}  // namespace planeio
