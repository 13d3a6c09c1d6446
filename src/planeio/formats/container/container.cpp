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

#include "planeio/formats/container/container.h"

#include <algorithm>
#include <utility>

#include "absl/strings/str_format.h"
#include "planeio/context.h"
#include "planeio/status.h"

namespace planeio {
namespace formats {
namespace container {

void ContainerMetadata::SetInner(std::unique_ptr<Metadata> inner,
                                 std::string format_name) {
  inner_ = std::move(inner);
  inner_format_name_ = std::move(format_name);
}

std::unique_ptr<Metadata> ContainerMetadata::ReleaseInner() {
  return std::move(inner_);
}

absl::Status ContainerMetadata::Close(Context& context) {
  absl::Status inner_status;
  if (inner_ != nullptr) {
    inner_status = inner_->Close(context);
    inner_.reset();
  }
  auto own_status = Metadata::Close(context);
  RETURN_IF_ERROR(inner_status, "Failed to close wrapped resource");
  RETURN_IF_ERROR(own_status, "");
  return absl::OkStatus();
}

ContainerParser::ContainerParser(std::string format_name,
                                 std::vector<uint8_t> magic,
                                 UnwrapFunction unwrap)
    : format_name_(std::move(format_name)),
      magic_(std::move(magic)),
      unwrap_(std::move(unwrap)) {}

absl::Status ContainerParser::CheckHeader(io::BufferedStream& stream) {
  std::vector<uint8_t> prefix(magic_.size());
  DECLARE_ASSIGN_OR_RETURN_MOVE(size_t, count, stream.Read(prefix), "");
  if (count < magic_.size() ||
      !std::equal(magic_.begin(), magic_.end(), prefix.begin())) {
    return MAKE_STATUS(ErrorKind::kFormat,
                       absl::StrFormat("Missing %s signature", format_name_));
  }
  return absl::OkStatus();
}

absl::Status ContainerParser::TypedParse(Context& context,
                                         io::BufferedStream& /*stream*/,
                                         Metadata& metadata,
                                         const ParserOptions& options) {
  auto* container = dynamic_cast<ContainerMetadata*>(&metadata);
  if (container == nullptr) {
    return MAKE_STATUS(ErrorKind::kInvalidArgument,
                       "Container parser needs ContainerMetadata");
  }

  DECLARE_ASSIGN_OR_RETURN_MOVE(
      UnwrapResult, unwrapped, unwrap_(context, metadata.GetSourceId()),
      absl::StrFormat("Failed to unwrap %s", metadata.GetSourceId()));
  for (auto& id : unwrapped.mapped_ids) {
    metadata.AddMappedId(std::move(id));
  }

  DECLARE_ASSIGN_OR_RETURN_MOVE(FormatIdentity, identity,
                                context.Identify(unwrapped.inner_id), "");
  if (!identity.format->create_parser) {
    return MAKE_STATUS(
        ErrorKind::kUnsupportedFormat,
        absl::StrFormat("No parser for %s content of %s",
                        identity.format->format_name, metadata.GetSourceId()));
  }

  auto parser = identity.format->create_parser();
  DECLARE_ASSIGN_OR_RETURN_MOVE(
      std::unique_ptr<Metadata>, inner,
      parser->Parse(context, unwrapped.inner_id, options), "");

  for (const auto& image : inner->GetImages()) {
    metadata.AddImage(image);
  }
  metadata.GetMutableTable().Merge(inner->GetTable());
  container->SetInner(std::move(inner), identity.format->format_name);
  return absl::OkStatus();
}

ContainerReader::ContainerReader(
    std::string format_name,
    std::function<std::unique_ptr<Parser>()> create_parser)
    : format_name_(std::move(format_name)),
      create_parser_(std::move(create_parser)) {}

absl::Status ContainerReader::OnSetMetadata(Context& context,
                                            const ReaderOptions& options) {
  auto* metadata = GetMetadataAs<ContainerMetadata>();
  if (metadata == nullptr || metadata->GetInner() == nullptr) {
    return MAKE_STATUS(ErrorKind::kInvalidArgument,
                       "Container reader needs parsed container metadata");
  }

  auto format =
      context.GetRegistry().GetFormat(metadata->GetInnerFormatName());
  if (format == nullptr || !format->create_reader) {
    return MAKE_STATUS(ErrorKind::kUnsupportedFormat,
                       absl::StrFormat("No reader for wrapped %s content",
                                       metadata->GetInnerFormatName()));
  }

  auto nested = format->create_reader();
  RETURN_IF_ERROR(
      nested->SetMetadata(context, metadata->ReleaseInner(), options), "");
  nested_ = std::move(nested);
  return absl::OkStatus();
}

absl::Status ContainerReader::OpenPlane(int series, int64_t plane_index,
                                        const PlaneRegion& region,
                                        Plane& plane) {
  if (nested_ == nullptr) {
    return MAKE_STATUS(ErrorKind::kClosed, "Reader is not open");
  }
  RETURN_IF_ERROR(nested_->OpenPlane(series, plane_index, region, plane), "");
  return absl::OkStatus();
}

void ContainerReader::SetNormalized(bool normalized) {
  Reader::SetNormalized(normalized);
  if (nested_ != nullptr) {
    nested_->SetNormalized(normalized);
  }
}

absl::Status ContainerReader::ReadPlaneBytes(const ImageMetadata& /*image*/,
                                             int64_t /*plane_index*/,
                                             const PlaneRegion& /*region*/,
                                             std::span<uint8_t> /*out*/) {
  return MAKE_STATUS(ErrorKind::kInvalidArgument,
                     "Container planes are read by the nested reader");
}

absl::Status ContainerReader::OnClose() {
  if (nested_ == nullptr) {
    return absl::OkStatus();
  }
  auto close_status = nested_->Close();
  nested_.reset();
  RETURN_IF_ERROR(close_status, "Failed to close wrapped reader");
  return absl::OkStatus();
}

}  // namespace container
}  // namespace formats
}  // namespace planeio
