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

#include "planeio/formats/ics/ics_reader.h"

#include <cstdint>
#include <limits>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/str_format.h"
#include "planeio/context.h"
#include "planeio/decode/interleaved_region.h"
#include "planeio/formats/ics/ics_parser.h"
#include "planeio/io/binary_utils.h"
#include "planeio/io/memory_handle.h"
#include "planeio/status.h"

namespace planeio {
namespace formats {
namespace ics {

std::unique_ptr<Parser> IcsReader::CreateParser() const {
  return std::make_unique<IcsParser>();
}

absl::Status IcsReader::OnSetMetadata(Context& context,
                                      const ReaderOptions& options) {
  auto* metadata = GetMetadataAs<IcsMetadata>();
  if (metadata == nullptr || !metadata->GetLayout().has_value()) {
    return MAKE_STATUS(ErrorKind::kInvalidArgument,
                       "ICS reader needs parsed ICS metadata");
  }

  if (metadata->HasCompanionData()) {
    DECLARE_ASSIGN_OR_RETURN_MOVE(
        std::unique_ptr<io::BufferedStream>, data,
        context.OpenStream(metadata->GetDataId(), io::OpenMode::kRead,
                           options.parser.stream),
        absl::StrFormat("Failed to open ICS data %s", metadata->GetDataId()));
    RETURN_IF_ERROR(metadata->ReplaceDataStream(std::move(data)), "");
  }

  if (metadata->GetCompression() == IcsCompression::kGzip) {
    io::BufferedStream* data = metadata->GetDataStream();
    DECLARE_ASSIGN_OR_RETURN_MOVE(int64_t, length, data->Length(), "");
    const int64_t offset = static_cast<int64_t>(metadata->GetDataOffset());
    if (offset > length) {
      return MAKE_STATUS(ErrorKind::kFormat, "ICS data offset past end");
    }
    RETURN_IF_ERROR(data->Seek(offset), "");
    DECLARE_ASSIGN_OR_RETURN_MOVE(
        std::vector<uint8_t>, compressed,
        data->ReadBytes(static_cast<size_t>(length - offset)), "");

    const uint64_t expected = metadata->GetLayout()->GetTotalBytes();
    if (expected > std::numeric_limits<size_t>::max()) {
      return MAKE_STATUS(
          ErrorKind::kResourceExhausted,
          absl::StrFormat("ICS data of %d bytes cannot be held in memory",
                          expected));
    }
    DECLARE_ASSIGN_OR_RETURN_MOVE(
        std::vector<uint8_t>, inflated,
        io::DecompressZlib(compressed, static_cast<size_t>(expected)),
        absl::StrFormat("Failed to inflate ICS data of %s",
                        metadata->GetSourceId()));
    VLOG(1) << "Inflated " << compressed.size() << " ICS bytes to "
            << inflated.size();

    DECLARE_ASSIGN_OR_RETURN_MOVE(
        std::unique_ptr<io::BufferedStream>, cached,
        io::BufferedStream::Open(io::MemoryHandle::FromBytes(std::move(inflated)),
                                 options.parser.stream),
        "");
    RETURN_IF_ERROR(metadata->ReplaceDataStream(std::move(cached)), "");
    metadata->SetDataOffset(0);
  }
  return absl::OkStatus();
}

absl::Status IcsReader::ReadPlaneBytes(const ImageMetadata& image,
                                       int64_t plane_index,
                                       const PlaneRegion& region,
                                       std::span<uint8_t> out) {
  auto* metadata = GetMetadataAs<IcsMetadata>();
  DECLARE_ASSIGN_OR_RETURN_MOVE(
      decode::InterleavedLayout, layout,
      metadata->GetLayout()->ForPlane(image, plane_index,
                                      metadata->GetDataOffset()),
      "");
  RETURN_IF_ERROR(decode::ReadInterleavedRegion(*metadata->GetDataStream(),
                                                layout, region, out),
                  "");
  return absl::OkStatus();
}

}  // namespace ics
}  // namespace formats
}  // namespace planeio
