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

#include "planeio/decode/plane_decoder.h"

#include <utility>

#include "absl/strings/str_format.h"
#include "planeio/status.h"

namespace planeio {
namespace decode {

absl::Status ConvertBytes(PixelBuffer& target, std::span<const uint8_t> raw,
                          size_t plane_offset, const PixelEncoding& encoding,
                          std::optional<size_t> count) {
  if (target.GetPixelType() != encoding.pixel_type) {
    return MAKE_STATUS(
        ErrorKind::kInvalidArgument,
        absl::StrFormat("Buffer holds %s elements, plane holds %s",
                        GetName(target.GetPixelType()),
                        GetName(encoding.pixel_type)));
  }
  absl::Status result;
  DispatchByPixelType(encoding.pixel_type, [&]<typename T>() {
    result = ConvertBytes<T>(target.As<T>(), raw, plane_offset, encoding,
                             count);
  });
  return result;
}

absl::StatusOr<PixelBuffer> DecodeSamples(std::span<const uint8_t> raw,
                                          const PixelEncoding& encoding,
                                          size_t count) {
  PixelBuffer buffer(encoding.pixel_type, count);
  RETURN_IF_ERROR(ConvertBytes(buffer, raw, 0, encoding, count),
                  "Failed to decode plane");
  return buffer;
}

}  // namespace decode
}  // namespace planeio
