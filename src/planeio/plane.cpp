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

#include "planeio/plane.h"

#include "planeio/decode/plane_decoder.h"

namespace planeio {

absl::StatusOr<PixelBuffer> Plane::Decode() const {
  return decode::DecodeSamples(bytes, GetEncoding(),
                               static_cast<size_t>(region.Area()));
}

}  // namespace planeio
