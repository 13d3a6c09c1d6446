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

#include "planeio/metadata.h"

#include <utility>

#include "absl/strings/str_format.h"
#include "planeio/context.h"
#include "planeio/status.h"

namespace planeio {

absl::StatusOr<const ImageMetadata*> Metadata::GetImage(int series) const {
  if (series < 0 || series >= GetImageCount()) {
    return MAKE_STATUS(ErrorKind::kBounds,
                       absl::StrFormat("Invalid series %d (series count %d)",
                                       series, GetImageCount()));
  }
  return &images_[static_cast<size_t>(series)];
}

absl::Status Metadata::Close(Context& context) {
  absl::Status status;
  if (source_ != nullptr) {
    status = source_->Close();
    source_.reset();
  }
  for (const auto& id : mapped_ids_) {
    context.GetLocation().Unmap(id);
  }
  mapped_ids_.clear();
  return status;
}

}  // namespace planeio
