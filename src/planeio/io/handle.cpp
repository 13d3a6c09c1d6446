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

#include "planeio/io/handle.h"

#include "planeio/status.h"

namespace planeio {
namespace io {

absl::Status Handle::Write(std::span<const uint8_t> /*data*/) {
  RETURN_IF_ERROR(CheckOpen(), "");
  return MAKE_STATUS(ErrorKind::kIo, "Resource is read-only");
}

absl::Status Handle::SetLength(int64_t /*length*/) {
  RETURN_IF_ERROR(CheckOpen(), "");
  return MAKE_STATUS(ErrorKind::kIo, "Resource is read-only");
}

absl::StatusOr<size_t> Handle::ReadAt(int64_t offset,
                                      std::span<uint8_t> buffer) {
  RETURN_IF_ERROR(Seek(offset), "");
  return Read(buffer);
}

absl::Status Handle::CheckOpen() const {
  if (IsClosed()) {
    return MAKE_STATUS(ErrorKind::kClosed, "Handle is closed");
  }
  return absl::OkStatus();
}

}  // namespace io
}  // namespace planeio
