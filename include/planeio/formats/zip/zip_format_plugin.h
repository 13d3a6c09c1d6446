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

#ifndef PLANEIO_INCLUDE_PLANEIO_FORMATS_ZIP_ZIP_FORMAT_PLUGIN_H_
#define PLANEIO_INCLUDE_PLANEIO_FORMATS_ZIP_ZIP_FORMAT_PLUGIN_H_

#include <string_view>

#include "absl/status/statusor.h"
#include "planeio/runtime/format_descriptor.h"

namespace planeio::formats::zip {

inline constexpr std::string_view kFormatName = "Zip";

/// @brief Map every file entry of a zip archive into the context
///
/// Entries become "<id>!/<entry name>", so companion files inside the
/// archive (an .ids next to its .ics) resolve like siblings on disk. The
/// first file entry in central-directory order is the one to parse.
///
/// @retval DataLoss (format kind) when the archive holds no file entry
absl::StatusOr<UnwrapResult> UnwrapZip(Context& context, std::string_view id);

/// @brief Create Zip format descriptor
FormatDescriptor CreateZipFormatDescriptor();

}  // namespace planeio::formats::zip

#endif  // PLANEIO_INCLUDE_PLANEIO_FORMATS_ZIP_ZIP_FORMAT_PLUGIN_H_
