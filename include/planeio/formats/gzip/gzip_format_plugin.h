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

#ifndef PLANEIO_INCLUDE_PLANEIO_FORMATS_GZIP_GZIP_FORMAT_PLUGIN_H_
#define PLANEIO_INCLUDE_PLANEIO_FORMATS_GZIP_GZIP_FORMAT_PLUGIN_H_

#include <string>
#include <string_view>

#include "absl/status/statusor.h"
#include "planeio/runtime/format_descriptor.h"

namespace planeio::formats::gzip {

inline constexpr std::string_view kFormatName = "GZip";

/// @brief Id of the content wrapped by a gzip resource
///
/// "dir/cells.ics.gz" becomes "dir/cells.ics.gz!/cells.ics".
std::string GetInnerId(std::string_view id);

/// @brief Map the decompressed content of a gzip resource
///
/// The mapped id opens a fresh decompressing handle every time it is
/// opened; nothing is inflated up front.
absl::StatusOr<UnwrapResult> UnwrapGzip(Context& context, std::string_view id);

/// @brief Create GZip format descriptor
FormatDescriptor CreateGzipFormatDescriptor();

}  // namespace planeio::formats::gzip

#endif  // PLANEIO_INCLUDE_PLANEIO_FORMATS_GZIP_GZIP_FORMAT_PLUGIN_H_
