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

#ifndef PLANEIO_INCLUDE_PLANEIO_FORMATS_ICS_ICS_FORMAT_PLUGIN_H_
#define PLANEIO_INCLUDE_PLANEIO_FORMATS_ICS_ICS_FORMAT_PLUGIN_H_

#include "planeio/runtime/format_descriptor.h"

/**
 * @file ics_format_plugin.h
 * @brief ICS (Image Cytometry Standard) format descriptor
 */

namespace planeio::formats::ics {

/// @brief Create ICS format descriptor
///
/// The .ics and .ids suffixes are sufficient on their own, so a bare data
/// file is recognised and redirected to its header.
FormatDescriptor CreateIcsFormatDescriptor();

}  // namespace planeio::formats::ics

#endif  // PLANEIO_INCLUDE_PLANEIO_FORMATS_ICS_ICS_FORMAT_PLUGIN_H_
