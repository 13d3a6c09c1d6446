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

#ifndef PLANEIO_INCLUDE_PLANEIO_RUNTIME_BUILTIN_FORMATS_H_
#define PLANEIO_INCLUDE_PLANEIO_RUNTIME_BUILTIN_FORMATS_H_

#include <memory>

#include "planeio/runtime/format_registry.h"

/**
 * @file builtin_formats.h
 * @brief Registration of the formats shipped with planeio
 *
 * Registration is explicit. Nothing is registered at static
 * initialization time and no plugin directories are scanned.
 */

namespace planeio::runtime {

/// @brief Register Zip, GZip, ICS, BMP and PNM
///
/// Safe to call more than once; existing registrations are replaced.
void RegisterBuiltinFormats(FormatRegistry& registry);

/// @brief Create a registry holding the built-in formats
std::shared_ptr<const FormatRegistry> CreateBuiltinRegistry();

}  // namespace planeio::runtime

#endif  // PLANEIO_INCLUDE_PLANEIO_RUNTIME_BUILTIN_FORMATS_H_
