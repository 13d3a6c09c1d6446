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

#include "planeio/runtime/builtin_formats.h"

#include <memory>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "planeio/formats/bmp/bmp_format_plugin.h"
#include "planeio/formats/gzip/gzip_format_plugin.h"
#include "planeio/formats/ics/ics_format_plugin.h"
#include "planeio/formats/pnm/pnm_format_plugin.h"
#include "planeio/formats/zip/zip_format_plugin.h"

namespace planeio {
namespace runtime {

void RegisterBuiltinFormats(FormatRegistry& registry) {
  std::vector<FormatDescriptor> descriptors;
  descriptors.push_back(formats::zip::CreateZipFormatDescriptor());
  descriptors.push_back(formats::gzip::CreateGzipFormatDescriptor());
  descriptors.push_back(formats::ics::CreateIcsFormatDescriptor());
  descriptors.push_back(formats::bmp::CreateBmpFormatDescriptor());
  descriptors.push_back(formats::pnm::CreatePnmFormatDescriptor());
  VLOG(1) << "Registering " << descriptors.size() << " built-in formats";
  registry.RegisterFormats(std::move(descriptors));
}

std::shared_ptr<const FormatRegistry> CreateBuiltinRegistry() {
  auto registry = std::make_shared<FormatRegistry>();
  RegisterBuiltinFormats(*registry);
  return registry;
}

}  // namespace runtime
}  // namespace planeio
