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

#include "planeio/formats/pnm/pnm_format_plugin.h"

#include <cstdint>
#include <memory>
#include <span>
#include <string>

#include "planeio/formats/pnm/pnm.h"

namespace planeio {
namespace formats {
namespace pnm {

FormatDescriptor CreatePnmFormatDescriptor() {
  FormatDescriptor desc;

  desc.format_name = std::string(kFormatName);
  desc.suffixes = {"pbm", "pgm", "ppm", "pnm"};
  desc.probe_length = 2;
  desc.probe = [](std::span<const uint8_t> prefix) {
    return prefix.size() >= 2 && prefix[0] == 'P' && prefix[1] >= '1' &&
           prefix[1] <= '6';
  };

  desc.capabilities = SetCapability(desc.capabilities, FormatCapability::kRead);
  desc.capabilities =
      SetCapability(desc.capabilities, FormatCapability::kWrite);
  desc.priority = 30;

  desc.create_parser = []() -> std::unique_ptr<Parser> {
    return std::make_unique<PnmParser>();
  };
  desc.create_reader = []() -> std::unique_ptr<Reader> {
    return std::make_unique<PnmReader>();
  };
  desc.create_writer = []() -> std::unique_ptr<Writer> {
    return std::make_unique<PnmWriter>();
  };

  return desc;
}

}  // namespace pnm
}  // namespace formats
}  // namespace planeio
