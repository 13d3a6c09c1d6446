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

#include "planeio/formats/bmp/bmp_format_plugin.h"

#include <cstdint>
#include <memory>
#include <span>
#include <string>

#include "planeio/formats/bmp/bmp.h"

namespace planeio {
namespace formats {
namespace bmp {

FormatDescriptor CreateBmpFormatDescriptor() {
  FormatDescriptor desc;

  desc.format_name = std::string(kFormatName);
  desc.suffixes = {"bmp"};
  desc.probe_length = 2;
  desc.probe = [](std::span<const uint8_t> prefix) {
    return prefix.size() >= 2 && prefix[0] == 'B' && prefix[1] == 'M';
  };

  desc.capabilities = SetCapability(desc.capabilities, FormatCapability::kRead);
  desc.capabilities =
      SetCapability(desc.capabilities, FormatCapability::kIndexedColor);
  desc.priority = 40;

  desc.create_parser = []() -> std::unique_ptr<Parser> {
    return std::make_unique<BmpParser>();
  };
  desc.create_reader = []() -> std::unique_ptr<Reader> {
    return std::make_unique<BmpReader>();
  };

  return desc;
}

}  // namespace bmp
}  // namespace formats
}  // namespace planeio
