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

#include "planeio/formats/ics/ics_format_plugin.h"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

#include "absl/strings/match.h"
#include "planeio/formats/ics/ics_parser.h"
#include "planeio/formats/ics/ics_reader.h"
#include "planeio/formats/ics/ics_writer.h"

namespace planeio {
namespace formats {
namespace ics {

namespace {

constexpr std::string_view kVersionRecord = "ics_version";

bool ProbeIcs(std::span<const uint8_t> prefix) {
  if (prefix.size() < 2 + kVersionRecord.size()) {
    return false;
  }
  const std::string_view text(
      reinterpret_cast<const char*>(prefix.data()) + 2, kVersionRecord.size());
  return absl::EqualsIgnoreCase(text, kVersionRecord);
}

}  // namespace

FormatDescriptor CreateIcsFormatDescriptor() {
  FormatDescriptor desc;

  desc.format_name = std::string(kFormatName);
  desc.suffixes = {"ics", "ids"};
  desc.suffix_sufficient = true;
  desc.probe_length = 2 + kVersionRecord.size();
  desc.probe = ProbeIcs;

  desc.capabilities = SetCapability(desc.capabilities, FormatCapability::kRead);
  desc.capabilities =
      SetCapability(desc.capabilities, FormatCapability::kWrite);
  desc.capabilities =
      SetCapability(desc.capabilities, FormatCapability::kCompressed);
  desc.priority = 50;

  desc.create_parser = []() -> std::unique_ptr<Parser> {
    return std::make_unique<IcsParser>();
  };
  desc.create_reader = []() -> std::unique_ptr<Reader> {
    return std::make_unique<IcsReader>();
  };
  desc.create_writer = []() -> std::unique_ptr<Writer> {
    return std::make_unique<IcsWriter>();
  };

  return desc;
}

}  // namespace ics
}  // namespace formats
}  // namespace planeio
