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

#include "planeio/runtime/format_descriptor.h"

#include <algorithm>
#include <string>
#include <string_view>

#include "absl/strings/ascii.h"

namespace planeio {
namespace runtime {

std::string GetSuffix(std::string_view id) {
  const size_t component = id.find_last_of("/!");
  const std::string_view name =
      component == std::string_view::npos ? id : id.substr(component + 1);
  const size_t dot = name.rfind('.');
  if (dot == std::string_view::npos) {
    return "";
  }
  return absl::AsciiStrToLower(name.substr(dot + 1));
}

bool FormatDescriptor::HasSuffix(std::string_view id) const {
  const std::string suffix = GetSuffix(id);
  if (suffix.empty()) {
    return false;
  }
  return std::find(suffixes.begin(), suffixes.end(), suffix) != suffixes.end();
}

bool FormatDescriptor::Matches(std::string_view id,
                               std::span<const uint8_t> prefix) const {
  const bool suffix_match = HasSuffix(id);
  if (suffix_sufficient && suffix_match) {
    return true;
  }
  if (suffix_necessary && !suffix_match) {
    return false;
  }
  if (!probe) {
    return suffix_match;
  }
  return probe(prefix);
}

}  // namespace runtime
}  // namespace planeio
