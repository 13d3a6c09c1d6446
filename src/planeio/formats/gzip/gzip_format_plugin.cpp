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

#include "planeio/formats/gzip/gzip_format_plugin.h"

#include <cstdint>
#include <memory>
#include <span>
#include <utility>
#include <vector>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "planeio/context.h"
#include "planeio/formats/container/container.h"
#include "planeio/io/gzip_handle.h"
#include "planeio/status.h"

namespace planeio {
namespace formats {
namespace gzip {

namespace {

const std::vector<uint8_t>& Magic() {
  static const std::vector<uint8_t> magic = {0x1f, 0x8b};
  return magic;
}

std::unique_ptr<Parser> CreateGzipParser() {
  return std::make_unique<container::ContainerParser>(
      std::string(kFormatName), Magic(), UnwrapGzip);
}

}  // namespace

std::string GetInnerId(std::string_view id) {
  std::string_view name = id;
  const size_t separator = id.find_last_of("/!");
  if (separator != std::string_view::npos) {
    name = id.substr(separator + 1);
  }
  if (absl::EndsWithIgnoreCase(name, ".gz")) {
    name.remove_suffix(3);
  }
  return absl::StrCat(id, "!/", name);
}

absl::StatusOr<UnwrapResult> UnwrapGzip(Context& context,
                                        std::string_view id) {
  std::string inner_id = GetInnerId(id);
  io::Location* location = &context.GetLocation();
  std::string outer_id(id);

  location->MapFactory(
      inner_id,
      [location, outer_id](
          io::OpenMode mode) -> absl::StatusOr<std::unique_ptr<io::Handle>> {
        if (mode != io::OpenMode::kRead) {
          return MAKE_STATUS(ErrorKind::kIo,
                             absl::StrCat("Content of ", outer_id,
                                          " is read-only"));
        }
        DECLARE_ASSIGN_OR_RETURN_MOVE(
            std::unique_ptr<io::Handle>, source,
            location->OpenHandle(outer_id, io::OpenMode::kRead), "");
        DECLARE_ASSIGN_OR_RETURN_MOVE(std::unique_ptr<io::GzipHandle>, handle,
                                      io::GzipHandle::Open(std::move(source)),
                                      "");
        return std::unique_ptr<io::Handle>(std::move(handle));
      });

  UnwrapResult result;
  result.inner_id = inner_id;
  result.mapped_ids.push_back(std::move(inner_id));
  return result;
}

FormatDescriptor CreateGzipFormatDescriptor() {
  FormatDescriptor desc;

  desc.format_name = std::string(kFormatName);
  desc.suffixes = {"gz"};
  desc.probe_length = Magic().size();
  desc.probe = [](std::span<const uint8_t> prefix) {
    return prefix.size() >= 2 && prefix[0] == 0x1f && prefix[1] == 0x8b;
  };
  desc.unwrap = UnwrapGzip;

  desc.capabilities = SetCapability(desc.capabilities, FormatCapability::kRead);
  desc.capabilities =
      SetCapability(desc.capabilities, FormatCapability::kContainer);
  desc.capabilities =
      SetCapability(desc.capabilities, FormatCapability::kCompressed);
  desc.priority = 90;

  desc.create_parser = CreateGzipParser;
  desc.create_reader = []() -> std::unique_ptr<Reader> {
    return std::make_unique<container::ContainerReader>(
        std::string(kFormatName), CreateGzipParser);
  };

  return desc;
}

}  // namespace gzip
}  // namespace formats
}  // namespace planeio
