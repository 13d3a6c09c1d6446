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

#include "planeio/formats/zip/zip_format_plugin.h"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "planeio/context.h"
#include "planeio/formats/container/container.h"
#include "planeio/io/zip_handle.h"
#include "planeio/status.h"

namespace planeio {
namespace formats {
namespace zip {

namespace {

const std::vector<uint8_t>& Magic() {
  static const std::vector<uint8_t> magic = {'P', 'K', 0x03, 0x04};
  return magic;
}

std::unique_ptr<Parser> CreateZipParser() {
  return std::make_unique<container::ContainerParser>(
      std::string(kFormatName), Magic(), UnwrapZip);
}

}  // namespace

absl::StatusOr<UnwrapResult> UnwrapZip(Context& context, std::string_view id) {
  io::Location& location = context.GetLocation();
  DECLARE_ASSIGN_OR_RETURN_MOVE(std::unique_ptr<io::Handle>, source,
                                location.OpenHandle(id, io::OpenMode::kRead),
                                "");
  DECLARE_ASSIGN_OR_RETURN_MOVE(std::shared_ptr<io::ZipArchive>, archive,
                                io::ZipArchive::Open(std::move(source)),
                                absl::StrCat("Failed to read archive ", id));

  UnwrapResult result;
  for (const auto& entry : archive->GetEntries()) {
    if (entry.is_directory) {
      continue;
    }
    std::string entry_id = absl::StrCat(id, "!/", entry.name);
    VLOG(1) << "Mapping zip entry " << entry_id << " ("
            << entry.uncompressed_size << " bytes)";

    std::string entry_name = entry.name;
    location.MapFactory(
        entry_id,
        [archive, entry_name](io::OpenMode mode)
            -> absl::StatusOr<std::unique_ptr<io::Handle>> {
          if (mode != io::OpenMode::kRead) {
            return MAKE_STATUS(ErrorKind::kIo,
                               absl::StrCat("Zip entry ", entry_name,
                                            " is read-only"));
          }
          DECLARE_ASSIGN_OR_RETURN_MOVE(
              std::unique_ptr<io::ZipHandle>, handle,
              io::ZipHandle::Open(archive, entry_name), "");
          return std::unique_ptr<io::Handle>(std::move(handle));
        });

    if (result.inner_id.empty()) {
      result.inner_id = entry_id;
    }
    result.mapped_ids.push_back(std::move(entry_id));
  }

  if (result.inner_id.empty()) {
    return MAKE_STATUS(ErrorKind::kFormat,
                       absl::StrCat("Archive ", id, " holds no file entry"));
  }
  return result;
}

FormatDescriptor CreateZipFormatDescriptor() {
  FormatDescriptor desc;

  desc.format_name = std::string(kFormatName);
  desc.suffixes = {"zip"};
  desc.probe_length = Magic().size();
  desc.probe = [](std::span<const uint8_t> prefix) {
    const auto& magic = Magic();
    return prefix.size() >= magic.size() &&
           std::equal(magic.begin(), magic.end(), prefix.begin());
  };
  desc.unwrap = UnwrapZip;

  desc.capabilities = SetCapability(desc.capabilities, FormatCapability::kRead);
  desc.capabilities =
      SetCapability(desc.capabilities, FormatCapability::kContainer);
  desc.capabilities =
      SetCapability(desc.capabilities, FormatCapability::kCompressed);
  desc.priority = 100;

  desc.create_parser = CreateZipParser;
  desc.create_reader = []() -> std::unique_ptr<Reader> {
    return std::make_unique<container::ContainerReader>(
        std::string(kFormatName), CreateZipParser);
  };

  return desc;
}

}  // namespace zip
}  // namespace formats
}  // namespace planeio
