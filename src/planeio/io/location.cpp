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

#include "planeio/io/location.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "absl/strings/str_format.h"
#include "planeio/io/file_handle.h"
#include "planeio/io/memory_handle.h"
#include "planeio/status.h"

namespace planeio {
namespace io {

void Location::Map(std::string id, Mapping mapping) {
  absl::MutexLock lock(&mutex_);
  Entry& entry = mappings_[std::move(id)];
  entry.mapping = std::move(mapping);
  ++entry.references;
}

void Location::MapBytes(std::string id, std::vector<uint8_t> bytes) {
  Map(std::move(id),
      Mapping(std::make_shared<std::vector<uint8_t>>(std::move(bytes))));
}

void Location::MapFactory(std::string id, HandleFactory factory) {
  Map(std::move(id), Mapping(std::move(factory)));
}

bool Location::Unmap(std::string_view id) {
  absl::MutexLock lock(&mutex_);
  auto it = mappings_.find(id);
  if (it == mappings_.end()) {
    return false;
  }
  if (--it->second.references <= 0) {
    mappings_.erase(it);
  }
  return true;
}

bool Location::IsMapped(std::string_view id) const {
  absl::MutexLock lock(&mutex_);
  return mappings_.find(id) != mappings_.end();
}

absl::StatusOr<std::vector<uint8_t>> Location::GetBytes(
    std::string_view id) const {
  absl::MutexLock lock(&mutex_);
  auto it = mappings_.find(id);
  if (it != mappings_.end()) {
    if (const auto* storage = std::get_if<Storage>(&it->second.mapping)) {
      return **storage;
    }
  }
  return MAKE_STATUS_WITH_CODE(
      ErrorKind::kIo, absl::StatusCode::kNotFound,
      absl::StrFormat("No in-memory buffer mapped for '%s'", id));
}

bool Location::Exists(std::string_view id) const {
  if (IsMapped(id)) {
    return true;
  }
  std::error_code ec;
  return fs::is_regular_file(fs::path(std::string(id)), ec);
}

absl::StatusOr<std::unique_ptr<Handle>> Location::OpenHandle(
    std::string_view id, OpenMode mode) const {
  std::optional<Mapping> mapping;
  {
    absl::MutexLock lock(&mutex_);
    auto it = mappings_.find(id);
    if (it != mappings_.end()) {
      mapping = it->second.mapping;
    }
  }

  // Factories run without the lock; they may resolve other ids.
  if (mapping.has_value()) {
    if (auto* factory = std::get_if<HandleFactory>(&*mapping)) {
      return (*factory)(mode);
    }
    auto storage = std::get<Storage>(*mapping);
    if (mode == OpenMode::kTruncate) {
      storage->clear();
    }
    return std::make_unique<MemoryHandle>(std::move(storage),
                                          mode != OpenMode::kRead);
  }

  DECLARE_ASSIGN_OR_RETURN_MOVE(std::unique_ptr<FileHandle>, file,
                                FileHandle::Open(fs::path(std::string(id)), mode),
                                "");
  return std::unique_ptr<Handle>(std::move(file));
}

}  // namespace io
}  // namespace planeio
