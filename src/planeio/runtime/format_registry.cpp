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

#include "planeio/runtime/format_registry.h"

#include <algorithm>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "planeio/context.h"
#include "planeio/io/buffered_stream.h"
#include "planeio/status.h"
#include "planeio/utilities/fmt.h"

namespace planeio {
namespace runtime {

void FormatRegistry::RegisterFormat(FormatDescriptor descriptor) {
  auto shared = std::make_shared<const FormatDescriptor>(std::move(descriptor));

  absl::MutexLock lock(&mutex_);

  auto existing = std::find_if(
      formats_.begin(), formats_.end(), [&](const auto& format) {
        return absl::EqualsIgnoreCase(format->format_name,
                                      shared->format_name);
      });
  if (existing != formats_.end()) {
    LOG(WARNING) << "Replacing registered format " << shared->format_name;
    formats_.erase(existing);
  }

  // Insert after every descriptor of equal or higher priority.
  auto position = std::find_if(
      formats_.begin(), formats_.end(), [&](const auto& format) {
        return format->priority < shared->priority;
      });
  formats_.insert(position, std::move(shared));
}

void FormatRegistry::RegisterFormats(
    std::vector<FormatDescriptor> descriptors) {
  for (auto& desc : descriptors) {
    RegisterFormat(std::move(desc));
  }
}

std::vector<std::shared_ptr<const FormatDescriptor>> FormatRegistry::Snapshot()
    const {
  absl::ReaderMutexLock lock(&mutex_);
  return formats_;
}

std::shared_ptr<const FormatDescriptor> FormatRegistry::GetFormat(
    std::string_view format_name) const {
  absl::ReaderMutexLock lock(&mutex_);
  for (const auto& format : formats_) {
    if (absl::EqualsIgnoreCase(format->format_name, format_name)) {
      return format;
    }
  }
  return nullptr;
}

std::shared_ptr<const FormatDescriptor> FormatRegistry::GetFormatForSuffix(
    std::string_view id) const {
  absl::ReaderMutexLock lock(&mutex_);
  for (const auto& format : formats_) {
    if (format->HasSuffix(id)) {
      return format;
    }
  }
  return nullptr;
}

std::shared_ptr<const FormatDescriptor> FormatRegistry::GetWriterFormat(
    std::string_view id) const {
  absl::ReaderMutexLock lock(&mutex_);
  for (const auto& format : formats_) {
    if (format->create_writer && format->HasSuffix(id)) {
      return format;
    }
  }
  return nullptr;
}

std::vector<std::string> FormatRegistry::ListFormats() const {
  absl::ReaderMutexLock lock(&mutex_);
  std::vector<std::string> names;
  names.reserve(formats_.size());
  for (const auto& format : formats_) {
    names.push_back(format->format_name);
  }
  return names;
}

std::vector<std::string> FormatRegistry::ListFormatsByCapability(
    FormatCapability capability) const {
  absl::ReaderMutexLock lock(&mutex_);
  std::vector<std::string> names;
  for (const auto& format : formats_) {
    if (format->HasCapability(capability)) {
      names.push_back(format->format_name);
    }
  }
  return names;
}

size_t FormatRegistry::GetMaxProbeLength() const {
  absl::ReaderMutexLock lock(&mutex_);
  size_t length = 0;
  for (const auto& format : formats_) {
    length = std::max(length, format->probe_length);
  }
  return length;
}

absl::StatusOr<std::shared_ptr<const FormatDescriptor>> FormatRegistry::Match(
    Context& context, std::string_view id) const {
  const auto formats = Snapshot();

  size_t probe_length = 0;
  for (const auto& format : formats) {
    probe_length = std::max(probe_length, format->probe_length);
  }

  // One bounded prefix serves every probe.
  std::vector<uint8_t> prefix(probe_length);
  size_t available = 0;
  if (probe_length > 0) {
    StreamOptions options;
    options.buffer_size = probe_length;
    DECLARE_ASSIGN_OR_RETURN_MOVE(
        std::unique_ptr<io::BufferedStream>, stream,
        context.OpenStream(id, io::OpenMode::kRead, options),
        fmt::format("Failed to open {} for identification", id));
    ASSIGN_OR_RETURN(available, stream->Read(prefix), "");
    RETURN_IF_ERROR(stream->Close(), "");
  }
  const std::span<const uint8_t> view(prefix.data(), available);

  for (const auto& format : formats) {
    if (format->Matches(id, view)) {
      return format;
    }
  }
  return MAKE_STATUS(ErrorKind::kUnsupportedFormat,
                     fmt::format("No registered format matches {}", id));
}

absl::StatusOr<FormatIdentity> FormatRegistry::Identify(
    Context& context, std::string_view id) const {
  return IdentifyAtDepth(context, id, 0);
}

absl::StatusOr<FormatIdentity> FormatRegistry::IdentifyAtDepth(
    Context& context, std::string_view id, int depth) const {
  if (depth > kMaxContainerDepth) {
    return MAKE_STATUS(
        ErrorKind::kFormat,
        fmt::format("Containers nested deeper than {} levels at {}",
                    kMaxContainerDepth, id));
  }

  DECLARE_ASSIGN_OR_RETURN_MOVE(std::shared_ptr<const FormatDescriptor>,
                                format, Match(context, id), "");

  FormatIdentity identity;
  identity.format = format;
  identity.chain.push_back(format->format_name);
  if (!format->IsContainer()) {
    identity.inner = format;
    identity.inner_id = std::string(id);
    return identity;
  }

  DECLARE_ASSIGN_OR_RETURN_MOVE(UnwrapResult, unwrapped,
                                format->unwrap(context, id),
                                fmt::format("Failed to unwrap {}", id));
  VLOG(1) << "Identifying " << unwrapped.inner_id << " inside "
          << format->format_name << " container " << id;

  auto inner = IdentifyAtDepth(context, unwrapped.inner_id, depth + 1);
  for (const auto& mapped : unwrapped.mapped_ids) {
    context.GetLocation().Unmap(mapped);
  }
  RETURN_IF_ERROR(inner.status(), "");

  identity.inner = inner->inner;
  identity.inner_id = inner->inner_id;
  identity.chain.insert(identity.chain.end(), inner->chain.begin(),
                        inner->chain.end());
  return identity;
}

void FormatRegistry::Clear() {
  absl::MutexLock lock(&mutex_);
  formats_.clear();
}

}  // namespace runtime
}  // namespace planeio
