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

#include "planeio/context.h"

#include <utility>

#include "absl/strings/str_format.h"
#include "planeio/runtime/builtin_formats.h"
#include "planeio/status.h"

namespace planeio {

Context::Context() : registry_(runtime::CreateBuiltinRegistry()) {}

Context::Context(std::shared_ptr<const FormatRegistry> registry)
    : registry_(std::move(registry)) {}

absl::StatusOr<std::unique_ptr<io::BufferedStream>> Context::OpenStream(
    std::string_view id, io::OpenMode mode, const StreamOptions& options) {
  DECLARE_ASSIGN_OR_RETURN_MOVE(std::unique_ptr<io::Handle>, handle,
                                location_.OpenHandle(id, mode), "");
  return io::BufferedStream::Open(std::move(handle), options);
}

absl::StatusOr<FormatIdentity> Context::Identify(std::string_view id) {
  return registry_->Identify(*this, id);
}

absl::StatusOr<std::unique_ptr<Reader>> Context::OpenReader(
    std::string_view id, const ReaderOptions& options) {
  DECLARE_ASSIGN_OR_RETURN_MOVE(FormatIdentity, identity, Identify(id), "");
  if (!identity.format->create_reader) {
    return MAKE_STATUS(ErrorKind::kUnsupportedFormat,
                       absl::StrFormat("No reader for %s format of %s",
                                       identity.format->format_name, id));
  }
  auto reader = identity.format->create_reader();
  RETURN_IF_ERROR(reader->SetSource(*this, id, options),
                  absl::StrFormat("Failed to open %s", id));
  return reader;
}

absl::StatusOr<std::unique_ptr<Writer>> Context::OpenWriter(
    std::string_view id, const Metadata& metadata,
    const WriterOptions& options) {
  auto format = registry_->GetWriterFormat(id);
  if (format == nullptr) {
    return MAKE_STATUS(ErrorKind::kUnsupportedFormat,
                       absl::StrFormat("No writer for suffix of %s", id));
  }
  auto writer = format->create_writer();
  RETURN_IF_ERROR(writer->SetDest(*this, id, metadata, options),
                  absl::StrFormat("Failed to create %s", id));
  return writer;
}

}  // namespace planeio
