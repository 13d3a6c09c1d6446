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

#include "planeio/status.h"

#include <optional>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/strings/cord.h"

namespace planeio {

absl::Status MakeError(ErrorKind kind, absl::StatusCode code,
                       std::string_view message) {
  absl::Status status(code, message);
  status.SetPayload(kErrorKindPayloadUrl, absl::Cord(GetName(kind)));
  return status;
}

std::optional<ErrorKind> GetErrorKind(const absl::Status& status) {
  if (status.ok()) {
    return std::nullopt;
  }
  auto payload = status.GetPayload(kErrorKindPayloadUrl);
  if (!payload.has_value()) {
    return std::nullopt;
  }
  const std::string name(*payload);
  for (ErrorKind kind :
       {ErrorKind::kFormat, ErrorKind::kUnsupportedFormat, ErrorKind::kIo,
        ErrorKind::kEndOfFile, ErrorKind::kClosed, ErrorKind::kBounds,
        ErrorKind::kEnumeration, ErrorKind::kInvalidArgument,
        ErrorKind::kResourceExhausted}) {
    if (name == GetName(kind)) {
      return kind;
    }
  }
  return std::nullopt;
}

namespace status {

std::string FormatStackFrame(char const* function, char const* file, int line,
                             absl::StatusCode code, std::string_view message) {
  std::string s = "  at ";
  s.append(function);
  s.append(" (");
  s.append(file);
  s.push_back(':');
  s.append(std::to_string(line));
  s.append(") [");
  s.append(absl::StatusCodeToString(code));
  s.append("]");

  if (!message.empty()) {
    s.append(" - ");
    s.append(message);
  }
  return s;
}

std::string StripStackTrace(std::string_view full_message) {
  if (auto pos = full_message.find("\n  at "); pos != std::string_view::npos) {
    return std::string(full_message.substr(0, pos));
  }
  return std::string(full_message);
}

absl::Status AddTrace(absl::Status const& st, char const* function,
                      char const* file, int line, std::string_view message) {
  if (st.ok()) {
    return st;
  }

  std::string out = StripStackTrace(st.message());
  if (auto pos = st.message().find("\n  at ");
      pos != std::string_view::npos) {
    out.append(st.message().substr(pos));
  }
  out.push_back('\n');
  out += FormatStackFrame(function, file, line, st.code(), message);

  absl::Status traced(st.code(), out);
  st.ForEachPayload([&traced](std::string_view url, const absl::Cord& payload) {
    traced.SetPayload(url, payload);
  });
  return traced;
}

}  // namespace status
}  // namespace planeio
