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

#ifndef PLANEIO_INCLUDE_PLANEIO_STATUS_H_
#define PLANEIO_INCLUDE_PLANEIO_STATUS_H_

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/cord.h"

namespace planeio {

/// @brief Error categories surfaced by planeio
///
/// Every error produced by the library carries one of these kinds as a
/// status payload, so callers can tell "unsupported" from "corrupt" and
/// "closed" from "end of file" without parsing messages. The absl status
/// code is derived from the kind (see ToStatusCode).
enum class ErrorKind {
  kFormat,             ///< Malformed content
  kUnsupportedFormat,  ///< No registered format matches the resource
  kIo,                 ///< Backing-store failure or missing resource
  kEndOfFile,          ///< Read past the logical end of a stream
  kClosed,             ///< Operation on a closed resource
  kBounds,             ///< Invalid series, plane, region or offset
  kEnumeration,        ///< Value matches no enumerated term
  kInvalidArgument,    ///< Other caller misuse
  kResourceExhausted,  ///< A hard search or size cap was exceeded
};

/// @brief Payload URL under which the error kind is stored
inline constexpr std::string_view kErrorKindPayloadUrl =
    "type.planeio/error_kind";

/// @brief Get string representation of an error kind
constexpr const char* GetName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kFormat:
      return "FormatError";
    case ErrorKind::kUnsupportedFormat:
      return "UnsupportedFormatError";
    case ErrorKind::kIo:
      return "IOError";
    case ErrorKind::kEndOfFile:
      return "EndOfFileError";
    case ErrorKind::kClosed:
      return "ClosedError";
    case ErrorKind::kBounds:
      return "BoundsError";
    case ErrorKind::kEnumeration:
      return "EnumerationError";
    case ErrorKind::kInvalidArgument:
      return "InvalidArgumentError";
    case ErrorKind::kResourceExhausted:
      return "ResourceExhaustedError";
  }
  return "unknown";
}

/// @brief Default absl status code for an error kind
constexpr absl::StatusCode ToStatusCode(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kFormat:
      return absl::StatusCode::kDataLoss;
    case ErrorKind::kUnsupportedFormat:
      return absl::StatusCode::kUnimplemented;
    case ErrorKind::kIo:
      return absl::StatusCode::kInternal;
    case ErrorKind::kEndOfFile:
    case ErrorKind::kBounds:
      return absl::StatusCode::kOutOfRange;
    case ErrorKind::kClosed:
      return absl::StatusCode::kFailedPrecondition;
    case ErrorKind::kEnumeration:
    case ErrorKind::kInvalidArgument:
      return absl::StatusCode::kInvalidArgument;
    case ErrorKind::kResourceExhausted:
      return absl::StatusCode::kResourceExhausted;
  }
  return absl::StatusCode::kUnknown;
}

/// @brief Create a status of the given kind with an explicit code
/// @param kind Error kind stored as payload
/// @param code absl status code
/// @param message Error message
absl::Status MakeError(ErrorKind kind, absl::StatusCode code,
                       std::string_view message);

/// @brief Create a status of the given kind with its default code
inline absl::Status MakeError(ErrorKind kind, std::string_view message) {
  return MakeError(kind, ToStatusCode(kind), message);
}

/// @brief Extract the error kind of a status
/// @return The kind, or nullopt for OK statuses and foreign errors
std::optional<ErrorKind> GetErrorKind(const absl::Status& status);

/// @brief Check whether a status carries the given error kind
inline bool HasErrorKind(const absl::Status& status, ErrorKind kind) {
  auto actual = GetErrorKind(status);
  return actual.has_value() && *actual == kind;
}

inline bool IsFormatError(const absl::Status& status) {
  return HasErrorKind(status, ErrorKind::kFormat);
}

inline bool IsUnsupportedFormatError(const absl::Status& status) {
  return HasErrorKind(status, ErrorKind::kUnsupportedFormat);
}

inline bool IsIoError(const absl::Status& status) {
  return HasErrorKind(status, ErrorKind::kIo);
}

inline bool IsEndOfFileError(const absl::Status& status) {
  return HasErrorKind(status, ErrorKind::kEndOfFile);
}

inline bool IsClosedError(const absl::Status& status) {
  return HasErrorKind(status, ErrorKind::kClosed);
}

inline bool IsBoundsError(const absl::Status& status) {
  return HasErrorKind(status, ErrorKind::kBounds);
}

inline bool IsEnumerationError(const absl::Status& status) {
  return HasErrorKind(status, ErrorKind::kEnumeration);
}

namespace status {

/**
 * @brief Formats a single stack-frame line.
 *
 * Produces a line of the form:
 *     "  at FunctionName (file.cpp:123) [StatusCode] - optional message"
 *
 * @param function Name of the function.
 * @param file     Source file path.
 * @param line     Source line number.
 * @param code     Status code for this frame.
 * @param message  Optional message to append.
 * @return A formatted frame string.
 */
std::string FormatStackFrame(char const* function, char const* file, int line,
                             absl::StatusCode code, std::string_view message);

/**
 * @brief Strips any existing stack-frame lines from a full message,
 *        leaving only the root error text.
 *
 * @param full_message The full status message, possibly containing frames.
 * @return The root message without any frames.
 */
std::string StripStackTrace(std::string_view full_message);

/**
 * @brief Appends exactly one new stack frame to a Status.
 *
 * If the input status is ok(), returns it unmodified. Otherwise the root
 * error text and earlier frames are kept, the new frame is appended and
 * every payload (including the planeio error kind) is carried over.
 *
 * @param st        Original absl::Status.
 * @param function  Name of the calling function.
 * @param file      Source file path.
 * @param line      Source line number.
 * @param message   Optional per-frame message.
 * @return A new absl::Status with the appended frame.
 */
absl::Status AddTrace(absl::Status const& st, char const* function,
                      char const* file, int line,
                      std::string_view message = {});

/// @brief Overload for absl::StatusOr<T>
template <typename T>
absl::StatusOr<T> AddTrace(absl::StatusOr<T> const& sor, char const* function,
                           char const* file, int line,
                           std::string_view message = {}) {
  if (sor.ok()) {
    return sor;
  }
  return AddTrace(sor.status(), function, file, line, message);
}

}  // namespace status
}  // namespace planeio

//------------------------------------------------------------------------------
// Macros
//------------------------------------------------------------------------------

/**
 * @brief Create a traced planeio error with an initial frame.
 *
 * @param kind    The planeio::ErrorKind to use.
 * @param message The error message.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define MAKE_STATUS(kind, message)                                      \
  ::planeio::status::AddTrace(::planeio::MakeError((kind), (message)), \
                              __func__, __FILE__, __LINE__, (message))

/**
 * @brief Create a traced planeio error with an explicit status code.
 *
 * @param kind    The planeio::ErrorKind to use.
 * @param code    The absl::StatusCode to use.
 * @param message The error message.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define MAKE_STATUS_WITH_CODE(kind, code, message)                         \
  ::planeio::status::AddTrace(::planeio::MakeError((kind), (code), (message)), \
                              __func__, __FILE__, __LINE__, (message))

/**
 * @brief Propagate an absl::Status, appending this function as a frame.
 *
 * @param expr  A Status-producing expression.
 * @param msg   Message for this frame (may be empty).
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while)
#define RETURN_IF_ERROR(expr, msg)                                          \
  do {                                                                      \
    auto _st = (expr);                                                      \
    if (!_st.ok()) {                                                        \
      return ::planeio::status::AddTrace(_st, __func__, __FILE__, __LINE__, \
                                         (msg));                            \
    }                                                                       \
  } while (0)

/**
 * @brief Unpack a StatusOr<T> into lhs or return on error with a trace.
 *
 * @param lhs   Target variable to assign (must be already declared).
 * @param expr  A StatusOr<T>-producing expression.
 * @param ...   Optional message for this frame.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while)
#define ASSIGN_OR_RETURN(lhs, expr, ...)                                    \
  do {                                                                      \
    auto _sor = (expr);                                                     \
    if (!_sor.ok()) {                                                       \
      return ::planeio::status::AddTrace(_sor.status(), __func__, __FILE__, \
                                         __LINE__, ##__VA_ARGS__);          \
    }                                                                       \
    lhs = std::move(_sor).value();                                          \
  } while (0)

/**
 * @brief Declare a variable and unpack a StatusOr<T> into it using move
 * semantics, returning a traced error on failure.
 *
 * @param type   The type of the variable to declare.
 * @param name   The name of the variable to declare.
 * @param expr   A StatusOr<T>-producing expression.
 * @param ...    Optional message for this frame.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define DECLARE_ASSIGN_OR_RETURN_MOVE(type, name, expr, ...) \
  type name;                                                 \
  ASSIGN_OR_RETURN(name, expr, ##__VA_ARGS__)

#endif  // PLANEIO_INCLUDE_PLANEIO_STATUS_H_
