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

#include <gtest/gtest.h>

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/match.h"

namespace planeio {

namespace {

absl::StatusOr<int> FailWithBounds() {
  return MAKE_STATUS(ErrorKind::kBounds, "plane 9 out of range");
}

absl::Status PropagateStatus() {
  RETURN_IF_ERROR(FailWithBounds().status(), "while opening plane");
  return absl::OkStatus();
}

absl::StatusOr<int> PropagateValue() {
  DECLARE_ASSIGN_OR_RETURN_MOVE(int, value, FailWithBounds(), "outer");
  return value + 1;
}

absl::StatusOr<int> Succeed() {
  DECLARE_ASSIGN_OR_RETURN_MOVE(int, value, absl::StatusOr<int>(41));
  return value + 1;
}

}  // namespace

TEST(StatusTest, KindsMapToStatusCodes) {
  EXPECT_EQ(MakeError(ErrorKind::kFormat, "x").code(),
            absl::StatusCode::kDataLoss);
  EXPECT_EQ(MakeError(ErrorKind::kUnsupportedFormat, "x").code(),
            absl::StatusCode::kUnimplemented);
  EXPECT_EQ(MakeError(ErrorKind::kClosed, "x").code(),
            absl::StatusCode::kFailedPrecondition);
  EXPECT_EQ(MakeError(ErrorKind::kEndOfFile, "x").code(),
            absl::StatusCode::kOutOfRange);
  EXPECT_EQ(MakeError(ErrorKind::kIo, absl::StatusCode::kNotFound, "x").code(),
            absl::StatusCode::kNotFound);
}

TEST(StatusTest, KindSurvivesPropagation) {
  auto status = PropagateStatus();
  ASSERT_FALSE(status.ok());
  EXPECT_TRUE(IsBoundsError(status));
  EXPECT_EQ(GetErrorKind(status), ErrorKind::kBounds);

  auto value = PropagateValue();
  ASSERT_FALSE(value.ok());
  EXPECT_TRUE(IsBoundsError(value.status()));
}

TEST(StatusTest, TraceKeepsRootMessageAndAddsFrames) {
  auto status = PropagateStatus();
  const std::string message(status.message());
  EXPECT_EQ(status::StripStackTrace(message), "plane 9 out of range");
  EXPECT_TRUE(absl::StrContains(message, "at FailWithBounds"));
  EXPECT_TRUE(absl::StrContains(message, "at PropagateStatus"));
  EXPECT_TRUE(absl::StrContains(message, "while opening plane"));
}

TEST(StatusTest, ForeignErrorsHaveNoKind) {
  EXPECT_FALSE(GetErrorKind(absl::InternalError("boom")).has_value());
  EXPECT_FALSE(GetErrorKind(absl::OkStatus()).has_value());
  EXPECT_FALSE(HasErrorKind(absl::InternalError("boom"), ErrorKind::kIo));
}

TEST(StatusTest, SuccessPassesThrough) {
  auto value = Succeed();
  ASSERT_TRUE(value.ok());
  EXPECT_EQ(*value, 42);
  EXPECT_TRUE(status::AddTrace(absl::OkStatus(), "f", "f.cpp", 1).ok());
}

}  // namespace planeio
