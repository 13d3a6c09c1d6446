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

#include "planeio/reader.h"

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <vector>

#include "planeio/context.h"
#include "planeio/io/byte_order.h"
#include "planeio/status.h"
#include "planeio/testing/test_util.h"

namespace planeio {

namespace {

// Float word with a non-canonical NaN payload.
constexpr uint32_t kOddNan = 0x7fa00001;

}  // namespace

class ReaderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    // 4x3 8-bit graymap with a comment.
    context_.GetLocation().MapBytes(
        "gray.pgm",
        testutil::ToBytes("P5\n# \x01scanner\n4 3\n255\n"));
    auto bytes = *context_.GetLocation().GetBytes("gray.pgm");
    const auto raster = testutil::MakeSequence(12);
    bytes.insert(bytes.end(), raster.begin(), raster.end());
    context_.GetLocation().MapBytes("gray.pgm", bytes);
  }

  // 3x1 big-endian float ICS holding 1.5, NaN (odd payload) and -2.
  void WriteFloatIcs(const std::string& id) {
    Metadata metadata;
    metadata.AddImage(ImageMetadata::Create(3, 1, PixelType::kFloat));
    context_.GetLocation().MapBytes(id);
    auto writer = context_.OpenWriter(id, metadata);
    ASSERT_TRUE(writer.ok()) << writer.status();

    std::vector<uint8_t> plane(12);
    io::StoreValue<float>(1.5f, plane.data(), false);
    io::StoreValue<uint32_t>(kOddNan, plane.data() + 4, false);
    io::StoreValue<float>(-2.0f, plane.data() + 8, false);
    ASSERT_TRUE((*writer)->SavePlane(0, 0, plane).ok());
    ASSERT_TRUE((*writer)->Close().ok());
  }

  Context context_;
};

// ============================================================================
// Plane access checks
// ============================================================================

TEST_F(ReaderTest, OutOfRangeRequestsAreBoundsErrors) {
  auto reader = context_.OpenReader("gray.pgm");
  ASSERT_TRUE(reader.ok()) << reader.status();
  Reader& r = **reader;

  EXPECT_TRUE(IsBoundsError(r.OpenPlane(1, 0).status()));
  EXPECT_TRUE(IsBoundsError(r.OpenPlane(-1, 0).status()));
  EXPECT_TRUE(IsBoundsError(r.OpenPlane(0, 1).status()));
  EXPECT_TRUE(IsBoundsError(r.OpenPlane(0, -1).status()));
  EXPECT_TRUE(IsBoundsError(r.OpenPlane(0, 0, PlaneRegion{3, 0, 2, 1}).status()));
  EXPECT_TRUE(IsBoundsError(r.OpenPlane(0, 0, PlaneRegion{0, 0, 4, 4}).status()));
  EXPECT_TRUE(IsBoundsError(r.OpenPlane(0, 0, PlaneRegion{-1, 0, 1, 1}).status()));
  EXPECT_EQ(r.OpenPlane(1, 0).status().code(), absl::StatusCode::kOutOfRange);

  // Edge regions are valid, including empty ones.
  auto corner = r.OpenPlane(0, 0, PlaneRegion{3, 2, 1, 1});
  ASSERT_TRUE(corner.ok()) << corner.status();
  EXPECT_EQ(corner->bytes, (std::vector<uint8_t>{11}));
  auto empty = r.OpenPlane(0, 0, PlaneRegion{4, 3, 0, 0});
  ASSERT_TRUE(empty.ok()) << empty.status();
  EXPECT_TRUE(empty->bytes.empty());
}

TEST_F(ReaderTest, CallerOwnedPlaneIsReused) {
  auto reader = context_.OpenReader("gray.pgm");
  ASSERT_TRUE(reader.ok()) << reader.status();

  Plane plane;
  ASSERT_TRUE((*reader)->OpenPlane(0, 0, PlaneRegion{0, 0, 4, 3}, plane).ok());
  EXPECT_EQ(plane.bytes, testutil::MakeSequence(12));
  ASSERT_TRUE((*reader)->OpenPlane(0, 0, PlaneRegion{1, 1, 2, 2}, plane).ok());
  EXPECT_EQ(plane.bytes, (std::vector<uint8_t>{5, 6, 9, 10}));
  EXPECT_EQ(plane.region, (PlaneRegion{1, 1, 2, 2}));
  EXPECT_EQ(plane.pixel_type, PixelType::kUInt8);
}

TEST_F(ReaderTest, ClosedReaderRefusesPlanes) {
  auto reader = context_.OpenReader("gray.pgm");
  ASSERT_TRUE(reader.ok()) << reader.status();
  EXPECT_TRUE((*reader)->IsOpen());
  ASSERT_TRUE((*reader)->Close().ok());
  EXPECT_FALSE((*reader)->IsOpen());
  EXPECT_EQ((*reader)->GetMetadata(), nullptr);
  EXPECT_TRUE(IsClosedError((*reader)->OpenPlane(0, 0).status()));
  EXPECT_TRUE((*reader)->Close().ok());
}

TEST_F(ReaderTest, OversizedPlanesNeedRegions) {
  // 100000x100000 graymap header with only one row of real data.
  auto bytes = testutil::ToBytes("P5\n100000 100000\n255\n");
  const auto row = testutil::MakeSequence(16);
  bytes.insert(bytes.end(), row.begin(), row.end());
  context_.GetLocation().MapBytes("huge.pgm", bytes);

  auto reader = context_.OpenReader("huge.pgm");
  ASSERT_TRUE(reader.ok()) << reader.status();
  auto full = (*reader)->OpenPlane(0, 0);
  ASSERT_FALSE(full.ok());
  EXPECT_TRUE(HasErrorKind(full.status(), ErrorKind::kResourceExhausted))
      << full.status();

  auto strip = (*reader)->OpenPlane(0, 0, PlaneRegion{0, 0, 16, 1});
  ASSERT_TRUE(strip.ok()) << strip.status();
  EXPECT_EQ(strip->bytes, row);
}

TEST_F(ReaderTest, UnknownFormatIsUnsupported) {
  context_.GetLocation().MapBytes("mystery.dat", testutil::MakeSequence(64));
  auto reader = context_.OpenReader("mystery.dat");
  ASSERT_FALSE(reader.ok());
  EXPECT_TRUE(IsUnsupportedFormatError(reader.status())) << reader.status();
  EXPECT_EQ(reader.status().code(), absl::StatusCode::kUnimplemented);
}

// ============================================================================
// Raw metadata options
// ============================================================================

TEST_F(ReaderTest, OriginalMetadataCanBeDropped) {
  ReaderOptions options;
  options.parser.original_metadata_populated = false;
  auto reader = context_.OpenReader("gray.pgm", options);
  ASSERT_TRUE(reader.ok()) << reader.status();
  EXPECT_TRUE((*reader)->GetMetadata()->GetTable().empty());
  EXPECT_EQ((*reader)->GetMetadata()->GetImages()[0].GetSizeX(), 4);
}

TEST_F(ReaderTest, MetadataFilterCleansTable) {
  ReaderOptions options;
  options.parser.metadata_filtered = true;
  options.parser.filter.excluded_prefixes = {"Max"};
  auto reader = context_.OpenReader("gray.pgm", options);
  ASSERT_TRUE(reader.ok()) << reader.status();
  const MetadataTable& table = (*reader)->GetMetadata()->GetTable();
  EXPECT_EQ(table.GetString("Comment"), "scanner");
  EXPECT_FALSE(table.contains("Maximum value"));
  EXPECT_TRUE(table.contains("Width"));
}

// ============================================================================
// Float normalization
// ============================================================================

TEST_F(ReaderTest, FloatsKeepStoredOrderByDefault) {
  WriteFloatIcs("float.ics");
  auto reader = context_.OpenReader("float.ics");
  ASSERT_TRUE(reader.ok()) << reader.status();
  auto plane = (*reader)->OpenPlane(0, 0);
  ASSERT_TRUE(plane.ok()) << plane.status();
  EXPECT_FALSE(plane->little_endian);
  EXPECT_EQ(io::LoadValue<uint32_t>(plane->bytes.data() + 4, false), kOddNan);
}

TEST_F(ReaderTest, NormalizedFloatsAreCanonicalNativeOrder) {
  WriteFloatIcs("float.ics");
  ReaderOptions options;
  options.normalized = true;
  auto reader = context_.OpenReader("float.ics", options);
  ASSERT_TRUE(reader.ok()) << reader.status();
  EXPECT_TRUE((*reader)->IsNormalized());

  auto plane = (*reader)->OpenPlane(0, 0);
  ASSERT_TRUE(plane.ok()) << plane.status();
  EXPECT_EQ(plane->little_endian, io::kHostLittleEndian);

  float values[3];
  std::memcpy(values, plane->bytes.data(), sizeof(values));
  EXPECT_FLOAT_EQ(values[0], 1.5f);
  EXPECT_TRUE(std::isnan(values[1]));
  EXPECT_FLOAT_EQ(values[2], -2.0f);

  const float canonical = std::numeric_limits<float>::quiet_NaN();
  EXPECT_EQ(std::memcmp(&values[1], &canonical, sizeof(float)), 0);

  auto decoded = plane->Decode();
  ASSERT_TRUE(decoded.ok()) << decoded.status();
  EXPECT_FLOAT_EQ(decoded->GetDataAs<float>()[2], -2.0f);
}

TEST_F(ReaderTest, NormalizationPassesThroughContainers) {
  WriteFloatIcs("float.ics");
  auto bytes = context_.GetLocation().GetBytes("float.ics");
  ASSERT_TRUE(bytes.ok());
  context_.GetLocation().MapBytes("float.ics.gz",
                                  testutil::GzipBytes(*bytes));

  ReaderOptions options;
  options.normalized = true;
  auto reader = context_.OpenReader("float.ics.gz", options);
  ASSERT_TRUE(reader.ok()) << reader.status();
  auto plane = (*reader)->OpenPlane(0, 0);
  ASSERT_TRUE(plane.ok()) << plane.status();
  EXPECT_EQ(plane->little_endian, io::kHostLittleEndian);
  float first = 0;
  std::memcpy(&first, plane->bytes.data(), sizeof(first));
  EXPECT_FLOAT_EQ(first, 1.5f);
}

TEST(NormalizeFloatPlaneTest, IntegerPlanesAreUntouched) {
  Plane plane;
  plane.pixel_type = PixelType::kUInt16;
  plane.bits_per_pixel = 16;
  plane.little_endian = !io::kHostLittleEndian;
  plane.bytes = {1, 2};
  NormalizeFloatPlane(plane);
  EXPECT_EQ(plane.bytes, (std::vector<uint8_t>{1, 2}));
  EXPECT_EQ(plane.little_endian, !io::kHostLittleEndian);
}

TEST(NormalizeFloatPlaneTest, DoublesAreSwapped) {
  Plane plane;
  plane.pixel_type = PixelType::kDouble;
  plane.bits_per_pixel = 64;
  plane.little_endian = !io::kHostLittleEndian;
  plane.bytes.resize(8);
  io::StoreValue<double>(0.25, plane.bytes.data(), plane.little_endian);
  NormalizeFloatPlane(plane);
  double value = 0;
  std::memcpy(&value, plane.bytes.data(), sizeof(value));
  EXPECT_DOUBLE_EQ(value, 0.25);
}

}  // namespace planeio
