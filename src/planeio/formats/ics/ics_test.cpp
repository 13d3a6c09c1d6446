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

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <iterator>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "planeio/context.h"
#include "planeio/formats/ics/ics_metadata.h"
#include "planeio/formats/ics/ics_writer.h"
#include "planeio/io/byte_order.h"
#include "planeio/status.h"
#include "planeio/testing/test_util.h"

namespace planeio {
namespace formats {
namespace ics {

namespace {

// Stored value of pixel (x, y) of plane p.
uint16_t SampleValue(int64_t p, int64_t x, int64_t y) {
  return static_cast<uint16_t>(1000 * p + 16 * y + x);
}

std::vector<uint8_t> MakePlane(int64_t p, int64_t width, int64_t height,
                               bool little_endian) {
  std::vector<uint8_t> bytes(static_cast<size_t>(width * height) * 2);
  for (int64_t y = 0; y < height; ++y) {
    for (int64_t x = 0; x < width; ++x) {
      io::StoreValue<uint16_t>(SampleValue(p, x, y),
                               bytes.data() + 2 * (y * width + x),
                               little_endian);
    }
  }
  return bytes;
}

std::string TextOf(const std::vector<uint8_t>& bytes) {
  return std::string(bytes.begin(), bytes.end());
}

}  // namespace

class IcsTest : public ::testing::Test {
 protected:
  static constexpr int64_t kWidth = 6;
  static constexpr int64_t kHeight = 4;

  // 6x4 uint16 with two channels and three z-slices, X scaled in microns.
  Metadata& MakeStackMetadata() {
    auto image = ImageMetadata::Create(
        kWidth, kHeight, PixelType::kUInt16,
        {Axis{.type = AxisType::kChannel, .length = 2},
         Axis{.type = AxisType::kZ, .length = 3, .scale = 0.25, .unit = "um"}});
    image.axes[0].scale = 0.5;
    image.axes[0].unit = "um";
    metadata_.AddImage(std::move(image));
    return metadata_;
  }

  void WriteStack(const std::string& id, const WriterOptions& options = {}) {
    context_.GetLocation().MapBytes(id);
    auto writer = context_.OpenWriter(id, metadata_, options);
    ASSERT_TRUE(writer.ok()) << writer.status();
    const int64_t planes = metadata_.GetImages()[0].GetPlaneCount();
    // Planes in reverse order: the data block is addressed, not appended.
    for (int64_t p = planes - 1; p >= 0; --p) {
      auto status =
          (*writer)->SavePlane(0, p, MakePlane(p, kWidth, kHeight, false));
      ASSERT_TRUE(status.ok()) << status;
    }
    ASSERT_TRUE((*writer)->Close().ok());
  }

  void ExpectStack(const std::string& id, const ReaderOptions& options = {}) {
    auto reader = context_.OpenReader(id, options);
    ASSERT_TRUE(reader.ok()) << reader.status();
    const ImageMetadata& image = (*reader)->GetMetadata()->GetImages()[0];
    EXPECT_EQ(image.GetDimensionOrder(), "XYCZ");
    EXPECT_EQ(image.GetSizeX(), kWidth);
    EXPECT_EQ(image.GetSizeY(), kHeight);
    EXPECT_EQ(image.GetPlaneCount(), 6);
    EXPECT_EQ(image.pixel_type, PixelType::kUInt16);

    for (int64_t p = 0; p < 6; ++p) {
      auto plane = (*reader)->OpenPlane(0, p);
      ASSERT_TRUE(plane.ok()) << plane.status();
      auto pixels = plane->Decode();
      ASSERT_TRUE(pixels.ok()) << pixels.status();
      const auto values = pixels->As<uint16_t>();
      for (int64_t y = 0; y < kHeight; ++y) {
        for (int64_t x = 0; x < kWidth; ++x) {
          ASSERT_EQ(values[y * kWidth + x], SampleValue(p, x, y))
              << "plane " << p << " at " << x << "," << y;
        }
      }
    }
    ASSERT_TRUE((*reader)->Close().ok());
  }

  Context context_;
  Metadata metadata_;
};

// ============================================================================
// Writing and reading back
// ============================================================================

TEST_F(IcsTest, RoundTripInMemory) {
  MakeStackMetadata();
  WriteStack("stack.ics");

  auto bytes = context_.GetLocation().GetBytes("stack.ics");
  ASSERT_TRUE(bytes.ok());
  const std::string text = TextOf(*bytes);
  EXPECT_TRUE(absl::StartsWith(text, "\t\nics_version\t2.0\n"));
  EXPECT_TRUE(absl::StrContains(text, "filename\tstack\n"));
  EXPECT_TRUE(absl::StrContains(text, "layout\torder\tbits\tx\ty\tch\tz\n"));
  EXPECT_TRUE(absl::StrContains(text, "layout\tsizes\t16\t6\t4\t2\t3\n"));

  const size_t header_end = text.find("end\n") + 4;
  EXPECT_EQ(bytes->size(), header_end + kWidth * kHeight * 6 * 2);

  ExpectStack("stack.ics");
}

TEST_F(IcsTest, HeaderRecordsAreExposed) {
  MakeStackMetadata();
  WriteStack("stack.ics");

  auto reader = context_.OpenReader("stack.ics");
  ASSERT_TRUE(reader.ok()) << reader.status();
  const Metadata* metadata = (*reader)->GetMetadata();
  EXPECT_EQ(metadata->GetFormatName(), "ICS");
  EXPECT_EQ(metadata->GetTable().GetString("layout order"),
            "bits x y ch z");
  EXPECT_EQ(metadata->GetTable().GetString("representation sign"),
            "unsigned");

  const auto* ics = dynamic_cast<const IcsMetadata*>(metadata);
  ASSERT_NE(ics, nullptr);
  EXPECT_EQ(ics->GetVersion(), "2.0");
  EXPECT_FALSE(ics->HasCompanionData());

  const ImageMetadata& image = metadata->GetImages()[0];
  EXPECT_EQ(image.name, "stack");
  EXPECT_DOUBLE_EQ(image.axes[0].scale, 0.5);
  EXPECT_EQ(image.axes[0].unit, "um");
  EXPECT_DOUBLE_EQ(image.axes[3].scale, 0.25);
  EXPECT_TRUE(image.axes[2].unit.empty());
}

TEST_F(IcsTest, RoundTripThroughFile) {
  const auto dir = std::filesystem::temp_directory_path() / "planeio_ics_test";
  std::filesystem::create_directories(dir);
  const std::string path = (dir / "stack.ics").string();

  MakeStackMetadata();
  {
    auto writer = context_.OpenWriter(path, metadata_);
    ASSERT_TRUE(writer.ok()) << writer.status();
    for (int64_t p = 0; p < 6; ++p) {
      ASSERT_TRUE(
          (*writer)->SavePlane(0, p, MakePlane(p, kWidth, kHeight, false))
              .ok());
    }
    ASSERT_TRUE((*writer)->Close().ok());
  }
  ExpectStack(path);
  std::filesystem::remove_all(dir);
}

TEST_F(IcsTest, OutputOrderInterleavesChannels) {
  MakeStackMetadata();
  WriterOptions options;
  options.output_order = "CXYZ";
  WriteStack("interleaved.ics", options);

  auto bytes = context_.GetLocation().GetBytes("interleaved.ics");
  ASSERT_TRUE(bytes.ok());
  const std::string text = TextOf(*bytes);
  EXPECT_TRUE(absl::StrContains(text, "layout\torder\tbits\tch\tx\ty\tz\n"));

  // First stored pixel holds both channels of plane 0 and plane 1.
  const size_t data = text.find("end\n") + 4;
  EXPECT_EQ(io::LoadValue<uint16_t>(bytes->data() + data, false),
            SampleValue(0, 0, 0));
  EXPECT_EQ(io::LoadValue<uint16_t>(bytes->data() + data + 2, false),
            SampleValue(1, 0, 0));

  // Declared order is X, Y, then file order; plane indices are unchanged.
  ExpectStack("interleaved.ics");
}

TEST_F(IcsTest, RegionsAndForeignByteOrder) {
  MakeStackMetadata();
  context_.GetLocation().MapBytes("regions.ics");
  auto writer = context_.OpenWriter("regions.ics", metadata_);
  ASSERT_TRUE(writer.ok()) << writer.status();

  for (int64_t p = 0; p < 6; ++p) {
    const auto full = MakePlane(p, kWidth, kHeight, true);
    // Top and bottom halves as separate little-endian regions.
    for (int64_t half = 0; half < 2; ++half) {
      Plane plane;
      plane.region = PlaneRegion{0, half * 2, kWidth, 2};
      plane.pixel_type = PixelType::kUInt16;
      plane.bits_per_pixel = 16;
      plane.little_endian = true;
      const size_t offset = static_cast<size_t>(half * 2 * kWidth * 2);
      plane.bytes.assign(full.begin() + offset,
                         full.begin() + offset + kWidth * 2 * 2);
      auto status = (*writer)->SavePlane(0, p, plane);
      ASSERT_TRUE(status.ok()) << status;
    }
  }
  ASSERT_TRUE((*writer)->Close().ok());
  ExpectStack("regions.ics");

  auto reader = context_.OpenReader("regions.ics");
  ASSERT_TRUE(reader.ok());
  auto plane = (*reader)->OpenPlane(0, 4, PlaneRegion{2, 1, 3, 2});
  ASSERT_TRUE(plane.ok()) << plane.status();
  auto pixels = plane->Decode();
  ASSERT_TRUE(pixels.ok());
  const auto values = pixels->As<uint16_t>();
  EXPECT_EQ(values[0], SampleValue(4, 2, 1));
  EXPECT_EQ(values[5], SampleValue(4, 4, 2));
}

// ============================================================================
// Version 1.0 and compressed data
// ============================================================================

TEST_F(IcsTest, Version1ReadsCompanionData) {
  const std::string header =
      "\t\n"
      "ics_version\t1.0\n"
      "filename\told\n"
      "layout\tparameters\t3\n"
      "layout\torder\tbits\tx\ty\n"
      "layout\tsizes\t16\t3\t2\n"
      "representation\tformat\tinteger\n"
      "representation\tsign\tsigned\n"
      "representation\tbyte_order\t1\t2\n"
      "end\n";
  context_.GetLocation().MapBytes("dir/old.ics", testutil::ToBytes(header));

  std::vector<uint8_t> data(12);
  const int16_t values[] = {-3, -2, -1, 0, 1, 32767};
  for (int i = 0; i < 6; ++i) {
    io::StoreValue<int16_t>(values[i], data.data() + 2 * i, true);
  }
  context_.GetLocation().MapBytes("dir/old.ids", data);

  // The data file is recognised by suffix and redirected to its header.
  auto reader = context_.OpenReader("dir/old.ids");
  ASSERT_TRUE(reader.ok()) << reader.status();
  const auto* ics =
      dynamic_cast<const IcsMetadata*>((*reader)->GetMetadata());
  ASSERT_NE(ics, nullptr);
  EXPECT_EQ(ics->GetSourceId(), "dir/old.ics");
  EXPECT_EQ(ics->GetDataId(), "dir/old.ids");
  EXPECT_TRUE(ics->HasCompanionData());

  const ImageMetadata& image = ics->GetImages()[0];
  EXPECT_EQ(image.pixel_type, PixelType::kInt16);
  EXPECT_TRUE(image.little_endian);

  auto plane = (*reader)->OpenPlane(0, 0);
  ASSERT_TRUE(plane.ok()) << plane.status();
  auto pixels = plane->Decode();
  ASSERT_TRUE(pixels.ok());
  const auto decoded = pixels->As<int16_t>();
  EXPECT_EQ(std::vector<int16_t>(decoded.begin(), decoded.end()),
            std::vector<int16_t>(std::begin(values), std::end(values)));
}

TEST_F(IcsTest, Version1WithoutDataFileIsNotFound) {
  context_.GetLocation().MapBytes(
      "lonely.ics", testutil::ToBytes("\t\nics_version\t1.0\n"
                                      "layout\torder\tbits\tx\ty\n"
                                      "layout\tsizes\t8\t2\t2\n"));
  auto reader = context_.OpenReader("lonely.ics");
  ASSERT_FALSE(reader.ok());
  EXPECT_TRUE(IsIoError(reader.status())) << reader.status();
  EXPECT_EQ(reader.status().code(), absl::StatusCode::kNotFound);
}

TEST_F(IcsTest, GzipCompressedData) {
  std::vector<uint8_t> raw(4 * 3);
  for (size_t i = 0; i < raw.size(); ++i) {
    raw[i] = static_cast<uint8_t>(i * 7);
  }
  std::vector<uint8_t> file = testutil::ToBytes(
      "\t\nics_version\t2.0\n"
      "layout\torder\tbits\tx\ty\n"
      "layout\tsizes\t8\t4\t3\n"
      "representation\tcompression\tgzip\n"
      "end\n");
  const auto compressed = testutil::GzipBytes(raw);
  file.insert(file.end(), compressed.begin(), compressed.end());
  context_.GetLocation().MapBytes("packed.ics", file);

  auto reader = context_.OpenReader("packed.ics");
  ASSERT_TRUE(reader.ok()) << reader.status();
  auto plane = (*reader)->OpenPlane(0, 0, PlaneRegion{1, 1, 2, 2});
  ASSERT_TRUE(plane.ok()) << plane.status();
  EXPECT_EQ(plane->bytes, (std::vector<uint8_t>{raw[5], raw[6], raw[9],
                                                raw[10]}));
}

TEST_F(IcsTest, TruncatedCompressedDataIsFormatError) {
  std::vector<uint8_t> file = testutil::ToBytes(
      "\t\nics_version\t2.0\n"
      "layout\torder\tbits\tx\ty\n"
      "layout\tsizes\t8\t4\t3\n"
      "representation\tcompression\tgzip\n"
      "end\n");
  const auto compressed = testutil::GzipBytes(testutil::MakeSequence(6));
  file.insert(file.end(), compressed.begin(), compressed.end());
  context_.GetLocation().MapBytes("short.ics", file);

  auto reader = context_.OpenReader("short.ics");
  ASSERT_FALSE(reader.ok());
  EXPECT_TRUE(IsFormatError(reader.status())) << reader.status();
}

TEST_F(IcsTest, HugeCompressedLayoutFailsWithoutAllocating) {
  // 1.6e16 bits declared, a few bytes present.
  std::vector<uint8_t> file = testutil::ToBytes(
      "\t\nics_version\t2.0\n"
      "layout\torder\tbits\tx\ty\tz\n"
      "layout\tsizes\t16\t100000\t100000\t100000\n"
      "representation\tcompression\tgzip\n"
      "end\n");
  const auto compressed = testutil::GzipBytes(testutil::MakeSequence(64));
  file.insert(file.end(), compressed.begin(), compressed.end());
  context_.GetLocation().MapBytes("huge.ics", file);

  auto reader = context_.OpenReader("huge.ics");
  ASSERT_FALSE(reader.ok());
  EXPECT_TRUE(IsFormatError(reader.status())) << reader.status();
}

TEST_F(IcsTest, OverflowingLayoutIsFormatError) {
  for (const char* sizes : {"16\t4000000000\t4000000000\t4000000000",
                            "4294967304\t2\t2\t2"}) {
    context_.GetLocation().MapBytes(
        "overflow.ics",
        testutil::ToBytes(absl::StrCat("\t\nics_version\t2.0\n"
                                       "layout\torder\tbits\tx\ty\tz\n"
                                       "layout\tsizes\t",
                                       sizes,
                                       "\n"
                                       "representation\tcompression\tgzip\n"
                                       "end\n")));
    auto reader = context_.OpenReader("overflow.ics");
    ASSERT_FALSE(reader.ok()) << sizes;
    EXPECT_TRUE(IsFormatError(reader.status())) << reader.status();
  }
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(IcsTest, MalformedHeaders) {
  context_.GetLocation().MapBytes(
      "noend.ics", testutil::ToBytes("\t\nics_version\t2.0\n"
                                     "layout\torder\tbits\tx\ty\n"
                                     "layout\tsizes\t8\t2\t2\n"));
  auto reader = context_.OpenReader("noend.ics");
  EXPECT_TRUE(IsFormatError(reader.status())) << reader.status();

  context_.GetLocation().MapBytes(
      "mismatch.ics", testutil::ToBytes("\t\nics_version\t2.0\n"
                                        "layout\torder\tbits\tx\ty\n"
                                        "layout\tsizes\t8\t2\n"
                                        "end\n"));
  reader = context_.OpenReader("mismatch.ics");
  EXPECT_TRUE(IsFormatError(reader.status())) << reader.status();

  context_.GetLocation().MapBytes(
      "apart.ics", testutil::ToBytes("\t\nics_version\t2.0\n"
                                     "layout\torder\tbits\tx\tz\ty\n"
                                     "layout\tsizes\t8\t2\t2\t2\n"
                                     "end\n"));
  reader = context_.OpenReader("apart.ics");
  EXPECT_TRUE(IsFormatError(reader.status())) << reader.status();

  context_.GetLocation().MapBytes(
      "complex.ics", testutil::ToBytes("\t\nics_version\t2.0\n"
                                       "layout\torder\tbits\tx\ty\n"
                                       "layout\tsizes\t64\t2\t2\n"
                                       "representation\tformat\tcomplex\n"
                                       "end\n"));
  reader = context_.OpenReader("complex.ics");
  EXPECT_TRUE(IsUnsupportedFormatError(reader.status())) << reader.status();
}

TEST_F(IcsTest, OrderAxesForWriting) {
  const auto image = ImageMetadata::Create(
      4, 4, PixelType::kUInt8,
      {Axis{.type = AxisType::kZ, .length = 2},
       Axis{.type = AxisType::kTime, .length = 3}});

  auto axes = OrderAxesForWriting(image, "XYTCZ");
  ASSERT_TRUE(axes.ok()) << axes.status();
  ASSERT_EQ(axes->size(), 4u);
  EXPECT_EQ((*axes)[2].type, AxisType::kTime);
  EXPECT_EQ((*axes)[3].type, AxisType::kZ);

  axes = OrderAxesForWriting(image, "");
  ASSERT_TRUE(axes.ok());
  EXPECT_EQ((*axes)[2].type, AxisType::kZ);

  EXPECT_EQ(OrderAxesForWriting(image, "XZY").status().code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(OrderAxesForWriting(image, "XYY").status().code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(OrderAxesForWriting(image, "XYQ").status().code(),
            absl::StatusCode::kInvalidArgument);
}

TEST_F(IcsTest, WriterRejectsUnsupportedSeries) {
  metadata_.AddImage(ImageMetadata::Create(2, 2, PixelType::kUInt64));
  context_.GetLocation().MapBytes("wide.ics");
  auto writer = context_.OpenWriter("wide.ics", metadata_);
  ASSERT_FALSE(writer.ok());
  EXPECT_EQ(writer.status().code(), absl::StatusCode::kInvalidArgument);

  Metadata empty;
  writer = context_.OpenWriter("wide.ics", empty);
  EXPECT_EQ(writer.status().code(), absl::StatusCode::kInvalidArgument);

  writer = context_.OpenWriter("wide.tiff", metadata_);
  EXPECT_TRUE(IsUnsupportedFormatError(writer.status())) << writer.status();
}

TEST_F(IcsTest, SavePlaneChecks) {
  MakeStackMetadata();
  context_.GetLocation().MapBytes("checks.ics");
  auto writer = context_.OpenWriter("checks.ics", metadata_);
  ASSERT_TRUE(writer.ok()) << writer.status();
  const auto plane = MakePlane(0, kWidth, kHeight, false);

  EXPECT_TRUE(IsBoundsError((*writer)->SavePlane(0, 6, plane)));
  EXPECT_TRUE(IsBoundsError((*writer)->SavePlane(1, 0, plane)));
  EXPECT_TRUE(IsBoundsError((*writer)->SavePlane(
      0, 0, std::span<const uint8_t>(plane).first(plane.size() - 1))));

  Plane wrong_type;
  wrong_type.region = PlaneRegion{0, 0, 1, 1};
  wrong_type.pixel_type = PixelType::kInt16;
  wrong_type.bits_per_pixel = 16;
  wrong_type.bytes = {0, 0};
  EXPECT_EQ((*writer)->SavePlane(0, 0, wrong_type).code(),
            absl::StatusCode::kInvalidArgument);

  Plane outside = wrong_type;
  outside.pixel_type = PixelType::kUInt16;
  outside.region = PlaneRegion{kWidth, 0, 1, 1};
  EXPECT_TRUE(IsBoundsError((*writer)->SavePlane(0, 0, outside)));

  ASSERT_TRUE((*writer)->Close().ok());
  EXPECT_TRUE((*writer)->Close().ok());
  EXPECT_TRUE(IsClosedError((*writer)->SavePlane(0, 0, plane)));
}

TEST(IcsCompanionTest, SwapsSuffixKeepingCase) {
  EXPECT_EQ(GetCompanionId("a/b.ics"), "a/b.ids");
  EXPECT_EQ(GetCompanionId("a/B.IDS"), "a/B.ICS");
  EXPECT_EQ(GetCompanionId("x.zip!/img.Ics"), "x.zip!/img.Ids");
  EXPECT_FALSE(GetCompanionId("a/b.tif").has_value());
}

}  // namespace ics
}  // namespace formats
}  // namespace planeio
