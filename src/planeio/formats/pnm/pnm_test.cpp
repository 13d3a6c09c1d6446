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

#include "planeio/formats/pnm/pnm.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "planeio/context.h"
#include "planeio/io/byte_order.h"
#include "planeio/status.h"
#include "planeio/testing/test_util.h"

namespace planeio {
namespace formats {
namespace pnm {

namespace {

std::vector<uint8_t> WithRaster(std::string_view header,
                                std::vector<uint8_t> raster) {
  std::vector<uint8_t> bytes = testutil::ToBytes(header);
  bytes.insert(bytes.end(), raster.begin(), raster.end());
  return bytes;
}

}  // namespace

class PnmTest : public ::testing::Test {
 protected:
  std::unique_ptr<Reader> Open(const std::string& id,
                               std::vector<uint8_t> bytes) {
    context_.GetLocation().MapBytes(id, std::move(bytes));
    auto reader = context_.OpenReader(id);
    EXPECT_TRUE(reader.ok()) << reader.status();
    return reader.ok() ? std::move(*reader) : nullptr;
  }

  std::vector<uint8_t> PlaneBytes(Reader& reader, int64_t plane_index) {
    auto plane = reader.OpenPlane(0, plane_index);
    EXPECT_TRUE(plane.ok()) << plane.status();
    return plane.ok() ? plane->bytes : std::vector<uint8_t>{};
  }

  Context context_;
};

// ============================================================================
// Binary variants
// ============================================================================

TEST_F(PnmTest, GraymapWithComments) {
  auto reader = Open("gray.pgm", WithRaster("P5\n# first\n3 # inline\n2\n"
                                            "255\n",
                                            {1, 2, 3, 4, 5, 6}));
  ASSERT_NE(reader, nullptr);

  const Metadata* metadata = reader->GetMetadata();
  const ImageMetadata& image = metadata->GetImages()[0];
  EXPECT_EQ(image.GetSizeX(), 3);
  EXPECT_EQ(image.GetSizeY(), 2);
  EXPECT_EQ(image.GetPlaneCount(), 1);
  EXPECT_EQ(image.pixel_type, PixelType::kUInt8);

  const MetadataTable& table = metadata->GetTable();
  EXPECT_EQ(table.GetString("Magic"), "P5");
  EXPECT_EQ(table.GetInt("Maximum value"), 255);
  EXPECT_EQ(table.GetString("Comment"), "first");
  EXPECT_EQ(table.GetString("Comment #2"), "inline");

  EXPECT_EQ(PlaneBytes(*reader, 0), (std::vector<uint8_t>{1, 2, 3, 4, 5, 6}));

  auto region = reader->OpenPlane(0, 0, PlaneRegion{1, 1, 2, 1});
  ASSERT_TRUE(region.ok()) << region.status();
  EXPECT_EQ(region->bytes, (std::vector<uint8_t>{5, 6}));
}

TEST_F(PnmTest, SixteenBitPixmapSplitsChannels) {
  std::vector<uint8_t> raster(2 * 3 * 2);
  for (uint16_t i = 0; i < 6; ++i) {
    io::StoreValue<uint16_t>(static_cast<uint16_t>(1000 * i + 7),
                             raster.data() + 2 * i, false);
  }
  auto reader = Open("color.ppm", WithRaster("P6 2 1 65535\n", raster));
  ASSERT_NE(reader, nullptr);

  const ImageMetadata& image = reader->GetMetadata()->GetImages()[0];
  EXPECT_EQ(image.pixel_type, PixelType::kUInt16);
  EXPECT_EQ(image.GetDimensionOrder(), "XYC");
  EXPECT_EQ(image.GetPlaneCount(), 3);

  for (int64_t c = 0; c < 3; ++c) {
    auto plane = reader->OpenPlane(0, c);
    ASSERT_TRUE(plane.ok()) << plane.status();
    auto pixels = plane->Decode();
    ASSERT_TRUE(pixels.ok()) << pixels.status();
    const auto values = pixels->As<uint16_t>();
    EXPECT_EQ(values[0], 1000 * c + 7);
    EXPECT_EQ(values[1], 1000 * (c + 3) + 7);
  }
}

TEST_F(PnmTest, BitmapRowsArePadded) {
  // 10 pixels per row: two bytes, the last six bits padding.
  auto reader = Open("mask.pbm", WithRaster("P4\n10 2\n",
                                            {0b10000000, 0b01111111,
                                             0b01010101, 0b11000000}));
  ASSERT_NE(reader, nullptr);
  const ImageMetadata& image = reader->GetMetadata()->GetImages()[0];
  EXPECT_EQ(image.pixel_type, PixelType::kBit);
  EXPECT_EQ(image.bits_per_pixel, 1u);

  auto plane = reader->OpenPlane(0, 0);
  ASSERT_TRUE(plane.ok()) << plane.status();
  auto pixels = plane->Decode();
  ASSERT_TRUE(pixels.ok()) << pixels.status();
  const auto bits = pixels->As<uint8_t>();
  EXPECT_EQ(std::vector<uint8_t>(bits.begin(), bits.end()),
            (std::vector<uint8_t>{1, 0, 0, 0, 0, 0, 0, 0, 0, 1,
                                  0, 1, 0, 1, 0, 1, 0, 1, 1, 1}));
}

// ============================================================================
// ASCII variants
// ============================================================================

TEST_F(PnmTest, AsciiVariantsMatchBinary) {
  auto ascii = Open("a.pgm", testutil::ToBytes("P2\n3 2\n300\n"
                                               "0 1 2\n# mid\n299 300 5\n"));
  ASSERT_NE(ascii, nullptr);
  EXPECT_EQ(ascii->GetMetadata()->GetImages()[0].pixel_type,
            PixelType::kUInt16);
  EXPECT_EQ(PlaneBytes(*ascii, 0),
            (std::vector<uint8_t>{0, 0, 0, 1, 0, 2, 1, 43, 1, 44, 0, 5}));

  auto color = Open("a.ppm", testutil::ToBytes("P3 2 1 255 1 2 3 4 5 6"));
  ASSERT_NE(color, nullptr);
  EXPECT_EQ(PlaneBytes(*color, 0), (std::vector<uint8_t>{1, 4}));
  EXPECT_EQ(PlaneBytes(*color, 2), (std::vector<uint8_t>{3, 6}));

  auto bitmap = Open("a.pbm", testutil::ToBytes("P1\n3 2\n1 0 1\n011\n"));
  ASSERT_NE(bitmap, nullptr);
  auto plane = bitmap->OpenPlane(0, 0);
  ASSERT_TRUE(plane.ok()) << plane.status();
  // Plane bytes are packed without row padding.
  EXPECT_EQ(plane->bytes, (std::vector<uint8_t>{0b10101100}));
}

TEST_F(PnmTest, ShortAsciiRasterIsFormatError) {
  context_.GetLocation().MapBytes("short.pgm",
                                  testutil::ToBytes("P2 2 2 255 1 2 3"));
  auto reader = context_.OpenReader("short.pgm");
  ASSERT_FALSE(reader.ok());
  EXPECT_TRUE(IsFormatError(reader.status())) << reader.status();

  context_.GetLocation().MapBytes("big.pgm",
                                  testutil::ToBytes("P2 1 1 10 11"));
  reader = context_.OpenReader("big.pgm");
  EXPECT_TRUE(IsFormatError(reader.status())) << reader.status();
}

TEST_F(PnmTest, InvalidHeaders) {
  context_.GetLocation().MapBytes("zero.pgm",
                                  testutil::ToBytes("P5 0 2 255\n"));
  EXPECT_TRUE(IsFormatError(context_.OpenReader("zero.pgm").status()));

  context_.GetLocation().MapBytes("deep.pgm",
                                  testutil::ToBytes("P5 1 1 70000\n"));
  EXPECT_TRUE(IsFormatError(context_.OpenReader("deep.pgm").status()));

  context_.GetLocation().MapBytes("cut.pgm", testutil::ToBytes("P5 4"));
  EXPECT_FALSE(context_.OpenReader("cut.pgm").ok());
}

TEST_F(PnmTest, HugeHeadersAreFormatErrors) {
  // Each header claims far more samples than the file or int64 can hold.
  const std::vector<std::pair<std::string, std::string>> cases = {
      {"overflow.pbm", "P1\n4000000000 4000000000\n0"},
      {"wide.pbm", "P1\n2000000000 2000000000\n0 1 0"},
      {"wide.pgm", "P2\n100000 100000\n255\n1 2 3"},
      {"overflow.ppm", "P3 3000000000 3000000000 65535 1"},
      {"overflow.pgm", "P5 4000000000 4000000000 65535\n"},
  };
  for (const auto& [id, header] : cases) {
    context_.GetLocation().MapBytes(id, testutil::ToBytes(header));
    auto reader = context_.OpenReader(id);
    ASSERT_FALSE(reader.ok()) << id;
    EXPECT_TRUE(IsFormatError(reader.status())) << id << ": "
                                                << reader.status();
  }
}

TEST_F(PnmTest, TruncatedRasterFailsOnRead) {
  auto reader = Open("cut.pgm", WithRaster("P5 4 4 255\n", {1, 2, 3}));
  ASSERT_NE(reader, nullptr);
  auto plane = reader->OpenPlane(0, 0);
  EXPECT_TRUE(IsEndOfFileError(plane.status())) << plane.status();
}

// ============================================================================
// Writing
// ============================================================================

TEST_F(PnmTest, WritesGraymap) {
  Metadata metadata;
  metadata.AddImage(ImageMetadata::Create(3, 2, PixelType::kUInt8));
  context_.GetLocation().MapBytes("out.pgm");
  auto writer = context_.OpenWriter("out.pgm", metadata);
  ASSERT_TRUE(writer.ok()) << writer.status();
  ASSERT_TRUE((*writer)->SavePlane(0, 0, testutil::MakeSequence(6)).ok());
  ASSERT_TRUE((*writer)->Close().ok());

  auto bytes = context_.GetLocation().GetBytes("out.pgm");
  ASSERT_TRUE(bytes.ok());
  EXPECT_EQ(*bytes, WithRaster("P5\n3 2\n255\n", testutil::MakeSequence(6)));
}

TEST_F(PnmTest, WritesPixmapFromChannelPlanes) {
  Metadata metadata;
  metadata.AddImage(ImageMetadata::Create(
      2, 2, PixelType::kUInt16,
      {Axis{.type = AxisType::kChannel, .length = 3}}));
  context_.GetLocation().MapBytes("out.ppm");
  auto writer = context_.OpenWriter("out.ppm", metadata);
  ASSERT_TRUE(writer.ok()) << writer.status();

  // Channels arrive little-endian; the file is big-endian.
  for (int64_t c = 2; c >= 0; --c) {
    Plane plane;
    plane.region = PlaneRegion{0, 0, 2, 2};
    plane.pixel_type = PixelType::kUInt16;
    plane.bits_per_pixel = 16;
    plane.little_endian = true;
    plane.bytes.resize(8);
    for (int i = 0; i < 4; ++i) {
      io::StoreValue<uint16_t>(static_cast<uint16_t>(256 * c + i),
                               plane.bytes.data() + 2 * i, true);
    }
    ASSERT_TRUE((*writer)->SavePlane(0, c, plane).ok());
  }
  ASSERT_TRUE((*writer)->Close().ok());

  auto reader = context_.OpenReader("out.ppm");
  ASSERT_TRUE(reader.ok()) << reader.status();
  EXPECT_EQ((*reader)->GetMetadata()->GetTable().GetString("Magic"), "P6");
  for (int64_t c = 0; c < 3; ++c) {
    auto plane = (*reader)->OpenPlane(0, c);
    ASSERT_TRUE(plane.ok()) << plane.status();
    auto pixels = plane->Decode();
    ASSERT_TRUE(pixels.ok());
    for (int i = 0; i < 4; ++i) {
      EXPECT_EQ(pixels->As<uint16_t>()[i], 256 * c + i);
    }
  }
}

TEST_F(PnmTest, WritesBitmap) {
  Metadata metadata;
  metadata.AddImage(ImageMetadata::Create(10, 1, PixelType::kBit));
  context_.GetLocation().MapBytes("out.pbm");
  auto writer = context_.OpenWriter("out.pbm", metadata);
  ASSERT_TRUE(writer.ok()) << writer.status();
  ASSERT_TRUE(
      (*writer)->SavePlane(0, 0, std::vector<uint8_t>{0b11000000, 0b01000000})
          .ok());
  ASSERT_TRUE((*writer)->Close().ok());

  auto bytes = context_.GetLocation().GetBytes("out.pbm");
  ASSERT_TRUE(bytes.ok());
  EXPECT_EQ(*bytes, WithRaster("P4\n10 1\n", {0b11000000, 0b01000000}));
}

TEST_F(PnmTest, WriterRejectsStacks) {
  Metadata metadata;
  metadata.AddImage(ImageMetadata::Create(
      2, 2, PixelType::kUInt8, {Axis{.type = AxisType::kZ, .length = 2}}));
  context_.GetLocation().MapBytes("stack.pgm");
  auto writer = context_.OpenWriter("stack.pgm", metadata);
  ASSERT_FALSE(writer.ok());
  EXPECT_EQ(writer.status().code(), absl::StatusCode::kInvalidArgument);

  Metadata signed_metadata;
  signed_metadata.AddImage(ImageMetadata::Create(2, 2, PixelType::kInt16));
  writer = context_.OpenWriter("stack.pgm", signed_metadata);
  EXPECT_EQ(writer.status().code(), absl::StatusCode::kInvalidArgument);
}

}  // namespace pnm
}  // namespace formats
}  // namespace planeio
