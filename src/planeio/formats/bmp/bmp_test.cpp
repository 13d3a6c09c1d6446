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

#include "planeio/formats/bmp/bmp.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <vector>

#include "planeio/context.h"
#include "planeio/io/byte_order.h"
#include "planeio/status.h"

namespace planeio {
namespace formats {
namespace bmp {

namespace {

struct BmpLayout {
  int32_t width = 0;
  int32_t height = 0;
  uint16_t bits = 24;
  uint32_t compression = 0;
  int32_t x_ppm = 0;
  std::vector<uint8_t> palette;  // BGR0 entries
  std::vector<uint8_t> raster;
};

std::vector<uint8_t> MakeBmp(const BmpLayout& layout) {
  const uint32_t data_offset =
      kMinHeaderSize + static_cast<uint32_t>(layout.palette.size());
  std::vector<uint8_t> bytes(data_offset, 0);
  auto put32 = [&](size_t at, uint32_t v) {
    io::StoreValue<uint32_t>(v, bytes.data() + at, true);
  };
  auto put16 = [&](size_t at, uint16_t v) {
    io::StoreValue<uint16_t>(v, bytes.data() + at, true);
  };
  bytes[0] = 'B';
  bytes[1] = 'M';
  put32(2, data_offset + static_cast<uint32_t>(layout.raster.size()));
  put32(10, data_offset);
  put32(14, 40);
  put32(18, static_cast<uint32_t>(layout.width));
  put32(22, static_cast<uint32_t>(layout.height));
  put16(26, 1);
  put16(28, layout.bits);
  put32(30, layout.compression);
  put32(34, static_cast<uint32_t>(layout.raster.size()));
  put32(38, static_cast<uint32_t>(layout.x_ppm));
  put32(42, static_cast<uint32_t>(layout.x_ppm));
  put32(46, static_cast<uint32_t>(layout.palette.size() / 4));
  std::copy(layout.palette.begin(), layout.palette.end(),
            bytes.begin() + kMinHeaderSize);
  bytes.insert(bytes.end(), layout.raster.begin(), layout.raster.end());
  return bytes;
}

}  // namespace

class BmpTest : public ::testing::Test {
 protected:
  absl::StatusOr<std::unique_ptr<Reader>> Open(const BmpLayout& layout) {
    context_.GetLocation().MapBytes("image.bmp", MakeBmp(layout));
    return context_.OpenReader("image.bmp");
  }

  Context context_;
};

TEST_F(BmpTest, TrueColorBottomUp) {
  // 2x2, rows padded to 8 bytes, last row stored first.
  BmpLayout layout{.width = 2, .height = 2, .bits = 24, .x_ppm = 2000};
  layout.raster = {
      // bottom row (y = 1): BGR BGR pad
      3, 2, 1, 6, 5, 4, 0, 0,
      // top row (y = 0)
      13, 12, 11, 16, 15, 14, 0, 0};
  auto reader = Open(layout);
  ASSERT_TRUE(reader.ok()) << reader.status();

  const ImageMetadata& image = (*reader)->GetMetadata()->GetImages()[0];
  EXPECT_EQ(image.GetDimensionOrder(), "XYC");
  EXPECT_EQ(image.GetPlaneCount(), 3);
  EXPECT_EQ(image.color_table, nullptr);
  EXPECT_DOUBLE_EQ(image.axes[0].scale, 500.0);
  EXPECT_EQ(image.axes[0].unit, "um");

  const std::vector<std::vector<uint8_t>> expected = {
      {11, 14, 1, 4}, {12, 15, 2, 5}, {13, 16, 3, 6}};
  for (int64_t c = 0; c < 3; ++c) {
    auto plane = (*reader)->OpenPlane(0, c);
    ASSERT_TRUE(plane.ok()) << plane.status();
    EXPECT_EQ(plane->bytes, expected[c]) << "channel " << c;
  }

  const MetadataTable& table = (*reader)->GetMetadata()->GetTable();
  EXPECT_EQ(table.GetString("Compression type"), "None");
  EXPECT_EQ(table.GetInt("Bits per pixel"), 24);
  EXPECT_EQ(table.GetInt("Top down"), 0);
}

TEST_F(BmpTest, TopDownWithAlpha) {
  BmpLayout layout{.width = 1, .height = -2, .bits = 32};
  layout.raster = {1, 2, 3, 4, 5, 6, 7, 8};  // BGRA per row
  auto reader = Open(layout);
  ASSERT_TRUE(reader.ok()) << reader.status();
  EXPECT_EQ((*reader)->GetMetadata()->GetImages()[0].GetPlaneCount(), 4);

  auto red = (*reader)->OpenPlane(0, 0);
  ASSERT_TRUE(red.ok());
  EXPECT_EQ(red->bytes, (std::vector<uint8_t>{3, 7}));
  auto alpha = (*reader)->OpenPlane(0, 3);
  ASSERT_TRUE(alpha.ok());
  EXPECT_EQ(alpha->bytes, (std::vector<uint8_t>{4, 8}));
}

TEST_F(BmpTest, IndexedFourBitWithPalette) {
  BmpLayout layout{.width = 3, .height = 1, .bits = 4};
  layout.palette = {0, 0, 0, 0, 10, 20, 30, 0, 40, 50, 60, 0};
  layout.raster = {0x12, 0x00, 0x00, 0x00};
  auto reader = Open(layout);
  ASSERT_TRUE(reader.ok()) << reader.status();

  const ImageMetadata& image = (*reader)->GetMetadata()->GetImages()[0];
  EXPECT_EQ(image.pixel_type, PixelType::kUInt8);
  EXPECT_EQ(image.bits_per_pixel, 4u);
  ASSERT_NE(image.color_table, nullptr);
  EXPECT_EQ(image.color_table->GetLength(), 3u);
  // Stored BGR, exposed RGB.
  EXPECT_EQ(image.color_table->Get(0, 1), 30);
  EXPECT_EQ(image.color_table->Get(2, 1), 10);
  EXPECT_EQ(image.color_table->Get(0, 2), 60);

  auto plane = (*reader)->OpenPlane(0, 0);
  ASSERT_TRUE(plane.ok()) << plane.status();
  EXPECT_NE(plane->color_table, nullptr);
  auto indices = plane->Decode();
  ASSERT_TRUE(indices.ok()) << indices.status();
  const auto values = indices->As<uint8_t>();
  EXPECT_EQ(std::vector<uint8_t>(values.begin(), values.end()),
            (std::vector<uint8_t>{1, 2, 0}));
}

TEST_F(BmpTest, UnsupportedVariants) {
  BmpLayout rle{.width = 2, .height = 2, .bits = 8, .compression = 1};
  rle.palette.assign(4 * 256, 0);
  rle.raster.assign(8, 0);
  auto reader = Open(rle);
  ASSERT_FALSE(reader.ok());
  EXPECT_TRUE(IsUnsupportedFormatError(reader.status())) << reader.status();

  BmpLayout depth{.width = 2, .height = 2, .bits = 16};
  depth.raster.assign(8, 0);
  reader = Open(depth);
  EXPECT_TRUE(IsUnsupportedFormatError(reader.status())) << reader.status();
}

TEST_F(BmpTest, MalformedFiles) {
  BmpLayout truncated{.width = 4, .height = 4, .bits = 24};
  truncated.raster.assign(20, 0);
  auto reader = Open(truncated);
  EXPECT_TRUE(IsFormatError(reader.status())) << reader.status();

  BmpLayout empty{.width = 0, .height = 4, .bits = 24};
  reader = Open(empty);
  EXPECT_TRUE(IsFormatError(reader.status())) << reader.status();

  context_.GetLocation().MapBytes("short.bmp", {'B', 'M', 0, 0});
  reader = context_.OpenReader("short.bmp");
  EXPECT_TRUE(IsFormatError(reader.status())) << reader.status();
}

TEST_F(BmpTest, NoWriter) {
  Metadata metadata;
  metadata.AddImage(ImageMetadata::Create(2, 2, PixelType::kUInt8));
  auto writer = context_.OpenWriter("out.bmp", metadata);
  EXPECT_TRUE(IsUnsupportedFormatError(writer.status())) << writer.status();
}

}  // namespace bmp
}  // namespace formats
}  // namespace planeio
