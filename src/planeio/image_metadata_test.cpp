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

#include "planeio/image_metadata.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <memory>
#include <stdexcept>
#include <vector>

#include "planeio/metadata_table.h"
#include "planeio/options.h"
#include "planeio/status.h"

namespace planeio {

class ImageMetadataTest : public ::testing::Test {
 protected:
  void SetUp() override {
    image_ = ImageMetadata::Create(
        64, 32, PixelType::kUInt16,
        {Axis{.type = AxisType::kChannel, .length = 3},
         Axis{.type = AxisType::kZ, .length = 4},
         Axis{.type = AxisType::kTime, .length = 2}});
  }

  ImageMetadata image_;
};

TEST_F(ImageMetadataTest, Dimensions) {
  EXPECT_EQ(image_.GetSizeX(), 64);
  EXPECT_EQ(image_.GetSizeY(), 32);
  EXPECT_EQ(image_.GetPlaneCount(), 24);
  EXPECT_EQ(image_.GetAxisLength(AxisType::kSpectra), 1);
  EXPECT_EQ(image_.GetDimensionOrder(), "XYCZT");
  EXPECT_EQ(image_.bits_per_pixel, 16u);
  EXPECT_EQ(image_.GetPlaneSizeBytes(64, 32), 64u * 32u * 2u);
  EXPECT_TRUE(image_.Validate().ok());
}

TEST_F(ImageMetadataTest, FirstNonPlanarAxisVariesFastest) {
  auto position = image_.GetPlanePosition(0);
  ASSERT_TRUE(position.ok());
  EXPECT_EQ(*position, (std::vector<int64_t>{0, 0, 0}));

  position = image_.GetPlanePosition(1);
  ASSERT_TRUE(position.ok());
  EXPECT_EQ(*position, (std::vector<int64_t>{1, 0, 0}));

  position = image_.GetPlanePosition(3);
  ASSERT_TRUE(position.ok());
  EXPECT_EQ(*position, (std::vector<int64_t>{0, 1, 0}));

  position = image_.GetPlanePosition(23);
  ASSERT_TRUE(position.ok());
  EXPECT_EQ(*position, (std::vector<int64_t>{2, 3, 1}));
}

TEST_F(ImageMetadataTest, PlaneIndexInvertsPosition) {
  for (int64_t index = 0; index < image_.GetPlaneCount(); ++index) {
    auto position = image_.GetPlanePosition(index);
    ASSERT_TRUE(position.ok());
    auto back = image_.GetPlaneIndex(*position);
    ASSERT_TRUE(back.ok());
    EXPECT_EQ(*back, index);
  }
}

TEST_F(ImageMetadataTest, OutOfRangePositions) {
  EXPECT_TRUE(IsBoundsError(image_.GetPlanePosition(24).status()));
  EXPECT_TRUE(IsBoundsError(image_.GetPlanePosition(-1).status()));

  const std::vector<int64_t> too_far = {3, 0, 0};
  EXPECT_TRUE(IsBoundsError(image_.GetPlaneIndex(too_far).status()));
  const std::vector<int64_t> too_short = {0, 0};
  EXPECT_FALSE(image_.GetPlaneIndex(too_short).ok());
}

TEST_F(ImageMetadataTest, SubBytePlanesArePacked) {
  ImageMetadata image = ImageMetadata::Create(10, 3, PixelType::kUInt16);
  image.bits_per_pixel = 12;
  EXPECT_TRUE(image.Validate().ok());
  EXPECT_EQ(image.GetPlaneSizeBytes(10, 3), 45u);

  ImageMetadata bits = ImageMetadata::Create(9, 1, PixelType::kBit);
  EXPECT_EQ(bits.GetPlaneSizeBytes(9, 1), 2u);
}

TEST_F(ImageMetadataTest, ValidateRejectsBrokenSeries) {
  ImageMetadata image = image_;
  image.bits_per_pixel = 17;
  EXPECT_TRUE(IsFormatError(image.Validate()));

  image = image_;
  image.axes.push_back(Axis{.type = AxisType::kZ, .length = 2});
  EXPECT_TRUE(IsFormatError(image.Validate()));

  image = image_;
  image.axes[2].length = 0;
  EXPECT_TRUE(IsFormatError(image.Validate()));

  image = ImageMetadata::Create(4, 4, PixelType::kFloat);
  image.bits_per_pixel = 16;
  EXPECT_TRUE(IsFormatError(image.Validate()));

  image = image_;
  image.color_table = std::make_shared<ColorTable>(2, 8, 4);
  EXPECT_TRUE(IsFormatError(image.Validate()));
}

TEST_F(ImageMetadataTest, OverflowingSeriesAreRejected) {
  ImageMetadata image = ImageMetadata::Create(
      int64_t{1} << 20, int64_t{1} << 20, PixelType::kUInt16,
      {Axis{.type = AxisType::kZ, .length = int64_t{1} << 40},
       Axis{.type = AxisType::kTime, .length = int64_t{1} << 40}});
  EXPECT_EQ(image.GetPlaneCount(), std::numeric_limits<int64_t>::max());
  EXPECT_TRUE(IsFormatError(image.Validate()));

  // Planes fit, but the series does not once pixel bits are counted.
  image = ImageMetadata::Create(
      int64_t{1} << 20, int64_t{1} << 20, PixelType::kUInt16,
      {Axis{.type = AxisType::kZ, .length = int64_t{1} << 20}});
  EXPECT_EQ(image.GetPlaneCount(), int64_t{1} << 20);
  EXPECT_TRUE(IsFormatError(image.Validate()));
}

TEST(ColorTableTest, EntriesAndBounds) {
  ColorTable table(3, 8, 4);
  table.Set(1, 2, 200);
  EXPECT_EQ(table.Get(1, 2), 200);
  EXPECT_EQ(table.Get(0, 0), 0);
  EXPECT_THROW((void)table.Get(3, 0), std::out_of_range);
}

// ============================================================================
// MetadataTable
// ============================================================================

TEST(MetadataTableTest, TypedAccess) {
  MetadataTable table;
  table.Set("width", int64_t{512});
  table.Set("scale", 0.25);
  table.Set("name", std::string("stack"));
  table.Set("count", std::string("17"));

  EXPECT_EQ(table.GetInt("width"), 512);
  EXPECT_DOUBLE_EQ(table.GetDouble("scale"), 0.25);
  EXPECT_EQ(table.GetString("name"), "stack");
  EXPECT_EQ(table.GetInt("count"), 17);
  EXPECT_EQ(table.GetInt("name", -1), -1);
  EXPECT_EQ(table.GetString("missing", "none"), "none");
}

TEST(MetadataTableTest, AddKeepsRepeatedKeys) {
  MetadataTable table;
  table.Add("history", std::string("first"));
  table.Add("history", std::string("second"));
  table.Add("history", std::string("third"));
  EXPECT_EQ(table.size(), 3u);
  EXPECT_EQ(table.GetString("history"), "first");
  EXPECT_EQ(table.GetString("history #2"), "second");
  EXPECT_EQ(table.GetString("history #3"), "third");
}

TEST(MetadataTableTest, MergeWithPrefix) {
  MetadataTable inner;
  inner.Set("layout order", std::string("bits x y"));
  MetadataTable outer;
  outer.Merge(inner, "Zip ");
  EXPECT_TRUE(outer.contains("Zip layout order"));
  EXPECT_TRUE(outer.Erase("Zip layout order"));
  EXPECT_TRUE(outer.empty());
}

TEST(MetadataTableTest, FilterPolicy) {
  MetadataTable table;
  table.Set("keep", std::string("value"));
  table.Set("empty", std::string(""));
  table.Set("long", std::string(100, 'x'));
  table.Set("ctl\x01key", std::string("a\tb"));
  table.Set("private secret", std::string("s"));

  MetadataFilter filter;
  filter.max_value_length = 50;
  filter.excluded_prefixes = {"private"};
  ApplyMetadataFilter(filter, table);

  EXPECT_TRUE(table.contains("keep"));
  EXPECT_FALSE(table.contains("empty"));
  EXPECT_FALSE(table.contains("long"));
  EXPECT_FALSE(table.contains("private secret"));
  EXPECT_EQ(table.GetString("ctlkey"), "ab");
}

}  // namespace planeio
