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

#include "planeio/formats/container/container.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "planeio/context.h"
#include "planeio/formats/gzip/gzip_format_plugin.h"
#include "planeio/io/byte_order.h"
#include "planeio/status.h"
#include "planeio/testing/test_util.h"

namespace planeio {
namespace formats {
namespace container {

class ContainerTest : public ::testing::Test {
 protected:
  // Writes a 5x3 uint16 ICS stack with four time points into "stack.ics".
  void SetUp() override {
    Metadata metadata;
    metadata.AddImage(ImageMetadata::Create(
        5, 3, PixelType::kUInt16, {Axis{.type = AxisType::kTime, .length = 4}}));
    context_.GetLocation().MapBytes("stack.ics");
    auto writer = context_.OpenWriter("stack.ics", metadata);
    ASSERT_TRUE(writer.ok()) << writer.status();
    for (int64_t t = 0; t < 4; ++t) {
      std::vector<uint8_t> plane(5 * 3 * 2);
      for (size_t i = 0; i < 15; ++i) {
        io::StoreValue<uint16_t>(static_cast<uint16_t>(100 * t + i),
                                 plane.data() + 2 * i, false);
      }
      ASSERT_TRUE((*writer)->SavePlane(0, t, plane).ok());
    }
    ASSERT_TRUE((*writer)->Close().ok());

    auto bytes = context_.GetLocation().GetBytes("stack.ics");
    ASSERT_TRUE(bytes.ok());
    ics_bytes_ = std::move(*bytes);
  }

  // Every plane of id equals the plane of the directly read stack.
  void ExpectSameAsDirect(const std::string& id) {
    auto direct = context_.OpenReader("stack.ics");
    ASSERT_TRUE(direct.ok()) << direct.status();
    auto wrapped = context_.OpenReader(id);
    ASSERT_TRUE(wrapped.ok()) << wrapped.status();

    const auto& expected = (*direct)->GetMetadata()->GetImages();
    const auto& actual = (*wrapped)->GetMetadata()->GetImages();
    ASSERT_EQ(actual.size(), expected.size());
    EXPECT_EQ(actual[0].GetDimensionOrder(), expected[0].GetDimensionOrder());
    EXPECT_EQ(actual[0].pixel_type, expected[0].pixel_type);
    EXPECT_EQ((*wrapped)->GetMetadata()->GetTable().GetString("layout sizes"),
              (*direct)->GetMetadata()->GetTable().GetString("layout sizes"));

    for (int64_t t = 0; t < 4; ++t) {
      auto a = (*direct)->OpenPlane(0, t);
      auto b = (*wrapped)->OpenPlane(0, t);
      ASSERT_TRUE(a.ok()) << a.status();
      ASSERT_TRUE(b.ok()) << b.status();
      EXPECT_EQ(a->bytes, b->bytes) << "plane " << t;
    }
    auto region = (*wrapped)->OpenPlane(0, 2, PlaneRegion{1, 1, 3, 2});
    ASSERT_TRUE(region.ok()) << region.status();
    EXPECT_EQ(io::LoadValue<uint16_t>(region->bytes.data(), false), 206);

    ASSERT_TRUE((*wrapped)->Close().ok());
  }

  Context context_;
  std::vector<uint8_t> ics_bytes_;
};

TEST_F(ContainerTest, GzipWrappedIcsMatchesDirectRead) {
  context_.GetLocation().MapBytes("stack.ics.gz",
                                  testutil::GzipBytes(ics_bytes_));
  auto identity = context_.Identify("stack.ics.gz");
  ASSERT_TRUE(identity.ok()) << identity.status();
  EXPECT_EQ(identity->chain, (std::vector<std::string>{"GZip", "ICS"}));

  ExpectSameAsDirect("stack.ics.gz");
}

TEST_F(ContainerTest, ZipWrappedIcsMatchesDirectRead) {
  context_.GetLocation().MapBytes(
      "bundle.zip",
      testutil::ZipBytes({{"data/", {}}, {"data/stack.ics", ics_bytes_}}));
  auto identity = context_.Identify("bundle.zip");
  ASSERT_TRUE(identity.ok()) << identity.status();
  EXPECT_EQ(identity->chain, (std::vector<std::string>{"Zip", "ICS"}));
  EXPECT_EQ(identity->inner_id, "bundle.zip!/data/stack.ics");

  ExpectSameAsDirect("bundle.zip");
}

TEST_F(ContainerTest, ZipResolvesCompanionDataFile) {
  const std::string header =
      "\t\nics_version\t1.0\n"
      "layout\torder\tbits\tx\ty\n"
      "layout\tsizes\t8\t2\t2\n"
      "end\n";
  context_.GetLocation().MapBytes(
      "old.zip", testutil::ZipBytes({{"old.ics", testutil::ToBytes(header)},
                                     {"old.ids", {9, 8, 7, 6}}}));
  auto reader = context_.OpenReader("old.zip");
  ASSERT_TRUE(reader.ok()) << reader.status();
  auto plane = (*reader)->OpenPlane(0, 0);
  ASSERT_TRUE(plane.ok()) << plane.status();
  EXPECT_EQ(plane->bytes, (std::vector<uint8_t>{9, 8, 7, 6}));
}

TEST_F(ContainerTest, NestedContainersDelegateToInnerReader) {
  const auto zipped = testutil::ZipBytes({{"stack.ics", ics_bytes_}});
  context_.GetLocation().MapBytes("bundle.zip.gz",
                                  testutil::GzipBytes(zipped));

  auto reader = context_.OpenReader("bundle.zip.gz");
  ASSERT_TRUE(reader.ok()) << reader.status();
  EXPECT_EQ((*reader)->GetFormatName(), "GZip");

  const auto* container =
      dynamic_cast<const ContainerReader*>(reader->get());
  ASSERT_NE(container, nullptr);
  ASSERT_NE(container->GetNestedReader(), nullptr);
  EXPECT_EQ(container->GetNestedReader()->GetFormatName(), "Zip");

  const auto* metadata =
      dynamic_cast<const ContainerMetadata*>((*reader)->GetMetadata());
  ASSERT_NE(metadata, nullptr);
  EXPECT_EQ(metadata->GetInnerFormatName(), "Zip");
  EXPECT_EQ(metadata->GetMappedIds(),
            (std::vector<std::string>{"bundle.zip.gz!/bundle.zip"}));

  reader->reset();
  ExpectSameAsDirect("bundle.zip.gz");
}

TEST_F(ContainerTest, NestedReaderChecksPlaneRequests) {
  context_.GetLocation().MapBytes("stack.ics.gz",
                                  testutil::GzipBytes(ics_bytes_));
  auto reader = context_.OpenReader("stack.ics.gz");
  ASSERT_TRUE(reader.ok()) << reader.status();
  EXPECT_TRUE(IsBoundsError((*reader)->OpenPlane(0, 4).status()));
  EXPECT_TRUE(IsBoundsError((*reader)->OpenPlane(1, 0).status()));
  EXPECT_TRUE(IsBoundsError(
      (*reader)->OpenPlane(0, 0, PlaneRegion{0, 0, 100, 1}).status()));

  Plane plane;
  ASSERT_TRUE((*reader)->OpenPlane(0, 1, PlaneRegion{0, 0, 1, 1}, plane).ok());
  EXPECT_EQ(plane.index, 1);
  EXPECT_EQ(plane.bytes.size(), 2u);
}

TEST_F(ContainerTest, CloseReleasesMappedIds) {
  context_.GetLocation().MapBytes("stack.ics.gz",
                                  testutil::GzipBytes(ics_bytes_));
  auto reader = context_.OpenReader("stack.ics.gz");
  ASSERT_TRUE(reader.ok()) << reader.status();
  EXPECT_TRUE(context_.GetLocation().IsMapped("stack.ics.gz!/stack.ics"));

  ASSERT_TRUE((*reader)->Close().ok());
  EXPECT_FALSE(context_.GetLocation().IsMapped("stack.ics.gz!/stack.ics"));
  EXPECT_TRUE(context_.GetLocation().IsMapped("stack.ics.gz"));
  EXPECT_TRUE(IsClosedError((*reader)->OpenPlane(0, 0).status()));
  EXPECT_TRUE((*reader)->Close().ok());
}

TEST_F(ContainerTest, SameZipOpenedTwiceKeepsBothReadersUsable) {
  context_.GetLocation().MapBytes(
      "twice.zip", testutil::ZipBytes({{"stack.ics", ics_bytes_}}));

  // A tiny window makes every plane read go back to the archive.
  ReaderOptions options;
  options.parser.stream.buffer_size = 8;
  auto first = context_.OpenReader("twice.zip", options);
  ASSERT_TRUE(first.ok()) << first.status();
  auto plane = (*first)->OpenPlane(0, 0);
  ASSERT_TRUE(plane.ok()) << plane.status();

  ASSERT_TRUE(context_.Identify("twice.zip").ok());
  auto second = context_.OpenReader("twice.zip", options);
  ASSERT_TRUE(second.ok()) << second.status();

  auto ExpectPlanes = [](Reader& reader) {
    for (int64_t t = 3; t >= 0; --t) {
      auto p = reader.OpenPlane(0, t);
      ASSERT_TRUE(p.ok()) << p.status();
      for (size_t i = 0; i < 15; ++i) {
        EXPECT_EQ(static_cast<int64_t>(
                      io::LoadValue<uint16_t>(p->bytes.data() + 2 * i, false)),
                  100 * t + static_cast<int64_t>(i));
      }
    }
  };
  ExpectPlanes(**first);
  ExpectPlanes(**second);

  // Closing one reader leaves the entry mapped for the other.
  ASSERT_TRUE((*first)->Close().ok());
  EXPECT_TRUE(context_.GetLocation().IsMapped("twice.zip!/stack.ics"));
  ExpectPlanes(**second);
  ASSERT_TRUE((*second)->Close().ok());
  EXPECT_FALSE(context_.GetLocation().IsMapped("twice.zip!/stack.ics"));
}

TEST_F(ContainerTest, SameGzipOpenedTwiceKeepsBothReadersUsable) {
  context_.GetLocation().MapBytes("twice.ics.gz",
                                  testutil::GzipBytes(ics_bytes_));
  auto first = context_.OpenReader("twice.ics.gz");
  ASSERT_TRUE(first.ok()) << first.status();
  auto second = context_.OpenReader("twice.ics.gz");
  ASSERT_TRUE(second.ok()) << second.status();

  ASSERT_TRUE((*second)->Close().ok());
  EXPECT_TRUE(context_.GetLocation().IsMapped("twice.ics.gz!/twice.ics"));
  auto plane = (*first)->OpenPlane(0, 3);
  ASSERT_TRUE(plane.ok()) << plane.status();
  EXPECT_EQ(io::LoadValue<uint16_t>(plane->bytes.data(), false), 300);
  ASSERT_TRUE((*first)->Close().ok());
  EXPECT_FALSE(context_.GetLocation().IsMapped("twice.ics.gz!/twice.ics"));
}

TEST_F(ContainerTest, BrokenContainers) {
  context_.GetLocation().MapBytes("empty.zip",
                                  testutil::ZipBytes({{"only/", {}}}));
  auto reader = context_.OpenReader("empty.zip");
  ASSERT_FALSE(reader.ok());
  EXPECT_TRUE(IsFormatError(reader.status())) << reader.status();

  auto gz = testutil::GzipBytes(ics_bytes_);
  gz.resize(gz.size() / 2);
  context_.GetLocation().MapBytes("cut.ics.gz", gz);
  reader = context_.OpenReader("cut.ics.gz");
  ASSERT_FALSE(reader.ok());
  EXPECT_TRUE(IsFormatError(reader.status())) << reader.status();

  context_.GetLocation().MapBytes(
      "notes.txt.gz", testutil::GzipBytes(testutil::ToBytes("plain text")));
  reader = context_.OpenReader("notes.txt.gz");
  ASSERT_FALSE(reader.ok());
  EXPECT_TRUE(IsUnsupportedFormatError(reader.status())) << reader.status();
  EXPECT_FALSE(context_.GetLocation().IsMapped("notes.txt.gz!/notes.txt"));
}

TEST(GzipInnerIdTest, StripsGzSuffixOfLastComponent) {
  EXPECT_EQ(gzip::GetInnerId("dir/cells.ics.gz"),
            "dir/cells.ics.gz!/cells.ics");
  EXPECT_EQ(gzip::GetInnerId("a.zip!/b.GZ"), "a.zip!/b.GZ!/b");
  EXPECT_EQ(gzip::GetInnerId("raw"), "raw!/raw");
}

}  // namespace container
}  // namespace formats
}  // namespace planeio
