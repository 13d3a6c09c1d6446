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

#include <cstdint>
#include <random>
#include <span>
#include <vector>

#include "benchmark/benchmark.h"
#include "planeio/context.h"
#include "planeio/decode/plane_decoder.h"
#include "planeio/image_metadata.h"
#include "planeio/io/byte_order.h"
#include "planeio/metadata.h"
#include "planeio/pixel_type.h"

namespace {

// Fixed seed for reproducible plane contents
constexpr uint32_t kRandomSeed = 42;

std::vector<uint8_t> RandomBytes(size_t size) {
  std::mt19937 rng(kRandomSeed);
  std::uniform_int_distribution<int> dist(0, 255);
  std::vector<uint8_t> bytes(size);
  for (auto& b : bytes) {
    b = static_cast<uint8_t>(dist(rng));
  }
  return bytes;
}

/// @brief Square planes of a given edge length and byte order
class DecodeFixture : public benchmark::Fixture {
 public:
  void SetUp(const ::benchmark::State& state) override {
    edge_ = static_cast<size_t>(state.range(0));
    little_endian_ = state.range(1) != 0;
  }

 protected:
  size_t edge_ = 0;
  bool little_endian_ = false;
};

template <planeio::PixelType kType>
void RunDecode(benchmark::State& state, size_t edge, bool little_endian,
               bool fast) {
  using T = typename planeio::PixelTypeToCpp<kType>::type;
  const size_t count = edge * edge;
  const auto raw = RandomBytes(count * sizeof(T));
  std::vector<T> target(count);
  planeio::decode::PixelEncoding encoding;
  encoding.pixel_type = kType;
  encoding.bits_per_pixel = 8 * sizeof(T);
  encoding.little_endian = little_endian;

  for (auto _ : state) {
    auto status =
        fast ? planeio::decode::ConvertBytesFast(std::span<T>(target), raw, 0,
                                                 encoding)
             : planeio::decode::ConvertBytesGeneral(std::span<T>(target), raw,
                                                    0, encoding);
    if (!status.ok()) {
      state.SkipWithError("Failed to decode plane");
      return;
    }
    benchmark::DoNotOptimize(target.data());
    benchmark::ClobberMemory();
  }
  state.SetItemsProcessed(state.iterations() * count);
  state.SetBytesProcessed(state.iterations() * raw.size());
}

BENCHMARK_DEFINE_F(DecodeFixture, FastUInt16)(benchmark::State& state) {
  RunDecode<planeio::PixelType::kUInt16>(state, edge_, little_endian_, true);
}

BENCHMARK_DEFINE_F(DecodeFixture, GeneralUInt16)(benchmark::State& state) {
  RunDecode<planeio::PixelType::kUInt16>(state, edge_, little_endian_, false);
}

BENCHMARK_DEFINE_F(DecodeFixture, FastFloat)(benchmark::State& state) {
  RunDecode<planeio::PixelType::kFloat>(state, edge_, little_endian_, true);
}

BENCHMARK_DEFINE_F(DecodeFixture, GeneralFloat)(benchmark::State& state) {
  RunDecode<planeio::PixelType::kFloat>(state, edge_, little_endian_, false);
}

// 12-bit samples only decode through the bit reader.
static void BM_GeneralTwelveBit(benchmark::State& state) {
  const size_t edge = static_cast<size_t>(state.range(0));
  const size_t count = edge * edge;
  const auto raw = RandomBytes((count * 12 + 7) / 8);
  std::vector<uint16_t> target(count);
  planeio::decode::PixelEncoding encoding;
  encoding.pixel_type = planeio::PixelType::kUInt16;
  encoding.bits_per_pixel = 12;

  for (auto _ : state) {
    auto status = planeio::decode::ConvertBytesGeneral(
        std::span<uint16_t>(target), raw, 0, encoding, count);
    if (!status.ok()) {
      state.SkipWithError("Failed to decode plane");
      return;
    }
    benchmark::DoNotOptimize(target.data());
  }
  state.SetItemsProcessed(state.iterations() * count);
}

/// @brief Full reader path over an in-memory ICS stack
static void BM_ReadIcsPlane(benchmark::State& state) {
  const int64_t edge = state.range(0);
  planeio::Context context;
  planeio::Metadata metadata;
  metadata.AddImage(planeio::ImageMetadata::Create(
      edge, edge, planeio::PixelType::kUInt16,
      {planeio::Axis{planeio::AxisType::kZ, 4}}));
  context.GetLocation().MapBytes("bench.ics");
  {
    auto writer = context.OpenWriter("bench.ics", metadata);
    if (!writer.ok()) {
      state.SkipWithError("Failed to open writer");
      return;
    }
    const auto plane = RandomBytes(static_cast<size_t>(edge * edge * 2));
    for (int64_t z = 0; z < 4; ++z) {
      if (!(*writer)->SavePlane(0, z, plane).ok()) {
        state.SkipWithError("Failed to write plane");
        return;
      }
    }
    if (!(*writer)->Close().ok()) {
      state.SkipWithError("Failed to close writer");
      return;
    }
  }

  auto reader = context.OpenReader("bench.ics");
  if (!reader.ok()) {
    state.SkipWithError("Failed to open reader");
    return;
  }
  planeio::Plane plane;
  int64_t z = 0;
  for (auto _ : state) {
    if (!(*reader)->OpenPlane(0, z, {0, 0, edge, edge}, plane).ok()) {
      state.SkipWithError("Failed to read plane");
      return;
    }
    benchmark::DoNotOptimize(plane.bytes.data());
    z = (z + 1) % 4;
  }
  state.SetBytesProcessed(state.iterations() * edge * edge * 2);
}

BENCHMARK_REGISTER_F(DecodeFixture, FastUInt16)
    ->ArgsProduct({{256, 1024}, {0, 1}})
    ->Unit(benchmark::kMicrosecond);
BENCHMARK_REGISTER_F(DecodeFixture, GeneralUInt16)
    ->ArgsProduct({{256, 1024}, {0, 1}})
    ->Unit(benchmark::kMicrosecond);
BENCHMARK_REGISTER_F(DecodeFixture, FastFloat)
    ->ArgsProduct({{256, 1024}, {0, 1}})
    ->Unit(benchmark::kMicrosecond);
BENCHMARK_REGISTER_F(DecodeFixture, GeneralFloat)
    ->ArgsProduct({{256, 1024}, {0, 1}})
    ->Unit(benchmark::kMicrosecond);
BENCHMARK(BM_GeneralTwelveBit)->Arg(256)->Arg(1024)->Unit(benchmark::kMicrosecond);
BENCHMARK(BM_ReadIcsPlane)->Arg(256)->Arg(1024)->Unit(benchmark::kMicrosecond);

}  // namespace

BENCHMARK_MAIN();
