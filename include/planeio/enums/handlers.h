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

#ifndef PLANEIO_INCLUDE_PLANEIO_ENUMS_HANDLERS_H_
#define PLANEIO_INCLUDE_PLANEIO_ENUMS_HANDLERS_H_

#include "planeio/enums/enum_handler.h"
#include "planeio/image_metadata.h"
#include "planeio/pixel_type.h"

namespace planeio {
namespace enums {

enum class DimensionOrder {
  kXYZCT,
  kXYZTC,
  kXYCTZ,
  kXYCZT,
  kXYTCZ,
  kXYTZC,
};

enum class FontFamily {
  kArial,
  kCourier,
  kHelvetica,
  kTimesNewRoman,
};

/// @brief Sample representation of raw data
enum class SampleFormat {
  kInteger,
  kReal,
  kComplex,
};

constexpr const char* GetName(DimensionOrder order) {
  switch (order) {
    case DimensionOrder::kXYZCT:
      return "XYZCT";
    case DimensionOrder::kXYZTC:
      return "XYZTC";
    case DimensionOrder::kXYCTZ:
      return "XYCTZ";
    case DimensionOrder::kXYCZT:
      return "XYCZT";
    case DimensionOrder::kXYTCZ:
      return "XYTCZ";
    case DimensionOrder::kXYTZC:
      return "XYTZC";
  }
  return "unknown";
}

/// @brief Pixel type names such as "uint16" or "float"
const EnumHandler<PixelType>& PixelTypeHandler();

/// @brief Axis labels such as "x", "ch" or "lambda"; falls back to kOther
const EnumHandler<AxisType>& AxisTypeHandler();

/// @brief Five-letter dimension orders such as "XYZCT"
const EnumHandler<DimensionOrder>& DimensionOrderHandler();

const EnumHandler<FontFamily>& FontFamilyHandler();

/// @brief Sample formats ("integer", "real", "complex")
const EnumHandler<SampleFormat>& SampleFormatHandler();

}  // namespace enums
}  // namespace planeio

#endif  // PLANEIO_INCLUDE_PLANEIO_ENUMS_HANDLERS_H_
