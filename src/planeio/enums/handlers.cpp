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

#include "planeio/enums/handlers.h"

namespace planeio {
namespace enums {

const EnumHandler<PixelType>& PixelTypeHandler() {
  static const EnumHandler<PixelType> handler(
      "PixelType", {
                       {R"(\s*int8\s*)", PixelType::kInt8},
                       {R"(\s*uint8\s*)", PixelType::kUInt8},
                       {R"(\s*int16\s*)", PixelType::kInt16},
                       {R"(\s*uint16\s*)", PixelType::kUInt16},
                       {R"(\s*int32\s*)", PixelType::kInt32},
                       {R"(\s*uint32\s*)", PixelType::kUInt32},
                       {R"(\s*int64\s*)", PixelType::kInt64},
                       {R"(\s*uint64\s*)", PixelType::kUInt64},
                       {R"(\s*float\s*)", PixelType::kFloat},
                       {R"(\s*double\s*)", PixelType::kDouble},
                       {R"(\s*bit\s*)", PixelType::kBit},
                   });
  return handler;
}

const EnumHandler<AxisType>& AxisTypeHandler() {
  static const EnumHandler<AxisType> handler(
      "AxisType",
      {
          {R"(\s*x\s*)", AxisType::kX},
          {R"(\s*y\s*)", AxisType::kY},
          {R"(\s*z\s*)", AxisType::kZ},
          {R"(\s*(t|time)\s*)", AxisType::kTime},
          {R"(\s*(c|ch|channel)\s*)", AxisType::kChannel},
          {R"(\s*(lambda|spectra|spectral)\s*)", AxisType::kSpectra},
      },
      AxisType::kOther);
  return handler;
}

const EnumHandler<DimensionOrder>& DimensionOrderHandler() {
  static const EnumHandler<DimensionOrder> handler(
      "DimensionOrder", {
                            {R"(\s*XYZCT\s*)", DimensionOrder::kXYZCT},
                            {R"(\s*XYZTC\s*)", DimensionOrder::kXYZTC},
                            {R"(\s*XYCTZ\s*)", DimensionOrder::kXYCTZ},
                            {R"(\s*XYCZT\s*)", DimensionOrder::kXYCZT},
                            {R"(\s*XYTCZ\s*)", DimensionOrder::kXYTCZ},
                            {R"(\s*XYTZC\s*)", DimensionOrder::kXYTZC},
                        });
  return handler;
}

const EnumHandler<FontFamily>& FontFamilyHandler() {
  static const EnumHandler<FontFamily> handler(
      "FontFamily", {
                        {R"(\s*Arial)", FontFamily::kArial},
                        {R"(\s*Courier)", FontFamily::kCourier},
                        {R"(\s*Helvetica)", FontFamily::kHelvetica},
                        {R"(\s*TimesNewRoman)", FontFamily::kTimesNewRoman},
                    });
  return handler;
}

const EnumHandler<SampleFormat>& SampleFormatHandler() {
  static const EnumHandler<SampleFormat> handler(
      "SampleFormat", {
                          {R"(\s*integer\s*)", SampleFormat::kInteger},
                          {R"(\s*(real|float)\s*)", SampleFormat::kReal},
                          {R"(\s*complex\s*)", SampleFormat::kComplex},
                      });
  return handler;
}

}  // namespace enums
}  // namespace planeio
