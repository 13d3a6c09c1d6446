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

#ifndef PLANEIO_INCLUDE_PLANEIO_PIXEL_TYPE_H_
#define PLANEIO_INCLUDE_PLANEIO_PIXEL_TYPE_H_

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <type_traits>

namespace planeio {

/// @brief Pixel element kinds
///
/// kBit stores one sample per byte in decoded buffers and one bit per
/// sample in plane bytes.
enum class PixelType {
  kInt8,
  kUInt8,
  kInt16,
  kUInt16,
  kInt32,
  kUInt32,
  kInt64,
  kUInt64,
  kFloat,
  kDouble,
  kBit,
};

/// @brief Size in bytes of one decoded element
constexpr size_t GetPixelTypeSize(PixelType type) {
  switch (type) {
    case PixelType::kInt8:
    case PixelType::kUInt8:
    case PixelType::kBit:
      return 1;
    case PixelType::kInt16:
    case PixelType::kUInt16:
      return 2;
    case PixelType::kInt32:
    case PixelType::kUInt32:
    case PixelType::kFloat:
      return 4;
    case PixelType::kInt64:
    case PixelType::kUInt64:
    case PixelType::kDouble:
      return 8;
  }
  return 0;
}

/// @brief Natural bits per pixel of a type (1 for kBit)
constexpr uint32_t GetPixelTypeBits(PixelType type) {
  return type == PixelType::kBit
             ? 1
             : static_cast<uint32_t>(GetPixelTypeSize(type) * 8);
}

constexpr bool IsSigned(PixelType type) {
  switch (type) {
    case PixelType::kInt8:
    case PixelType::kInt16:
    case PixelType::kInt32:
    case PixelType::kInt64:
    case PixelType::kFloat:
    case PixelType::kDouble:
      return true;
    default:
      return false;
  }
}

constexpr bool IsFloatingPoint(PixelType type) {
  return type == PixelType::kFloat || type == PixelType::kDouble;
}

// Type traits for mapping PixelType enum to C++ types
template <PixelType>
struct PixelTypeToCpp;

template <>
struct PixelTypeToCpp<PixelType::kInt8> {
  using type = int8_t;
};

template <>
struct PixelTypeToCpp<PixelType::kUInt8> {
  using type = uint8_t;
};

template <>
struct PixelTypeToCpp<PixelType::kInt16> {
  using type = int16_t;
};

template <>
struct PixelTypeToCpp<PixelType::kUInt16> {
  using type = uint16_t;
};

template <>
struct PixelTypeToCpp<PixelType::kInt32> {
  using type = int32_t;
};

template <>
struct PixelTypeToCpp<PixelType::kUInt32> {
  using type = uint32_t;
};

template <>
struct PixelTypeToCpp<PixelType::kInt64> {
  using type = int64_t;
};

template <>
struct PixelTypeToCpp<PixelType::kUInt64> {
  using type = uint64_t;
};

template <>
struct PixelTypeToCpp<PixelType::kFloat> {
  using type = float;
};

template <>
struct PixelTypeToCpp<PixelType::kDouble> {
  using type = double;
};

template <>
struct PixelTypeToCpp<PixelType::kBit> {
  using type = uint8_t;
};

/// @brief Check whether T is the decoded element type of a pixel type
template <typename T>
constexpr bool MatchesPixelType(PixelType type) {
  switch (type) {
    case PixelType::kInt8:
      return std::is_same_v<T, int8_t>;
    case PixelType::kUInt8:
    case PixelType::kBit:
      return std::is_same_v<T, uint8_t>;
    case PixelType::kInt16:
      return std::is_same_v<T, int16_t>;
    case PixelType::kUInt16:
      return std::is_same_v<T, uint16_t>;
    case PixelType::kInt32:
      return std::is_same_v<T, int32_t>;
    case PixelType::kUInt32:
      return std::is_same_v<T, uint32_t>;
    case PixelType::kInt64:
      return std::is_same_v<T, int64_t>;
    case PixelType::kUInt64:
      return std::is_same_v<T, uint64_t>;
    case PixelType::kFloat:
      return std::is_same_v<T, float>;
    case PixelType::kDouble:
      return std::is_same_v<T, double>;
  }
  return false;
}

/// @brief Get string representation of a pixel type
constexpr const char* GetName(PixelType type) {
  switch (type) {
    case PixelType::kInt8:
      return "int8";
    case PixelType::kUInt8:
      return "uint8";
    case PixelType::kInt16:
      return "int16";
    case PixelType::kUInt16:
      return "uint16";
    case PixelType::kInt32:
      return "int32";
    case PixelType::kUInt32:
      return "uint32";
    case PixelType::kInt64:
      return "int64";
    case PixelType::kUInt64:
      return "uint64";
    case PixelType::kFloat:
      return "float";
    case PixelType::kDouble:
      return "double";
    case PixelType::kBit:
      return "bit";
  }
  return "unknown";
}

// Dispatching helper
template <typename Func>
void DispatchByPixelType(PixelType type, Func&& func) {
  switch (type) {
    case PixelType::kInt8:
      func.template operator()<int8_t>();
      break;
    case PixelType::kUInt8:
    case PixelType::kBit:
      func.template operator()<uint8_t>();
      break;
    case PixelType::kInt16:
      func.template operator()<int16_t>();
      break;
    case PixelType::kUInt16:
      func.template operator()<uint16_t>();
      break;
    case PixelType::kInt32:
      func.template operator()<int32_t>();
      break;
    case PixelType::kUInt32:
      func.template operator()<uint32_t>();
      break;
    case PixelType::kInt64:
      func.template operator()<int64_t>();
      break;
    case PixelType::kUInt64:
      func.template operator()<uint64_t>();
      break;
    case PixelType::kFloat:
      func.template operator()<float>();
      break;
    case PixelType::kDouble:
      func.template operator()<double>();
      break;
    default:
      throw std::runtime_error("Unsupported pixel type");
  }
}

}  // namespace planeio

#endif  // PLANEIO_INCLUDE_PLANEIO_PIXEL_TYPE_H_
