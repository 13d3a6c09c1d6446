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

#ifndef PLANEIO_INCLUDE_PLANEIO_PIXEL_BUFFER_H_
#define PLANEIO_INCLUDE_PLANEIO_PIXEL_BUFFER_H_

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "planeio/pixel_type.h"

namespace planeio {

/// @brief Typed array of decoded pixel elements
///
/// The element type is fixed at construction by a PixelType. Typed access
/// through GetDataAs<T>() or As<T>() throws std::runtime_error when T does
/// not match the stored type.
class PixelBuffer {
 public:
  /// @brief Default constructor for an empty buffer
  PixelBuffer() = default;

  /// @brief Allocate a zero-initialized buffer
  /// @param type Element type
  /// @param count Number of elements
  PixelBuffer(PixelType type, size_t count)
      : type_(type), count_(count), data_(count * GetPixelTypeSize(type), 0) {}

  PixelBuffer(const PixelBuffer& other) = default;
  PixelBuffer(PixelBuffer&& other) noexcept = default;
  PixelBuffer& operator=(const PixelBuffer& other) = default;
  PixelBuffer& operator=(PixelBuffer&& other) noexcept = default;
  ~PixelBuffer() = default;

  /// @brief Get element type
  [[nodiscard]] PixelType GetPixelType() const noexcept { return type_; }

  /// @brief Get number of elements
  [[nodiscard]] size_t Size() const noexcept { return count_; }

  /// @brief Get size of the storage in bytes
  [[nodiscard]] size_t SizeBytes() const noexcept { return data_.size(); }

  [[nodiscard]] bool Empty() const noexcept { return count_ == 0; }

  /// @brief Raw storage
  [[nodiscard]] uint8_t* Data() noexcept { return data_.data(); }

  [[nodiscard]] const uint8_t* Data() const noexcept { return data_.data(); }

  /// @brief Get typed pointer to the elements
  /// @tparam T Element type, must match the pixel type
  /// @throws std::runtime_error on type mismatch
  template <typename T>
  T* GetDataAs() {
    CheckType<T>();
    return reinterpret_cast<T*>(data_.data());
  }

  template <typename T>
  const T* GetDataAs() const {
    CheckType<T>();
    return reinterpret_cast<const T*>(data_.data());
  }

  /// @brief Get typed view of the elements
  template <typename T>
  std::span<T> As() {
    return std::span<T>(GetDataAs<T>(), count_);
  }

  template <typename T>
  std::span<const T> As() const {
    return std::span<const T>(GetDataAs<T>(), count_);
  }

  /// @brief Read one element converted to double
  /// @throws std::out_of_range if index is past the end
  [[nodiscard]] double GetValue(size_t index) const {
    if (index >= count_) {
      throw std::out_of_range("Pixel index out of bounds");
    }
    double value = 0.0;
    DispatchByPixelType(type_, [&]<typename T>() {
      value = static_cast<double>(GetDataAs<T>()[index]);
    });
    return value;
  }

 private:
  template <typename T>
  void CheckType() const {
    if (!MatchesPixelType<T>(type_)) {
      throw std::runtime_error(std::string("Pixel buffer holds ") +
                               GetName(type_) + " elements");
    }
  }

  PixelType type_ = PixelType::kUInt8;
  size_t count_ = 0;
  std::vector<uint8_t> data_;
};

}  // namespace planeio

#endif  // PLANEIO_INCLUDE_PLANEIO_PIXEL_BUFFER_H_
