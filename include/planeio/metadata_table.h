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

#ifndef PLANEIO_INCLUDE_PLANEIO_METADATA_TABLE_H_
#define PLANEIO_INCLUDE_PLANEIO_METADATA_TABLE_H_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "planeio/options.h"

namespace planeio {

/// @brief Raw original-metadata table
///
/// Holds the key/value pairs a parser found in the resource, before any
/// interpretation. Values keep the type they were parsed as. Lookups with
/// a different type convert where possible and fall back to a default.
class MetadataTable {
 public:
  /// @brief Value type for table entries
  using Value = std::variant<std::string, int64_t, double>;

  /// @brief Underlying container type
  using Container = std::map<std::string, Value, std::less<>>;

  using iterator = Container::iterator;
  using const_iterator = Container::const_iterator;
  using value_type = Container::value_type;

  MetadataTable() = default;

  MetadataTable(std::initializer_list<value_type> init) : data_(init) {}

  /// @brief Insert or replace an entry
  void Set(std::string key, Value value) {
    data_.insert_or_assign(std::move(key), std::move(value));
  }

  /// @brief Insert an entry, suffixing the key with " #n" when it is taken
  ///
  /// Used for headers that repeat a key (history lines and the like).
  void Add(const std::string& key, Value value);

  /// @brief Remove an entry
  /// @return True if the key was present
  bool Erase(std::string_view key);

  [[nodiscard]] bool contains(std::string_view key) const {
    return data_.find(key) != data_.end();
  }

  /// @brief Get value as string with optional default
  [[nodiscard]] std::string GetString(std::string_view key,
                                      const std::string& default_value = "") const;

  /// @brief Get value as double with optional default
  [[nodiscard]] double GetDouble(std::string_view key,
                                 double default_value = 0.0) const;

  /// @brief Get value as integer with optional default
  [[nodiscard]] int64_t GetInt(std::string_view key,
                               int64_t default_value = 0) const;

  /// @brief Copy every entry of another table, optionally prefixing keys
  void Merge(const MetadataTable& other, std::string_view prefix = "");

  size_t size() const noexcept { return data_.size(); }

  bool empty() const noexcept { return data_.empty(); }

  void clear() noexcept { data_.clear(); }

  iterator begin() { return data_.begin(); }

  const_iterator begin() const { return data_.begin(); }

  iterator end() { return data_.end(); }

  const_iterator end() const { return data_.end(); }

  /// @brief Convert to formatted string
  /// @param indent Number of spaces to indent each line
  std::string ToString(size_t indent = 0) const;

 private:
  Container data_;
};

/// @brief Apply a filter policy to a table in place
void ApplyMetadataFilter(const MetadataFilter& filter, MetadataTable& table);

std::ostream& operator<<(std::ostream& os, const MetadataTable& table);

}  // namespace planeio

#endif  // PLANEIO_INCLUDE_PLANEIO_METADATA_TABLE_H_
