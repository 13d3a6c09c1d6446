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

#include "planeio/metadata_table.h"

#include <algorithm>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"

namespace planeio {

namespace {

std::string ValueToString(const MetadataTable::Value& value) {
  return std::visit(
      [](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
          return v;
        } else if constexpr (std::is_same_v<T, int64_t>) {
          return absl::StrFormat("%d", v);
        } else {
          return absl::StrFormat("%g", v);
        }
      },
      value);
}

std::string StripControlCharacters(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    auto u = static_cast<unsigned char>(c);
    if (u >= 0x20 && u != 0x7f) {
      out.push_back(c);
    }
  }
  return out;
}

}  // namespace

void MetadataTable::Add(const std::string& key, Value value) {
  if (!contains(key)) {
    data_.emplace(key, std::move(value));
    return;
  }
  for (int n = 2;; ++n) {
    std::string candidate = absl::StrFormat("%s #%d", key, n);
    if (!contains(candidate)) {
      data_.emplace(std::move(candidate), std::move(value));
      return;
    }
  }
}

bool MetadataTable::Erase(std::string_view key) {
  auto it = data_.find(key);
  if (it == data_.end()) {
    return false;
  }
  data_.erase(it);
  return true;
}

std::string MetadataTable::GetString(std::string_view key,
                                     const std::string& default_value) const {
  auto it = data_.find(key);
  if (it == data_.end()) {
    return default_value;
  }
  return ValueToString(it->second);
}

double MetadataTable::GetDouble(std::string_view key,
                                double default_value) const {
  auto it = data_.find(key);
  if (it == data_.end()) {
    return default_value;
  }

  return std::visit(
      [default_value](const auto& value) -> double {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::string>) {
          double parsed = 0.0;
          return absl::SimpleAtod(value, &parsed) ? parsed : default_value;
        } else {
          return static_cast<double>(value);
        }
      },
      it->second);
}

int64_t MetadataTable::GetInt(std::string_view key,
                              int64_t default_value) const {
  auto it = data_.find(key);
  if (it == data_.end()) {
    return default_value;
  }

  return std::visit(
      [default_value](const auto& value) -> int64_t {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::string>) {
          int64_t parsed = 0;
          return absl::SimpleAtoi(value, &parsed) ? parsed : default_value;
        } else {
          return static_cast<int64_t>(value);
        }
      },
      it->second);
}

void MetadataTable::Merge(const MetadataTable& other, std::string_view prefix) {
  for (const auto& [key, value] : other) {
    Set(std::string(prefix) + key, value);
  }
}

std::string MetadataTable::ToString(size_t indent) const {
  std::string result;
  std::string indent_str(indent, ' ');

  for (const auto& [key, value] : data_) {
    result += indent_str + key + ": ";
    if (std::holds_alternative<std::string>(value)) {
      result += "\"" + std::get<std::string>(value) + "\"";
    } else {
      result += ValueToString(value);
    }
    result += "\n";
  }

  return result;
}

void ApplyMetadataFilter(const MetadataFilter& filter, MetadataTable& table) {
  MetadataTable filtered;
  for (const auto& [raw_key, raw_value] : table) {
    std::string key = filter.strip_control_characters
                          ? StripControlCharacters(raw_key)
                          : raw_key;
    MetadataTable::Value value = raw_value;
    if (auto* text = std::get_if<std::string>(&value)) {
      if (filter.strip_control_characters) {
        *text = StripControlCharacters(*text);
      }
      if (text->size() > filter.max_value_length) {
        continue;
      }
      if (filter.drop_empty && text->empty()) {
        continue;
      }
    }
    if (filter.drop_empty && key.empty()) {
      continue;
    }
    bool excluded = std::any_of(
        filter.excluded_prefixes.begin(), filter.excluded_prefixes.end(),
        [&key](const std::string& prefix) {
          return absl::StartsWith(key, prefix);
        });
    if (excluded) {
      continue;
    }
    filtered.Set(std::move(key), std::move(value));
  }
  table = std::move(filtered);
}

std::ostream& operator<<(std::ostream& os, const MetadataTable& table) {
  os << "MetadataTable {\n" << table.ToString(2) << "}";
  return os;
}

}  // namespace planeio
