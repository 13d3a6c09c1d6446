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

#ifndef PLANEIO_INCLUDE_PLANEIO_ENUMS_ENUM_HANDLER_H_
#define PLANEIO_INCLUDE_PLANEIO_ENUMS_ENUM_HANDLER_H_

#include <initializer_list>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "planeio/status.h"

namespace planeio {
namespace enums {

/// @brief One pattern of an enumeration table
template <typename E>
struct EnumRule {
  /// @brief ECMAScript pattern, matched against the whole value ignoring
  /// case
  std::string_view pattern;
  E value;
};

/// @brief Maps free-text values onto an enumeration
///
/// Rules are compiled once and tried in table order; the first pattern
/// matching the whole value wins. Any unmatched value, the aliases "Other"
/// and "Unknown" included, resolves to the fallback term when the
/// enumeration has one.
///
/// Handlers are immutable after construction and may be shared between
/// threads.
///
/// Example usage:
/// @code
/// const EnumHandler<FontFamily>& handler = FontFamilyHandler();
/// DECLARE_ASSIGN_OR_RETURN_MOVE(FontFamily, family,
///                               handler.GetEnumeration(" Courier"));
/// @endcode
template <typename E>
class EnumHandler {
 public:
  EnumHandler(std::string name, std::initializer_list<EnumRule<E>> rules,
              std::optional<E> fallback = std::nullopt)
      : name_(std::move(name)), fallback_(fallback) {
    rules_.reserve(rules.size());
    for (const auto& rule : rules) {
      rules_.push_back(CompiledRule{
          std::regex(std::string(rule.pattern),
                     std::regex::ECMAScript | std::regex::icase),
          rule.value});
    }
  }

  /// @brief Resolve a value
  /// @retval InvalidArgument (enumeration kind) when nothing matches and
  ///         there is no fallback
  absl::StatusOr<E> GetEnumeration(std::string_view value) const {
    const std::string text(value);
    for (const auto& rule : rules_) {
      if (std::regex_match(text, rule.pattern)) {
        return rule.value;
      }
    }

    if (fallback_.has_value()) {
      return *fallback_;
    }
    return MAKE_STATUS(ErrorKind::kEnumeration,
                       absl::StrFormat("%s could not find enumeration for "
                                       "\"%s\"",
                                       name_, value));
  }

  [[nodiscard]] const std::string& GetName() const noexcept { return name_; }

  [[nodiscard]] std::optional<E> GetFallback() const noexcept {
    return fallback_;
  }

 private:
  struct CompiledRule {
    std::regex pattern;
    E value;
  };

  std::string name_;
  std::vector<CompiledRule> rules_;
  std::optional<E> fallback_;
};

}  // namespace enums
}  // namespace planeio

#endif  // PLANEIO_INCLUDE_PLANEIO_ENUMS_ENUM_HANDLER_H_
