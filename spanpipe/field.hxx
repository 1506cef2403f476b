/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *   Copyright 2025-Current Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

#pragma once

#include <fmt/core.h>

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace spanpipe
{
/**
 * Value rendered eagerly with `{}` formatting, for types that have no native field
 * representation.
 */
struct debug_value {
  std::string text{};
};

inline auto
operator==(const debug_value& lhs, const debug_value& rhs) -> bool
{
  return lhs.text == rhs.text;
}

using field_value = std::variant<std::string, std::int64_t, double, bool, debug_value>;

struct field {
  std::string key{};
  field_value value{};

  field() = default;

  field(std::string field_key, field_value field_val)
    : key{ std::move(field_key) }
    , value{ std::move(field_val) }
  {
  }

  field(std::string field_key, const char* text)
    : key{ std::move(field_key) }
    , value{ std::string{ text } }
  {
  }

  template<typename Integer,
           std::enable_if_t<std::is_integral_v<Integer> && !std::is_same_v<Integer, bool>, int> = 0>
  field(std::string field_key, Integer number)
    : key{ std::move(field_key) }
    , value{ static_cast<std::int64_t>(number) }
  {
  }

  field(std::string field_key, float number)
    : key{ std::move(field_key) }
    , value{ static_cast<double>(number) }
  {
  }
};

inline auto
operator==(const field& lhs, const field& rhs) -> bool
{
  return lhs.key == rhs.key && lhs.value == rhs.value;
}

inline auto
operator!=(const field& lhs, const field& rhs) -> bool
{
  return !(lhs == rhs);
}

/**
 * Ordered sequence of fields. Insertion order is kept for deterministic output.
 */
using field_set = std::vector<field>;

template<typename T>
auto
debug_field(std::string key, const T& value) -> field
{
  return { std::move(key), debug_value{ fmt::format("{}", value) } };
}

/**
 * Renders the value without quoting, e.g. `42`, `true`, `0.5` or the raw text.
 */
auto
to_string(const field_value& value) -> std::string;

/**
 * @return pointer to the first field with the given key, or nullptr
 */
auto
find_field(const field_set& fields, const std::string& key) -> const field*;
} // namespace spanpipe
