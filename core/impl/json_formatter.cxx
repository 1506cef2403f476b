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

#include <spanpipe/json_formatter.hxx>

#include "core/chrono_utils.hxx"

#include <tao/json.hpp>
#include <tao/json/contrib/traits.hpp>

#include <cstdint>
#include <type_traits>
#include <utility>
#include <variant>

namespace tao::json
{
template<>
struct traits<spanpipe::field_value> {
  template<template<typename...> class Traits>
  static void assign(basic_value<Traits>& v, const spanpipe::field_value& value)
  {
    std::visit(
      [&v](const auto& item) {
        using item_type = std::decay_t<decltype(item)>;
        if constexpr (std::is_same_v<item_type, spanpipe::debug_value>) {
          v = item.text;
        } else {
          v = item;
        }
      },
      value);
  }
};

template<>
struct traits<spanpipe::field> {
  template<template<typename...> class Traits>
  static void assign(basic_value<Traits>& v, const spanpipe::field& f)
  {
    v = {
      { "key", f.key },
      { "value", f.value },
    };
  }
};

template<>
struct traits<spanpipe::source_location> {
  template<template<typename...> class Traits>
  static void assign(basic_value<Traits>& v, const spanpipe::source_location& location)
  {
    v = {
      { "file", location.file },
      { "line", location.line },
    };
  }
};
} // namespace tao::json

namespace spanpipe
{
json_formatter::json_formatter(json_formatter_options options)
  : options_{ options }
{
}

auto
json_formatter::format(const dispatch_record& record) -> std::string
{
  const auto& meta = record.meta();
  tao::json::value json = {
    { "kind", std::string{ to_string(record.kind()) } },
    { "timestamp", core::to_iso8601_utc(record.timestamp().wall) },
    { "level", std::string{ to_string(meta.level) } },
    { "target", meta.target },
    { "name", meta.name },
    { "fields", record.fields() },
  };
  auto& object = json.get_object();
  if (auto id = record.id(); id) {
    object.emplace("id", id.value());
  }
  if (auto parent = record.parent_id(); parent) {
    object.emplace("parent_id", parent.value());
  }
  if (const auto* closed = record.try_as_span_closed(); closed != nullptr) {
    object.emplace("start_time", core::to_iso8601_utc(closed->start_time.wall));
    object.emplace("elapsed_us", static_cast<std::int64_t>(closed->elapsed().count()));
  }
  if (options_.include_location && meta.location) {
    object.emplace("location", meta.location.value());
  }
  return tao::json::to_string(json);
}
} // namespace spanpipe
