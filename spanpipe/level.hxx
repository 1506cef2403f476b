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

#include <optional>
#include <string_view>

namespace spanpipe
{
/**
 * Severity of a record, ordered from the most verbose to the most severe.
 *
 * `off` is only meaningful as a threshold, records never carry it.
 */
enum class level {
  trace = 0,
  debug = 1,
  info = 2,
  warn = 3,
  error = 4,
  off = 5,
};

/**
 * @return upper case name of the level, e.g. "INFO"
 */
auto
to_string(level lvl) -> std::string_view;

/**
 * Case-insensitive parsing. "warning" is accepted as an alias of "warn".
 *
 * @return empty optional if the name is not recognized
 */
auto
level_from_string(std::string_view name) -> std::optional<level>;

/**
 * @return true if a record at `lvl` passes the `threshold`
 */
constexpr auto
is_enabled(level lvl, level threshold) -> bool
{
  return lvl != level::off && static_cast<int>(lvl) >= static_cast<int>(threshold);
}
} // namespace spanpipe
