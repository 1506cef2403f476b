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

#include <spanpipe/level.hxx>

#include <algorithm>
#include <cctype>
#include <string>

namespace spanpipe
{
auto
to_string(level lvl) -> std::string_view
{
  switch (lvl) {
    case level::trace:
      return "TRACE";
    case level::debug:
      return "DEBUG";
    case level::info:
      return "INFO";
    case level::warn:
      return "WARN";
    case level::error:
      return "ERROR";
    case level::off:
      return "OFF";
  }
  return "UNKNOWN";
}

auto
level_from_string(std::string_view name) -> std::optional<level>
{
  std::string normalized{ name };
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (normalized == "trace") {
    return level::trace;
  }
  if (normalized == "debug") {
    return level::debug;
  }
  if (normalized == "info") {
    return level::info;
  }
  if (normalized == "warn" || normalized == "warning") {
    return level::warn;
  }
  if (normalized == "error") {
    return level::error;
  }
  if (normalized == "off") {
    return level::off;
  }
  return {};
}
} // namespace spanpipe
