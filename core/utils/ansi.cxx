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

#include "ansi.hxx"

namespace spanpipe::core::utils
{
auto
ansi_color(level lvl) -> std::string_view
{
  switch (lvl) {
    case level::trace:
      return "\x1b[35m"; // magenta
    case level::debug:
      return "\x1b[36m"; // cyan
    case level::info:
      return "\x1b[32m"; // green
    case level::warn:
      return "\x1b[33m"; // yellow
    case level::error:
      return "\x1b[31m"; // red
    case level::off:
      break;
  }
  return {};
}

auto
strip_ansi(std::string_view input) -> std::string
{
  std::string result{};
  result.reserve(input.size());
  bool in_escape{ false };
  for (const char c : input) {
    if (c == '\x1b') {
      in_escape = true;
    } else if (in_escape) {
      if (c == 'm') {
        in_escape = false;
      }
    } else {
      result.push_back(c);
    }
  }
  return result;
}
} // namespace spanpipe::core::utils
