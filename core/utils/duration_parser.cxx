/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *   Copyright 2020-2021 Couchbase, Inc.
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

#include "duration_parser.hxx"

#include <cstdint>
#include <limits>
#include <string_view>

namespace spanpipe::core::utils
{
namespace
{
auto
unit_scale(std::string_view unit) -> std::uint64_t
{
  if (unit == "ns") {
    return 1ULL;
  }
  // U+00B5 micro sign and U+03BC greek letter mu
  if (unit == "us" || unit == "\u00b5s" || unit == "\u03bcs") {
    return 1'000ULL;
  }
  if (unit == "ms") {
    return 1'000'000ULL;
  }
  if (unit == "s") {
    return 1'000'000'000ULL;
  }
  if (unit == "m") {
    return 60ULL * 1'000'000'000ULL;
  }
  if (unit == "h") {
    return 60ULL * 60ULL * 1'000'000'000ULL;
  }
  return 0;
}

auto
is_digit(char c) -> bool
{
  return c >= '0' && c <= '9';
}
} // namespace

std::chrono::nanoseconds
parse_duration(const std::string& text)
{
  std::string_view input{ text };
  const std::string_view original{ text };

  bool negative{ false };
  if (!input.empty() && (input.front() == '-' || input.front() == '+')) {
    negative = input.front() == '-';
    input.remove_prefix(1);
  }
  if (input == "0") {
    return std::chrono::nanoseconds::zero();
  }
  if (input.empty()) {
    throw duration_parse_error("invalid duration: \"" + std::string{ original } + "\"");
  }

  constexpr auto max_value = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
  std::uint64_t total{ 0 };
  while (!input.empty()) {
    if (!(input.front() == '.' || is_digit(input.front()))) {
      throw duration_parse_error("invalid duration: \"" + std::string{ original } + "\"");
    }

    std::uint64_t whole{ 0 };
    bool has_whole{ false };
    while (!input.empty() && is_digit(input.front())) {
      if (whole > (max_value - 9) / 10) {
        throw duration_parse_error("invalid duration (overflow): \"" + std::string{ original } +
                                   "\"");
      }
      whole = whole * 10 + static_cast<std::uint64_t>(input.front() - '0');
      has_whole = true;
      input.remove_prefix(1);
    }

    std::uint64_t fraction{ 0 };
    double fraction_scale{ 1 };
    bool has_fraction{ false };
    if (!input.empty() && input.front() == '.') {
      input.remove_prefix(1);
      while (!input.empty() && is_digit(input.front())) {
        if (fraction <= (max_value - 9) / 10) {
          fraction = fraction * 10 + static_cast<std::uint64_t>(input.front() - '0');
          fraction_scale *= 10;
        }
        has_fraction = true;
        input.remove_prefix(1);
      }
    }
    if (!has_whole && !has_fraction) {
      throw duration_parse_error("invalid duration: \"" + std::string{ original } + "\"");
    }

    std::size_t unit_length{ 0 };
    while (unit_length < input.size() && input[unit_length] != '.' &&
           !is_digit(input[unit_length])) {
      ++unit_length;
    }
    if (unit_length == 0) {
      throw duration_parse_error("missing unit in duration: \"" + std::string{ original } + "\"");
    }
    const auto unit = input.substr(0, unit_length);
    const auto scale = unit_scale(unit);
    if (scale == 0) {
      throw duration_parse_error("unknown unit \"" + std::string{ unit } + "\" in duration: \"" +
                                 std::string{ original } + "\"");
    }
    input.remove_prefix(unit_length);

    if (whole > max_value / scale) {
      throw duration_parse_error("invalid duration (overflow): \"" + std::string{ original } +
                                 "\"");
    }
    auto value = whole * scale;
    if (has_fraction) {
      value += static_cast<std::uint64_t>(static_cast<double>(fraction) *
                                          (static_cast<double>(scale) / fraction_scale));
    }
    if (value > max_value - total) {
      throw duration_parse_error("invalid duration (overflow): \"" + std::string{ original } +
                                 "\"");
    }
    total += value;
  }

  auto result = static_cast<std::int64_t>(total);
  return std::chrono::nanoseconds{ negative ? -result : result };
}
} // namespace spanpipe::core::utils
