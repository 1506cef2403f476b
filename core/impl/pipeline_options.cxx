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

#include <spanpipe/error_codes.hxx>
#include <spanpipe/pipeline_options.hxx>

#include "core/logger/logger.hxx"
#include "core/utils/duration_parser.hxx"

#include <charconv>
#include <string>

namespace spanpipe
{
namespace
{
auto
trim(std::string_view text) -> std::string_view
{
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
    text.remove_suffix(1);
  }
  return text;
}

auto
parse_size(std::string_view text) -> std::optional<std::size_t>
{
  std::size_t value{};
  const auto* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end || text.empty()) {
    return {};
  }
  return value;
}

auto
parse_milliseconds(std::string_view text) -> std::optional<std::chrono::milliseconds>
{
  try {
    auto value = core::utils::parse_duration(std::string{ text });
    if (value.count() < 0) {
      return {};
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(value);
  } catch (const core::utils::duration_parse_error& e) {
    SP_LOG_DEBUG("{}", e.what());
    return {};
  }
}

auto
apply_option(pipeline_options& options, std::string_view key, std::string_view value) -> bool
{
  if (key == "queue_capacity") {
    if (auto capacity = parse_size(value); capacity && capacity.value() > 0) {
      options.queue_capacity(capacity.value());
      return true;
    }
  } else if (key == "overflow_policy" || key == "overflow") {
    if (auto policy = overflow_policy_from_string(value); policy) {
      options.overflow(policy.value());
      return true;
    }
  } else if (key == "batch_size") {
    if (auto size = parse_size(value); size && size.value() > 0) {
      options.batch_size(size.value());
      return true;
    }
  } else if (key == "batch_window") {
    if (auto window = parse_milliseconds(value); window) {
      options.batch_window(window.value());
      return true;
    }
  } else if (key == "retry_attempts") {
    if (auto attempts = parse_size(value); attempts) {
      options.retry_attempts(attempts.value());
      return true;
    }
  } else if (key == "retry_backoff") {
    if (auto backoff = parse_milliseconds(value); backoff) {
      options.retry_backoff(backoff.value());
      return true;
    }
  } else if (key == "min_level") {
    if (auto threshold = level_from_string(value); threshold) {
      options.min_level(threshold.value());
      return true;
    }
  }
  return false;
}
} // namespace

auto
to_string(overflow_policy policy) -> std::string_view
{
  switch (policy) {
    case overflow_policy::block:
      return "block";
    case overflow_policy::drop_newest:
      return "drop_newest";
    case overflow_policy::drop_oldest:
      return "drop_oldest";
  }
  return "unknown";
}

auto
overflow_policy_from_string(std::string_view name) -> std::optional<overflow_policy>
{
  if (name == "block") {
    return overflow_policy::block;
  }
  if (name == "drop_newest") {
    return overflow_policy::drop_newest;
  }
  if (name == "drop_oldest") {
    return overflow_policy::drop_oldest;
  }
  return {};
}

auto
parse_pipeline_options(std::string_view text, pipeline_options base)
  -> std::pair<std::error_code, pipeline_options>
{
  while (!text.empty()) {
    auto separator = text.find_first_of(";&");
    auto pair = trim(text.substr(0, separator));
    text = separator == std::string_view::npos ? std::string_view{} : text.substr(separator + 1);
    if (pair.empty()) {
      continue;
    }

    auto equals = pair.find('=');
    if (equals == std::string_view::npos) {
      SP_LOG_WARNING(R"(pipeline option "{}" is not a key=value pair)", pair);
      return { errc::telemetry::invalid_argument, base };
    }
    auto key = trim(pair.substr(0, equals));
    auto value = trim(pair.substr(equals + 1));
    if (!apply_option(base, key, value)) {
      SP_LOG_WARNING(R"(unable to apply pipeline option "{}" with value "{}")", key, value);
      return { errc::telemetry::invalid_argument, base };
    }
  }
  return { {}, base };
}
} // namespace spanpipe
