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

#include <spanpipe/level.hxx>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string_view>
#include <system_error>
#include <utility>

namespace spanpipe
{
/**
 * Behavior of a producer that hits a full export queue.
 */
enum class overflow_policy {
  /**
   * Wait until the drain thread makes room, or until the pipeline shuts down.
   */
  block,

  /**
   * Discard the incoming record and count it.
   */
  drop_newest,

  /**
   * Evict the oldest queued record to make room for the incoming one.
   */
  drop_oldest,
};

auto
to_string(overflow_policy policy) -> std::string_view;

auto
overflow_policy_from_string(std::string_view name) -> std::optional<overflow_policy>;

class pipeline_options
{
public:
  static constexpr std::size_t default_queue_capacity{ 1'024 };
  static constexpr overflow_policy default_overflow_policy{ overflow_policy::drop_newest };
  static constexpr std::size_t default_batch_size{ 64 };
  static constexpr std::chrono::milliseconds default_batch_window{ 100 };
  static constexpr std::size_t default_retry_attempts{ 3 };
  static constexpr std::chrono::milliseconds default_retry_backoff{ 50 };
  static constexpr std::chrono::milliseconds max_retry_backoff{ std::chrono::seconds{ 1 } };
  static constexpr spanpipe::level default_min_level{ level::trace };

  auto queue_capacity(std::size_t capacity) -> pipeline_options&
  {
    queue_capacity_ = capacity;
    return *this;
  }

  auto overflow(overflow_policy policy) -> pipeline_options&
  {
    overflow_policy_ = policy;
    return *this;
  }

  auto batch_size(std::size_t size) -> pipeline_options&
  {
    batch_size_ = size;
    return *this;
  }

  auto batch_window(std::chrono::milliseconds window) -> pipeline_options&
  {
    batch_window_ = window;
    return *this;
  }

  /**
   * Number of additional attempts after the first failed write of a batch.
   */
  auto retry_attempts(std::size_t attempts) -> pipeline_options&
  {
    retry_attempts_ = attempts;
    return *this;
  }

  /**
   * Delay before the first retry. Doubles on every subsequent retry, up to max_retry_backoff.
   */
  auto retry_backoff(std::chrono::milliseconds backoff) -> pipeline_options&
  {
    retry_backoff_ = backoff;
    return *this;
  }

  auto min_level(spanpipe::level threshold) -> pipeline_options&
  {
    min_level_ = threshold;
    return *this;
  }

  struct built {
    std::size_t queue_capacity;
    overflow_policy overflow;
    std::size_t batch_size;
    std::chrono::milliseconds batch_window;
    std::size_t retry_attempts;
    std::chrono::milliseconds retry_backoff;
    spanpipe::level min_level;
  };

  [[nodiscard]] auto build() const -> built
  {
    return {
      queue_capacity_,
      overflow_policy_,
      batch_size_,
      batch_window_,
      retry_attempts_,
      retry_backoff_,
      min_level_,
    };
  }

private:
  std::size_t queue_capacity_{ default_queue_capacity };
  overflow_policy overflow_policy_{ default_overflow_policy };
  std::size_t batch_size_{ default_batch_size };
  std::chrono::milliseconds batch_window_{ default_batch_window };
  std::size_t retry_attempts_{ default_retry_attempts };
  std::chrono::milliseconds retry_backoff_{ default_retry_backoff };
  spanpipe::level min_level_{ default_min_level };
};

/**
 * Parses options from text such as
 *
 *   queue_capacity=4096;overflow_policy=drop_oldest;batch_window=250ms;min_level=warn
 *
 * Pairs are separated by ';' or '&'. Durations use the "300ms", "1.5s" syntax.
 *
 * @return errc::telemetry::invalid_argument for unknown keys or malformed values
 */
auto
parse_pipeline_options(std::string_view text,
                       pipeline_options base = {}) -> std::pair<std::error_code, pipeline_options>;
} // namespace spanpipe
