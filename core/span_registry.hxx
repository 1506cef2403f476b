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

#include <spanpipe/field.hxx>
#include <spanpipe/metadata.hxx>
#include <spanpipe/record.hxx>

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

namespace spanpipe::core
{
struct span_snapshot {
  span_id id{ 0 };
  std::shared_ptr<const metadata> meta{};
  std::optional<span_id> parent_id{};
  field_set fields{};
  record_time start_time{};
  std::optional<record_time> end_time{};
};

/**
 * Table of the spans that are open, or closed but not yet dispatched.
 *
 * Entries are spread over independently locked shards selected by id, so spans opened at
 * unrelated call sites rarely contend. Parent and child reference each other only by id.
 */
class span_registry
{
public:
  static constexpr std::size_t default_shard_count{ 16 };

  explicit span_registry(std::size_t shard_count = default_shard_count);

  /**
   * Allocates a new id, records the current span of the active context as parent and pushes
   * the id onto the active context.
   *
   * A context forked from a span can outlive it. When the current span is no longer open in
   * this registry the new span is recorded without a parent.
   */
  auto open(std::shared_ptr<const metadata> meta, field_set fields) -> span_snapshot;

  /**
   * @return errc::telemetry::span_not_open if the span is closed or unknown
   */
  auto add_field(span_id id, field value) -> std::error_code;

  /**
   * Marks the span closed and pops it from the active context.
   *
   * @return errc::telemetry::span_not_open if the span is not open,
   * errc::telemetry::context_mismatch if it is not the current span of the active context (the
   * span stays open)
   */
  auto close(span_id id) -> std::pair<std::error_code, span_snapshot>;

  /**
   * Forgets a closed span. Open spans are left untouched.
   */
  void reclaim(span_id id);

  [[nodiscard]] auto state(span_id id) const -> span_state;
  [[nodiscard]] auto open_spans() const -> std::size_t;

  /**
   * @return most recently issued id in this process, zero if none was issued yet
   */
  static auto last_issued_id() -> span_id;

private:
  struct entry {
    span_snapshot snapshot;
    span_state state{ span_state::open };
  };

  struct shard {
    mutable std::mutex mutex{};
    std::unordered_map<span_id, entry> entries{};
  };

  [[nodiscard]] auto shard_for(span_id id) const -> shard&;
  [[nodiscard]] auto is_open(span_id id) const -> bool;

  std::vector<std::unique_ptr<shard>> shards_{};
};
} // namespace spanpipe::core
