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

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace spanpipe
{
/**
 * Opaque span identifier. Issued from a process-wide counter starting at 1, zero is never used.
 */
using span_id = std::uint64_t;

/**
 * Both clocks are sampled together: the wall clock is used for display, the monotonic clock
 * for durations and for ordering records that were produced on different threads.
 */
struct record_time {
  std::chrono::system_clock::time_point wall{};
  std::chrono::steady_clock::time_point monotonic{};

  static auto now() -> record_time;
};

inline auto
operator==(const record_time& lhs, const record_time& rhs) -> bool
{
  return lhs.wall == rhs.wall && lhs.monotonic == rhs.monotonic;
}

struct event_record {
  std::shared_ptr<const metadata> meta{};
  std::optional<span_id> parent_id{};
  field_set fields{};
  record_time timestamp{};
};

struct span_opened_record {
  span_id id{ 0 };
  std::shared_ptr<const metadata> meta{};
  std::optional<span_id> parent_id{};
  field_set fields{};
  record_time start_time{};
};

struct span_closed_record {
  span_id id{ 0 };
  std::shared_ptr<const metadata> meta{};
  std::optional<span_id> parent_id{};
  field_set fields{};
  record_time start_time{};
  record_time end_time{};

  [[nodiscard]] auto elapsed() const -> std::chrono::microseconds
  {
    return std::chrono::duration_cast<std::chrono::microseconds>(end_time.monotonic -
                                                                 start_time.monotonic);
  }
};

/**
 * Lifecycle of a span id: unopened -> open -> closed. Closed is terminal.
 */
enum class span_state {
  unopened,
  open,
  closed,
};

auto
to_string(span_state state) -> std::string_view;

enum class record_kind {
  event,
  span_opened,
  span_closed,
};

auto
to_string(record_kind kind) -> std::string_view;

/**
 * Unit of work passed down the stage chain. Immutable once built: stages receive it by const
 * reference and enrichers produce an augmented copy.
 */
class dispatch_record
{
public:
  explicit dispatch_record(event_record record);
  explicit dispatch_record(span_opened_record record);
  explicit dispatch_record(span_closed_record record);

  dispatch_record(const dispatch_record&) = default;
  dispatch_record(dispatch_record&&) noexcept = default;
  auto operator=(const dispatch_record&) -> dispatch_record& = default;
  auto operator=(dispatch_record&&) noexcept -> dispatch_record& = default;
  ~dispatch_record() = default;

  [[nodiscard]] auto kind() const noexcept -> record_kind;

  [[nodiscard]] auto is_event() const noexcept -> bool;
  [[nodiscard]] auto as_event() const& -> const event_record&;
  [[nodiscard]] auto try_as_event() const -> const event_record*;

  [[nodiscard]] auto is_span_opened() const noexcept -> bool;
  [[nodiscard]] auto as_span_opened() const& -> const span_opened_record&;
  [[nodiscard]] auto try_as_span_opened() const -> const span_opened_record*;

  [[nodiscard]] auto is_span_closed() const noexcept -> bool;
  [[nodiscard]] auto as_span_closed() const& -> const span_closed_record&;
  [[nodiscard]] auto try_as_span_closed() const -> const span_closed_record*;

  [[nodiscard]] auto meta() const -> const metadata&;
  [[nodiscard]] auto level() const -> spanpipe::level;
  [[nodiscard]] auto fields() const -> const field_set&;
  [[nodiscard]] auto parent_id() const -> std::optional<span_id>;

  /**
   * @return id of the span for span records, empty for events
   */
  [[nodiscard]] auto id() const -> std::optional<span_id>;

  /**
   * @return time of the event, span start or span end depending on the kind
   */
  [[nodiscard]] auto timestamp() const -> const record_time&;

  /**
   * @return copy of this record with `extra` appended to its fields
   */
  [[nodiscard]] auto with_fields(const field_set& extra) const -> dispatch_record;

  friend auto operator==(const dispatch_record& lhs, const dispatch_record& rhs) -> bool;

private:
  std::variant<event_record, span_opened_record, span_closed_record> record_;
};

auto
operator==(const dispatch_record& lhs, const dispatch_record& rhs) -> bool;

inline auto
operator!=(const dispatch_record& lhs, const dispatch_record& rhs) -> bool
{
  return !(lhs == rhs);
}
} // namespace spanpipe
