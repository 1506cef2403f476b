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

#include <spanpipe/record.hxx>

#include <type_traits>
#include <utility>

namespace spanpipe
{
namespace
{
auto
same_metadata(const std::shared_ptr<const metadata>& lhs,
              const std::shared_ptr<const metadata>& rhs) -> bool
{
  if (lhs == rhs) {
    return true;
  }
  return lhs != nullptr && rhs != nullptr && *lhs == *rhs;
}

auto
same_record(const event_record& lhs, const event_record& rhs) -> bool
{
  return same_metadata(lhs.meta, rhs.meta) && lhs.parent_id == rhs.parent_id &&
         lhs.fields == rhs.fields && lhs.timestamp == rhs.timestamp;
}

auto
same_record(const span_opened_record& lhs, const span_opened_record& rhs) -> bool
{
  return lhs.id == rhs.id && same_metadata(lhs.meta, rhs.meta) &&
         lhs.parent_id == rhs.parent_id &&
         lhs.fields == rhs.fields && lhs.start_time == rhs.start_time;
}

auto
same_record(const span_closed_record& lhs, const span_closed_record& rhs) -> bool
{
  return lhs.id == rhs.id && same_metadata(lhs.meta, rhs.meta) &&
         lhs.parent_id == rhs.parent_id &&
         lhs.fields == rhs.fields && lhs.start_time == rhs.start_time &&
         lhs.end_time == rhs.end_time;
}
} // namespace

auto
record_time::now() -> record_time
{
  return { std::chrono::system_clock::now(), std::chrono::steady_clock::now() };
}

auto
to_string(span_state state) -> std::string_view
{
  switch (state) {
    case span_state::unopened:
      return "unopened";
    case span_state::open:
      return "open";
    case span_state::closed:
      return "closed";
  }
  return "unknown";
}

auto
to_string(record_kind kind) -> std::string_view
{
  switch (kind) {
    case record_kind::event:
      return "event";
    case record_kind::span_opened:
      return "span_opened";
    case record_kind::span_closed:
      return "span_closed";
  }
  return "unknown";
}

dispatch_record::dispatch_record(event_record record)
  : record_{ std::move(record) }
{
}

dispatch_record::dispatch_record(span_opened_record record)
  : record_{ std::move(record) }
{
}

dispatch_record::dispatch_record(span_closed_record record)
  : record_{ std::move(record) }
{
}

auto
dispatch_record::kind() const noexcept -> record_kind
{
  if (is_span_opened()) {
    return record_kind::span_opened;
  }
  if (is_span_closed()) {
    return record_kind::span_closed;
  }
  return record_kind::event;
}

auto
dispatch_record::is_event() const noexcept -> bool
{
  return std::holds_alternative<event_record>(record_);
}

auto
dispatch_record::as_event() const& -> const event_record&
{
  return std::get<event_record>(record_);
}

auto
dispatch_record::try_as_event() const -> const event_record*
{
  return std::get_if<event_record>(&record_);
}

auto
dispatch_record::is_span_opened() const noexcept -> bool
{
  return std::holds_alternative<span_opened_record>(record_);
}

auto
dispatch_record::as_span_opened() const& -> const span_opened_record&
{
  return std::get<span_opened_record>(record_);
}

auto
dispatch_record::try_as_span_opened() const -> const span_opened_record*
{
  return std::get_if<span_opened_record>(&record_);
}

auto
dispatch_record::is_span_closed() const noexcept -> bool
{
  return std::holds_alternative<span_closed_record>(record_);
}

auto
dispatch_record::as_span_closed() const& -> const span_closed_record&
{
  return std::get<span_closed_record>(record_);
}

auto
dispatch_record::try_as_span_closed() const -> const span_closed_record*
{
  return std::get_if<span_closed_record>(&record_);
}

auto
dispatch_record::meta() const -> const metadata&
{
  return *std::visit(
    [](const auto& r) -> const std::shared_ptr<const metadata>& {
      return r.meta;
    },
    record_);
}

auto
dispatch_record::level() const -> spanpipe::level
{
  return meta().level;
}

auto
dispatch_record::fields() const -> const field_set&
{
  return std::visit(
    [](const auto& r) -> const field_set& {
      return r.fields;
    },
    record_);
}

auto
dispatch_record::parent_id() const -> std::optional<span_id>
{
  return std::visit(
    [](const auto& r) -> std::optional<span_id> {
      return r.parent_id;
    },
    record_);
}

auto
dispatch_record::id() const -> std::optional<span_id>
{
  return std::visit(
    [](const auto& r) -> std::optional<span_id> {
      if constexpr (std::is_same_v<std::decay_t<decltype(r)>, event_record>) {
        return std::nullopt;
      } else {
        return r.id;
      }
    },
    record_);
}

auto
dispatch_record::timestamp() const -> const record_time&
{
  return std::visit(
    [](const auto& r) -> const record_time& {
      using record_type = std::decay_t<decltype(r)>;
      if constexpr (std::is_same_v<record_type, event_record>) {
        return r.timestamp;
      } else if constexpr (std::is_same_v<record_type, span_opened_record>) {
        return r.start_time;
      } else {
        return r.end_time;
      }
    },
    record_);
}

auto
dispatch_record::with_fields(const field_set& extra) const -> dispatch_record
{
  dispatch_record copy{ *this };
  std::visit(
    [&extra](auto& r) {
      r.fields.insert(r.fields.end(), extra.begin(), extra.end());
    },
    copy.record_);
  return copy;
}

auto
operator==(const dispatch_record& lhs, const dispatch_record& rhs) -> bool
{
  if (lhs.record_.index() != rhs.record_.index()) {
    return false;
  }
  return std::visit(
    [&rhs](const auto& r) -> bool {
      using record_type = std::decay_t<decltype(r)>;
      return same_record(r, std::get<record_type>(rhs.record_));
    },
    lhs.record_);
}
} // namespace spanpipe
