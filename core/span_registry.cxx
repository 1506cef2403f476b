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

#include "span_registry.hxx"

#include "context_stack.hxx"
#include "core/logger/logger.hxx"

#include <spanpipe/error_codes.hxx>

#include <atomic>

namespace spanpipe::core
{
namespace
{
std::atomic<span_id> last_span_id{ 0 };

auto
allocate_span_id() -> span_id
{
  return last_span_id.fetch_add(1, std::memory_order_relaxed) + 1;
}
} // namespace

span_registry::span_registry(std::size_t shard_count)
{
  if (shard_count == 0) {
    shard_count = 1;
  }
  shards_.reserve(shard_count);
  for (std::size_t i = 0; i < shard_count; ++i) {
    shards_.emplace_back(std::make_unique<shard>());
  }
}

auto
span_registry::shard_for(span_id id) const -> shard&
{
  return *shards_[id % shards_.size()];
}

auto
span_registry::open(std::shared_ptr<const metadata> meta, field_set fields) -> span_snapshot
{
  auto& context = context_stack::active();

  span_snapshot snapshot{};
  snapshot.id = allocate_span_id();
  snapshot.meta = std::move(meta);
  if (auto parent = context.current(); parent) {
    if (is_open(parent.value())) {
      snapshot.parent_id = parent;
    } else {
      SP_LOG_DEBUG("span {} opened while the current span {} is no longer open, recorded as root",
                   snapshot.id,
                   parent.value());
    }
  }
  snapshot.fields = std::move(fields);
  snapshot.start_time = record_time::now();

  {
    auto& target = shard_for(snapshot.id);
    const std::scoped_lock lock(target.mutex);
    target.entries.emplace(snapshot.id, entry{ snapshot, span_state::open });
  }
  context.enter(snapshot.id);
  return snapshot;
}

auto
span_registry::is_open(span_id id) const -> bool
{
  auto& target = shard_for(id);
  const std::scoped_lock lock(target.mutex);
  auto it = target.entries.find(id);
  return it != target.entries.end() && it->second.state == span_state::open;
}

auto
span_registry::add_field(span_id id, field value) -> std::error_code
{
  auto& target = shard_for(id);
  const std::scoped_lock lock(target.mutex);
  auto it = target.entries.find(id);
  if (it == target.entries.end() || it->second.state != span_state::open) {
    return errc::telemetry::span_not_open;
  }
  it->second.snapshot.fields.emplace_back(std::move(value));
  return {};
}

auto
span_registry::close(span_id id) -> std::pair<std::error_code, span_snapshot>
{
  auto& target = shard_for(id);
  const std::scoped_lock lock(target.mutex);
  auto it = target.entries.find(id);
  if (it == target.entries.end() || it->second.state != span_state::open) {
    return { errc::telemetry::span_not_open, {} };
  }
  if (auto ec = context_stack::active().exit(id); ec) {
    return { ec, {} };
  }
  it->second.state = span_state::closed;
  it->second.snapshot.end_time = record_time::now();
  return { {}, it->second.snapshot };
}

void
span_registry::reclaim(span_id id)
{
  auto& target = shard_for(id);
  const std::scoped_lock lock(target.mutex);
  if (auto it = target.entries.find(id);
      it != target.entries.end() && it->second.state == span_state::closed) {
    target.entries.erase(it);
  }
}

auto
span_registry::state(span_id id) const -> span_state
{
  {
    auto& target = shard_for(id);
    const std::scoped_lock lock(target.mutex);
    if (auto it = target.entries.find(id); it != target.entries.end()) {
      return it->second.state;
    }
  }
  if (id == 0 || id > last_issued_id()) {
    return span_state::unopened;
  }
  return span_state::closed;
}

auto
span_registry::open_spans() const -> std::size_t
{
  std::size_t count{ 0 };
  for (const auto& s : shards_) {
    const std::scoped_lock lock(s->mutex);
    for (const auto& item : s->entries) {
      if (item.second.state == span_state::open) {
        ++count;
      }
    }
  }
  return count;
}

auto
span_registry::last_issued_id() -> span_id
{
  return last_span_id.load(std::memory_order_relaxed);
}
} // namespace spanpipe::core
