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

#include "record_builder.hxx"

#include "context_stack.hxx"

#include <utility>

namespace spanpipe::core
{
auto
record_builder::event(std::shared_ptr<const metadata> meta, field_set fields) -> event_record
{
  return {
    std::move(meta),
    context_stack::active().current(),
    std::move(fields),
    record_time::now(),
  };
}

auto
record_builder::span_opened(const span_snapshot& snapshot) -> span_opened_record
{
  return {
    snapshot.id, snapshot.meta, snapshot.parent_id, snapshot.fields, snapshot.start_time,
  };
}

auto
record_builder::span_closed(const span_snapshot& snapshot) -> span_closed_record
{
  return {
    snapshot.id,
    snapshot.meta,
    snapshot.parent_id,
    snapshot.fields,
    snapshot.start_time,
    snapshot.end_time.value_or(record_time::now()),
  };
}
} // namespace spanpipe::core
