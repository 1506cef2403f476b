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

#include "context_stack.hxx"

#include <spanpipe/error_codes.hxx>

#include <utility>

namespace spanpipe::core
{
namespace
{
thread_local context_stack thread_stack{};
thread_local context_stack* installed_stack{ nullptr };
} // namespace

context_stack::context_stack(std::vector<span_id> ids)
  : ids_{ std::move(ids) }
{
}

auto
context_stack::current() const -> std::optional<span_id>
{
  const std::scoped_lock lock(mutex_);
  if (ids_.empty()) {
    return {};
  }
  return ids_.back();
}

auto
context_stack::depth() const -> std::size_t
{
  const std::scoped_lock lock(mutex_);
  return ids_.size();
}

auto
context_stack::snapshot() const -> std::vector<span_id>
{
  const std::scoped_lock lock(mutex_);
  return ids_;
}

void
context_stack::enter(span_id id)
{
  const std::scoped_lock lock(mutex_);
  ids_.push_back(id);
}

auto
context_stack::exit(span_id id) -> std::error_code
{
  const std::scoped_lock lock(mutex_);
  if (ids_.empty() || ids_.back() != id) {
    return errc::telemetry::context_mismatch;
  }
  ids_.pop_back();
  return {};
}

auto
context_stack::active() -> context_stack&
{
  if (installed_stack != nullptr) {
    return *installed_stack;
  }
  return thread_stack;
}

auto
context_stack::install(context_stack* stack) -> context_stack*
{
  return std::exchange(installed_stack, stack);
}
} // namespace spanpipe::core
