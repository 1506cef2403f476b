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

#include <spanpipe/execution_context.hxx>

#include "core/context_stack.hxx"

#include <utility>

namespace spanpipe
{
execution_context::execution_context()
  : stack_{ std::make_shared<core::context_stack>() }
{
}

execution_context::execution_context(std::shared_ptr<core::context_stack> stack)
  : stack_{ std::move(stack) }
{
}

auto
execution_context::fork_current() -> execution_context
{
  return execution_context{ std::make_shared<core::context_stack>(
    core::context_stack::active().snapshot()) };
}

auto
execution_context::current() const -> std::optional<span_id>
{
  return stack_->current();
}

auto
execution_context::depth() const -> std::size_t
{
  return stack_->depth();
}

execution_context_scope::execution_context_scope(const execution_context& context)
  : installed_{ context.stack_ }
  , previous_{ core::context_stack::install(installed_.get()) }
{
}

execution_context_scope::~execution_context_scope()
{
  core::context_stack::install(previous_);
}

auto
current_span() -> std::optional<span_id>
{
  return core::context_stack::active().current();
}
} // namespace spanpipe
