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

#include <spanpipe/record.hxx>

#include <cstddef>
#include <memory>
#include <optional>
#include <utility>

namespace spanpipe
{
namespace core
{
class context_stack;
} // namespace core

/**
 * Stack of open spans owned by a cooperative task.
 *
 * Every thread has an implicit context of its own. Tasks that are multiplexed over threads
 * (coroutines, callbacks chained on an executor) keep one execution_context each and install
 * it with execution_context_scope whenever they resume, so that spans opened by one task never
 * become the parent of records emitted by another.
 *
 * Copies share the same underlying stack.
 */
class execution_context
{
public:
  /**
   * Creates a context with an empty stack.
   */
  execution_context();

  /**
   * Creates a context whose stack starts as a copy of the calling context, so work spawned
   * from inside a span is attributed to that span.
   */
  [[nodiscard]] static auto fork_current() -> execution_context;

  [[nodiscard]] auto current() const -> std::optional<span_id>;
  [[nodiscard]] auto depth() const -> std::size_t;

private:
  explicit execution_context(std::shared_ptr<core::context_stack> stack);

  std::shared_ptr<core::context_stack> stack_;

  friend class execution_context_scope;
};

/**
 * Makes the given context the active one for the current thread until destruction, then
 * restores the previously active context.
 */
class execution_context_scope
{
public:
  explicit execution_context_scope(const execution_context& context);
  ~execution_context_scope();

  execution_context_scope(const execution_context_scope&) = delete;
  execution_context_scope(execution_context_scope&&) = delete;
  auto operator=(const execution_context_scope&) -> execution_context_scope& = delete;
  auto operator=(execution_context_scope&&) -> execution_context_scope& = delete;

private:
  std::shared_ptr<core::context_stack> installed_;
  core::context_stack* previous_;
};

/**
 * Wraps the handler so that it always runs with `context` installed.
 */
template<typename Handler>
auto
bind_execution_context(execution_context context, Handler&& handler)
{
  return [context = std::move(context),
          handler = std::forward<Handler>(handler)](auto&&... args) mutable -> decltype(auto) {
    const execution_context_scope scope{ context };
    return handler(std::forward<decltype(args)>(args)...);
  };
}

/**
 * @return innermost open span of the active context of the calling thread
 */
auto
current_span() -> std::optional<span_id>;
} // namespace spanpipe
