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
#include <mutex>
#include <optional>
#include <system_error>
#include <vector>

namespace spanpipe::core
{
/**
 * Ordered sequence of the open spans of one execution context. The top is the current span.
 *
 * A stack is only ever active on one thread at a time, the mutex protects the rare case where
 * a handle to it is inspected from another thread (execution_context::depth()).
 */
class context_stack
{
public:
  context_stack() = default;
  explicit context_stack(std::vector<span_id> ids);

  [[nodiscard]] auto current() const -> std::optional<span_id>;
  [[nodiscard]] auto depth() const -> std::size_t;
  [[nodiscard]] auto snapshot() const -> std::vector<span_id>;

  void enter(span_id id);

  /**
   * Pops `id` if it is the top of the stack.
   *
   * @return errc::telemetry::context_mismatch if `id` is not the top, the stack is unchanged
   */
  auto exit(span_id id) -> std::error_code;

  /**
   * @return stack of the execution context that is active on the calling thread. Falls back to
   * the thread's own stack when no execution_context_scope is installed.
   */
  static auto active() -> context_stack&;

  /**
   * Makes `stack` the active stack of the calling thread. Passing nullptr reinstates the
   * thread's own stack.
   *
   * @return previously installed stack (nullptr for the thread's own stack)
   */
  static auto install(context_stack* stack) -> context_stack*;

private:
  mutable std::mutex mutex_{};
  std::vector<span_id> ids_{};
};
} // namespace spanpipe::core
