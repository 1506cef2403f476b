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

#include "test_helper.hxx"

#include "core/context_stack.hxx"
#include "core/span_registry.hxx"

#include <spanpipe/execution_context.hxx>
#include <spanpipe/metadata.hxx>

#include <atomic>
#include <functional>
#include <optional>
#include <set>
#include <thread>
#include <vector>

// NOLINTBEGIN(bugprone-chained-comparison, misc-use-anonymous-namespace)

TEST_CASE("context stack push and pop", "[unit][context_stack]")
{
  using namespace spanpipe;

  core::context_stack stack;
  REQUIRE_FALSE(stack.current().has_value());

  SECTION("properly nested enter and exit leave the stack empty")
  {
    stack.enter(1);
    stack.enter(2);
    stack.enter(3);
    REQUIRE(stack.current() == 3);
    REQUIRE(stack.depth() == 3);
    REQUIRE_SUCCESS(stack.exit(3));
    REQUIRE_SUCCESS(stack.exit(2));
    REQUIRE(stack.current() == 1);
    REQUIRE_SUCCESS(stack.exit(1));
    REQUIRE(stack.depth() == 0);
    REQUIRE_FALSE(stack.current().has_value());
  }

  SECTION("exiting a span that is not the top fails and leaves the stack unchanged")
  {
    stack.enter(10);
    stack.enter(11);
    REQUIRE(stack.exit(10) == errc::telemetry::context_mismatch);
    REQUIRE(stack.snapshot() == std::vector<span_id>{ 10, 11 });
    REQUIRE(stack.exit(99) == errc::telemetry::context_mismatch);
    REQUIRE(stack.depth() == 2);
  }

  SECTION("exiting an empty stack fails")
  {
    REQUIRE(stack.exit(1) == errc::telemetry::context_mismatch);
  }
}

TEST_CASE("every thread has its own context", "[unit][context_stack]")
{
  using namespace spanpipe;

  auto& main_stack = core::context_stack::active();
  main_stack.enter(1000);

  std::optional<span_id> seen_by_other_thread{ 42 };
  std::thread other([&seen_by_other_thread]() {
    seen_by_other_thread = core::context_stack::active().current();
  });
  other.join();

  REQUIRE_FALSE(seen_by_other_thread.has_value());
  REQUIRE(current_span() == 1000);
  REQUIRE_SUCCESS(main_stack.exit(1000));
}

TEST_CASE("span registry lifecycle", "[unit][span_registry]")
{
  using namespace spanpipe;

  test::utils::init_logger();
  core::span_registry registry;
  auto meta = make_metadata(level::info, "request", "tests");

  SECTION("open pushes onto the active context and records the parent")
  {
    auto outer = registry.open(meta, { { "method", "GET" } });
    REQUIRE(outer.id > 0);
    REQUIRE_FALSE(outer.parent_id.has_value());
    REQUIRE(current_span() == outer.id);

    auto inner = registry.open(meta, {});
    REQUIRE(inner.id > outer.id);
    REQUIRE(inner.parent_id == outer.id);
    REQUIRE(registry.open_spans() == 2);

    auto [ec_inner, closed_inner] = registry.close(inner.id);
    REQUIRE_SUCCESS(ec_inner);
    REQUIRE(closed_inner.end_time.has_value());
    auto [ec_outer, closed_outer] = registry.close(outer.id);
    REQUIRE_SUCCESS(ec_outer);
    REQUIRE(closed_outer.fields.size() == 1);
    REQUIRE_FALSE(current_span().has_value());
    REQUIRE(registry.state(outer.id) == span_state::closed);
    REQUIRE(registry.open_spans() == 0);
  }

  SECTION("closing out of order is a context mismatch and keeps the span open")
  {
    auto parent = registry.open(meta, {});
    auto child = registry.open(meta, {});
    auto [ec, snapshot] = registry.close(parent.id);
    REQUIRE(ec == errc::telemetry::context_mismatch);
    REQUIRE(registry.state(parent.id) == span_state::open);
    REQUIRE(current_span() == child.id);

    REQUIRE_SUCCESS(registry.close(child.id).first);
    REQUIRE_SUCCESS(registry.close(parent.id).first);
  }

  SECTION("fields can only be added to open spans")
  {
    auto span = registry.open(meta, {});
    REQUIRE_SUCCESS(registry.add_field(span.id, { "rows", 12 }));
    auto [ec, snapshot] = registry.close(span.id);
    REQUIRE_SUCCESS(ec);
    REQUIRE(snapshot.fields.size() == 1);
    REQUIRE(snapshot.fields[0].key == "rows");
    REQUIRE(registry.add_field(span.id, { "late", true }) == errc::telemetry::span_not_open);
  }

  SECTION("closing twice reports span_not_open")
  {
    auto span = registry.open(meta, {});
    REQUIRE_SUCCESS(registry.close(span.id).first);
    REQUIRE(registry.close(span.id).first == errc::telemetry::span_not_open);
  }

  SECTION("reclaimed spans are still reported as closed")
  {
    auto span = registry.open(meta, {});
    registry.reclaim(span.id); // open spans are kept
    REQUIRE(registry.state(span.id) == span_state::open);
    REQUIRE_SUCCESS(registry.close(span.id).first);
    registry.reclaim(span.id);
    REQUIRE(registry.state(span.id) == span_state::closed);
    REQUIRE(registry.add_field(span.id, { "k", 1 }) == errc::telemetry::span_not_open);
  }

  SECTION("ids that were never issued are unopened")
  {
    REQUIRE(registry.state(0) == span_state::unopened);
    REQUIRE(registry.state(core::span_registry::last_issued_id() + 1000) ==
            span_state::unopened);
  }
}

TEST_CASE("span ids are unique across threads", "[unit][span_registry]")
{
  using namespace spanpipe;

  core::span_registry registry;
  auto meta = make_metadata(level::info, "worker", "tests");

  constexpr std::size_t threads_count = 8;
  constexpr std::size_t spans_per_thread = 500;
  std::vector<std::vector<span_id>> ids(threads_count);
  std::vector<std::thread> threads;
  threads.reserve(threads_count);
  for (std::size_t t = 0; t < threads_count; ++t) {
    threads.emplace_back([&registry, &meta, &ids, t]() {
      for (std::size_t i = 0; i < spans_per_thread; ++i) {
        auto span = registry.open(meta, {});
        ids[t].push_back(span.id);
        if (registry.close(span.id).first) {
          return;
        }
        registry.reclaim(span.id);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  std::set<span_id> unique;
  for (const auto& per_thread : ids) {
    REQUIRE(per_thread.size() == spans_per_thread);
    for (std::size_t i = 1; i < per_thread.size(); ++i) {
      REQUIRE(per_thread[i] > per_thread[i - 1]);
    }
    unique.insert(per_thread.begin(), per_thread.end());
  }
  REQUIRE(unique.size() == threads_count * spans_per_thread);
  REQUIRE(registry.open_spans() == 0);
}

TEST_CASE("concurrent close of the same span, first one wins", "[unit][span_registry]")
{
  using namespace spanpipe;

  core::span_registry registry;
  auto meta = make_metadata(level::info, "shared", "tests");

  // both contexts have the span on top, as if work had been forked right after opening it
  auto span = registry.open(meta, {});
  auto first_context = execution_context::fork_current();
  auto second_context = execution_context::fork_current();
  REQUIRE_SUCCESS(core::context_stack::active().exit(span.id));

  std::atomic<int> successes{ 0 };
  std::atomic<int> not_open{ 0 };
  auto closer = [&registry, &successes, &not_open, id = span.id](const execution_context& ctx) {
    const execution_context_scope scope{ ctx };
    auto ec = registry.close(id).first;
    if (!ec) {
      ++successes;
    } else if (ec == errc::telemetry::span_not_open) {
      ++not_open;
    }
  };
  std::thread a(closer, std::cref(first_context));
  std::thread b(closer, std::cref(second_context));
  a.join();
  b.join();

  REQUIRE(successes.load() == 1);
  REQUIRE(not_open.load() == 1);
  REQUIRE(registry.state(span.id) == span_state::closed);
}

TEST_CASE("forked context that outlives its span", "[unit][span_registry]")
{
  using namespace spanpipe;

  test::utils::init_logger();
  core::span_registry registry;
  auto meta = make_metadata(level::info, "forked", "tests");

  auto parent = registry.open(meta, {});
  auto forked = execution_context::fork_current();
  REQUIRE_SUCCESS(registry.close(parent.id).first);

  SECTION("child opened after the parent closed is recorded as root")
  {
    const execution_context_scope scope{ forked };
    auto child = registry.open(meta, {});
    REQUIRE_FALSE(child.parent_id.has_value());
    REQUIRE(forked.current() == child.id);

    auto grandchild = registry.open(meta, {});
    REQUIRE(grandchild.parent_id == child.id);

    REQUIRE_SUCCESS(registry.close(grandchild.id).first);
    REQUIRE_SUCCESS(registry.close(child.id).first);
  }

  SECTION("same after the closed parent was reclaimed")
  {
    registry.reclaim(parent.id);
    const execution_context_scope scope{ forked };
    auto child = registry.open(meta, {});
    REQUIRE_FALSE(child.parent_id.has_value());
    REQUIRE_SUCCESS(registry.close(child.id).first);
  }

  REQUIRE(registry.open_spans() == 0);
}

// NOLINTEND(bugprone-chained-comparison, misc-use-anonymous-namespace)
