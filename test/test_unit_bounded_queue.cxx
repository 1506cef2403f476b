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
#include "utils/wait_until.hxx"

#include "core/utils/bounded_queue.hxx"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

// NOLINTBEGIN(bugprone-chained-comparison, misc-use-anonymous-namespace)

using spanpipe::overflow_policy;
using spanpipe::core::utils::bounded_queue;
using spanpipe::core::utils::push_result;

TEST_CASE("bounded_queue overflow policies", "[unit][bounded_queue]")
{
  constexpr std::size_t capacity = 4;

  SECTION("drop_oldest evicts the head")
  {
    bounded_queue<int> queue{ capacity, overflow_policy::drop_oldest };
    for (int i = 1; i <= static_cast<int>(capacity); ++i) {
      REQUIRE(queue.push(i) == push_result::accepted);
    }
    REQUIRE(queue.push(5) == push_result::evicted_oldest);

    REQUIRE(queue.take_all() == std::vector<int>{ 2, 3, 4, 5 });
    REQUIRE(queue.dropped() == 1);
  }

  SECTION("drop_newest discards the incoming item")
  {
    bounded_queue<int> queue{ capacity, overflow_policy::drop_newest };
    for (int i = 1; i <= static_cast<int>(capacity); ++i) {
      REQUIRE(queue.push(i) == push_result::accepted);
    }
    REQUIRE(queue.push(5) == push_result::dropped_newest);
    REQUIRE(queue.push(6) == push_result::dropped_newest);

    REQUIRE(queue.take_all() == std::vector<int>{ 1, 2, 3, 4 });
    REQUIRE(queue.dropped() == 2);
  }

  SECTION("push after close is rejected")
  {
    bounded_queue<int> queue{ capacity, overflow_policy::drop_newest };
    queue.close();
    REQUIRE(queue.push(1) == push_result::closed);
    REQUIRE(queue.size() == 0);
  }
}

TEST_CASE("bounded_queue block policy", "[unit][bounded_queue]")
{
  bounded_queue<int> queue{ 2, overflow_policy::block };
  REQUIRE(queue.push(1) == push_result::accepted);
  REQUIRE(queue.push(2) == push_result::accepted);

  SECTION("producer waits until the consumer makes room")
  {
    std::atomic<bool> returned{ false };
    std::thread producer([&queue, &returned]() {
      queue.push(3);
      returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    REQUIRE_FALSE(returned.load());

    auto batch = queue.pop_batch(1, std::chrono::milliseconds(0));
    REQUIRE(batch == std::vector<int>{ 1 });
    REQUIRE(test::utils::wait_until([&returned]() {
      return returned.load();
    }));
    producer.join();
    REQUIRE(queue.take_all() == std::vector<int>{ 2, 3 });
  }

  SECTION("producer is released by close")
  {
    std::atomic<bool> returned{ false };
    push_result result{ push_result::accepted };
    std::thread producer([&queue, &returned, &result]() {
      result = queue.push(3);
      returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    REQUIRE_FALSE(returned.load());

    queue.close();
    producer.join();
    REQUIRE(returned.load());
    REQUIRE(result == push_result::closed);
    REQUIRE(queue.size() == 2);
  }
}

TEST_CASE("bounded_queue batching", "[unit][bounded_queue]")
{
  bounded_queue<int> queue{ 16, overflow_policy::drop_newest };

  SECTION("full batch is returned without waiting for the window")
  {
    for (int i = 0; i < 5; ++i) {
      queue.push(i);
    }
    const auto start = std::chrono::steady_clock::now();
    auto batch = queue.pop_batch(3, std::chrono::seconds(10));
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
    REQUIRE(batch == std::vector<int>{ 0, 1, 2 });
    queue.complete(batch.size());
  }

  SECTION("partial batch is returned when the window elapses")
  {
    queue.push(1);
    auto batch = queue.pop_batch(3, std::chrono::milliseconds(20));
    REQUIRE(batch == std::vector<int>{ 1 });
    queue.complete(batch.size());
  }

  SECTION("flush request returns a partial batch immediately")
  {
    queue.push(1);
    queue.push(2);
    auto ticket = queue.request_flush();
    auto batch = queue.pop_batch(10, std::chrono::seconds(10));
    REQUIRE(batch == std::vector<int>{ 1, 2 });
    REQUIRE_FALSE(queue.due_flush().has_value());
    queue.complete(batch.size());
    REQUIRE(queue.due_flush() == ticket);
  }

  SECTION("closed and drained queue returns an empty batch")
  {
    queue.push(1);
    queue.close();
    REQUIRE(queue.pop_batch(10, std::chrono::seconds(10)) == std::vector<int>{ 1 });
    REQUIRE(queue.pop_batch(10, std::chrono::seconds(10)).empty());
  }

}

TEST_CASE("bounded_queue flush requests", "[unit][bounded_queue]")
{
  bounded_queue<int> queue{ 16, overflow_policy::drop_newest };

  SECTION("request on an empty queue wakes the consumer and is due at once")
  {
    auto ticket = queue.request_flush();
    REQUIRE(queue.pop_batch(10, std::chrono::seconds(10)).empty());
    REQUIRE(queue.due_flush() == ticket);
    REQUIRE_FALSE(queue.due_flush().has_value());
  }

  SECTION("items accepted after the request do not delay it")
  {
    queue.push(1);
    auto ticket = queue.request_flush();
    queue.push(2);
    queue.push(3);

    auto batch = queue.pop_batch(1, std::chrono::seconds(10));
    REQUIRE(batch == std::vector<int>{ 1 });
    queue.complete(batch.size());
    REQUIRE(queue.due_flush() == ticket);
    REQUIRE(queue.size() == 2);
  }

  SECTION("requests due together are reported by the highest ticket")
  {
    queue.push(1);
    auto first = queue.request_flush();
    auto second = queue.request_flush();
    REQUIRE(second > first);
    queue.complete(queue.pop_batch(10, std::chrono::milliseconds(0)).size());
    REQUIRE(queue.due_flush() == second);
  }

  SECTION("evicted items count as processed")
  {
    bounded_queue<int> small{ 1, overflow_policy::drop_oldest };
    small.push(1);
    auto ticket = small.request_flush();
    REQUIRE(small.push(2) == push_result::evicted_oldest);
    REQUIRE(small.due_flush() == ticket);
  }

  SECTION("waiters are released by flush_done and release_flushes")
  {
    auto ticket = queue.request_flush();
    auto soon = [] {
      return std::chrono::steady_clock::now() + std::chrono::milliseconds(20);
    };
    REQUIRE_FALSE(queue.wait_flushed(ticket, soon()));

    std::thread consumer([&queue]() {
      queue.pop_batch(10, std::chrono::seconds(10));
      if (auto due = queue.due_flush(); due) {
        queue.flush_done(due.value());
      }
    });
    REQUIRE(queue.wait_flushed(ticket, std::chrono::steady_clock::now() + std::chrono::seconds(5)));
    consumer.join();

    auto abandoned = queue.request_flush();
    queue.close();
    queue.release_flushes();
    REQUIRE(queue.wait_flushed(abandoned, soon()));
  }
}

// NOLINTEND(bugprone-chained-comparison, misc-use-anonymous-namespace)
