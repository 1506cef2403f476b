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

#include <spanpipe/pipeline_options.hxx>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace spanpipe::core::utils
{
enum class push_result {
  accepted,
  dropped_newest,
  evicted_oldest,
  closed,
};

constexpr auto
to_string(push_result result) -> std::string_view
{
  switch (result) {
    case push_result::accepted:
      return "accepted";
    case push_result::dropped_newest:
      return "dropped_newest";
    case push_result::evicted_oldest:
      return "evicted_oldest";
    case push_result::closed:
      return "closed";
  }
  return "unknown";
}

/**
 * FIFO queue with a fixed capacity, shared by many producers and a single consumer.
 *
 * Every accepted item is numbered. An item counts as processed once the consumer has called
 * complete() for it, or when it is evicted or taken by take_all(). A flush request covers the
 * items accepted before it was made: the consumer collects the request with due_flush() once
 * those items are processed, performs the flush and reports it with flush_done().
 */
template<typename T>
class bounded_queue
{
public:
  bounded_queue(std::size_t capacity, overflow_policy policy)
    : capacity_{ capacity == 0 ? 1 : capacity }
    , policy_{ policy }
  {
  }

  bounded_queue(const bounded_queue&) = delete;
  bounded_queue(bounded_queue&&) = delete;
  auto operator=(const bounded_queue&) -> bounded_queue& = delete;
  auto operator=(bounded_queue&&) -> bounded_queue& = delete;
  ~bounded_queue() = default;

  auto push(T item) -> push_result
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (closed_) {
      return push_result::closed;
    }
    auto result{ push_result::accepted };
    if (items_.size() >= capacity_) {
      switch (policy_) {
        case overflow_policy::block:
          not_full_.wait(lock, [this] {
            return closed_ || items_.size() < capacity_;
          });
          if (closed_) {
            return push_result::closed;
          }
          break;
        case overflow_policy::drop_newest:
          ++dropped_;
          return push_result::dropped_newest;
        case overflow_policy::drop_oldest:
          items_.pop_front();
          ++processed_;
          ++dropped_;
          result = push_result::evicted_oldest;
          break;
      }
    }
    items_.emplace_back(std::move(item));
    ++accepted_;
    lock.unlock();
    not_empty_.notify_one();
    return result;
  }

  /**
   * Waits for the first item, then keeps collecting until `max_items` are queued or `window`
   * has elapsed since the first item was seen. A pending flush request or close() ends the wait
   * early.
   *
   * @return up to `max_items` items in FIFO order, empty when the queue is closed and drained
   * or when only a flush request is pending
   */
  auto pop_batch(std::size_t max_items, std::chrono::milliseconds window) -> std::vector<T>
  {
    if (max_items == 0) {
      max_items = 1;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this] {
      return closed_ || !items_.empty() || !pending_flushes_.empty();
    });
    const auto deadline = std::chrono::steady_clock::now() + window;
    not_empty_.wait_until(lock, deadline, [this, max_items] {
      return closed_ || !pending_flushes_.empty() || items_.size() >= max_items;
    });

    std::vector<T> batch{};
    const auto count = std::min(max_items, items_.size());
    batch.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
      batch.emplace_back(std::move(items_.front()));
      items_.pop_front();
    }
    lock.unlock();
    not_full_.notify_all();
    return batch;
  }

  /**
   * Marks `count` items returned by pop_batch() as processed.
   */
  void complete(std::size_t count)
  {
    const std::scoped_lock lock(mutex_);
    processed_ += count;
  }

  /**
   * Removes every queued item without waiting.
   */
  auto take_all() -> std::vector<T>
  {
    std::vector<T> result{};
    {
      const std::scoped_lock lock(mutex_);
      result.reserve(items_.size());
      while (!items_.empty()) {
        result.emplace_back(std::move(items_.front()));
        items_.pop_front();
        ++processed_;
      }
    }
    not_full_.notify_all();
    return result;
  }

  /**
   * Asks the consumer to flush once every item accepted so far is processed. While a request
   * is pending pop_batch() returns partial batches immediately.
   *
   * @return ticket to pass to wait_flushed()
   */
  auto request_flush() -> std::uint64_t
  {
    std::uint64_t ticket{};
    {
      const std::scoped_lock lock(mutex_);
      ticket = ++last_flush_ticket_;
      pending_flushes_.push_back({ ticket, accepted_ });
    }
    not_empty_.notify_all();
    return ticket;
  }

  /**
   * Removes the flush requests whose items are all processed.
   *
   * @return highest ticket removed, empty if no request is due
   */
  auto due_flush() -> std::optional<std::uint64_t>
  {
    const std::scoped_lock lock(mutex_);
    std::optional<std::uint64_t> ticket{};
    while (!pending_flushes_.empty() && pending_flushes_.front().target <= processed_) {
      ticket = pending_flushes_.front().ticket;
      pending_flushes_.pop_front();
    }
    return ticket;
  }

  /**
   * Reports that every request up to and including `ticket` has been flushed.
   */
  void flush_done(std::uint64_t ticket)
  {
    {
      const std::scoped_lock lock(mutex_);
      flushed_ticket_ = std::max(flushed_ticket_, ticket);
    }
    flushed_.notify_all();
  }

  /**
   * Completes every outstanding request, used once the consumer has stopped.
   */
  void release_flushes()
  {
    {
      const std::scoped_lock lock(mutex_);
      pending_flushes_.clear();
      flushed_ticket_ = last_flush_ticket_;
    }
    flushed_.notify_all();
  }

  /**
   * @return true if the request was flushed before the deadline
   */
  auto wait_flushed(std::uint64_t ticket, std::chrono::steady_clock::time_point deadline) -> bool
  {
    std::unique_lock<std::mutex> lock(mutex_);
    return flushed_.wait_until(lock, deadline, [this, ticket] {
      return flushed_ticket_ >= ticket;
    });
  }

  /**
   * Rejects further pushes and wakes every waiting producer and consumer. Queued items can
   * still be popped.
   */
  void close()
  {
    {
      const std::scoped_lock lock(mutex_);
      closed_ = true;
    }
    not_full_.notify_all();
    not_empty_.notify_all();
  }

  [[nodiscard]] auto closed() const -> bool
  {
    const std::scoped_lock lock(mutex_);
    return closed_;
  }

  [[nodiscard]] auto size() const -> std::size_t
  {
    const std::scoped_lock lock(mutex_);
    return items_.size();
  }

  [[nodiscard]] auto capacity() const -> std::size_t
  {
    return capacity_;
  }

  /**
   * @return number of items discarded by the overflow policy
   */
  [[nodiscard]] auto dropped() const -> std::size_t
  {
    const std::scoped_lock lock(mutex_);
    return dropped_;
  }

private:
  struct flush_request {
    std::uint64_t ticket;
    std::uint64_t target;
  };

  const std::size_t capacity_;
  const overflow_policy policy_;

  mutable std::mutex mutex_{};
  std::condition_variable not_empty_{};
  std::condition_variable not_full_{};
  std::condition_variable flushed_{};
  std::deque<T> items_{};
  std::uint64_t accepted_{ 0 };
  std::uint64_t processed_{ 0 };
  std::deque<flush_request> pending_flushes_{};
  std::uint64_t last_flush_ticket_{ 0 };
  std::uint64_t flushed_ticket_{ 0 };
  std::size_t dropped_{ 0 };
  bool closed_{ false };
};
} // namespace spanpipe::core::utils
