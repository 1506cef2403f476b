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

#include "buffered_exporter.hxx"

#include "core/logger/logger.hxx"

#include <spanpipe/error_codes.hxx>

#include <algorithm>
#include <cstdint>
#include <exception>
#include <utility>

namespace spanpipe::core
{
namespace
{
auto
retry_delay(std::chrono::milliseconds backoff, std::size_t retry) -> std::chrono::milliseconds
{
  auto delay = backoff;
  for (std::size_t i = 1; i < retry && delay < pipeline_options::max_retry_backoff; ++i) {
    delay *= 2;
  }
  return std::min(delay, pipeline_options::max_retry_backoff);
}
} // namespace

buffered_exporter::buffered_exporter(std::shared_ptr<sink> destination,
                                     const pipeline_options::built& options,
                                     std::shared_ptr<diagnostic_counters> counters)
  : sink_{ std::move(destination) }
  , options_{ options }
  , counters_{ std::move(counters) }
  , queue_{ options.queue_capacity, options.overflow }
{
}

buffered_exporter::~buffered_exporter()
{
  shutdown();
}

void
buffered_exporter::start()
{
  const std::scoped_lock lock(lifecycle_mutex_);
  if (running_.load() || stopped_.load()) {
    return;
  }
  running_.store(true);
  drain_thread_ = std::thread(&buffered_exporter::drain_loop, this);
}

auto
buffered_exporter::export_rendered(std::string rendered) -> std::error_code
{
  switch (queue_.push(std::move(rendered))) {
    case utils::push_result::accepted:
      return {};
    case utils::push_result::evicted_oldest:
      ++counters_->dropped_overflow;
      return {};
    case utils::push_result::dropped_newest:
      ++counters_->dropped_overflow;
      return errc::telemetry::queue_overflow;
    case utils::push_result::closed:
      ++counters_->dropped_overflow;
      return errc::telemetry::pipeline_shutdown;
  }
  return errc::telemetry::queue_overflow;
}

auto
buffered_exporter::force_flush(std::chrono::milliseconds timeout) -> bool
{
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::uint64_t ticket{};
  {
    const std::scoped_lock lock(lifecycle_mutex_);
    if (!running_.load()) {
      // no drain thread, so the sink cannot be in use elsewhere
      flush_sink();
      return true;
    }
    ticket = queue_.request_flush();
  }
  return queue_.wait_flushed(ticket, deadline);
}

void
buffered_exporter::flush()
{
  if (!force_flush(default_flush_timeout)) {
    SP_LOG_WARNING("flush timed out after {}ms, {} records still queued",
                   default_flush_timeout.count(),
                   queue_.size());
  }
}

void
buffered_exporter::shutdown()
{
  const std::scoped_lock lock(lifecycle_mutex_);
  if (stopped_.exchange(true)) {
    return;
  }
  queue_.close();
  if (running_.load()) {
    if (drain_thread_.joinable()) {
      drain_thread_.join();
    }
    running_.store(false);
  } else {
    // never started, drain on the calling thread
    while (true) {
      auto batch = queue_.pop_batch(options_.batch_size, std::chrono::milliseconds::zero());
      if (batch.empty()) {
        break;
      }
      write_batch(batch);
      queue_.complete(batch.size());
    }
  }
  flush_sink();
  queue_.release_flushes();
  const auto stats = counters_->snapshot();
  SP_LOG_DEBUG("buffered exporter stopped, batches_exported={}, dropped_export_failure={}",
               stats.batches_exported,
               stats.dropped_export_failure);
}

auto
buffered_exporter::queued() const -> std::size_t
{
  return queue_.size();
}

void
buffered_exporter::drain_loop()
{
  while (true) {
    auto batch = queue_.pop_batch(options_.batch_size, options_.batch_window);
    if (!batch.empty()) {
      write_batch(batch);
      queue_.complete(batch.size());
    }
    if (auto ticket = queue_.due_flush(); ticket) {
      flush_sink();
      queue_.flush_done(ticket.value());
    }
    if (batch.empty() && queue_.closed()) {
      break;
    }
  }
}

auto
buffered_exporter::try_write(const std::vector<std::string>& batch) -> std::error_code
{
  try {
    return sink_->write(batch);
  } catch (const std::exception& e) {
    SP_LOG_DEBUG("sink threw while writing batch of {} records: {}", batch.size(), e.what());
  } catch (...) {
    SP_LOG_DEBUG("sink threw unknown exception while writing batch of {} records", batch.size());
  }
  return errc::telemetry::export_failure;
}

void
buffered_exporter::flush_sink()
{
  std::error_code ec{};
  try {
    ec = sink_->flush();
  } catch (const std::exception& e) {
    SP_LOG_DEBUG("sink threw while flushing: {}", e.what());
    ec = errc::telemetry::export_failure;
  } catch (...) {
    SP_LOG_DEBUG("sink threw unknown exception while flushing");
    ec = errc::telemetry::export_failure;
  }
  if (ec) {
    SP_LOG_WARNING("unable to flush sink: {}", ec.message());
  }
}

void
buffered_exporter::write_batch(const std::vector<std::string>& batch)
{
  auto ec = try_write(batch);
  for (std::size_t retry = 1; ec && retry <= options_.retry_attempts; ++retry) {
    ++counters_->export_retries;
    std::this_thread::sleep_for(retry_delay(options_.retry_backoff, retry));
    ec = try_write(batch);
  }
  if (ec) {
    counters_->dropped_export_failure += batch.size();
    SP_LOG_WARNING("{}: dropping batch of {} records after {} retries, last error: {}",
                   std::error_code{ errc::telemetry::export_failure }.message(),
                   batch.size(),
                   options_.retry_attempts,
                   ec.message());
    return;
  }
  ++counters_->batches_exported;
}
} // namespace spanpipe::core
