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

#include "diagnostic_counters.hxx"
#include "utils/bounded_queue.hxx"

#include <spanpipe/pipeline_options.hxx>
#include <spanpipe/sink.hxx>
#include <spanpipe/stage.hxx>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace spanpipe::core
{
/**
 * Exporter stage that hands rendered records to a drain thread through a bounded queue, so
 * the dispatching thread never waits for sink I/O (unless the overflow policy is `block`).
 *
 * The drain thread writes batches of up to `batch_size` records, retrying a failed write
 * `retry_attempts` times with exponential backoff before dropping the batch.
 */
class buffered_exporter : public record_exporter
{
public:
  buffered_exporter(std::shared_ptr<sink> destination,
                    const pipeline_options::built& options,
                    std::shared_ptr<diagnostic_counters> counters);
  buffered_exporter(const buffered_exporter&) = delete;
  buffered_exporter(buffered_exporter&&) = delete;
  auto operator=(const buffered_exporter&) -> buffered_exporter& = delete;
  auto operator=(buffered_exporter&&) -> buffered_exporter& = delete;
  ~buffered_exporter() override;

  /**
   * Starts the drain thread. Records exported before start() stay queued.
   */
  void start();

  /**
   * @return errc::telemetry::queue_overflow if the record was discarded,
   * errc::telemetry::pipeline_shutdown after shutdown()
   */
  auto export_rendered(std::string rendered) -> std::error_code override;

  /**
   * Waits until the records queued before the call have been written (or dropped) and the
   * drain thread has flushed the sink. Records queued afterwards are not waited for.
   *
   * @return false if the timeout expired first
   */
  auto force_flush(std::chrono::milliseconds timeout) -> bool;

  void flush() override;

  /**
   * Stops accepting records, drains the queue, joins the drain thread and flushes the sink.
   * Safe to call more than once.
   */
  void shutdown() override;

  [[nodiscard]] auto queued() const -> std::size_t;

  static constexpr std::chrono::milliseconds default_flush_timeout{ std::chrono::seconds{ 10 } };

private:
  void drain_loop();
  void write_batch(const std::vector<std::string>& batch);
  auto try_write(const std::vector<std::string>& batch) -> std::error_code;
  void flush_sink();

  std::shared_ptr<sink> sink_;
  pipeline_options::built options_;
  std::shared_ptr<diagnostic_counters> counters_;
  utils::bounded_queue<std::string> queue_;

  std::mutex lifecycle_mutex_{};
  std::thread drain_thread_{};
  std::atomic<bool> running_{ false };
  std::atomic<bool> stopped_{ false };
};
} // namespace spanpipe::core
