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

#include <spanpipe/level.hxx>
#include <spanpipe/record.hxx>
#include <spanpipe/stage.hxx>

#include <memory>
#include <mutex>
#include <unordered_set>
#include <vector>

namespace spanpipe::core
{
/**
 * Runs every record through the registered stages, in registration order.
 *
 * Filters may end the chain, enrichers replace the working record, formatters replace the
 * rendered bytes and exporters receive the most recent rendered bytes. A stage that throws
 * only costs the current record: the failure is logged and counted, never propagated.
 */
class dispatcher
{
public:
  dispatcher(spanpipe::level min_level, std::shared_ptr<diagnostic_counters> counters);

  void add_stage(dispatch_stage stage);

  void dispatch(const dispatch_record& record);

  [[nodiscard]] auto exporters() const -> std::vector<std::shared_ptr<record_exporter>>;

  /**
   * @return ids for which SpanOpened was dispatched and SpanClosed was not yet
   */
  [[nodiscard]] auto tracked_spans() const -> std::size_t;

private:
  auto track(const dispatch_record& record) -> bool;
  void run_stages(const std::vector<dispatch_stage>& stages, const dispatch_record& record);

  spanpipe::level min_level_;
  std::shared_ptr<diagnostic_counters> counters_;

  mutable std::mutex stages_mutex_{};
  std::shared_ptr<const std::vector<dispatch_stage>> stages_{
    std::make_shared<const std::vector<dispatch_stage>>()
  };

  mutable std::mutex tracker_mutex_{};
  std::unordered_set<span_id> open_ids_{};
};
} // namespace spanpipe::core
