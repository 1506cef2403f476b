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

#include "dispatcher.hxx"

#include "core/logger/logger.hxx"

#include <spanpipe/error_codes.hxx>

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace spanpipe::core
{
namespace
{
auto
describe(const dispatch_record& record) -> std::string
{
  if (auto id = record.id(); id) {
    return fmt::format(
      "{}(id={}, name=\"{}\")", to_string(record.kind()), id.value(), record.meta().name);
  }
  return fmt::format("{}(name=\"{}\")", to_string(record.kind()), record.meta().name);
}
} // namespace

dispatcher::dispatcher(spanpipe::level min_level, std::shared_ptr<diagnostic_counters> counters)
  : min_level_{ min_level }
  , counters_{ std::move(counters) }
{
}

void
dispatcher::add_stage(dispatch_stage stage)
{
  const std::scoped_lock lock(stages_mutex_);
  auto stages = std::make_shared<std::vector<dispatch_stage>>(*stages_);
  stages->emplace_back(std::move(stage));
  stages_ = std::move(stages);
}

auto
dispatcher::exporters() const -> std::vector<std::shared_ptr<record_exporter>>
{
  std::shared_ptr<const std::vector<dispatch_stage>> stages{};
  {
    const std::scoped_lock lock(stages_mutex_);
    stages = stages_;
  }
  std::vector<std::shared_ptr<record_exporter>> result{};
  for (const auto& stage : *stages) {
    if (const auto* exporter = std::get_if<std::shared_ptr<record_exporter>>(&stage); exporter) {
      result.push_back(*exporter);
    }
  }
  return result;
}

auto
dispatcher::tracked_spans() const -> std::size_t
{
  const std::scoped_lock lock(tracker_mutex_);
  return open_ids_.size();
}

auto
dispatcher::track(const dispatch_record& record) -> bool
{
  if (record.is_event()) {
    return true;
  }
  const auto id = record.id().value_or(0);
  const std::scoped_lock lock(tracker_mutex_);
  if (record.is_span_opened()) {
    return open_ids_.insert(id).second;
  }
  return open_ids_.erase(id) > 0;
}

void
dispatcher::dispatch(const dispatch_record& record)
{
  ++counters_->records_emitted;

  if (!track(record)) {
    ++counters_->contract_violations;
    SP_LOG_WARNING("contract violation: {} does not follow the span lifecycle, record dropped",
                   describe(record));
    return;
  }

  if (!is_enabled(record.level(), min_level_)) {
    ++counters_->dropped_filtered;
    return;
  }

  std::shared_ptr<const std::vector<dispatch_stage>> stages{};
  {
    const std::scoped_lock lock(stages_mutex_);
    stages = stages_;
  }

  try {
    run_stages(*stages, record);
  } catch (const std::exception& e) {
    ++counters_->dispatch_failures;
    SP_LOG_ERROR("{}: stage failed for {}, record dropped: {}",
                 std::error_code{ errc::telemetry::dispatch_stage_failure }.message(),
                 describe(record),
                 e.what());
  } catch (...) {
    ++counters_->dispatch_failures;
    SP_LOG_ERROR("{}: stage failed for {} with unknown exception, record dropped",
                 std::error_code{ errc::telemetry::dispatch_stage_failure }.message(),
                 describe(record));
  }
}

void
dispatcher::run_stages(const std::vector<dispatch_stage>& stages, const dispatch_record& record)
{
  dispatch_record working{ record };
  std::optional<std::string> rendered{};

  for (const auto& stage : stages) {
    bool keep_going{ true };
    std::visit(
      [&](const auto& handler) {
        using handler_type = std::decay_t<decltype(handler)>;
        if constexpr (std::is_same_v<handler_type, std::shared_ptr<record_filter>>) {
          if (!handler->filter(working)) {
            ++counters_->dropped_filtered;
            keep_going = false;
          }
        } else if constexpr (std::is_same_v<handler_type, std::shared_ptr<record_enricher>>) {
          working = handler->enrich(working);
        } else if constexpr (std::is_same_v<handler_type, std::shared_ptr<record_formatter>>) {
          rendered = handler->format(working);
        } else if constexpr (std::is_same_v<handler_type, std::shared_ptr<record_exporter>>) {
          if (!rendered) {
            throw std::logic_error("exporter registered before any formatter");
          }
          if (auto ec = handler->export_rendered(rendered.value()); ec) {
            SP_LOG_TRACE("exporter rejected {}: {}", describe(working), ec.message());
          }
        }
      },
      stage);
    if (!keep_going) {
      return;
    }
  }
}
} // namespace spanpipe::core
