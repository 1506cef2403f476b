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

#include <spanpipe/tracer.hxx>

#include "core/buffered_exporter.hxx"
#include "core/diagnostic_counters.hxx"
#include "core/dispatcher.hxx"
#include "core/logger/logger.hxx"
#include "core/record_builder.hxx"
#include "core/span_registry.hxx"

#include <atomic>
#include <utility>

namespace spanpipe
{
class tracer_impl
{
public:
  explicit tracer_impl(const pipeline_options& options)
    : options_{ options.build() }
    , dispatcher_{ options_.min_level, counters_ }
  {
  }

  tracer_impl(const tracer_impl&) = delete;
  tracer_impl(tracer_impl&&) = delete;
  auto operator=(const tracer_impl&) -> tracer_impl& = delete;
  auto operator=(tracer_impl&&) -> tracer_impl& = delete;

  ~tracer_impl()
  {
    shutdown();
  }

  void add_stage(dispatch_stage stage)
  {
    dispatcher_.add_stage(std::move(stage));
  }

  auto add_sink(std::shared_ptr<sink> destination) -> std::shared_ptr<core::buffered_exporter>
  {
    auto exporter =
      std::make_shared<core::buffered_exporter>(std::move(destination), options_, counters_);
    exporter->start();
    dispatcher_.add_stage(std::shared_ptr<record_exporter>{ exporter });
    return exporter;
  }

  auto open_span(std::shared_ptr<const metadata> meta, field_set fields) -> span_id
  {
    auto snapshot = registry_.open(std::move(meta), std::move(fields));
    dispatcher_.dispatch(dispatch_record{ core::record_builder::span_opened(snapshot) });
    return snapshot.id;
  }

  auto add_field(span_id id, field value) -> std::error_code
  {
    return registry_.add_field(id, std::move(value));
  }

  auto close_span(span_id id) -> std::error_code
  {
    auto [ec, snapshot] = registry_.close(id);
    if (ec) {
      SP_LOG_DEBUG("unable to close span {}: {}", id, ec.message());
      return ec;
    }
    dispatcher_.dispatch(dispatch_record{ core::record_builder::span_closed(snapshot) });
    registry_.reclaim(id);
    return {};
  }

  void event(std::shared_ptr<const metadata> meta, field_set fields)
  {
    dispatcher_.dispatch(
      dispatch_record{ core::record_builder::event(std::move(meta), std::move(fields)) });
  }

  [[nodiscard]] auto state(span_id id) const -> span_state
  {
    return registry_.state(id);
  }

  [[nodiscard]] auto open_spans() const -> std::size_t
  {
    return registry_.open_spans();
  }

  [[nodiscard]] auto stats() const -> diagnostics
  {
    return counters_->snapshot();
  }

  [[nodiscard]] auto options() const -> const pipeline_options::built&
  {
    return options_;
  }

  void flush()
  {
    for (const auto& exporter : dispatcher_.exporters()) {
      exporter->flush();
    }
  }

  void shutdown()
  {
    if (shutdown_.exchange(true)) {
      return;
    }
    for (const auto& exporter : dispatcher_.exporters()) {
      exporter->shutdown();
    }
    if (auto open = registry_.open_spans(); open > 0) {
      SP_LOG_DEBUG("tracer shut down with {} spans still open", open);
    }
    SP_LOG_DEBUG("tracer shut down: {}", to_string(counters_->snapshot()));
  }

private:
  pipeline_options::built options_;
  std::shared_ptr<core::diagnostic_counters> counters_{
    std::make_shared<core::diagnostic_counters>()
  };
  core::span_registry registry_{};
  core::dispatcher dispatcher_;
  std::atomic<bool> shutdown_{ false };
};

tracer::tracer(pipeline_options options)
  : impl_{ std::make_shared<tracer_impl>(options) }
{
}

tracer::~tracer() = default;

void
tracer::add_stage(dispatch_stage stage)
{
  return impl_->add_stage(std::move(stage));
}

auto
tracer::add_sink(std::shared_ptr<sink> destination) -> std::shared_ptr<core::buffered_exporter>
{
  return impl_->add_sink(std::move(destination));
}

auto
tracer::open_span(std::shared_ptr<const metadata> meta, field_set fields) -> span_id
{
  return impl_->open_span(std::move(meta), std::move(fields));
}

auto
tracer::add_field(span_id id, field value) -> std::error_code
{
  return impl_->add_field(id, std::move(value));
}

auto
tracer::close_span(span_id id) -> std::error_code
{
  return impl_->close_span(id);
}

void
tracer::event(std::shared_ptr<const metadata> meta, field_set fields)
{
  return impl_->event(std::move(meta), std::move(fields));
}

auto
tracer::state(span_id id) const -> span_state
{
  return impl_->state(id);
}

auto
tracer::open_spans() const -> std::size_t
{
  return impl_->open_spans();
}

auto
tracer::stats() const -> diagnostics
{
  return impl_->stats();
}

auto
tracer::options() const -> const pipeline_options::built&
{
  return impl_->options();
}

void
tracer::flush()
{
  return impl_->flush();
}

void
tracer::shutdown()
{
  return impl_->shutdown();
}

scoped_span::scoped_span(tracer& owner, std::shared_ptr<const metadata> meta, field_set fields)
  : tracer_{ owner }
  , id_{ owner.open_span(std::move(meta), std::move(fields)) }
{
}

scoped_span::~scoped_span()
{
  if (!closed_) {
    if (auto ec = tracer_.close_span(id_); ec) {
      SP_LOG_WARNING("span {} was not closed at the end of its scope: {}", id_, ec.message());
    }
  }
}

auto
scoped_span::add_field(field value) -> std::error_code
{
  return tracer_.add_field(id_, std::move(value));
}

auto
scoped_span::close() -> std::error_code
{
  auto ec = tracer_.close_span(id_);
  if (!ec) {
    closed_ = true;
  }
  return ec;
}
} // namespace spanpipe
