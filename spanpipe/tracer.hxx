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

#include <spanpipe/diagnostics.hxx>
#include <spanpipe/error_codes.hxx>
#include <spanpipe/field.hxx>
#include <spanpipe/metadata.hxx>
#include <spanpipe/pipeline_options.hxx>
#include <spanpipe/record.hxx>
#include <spanpipe/sink.hxx>
#include <spanpipe/stage.hxx>

#include <memory>
#include <system_error>

namespace spanpipe
{
namespace core
{
class buffered_exporter;
} // namespace core

class tracer_impl;

/**
 * Entry point of the pipeline: owns the span registry, the stage chain and the counters.
 *
 * All methods are thread safe. Span operations act on the active execution context of the
 * calling thread (see execution_context).
 */
class tracer
{
public:
  explicit tracer(pipeline_options options = {});
  ~tracer();

  tracer(const tracer&) = delete;
  tracer(tracer&&) = delete;
  auto operator=(const tracer&) -> tracer& = delete;
  auto operator=(tracer&&) -> tracer& = delete;

  /**
   * Appends a stage to the chain. Stages run in registration order.
   */
  void add_stage(dispatch_stage stage);

  /**
   * Creates a buffered exporter for the sink using the tracer options, starts its drain thread
   * and appends it to the chain.
   */
  auto add_sink(std::shared_ptr<sink> destination) -> std::shared_ptr<core::buffered_exporter>;

  /**
   * Opens a span as a child of the current span and makes it the current span.
   */
  auto open_span(std::shared_ptr<const metadata> meta, field_set fields = {}) -> span_id;

  /**
   * @return errc::telemetry::span_not_open if the span is closed or unknown
   */
  auto add_field(span_id id, field value) -> std::error_code;

  /**
   * Closes the innermost open span of the active context.
   *
   * @return errc::telemetry::context_mismatch if `id` is not the current span (nothing is
   * changed), errc::telemetry::span_not_open if it has already been closed
   */
  auto close_span(span_id id) -> std::error_code;

  /**
   * Emits a point-in-time record attributed to the current span.
   */
  void event(std::shared_ptr<const metadata> meta, field_set fields = {});

  [[nodiscard]] auto state(span_id id) const -> span_state;
  [[nodiscard]] auto open_spans() const -> std::size_t;
  [[nodiscard]] auto stats() const -> diagnostics;
  [[nodiscard]] auto options() const -> const pipeline_options::built&;

  /**
   * Asks every exporter to deliver what it has queued.
   */
  void flush();

  /**
   * Flushes and stops every exporter. Records emitted afterwards are dropped and counted.
   */
  void shutdown();

private:
  std::shared_ptr<tracer_impl> impl_;
};

/**
 * Closes the span when it goes out of scope.
 */
class scoped_span
{
public:
  scoped_span(tracer& owner, std::shared_ptr<const metadata> meta, field_set fields = {});
  ~scoped_span();

  scoped_span(const scoped_span&) = delete;
  scoped_span(scoped_span&&) = delete;
  auto operator=(const scoped_span&) -> scoped_span& = delete;
  auto operator=(scoped_span&&) -> scoped_span& = delete;

  [[nodiscard]] auto id() const -> span_id
  {
    return id_;
  }

  auto add_field(field value) -> std::error_code;

  /**
   * Closes the span before the end of the scope.
   */
  auto close() -> std::error_code;

private:
  tracer& tracer_;
  span_id id_;
  bool closed_{ false };
};
} // namespace spanpipe

#define SPANPIPE_EVENT(tracer_ref, lvl, name, ...)                                                 \
  (tracer_ref).event(SPANPIPE_CALLSITE((lvl), (name), SPANPIPE_DEFAULT_TARGET),                    \
                     spanpipe::field_set{ __VA_ARGS__ })

#define SPANPIPE_SPAN(variable, tracer_ref, lvl, name, ...)                                        \
  spanpipe::scoped_span variable((tracer_ref),                                                     \
                                 SPANPIPE_CALLSITE((lvl), (name), SPANPIPE_DEFAULT_TARGET),        \
                                 spanpipe::field_set{ __VA_ARGS__ })
