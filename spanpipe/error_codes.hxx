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

#include <system_error>

namespace spanpipe
{
namespace core::impl
{
const std::error_category&
telemetry_category() noexcept;
} // namespace core::impl

namespace errc
{
/**
 * Errors reported by the telemetry pipeline.
 */
enum class telemetry {
  /**
   * The span being exited or closed is not the innermost open span of the current execution
   * context. The context stack is left unchanged.
   */
  context_mismatch = 1,

  /**
   * The span is already closed (or was never opened), so fields cannot be added and it cannot
   * be closed again.
   */
  span_not_open = 2,

  /**
   * A filter, enrich, format or export stage raised an error. The record has been dropped.
   */
  dispatch_stage_failure = 3,

  /**
   * The sink rejected a batch after all retry attempts. The batch has been dropped.
   */
  export_failure = 4,

  /**
   * The export queue was full and the record has been dropped according to the overflow
   * policy.
   */
  queue_overflow = 5,

  /**
   * The pipeline has been shut down and does not accept new records.
   */
  pipeline_shutdown = 6,

  /**
   * Configuration value could not be parsed or is out of range.
   */
  invalid_argument = 7,
};

inline std::error_code
make_error_code(telemetry e) noexcept
{
  return { static_cast<int>(e), core::impl::telemetry_category() };
}
} // namespace errc
} // namespace spanpipe

template<>
struct std::is_error_code_enum<spanpipe::errc::telemetry> : std::true_type {
};
