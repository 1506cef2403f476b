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

#include <spanpipe/error_codes.hxx>

#include <string>

namespace spanpipe::core::impl
{
struct telemetry_error_category : std::error_category {
  [[nodiscard]] auto name() const noexcept -> const char* override
  {
    return "spanpipe.telemetry";
  }

  [[nodiscard]] auto message(int ev) const noexcept -> std::string override
  {
    switch (static_cast<errc::telemetry>(ev)) {
      case errc::telemetry::context_mismatch:
        return "context_mismatch (1)";
      case errc::telemetry::span_not_open:
        return "span_not_open (2)";
      case errc::telemetry::dispatch_stage_failure:
        return "dispatch_stage_failure (3)";
      case errc::telemetry::export_failure:
        return "export_failure (4)";
      case errc::telemetry::queue_overflow:
        return "queue_overflow (5)";
      case errc::telemetry::pipeline_shutdown:
        return "pipeline_shutdown (6)";
      case errc::telemetry::invalid_argument:
        return "invalid_argument (7)";
    }
    return "FIXME: unknown error code (recompile with newer library): spanpipe.telemetry." +
           std::to_string(ev);
  }
};

const inline static telemetry_error_category category_instance;

auto
telemetry_category() noexcept -> const std::error_category&
{
  return category_instance;
}
} // namespace spanpipe::core::impl
