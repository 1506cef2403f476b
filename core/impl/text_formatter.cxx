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

#include <spanpipe/text_formatter.hxx>

#include "core/chrono_utils.hxx"
#include "core/utils/ansi.hxx"

#include <fmt/format.h>

#include <iterator>
#include <utility>

namespace spanpipe
{
namespace
{
void
append_fields(fmt::memory_buffer& out, const field_set& fields)
{
  for (const auto& f : fields) {
    fmt::format_to(std::back_inserter(out), " {}={}", f.key, to_string(f.value));
  }
}
} // namespace

text_formatter::text_formatter(text_formatter_options options)
  : options_{ std::move(options) }
{
}

auto
text_formatter::format(const dispatch_record& record) -> std::string
{
  const auto& meta = record.meta();
  fmt::memory_buffer out;
  auto it = std::back_inserter(out);

  if (options_.fixed_timestamp) {
    fmt::format_to(it, "{} ", options_.fixed_timestamp.value());
  } else {
    fmt::format_to(it, "{} ", core::to_clock_time_utc(record.timestamp().wall));
  }
  if (options_.ansi) {
    fmt::format_to(it,
                   "{}{:<5}{} ",
                   core::utils::ansi_color(meta.level),
                   to_string(meta.level),
                   core::utils::ansi_reset);
  } else {
    fmt::format_to(it, "{:<5} ", to_string(meta.level));
  }
  fmt::format_to(it, "{}: ", meta.target);

  switch (record.kind()) {
    case record_kind::event:
      fmt::format_to(it, "{}", meta.name);
      break;
    case record_kind::span_opened:
      fmt::format_to(it, "-> {} id={}", meta.name, record.id().value_or(0));
      break;
    case record_kind::span_closed:
      fmt::format_to(it, "<- {} id={}", meta.name, record.id().value_or(0));
      break;
  }
  if (auto parent = record.parent_id(); parent) {
    fmt::format_to(it, " span={}", parent.value());
  }
  append_fields(out, record.fields());
  if (const auto* closed = record.try_as_span_closed(); closed != nullptr) {
    fmt::format_to(it, " elapsed_us={}", closed->elapsed().count());
  }
  if (options_.include_location && meta.location) {
    fmt::format_to(it, " ({}:{})", meta.location->file, meta.location->line);
  }
  return fmt::to_string(out);
}
} // namespace spanpipe
