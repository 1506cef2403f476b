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

#include <spanpipe/sinks.hxx>

#include "core/logger/logger.hxx"
#include "core/utils/ansi.hxx"

#include <spanpipe/error_codes.hxx>

#include <fmt/core.h>

#include <cerrno>

namespace spanpipe
{
namespace
{
auto
write_lines(std::FILE* output, const std::vector<std::string>& batch, bool strip)
  -> std::error_code
{
  for (const auto& line : batch) {
    if (strip) {
      fmt::print(output, "{}\n", core::utils::strip_ansi(line));
    } else {
      fmt::print(output, "{}\n", line);
    }
  }
  if (std::ferror(output) != 0) {
    std::clearerr(output);
    return errc::telemetry::export_failure;
  }
  return {};
}

auto
flush_stream(std::FILE* output) -> std::error_code
{
  if (std::fflush(output) != 0) {
    return { errno, std::generic_category() };
  }
  return {};
}
} // namespace

auto
memory_sink::write(const std::vector<std::string>& batch) -> std::error_code
{
  const std::scoped_lock lock(mutex_);
  for (const auto& line : batch) {
    lines_.emplace_back(core::utils::strip_ansi(line));
  }
  batch_sizes_.push_back(batch.size());
  return {};
}

auto
memory_sink::flush() -> std::error_code
{
  const std::scoped_lock lock(mutex_);
  ++flush_count_;
  return {};
}

auto
memory_sink::lines() const -> std::vector<std::string>
{
  const std::scoped_lock lock(mutex_);
  return lines_;
}

auto
memory_sink::batch_sizes() const -> std::vector<std::size_t>
{
  const std::scoped_lock lock(mutex_);
  return batch_sizes_;
}

auto
memory_sink::flush_count() const -> std::size_t
{
  const std::scoped_lock lock(mutex_);
  return flush_count_;
}

void
memory_sink::clear()
{
  const std::scoped_lock lock(mutex_);
  lines_.clear();
  batch_sizes_.clear();
  flush_count_ = 0;
}

file_sink::file_sink(std::FILE* output)
  : file_sink(output, false)
{
}

file_sink::file_sink(std::FILE* output, bool owned)
  : output_{ output }
  , owned_{ owned }
{
}

file_sink::~file_sink()
{
  if (output_ == nullptr) {
    return;
  }
  std::fflush(output_);
  if (owned_) {
    std::fclose(output_);
  }
}

auto
file_sink::open(const std::string& path) -> std::pair<std::error_code, std::shared_ptr<file_sink>>
{
  std::FILE* output = std::fopen(path.c_str(), "a");
  if (output == nullptr) {
    std::error_code ec{ errno, std::generic_category() };
    SP_LOG_WARNING(R"(unable to open "{}" for writing: {})", path, ec.message());
    return { ec, nullptr };
  }
  return { {}, std::shared_ptr<file_sink>(new file_sink(output, true)) };
}

auto
file_sink::write(const std::vector<std::string>& batch) -> std::error_code
{
  return write_lines(output_, batch, true);
}

auto
file_sink::flush() -> std::error_code
{
  return flush_stream(output_);
}

auto
console_sink::write(const std::vector<std::string>& batch) -> std::error_code
{
  return write_lines(stdout, batch, false);
}

auto
console_sink::flush() -> std::error_code
{
  return flush_stream(stdout);
}
} // namespace spanpipe
