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

#include <spanpipe/sink.hxx>

#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace spanpipe
{
/**
 * Keeps every written line in memory with ANSI escape sequences removed.
 */
class memory_sink : public sink
{
public:
  auto write(const std::vector<std::string>& batch) -> std::error_code override;
  auto flush() -> std::error_code override;

  [[nodiscard]] auto lines() const -> std::vector<std::string>;

  /**
   * @return size of every batch received, in order
   */
  [[nodiscard]] auto batch_sizes() const -> std::vector<std::size_t>;

  [[nodiscard]] auto flush_count() const -> std::size_t;

  void clear();

private:
  mutable std::mutex mutex_{};
  std::vector<std::string> lines_{};
  std::vector<std::size_t> batch_sizes_{};
  std::size_t flush_count_{ 0 };
};

/**
 * Appends one line per record to a file, without ANSI escape sequences.
 */
class file_sink : public sink
{
public:
  /**
   * Writes to a stream owned by the caller.
   */
  explicit file_sink(std::FILE* output);
  ~file_sink() override;

  file_sink(const file_sink&) = delete;
  file_sink(file_sink&&) = delete;
  auto operator=(const file_sink&) -> file_sink& = delete;
  auto operator=(file_sink&&) -> file_sink& = delete;

  /**
   * Opens (or creates) the file at `path` in append mode.
   */
  static auto open(const std::string& path)
    -> std::pair<std::error_code, std::shared_ptr<file_sink>>;

  auto write(const std::vector<std::string>& batch) -> std::error_code override;
  auto flush() -> std::error_code override;

private:
  file_sink(std::FILE* output, bool owned);

  std::FILE* output_;
  bool owned_;
};

/**
 * Writes lines to standard output as they are, colours included. Warnings and errors go to
 * standard output too; use a `file_sink` on `stderr` behind a `level_filter` to separate them.
 */
class console_sink : public sink
{
public:
  auto write(const std::vector<std::string>& batch) -> std::error_code override;
  auto flush() -> std::error_code override;
};
} // namespace spanpipe
