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

#include <string>
#include <system_error>
#include <vector>

namespace spanpipe
{
/**
 * Destination of rendered records. While the exporter runs, write() and flush() are only
 * called from its drain thread. Before start() and after shutdown() they are called under the
 * exporter's lifecycle lock. Calls never overlap, so implementations do not need to be thread
 * safe with respect to themselves.
 */
class sink
{
public:
  sink() = default;
  sink(const sink&) = delete;
  sink(sink&&) = delete;
  auto operator=(const sink&) -> sink& = delete;
  auto operator=(sink&&) -> sink& = delete;
  virtual ~sink() = default;

  /**
   * Writes the batch. A non-empty error code makes the exporter retry the same batch.
   */
  virtual auto write(const std::vector<std::string>& batch) -> std::error_code = 0;

  virtual auto flush() -> std::error_code = 0;
};
} // namespace spanpipe
