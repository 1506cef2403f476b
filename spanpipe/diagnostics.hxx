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

#include <cstdint>
#include <string>

namespace spanpipe
{
/**
 * Point-in-time copy of the pipeline counters.
 */
struct diagnostics {
  std::uint64_t records_emitted{ 0 };
  std::uint64_t dropped_filtered{ 0 };
  std::uint64_t dropped_overflow{ 0 };
  std::uint64_t dropped_export_failure{ 0 };
  std::uint64_t batches_exported{ 0 };
  std::uint64_t export_retries{ 0 };
  std::uint64_t dispatch_failures{ 0 };
  std::uint64_t contract_violations{ 0 };

  [[nodiscard]] auto dropped_total() const -> std::uint64_t
  {
    return dropped_filtered + dropped_overflow + dropped_export_failure;
  }
};

/**
 * @return JSON object with every counter, used when logging the final report on shutdown
 */
auto
to_string(const diagnostics& stats) -> std::string;
} // namespace spanpipe
