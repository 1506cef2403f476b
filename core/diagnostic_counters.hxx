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

#include <atomic>
#include <cstdint>

namespace spanpipe::core
{
/**
 * Counters shared by the dispatcher and every buffered exporter of a tracer.
 */
struct diagnostic_counters {
  std::atomic<std::uint64_t> records_emitted{ 0 };
  std::atomic<std::uint64_t> dropped_filtered{ 0 };
  std::atomic<std::uint64_t> dropped_overflow{ 0 };
  std::atomic<std::uint64_t> dropped_export_failure{ 0 };
  std::atomic<std::uint64_t> batches_exported{ 0 };
  std::atomic<std::uint64_t> export_retries{ 0 };
  std::atomic<std::uint64_t> dispatch_failures{ 0 };
  std::atomic<std::uint64_t> contract_violations{ 0 };

  [[nodiscard]] auto snapshot() const -> diagnostics
  {
    diagnostics stats{};
    stats.records_emitted = records_emitted.load();
    stats.dropped_filtered = dropped_filtered.load();
    stats.dropped_overflow = dropped_overflow.load();
    stats.dropped_export_failure = dropped_export_failure.load();
    stats.batches_exported = batches_exported.load();
    stats.export_retries = export_retries.load();
    stats.dispatch_failures = dispatch_failures.load();
    stats.contract_violations = contract_violations.load();
    return stats;
  }
};
} // namespace spanpipe::core
