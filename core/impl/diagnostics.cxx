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

#include <spanpipe/diagnostics.hxx>

#include <tao/json.hpp>

namespace spanpipe
{
auto
to_string(const diagnostics& stats) -> std::string
{
  const tao::json::value json = {
    { "records_emitted", stats.records_emitted },
    { "dropped_filtered", stats.dropped_filtered },
    { "dropped_overflow", stats.dropped_overflow },
    { "dropped_export_failure", stats.dropped_export_failure },
    { "batches_exported", stats.batches_exported },
    { "export_retries", stats.export_retries },
    { "dispatch_failures", stats.dispatch_failures },
    { "contract_violations", stats.contract_violations },
  };
  return tao::json::to_string(json);
}
} // namespace spanpipe
