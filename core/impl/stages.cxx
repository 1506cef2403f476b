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

#include <spanpipe/stages.hxx>

#include <utility>

namespace spanpipe
{
static_fields_enricher::static_fields_enricher(field_set fields)
  : fields_{ std::move(fields) }
{
}

auto
static_fields_enricher::enrich(const dispatch_record& record) -> dispatch_record
{
  return record.with_fields(fields_);
}

level_filter::level_filter(level threshold)
  : threshold_{ threshold }
{
}

auto
level_filter::filter(const dispatch_record& record) -> bool
{
  return is_enabled(record.level(), threshold_);
}
} // namespace spanpipe
