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

#include <spanpipe/field.hxx>
#include <spanpipe/level.hxx>
#include <spanpipe/stage.hxx>

namespace spanpipe
{
/**
 * Appends the same fields to every record, e.g. service name or host.
 */
class static_fields_enricher : public record_enricher
{
public:
  explicit static_fields_enricher(field_set fields);

  auto enrich(const dispatch_record& record) -> dispatch_record override;

private:
  field_set fields_;
};

/**
 * Keeps records at or above the threshold. Unlike pipeline_options::min_level it can be placed
 * between stages, e.g. to send only warnings to one of several exporters.
 */
class level_filter : public record_filter
{
public:
  explicit level_filter(level threshold);

  auto filter(const dispatch_record& record) -> bool override;

private:
  level threshold_;
};
} // namespace spanpipe
