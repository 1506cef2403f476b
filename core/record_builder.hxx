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

#include "span_registry.hxx"

#include <spanpipe/record.hxx>

#include <memory>

namespace spanpipe::core
{
/**
 * Turns call site metadata and registry snapshots into immutable records. Reads the active
 * context and the clocks, nothing else.
 */
class record_builder
{
public:
  [[nodiscard]] static auto event(std::shared_ptr<const metadata> meta,
                                  field_set fields) -> event_record;
  [[nodiscard]] static auto span_opened(const span_snapshot& snapshot) -> span_opened_record;
  [[nodiscard]] static auto span_closed(const span_snapshot& snapshot) -> span_closed_record;
};
} // namespace spanpipe::core
