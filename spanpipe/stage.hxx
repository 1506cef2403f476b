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

#include <spanpipe/record.hxx>

#include <memory>
#include <string>
#include <system_error>
#include <variant>

namespace spanpipe
{
/**
 * Decides whether a record continues down the chain. Returning false ends the chain for the
 * record without an error.
 */
class record_filter
{
public:
  virtual ~record_filter() = default;

  virtual auto filter(const dispatch_record& record) -> bool = 0;
};

/**
 * Produces an augmented copy of the record. Subsequent stages observe the copy.
 */
class record_enricher
{
public:
  virtual ~record_enricher() = default;

  virtual auto enrich(const dispatch_record& record) -> dispatch_record = 0;
};

/**
 * Renders the record into bytes. Exporters registered after it receive the rendered bytes.
 */
class record_formatter
{
public:
  virtual ~record_formatter() = default;

  virtual auto format(const dispatch_record& record) -> std::string = 0;
};

/**
 * Receives rendered records. Called on the dispatching thread, so implementations must not
 * perform blocking I/O (see core::buffered_exporter).
 */
class record_exporter
{
public:
  virtual ~record_exporter() = default;

  virtual auto export_rendered(std::string rendered) -> std::error_code = 0;

  virtual void flush()
  {
    // do nothing
  }

  virtual void shutdown()
  {
    // do nothing
  }
};

using dispatch_stage = std::variant<std::shared_ptr<record_filter>,
                                    std::shared_ptr<record_enricher>,
                                    std::shared_ptr<record_formatter>,
                                    std::shared_ptr<record_exporter>>;
} // namespace spanpipe
