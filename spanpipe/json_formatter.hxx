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

#include <spanpipe/stage.hxx>

#include <string>

namespace spanpipe
{
struct json_formatter_options {
  bool include_location{ true };
};

/**
 * Renders one JSON object per record. Fields are kept as an ordered array of
 * {"key": ..., "value": ...} objects, timestamps are ISO-8601 in UTC.
 */
class json_formatter : public record_formatter
{
public:
  explicit json_formatter(json_formatter_options options = {});

  auto format(const dispatch_record& record) -> std::string override;

private:
  json_formatter_options options_;
};
} // namespace spanpipe
