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

#include <optional>
#include <string>

namespace spanpipe
{
struct text_formatter_options {
  /**
   * Colour the level with ANSI escape sequences.
   */
  bool ansi{ true };

  /**
   * Append "(file:line)" when the call site is known.
   */
  bool include_location{ true };

  /**
   * Printed instead of the record time, so the output can be compared verbatim.
   */
  std::optional<std::string> fixed_timestamp{};
};

/**
 * Renders one human readable line per record:
 *
 *   13:07:42.315 INFO  app: -> request id=1 method=GET (server.cxx:42)
 *   13:07:42.318 INFO  app: validated span=1 (server.cxx:47)
 *   13:07:42.320 INFO  app: <- request id=1 method=GET elapsed_us=5012 (server.cxx:42)
 */
class text_formatter : public record_formatter
{
public:
  explicit text_formatter(text_formatter_options options = {});

  auto format(const dispatch_record& record) -> std::string override;

private:
  text_formatter_options options_;
};
} // namespace spanpipe
