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

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace spanpipe::core
{
auto
to_iso8601_utc(std::time_t time_in_seconds, std::int64_t microseconds = 0) -> std::string;

auto
to_iso8601_utc(const std::chrono::system_clock::time_point& time_point) -> std::string;

/**
 * @return time of day in UTC with millisecond precision, e.g. "13:07:42.315"
 */
auto
to_clock_time_utc(const std::chrono::system_clock::time_point& time_point) -> std::string;
} // namespace spanpipe::core
