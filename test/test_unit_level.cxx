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

#include "test_helper.hxx"

#include <spanpipe/level.hxx>

// NOLINTBEGIN(bugprone-chained-comparison, misc-use-anonymous-namespace)

TEST_CASE("level names and parsing", "[unit][level]")
{
  using namespace spanpipe;

  SECTION("ordering from the most verbose to the most severe")
  {
    REQUIRE(is_enabled(level::error, level::warn));
    REQUIRE(is_enabled(level::warn, level::warn));
    REQUIRE_FALSE(is_enabled(level::info, level::warn));
    REQUIRE(is_enabled(level::trace, level::trace));
  }

  SECTION("off disables everything")
  {
    REQUIRE_FALSE(is_enabled(level::error, level::off));
    REQUIRE_FALSE(is_enabled(level::off, level::trace));
  }

  SECTION("upper case names")
  {
    REQUIRE(to_string(level::trace) == "TRACE");
    REQUIRE(to_string(level::debug) == "DEBUG");
    REQUIRE(to_string(level::info) == "INFO");
    REQUIRE(to_string(level::warn) == "WARN");
    REQUIRE(to_string(level::error) == "ERROR");
    REQUIRE(to_string(level::off) == "OFF");
  }

  SECTION("parsing is case insensitive")
  {
    REQUIRE(level_from_string("info") == level::info);
    REQUIRE(level_from_string("INFO") == level::info);
    REQUIRE(level_from_string("Debug") == level::debug);
    REQUIRE(level_from_string("oFf") == level::off);
  }

  SECTION("warning is an alias of warn")
  {
    REQUIRE(level_from_string("warning") == level::warn);
    REQUIRE(level_from_string("WARNING") == level::warn);
  }

  SECTION("unknown names are rejected")
  {
    REQUIRE_FALSE(level_from_string("verbose").has_value());
    REQUIRE_FALSE(level_from_string("").has_value());
  }
}

// NOLINTEND(bugprone-chained-comparison, misc-use-anonymous-namespace)
