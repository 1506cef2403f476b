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

#include <spanpipe/field.hxx>
#include <spanpipe/metadata.hxx>

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

// NOLINTBEGIN(bugprone-chained-comparison, misc-use-anonymous-namespace)

TEST_CASE("field values", "[unit][field]")
{
  using namespace spanpipe;

  SECTION("integers of any width are stored as int64")
  {
    const field small{ "count", static_cast<std::uint16_t>(7) };
    REQUIRE(std::get<std::int64_t>(small.value) == 7);
    const field negative{ "delta", -3 };
    REQUIRE(std::get<std::int64_t>(negative.value) == -3);
  }

  SECTION("string literals are stored as strings, not booleans")
  {
    const field f{ "method", "GET" };
    REQUIRE(std::get<std::string>(f.value) == "GET");
  }

  SECTION("rendering without quotes")
  {
    REQUIRE(to_string(field_value{ std::string{ "text" } }) == "text");
    REQUIRE(to_string(field_value{ std::int64_t{ 42 } }) == "42");
    REQUIRE(to_string(field_value{ true }) == "true");
    REQUIRE(to_string(field_value{ 0.5 }) == "0.5");
  }

  SECTION("debug fields are formatted eagerly")
  {
    const std::vector<int> values{ 1, 2, 3 };
    auto f = debug_field("values", values.size());
    REQUIRE(std::get<debug_value>(f.value).text == "3");
  }

  SECTION("lookup by key returns the first match")
  {
    const field_set fields{ { "a", 1 }, { "b", "x" }, { "a", 2 } };
    const auto* found = find_field(fields, "a");
    REQUIRE(found != nullptr);
    REQUIRE(std::get<std::int64_t>(found->value) == 1);
    REQUIRE(find_field(fields, "missing") == nullptr);
  }
}

namespace
{
auto
callsite_in_loop() -> const std::shared_ptr<const spanpipe::metadata>&
{
  return SPANPIPE_CALLSITE(spanpipe::level::info, "loop", "tests");
}
} // namespace

TEST_CASE("call site metadata", "[unit][metadata]")
{
  using namespace spanpipe;

  SECTION("created once per call site")
  {
    const auto& first = callsite_in_loop();
    const auto& second = callsite_in_loop();
    REQUIRE(first.get() == second.get());
    REQUIRE(first->name == "loop");
    REQUIRE(first->target == "tests");
    REQUIRE(first->level == level::info);
    REQUIRE(first->location.has_value());
    REQUIRE(first->location->line > 0);
  }

  SECTION("different call sites get different metadata")
  {
    const auto& a = SPANPIPE_CALLSITE(level::debug, "a", "tests");
    const auto& b = SPANPIPE_CALLSITE(level::debug, "b", "tests");
    REQUIRE(a.get() != b.get());
    REQUIRE(*a != *b);
  }
}

// NOLINTEND(bugprone-chained-comparison, misc-use-anonymous-namespace)
