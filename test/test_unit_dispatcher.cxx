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
#include "utils/test_stages.hxx"

#include "core/diagnostic_counters.hxx"
#include "core/dispatcher.hxx"

#include <spanpipe/metadata.hxx>
#include <spanpipe/stages.hxx>

#include <memory>
#include <string>
#include <vector>

// NOLINTBEGIN(bugprone-chained-comparison, misc-use-anonymous-namespace)

namespace
{
auto
make_event(const std::string& name, spanpipe::level lvl = spanpipe::level::info)
  -> spanpipe::dispatch_record
{
  return spanpipe::dispatch_record{ spanpipe::event_record{
    spanpipe::make_metadata(lvl, name, "tests"), {}, {}, spanpipe::record_time::now() } };
}

auto
make_opened(spanpipe::span_id id) -> spanpipe::dispatch_record
{
  return spanpipe::dispatch_record{ spanpipe::span_opened_record{
    id, spanpipe::make_metadata(spanpipe::level::info, "span", "tests"), {}, {}, {} } };
}

auto
make_closed(spanpipe::span_id id) -> spanpipe::dispatch_record
{
  return spanpipe::dispatch_record{ spanpipe::span_closed_record{
    id, spanpipe::make_metadata(spanpipe::level::info, "span", "tests"), {}, {}, {}, {} } };
}
} // namespace

TEST_CASE("dispatcher runs stages in registration order", "[unit][dispatcher]")
{
  using namespace spanpipe;

  test::utils::init_logger();
  auto counters = std::make_shared<core::diagnostic_counters>();
  core::dispatcher dispatcher{ level::trace, counters };

  SECTION("filter returning false stops the chain")
  {
    auto first = std::make_shared<test::utils::predicate_filter>(true);
    auto rejecting = std::make_shared<test::utils::predicate_filter>(false);
    auto after = std::make_shared<test::utils::predicate_filter>(true);
    auto formatter = std::make_shared<test::utils::recording_formatter>();
    auto exporter = std::make_shared<test::utils::recording_exporter>();
    dispatcher.add_stage(std::shared_ptr<record_filter>{ first });
    dispatcher.add_stage(std::shared_ptr<record_filter>{ rejecting });
    dispatcher.add_stage(std::shared_ptr<record_filter>{ after });
    dispatcher.add_stage(std::shared_ptr<record_formatter>{ formatter });
    dispatcher.add_stage(std::shared_ptr<record_exporter>{ exporter });

    for (int i = 0; i < 5; ++i) {
      dispatcher.dispatch(make_event("ignored"));
    }

    REQUIRE(first->calls() == 5);
    REQUIRE(rejecting->calls() == 5);
    REQUIRE(after->calls() == 0);
    REQUIRE(formatter->seen().empty());
    REQUIRE(exporter->exported().empty());
    REQUIRE(counters->snapshot().dropped_filtered == 5);
    REQUIRE(counters->snapshot().records_emitted == 5);
  }

  SECTION("enricher output is what later stages observe")
  {
    auto formatter = std::make_shared<test::utils::recording_formatter>();
    dispatcher.add_stage(std::shared_ptr<record_enricher>{
      std::make_shared<static_fields_enricher>(field_set{ { "service", "billing" } }) });
    dispatcher.add_stage(std::shared_ptr<record_formatter>{ formatter });

    auto original = make_event("charged");
    dispatcher.dispatch(original);

    auto seen = formatter->seen();
    REQUIRE(seen.size() == 1);
    REQUIRE(seen[0].fields().size() == 1);
    REQUIRE(seen[0].fields()[0].key == "service");
    REQUIRE(original.fields().empty());
  }

  SECTION("exporter receives the bytes of the latest formatter")
  {
    auto exporter = std::make_shared<test::utils::recording_exporter>();
    dispatcher.add_stage(
      std::shared_ptr<record_formatter>{ std::make_shared<test::utils::recording_formatter>() });
    dispatcher.add_stage(std::shared_ptr<record_exporter>{ exporter });

    dispatcher.dispatch(make_event("first"));
    dispatcher.dispatch(make_event("second"));

    REQUIRE(exporter->exported() == std::vector<std::string>{ "event:first", "event:second" });
  }

  SECTION("records below the minimum level are dropped before any stage")
  {
    core::dispatcher strict{ level::warn, counters };
    auto filter = std::make_shared<test::utils::predicate_filter>(true);
    strict.add_stage(std::shared_ptr<record_filter>{ filter });

    strict.dispatch(make_event("noise", level::debug));
    strict.dispatch(make_event("problem", level::error));

    REQUIRE(filter->calls() == 1);
    REQUIRE(counters->snapshot().dropped_filtered == 1);
  }
}

TEST_CASE("dispatcher contains stage failures", "[unit][dispatcher]")
{
  using namespace spanpipe;

  test::utils::init_logger();
  auto counters = std::make_shared<core::diagnostic_counters>();
  core::dispatcher dispatcher{ level::trace, counters };

  SECTION("throwing formatter drops only the current record")
  {
    auto exporter = std::make_shared<test::utils::recording_exporter>();
    dispatcher.add_stage(
      std::shared_ptr<record_formatter>{ std::make_shared<test::utils::throwing_formatter>() });
    dispatcher.add_stage(std::shared_ptr<record_exporter>{ exporter });

    REQUIRE_NOTHROW(dispatcher.dispatch(make_event("boom")));
    REQUIRE_NOTHROW(dispatcher.dispatch(make_event("boom again")));

    REQUIRE(exporter->exported().empty());
    REQUIRE(counters->snapshot().dispatch_failures == 2);
    REQUIRE(counters->snapshot().records_emitted == 2);
  }

  SECTION("throwing filter drops the record before later stages")
  {
    auto after = std::make_shared<test::utils::predicate_filter>(true);
    auto formatter = std::make_shared<test::utils::recording_formatter>();
    dispatcher.add_stage(
      std::shared_ptr<record_filter>{ std::make_shared<test::utils::throwing_filter>() });
    dispatcher.add_stage(std::shared_ptr<record_filter>{ after });
    dispatcher.add_stage(std::shared_ptr<record_formatter>{ formatter });

    REQUIRE_NOTHROW(dispatcher.dispatch(make_event("filtered badly")));

    REQUIRE(after->calls() == 0);
    REQUIRE(formatter->seen().empty());
    REQUIRE(counters->snapshot().dispatch_failures == 1);
    REQUIRE(counters->snapshot().dropped_filtered == 0);
  }

  SECTION("enricher throwing a non-exception drops the record before later stages")
  {
    auto formatter = std::make_shared<test::utils::recording_formatter>();
    auto exporter = std::make_shared<test::utils::recording_exporter>();
    dispatcher.add_stage(
      std::shared_ptr<record_enricher>{ std::make_shared<test::utils::throwing_enricher>() });
    dispatcher.add_stage(std::shared_ptr<record_formatter>{ formatter });
    dispatcher.add_stage(std::shared_ptr<record_exporter>{ exporter });

    REQUIRE_NOTHROW(dispatcher.dispatch(make_event("enriched badly")));
    REQUIRE_NOTHROW(dispatcher.dispatch(make_event("enriched badly again")));

    REQUIRE(formatter->seen().empty());
    REQUIRE(exporter->exported().empty());
    REQUIRE(counters->snapshot().dispatch_failures == 2);
  }

  SECTION("exporter without formatter is a stage failure")
  {
    auto exporter = std::make_shared<test::utils::recording_exporter>();
    dispatcher.add_stage(std::shared_ptr<record_exporter>{ exporter });

    REQUIRE_NOTHROW(dispatcher.dispatch(make_event("unformatted")));
    REQUIRE(exporter->exported().empty());
    REQUIRE(counters->snapshot().dispatch_failures == 1);
  }
}

TEST_CASE("dispatcher enforces the span lifecycle", "[unit][dispatcher]")
{
  using namespace spanpipe;

  test::utils::init_logger();
  auto counters = std::make_shared<core::diagnostic_counters>();
  core::dispatcher dispatcher{ level::trace, counters };
  auto formatter = std::make_shared<test::utils::recording_formatter>();
  dispatcher.add_stage(std::shared_ptr<record_formatter>{ formatter });

  SECTION("open then close is accepted")
  {
    dispatcher.dispatch(make_opened(7));
    REQUIRE(dispatcher.tracked_spans() == 1);
    dispatcher.dispatch(make_closed(7));
    REQUIRE(dispatcher.tracked_spans() == 0);
    REQUIRE(formatter->seen().size() == 2);
    REQUIRE(counters->snapshot().contract_violations == 0);
  }

  SECTION("close without open is reported and dropped")
  {
    dispatcher.dispatch(make_closed(8));
    REQUIRE(formatter->seen().empty());
    REQUIRE(counters->snapshot().contract_violations == 1);
  }

  SECTION("second close is reported and dropped")
  {
    dispatcher.dispatch(make_opened(9));
    dispatcher.dispatch(make_closed(9));
    dispatcher.dispatch(make_closed(9));
    REQUIRE(formatter->seen().size() == 2);
    REQUIRE(counters->snapshot().contract_violations == 1);
  }

  SECTION("opening the same id twice is reported and dropped")
  {
    dispatcher.dispatch(make_opened(10));
    dispatcher.dispatch(make_opened(10));
    REQUIRE(formatter->seen().size() == 1);
    REQUIRE(counters->snapshot().contract_violations == 1);
  }
}

// NOLINTEND(bugprone-chained-comparison, misc-use-anonymous-namespace)
