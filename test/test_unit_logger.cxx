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

#include <spanpipe/logger.hxx>
#include <spanpipe/tracer.hxx>

#include "core/logger/configuration.hxx"
#include "core/logger/logger.hxx"

#include <spdlog/sinks/ringbuffer_sink.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

// NOLINTBEGIN(bugprone-chained-comparison, misc-use-anonymous-namespace)

namespace
{
auto
install_capturing_logger(spanpipe::core::logger::level level)
  -> std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt>
{
  auto capture = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(128);
  spanpipe::core::logger::configuration configuration{};
  configuration.unit_test = true;
  configuration.console = false;
  configuration.log_level = level;
  configuration.sink = capture;
  REQUIRE_FALSE(spanpipe::core::logger::create_file_logger(configuration).has_value());
  return capture;
}

void
restore_test_logger()
{
  spanpipe::core::logger::create_blackhole_logger();
}

auto
contains(const std::vector<std::string>& lines, const std::string& needle) -> bool
{
  return std::any_of(lines.begin(), lines.end(), [&needle](const auto& line) {
    return line.find(needle) != std::string::npos;
  });
}
} // namespace

TEST_CASE("unit: internal log macros respect the logger level", "[unit][logger]")
{
  test::utils::init_logger();
  auto capture = install_capturing_logger(spanpipe::core::logger::level::info);

  SP_LOG_DEBUG("hidden debug {}", 1);
  SP_LOG_INFO("visible info {}", 2);
  SP_LOG_WARNING("visible warning {}", 3);
  REQUIRE(spanpipe::core::logger::should_log(spanpipe::core::logger::level::err));
  REQUIRE_FALSE(spanpipe::core::logger::should_log(spanpipe::core::logger::level::trace));

  auto lines = capture->last_formatted();
  REQUIRE(lines.size() == 2);
  REQUIRE(contains(lines, "visible info 2"));
  REQUIRE(contains(lines, "visible warning 3"));
  REQUIRE_FALSE(contains(lines, "hidden debug"));

  spanpipe::logger::set_level(spanpipe::logger::log_level::debug);
  REQUIRE(spanpipe::core::logger::check_log_levels(spanpipe::core::logger::level::debug));
  SP_LOG_DEBUG("now visible");
  REQUIRE(contains(capture->last_formatted(), "now visible"));

  restore_test_logger();
}

TEST_CASE("unit: pipeline failures are reported through the logger", "[unit][logger]")
{
  test::utils::init_logger();
  auto capture = install_capturing_logger(spanpipe::core::logger::level::warn);

  {
    spanpipe::tracer telemetry;
    std::shared_ptr<spanpipe::record_formatter> failing =
      std::make_shared<test::utils::throwing_formatter>();
    telemetry.add_stage(failing);
    telemetry.event(spanpipe::make_metadata(spanpipe::level::info, "doomed", "tests"));
    REQUIRE(telemetry.stats().dispatch_failures == 1);

    REQUIRE(telemetry.close_span(424242) == spanpipe::errc::telemetry::span_not_open);
    telemetry.shutdown();
  }

  auto lines = capture->last_formatted();
  REQUIRE(contains(lines, "formatter failure"));
  REQUIRE(contains(lines, "dispatch_stage_failure"));

  restore_test_logger();
}

TEST_CASE("unit: file logger falls back to the console", "[unit][logger]")
{
  test::utils::init_logger();

  spanpipe::logger::initialize_file_logger("/nonexistent-directory/for/spanpipe/test.log");
  REQUIRE(spanpipe::core::logger::is_initialized());

  restore_test_logger();
}

TEST_CASE("unit: blackhole and reset loggers", "[unit][logger]")
{
  test::utils::init_logger();

  SECTION("blackhole logger is installed but never logs")
  {
    spanpipe::core::logger::create_blackhole_logger();
    REQUIRE(spanpipe::core::logger::is_initialized());
    REQUIRE(spanpipe::core::logger::get() != nullptr);
    REQUIRE_FALSE(spanpipe::core::logger::should_log(spanpipe::core::logger::level::critical));
  }

  SECTION("reset leaves the library without a logger and macros become no-ops")
  {
    spanpipe::core::logger::reset();
    REQUIRE_FALSE(spanpipe::core::logger::is_initialized());
    REQUIRE(spanpipe::core::logger::get() == nullptr);
    REQUIRE_FALSE(spanpipe::core::logger::should_log(spanpipe::core::logger::level::critical));
    SP_LOG_ERROR("dropped {}", 1);

    spanpipe::tracer telemetry;
    telemetry.event(spanpipe::make_metadata(spanpipe::level::info, "unlogged", "tests"));
    REQUIRE(telemetry.stats().records_emitted == 1);
  }

  restore_test_logger();
}

// NOLINTEND(bugprone-chained-comparison, misc-use-anonymous-namespace)
