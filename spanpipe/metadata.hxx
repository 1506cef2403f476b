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

#include <spanpipe/level.hxx>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace spanpipe
{
struct source_location {
  std::string file{};
  std::uint32_t line{ 0 };
};

/**
 * Immutable description of a call site. One instance is shared by every record produced at
 * that call site.
 */
struct metadata {
  spanpipe::level level{ level::info };
  std::string name{};
  std::string target{};
  std::optional<source_location> location{};
};

inline auto
operator==(const source_location& lhs, const source_location& rhs) -> bool
{
  return lhs.file == rhs.file && lhs.line == rhs.line;
}

inline auto
operator==(const metadata& lhs, const metadata& rhs) -> bool
{
  return lhs.level == rhs.level &&   //
         lhs.name == rhs.name &&     //
         lhs.target == rhs.target && //
         lhs.location == rhs.location;
}

inline auto
operator!=(const metadata& lhs, const metadata& rhs) -> bool
{
  return !(lhs == rhs);
}

auto
make_metadata(spanpipe::level lvl,
              std::string name,
              std::string target,
              std::optional<source_location> location = {}) -> std::shared_ptr<const metadata>;
} // namespace spanpipe

#ifndef SPANPIPE_DEFAULT_TARGET
#define SPANPIPE_DEFAULT_TARGET "app"
#endif

/**
 * Expands to a `std::shared_ptr<const spanpipe::metadata>` that is created once for the call
 * site and reused on every subsequent evaluation.
 */
#define SPANPIPE_CALLSITE(lvl, name, target)                                                       \
  ([]() -> const std::shared_ptr<const spanpipe::metadata>& {                                      \
    static const std::shared_ptr<const spanpipe::metadata> callsite_metadata =                     \
      spanpipe::make_metadata(                                                                     \
        (lvl), (name), (target), spanpipe::source_location{ __FILE__, __LINE__ });                 \
    return callsite_metadata;                                                                      \
  }())
