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

#include <spanpipe/field.hxx>
#include <spanpipe/metadata.hxx>

#include <fmt/format.h>

#include <type_traits>

namespace spanpipe
{
auto
to_string(const field_value& value) -> std::string
{
  return std::visit(
    [](const auto& v) -> std::string {
      using value_type = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<value_type, std::string>) {
        return v;
      } else if constexpr (std::is_same_v<value_type, debug_value>) {
        return v.text;
      } else if constexpr (std::is_same_v<value_type, bool>) {
        return v ? "true" : "false";
      } else {
        return fmt::format("{}", v);
      }
    },
    value);
}

auto
find_field(const field_set& fields, const std::string& key) -> const field*
{
  for (const auto& f : fields) {
    if (f.key == key) {
      return &f;
    }
  }
  return nullptr;
}

auto
make_metadata(spanpipe::level lvl,
              std::string name,
              std::string target,
              std::optional<source_location> location) -> std::shared_ptr<const metadata>
{
  return std::make_shared<const metadata>(
    metadata{ lvl, std::move(name), std::move(target), std::move(location) });
}
} // namespace spanpipe
