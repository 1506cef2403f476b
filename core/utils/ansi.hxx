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

#include <string>
#include <string_view>

namespace spanpipe::core::utils
{
constexpr std::string_view ansi_reset{ "\x1b[0m" };

/**
 * @return escape sequence that selects the foreground colour of the level
 */
auto
ansi_color(level lvl) -> std::string_view;

/**
 * Removes every escape sequence, from the ESC byte up to and including the terminating 'm'.
 */
auto
strip_ansi(std::string_view input) -> std::string;
} // namespace spanpipe::core::utils
