/*
 * Copyright 2025 TierOne Software
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <dirserve/error.hpp>
#include <expected>
#include <filesystem>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dirserve {

// Exclusion predicate: receives an absolute path, returns true to hide it.
// An empty function excludes nothing.
using exclude_fn = std::function<bool(const std::filesystem::path&)>;

// Any-of composition; empty functions are ignored
[[nodiscard]] exclude_fn exclude_union(std::vector<exclude_fn> functions);

namespace glob {

// Translate a shell-style pattern into an ECMAScript regular expression
// searched against absolute paths.
//
//   *  any run of characters except `sep`      **  anything
//   ?  one character except `sep`              [a-z] [!a-z]  ranges
//   {a,b} alternation                          \x  literal x
//
// A leading `sep` anchors the pattern at `base`; otherwise it matches after
// any separator. Matches extend to the entry's descendants.
[[nodiscard]] std::string translate(std::string_view pattern, char sep = '/', std::string_view base = {});

// Predicate matching any of `patterns` below `base`; empty if there are none.
// Fails with invalid_argument when a pattern does not form a valid expression.
[[nodiscard]] std::expected<exclude_fn, error> make_exclude(std::span<const std::string> patterns,
                                                          const std::filesystem::path& base);

// Read patterns from files: one per line, '#' starts a comment
[[nodiscard]] std::expected<std::vector<std::string>, error> collect_patterns(
    std::span<const std::filesystem::path> files);

} // namespace glob

} // namespace dirserve
