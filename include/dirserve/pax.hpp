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
#include <dirserve/metadata.hpp>
#include <expected>
#include <map>
#include <span>
#include <string>
#include <string_view>

namespace dirserve::pax {

// Parse PAX extended header records ("<len> <key>=<value>\n")
[[nodiscard]] std::expected<std::map<std::string, std::string>, error> parse_pax_headers(
    std::span<const std::byte> data
);

// Format one record; the leading length counts itself
[[nodiscard]] std::string format_pax_record(std::string_view key, std::string_view value);

// Records needed to carry the fields of `meta` that a ustar header cannot hold.
// Empty when the entry fits.
[[nodiscard]] std::string extended_records(const file_metadata& meta);

// Metadata of the 'x' entry that precedes `meta`
[[nodiscard]] file_metadata extended_header_for(const file_metadata& meta, size_t records_size);

// Apply path/linkpath/size/uid/gid/mtime overrides to the following entry
void apply_pax_headers(file_metadata& meta, const std::map<std::string, std::string>& headers);

} // namespace dirserve::pax
