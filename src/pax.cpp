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

#include <dirserve/pax.hpp>
#include <dirserve/header_codec.hpp>
#include <algorithm>
#include <charconv>
#include <fmt/format.h>

namespace dirserve::pax {

namespace {

size_t decimal_digits(size_t value) {
    size_t digits = 1;
    while (value >= 10) {
        value /= 10;
        ++digits;
    }
    return digits;
}

template<typename T>
bool parse_decimal(const std::string& text, T& out) {
    // PAX times may carry a fractional part; only whole seconds are kept
    const char* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, out);
    return ec == std::errc{} && (ptr == end || *ptr == '.');
}

} // anonymous namespace

auto parse_pax_headers(
    const std::span<const std::byte> data) -> std::expected<std::map<std::string, std::string>, error> {
    std::map<std::string, std::string> result;

    const auto start = reinterpret_cast<const char*>(data.data());
    const char* end = start + data.size();
    const char* pos = start;

    while (pos < end && *pos != '\0') {
        const char* length_start = pos;
        while (pos < end && *pos >= '0' && *pos <= '9') {
            ++pos;
        }

        if (pos == length_start || pos >= end || *pos != ' ') {
            const std::string debug_str(length_start, std::min(pos, end));
            return std::unexpected(error{error_code::invalid_header,
                fmt::format("Invalid PAX header length field, found: '{}'", debug_str)});
        }

        size_t length;
        auto result_code = std::from_chars(length_start, pos, length);
        if (result_code.ec != std::errc{}) {
            return std::unexpected(error{error_code::invalid_header, "Failed to parse PAX header length"});
        }

        if (length == 0) {
            return std::unexpected(error{error_code::invalid_header, "PAX header record length cannot be zero"});
        }

        ++pos; // Skip space

        const char* record_end = length_start + length;
        if (record_end > end || record_end <= pos) {
            return std::unexpected(error{error_code::corrupt_archive, "PAX header record extends beyond data"});
        }

        const char* key_start = pos;
        const char* value_end = record_end;
        if (*(value_end - 1) == '\n') {
            --value_end;
        }

        const char* equals_pos = std::find(key_start, value_end, '=');
        if (equals_pos == value_end) {
            return std::unexpected(error{error_code::invalid_header, "PAX header missing '=' separator"});
        }

        result[std::string(key_start, equals_pos)] = std::string(equals_pos + 1, value_end);

        pos = record_end;
    }

    return result;
}

std::string format_pax_record(std::string_view key, std::string_view value) {
    // " key=value\n" plus the length digits, which count themselves
    const size_t payload = key.size() + value.size() + 3;
    size_t length = payload + decimal_digits(payload);
    if (decimal_digits(length) != decimal_digits(payload)) {
        length = payload + decimal_digits(length);
    }
    return fmt::format("{} {}={}\n", length, key, value);
}

std::string extended_records(const file_metadata& meta) {
    std::string records;

    if (!detail::split_ustar_path(meta.path)) {
        records += format_pax_record("path", meta.path);
    }
    if (meta.link_target && meta.link_target->size() > detail::NAME_SIZE) {
        records += format_pax_record("linkpath", *meta.link_target);
    }
    if (meta.has_payload() && meta.size > detail::octal_field_max(12)) {
        records += format_pax_record("size", std::to_string(meta.size));
    }
    if (meta.owner_id > detail::octal_field_max(8)) {
        records += format_pax_record("uid", std::to_string(meta.owner_id));
    }
    if (meta.group_id > detail::octal_field_max(8)) {
        records += format_pax_record("gid", std::to_string(meta.group_id));
    }
    const auto mtime = std::chrono::duration_cast<std::chrono::seconds>(
        meta.modification_time.time_since_epoch()).count();
    if (mtime > 0 && static_cast<uint64_t>(mtime) > detail::octal_field_max(12)) {
        records += format_pax_record("mtime", std::to_string(mtime));
    }

    return records;
}

file_metadata extended_header_for(const file_metadata& meta, const size_t records_size) {
    std::string_view base = meta.path;
    while (base.size() > 1 && base.back() == '/') {
        base.remove_suffix(1);
    }
    if (const auto slash = base.rfind('/'); slash != std::string_view::npos) {
        base = base.substr(slash + 1);
    }

    file_metadata header;
    header.path = fmt::format("PaxHeader/{}", base).substr(0, detail::NAME_SIZE);
    header.type = entry_type::pax_extended_header;
    header.mode = 0644;
    header.size = records_size;
    header.modification_time = meta.modification_time;
    return header;
}

void apply_pax_headers(file_metadata& meta, const std::map<std::string, std::string>& headers) {
    if (auto it = headers.find("path"); it != headers.end()) {
        meta.path = it->second;
    }
    if (auto it = headers.find("linkpath"); it != headers.end()) {
        meta.link_target = it->second;
    }
    if (auto it = headers.find("size"); it != headers.end()) {
        uint64_t value;
        if (parse_decimal(it->second, value)) {
            meta.size = value;
        }
    }
    if (auto it = headers.find("uid"); it != headers.end()) {
        uint64_t value;
        if (parse_decimal(it->second, value)) {
            meta.owner_id = value;
        }
    }
    if (auto it = headers.find("gid"); it != headers.end()) {
        uint64_t value;
        if (parse_decimal(it->second, value)) {
            meta.group_id = value;
        }
    }
    if (auto it = headers.find("mtime"); it != headers.end()) {
        int64_t value;
        if (parse_decimal(it->second, value)) {
            meta.modification_time = std::chrono::system_clock::time_point{std::chrono::seconds{value}};
        }
    }
    if (auto it = headers.find("uname"); it != headers.end()) {
        meta.owner_name = it->second;
    }
    if (auto it = headers.find("gname"); it != headers.end()) {
        meta.group_name = it->second;
    }
}

} // namespace dirserve::pax
