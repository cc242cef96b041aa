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

#include <dirserve/header_codec.hpp>
#include <algorithm>
#include <bit>
#include <cstring>
#include <ctime>
#include <ranges>
#include <fmt/format.h>

namespace dirserve::detail {

namespace {

void copy_string(std::span<char> field, std::string_view value) {
    const size_t n = std::min(field.size(), value.size());
    std::ranges::copy(value.substr(0, n), field.begin());
}

uint64_t to_unix_seconds(const std::chrono::system_clock::time_point tp) {
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    return seconds < 0 ? 0 : static_cast<uint64_t>(seconds);
}

} // anonymous namespace

bool format_octal(std::span<char> field, uint64_t value) {
    if (field.empty() || value > octal_field_max(field.size())) {
        return false;
    }

    const size_t digits = field.size() - 1;
    field[digits] = '\0';
    for (size_t i = digits; i > 0; --i) {
        field[i - 1] = static_cast<char>('0' + (value & 07));
        value >>= 3;
    }
    return true;
}

uint32_t calculate_checksum(std::span<const std::byte, BLOCK_SIZE> block) {
    uint32_t sum = 0;

    // Create a copy to zero out the checksum field
    std::array<std::byte, BLOCK_SIZE> temp_block{};
    std::ranges::copy(block, temp_block.begin());

    // Zero out checksum field (bytes 148-155) and fill with spaces
    auto* header = std::bit_cast<ustar_header*>(temp_block.data());
    std::ranges::fill(std::span{header->checksum}, ' ');

    for (auto byte : temp_block) {
        sum += static_cast<uint8_t>(byte);
    }

    return sum;
}

auto split_ustar_path(std::string_view path)
    -> std::optional<std::pair<std::string_view, std::string_view>> {
    if (path.size() <= NAME_SIZE) {
        return std::pair{std::string_view{}, path};
    }

    // Rightmost separator that keeps the prefix within 155 bytes
    const size_t limit = std::min(path.size() - 1, PREFIX_SIZE);
    for (size_t pos = limit + 1; pos-- > 0;) {
        if (path[pos] != '/') {
            continue;
        }
        const auto prefix = path.substr(0, pos);
        const auto name = path.substr(pos + 1);
        if (prefix.empty() || name.empty() || name.size() > NAME_SIZE) {
            return std::nullopt;
        }
        return std::pair{prefix, name};
    }
    return std::nullopt;
}

bool fits_ustar(const file_metadata& meta) {
    if (!split_ustar_path(meta.path)) {
        return false;
    }
    if (meta.link_target && meta.link_target->size() > NAME_SIZE) {
        return false;
    }
    return meta.size <= octal_field_max(12) &&
           meta.owner_id <= octal_field_max(8) &&
           meta.group_id <= octal_field_max(8) &&
           to_unix_seconds(meta.modification_time) <= octal_field_max(12);
}

header_block encode_header(const file_metadata& meta) {
    header_block block{};
    auto* header = std::bit_cast<ustar_header*>(block.data());

    if (const auto split = split_ustar_path(meta.path)) {
        copy_string(header->prefix, split->first);
        copy_string(header->name, split->second);
    } else {
        copy_string(header->name, meta.path);
    }

    (void)format_octal(header->mode, meta.mode & 07777);
    if (!format_octal(header->uid, meta.owner_id)) {
        (void)format_octal(header->uid, 0);
    }
    if (!format_octal(header->gid, meta.group_id)) {
        (void)format_octal(header->gid, 0);
    }

    const uint64_t size = meta.has_payload() ? meta.size : 0;
    if (!format_octal(header->size, size)) {
        (void)format_octal(header->size, 0);
    }
    if (!format_octal(header->mtime, to_unix_seconds(meta.modification_time))) {
        (void)format_octal(header->mtime, 0);
    }

    header->typeflag = std::to_underlying(meta.type);
    if (meta.link_target) {
        copy_string(header->linkname, *meta.link_target);
    }

    std::memcpy(header->magic, "ustar", 6);
    std::memcpy(header->version, "00", 2);
    copy_string(header->uname, meta.owner_name);
    copy_string(header->gname, meta.group_name);

    if (meta.is_device()) {
        (void)format_octal(header->devmajor, meta.device_major);
        (void)format_octal(header->devminor, meta.device_minor);
    }

    // Six octal digits, NUL, space
    const uint32_t checksum = calculate_checksum(block);
    (void)format_octal(std::span{header->checksum, 7}, checksum);
    header->checksum[7] = ' ';

    return block;
}

std::string_view extract_string(std::span<const char> field) {
    const auto null_pos = std::ranges::find(field, '\0');
    const size_t length = null_pos != field.end() ?
        static_cast<size_t>(std::distance(field.begin(), null_pos)) :
        field.size();
    return std::string_view{field.data(), length};
}

bool is_zero_block(std::span<const std::byte, BLOCK_SIZE> block) {
    return std::ranges::all_of(block, [](auto b) { return b == std::byte{0}; });
}

auto parse_header(std::span<const std::byte, BLOCK_SIZE> block) -> std::expected<file_metadata, error> {
    const auto* header = std::bit_cast<const ustar_header*>(block.data());

    // POSIX ustar ("ustar\0") or GNU tar ("ustar  \0")
    std::string_view magic = extract_string(std::span{header->magic, 6});
    if (magic != "ustar" && magic != "ustar ") {
        return std::unexpected(error{error_code::invalid_header,
            "Not a POSIX ustar or GNU tar archive (magic: '" + std::string{magic} + "')"});
    }

    auto stored_checksum = parse_octal(std::span{header->checksum});
    if (!stored_checksum) {
        return std::unexpected(stored_checksum.error());
    }

    if (calculate_checksum(block) != *stored_checksum) {
        return std::unexpected(error{error_code::corrupt_archive, "Header checksum mismatch"});
    }

    auto mode = parse_octal(std::span{header->mode});
    auto uid = parse_octal(std::span{header->uid});
    auto gid = parse_octal(std::span{header->gid});
    auto size = parse_octal(std::span{header->size});
    auto mtime = parse_octal(std::span{header->mtime});

    if (!mode || !uid || !gid || !size || !mtime) {
        return std::unexpected(error{error_code::invalid_header, "Failed to parse numeric fields"});
    }

    file_metadata meta;

    std::string_view prefix = extract_string(std::span{header->prefix});
    std::string_view name = extract_string(std::span{header->name});
    meta.path = prefix.empty() ? std::string{name} : fmt::format("{}/{}", prefix, name);

    if (meta.path.empty()) {
        return std::unexpected(error{error_code::invalid_header, "Empty file path"});
    }

    meta.type = static_cast<entry_type>(header->typeflag);
    meta.mode = static_cast<uint32_t>(*mode & 07777);
    meta.owner_id = *uid;
    meta.group_id = *gid;
    meta.size = *size;
    meta.modification_time = std::chrono::system_clock::from_time_t(static_cast<std::time_t>(*mtime));
    meta.owner_name = std::string{extract_string(std::span{header->uname})};
    meta.group_name = std::string{extract_string(std::span{header->gname})};

    if (meta.is_device()) {
        auto major = parse_octal(std::span{header->devmajor});
        auto minor = parse_octal(std::span{header->devminor});
        if (major) {
            meta.device_major = static_cast<uint32_t>(*major);
        }
        if (minor) {
            meta.device_minor = static_cast<uint32_t>(*minor);
        }
    }

    if (meta.is_symbolic_link() || meta.is_hard_link()) {
        std::string_view linkname = extract_string(std::span{header->linkname});
        if (!linkname.empty()) {
            meta.link_target = std::string{linkname};
        }
    }

    switch (meta.type) {
        case entry_type::regular_file:
        case entry_type::regular_file_old:
        case entry_type::hard_link:
        case entry_type::symbolic_link:
        case entry_type::character_device:
        case entry_type::block_device:
        case entry_type::directory:
        case entry_type::fifo:
        case entry_type::contiguous_file:
        case entry_type::pax_extended_header:
        case entry_type::pax_global_header:
        case entry_type::gnu_longname:
        case entry_type::gnu_longlink:
            break;
        default:
            return std::unexpected(error{error_code::unsupported_feature,
                fmt::format("Unsupported entry type: {}", static_cast<int>(header->typeflag))});
    }

    return meta;
}

} // namespace dirserve::detail
