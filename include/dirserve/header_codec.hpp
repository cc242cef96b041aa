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
#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

namespace dirserve::detail {

constexpr size_t BLOCK_SIZE = 512;
constexpr size_t NAME_SIZE = 100;
constexpr size_t PREFIX_SIZE = 155;

using header_block = std::array<std::byte, BLOCK_SIZE>;

// Parse octal field with proper error handling
template<size_t N>
constexpr std::expected<uint64_t, error> parse_octal(std::span<const char, N> field) {
    uint64_t result = 0;
    bool found_digit = false;

    for (char c : field) {
        if (c == '\0' || c == ' ') {
            if (!found_digit) continue;
            break;
        }
        if (c < '0' || c > '7') {
            return std::unexpected(error{error_code::invalid_header, "Invalid octal digit"});
        }
        found_digit = true;

        if (result > (UINT64_MAX >> 3)) {
            return std::unexpected(error{error_code::invalid_header, "Octal value overflow"});
        }

        result = (result << 3) | static_cast<uint64_t>(c - '0');
    }

    return found_digit ? result : 0;
}

// Largest value an octal field of `width` bytes can hold (width - 1 digits + NUL)
[[nodiscard]] constexpr uint64_t octal_field_max(const size_t width) noexcept {
    const size_t digits = width - 1;
    return digits >= 21 ? UINT64_MAX : (uint64_t{1} << (3 * digits)) - 1;
}

// Zero-padded octal digits followed by NUL. Returns false if the value does not fit.
[[nodiscard]] bool format_octal(std::span<char> field, uint64_t value);

// Bytes needed to pad `size` up to the next block boundary
[[nodiscard]] constexpr size_t padding_for(const uint64_t size) noexcept {
    return static_cast<size_t>((BLOCK_SIZE - (size % BLOCK_SIZE)) % BLOCK_SIZE);
}

// Calculate checksum, treating the checksum field as eight spaces
[[nodiscard]] uint32_t calculate_checksum(std::span<const std::byte, BLOCK_SIZE> block);

// Split a member path into ustar (prefix, name); nullopt when it cannot be represented
[[nodiscard]] std::optional<std::pair<std::string_view, std::string_view>>
split_ustar_path(std::string_view path);

// True when every field of `meta` fits a plain ustar header
[[nodiscard]] bool fits_ustar(const file_metadata& meta);

// Serialize a header block. Fields that do not fit are truncated or zeroed;
// callers emit a PAX record beforehand for those.
[[nodiscard]] header_block encode_header(const file_metadata& meta);

// Parse a complete tar header block
[[nodiscard]] std::expected<file_metadata, error> parse_header(std::span<const std::byte, BLOCK_SIZE> block);

// Check if block is all zeros (end-of-archive marker)
[[nodiscard]] bool is_zero_block(std::span<const std::byte, BLOCK_SIZE> block);

// Helper to safely extract null-terminated string from a fixed-size field
[[nodiscard]] std::string_view extract_string(std::span<const char> field);

} // namespace dirserve::detail
