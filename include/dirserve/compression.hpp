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
#include <boost/iostreams/filtering_stream.hpp>
#include <expected>
#include <optional>
#include <string_view>

namespace dirserve {

enum class compression {
    none,
    gzip,
    bzip2,
    xz
};

// Compression levels are 1 (fastest) to 9 (smallest); nullopt keeps the codec default
using compression_level = std::optional<int>;

// Suggested archive filename extension, including the leading dot
[[nodiscard]] std::string_view extension(compression mode) noexcept;

[[nodiscard]] std::string_view to_string(compression mode) noexcept;

// Accepts codec names ("gzip", "bz2", ...) and extensions ("tgz", "tar.xz", ...)
[[nodiscard]] std::expected<compression, error> parse_compression(std::string_view name);

// Detect the compression of an archive from its filename extension
[[nodiscard]] std::expected<compression, error> compression_from_filename(std::string_view filename);

[[nodiscard]] constexpr std::string_view content_type() noexcept {
    return "application/octet-stream";
}

// Push the compressing filter for `mode` (nothing for compression::none)
void push_compressor(boost::iostreams::filtering_ostream& out, compression mode,
                     compression_level level = std::nullopt);

// Push the decompressing filter for `mode` (nothing for compression::none)
void push_decompressor(boost::iostreams::filtering_istream& in, compression mode);

} // namespace dirserve
