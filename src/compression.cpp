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

#include <dirserve/compression.hpp>
#include <boost/iostreams/filter/bzip2.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filter/lzma.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace dirserve {

namespace io = boost::iostreams;

namespace {

std::string lowercase(std::string_view text) {
    std::string result{text};
    std::ranges::transform(result, result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

constexpr std::array<std::pair<std::string_view, compression>, 14> names{{
    {"", compression::none},
    {"none", compression::none},
    {"tar", compression::none},
    {"gzip", compression::gzip},
    {"gz", compression::gzip},
    {"tgz", compression::gzip},
    {"tar.gz", compression::gzip},
    {"bzip2", compression::bzip2},
    {"bz2", compression::bzip2},
    {"tar.bz2", compression::bzip2},
    {"tbz2", compression::bzip2},
    {"xz", compression::xz},
    {"lzma", compression::xz},
    {"tar.xz", compression::xz},
}};

} // anonymous namespace

std::string_view extension(const compression mode) noexcept {
    switch (mode) {
        case compression::none:  return ".tar";
        case compression::gzip:  return ".tgz";
        case compression::bzip2: return ".tar.bz2";
        case compression::xz:    return ".tar.xz";
    }
    return ".tar";
}

std::string_view to_string(const compression mode) noexcept {
    switch (mode) {
        case compression::none:  return "none";
        case compression::gzip:  return "gzip";
        case compression::bzip2: return "bzip2";
        case compression::xz:    return "xz";
    }
    return "none";
}

auto parse_compression(std::string_view name) -> std::expected<compression, error> {
    const std::string key = lowercase(name);
    const auto it = std::ranges::find(names, std::string_view{key}, &std::pair<std::string_view, compression>::first);
    if (it == names.end()) {
        return std::unexpected(error{error_code::invalid_argument,
            "Unknown compression: '" + std::string{name} + "'"});
    }
    return it->second;
}

auto compression_from_filename(std::string_view filename) -> std::expected<compression, error> {
    const std::string lower = lowercase(filename);
    std::string_view name{lower};

    // Longest suffix first so "x.tar.gz" is not taken for a plain ".gz"
    for (std::string_view suffix : {".tar.gz", ".tar.bz2", ".tar.xz", ".tgz", ".tbz2", ".txz", ".tar"}) {
        if (!name.ends_with(suffix)) {
            continue;
        }
        if (suffix == ".tar") {
            return compression::none;
        }
        if (suffix == ".txz") {
            return compression::xz;
        }
        return parse_compression(suffix.substr(1));
    }

    return std::unexpected(error{error_code::invalid_argument,
        "Not a tar archive filename: '" + std::string{filename} + "'"});
}

void push_compressor(io::filtering_ostream& out, const compression mode, const compression_level level) {
    switch (mode) {
        case compression::none:
            break;
        case compression::gzip:
            out.push(io::gzip_compressor(io::gzip_params(level.value_or(io::gzip::default_compression))));
            break;
        case compression::bzip2:
            out.push(io::bzip2_compressor(io::bzip2_params(level.value_or(io::bzip2::default_block_size))));
            break;
        case compression::xz:
            out.push(io::lzma_compressor(io::lzma_params(
                static_cast<uint32_t>(level.value_or(static_cast<int>(io::lzma::default_compression))))));
            break;
    }
}

void push_decompressor(io::filtering_istream& in, const compression mode) {
    switch (mode) {
        case compression::none:
            break;
        case compression::gzip:
            in.push(io::gzip_decompressor());
            break;
        case compression::bzip2:
            in.push(io::bzip2_decompressor());
            break;
        case compression::xz:
            in.push(io::lzma_decompressor());
            break;
    }
}

} // namespace dirserve
