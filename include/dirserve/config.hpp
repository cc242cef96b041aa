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

#include <dirserve/archive_stream.hpp>
#include <dirserve/compression.hpp>
#include <dirserve/error.hpp>
#include <dirserve/exclude.hpp>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dirserve {

// Settings of one served directory tree, passed explicitly to whatever
// handles requests.
struct browse_config {
    std::filesystem::path directory_base;                    // Jail root
    std::filesystem::path directory_start;                   // Initial directory, defaults to the base
    std::optional<std::filesystem::path> directory_remove;   // Deletion allowed below this
    std::optional<std::filesystem::path> directory_upload;   // Uploads allowed at or below this
    bool directory_downloadable = true;
    size_t directory_tar_buffsize = 262144;
    compression directory_tar_compression = compression::gzip;
    compression_level directory_tar_compresslevel = 1;
    std::vector<std::string> exclude_patterns;
    exclude_fn exclude;                                      // Extra predicate, or-ed with the patterns
    bool verbose = false;

    [[nodiscard]] std::expected<void, error> validate() const;

    [[nodiscard]] bool can_download(bool is_directory) const noexcept;
    [[nodiscard]] bool can_remove(const std::filesystem::path& path) const;
    [[nodiscard]] bool can_upload(const std::filesystem::path& path) const;

    // Predicate hiding entries matched by exclude_patterns or exclude
    [[nodiscard]] std::expected<exclude_fn, error> make_exclude() const;

    // Options for streaming a directory with these settings
    [[nodiscard]] std::expected<dirserve::archive_options, error> stream_options() const;
};

// Build a config from command line arguments (program name excluded).
// Positional arguments are appended to `positional` when given, and
// rejected otherwise.
[[nodiscard]] std::expected<browse_config, error> parse_arguments(
    std::span<const std::string> args,
    std::vector<std::string>* positional = nullptr);

[[nodiscard]] std::string_view usage() noexcept;

} // namespace dirserve
