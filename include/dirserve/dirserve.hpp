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
#include <dirserve/path_guard.hpp>
#include <dirserve/compression.hpp>
#include <dirserve/exclude.hpp>
#include <dirserve/archive_stream.hpp>
#include <dirserve/stream.hpp>
#include <dirserve/archive_reader.hpp>
#include <dirserve/config.hpp>

namespace dirserve {

// Archive stream for the directory at `relative_path` below the configured
// base. Fails with outside_jail for paths escaping the base, and with
// invalid_argument when directory downloads are disabled.
[[nodiscard]] std::expected<std::unique_ptr<directory_archive_stream>, error> open_directory_stream(
    const browse_config& config, std::string_view relative_path);

// Reader over an archive file, decompressed according to its extension
[[nodiscard]] std::expected<archive_reader, error> open_archive(const std::filesystem::path& path);
[[nodiscard]] std::expected<archive_reader, error> open_archive(std::unique_ptr<input_stream> stream);

} // namespace dirserve
