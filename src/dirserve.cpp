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

#include <dirserve/dirserve.hpp>

namespace dirserve {

auto open_directory_stream(const browse_config& config, std::string_view relative_path)
    -> std::expected<std::unique_ptr<directory_archive_stream>, error> {
    if (!config.can_download(true)) {
        return std::unexpected(error{error_code::invalid_argument, "Directory downloads are disabled"});
    }

    auto root = resolve(config.directory_base, relative_path);
    if (!root) {
        return std::unexpected(root.error());
    }

    auto options = config.stream_options();
    if (!options) {
        return std::unexpected(options.error());
    }

    return directory_archive_stream::create(*root, std::move(*options));
}

auto open_archive(const std::filesystem::path &path) -> std::expected<archive_reader, error> {
    auto mode = compression_from_filename(path.filename().string());
    if (!mode) {
        return std::unexpected(mode.error());
    }

    if (*mode == compression::none) {
        auto file = file_stream::open(path);
        if (!file) {
            return std::unexpected(file.error());
        }
        return archive_reader::from_stream(std::make_unique<file_stream>(std::move(*file)));
    }

    auto stream = decompressing_stream::from_file(path, *mode);
    if (!stream) {
        return std::unexpected(stream.error());
    }
    return archive_reader::from_stream(std::make_unique<decompressing_stream>(std::move(*stream)));
}

auto open_archive(std::unique_ptr<input_stream> stream) -> std::expected<archive_reader, error> {
    return archive_reader::from_stream(std::move(stream));
}

} // namespace dirserve
