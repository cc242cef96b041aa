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

#include <dirserve/config.hpp>
#include <dirserve/path_guard.hpp>
#include <charconv>
#include <fmt/format.h>

namespace dirserve {

namespace {

template<typename T>
std::expected<T, error> parse_number(std::string_view option, std::string_view text) {
    T value{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::unexpected(error{error_code::invalid_argument,
            fmt::format("Invalid value for {}: '{}'", option, text)});
    }
    return value;
}

std::expected<std::filesystem::path, error> existing_directory(std::string_view option, std::string_view text) {
    std::error_code ec;
    auto path = std::filesystem::absolute(std::filesystem::path{text}, ec).lexically_normal();
    if (ec || !std::filesystem::is_directory(path, ec)) {
        return std::unexpected(error{error_code::invalid_argument,
            fmt::format("{}: '{}' is not a valid directory", option, text)});
    }
    return path;
}

std::expected<std::filesystem::path, error> existing_file(std::string_view option, std::string_view text) {
    std::error_code ec;
    auto path = std::filesystem::absolute(std::filesystem::path{text}, ec).lexically_normal();
    if (ec || !std::filesystem::is_regular_file(path, ec)) {
        return std::unexpected(error{error_code::invalid_argument,
            fmt::format("{}: '{}' is not a valid file", option, text)});
    }
    return path;
}

} // anonymous namespace

auto browse_config::validate() const -> std::expected<void, error> {
    if (directory_base.empty() || !directory_base.is_absolute()) {
        return std::unexpected(error{error_code::invalid_argument,
            "Base directory must be an absolute path"});
    }
    if (!directory_start.empty() && !is_within(directory_base, directory_start)) {
        return std::unexpected(error{error_code::invalid_argument,
            "Initial directory must be inside the base directory"});
    }
    if (directory_remove && !is_within(directory_base, *directory_remove)) {
        return std::unexpected(error{error_code::invalid_argument,
            "Removable directory must be inside the base directory"});
    }
    if (directory_upload && !is_within(directory_base, *directory_upload)) {
        return std::unexpected(error{error_code::invalid_argument,
            "Upload directory must be inside the base directory"});
    }
    if (directory_tar_buffsize == 0) {
        return std::unexpected(error{error_code::invalid_argument, "Buffer size must be positive"});
    }
    if (directory_tar_compresslevel &&
        (*directory_tar_compresslevel < 1 || *directory_tar_compresslevel > 9)) {
        return std::unexpected(error{error_code::invalid_argument,
            fmt::format("Compression level {} is out of range 1-9", *directory_tar_compresslevel)});
    }
    return {};
}

bool browse_config::can_download(const bool is_directory) const noexcept {
    return directory_downloadable || !is_directory;
}

bool browse_config::can_remove(const std::filesystem::path& path) const {
    return directory_remove && is_strictly_within(*directory_remove, path);
}

bool browse_config::can_upload(const std::filesystem::path& path) const {
    return directory_upload && is_within(*directory_upload, path);
}

auto browse_config::make_exclude() const -> std::expected<exclude_fn, error> {
    auto patterns = glob::make_exclude(exclude_patterns, directory_base);
    if (!patterns) {
        return std::unexpected(patterns.error());
    }
    return exclude_union({std::move(*patterns), exclude});
}

auto browse_config::stream_options() const -> std::expected<dirserve::archive_options, error> {
    auto predicate = make_exclude();
    if (!predicate) {
        return std::unexpected(predicate.error());
    }

    dirserve::archive_options options;
    options.buffer_size = directory_tar_buffsize;
    options.mode = directory_tar_compression;
    // Plain tar has no level
    options.level = directory_tar_compression == compression::none ? std::nullopt : directory_tar_compresslevel;
    options.exclude = std::move(*predicate);
    return options;
}

auto parse_arguments(std::span<const std::string> args, std::vector<std::string>* positional)
    -> std::expected<browse_config, error> {
    browse_config config;
    std::optional<std::filesystem::path> initial;
    std::vector<std::filesystem::path> pattern_files;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string_view arg = args[i];

        if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
            continue;
        }

        if (!arg.starts_with("--")) {
            if (!positional) {
                return std::unexpected(error{error_code::invalid_argument,
                    fmt::format("Unexpected argument '{}'", arg)});
            }
            positional->emplace_back(arg);
            continue;
        }

        // --option=value or --option value
        std::string_view option = arg;
        std::string_view value;
        if (const auto eq = arg.find('='); eq != std::string_view::npos) {
            option = arg.substr(0, eq);
            value = arg.substr(eq + 1);
        } else if (i + 1 < args.size()) {
            value = args[++i];
        } else {
            return std::unexpected(error{error_code::invalid_argument,
                fmt::format("Missing value for {}", option)});
        }

        if (option == "--directory") {
            auto path = existing_directory(option, value);
            if (!path) {
                return std::unexpected(path.error());
            }
            config.directory_base = std::move(*path);
        } else if (option == "--initial") {
            if (value.empty()) {
                initial.reset();
                continue;
            }
            auto path = existing_directory(option, value);
            if (!path) {
                return std::unexpected(path.error());
            }
            initial = std::move(*path);
        } else if (option == "--removable") {
            auto path = existing_directory(option, value);
            if (!path) {
                return std::unexpected(path.error());
            }
            config.directory_remove = std::move(*path);
        } else if (option == "--upload") {
            auto path = existing_directory(option, value);
            if (!path) {
                return std::unexpected(path.error());
            }
            config.directory_upload = std::move(*path);
        } else if (option == "--exclude") {
            config.exclude_patterns.emplace_back(value);
        } else if (option == "--exclude-from") {
            auto path = existing_file(option, value);
            if (!path) {
                return std::unexpected(path.error());
            }
            pattern_files.push_back(std::move(*path));
        } else if (option == "--buffer-size") {
            auto size = parse_number<size_t>(option, value);
            if (!size) {
                return std::unexpected(size.error());
            }
            config.directory_tar_buffsize = *size;
        } else if (option == "--compression") {
            auto mode = parse_compression(value);
            if (!mode) {
                return std::unexpected(mode.error());
            }
            config.directory_tar_compression = *mode;
        } else if (option == "--compress-level") {
            auto level = parse_number<int>(option, value);
            if (!level) {
                return std::unexpected(level.error());
            }
            config.directory_tar_compresslevel = *level;
        } else {
            return std::unexpected(error{error_code::invalid_argument,
                fmt::format("Unknown option '{}'", option)});
        }
    }

    if (config.directory_base.empty()) {
        std::error_code ec;
        config.directory_base = std::filesystem::current_path(ec);
        if (ec) {
            return std::unexpected(make_filesystem_error("Cannot determine", "current directory", ec));
        }
    }
    config.directory_start = initial.value_or(config.directory_base);

    auto patterns = glob::collect_patterns(pattern_files);
    if (!patterns) {
        return std::unexpected(patterns.error());
    }
    config.exclude_patterns.insert(config.exclude_patterns.end(), patterns->begin(), patterns->end());

    if (auto valid = config.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

std::string_view usage() noexcept {
    return "Options:\n"
           "  --directory PATH       serving directory (default: current directory)\n"
           "  --initial PATH         default directory (default: same as --directory)\n"
           "  --removable PATH       base directory allowing remove\n"
           "  --upload PATH          base directory allowing upload\n"
           "  --exclude PATTERN      exclude paths by pattern (multiple)\n"
           "  --exclude-from PATH    exclude paths by pattern file (multiple)\n"
           "  --buffer-size N        archive chunk size in bytes (default: 262144)\n"
           "  --compression NAME     none, gzip, bzip2 or xz (default: gzip)\n"
           "  --compress-level N     1 (fastest) to 9 (smallest) (default: 1)\n"
           "  --verbose, -v          debug logging\n";
}

} // namespace dirserve
