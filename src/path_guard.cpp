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

#include <dirserve/path_guard.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <fmt/format.h>
#include <random>
#include <spdlog/spdlog.h>

namespace dirserve {

namespace {

constexpr std::string_view fs_safe_characters = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

constexpr std::array<std::string_view, 4> restricted_names{"", ".", "..", "::"};

constexpr std::array<std::string_view, 22> windows_device_names{
    "CON", "PRN", "AUX", "NUL",
    "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
    "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"
};

// Lexically normalised text of `path` without trailing separators ("/" stays "/")
std::string normalized_text(const std::filesystem::path& path) {
    std::string text = path.lexically_normal().generic_string();
    while (text.size() > 1 && text.back() == '/') {
        text.pop_back();
    }
    return text;
}

std::expected<std::string, error> normalized_jail(const std::filesystem::path& jail_root) {
    if (jail_root.empty() || !jail_root.is_absolute()) {
        return std::unexpected(error{error_code::invalid_argument,
            "Jail root must be an absolute path: '" + jail_root.string() + "'"});
    }
    return normalized_text(jail_root);
}

// Length of the jail prefix to drop, separator included, when `candidate`
// lies strictly below `jail`; nullopt otherwise
std::optional<size_t> child_offset(const std::string& jail, const std::string& candidate) {
    if (jail == "/") {
        return candidate.size() > 1 && candidate.front() == '/' ? std::optional<size_t>{1} : std::nullopt;
    }
    if (candidate.size() > jail.size() + 1 &&
        candidate.compare(0, jail.size(), jail) == 0 &&
        candidate[jail.size()] == '/') {
        return jail.size() + 1;
    }
    return std::nullopt;
}

bool contains(const std::string& jail, const std::string& candidate) {
    return candidate == jail || child_offset(jail, candidate).has_value();
}

error outside_jail(const std::string& jail, std::string_view path) {
    spdlog::debug("Rejected '{}': outside of '{}'", path, jail);
    return error{error_code::outside_jail, fmt::format("Path '{}' is outside of the jail", path)};
}

// Decode one UTF-8 sequence at `pos`; nullopt for an invalid sequence
std::optional<std::pair<uint32_t, size_t>> decode_utf8(std::string_view text, const size_t pos) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    if (lead < 0x80) {
        return std::pair{uint32_t{lead}, size_t{1}};
    }

    size_t length = 0;
    uint32_t code_point = 0;
    uint32_t minimum = 0;
    if ((lead & 0xE0) == 0xC0) {
        length = 2;
        code_point = lead & 0x1F;
        minimum = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        code_point = lead & 0x0F;
        minimum = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        code_point = lead & 0x07;
        minimum = 0x10000;
    } else {
        return std::nullopt;
    }

    if (pos + length > text.size()) {
        return std::nullopt;
    }
    for (size_t i = 1; i < length; ++i) {
        const auto next = static_cast<unsigned char>(text[pos + i]);
        if ((next & 0xC0) != 0x80) {
            return std::nullopt;
        }
        code_point = (code_point << 6) | (next & 0x3F);
    }

    if (code_point < minimum || code_point > 0x10FFFF || (code_point >= 0xD800 && code_point <= 0xDFFF)) {
        return std::nullopt;
    }
    return std::pair{code_point, length};
}

// Replace every character outside the charset, and every invalid byte, by one '_'
std::string restrict_charset(std::string_view text, const filename_charset charset) {
    const uint32_t limit = charset == filename_charset::ascii ? 0x7F : 0xFF;

    std::string result;
    result.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        const auto decoded = decode_utf8(text, pos);
        if (!decoded) {
            result += '_';
            ++pos;
            continue;
        }
        const auto [code_point, length] = *decoded;
        if (code_point > limit) {
            result += '_';
        } else {
            result.append(text.substr(pos, length));
        }
        pos += length;
    }
    return result;
}

bool is_windows_device(std::string_view name) {
    std::string stem{name.substr(0, name.find('.'))};
    std::ranges::transform(stem, stem.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return std::ranges::find(windows_device_names, stem) != windows_device_names.end();
}

} // anonymous namespace

auto resolve(const std::filesystem::path& jail_root,
             std::string_view relative_path,
             const symlink_policy policy) -> std::expected<std::filesystem::path, error> {
    auto jail = normalized_jail(jail_root);
    if (!jail) {
        return std::unexpected(jail.error());
    }

    while (!relative_path.empty() && relative_path.front() == '/') {
        relative_path.remove_prefix(1);
    }

    const std::filesystem::path relative{std::string{relative_path}, std::filesystem::path::generic_format};
    const std::string candidate = normalized_text(std::filesystem::path{*jail} / relative);
    if (!contains(*jail, candidate)) {
        return std::unexpected(outside_jail(*jail, relative_path));
    }

    if (policy == symlink_policy::resolve) {
        std::error_code ec;
        const auto real_jail = std::filesystem::weakly_canonical(*jail, ec);
        if (ec) {
            return std::unexpected(make_filesystem_error("Cannot resolve", *jail, ec));
        }
        const auto real_candidate = std::filesystem::weakly_canonical(candidate, ec);
        if (ec) {
            return std::unexpected(make_filesystem_error("Cannot resolve", candidate, ec));
        }
        if (!contains(normalized_text(real_jail), normalized_text(real_candidate))) {
            return std::unexpected(outside_jail(*jail, relative_path));
        }
    }

    return std::filesystem::path{candidate};
}

auto relativize(const std::filesystem::path& jail_root,
                const std::filesystem::path& absolute_path) -> std::expected<std::string, error> {
    auto jail = normalized_jail(jail_root);
    if (!jail) {
        return std::unexpected(jail.error());
    }

    const std::string candidate = normalized_text(absolute_path);
    if (candidate == *jail) {
        return std::string{};
    }
    if (const auto offset = child_offset(*jail, candidate)) {
        return candidate.substr(*offset);
    }
    return std::unexpected(outside_jail(*jail, candidate));
}

std::string sanitize_filename(std::string_view raw, const target_os os, const filename_charset charset) {
    if (const auto last = raw.find_last_of("/\\"); last != std::string_view::npos) {
        raw.remove_prefix(last + 1);
    }

    std::string name{raw};
    std::ranges::replace_if(name, [](char c) { return c == '/' || c == '\\' || c == '\0'; }, '_');

    if (std::ranges::find(restricted_names, name) != restricted_names.end()) {
        return {};
    }
    if (os == target_os::windows && is_windows_device(name)) {
        return {};
    }

    if (charset != filename_charset::unicode) {
        name = restrict_charset(name, charset);
    }
    return name;
}

std::string alternative_filename(std::string_view name, const std::optional<size_t> attempt) {
    // Keep at most two trailing extensions
    size_t split = name.size();
    for (int i = 0; i < 2; ++i) {
        const size_t dot = split == 0 ? std::string_view::npos : name.rfind('.', split - 1);
        if (dot == std::string_view::npos) {
            break;
        }
        split = dot;
    }

    std::string extra;
    if (attempt) {
        extra = fmt::format(" ({})", *attempt);
    } else {
        thread_local std::mt19937 generator{std::random_device{}()};
        std::uniform_int_distribution<size_t> pick{0, fs_safe_characters.size() - 1};
        extra = " ";
        for (int i = 0; i < 8; ++i) {
            extra += fs_safe_characters[pick(generator)];
        }
    }

    return fmt::format("{}{}{}", name.substr(0, split), extra, name.substr(split));
}

std::string choose_non_colliding_name(const exists_fn& exists,
                                      const std::string& desired,
                                      const size_t max_attempts) {
    if (!exists(desired)) {
        return desired;
    }

    for (size_t attempt = 2; attempt <= max_attempts; ++attempt) {
        if (auto candidate = alternative_filename(desired, attempt); !exists(candidate)) {
            return candidate;
        }
    }

    while (true) {
        if (auto candidate = alternative_filename(desired); !exists(candidate)) {
            return candidate;
        }
    }
}

std::string choose_non_colliding_name(const std::filesystem::path& directory,
                                      const std::string& desired,
                                      const size_t max_attempts) {
    return choose_non_colliding_name(
        [&directory](const std::string& name) {
            std::error_code ec;
            return std::filesystem::symlink_status(directory / name, ec).type() !=
                   std::filesystem::file_type::not_found;
        },
        desired, max_attempts);
}

bool is_within(const std::filesystem::path& base, const std::filesystem::path& path) {
    return contains(normalized_text(base), normalized_text(path));
}

bool is_strictly_within(const std::filesystem::path& base, const std::filesystem::path& path) {
    return child_offset(normalized_text(base), normalized_text(path)).has_value();
}

} // namespace dirserve
