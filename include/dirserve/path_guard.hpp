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
#include <cstddef>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace dirserve {

// Filesystem family the sanitized name must be valid on
enum class target_os {
    posix,
    windows,
#if defined(_WIN32)
    host = windows
#else
    host = posix
#endif
};

// Character repertoire of the target filesystem
enum class filename_charset {
    unicode,   // UTF-8, anything goes
    latin1,    // Code points up to U+00FF
    ascii      // Code points up to U+007F
};

enum class symlink_policy {
    lexical,   // No filesystem access
    resolve    // Follow existing symlinks before the containment check
};

// Join `relative_path` ('/'-separated, leading '/' ignored) to `jail_root`
// and normalise it. Fails with outside_jail when the result is neither the
// jail itself nor below it, and with invalid_argument for a relative or
// empty jail.
[[nodiscard]] std::expected<std::filesystem::path, error> resolve(
    const std::filesystem::path& jail_root,
    std::string_view relative_path,
    symlink_policy policy = symlink_policy::lexical);

// Inverse of resolve(): '/'-separated path of `absolute_path` below the
// jail, "" for the jail itself.
[[nodiscard]] std::expected<std::string, error> relativize(
    const std::filesystem::path& jail_root,
    const std::filesystem::path& absolute_path);

// Last path component of `raw`, safe to create inside a directory.
// Returns "" when the name must be rejected altogether.
[[nodiscard]] std::string sanitize_filename(
    std::string_view raw,
    target_os os = target_os::host,
    filename_charset charset = filename_charset::unicode);

// "name (N).ext" for a numbered attempt, or a random suffix without one.
// Up to two trailing extensions are kept: "a.tar.gz" -> "a (2).tar.gz".
[[nodiscard]] std::string alternative_filename(std::string_view name, std::optional<size_t> attempt = std::nullopt);

using exists_fn = std::function<bool(const std::string&)>;

// `desired` when free, else the first free numbered alternative up to
// `max_attempts`, else random alternatives until one is free.
[[nodiscard]] std::string choose_non_colliding_name(
    const exists_fn& exists,
    const std::string& desired,
    size_t max_attempts = 999);

// Same, probing entries of `directory` on disk
[[nodiscard]] std::string choose_non_colliding_name(
    const std::filesystem::path& directory,
    const std::string& desired,
    size_t max_attempts = 999);

// `path` equals `base` or lies below it (lexical)
[[nodiscard]] bool is_within(const std::filesystem::path& base, const std::filesystem::path& path);

// `path` lies below `base`, excluding `base` itself (lexical)
[[nodiscard]] bool is_strictly_within(const std::filesystem::path& base, const std::filesystem::path& path);

} // namespace dirserve
