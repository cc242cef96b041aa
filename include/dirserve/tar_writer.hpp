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
#include <dirserve/exclude.hpp>
#include <dirserve/metadata.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <ostream>
#include <span>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

namespace dirserve {

struct archive_statistics {
    size_t entries = 0;           // Members written, extension headers excluded
    uint64_t payload_bytes = 0;   // File contents
    uint64_t archive_bytes = 0;   // Everything written, headers and padding included
};

// Push-based ustar writer. Entries are appended to `out` in 512-byte blocks;
// finish() must be called to terminate the archive.
class tar_writer {
public:
    explicit tar_writer(std::ostream& out);

    tar_writer(const tar_writer&) = delete;
    tar_writer& operator=(const tar_writer&) = delete;

    // Archive everything below `root` (not `root` itself), member names
    // relative to it. Entries for which `exclude` returns true are skipped,
    // directories with all their descendants.
    [[nodiscard]] std::expected<void, error> add_tree(
        const std::filesystem::path& root,
        const exclude_fn& exclude = {},
        std::stop_token stop = {});

    // Header (preceded by a PAX record if needed) for one member. Regular
    // file payload must follow through write_payload().
    [[nodiscard]] std::expected<void, error> add_entry(const file_metadata& meta);

    // Payload bytes of the current regular file
    [[nodiscard]] std::expected<void, error> write_payload(std::span<const std::byte> data);

    // Zero padding up to the block boundary after `size` payload bytes
    [[nodiscard]] std::expected<void, error> pad(uint64_t size);

    // End-of-archive marker (two zero blocks), then flush
    [[nodiscard]] std::expected<void, error> finish();

    [[nodiscard]] const archive_statistics& statistics() const noexcept { return stats_; }
    [[nodiscard]] bool finished() const noexcept { return finished_; }

private:
    std::ostream& out_;
    archive_statistics stats_;
    bool finished_ = false;
    std::vector<std::byte> chunk_;

    // First member name seen for each (device, inode) with more than one link
    std::map<std::pair<uint64_t, uint64_t>, std::string> hard_links_;
    std::map<uint64_t, std::string> user_names_;
    std::map<uint64_t, std::string> group_names_;

    [[nodiscard]] std::expected<void, error> write_raw(std::span<const std::byte> data);

    [[nodiscard]] std::expected<void, error> add_directory(
        const std::filesystem::path& directory,
        const std::string& prefix,
        const exclude_fn& exclude,
        const std::stop_token& stop);

    [[nodiscard]] std::expected<void, error> add_path(
        const std::filesystem::path& path,
        const std::string& name,
        const exclude_fn& exclude,
        const std::stop_token& stop);

    [[nodiscard]] std::expected<void, error> add_file_contents(
        const std::filesystem::path& path,
        uint64_t size,
        const std::stop_token& stop);

    [[nodiscard]] const std::string& user_name(uint64_t uid);
    [[nodiscard]] const std::string& group_name(uint64_t gid);
};

} // namespace dirserve
