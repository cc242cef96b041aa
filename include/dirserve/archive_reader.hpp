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
#include <dirserve/header_codec.hpp>
#include <dirserve/metadata.hpp>
#include <dirserve/stream.hpp>
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dirserve {

// Sequential reader for the archives produced by directory_archive_stream,
// used to list and verify them.
class archive_reader {
private:
    std::unique_ptr<input_stream> stream_;
    std::optional<file_metadata> current_entry_;
    uint64_t current_entry_data_remaining_ = 0;  // Payload not yet consumed
    size_t current_entry_padding_ = 0;           // Padding after the payload
    bool finished_ = false;
    std::map<std::string, std::string> pending_pax_headers_;
    std::optional<std::string> pending_longname_;
    std::optional<std::string> pending_longlink_;

    // Read exactly one 512-byte block
    [[nodiscard]] std::expected<detail::header_block, error> read_block();

    // Read `size` payload bytes followed by their padding
    [[nodiscard]] std::expected<std::vector<std::byte>, error> read_payload(uint64_t size);

    // Skip what is left of the current entry, including its padding
    [[nodiscard]] std::expected<void, error> skip_current_entry_data();

public:
    explicit archive_reader(std::unique_ptr<input_stream> stream)
        : stream_(std::move(stream)) {}

    [[nodiscard]] static std::expected<archive_reader, error> from_stream(std::unique_ptr<input_stream> stream);

    // Next member, or nullopt at the end-of-archive marker
    [[nodiscard]] std::expected<std::optional<file_metadata>, error> next_entry();

    // Remaining payload of the member returned by the last next_entry()
    [[nodiscard]] std::expected<std::vector<std::byte>, error> read_data();

    [[nodiscard]] bool finished() const noexcept { return finished_; }
};

struct archive_member {
    file_metadata metadata;
    std::vector<std::byte> data;
};

// Read every member and its payload
[[nodiscard]] std::expected<std::vector<archive_member>, error> read_archive(std::unique_ptr<input_stream> stream);

} // namespace dirserve
