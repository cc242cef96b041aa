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

#include <dirserve/bounded_buffer.hpp>
#include <dirserve/compression.hpp>
#include <dirserve/error.hpp>
#include <dirserve/exclude.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace dirserve {

struct archive_options {
    size_t buffer_size = 10240;                  // Chunk threshold and buffer capacity, in bytes
    compression mode = compression::gzip;
    compression_level level = std::nullopt;
    exclude_fn exclude;                          // Receives absolute paths
};

enum class stream_state {
    idle,       // Worker not started
    running,    // Worker walking the tree
    draining,   // Archive complete, buffered bytes remain
    finished,   // Everything delivered
    aborted     // Worker failed or the consumer closed the stream
};

[[nodiscard]] std::string_view to_string(stream_state state) noexcept;

// Pull-based tar stream of a directory tree.
//
// A worker thread walks the tree and writes the (optionally compressed)
// archive into a bounded buffer; pull() hands out what accumulated. The
// stream is owned by one consumer and must not be pulled concurrently.
//
// Bytes already delivered cannot be retracted: a filesystem error in the
// middle of the walk ends the stream with that error after a partial archive.
class directory_archive_stream {
    // Restricts construction to create() while keeping std::make_unique usable
    struct construct_tag {
        explicit construct_tag() = default;
    };

public:
    // Fails with invalid_argument for an empty or relative root, or a zero
    // buffer size. The root is only accessed once the worker runs.
    [[nodiscard]] static std::expected<std::unique_ptr<directory_archive_stream>, error> create(
        const std::filesystem::path& root,
        archive_options options = {});

    directory_archive_stream(construct_tag, std::filesystem::path root, archive_options options);
    ~directory_archive_stream();

    directory_archive_stream(const directory_archive_stream&) = delete;
    directory_archive_stream& operator=(const directory_archive_stream&) = delete;

    // Start the worker; pull() does this on first use. No-op once started.
    void start();

    // Next chunk of at most buffer_size bytes, nullopt at end of stream.
    // Blocks while the worker is still producing. Returns the worker's error
    // once it failed, and stream_closed after close().
    [[nodiscard]] std::expected<std::optional<std::vector<std::byte>>, error> pull();

    // Stop the worker and wait for it. Safe to call repeatedly.
    void close();

    // Suggested download filename: "<basename><extension>"
    [[nodiscard]] std::string name() const;
    [[nodiscard]] static constexpr std::string_view content_type() noexcept { return dirserve::content_type(); }

    [[nodiscard]] stream_state state() const;
    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }
    [[nodiscard]] const archive_options& options() const noexcept { return options_; }

    // Largest amount of data the internal buffer has held
    [[nodiscard]] size_t buffer_high_water_mark() const { return buffer_.high_water_mark(); }
    [[nodiscard]] uint64_t bytes_delivered() const noexcept { return bytes_delivered_; }

private:
    void run(std::stop_token stop);

    const std::filesystem::path root_;
    const archive_options options_;
    bounded_buffer buffer_;

    mutable std::mutex mutex_;
    stream_state state_ = stream_state::idle;
    std::optional<error> worker_error_;
    bool closed_ = false;

    uint64_t bytes_delivered_ = 0;
    std::jthread worker_;
};

} // namespace dirserve
