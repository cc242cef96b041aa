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

#include <dirserve/archive_stream.hpp>
#include <dirserve/tar_writer.hpp>
#include <boost/iostreams/categories.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <exception>
#include <ios>

namespace io = boost::iostreams;

namespace dirserve {

namespace {

// Boost.Iostreams sink feeding the consumer through the bounded buffer.
// Writes block while the buffer is full and throw once it was aborted.
class buffer_sink {
public:
    using char_type = char;
    using category = io::sink_tag;

    explicit buffer_sink(bounded_buffer& buffer)
        : buffer_(&buffer) {}

    std::streamsize write(const char* s, const std::streamsize n) {
        if (!buffer_->write(std::as_bytes(std::span{s, static_cast<size_t>(n)}))) {
            throw std::ios_base::failure{"Archive stream aborted"};
        }
        return n;
    }

private:
    bounded_buffer* buffer_;
};

std::filesystem::path normalized_root(const std::filesystem::path& root) {
    auto normal = root.lexically_normal();
    if (!normal.has_filename() && normal.has_relative_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

} // anonymous namespace

std::string_view to_string(const stream_state state) noexcept {
    switch (state) {
        case stream_state::idle:     return "idle";
        case stream_state::running:  return "running";
        case stream_state::draining: return "draining";
        case stream_state::finished: return "finished";
        case stream_state::aborted:  return "aborted";
    }
    return "unknown";
}

auto directory_archive_stream::create(const std::filesystem::path& root, archive_options options)
    -> std::expected<std::unique_ptr<directory_archive_stream>, error> {
    if (root.empty() || !root.is_absolute()) {
        return std::unexpected(error{error_code::invalid_argument,
            "Archive root must be an absolute path: '" + root.string() + "'"});
    }
    if (options.buffer_size == 0) {
        return std::unexpected(error{error_code::invalid_argument, "Buffer size must be positive"});
    }
    if (options.level && (*options.level < 1 || *options.level > 9)) {
        return std::unexpected(error{error_code::invalid_argument,
            fmt::format("Compression level {} is out of range 1-9", *options.level)});
    }

    return std::make_unique<directory_archive_stream>(construct_tag{}, normalized_root(root), std::move(options));
}

directory_archive_stream::directory_archive_stream(construct_tag,
                                                   std::filesystem::path root,
                                                   archive_options options)
    : root_(std::move(root)),
      options_(std::move(options)),
      buffer_(options_.buffer_size) {}

directory_archive_stream::~directory_archive_stream() {
    close();
}

void directory_archive_stream::start() {
    std::lock_guard lock{mutex_};
    if (state_ != stream_state::idle || closed_) {
        return;
    }

    state_ = stream_state::running;
    worker_ = std::jthread{[this](std::stop_token stop) { run(std::move(stop)); }};
}

auto directory_archive_stream::pull() -> std::expected<std::optional<std::vector<std::byte>>, error> {
    {
        std::lock_guard lock{mutex_};
        if (closed_) {
            return std::unexpected(error{error_code::stream_closed, "Stream already closed"});
        }
        if (worker_error_) {
            return std::unexpected(*worker_error_);
        }
        if (state_ == stream_state::finished) {
            return std::nullopt;
        }
    }

    start();
    auto chunk = buffer_.read();

    std::lock_guard lock{mutex_};
    if (worker_error_) {
        state_ = stream_state::aborted;
        return std::unexpected(*worker_error_);
    }
    if (!chunk.empty()) {
        bytes_delivered_ += chunk.size();
        return chunk;
    }

    state_ = stream_state::finished;
    return std::nullopt;
}

void directory_archive_stream::close() {
    {
        std::lock_guard lock{mutex_};
        if (closed_) {
            return;
        }
        closed_ = true;
        if (state_ != stream_state::finished) {
            state_ = stream_state::aborted;
        }
    }

    // Stop first so the worker sees the request as soon as the abort wakes it
    worker_.request_stop();
    buffer_.abort();
    if (worker_.joinable()) {
        worker_.join();
    }
}

std::string directory_archive_stream::name() const {
    std::string base = root_.filename().string();
    if (base.empty()) {
        base = "archive";
    }
    return base + std::string{extension(options_.mode)};
}

stream_state directory_archive_stream::state() const {
    std::lock_guard lock{mutex_};
    return state_;
}

void directory_archive_stream::run(std::stop_token stop) {
    spdlog::debug("Archive worker started for '{}' ({})", root_.string(), to_string(options_.mode));

    std::optional<error> failure;
    archive_statistics stats;
    try {
        io::filtering_ostream out;
        push_compressor(out, options_.mode, options_.level);
        out.push(buffer_sink{buffer_});
        // The chain reports badbit until its sink is pushed
        out.exceptions(std::ios::badbit);

        tar_writer writer{out};
        auto result = writer.add_tree(root_, options_.exclude, stop);
        if (result) {
            result = writer.finish();
        }
        stats = writer.statistics();

        if (result) {
            // Closing the chain writes the compressor trailer
            out.reset();
        } else {
            failure = result.error();
        }
    } catch (const std::exception& e) {
        failure = error{error_code::io_error, fmt::format("Archive output failed: {}", e.what())};
    }

    {
        std::lock_guard lock{mutex_};
        if (failure && stop.stop_requested()) {
            spdlog::debug("Archive of '{}' cancelled after {} entries", root_.string(), stats.entries);
        } else if (failure) {
            spdlog::error("Archive of '{}' failed: {}", root_.string(), failure->message());
            worker_error_ = std::move(failure);
            state_ = stream_state::aborted;
        } else {
            spdlog::info("Archived '{}': {} entries, {} payload bytes, {} tar bytes",
                         root_.string(), stats.entries, stats.payload_bytes, stats.archive_bytes);
            if (state_ == stream_state::running) {
                state_ = stream_state::draining;
            }
        }
    }

    buffer_.close_writer();
}

} // namespace dirserve
