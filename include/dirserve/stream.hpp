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

#include <dirserve/compression.hpp>
#include <dirserve/error.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <cstdio>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>

namespace dirserve {

// Base interface for reading data streams
class input_stream {
public:
    virtual ~input_stream() = default;

    // Read up to buffer.size() bytes into buffer, returns actual bytes read
    [[nodiscard]] virtual std::expected<size_t, error> read(std::span<std::byte> buffer) = 0;

    // Skip n bytes in the stream
    [[nodiscard]] virtual std::expected<void, error> skip(size_t bytes) = 0;

    // Check if at end of stream
    [[nodiscard]] virtual bool at_end() const = 0;
};

// Non-owning view over bytes already in memory
class memory_stream : public input_stream {
private:
    std::span<const std::byte> data_;
    size_t position_ = 0;

public:
    explicit memory_stream(std::span<const std::byte> data)
        : data_(data) {}

    [[nodiscard]] std::expected<size_t, error> read(std::span<std::byte> buffer) override;
    [[nodiscard]] std::expected<void, error> skip(size_t bytes) override;
    [[nodiscard]] bool at_end() const override { return position_ >= data_.size(); }

    [[nodiscard]] size_t position() const noexcept { return position_; }
};

// File-based stream, also used to read source files while archiving
class file_stream : public input_stream {
private:
    struct file_deleter {
        void operator()(std::FILE* f) const {
            if (f) std::fclose(f);
        }
    };

    std::unique_ptr<std::FILE, file_deleter> file_;
    std::optional<size_t> file_size_;

public:
    [[nodiscard]] static std::expected<file_stream, error> open(const std::filesystem::path& path);

    [[nodiscard]] std::expected<size_t, error> read(std::span<std::byte> buffer) override;
    [[nodiscard]] std::expected<void, error> skip(size_t bytes) override;
    [[nodiscard]] bool at_end() const override;
    [[nodiscard]] std::optional<size_t> size() const noexcept { return file_size_; }

private:
    file_stream(std::FILE* file, std::optional<size_t> size);
};

// Tar bytes behind a gzip/bzip2/xz decompressor
class decompressing_stream : public input_stream {
private:
    std::unique_ptr<boost::iostreams::filtering_istream> in_;

    explicit decompressing_stream(std::unique_ptr<boost::iostreams::filtering_istream> in)
        : in_(std::move(in)) {}

public:
    // `data` must outlive the stream
    [[nodiscard]] static decompressing_stream from_memory(std::span<const std::byte> data, compression mode);
    [[nodiscard]] static std::expected<decompressing_stream, error> from_file(
        const std::filesystem::path& path, compression mode);

    [[nodiscard]] std::expected<size_t, error> read(std::span<std::byte> buffer) override;
    [[nodiscard]] std::expected<void, error> skip(size_t bytes) override;
    [[nodiscard]] bool at_end() const override;
};

} // namespace dirserve
