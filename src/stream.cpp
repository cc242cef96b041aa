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

#include <dirserve/stream.hpp>
#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/device/file.hpp>
#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <ranges>
#include <string>

namespace dirserve {

namespace io = boost::iostreams;

// memory_stream implementation
auto memory_stream::read(std::span<std::byte> buffer) -> std::expected<size_t, error> {
    const size_t available = data_.size() - position_;
    const size_t to_read = std::min(buffer.size(), available);

    std::ranges::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(position_),
                        static_cast<std::ptrdiff_t>(to_read), buffer.begin());
    position_ += to_read;

    return to_read;
}

auto memory_stream::skip(size_t bytes) -> std::expected<void, error> {
    if (position_ + bytes > data_.size()) {
        return std::unexpected(error{error_code::io_error, "Skip past end of stream"});
    }
    position_ += bytes;
    return {};
}

// file_stream implementation
file_stream::file_stream(std::FILE* file, const std::optional<size_t> size)
    : file_(file), file_size_(size) {}

auto file_stream::open(const std::filesystem::path &path) -> std::expected<file_stream, error> {
    std::FILE* file = std::fopen(path.c_str(), "rb");
    if (!file) {
        return std::unexpected(error{error_code::filesystem_error,
            "Failed to open file '" + path.string() + "': " + std::string{std::strerror(errno)}});
    }

    std::optional<size_t> file_size;
    if (std::fseek(file, 0, SEEK_END) == 0) {
        if (const long pos = std::ftell(file); pos >= 0) {
            file_size = static_cast<size_t>(pos);
        }
        if (std::fseek(file, 0, SEEK_SET) != 0) {
            std::fclose(file);
            return std::unexpected(error{error_code::filesystem_error,
                "Failed to rewind file '" + path.string() + "': " + std::string{std::strerror(errno)}});
        }
    }

    return file_stream{file, file_size};
}

auto file_stream::read(std::span<std::byte> buffer) -> std::expected<size_t, error> {
    size_t bytes_read = std::fread(buffer.data(), 1, buffer.size(), file_.get());

    if (bytes_read == 0 && std::ferror(file_.get())) {
        return std::unexpected(error{error_code::filesystem_error,
            "File read error: " + std::string{std::strerror(errno)}});
    }

    return bytes_read;
}

auto file_stream::skip(size_t bytes) -> std::expected<void, error> {
    if (std::fseek(file_.get(), static_cast<long>(bytes), SEEK_CUR) != 0) {
        return std::unexpected(error{error_code::io_error,
            "File seek error: " + std::string{std::strerror(errno)}});
    }
    return {};
}

bool file_stream::at_end() const {
    if (file_size_.has_value()) {
        if (const long pos = std::ftell(file_.get()); pos >= 0) {
            return static_cast<size_t>(pos) >= file_size_.value();
        }
    }
    return std::feof(file_.get()) != 0;
}

// decompressing_stream implementation
decompressing_stream decompressing_stream::from_memory(std::span<const std::byte> data, const compression mode) {
    auto in = std::make_unique<io::filtering_istream>();
    push_decompressor(*in, mode);
    in->push(io::array_source{reinterpret_cast<const char*>(data.data()), data.size()});
    return decompressing_stream{std::move(in)};
}

auto decompressing_stream::from_file(const std::filesystem::path &path, const compression mode)
    -> std::expected<decompressing_stream, error> {
    io::file_source source{path.string(), std::ios::binary};
    if (!source.is_open()) {
        return std::unexpected(error{error_code::filesystem_error,
            "Failed to open archive '" + path.string() + "'"});
    }

    auto in = std::make_unique<io::filtering_istream>();
    push_decompressor(*in, mode);
    in->push(source);
    return decompressing_stream{std::move(in)};
}

auto decompressing_stream::read(std::span<std::byte> buffer) -> std::expected<size_t, error> {
    in_->read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    if (in_->bad()) {
        return std::unexpected(error{error_code::corrupt_archive, "Decompression failed"});
    }
    return static_cast<size_t>(in_->gcount());
}

auto decompressing_stream::skip(size_t bytes) -> std::expected<void, error> {
    std::array<std::byte, 4096> scratch{};
    while (bytes > 0) {
        const size_t chunk = std::min(bytes, scratch.size());
        auto result = read(std::span{scratch.data(), chunk});
        if (!result) {
            return std::unexpected(result.error());
        }
        if (*result == 0) {
            return std::unexpected(error{error_code::io_error, "Skip past end of stream"});
        }
        bytes -= *result;
    }
    return {};
}

bool decompressing_stream::at_end() const {
    return in_->peek() == std::char_traits<char>::eof();
}

} // namespace dirserve
