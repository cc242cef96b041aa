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

#include <dirserve/archive_reader.hpp>
#include <dirserve/archive_stream.hpp>
#include <dirserve/stream.hpp>
#include <atomic>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <unistd.h>
#include <vector>

namespace dirserve::testing {

// Scratch directory removed with everything below it
class temp_tree {
    std::filesystem::path root_;

public:
    temp_tree() {
        static std::atomic<unsigned> counter{0};
        std::random_device rd;
        root_ = std::filesystem::temp_directory_path() /
            ("dirserve_test_" + std::to_string(::getpid()) + "_" + std::to_string(rd()) + "_" +
             std::to_string(counter++));
        std::filesystem::create_directories(root_);
    }

    ~temp_tree() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    temp_tree(const temp_tree&) = delete;
    temp_tree& operator=(const temp_tree&) = delete;

    const std::filesystem::path& path() const { return root_; }

    std::filesystem::path make_dir(const std::string& relative) const {
        const auto dir = root_ / relative;
        std::filesystem::create_directories(dir);
        return dir;
    }

    std::filesystem::path write(const std::string& relative, std::string_view content) const {
        const auto file = root_ / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        return file;
    }

    std::filesystem::path write(const std::string& relative, std::span<const std::byte> content) const {
        return write(relative, std::string_view{reinterpret_cast<const char*>(content.data()), content.size()});
    }
};

inline std::vector<std::byte> random_bytes(const size_t size, const unsigned seed = 42) {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dis(0, 255);
    std::vector<std::byte> data(size);
    for (auto& b : data) {
        b = static_cast<std::byte>(dis(gen));
    }
    return data;
}

inline std::string as_string(std::span<const std::byte> bytes) {
    return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

// Pull until end of stream
inline std::expected<std::vector<std::byte>, error> drain(directory_archive_stream& stream) {
    std::vector<std::byte> archive;
    while (true) {
        auto chunk = stream.pull();
        if (!chunk) {
            return std::unexpected(chunk.error());
        }
        if (!*chunk) {
            return archive;
        }
        archive.insert(archive.end(), (*chunk)->begin(), (*chunk)->end());
    }
}

// Decompress and parse a complete archive held in memory
inline std::expected<std::vector<archive_member>, error> members_of(std::span<const std::byte> archive,
                                                                    const compression mode) {
    if (mode == compression::none) {
        return read_archive(std::make_unique<memory_stream>(archive));
    }
    return read_archive(std::make_unique<decompressing_stream>(decompressing_stream::from_memory(archive, mode)));
}

inline const archive_member* find_member(const std::vector<archive_member>& members, std::string_view path) {
    for (const auto& member : members) {
        if (member.metadata.path == path) {
            return &member;
        }
    }
    return nullptr;
}

} // namespace dirserve::testing
