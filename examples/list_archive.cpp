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

#include <dirserve/dirserve.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdio>
#include <string>
#include <string_view>

namespace {

char type_letter(const dirserve::file_metadata& meta) {
    switch (meta.type) {
        case dirserve::entry_type::directory:        return 'd';
        case dirserve::entry_type::symbolic_link:    return 'l';
        case dirserve::entry_type::hard_link:        return 'h';
        case dirserve::entry_type::character_device: return 'c';
        case dirserve::entry_type::block_device:     return 'b';
        case dirserve::entry_type::fifo:             return 'p';
        default:                                     return '-';
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 3) {
        fmt::print(stderr, "Usage: {} <archive> [--verbose]\n", argv[0]);
        return 1;
    }
    if (argc == 3 && std::string_view{argv[2]} == "--verbose") {
        spdlog::set_level(spdlog::level::debug);
    }

    auto reader = dirserve::open_archive(argv[1]);
    if (!reader) {
        fmt::print(stderr, "Failed to open archive: {}\n", reader.error().message());
        return 1;
    }

    size_t entries = 0;
    uint64_t total_bytes = 0;
    while (true) {
        auto entry = reader->next_entry();
        if (!entry) {
            fmt::print(stderr, "Error reading archive: {}\n", entry.error().message());
            return 1;
        }
        if (!*entry) {
            break;
        }

        const auto& meta = **entry;
        const auto mtime = std::chrono::system_clock::to_time_t(meta.modification_time);
        fmt::print("{}{:04o} {:>8}/{:<8} {:>10} {:>12} {}", type_letter(meta), meta.mode,
                   meta.owner_name.empty() ? std::to_string(meta.owner_id) : meta.owner_name,
                   meta.group_name.empty() ? std::to_string(meta.group_id) : meta.group_name,
                   meta.size, mtime, meta.path);
        if (meta.link_target) {
            fmt::print(" -> {}", *meta.link_target);
        }
        fmt::print("\n");

        ++entries;
        total_bytes += meta.size;
    }

    fmt::print("\n{} entries, {} bytes\n", entries, total_bytes);
    return 0;
}
