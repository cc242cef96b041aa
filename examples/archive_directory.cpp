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
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    std::vector<std::string> positional;

    auto config = dirserve::parse_arguments(args, &positional);
    if (!config) {
        fmt::print(stderr, "{}\n", config.error().message());
        fmt::print(stderr, "Usage: {} [options] DIRECTORY [OUTPUT]\n{}", argv[0], dirserve::usage());
        return 1;
    }
    if (positional.empty() || positional.size() > 2) {
        fmt::print(stderr, "Usage: {} [options] DIRECTORY [OUTPUT]\n{}", argv[0], dirserve::usage());
        return 1;
    }
    if (config->verbose) {
        spdlog::set_level(spdlog::level::debug);
    }

    // DIRECTORY is relative to --directory, like a browsed path
    auto stream = dirserve::open_directory_stream(*config, positional[0]);
    if (!stream) {
        fmt::print(stderr, "Cannot archive '{}': {}\n", positional[0], stream.error().message());
        return 1;
    }

    const std::string output = positional.size() > 1 ? positional[1] : (*stream)->name();
    std::ofstream out{output, std::ios::binary};
    if (!out) {
        fmt::print(stderr, "Cannot create '{}'\n", output);
        return 1;
    }

    fmt::print("Archiving {} into {}\n", (*stream)->root().string(), output);

    while (true) {
        auto chunk = (*stream)->pull();
        if (!chunk) {
            // Whatever was written so far is a truncated archive
            fmt::print(stderr, "Archive failed: {}\n", chunk.error().message());
            return 1;
        }
        if (!*chunk) {
            break;
        }
        out.write(reinterpret_cast<const char*>((*chunk)->data()), static_cast<std::streamsize>((*chunk)->size()));
        if (!out) {
            fmt::print(stderr, "Write to '{}' failed\n", output);
            (*stream)->close();
            return 1;
        }
    }

    fmt::print("Wrote {} bytes ({})\n", (*stream)->bytes_delivered(), (*stream)->content_type());
    return 0;
}
