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

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include "test_support.hpp"
#include <dirserve/stream.hpp>
#include <dirserve/compression.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <array>
#include <cstring>
#include <vector>

using namespace dirserve;
using dirserve::testing::temp_tree;
namespace fs = std::filesystem;

namespace {

std::vector<std::byte> create_test_data(size_t size, std::byte pattern = std::byte{0xAB}) {
    std::vector<std::byte> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::byte>((static_cast<uint8_t>(pattern) + i) % 256);
    }
    return data;
}

std::vector<std::byte> compress(std::span<const std::byte> data, compression mode) {
    std::vector<char> sink;
    {
        boost::iostreams::filtering_ostream out;
        push_compressor(out, mode);
        out.push(boost::iostreams::back_inserter(sink));
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }
    std::vector<std::byte> result(sink.size());
    std::memcpy(result.data(), sink.data(), sink.size());
    return result;
}

std::vector<std::byte> read_all(input_stream& stream) {
    std::vector<std::byte> result;
    std::array<std::byte, 333> buffer{};
    while (true) {
        auto count = stream.read(buffer);
        REQUIRE(count.has_value());
        if (*count == 0) {
            return result;
        }
        result.insert(result.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(*count));
    }
}

} // anonymous namespace

TEST_CASE("memory_stream basic operations", "[unit][stream]") {
    auto data = create_test_data(1024);
    memory_stream stream{data};

    SECTION("Initial state") {
        CHECK_FALSE(stream.at_end());
        CHECK(stream.position() == 0);
    }

    SECTION("Read full buffer") {
        std::array<std::byte, 100> buffer{};
        auto result = stream.read(buffer);

        REQUIRE(result.has_value());
        CHECK(result.value() == 100);
        CHECK(stream.position() == 100);
        CHECK(std::memcmp(buffer.data(), data.data(), 100) == 0);
    }

    SECTION("Read beyond available data") {
        std::array<std::byte, 2000> buffer{};
        auto result = stream.read(buffer);

        REQUIRE(result.has_value());
        CHECK(result.value() == 1024);
        CHECK(stream.at_end());

        auto again = stream.read(buffer);
        REQUIRE(again.has_value());
        CHECK(again.value() == 0);
    }

    SECTION("Skip within bounds and past end") {
        REQUIRE(stream.skip(1000).has_value());
        CHECK(stream.position() == 1000);

        auto result = stream.skip(100);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::io_error);
        CHECK(stream.position() == 1000);
    }
}

TEST_CASE("file_stream operations", "[unit][stream]") {
    temp_tree tree;
    auto data = create_test_data(5000);
    const auto file = tree.write("data.bin", data);

    auto stream = file_stream::open(file);
    REQUIRE(stream.has_value());

    SECTION("Size and initial state") {
        REQUIRE(stream->size().has_value());
        CHECK(*stream->size() == 5000);
        CHECK_FALSE(stream->at_end());
    }

    SECTION("Read entire file") {
        CHECK(read_all(*stream) == data);
        CHECK(stream->at_end());
    }

    SECTION("Skip then read") {
        REQUIRE(stream->skip(4990).has_value());
        std::array<std::byte, 64> buffer{};
        auto count = stream->read(buffer);
        REQUIRE(count.has_value());
        CHECK(*count == 10);
        CHECK(std::memcmp(buffer.data(), data.data() + 4990, 10) == 0);
    }
}

TEST_CASE("file_stream error handling", "[unit][stream]") {
    SECTION("Open non-existent file") {
        auto result = file_stream::open("/non/existent/file.dat");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::filesystem_error);
    }

    SECTION("Empty file") {
        temp_tree tree;
        auto stream = file_stream::open(tree.write("empty", std::string_view{}));
        REQUIRE(stream.has_value());
        CHECK(stream->at_end());
        CHECK(read_all(*stream).empty());
    }
}

TEST_CASE("decompressing_stream restores the original bytes", "[unit][stream][compression]") {
    const auto mode = GENERATE(compression::none, compression::gzip, compression::bzip2, compression::xz);
    const auto data = dirserve::testing::random_bytes(100000, 7);
    const auto compressed = compress(data, mode);

    SECTION("From memory") {
        auto stream = decompressing_stream::from_memory(compressed, mode);
        CHECK(read_all(stream) == data);
        CHECK(stream.at_end());
    }

    SECTION("From file with skip") {
        temp_tree tree;
        const auto file = tree.write("archive.bin", compressed);
        auto stream = decompressing_stream::from_file(file, mode);
        REQUIRE(stream.has_value());
        REQUIRE(stream->skip(90000).has_value());
        auto rest = read_all(*stream);
        CHECK(rest == std::vector<std::byte>(data.begin() + 90000, data.end()));
    }
}

TEST_CASE("decompressing_stream error handling", "[unit][stream][compression]") {
    SECTION("Missing file") {
        auto result = decompressing_stream::from_file("/non/existent/archive.tgz", compression::gzip);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::filesystem_error);
    }

    SECTION("Garbage input") {
        const auto garbage = create_test_data(4096);
        auto stream = decompressing_stream::from_memory(garbage, compression::gzip);
        std::array<std::byte, 512> buffer{};
        auto result = stream.read(buffer);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::corrupt_archive);
    }

    SECTION("Skip past end") {
        const auto compressed = compress(create_test_data(100), compression::gzip);
        auto stream = decompressing_stream::from_memory(compressed, compression::gzip);
        auto result = stream.skip(1000);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::io_error);
    }
}
