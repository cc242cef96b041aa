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
#include "test_support.hpp"
#include <dirserve/archive_reader.hpp>
#include <dirserve/header_codec.hpp>
#include <dirserve/tar_writer.hpp>
#include <sstream>
#include <string>

using namespace dirserve;
using namespace dirserve::testing;

namespace {

file_metadata file_entry(std::string path, uint64_t size) {
    file_metadata meta;
    meta.path = std::move(path);
    meta.size = size;
    return meta;
}

// Archive built through the push interface
class archive_builder {
    std::ostringstream out_;
    tar_writer writer_{out_};

public:
    archive_builder& file(const std::string& path, std::string_view content) {
        REQUIRE(writer_.add_entry(file_entry(path, content.size())).has_value());
        REQUIRE(writer_.write_payload(std::as_bytes(std::span{content})).has_value());
        REQUIRE(writer_.pad(content.size()).has_value());
        return *this;
    }

    archive_builder& entry(const file_metadata& meta) {
        REQUIRE(writer_.add_entry(meta).has_value());
        return *this;
    }

    // Raw extension entry with payload, bypassing the writer's bookkeeping
    archive_builder& extension(entry_type type, const std::string& payload) {
        auto meta = file_entry("././@LongLink", payload.size());
        meta.type = type;
        const auto header = detail::encode_header(meta);
        out_.write(reinterpret_cast<const char*>(header.data()), header.size());
        out_ << payload << std::string(detail::padding_for(payload.size()), '\0');
        return *this;
    }

    std::string finish() {
        REQUIRE(writer_.finish().has_value());
        return out_.str();
    }

    std::string unfinished() const { return out_.str(); }
};

std::unique_ptr<memory_stream> stream_over(const std::string& bytes) {
    return std::make_unique<memory_stream>(std::as_bytes(std::span{bytes}));
}

} // anonymous namespace

TEST_CASE("archive_reader iterates entries", "[unit][archive_reader]") {
    const std::string bytes = archive_builder{}
        .file("one.txt", "first")
        .file("two.bin", std::string(1500, 'x'))
        .file("three.txt", "")
        .finish();

    auto reader = archive_reader::from_stream(stream_over(bytes));
    REQUIRE(reader.has_value());

    SECTION("Reading every payload") {
        auto first = reader->next_entry();
        REQUIRE(first.has_value());
        REQUIRE(first->has_value());
        CHECK((*first)->path == "one.txt");
        auto data = reader->read_data();
        REQUIRE(data.has_value());
        CHECK(as_string(*data) == "first");

        auto second = reader->next_entry();
        REQUIRE(second.has_value());
        REQUIRE(second->has_value());
        CHECK((*second)->size == 1500);
        CHECK(reader->read_data()->size() == 1500);

        auto third = reader->next_entry();
        REQUIRE(third.has_value());
        REQUIRE(third->has_value());
        CHECK(reader->read_data()->empty());

        auto end = reader->next_entry();
        REQUIRE(end.has_value());
        CHECK_FALSE(end->has_value());
        CHECK(reader->finished());
    }

    SECTION("Unread payloads are skipped") {
        std::vector<std::string> paths;
        while (true) {
            auto entry = reader->next_entry();
            REQUIRE(entry.has_value());
            if (!*entry) {
                break;
            }
            paths.push_back((*entry)->path);
        }
        CHECK(paths == std::vector<std::string>{"one.txt", "two.bin", "three.txt"});
    }
}

TEST_CASE("archive_reader applies extension headers", "[unit][archive_reader]") {
    SECTION("GNU long names and links") {
        auto link = file_entry("short", 0);
        link.type = entry_type::symbolic_link;
        link.link_target = "short-target";

        const std::string long_name(150, 'n');
        const std::string long_target(130, 't');
        const std::string bytes = archive_builder{}
            .extension(entry_type::gnu_longname, long_name + '\0')
            .extension(entry_type::gnu_longlink, long_target)
            .entry(link)
            .finish();

        auto members = read_archive(stream_over(bytes));
        REQUIRE(members.has_value());
        REQUIRE(members->size() == 1);
        CHECK((*members)[0].metadata.path == long_name);
        CHECK((*members)[0].metadata.link_target == long_target);
    }

    SECTION("PAX global headers are skipped") {
        const std::string bytes = archive_builder{}
            .extension(entry_type::pax_global_header, "19 comment=ignored\n")
            .file("real.txt", "data")
            .finish();

        auto members = read_archive(stream_over(bytes));
        REQUIRE(members.has_value());
        REQUIRE(members->size() == 1);
        CHECK((*members)[0].metadata.path == "real.txt");
    }
}

TEST_CASE("archive_reader error handling", "[unit][archive_reader]") {
    SECTION("Null stream") {
        auto reader = archive_reader::from_stream(nullptr);
        REQUIRE_FALSE(reader.has_value());
        CHECK(reader.error().code() == error_code::invalid_argument);
    }

    SECTION("Missing end-of-archive marker") {
        archive_builder builder;
        builder.file("a.txt", "abc");
        auto members = read_archive(stream_over(builder.unfinished()));
        REQUIRE_FALSE(members.has_value());
        CHECK(members.error().code() == error_code::corrupt_archive);
    }

    SECTION("Single zero block") {
        archive_builder builder;
        builder.file("a.txt", "abc");
        const std::string bytes = builder.unfinished() + std::string(512, '\0');
        auto members = read_archive(stream_over(bytes));
        REQUIRE_FALSE(members.has_value());
        CHECK(members.error().code() == error_code::corrupt_archive);
    }

    SECTION("Truncated payload") {
        std::string bytes = archive_builder{}.file("big.bin", std::string(2000, 'b')).finish();
        bytes.resize(1024);
        auto members = read_archive(stream_over(bytes));
        REQUIRE_FALSE(members.has_value());
        CHECK(members.error().code() == error_code::corrupt_archive);
    }

    SECTION("read_data without an entry") {
        const std::string bytes = archive_builder{}.finish();
        auto reader = archive_reader::from_stream(stream_over(bytes));
        REQUIRE(reader.has_value());
        auto data = reader->read_data();
        REQUIRE_FALSE(data.has_value());
        CHECK(data.error().code() == error_code::invalid_argument);
    }
}
