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
#include <dirserve/compression.hpp>
#include <dirserve/error.hpp>
#include <string>

using namespace dirserve;

TEST_CASE("parse_compression", "[unit][compression]") {
    CHECK(parse_compression("none").value() == compression::none);
    CHECK(parse_compression("").value() == compression::none);
    CHECK(parse_compression("gzip").value() == compression::gzip);
    CHECK(parse_compression("GZ").value() == compression::gzip);
    CHECK(parse_compression("tgz").value() == compression::gzip);
    CHECK(parse_compression("bz2").value() == compression::bzip2);
    CHECK(parse_compression("tar.bz2").value() == compression::bzip2);
    CHECK(parse_compression("xz").value() == compression::xz);
    CHECK(parse_compression("lzma").value() == compression::xz);

    auto result = parse_compression("zstd");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == error_code::invalid_argument);
}

TEST_CASE("compression_from_filename", "[unit][compression]") {
    CHECK(compression_from_filename("backup.tar").value() == compression::none);
    CHECK(compression_from_filename("backup.tar.gz").value() == compression::gzip);
    CHECK(compression_from_filename("BACKUP.TGZ").value() == compression::gzip);
    CHECK(compression_from_filename("backup.tar.bz2").value() == compression::bzip2);
    CHECK(compression_from_filename("backup.tbz2").value() == compression::bzip2);
    CHECK(compression_from_filename("backup.tar.xz").value() == compression::xz);
    CHECK(compression_from_filename("backup.txz").value() == compression::xz);

    for (const char* name : {"backup.zip", "backup.gz", "tar", ""}) {
        INFO(name);
        auto result = compression_from_filename(name);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::invalid_argument);
    }
}

TEST_CASE("Compression names", "[unit][compression]") {
    CHECK(extension(compression::none) == ".tar");
    CHECK(extension(compression::gzip) == ".tgz");
    CHECK(extension(compression::bzip2) == ".tar.bz2");
    CHECK(extension(compression::xz) == ".tar.xz");

    CHECK(content_type() == "application/octet-stream");

    SECTION("Suggested names map back to their mode") {
        const auto mode = GENERATE(compression::none, compression::gzip, compression::bzip2, compression::xz);
        CHECK(parse_compression(to_string(mode)).value() == mode);
        CHECK(compression_from_filename("archive" + std::string{extension(mode)}).value() == mode);
    }
}

TEST_CASE("Error code names", "[unit][error]") {
    CHECK(to_string(error_code::outside_jail) == "outside_jail");
    CHECK(to_string(error_code::stream_closed) == "stream_closed");

    const auto e = make_filesystem_error("Cannot open", "/srv/x", std::make_error_code(std::errc::permission_denied));
    CHECK(e.code() == error_code::filesystem_error);
    CHECK(e.message().starts_with("Cannot open '/srv/x': "));
}
