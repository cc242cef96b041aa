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
#include <catch2/matchers/catch_matchers_string.hpp>
#include "test_support.hpp"
#include <dirserve/path_guard.hpp>
#include <set>
#include <string>
#include <vector>

using namespace dirserve;
using dirserve::testing::temp_tree;
namespace fs = std::filesystem;

TEST_CASE("resolve joins and normalises below the jail", "[unit][path_guard]") {
    const fs::path jail = "/srv/jail";

    CHECK(resolve(jail, "a/b").value() == "/srv/jail/a/b");
    CHECK(resolve(jail, "").value() == "/srv/jail");
    CHECK(resolve(jail, "/a").value() == "/srv/jail/a");
    CHECK(resolve(jail, "//a//b/").value() == "/srv/jail/a/b");
    CHECK(resolve(jail, "a/./c/../b").value() == "/srv/jail/a/b");
    CHECK(resolve(jail, "a/..").value() == "/srv/jail");
    CHECK(resolve("/srv/jail/", "a").value() == "/srv/jail/a");
    CHECK(resolve("/", "../x").value() == "/x");
}

TEST_CASE("resolve rejects escapes", "[unit][path_guard]") {
    const fs::path jail = "/srv/jail";

    for (const std::string path : {"..", "../etc/passwd", "a/../../etc", "a/b/../../..", "../jail2",
                                   "/../jail/../..", "./../../srv"}) {
        auto result = resolve(jail, path);
        INFO(path);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::outside_jail);
    }

    SECTION("Normalised path back inside the jail") {
        // Climbs out and back in by name, which lands on the jail itself
        CHECK(resolve(jail, "../jail/x").value() == "/srv/jail/x");
    }
}

TEST_CASE("resolve never leaves the jail", "[unit][path_guard]") {
    const std::string jail = "/srv/jail";
    const std::vector<std::string> segments{"..", ".", "a", "b", "", "jail", "srv"};

    // Every three-segment combination of the pieces above
    for (const auto& first : segments) {
        for (const auto& second : segments) {
            for (const auto& third : segments) {
                const std::string path = first + "/" + second + "/" + third;
                auto result = resolve(jail, path);
                INFO(path);
                if (result) {
                    const std::string text = result->string();
                    CHECK((text == jail || text.starts_with(jail + "/")));
                } else {
                    CHECK(result.error().code() == error_code::outside_jail);
                }
            }
        }
    }
}

TEST_CASE("resolve requires an absolute jail", "[unit][path_guard]") {
    for (const fs::path jail : {fs::path{}, fs::path{"relative/jail"}}) {
        auto result = resolve(jail, "a");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::invalid_argument);
    }
}

TEST_CASE("resolve with symlink resolution", "[unit][path_guard]") {
    temp_tree tree;
    const auto jail = tree.make_dir("jail");
    tree.make_dir("outside");
    tree.write("jail/inner/file.txt", "x");
    fs::create_directory_symlink(tree.path() / "outside", jail / "escape");
    fs::create_directory_symlink("inner", jail / "alias");

    SECTION("Lexical resolution does not look at links") {
        CHECK(resolve(jail, "escape/secret").has_value());
    }

    SECTION("Links leaving the jail are rejected") {
        auto result = resolve(jail, "escape/secret", symlink_policy::resolve);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::outside_jail);
    }

    SECTION("Links inside the jail are accepted") {
        auto result = resolve(jail, "alias/file.txt", symlink_policy::resolve);
        REQUIRE(result.has_value());
        CHECK(*result == jail / "alias/file.txt");
    }
}

TEST_CASE("relativize strips the jail prefix", "[unit][path_guard]") {
    const fs::path jail = "/srv/jail";

    CHECK(relativize(jail, "/srv/jail/a/b").value() == "a/b");
    CHECK(relativize(jail, "/srv/jail").value() == "");
    CHECK(relativize(jail, "/srv/jail/").value() == "");
    CHECK(relativize("/", "/etc/hosts").value() == "etc/hosts");

    for (const fs::path outside : {fs::path{"/srv/jail2/a"}, fs::path{"/srv"}, fs::path{"/etc"}, fs::path{"a/b"}}) {
        auto result = relativize(jail, outside);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::outside_jail);
    }
}

TEST_CASE("resolve and relativize round trip", "[unit][path_guard]") {
    const fs::path jail = "/srv/jail";
    for (const fs::path absolute : {fs::path{"/srv/jail"}, fs::path{"/srv/jail/a"}, fs::path{"/srv/jail/a/b c/d.txt"}}) {
        auto relative = relativize(jail, absolute);
        REQUIRE(relative.has_value());
        auto resolved = resolve(jail, *relative);
        REQUIRE(resolved.has_value());
        CHECK(*resolved == absolute);
    }
}

TEST_CASE("sanitize_filename", "[unit][path_guard]") {
    SECTION("Keeps the last component") {
        CHECK(sanitize_filename("../../etc/passwd") == "passwd");
        CHECK(sanitize_filename("C:\\Windows\\evil.exe") == "evil.exe");
        CHECK(sanitize_filename("mixed/sep\\name.txt") == "name.txt");
    }

    SECTION("Replaces NUL") {
        CHECK(sanitize_filename(std::string_view{"a\0b", 3}) == "a_b");
    }

    SECTION("Rejects reserved names") {
        for (const char* name : {"", ".", "..", "::", "dir/", "a/.."}) {
            INFO(name);
            CHECK(sanitize_filename(name).empty());
        }
    }

    SECTION("Windows device names") {
        CHECK(sanitize_filename("con.txt", target_os::windows).empty());
        CHECK(sanitize_filename("Com1", target_os::windows).empty());
        CHECK(sanitize_filename("lpt9.tar.gz", target_os::windows).empty());
        CHECK(sanitize_filename("COM10", target_os::windows) == "COM10");
        CHECK(sanitize_filename("console.txt", target_os::windows) == "console.txt");
        CHECK(sanitize_filename("con.txt", target_os::posix) == "con.txt");
    }

    SECTION("Restricted character sets") {
        CHECK(sanitize_filename("caf\xc3\xa9.txt", target_os::posix, filename_charset::ascii) == "caf_.txt");
        CHECK(sanitize_filename("caf\xc3\xa9.txt", target_os::posix, filename_charset::latin1) == "caf\xc3\xa9.txt");
        CHECK(sanitize_filename("\xe6\x97\xa5\xe6\x9c\xac", target_os::posix, filename_charset::latin1) == "__");
        // Each invalid byte becomes its own replacement
        CHECK(sanitize_filename("a\xff\xfe", target_os::posix, filename_charset::ascii) == "a__");
        CHECK(sanitize_filename("\xe6\x97\xa5\xe6\x9c\xac", target_os::posix, filename_charset::unicode) ==
              "\xe6\x97\xa5\xe6\x9c\xac");
    }

    SECTION("Idempotent") {
        const std::vector<std::string> inputs{
            "plain.txt", "../x", "a\\b", ".", "..", "", "con.txt", "caf\xc3\xa9", "\xff\xfe\xfd",
            "dir/", std::string{"nul\0byte", 8}, "  spaced  ", "::"
        };
        for (const auto os : {target_os::posix, target_os::windows}) {
            for (const auto charset : {filename_charset::unicode, filename_charset::latin1, filename_charset::ascii}) {
                for (const auto& input : inputs) {
                    const auto once = sanitize_filename(input, os, charset);
                    CHECK(sanitize_filename(once, os, charset) == once);
                }
            }
        }
    }
}

TEST_CASE("alternative_filename", "[unit][path_guard]") {
    CHECK(alternative_filename("a.txt", 2) == "a (2).txt");
    CHECK(alternative_filename("a.tar.gz", 2) == "a (2).tar.gz");
    CHECK(alternative_filename("a.b.c.d", 3) == "a.b (3).c.d");
    CHECK(alternative_filename("noext", 2) == "noext (2)");
    CHECK(alternative_filename(".bashrc", 2) == " (2).bashrc");

    const auto random = alternative_filename("a.txt");
    CHECK_THAT(random, Catch::Matchers::Matches("a [A-Z0-9]{8}\\.txt"));
}

TEST_CASE("choose_non_colliding_name", "[unit][path_guard]") {
    std::set<std::string> taken{"a.txt"};
    const exists_fn exists = [&](const std::string& name) { return taken.contains(name); };

    SECTION("Free name is kept") {
        CHECK(choose_non_colliding_name(exists, "b.txt") == "b.txt");
    }

    SECTION("First numbered alternative") {
        CHECK(choose_non_colliding_name(exists, "a.txt", 2) == "a (2).txt");
    }

    SECTION("Skips taken alternatives") {
        taken.insert("a (2).txt");
        taken.insert("a (3).txt");
        CHECK(choose_non_colliding_name(exists, "a.txt") == "a (4).txt");
    }

    SECTION("Random suffix once attempts run out") {
        taken.insert("a (2).txt");
        CHECK_THAT(choose_non_colliding_name(exists, "a.txt", 2),
                   Catch::Matchers::Matches("a [A-Z0-9]{8}\\.txt"));
    }

    SECTION("Existence on disk") {
        temp_tree tree;
        tree.write("report.pdf", "x");
        tree.write("report (2).pdf", "x");
        CHECK(choose_non_colliding_name(tree.path(), "report.pdf") == "report (3).pdf");
        CHECK(choose_non_colliding_name(tree.path(), "other.pdf") == "other.pdf");
    }
}

TEST_CASE("Containment predicates", "[unit][path_guard]") {
    CHECK(is_within("/srv/up", "/srv/up"));
    CHECK(is_within("/srv/up", "/srv/up/a"));
    CHECK(is_within("/srv/up/", "/srv/up/a/../b"));
    CHECK_FALSE(is_within("/srv/up", "/srv/upload"));
    CHECK_FALSE(is_within("/srv/up", "/srv"));

    CHECK(is_strictly_within("/srv/up", "/srv/up/a"));
    CHECK_FALSE(is_strictly_within("/srv/up", "/srv/up"));
    CHECK_FALSE(is_strictly_within("/srv/up", "/srv/up/"));
    CHECK_FALSE(is_strictly_within("/srv/up", "/srv/up/a/.."));
}
