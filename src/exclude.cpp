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

#include <dirserve/exclude.hpp>
#include <algorithm>
#include <array>
#include <fstream>
#include <optional>
#include <regex>
#include <spdlog/spdlog.h>

namespace dirserve {

exclude_fn exclude_union(std::vector<exclude_fn> functions) {
    std::erase_if(functions, [](const exclude_fn& fn) { return !fn; });

    if (functions.empty()) {
        return {};
    }
    if (functions.size() == 1) {
        return std::move(functions.front());
    }
    return [functions = std::move(functions)](const std::filesystem::path& path) {
        return std::ranges::any_of(functions, [&](const exclude_fn& fn) { return fn(path); });
    };
}

namespace glob {

namespace {

constexpr std::string_view regex_specials = "^$\\.*+?()[]{}|";

constexpr std::array<std::string_view, 13> posix_classes{
    "alnum", "alpha", "blank", "cntrl", "digit", "graph", "lower",
    "print", "punct", "space", "upper", "xdigit", "word"
};

std::string escape(const char c) {
    if (regex_specials.find(c) != std::string_view::npos) {
        return std::string{'\\', c};
    }
    return std::string{c};
}

std::string escape(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (const char c : text) {
        result += escape(c);
    }
    return result;
}

// Escaping inside a bracket expression
std::string escape_in_class(const char c) {
    if (c == '\\' || c == ']' || c == '[' || c == '^') {
        return std::string{'\\', c};
    }
    return std::string{c};
}

// Parser state while translating a bracket expression
enum class range_state { start, body, done };

struct range_result {
    std::string expression;
    size_t end;  // Index just past the closing ']'
};

// Translate the bracket expression starting at pattern[start] == '['.
// nullopt when it is never closed, so the '[' is taken literally.
std::optional<range_result> translate_range(std::string_view pattern, const size_t start, const char sep) {
    size_t pos = start + 1;
    bool negate = false;
    bool unsupported = false;
    std::string body;

    if (pos < pattern.size() && (pattern[pos] == '!' || pattern[pos] == '^')) {
        negate = true;
        ++pos;
    }

    range_state state = range_state::start;
    while (pos < pattern.size() && state != range_state::done) {
        const char c = pattern[pos];

        if (c == ']' && state == range_state::body) {
            state = range_state::done;
            ++pos;
            continue;
        }

        if (c == '[' && pos + 1 < pattern.size() &&
            (pattern[pos + 1] == ':' || pattern[pos + 1] == '.' || pattern[pos + 1] == '=')) {
            const char kind = pattern[pos + 1];
            const size_t close = pattern.find(std::string{kind, ']'}, pos + 2);
            if (close != std::string_view::npos) {
                const auto name = pattern.substr(pos + 2, close - pos - 2);
                if (kind == ':' && std::ranges::find(posix_classes, name) != posix_classes.end()) {
                    body += name == "word" ? "[:w:]" : "[:" + std::string{name} + ":]";
                } else {
                    spdlog::warn("Unsupported bracket expression '[{}{}{}]' in pattern '{}'",
                                 kind, name, kind, pattern);
                    unsupported = true;
                }
                pos = close + 2;
                state = range_state::body;
                continue;
            }
        }

        body += c == sep ? escape_in_class(sep) : (c == '-' ? std::string{c} : escape_in_class(c));
        state = range_state::body;
        ++pos;
    }

    if (state != range_state::done) {
        return std::nullopt;
    }
    if (unsupported) {
        return range_result{".", pos};
    }
    return range_result{"[" + std::string{negate ? "^" : ""} + body + "]", pos};
}

} // anonymous namespace

std::string translate(std::string_view pattern, const char sep, std::string_view base) {
    while (pattern.size() > 1 && pattern.back() == sep) {
        pattern.remove_suffix(1);
    }
    while (!base.empty() && base.back() == sep) {
        base.remove_suffix(1);
    }

    const std::string separator = escape(sep);
    const std::string not_separator = "[^" + escape_in_class(sep) + "]";

    std::string result;
    if (!pattern.empty() && pattern.front() == sep) {
        result = "^" + escape(base);
    } else {
        result = separator;
    }

    size_t depth = 0;
    size_t pos = 0;
    while (pos < pattern.size()) {
        const char c = pattern[pos];

        if (c == '\\') {
            result += pos + 1 < pattern.size() ? escape(pattern[pos + 1]) : escape('\\');
            pos += 2;
        } else if (c == '*') {
            if (pos + 1 < pattern.size() && pattern[pos + 1] == '*') {
                result += ".*";
                pos += 2;
            } else {
                result += not_separator + "*";
                ++pos;
            }
        } else if (c == '?') {
            result += not_separator;
            ++pos;
        } else if (c == '[') {
            if (auto range = translate_range(pattern, pos, sep)) {
                result += range->expression;
                pos = range->end;
            } else {
                result += escape(c);
                ++pos;
            }
        } else if (c == '{') {
            ++depth;
            result += "(";
            ++pos;
        } else if (c == ',' && depth > 0) {
            result += "|";
            ++pos;
        } else if (c == '}' && depth > 0) {
            --depth;
            result += ")";
            ++pos;
        } else if (c == sep) {
            result += separator;
            ++pos;
        } else {
            result += escape(c);
            ++pos;
        }
    }

    for (; depth > 0; --depth) {
        result += ")";
    }

    return result + "(" + separator + "|$)";
}

auto make_exclude(std::span<const std::string> patterns, const std::filesystem::path& base)
    -> std::expected<exclude_fn, error> {
    if (patterns.empty()) {
        return exclude_fn{};
    }

    const std::string base_text = base.generic_string();
    std::string expression;
    for (const auto& pattern : patterns) {
        if (!expression.empty()) {
            expression += "|";
        }
        expression += "(?:" + translate(pattern, '/', base_text) + ")";
    }

    try {
        std::regex regex{expression, std::regex::ECMAScript | std::regex::optimize};
        return [regex = std::move(regex)](const std::filesystem::path& path) {
            return std::regex_search(path.generic_string(), regex);
        };
    } catch (const std::regex_error& e) {
        return std::unexpected(error{error_code::invalid_argument,
            "Invalid exclude pattern: " + std::string{e.what()}});
    }
}

auto collect_patterns(std::span<const std::filesystem::path> files)
    -> std::expected<std::vector<std::string>, error> {
    std::vector<std::string> patterns;

    for (const auto& file : files) {
        std::ifstream in{file};
        if (!in) {
            return std::unexpected(error{error_code::filesystem_error,
                "Cannot read pattern file '" + file.string() + "'"});
        }

        std::string line;
        while (std::getline(in, line)) {
            if (const auto comment = line.find('#'); comment != std::string::npos) {
                line.erase(comment);
            }
            const auto first = line.find_first_not_of(" \t\r\n");
            if (first == std::string::npos) {
                continue;
            }
            const auto last = line.find_last_not_of(" \t\r\n");
            patterns.push_back(line.substr(first, last - first + 1));
        }
    }

    return patterns;
}

} // namespace glob

} // namespace dirserve
