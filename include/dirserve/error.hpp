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

#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace dirserve {

enum class error_code {
    outside_jail,       // Path resolved outside the jail root
    filesystem_error,   // Walk failed (permission denied, vanished entry, ...)
    stream_closed,      // pull() after close()
    invalid_argument,
    io_error,
    invalid_header,
    corrupt_archive,
    unsupported_feature,
    end_of_archive
};

[[nodiscard]] std::string_view to_string(error_code code) noexcept;

class error {
public:
    error(const error_code code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] error_code code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

private:
    error_code code_;
    std::string message_;
};

// Wrap a std::error_code coming from <filesystem> or errno
[[nodiscard]] error make_filesystem_error(std::string_view what, std::string_view path, std::error_code ec);

} // namespace dirserve
