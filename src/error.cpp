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

#include <dirserve/error.hpp>
#include <fmt/format.h>

namespace dirserve {

std::string_view to_string(const error_code code) noexcept {
    switch (code) {
        case error_code::outside_jail:        return "outside_jail";
        case error_code::filesystem_error:    return "filesystem_error";
        case error_code::stream_closed:       return "stream_closed";
        case error_code::invalid_argument:    return "invalid_argument";
        case error_code::io_error:            return "io_error";
        case error_code::invalid_header:      return "invalid_header";
        case error_code::corrupt_archive:     return "corrupt_archive";
        case error_code::unsupported_feature: return "unsupported_feature";
        case error_code::end_of_archive:      return "end_of_archive";
    }
    return "unknown";
}

error make_filesystem_error(std::string_view what, std::string_view path, const std::error_code ec) {
    return error{error_code::filesystem_error, fmt::format("{} '{}': {}", what, path, ec.message())};
}

} // namespace dirserve
