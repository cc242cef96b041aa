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

#include <dirserve/archive_reader.hpp>
#include <dirserve/pax.hpp>
#include <algorithm>

namespace dirserve {

auto archive_reader::from_stream(std::unique_ptr<input_stream> stream) -> std::expected<archive_reader, error> {
    if (!stream) {
        return std::unexpected(error{error_code::invalid_argument, "Null stream provided"});
    }

    return archive_reader{std::move(stream)};
}

auto archive_reader::read_block() -> std::expected<detail::header_block, error> {
    detail::header_block block{};
    size_t filled = 0;

    while (filled < detail::BLOCK_SIZE) {
        auto result = stream_->read(std::span{block}.subspan(filled));
        if (!result) {
            return std::unexpected(result.error());
        }
        if (*result == 0) {
            if (filled == 0 && stream_->at_end()) {
                return std::unexpected(error{error_code::end_of_archive, "Unexpected end of archive"});
            }
            return std::unexpected(error{error_code::corrupt_archive, "Incomplete block read"});
        }
        filled += *result;
    }

    return block;
}

auto archive_reader::read_payload(const uint64_t size) -> std::expected<std::vector<std::byte>, error> {
    std::vector<std::byte> data(static_cast<size_t>(size));
    size_t filled = 0;

    while (filled < data.size()) {
        auto result = stream_->read(std::span{data}.subspan(filled));
        if (!result) {
            return std::unexpected(result.error());
        }
        if (*result == 0) {
            return std::unexpected(error{error_code::corrupt_archive, "Unexpected end of member data"});
        }
        filled += *result;
    }

    if (const size_t padding = detail::padding_for(size); padding > 0) {
        if (auto skip_result = stream_->skip(padding); !skip_result) {
            return std::unexpected(skip_result.error());
        }
    }

    return data;
}

auto archive_reader::skip_current_entry_data() -> std::expected<void, error> {
    const uint64_t to_skip = current_entry_data_remaining_ + current_entry_padding_;
    if (to_skip > 0) {
        if (auto skip_result = stream_->skip(static_cast<size_t>(to_skip)); !skip_result) {
            return std::unexpected(skip_result.error());
        }
    }

    current_entry_data_remaining_ = 0;
    current_entry_padding_ = 0;
    return {};
}

auto archive_reader::next_entry() -> std::expected<std::optional<file_metadata>, error> {
    if (finished_) {
        return std::nullopt;
    }

    if (auto skip_result = skip_current_entry_data(); !skip_result) {
        return std::unexpected(skip_result.error());
    }
    current_entry_.reset();

    // Extension records (PAX, GNU long names) describe the entry that follows
    while (true) {
        auto block_result = read_block();
        if (!block_result) {
            if (block_result.error().code() == error_code::end_of_archive) {
                return std::unexpected(error{error_code::corrupt_archive,
                    "Archive truncated before end-of-archive marker"});
            }
            return std::unexpected(block_result.error());
        }

        if (detail::is_zero_block(*block_result)) {
            if (auto second_block = read_block(); second_block && detail::is_zero_block(*second_block)) {
                finished_ = true;
                return std::nullopt;
            }
            return std::unexpected(error{error_code::corrupt_archive, "Single zero block in archive"});
        }

        auto metadata_result = detail::parse_header(*block_result);
        if (!metadata_result) {
            return std::unexpected(metadata_result.error());
        }
        auto& meta = *metadata_result;

        if (meta.type == entry_type::pax_extended_header) {
            auto records = read_payload(meta.size);
            if (!records) {
                return std::unexpected(records.error());
            }
            auto parsed = pax::parse_pax_headers(*records);
            if (!parsed) {
                return std::unexpected(parsed.error());
            }
            pending_pax_headers_ = std::move(*parsed);
            continue;
        }

        if (meta.type == entry_type::pax_global_header) {
            if (auto skipped = read_payload(meta.size); !skipped) {
                return std::unexpected(skipped.error());
            }
            continue;
        }

        if (meta.is_gnu_extension()) {
            auto payload = read_payload(meta.size);
            if (!payload) {
                return std::unexpected(payload.error());
            }
            std::string text(reinterpret_cast<const char*>(payload->data()), payload->size());
            while (!text.empty() && text.back() == '\0') {
                text.pop_back();
            }
            if (meta.type == entry_type::gnu_longname) {
                pending_longname_ = std::move(text);
            } else {
                pending_longlink_ = std::move(text);
            }
            continue;
        }

        if (pending_longname_) {
            meta.path = std::move(*pending_longname_);
            pending_longname_.reset();
        }
        if (pending_longlink_) {
            meta.link_target = std::move(*pending_longlink_);
            pending_longlink_.reset();
        }
        if (!pending_pax_headers_.empty()) {
            pax::apply_pax_headers(meta, pending_pax_headers_);
            pending_pax_headers_.clear();
        }

        current_entry_data_remaining_ = meta.has_payload() ? meta.size : 0;
        current_entry_padding_ = detail::padding_for(current_entry_data_remaining_);
        current_entry_ = meta;
        return current_entry_;
    }
}

auto archive_reader::read_data() -> std::expected<std::vector<std::byte>, error> {
    if (!current_entry_) {
        return std::unexpected(error{error_code::invalid_argument, "No current entry"});
    }

    const uint64_t size = current_entry_data_remaining_;
    current_entry_data_remaining_ = 0;
    current_entry_padding_ = 0;
    return read_payload(size);
}

auto read_archive(std::unique_ptr<input_stream> stream) -> std::expected<std::vector<archive_member>, error> {
    auto reader = archive_reader::from_stream(std::move(stream));
    if (!reader) {
        return std::unexpected(reader.error());
    }

    std::vector<archive_member> members;
    while (true) {
        auto entry = reader->next_entry();
        if (!entry) {
            return std::unexpected(entry.error());
        }
        if (!*entry) {
            break;
        }

        auto data = reader->read_data();
        if (!data) {
            return std::unexpected(data.error());
        }
        members.push_back(archive_member{std::move(**entry), std::move(*data)});
    }

    return members;
}

} // namespace dirserve
