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

#include <dirserve/tar_writer.hpp>
#include <dirserve/header_codec.hpp>
#include <dirserve/pax.hpp>
#include <dirserve/stream.hpp>
#include <algorithm>
#include <array>
#include <cerrno>
#include <grp.h>
#include <pwd.h>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <sys/sysmacros.h>
#include <unistd.h>

namespace dirserve {

namespace {

constexpr size_t CHUNK_SIZE = 64 * 1024;
constexpr std::array<std::byte, detail::BLOCK_SIZE> zero_block{};

error cancelled() {
    return error{error_code::stream_closed, "Archive cancelled"};
}

std::chrono::system_clock::time_point to_time_point(const struct timespec& ts) {
    return std::chrono::system_clock::time_point{
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::seconds{ts.tv_sec} + std::chrono::nanoseconds{ts.tv_nsec})};
}

// Buffer size hint for the reentrant passwd/group lookups
size_t lookup_buffer_size(const int name) {
    const long size = ::sysconf(name);
    return size > 0 ? static_cast<size_t>(size) : 16384;
}

} // anonymous namespace

tar_writer::tar_writer(std::ostream& out)
    : out_(out), chunk_(CHUNK_SIZE) {}

auto tar_writer::write_raw(std::span<const std::byte> data) -> std::expected<void, error> {
    out_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out_) {
        return std::unexpected(error{error_code::io_error, "Failed to write archive data"});
    }
    stats_.archive_bytes += data.size();
    return {};
}

auto tar_writer::add_entry(const file_metadata& meta) -> std::expected<void, error> {
    if (finished_) {
        return std::unexpected(error{error_code::invalid_argument, "Archive already finished"});
    }

    if (!detail::fits_ustar(meta)) {
        const std::string records = pax::extended_records(meta);
        if (!records.empty()) {
            const auto header = detail::encode_header(pax::extended_header_for(meta, records.size()));
            if (auto result = write_raw(header); !result) {
                return result;
            }
            if (auto result = write_raw(std::as_bytes(std::span{records})); !result) {
                return result;
            }
            if (auto result = pad(records.size()); !result) {
                return result;
            }
        }
    }

    if (auto result = write_raw(detail::encode_header(meta)); !result) {
        return result;
    }
    ++stats_.entries;
    return {};
}

auto tar_writer::write_payload(std::span<const std::byte> data) -> std::expected<void, error> {
    if (auto result = write_raw(data); !result) {
        return result;
    }
    stats_.payload_bytes += data.size();
    return {};
}

auto tar_writer::pad(const uint64_t size) -> std::expected<void, error> {
    if (const size_t padding = detail::padding_for(size); padding > 0) {
        return write_raw(std::span{zero_block}.first(padding));
    }
    return {};
}

auto tar_writer::finish() -> std::expected<void, error> {
    if (finished_) {
        return {};
    }

    for (int i = 0; i < 2; ++i) {
        if (auto result = write_raw(zero_block); !result) {
            return result;
        }
    }

    out_.flush();
    if (!out_) {
        return std::unexpected(error{error_code::io_error, "Failed to flush archive"});
    }

    finished_ = true;
    return {};
}

auto tar_writer::add_tree(const std::filesystem::path& root,
                          const exclude_fn& exclude,
                          std::stop_token stop) -> std::expected<void, error> {
    // The root is followed so that a symlinked directory can be archived
    std::error_code ec;
    const auto status = std::filesystem::status(root, ec);
    if (ec) {
        return std::unexpected(make_filesystem_error("Cannot access", root.string(), ec));
    }
    if (!std::filesystem::is_directory(status)) {
        return std::unexpected(error{error_code::filesystem_error,
            "Not a directory: '" + root.string() + "'"});
    }

    return add_directory(root, "", exclude, stop);
}

auto tar_writer::add_directory(const std::filesystem::path& directory,
                               const std::string& prefix,
                               const exclude_fn& exclude,
                               const std::stop_token& stop) -> std::expected<void, error> {
    std::error_code ec;
    std::vector<std::filesystem::path> children;
    for (std::filesystem::directory_iterator it{directory, ec}, end; !ec && it != end; it.increment(ec)) {
        children.push_back(it->path());
    }
    if (ec) {
        return std::unexpected(make_filesystem_error("Cannot list directory", directory.string(), ec));
    }

    std::ranges::sort(children, {}, [](const std::filesystem::path& p) { return p.filename().native(); });

    for (const auto& child : children) {
        if (stop.stop_requested()) {
            return std::unexpected(cancelled());
        }
        if (exclude && exclude(child)) {
            spdlog::debug("Excluded '{}'", child.string());
            continue;
        }
        if (auto result = add_path(child, prefix + child.filename().generic_string(), exclude, stop); !result) {
            return result;
        }
    }

    return {};
}

auto tar_writer::add_path(const std::filesystem::path& path,
                          const std::string& name,
                          const exclude_fn& exclude,
                          const std::stop_token& stop) -> std::expected<void, error> {
    struct stat st{};
    if (::lstat(path.c_str(), &st) != 0) {
        return std::unexpected(make_filesystem_error("Cannot stat", path.string(),
            std::error_code{errno, std::generic_category()}));
    }

    file_metadata meta;
    meta.path = name;
    meta.mode = static_cast<uint32_t>(st.st_mode & 07777);
    meta.owner_id = st.st_uid;
    meta.group_id = st.st_gid;
    meta.modification_time = to_time_point(st.st_mtim);
    meta.owner_name = user_name(st.st_uid);
    meta.group_name = group_name(st.st_gid);

    if (S_ISDIR(st.st_mode)) {
        meta.type = entry_type::directory;
        meta.path += '/';
        if (auto result = add_entry(meta); !result) {
            return result;
        }
        return add_directory(path, meta.path, exclude, stop);
    }

    if (S_ISREG(st.st_mode)) {
        if (st.st_nlink > 1) {
            const auto key = std::pair{static_cast<uint64_t>(st.st_dev), static_cast<uint64_t>(st.st_ino)};
            if (const auto it = hard_links_.find(key); it != hard_links_.end()) {
                meta.type = entry_type::hard_link;
                meta.link_target = it->second;
                return add_entry(meta);
            }
            hard_links_.emplace(key, name);
        }

        meta.type = entry_type::regular_file;
        meta.size = static_cast<uint64_t>(st.st_size);
        if (auto result = add_entry(meta); !result) {
            return result;
        }
        if (auto result = add_file_contents(path, meta.size, stop); !result) {
            return result;
        }
        return pad(meta.size);
    }

    if (S_ISLNK(st.st_mode)) {
        std::error_code ec;
        const auto target = std::filesystem::read_symlink(path, ec);
        if (ec) {
            return std::unexpected(make_filesystem_error("Cannot read link", path.string(), ec));
        }
        meta.type = entry_type::symbolic_link;
        meta.link_target = target.generic_string();
        return add_entry(meta);
    }

    if (S_ISFIFO(st.st_mode)) {
        meta.type = entry_type::fifo;
        return add_entry(meta);
    }

    if (S_ISCHR(st.st_mode) || S_ISBLK(st.st_mode)) {
        meta.type = S_ISCHR(st.st_mode) ? entry_type::character_device : entry_type::block_device;
        meta.device_major = major(st.st_rdev);
        meta.device_minor = minor(st.st_rdev);
        return add_entry(meta);
    }

    spdlog::warn("Skipping '{}': sockets cannot be archived", path.string());
    return {};
}

auto tar_writer::add_file_contents(const std::filesystem::path& path,
                                   const uint64_t size,
                                   const std::stop_token& stop) -> std::expected<void, error> {
    auto file = file_stream::open(path);
    if (!file) {
        return std::unexpected(file.error());
    }

    uint64_t remaining = size;
    while (remaining > 0) {
        if (stop.stop_requested()) {
            return std::unexpected(cancelled());
        }

        const size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, chunk_.size()));
        auto read = file->read(std::span{chunk_}.first(want));
        if (!read) {
            return std::unexpected(error{error_code::filesystem_error,
                "Cannot read '" + path.string() + "': " + read.error().message()});
        }
        if (*read == 0) {
            return std::unexpected(error{error_code::filesystem_error,
                "File '" + path.string() + "' shrank while being archived"});
        }

        if (auto result = write_payload(std::span{chunk_}.first(*read)); !result) {
            return result;
        }
        remaining -= *read;
    }

    std::array<std::byte, 1> probe{};
    auto extra = file->read(probe);
    if (!extra) {
        return std::unexpected(error{error_code::filesystem_error,
            "Cannot read '" + path.string() + "': " + extra.error().message()});
    }
    if (*extra != 0) {
        return std::unexpected(error{error_code::filesystem_error,
            "File '" + path.string() + "' grew while being archived"});
    }

    return {};
}

const std::string& tar_writer::user_name(const uint64_t uid) {
    if (const auto it = user_names_.find(uid); it != user_names_.end()) {
        return it->second;
    }

    std::string name;
    std::vector<char> buffer(lookup_buffer_size(_SC_GETPW_R_SIZE_MAX));
    struct passwd pwd{};
    struct passwd* result = nullptr;
    if (::getpwuid_r(static_cast<uid_t>(uid), &pwd, buffer.data(), buffer.size(), &result) == 0 && result) {
        name = result->pw_name;
    }

    return user_names_.emplace(uid, std::move(name)).first->second;
}

const std::string& tar_writer::group_name(const uint64_t gid) {
    if (const auto it = group_names_.find(gid); it != group_names_.end()) {
        return it->second;
    }

    std::string name;
    std::vector<char> buffer(lookup_buffer_size(_SC_GETGR_R_SIZE_MAX));
    struct group grp{};
    struct group* result = nullptr;
    if (::getgrgid_r(static_cast<gid_t>(gid), &grp, buffer.data(), buffer.size(), &result) == 0 && result) {
        name = result->gr_name;
    }

    return group_names_.emplace(gid, std::move(name)).first->second;
}

} // namespace dirserve
