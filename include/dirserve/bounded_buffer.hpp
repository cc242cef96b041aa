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

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <span>
#include <vector>

namespace dirserve {

// Fixed-capacity byte FIFO shared by exactly one producer and one consumer.
//
// The producer blocks in write() while the buffer is full, the consumer blocks
// in read() until a full buffer (or end-of-data) is available. abort() wakes
// both sides for good.
class bounded_buffer {
public:
    explicit bounded_buffer(size_t capacity);

    bounded_buffer(const bounded_buffer&) = delete;
    bounded_buffer& operator=(const bounded_buffer&) = delete;

    // Producer side. Returns false if the buffer was aborted before all of
    // `data` could be queued.
    [[nodiscard]] bool write(std::span<const std::byte> data);

    // Producer side: no more data will follow
    void close_writer();

    // Consumer side. Blocks until `capacity()` bytes are queued, the writer
    // closed, or the buffer was aborted; then hands over everything queued.
    [[nodiscard]] std::vector<std::byte> read();

    // Either side: wake every waiter, reject further writes
    void abort();

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t high_water_mark() const;
    [[nodiscard]] bool writer_closed() const;
    [[nodiscard]] bool aborted() const;

private:
    const size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;

    std::vector<std::byte> data_;
    size_t high_water_mark_ = 0;
    bool writer_closed_ = false;
    bool aborted_ = false;
};

} // namespace dirserve
