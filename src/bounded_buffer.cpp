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

#include <dirserve/bounded_buffer.hpp>
#include <algorithm>

namespace dirserve {

bounded_buffer::bounded_buffer(const size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)) {
    data_.reserve(capacity_);
}

bool bounded_buffer::write(std::span<const std::byte> data) {
    std::unique_lock lock{mutex_};

    while (!data.empty()) {
        not_full_.wait(lock, [this] { return aborted_ || data_.size() < capacity_; });
        if (aborted_) {
            return false;
        }

        const size_t room = capacity_ - data_.size();
        const size_t count = std::min(room, data.size());
        data_.insert(data_.end(), data.begin(), data.begin() + static_cast<std::ptrdiff_t>(count));
        data = data.subspan(count);
        high_water_mark_ = std::max(high_water_mark_, data_.size());

        if (data_.size() >= capacity_) {
            not_empty_.notify_one();
        }
    }

    return true;
}

void bounded_buffer::close_writer() {
    {
        std::lock_guard lock{mutex_};
        writer_closed_ = true;
    }
    not_empty_.notify_all();
}

std::vector<std::byte> bounded_buffer::read() {
    std::unique_lock lock{mutex_};
    not_empty_.wait(lock, [this] {
        return aborted_ || writer_closed_ || data_.size() >= capacity_;
    });

    std::vector<std::byte> chunk;
    chunk.reserve(capacity_);
    chunk.swap(data_);
    lock.unlock();

    not_full_.notify_one();
    return chunk;
}

void bounded_buffer::abort() {
    {
        std::lock_guard lock{mutex_};
        aborted_ = true;
        data_.clear();
    }
    not_full_.notify_all();
    not_empty_.notify_all();
}

size_t bounded_buffer::size() const {
    std::lock_guard lock{mutex_};
    return data_.size();
}

size_t bounded_buffer::high_water_mark() const {
    std::lock_guard lock{mutex_};
    return high_water_mark_;
}

bool bounded_buffer::writer_closed() const {
    std::lock_guard lock{mutex_};
    return writer_closed_;
}

bool bounded_buffer::aborted() const {
    std::lock_guard lock{mutex_};
    return aborted_;
}

} // namespace dirserve
