#include "safety/command_history.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

namespace warden::safety {

CommandHistory::CommandHistory(const std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void CommandHistory::append(protocol::CommandRecord record) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    records_.push_back(std::move(record));
    while (records_.size() > capacity_) {
        records_.pop_front();
    }
}

std::vector<protocol::CommandRecord> CommandHistory::recent(const std::size_t limit) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<protocol::CommandRecord> out;
    const std::size_t count = std::min(limit, records_.size());
    out.reserve(count);
    for (auto it = records_.rbegin(); it != records_.rend() && out.size() < count; ++it) {
        out.push_back(*it);
    }
    return out;
}

std::vector<protocol::CommandRecord> CommandHistory::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return {records_.begin(), records_.end()};
}

std::size_t CommandHistory::clear_older_than(
    const std::chrono::system_clock::time_point cutoff) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const std::size_t before = records_.size();
    records_.erase(std::remove_if(records_.begin(), records_.end(),
                                  [&](const protocol::CommandRecord& record) {
                                      return record.timestamp <= cutoff;
                                  }),
                   records_.end());
    return before - records_.size();
}

std::size_t CommandHistory::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return records_.size();
}

}  // namespace warden::safety
