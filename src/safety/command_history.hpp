#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <shared_mutex>
#include <vector>
#include "protocol/command_contract.hpp"

namespace warden::safety {

// Bounded FIFO of CommandRecords. Oldest entries are evicted first.
class CommandHistory {
public:
    explicit CommandHistory(std::size_t capacity = 1000);

    void append(protocol::CommandRecord record);

    // Newest first.
    std::vector<protocol::CommandRecord> recent(std::size_t limit) const;
    // Oldest first.
    std::vector<protocol::CommandRecord> snapshot() const;

    // Returns the number of records removed.
    std::size_t clear_older_than(std::chrono::system_clock::time_point cutoff);

    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }

private:
    mutable std::shared_mutex mutex_;
    std::deque<protocol::CommandRecord> records_;
    std::size_t capacity_;
};

}  // namespace warden::safety
