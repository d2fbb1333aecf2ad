#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include <unordered_set>

namespace client {

// Remembers the last `capacity` event ids in arrival order. Once an id is
// evicted it is admitted again.
class DedupFilter {
public:
    static constexpr std::size_t kDefaultCapacity = 1000;

    explicit DedupFilter(std::size_t capacity = kDefaultCapacity);

    // First call for an id records it and returns false.
    bool isDuplicate(const std::string& eventId);

    void clear();
    std::size_t size() const noexcept { return order_.size(); }
    std::size_t capacity() const noexcept { return capacity_; }

private:
    std::size_t capacity_;
    std::deque<std::string> order_;
    std::unordered_set<std::string> seen_;
};

}  // namespace client
