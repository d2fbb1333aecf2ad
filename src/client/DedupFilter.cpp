#include "client/DedupFilter.hpp"

#include <algorithm>

namespace client {

DedupFilter::DedupFilter(std::size_t capacity) : capacity_(std::max<std::size_t>(1, capacity)) {
    seen_.reserve(capacity_);
}

bool DedupFilter::isDuplicate(const std::string& eventId) {
    if (seen_.count(eventId) != 0) {
        return true;
    }

    if (order_.size() >= capacity_) {
        seen_.erase(order_.front());
        order_.pop_front();
    }
    order_.push_back(eventId);
    seen_.insert(eventId);
    return false;
}

void DedupFilter::clear() {
    order_.clear();
    seen_.clear();
}

}  // namespace client
