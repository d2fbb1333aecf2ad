#include "core/SequenceService.hpp"

#include <stdexcept>
#include <utility>

#include "logging/Log.h"

namespace core {
namespace {
constexpr logging::LogCategory kLogCategory = logging::LogCategory::SEQ;
}

SequenceService::SequenceService(std::shared_ptr<domain::contracts::ISequenceCounter> counter)
    : counter_(std::move(counter)) {
    if (!counter_) {
        throw std::invalid_argument("SequenceService requires a counter");
    }
}

std::optional<domain::SequenceNumber> SequenceService::next(const domain::TenantId& tenantId) {
    if (tenantId.empty()) {
        LOG_WARN(kLogCategory, "SequenceService rejected empty tenant id");
        return std::nullopt;
    }

    // Held across the counter call so lastIssued_ observes values in issue order.
    std::lock_guard<std::mutex> lock(mutex_);
    auto value = counter_->next(tenantId);
    if (!value) {
        LOG_ERROR(kLogCategory, "SequenceService allocation failed tenant=%s", tenantId.c_str());
        return std::nullopt;
    }

    auto [it, inserted] = lastIssued_.try_emplace(tenantId, *value);
    if (!inserted) {
        if (*value <= it->second) {
            LOG_ERROR(kLogCategory,
                      "SequenceService counter went backwards tenant=%s last=%lld got=%lld",
                      tenantId.c_str(),
                      static_cast<long long>(it->second),
                      static_cast<long long>(*value));
            return std::nullopt;
        }
        it->second = *value;
    }
    LOG_TRACE(kLogCategory, "SequenceService tenant=%s seq=%lld", tenantId.c_str(), static_cast<long long>(*value));
    return value;
}

std::optional<domain::SequenceNumber> SequenceService::lastIssued(const domain::TenantId& tenantId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = lastIssued_.find(tenantId); it != lastIssued_.end()) {
        return it->second;
    }
    return std::nullopt;
}

LocalSequenceCounter::LocalSequenceCounter(const domain::contracts::IEventLog& log) : log_(log) {}

std::optional<domain::SequenceNumber> LocalSequenceCounter::next(const domain::TenantId& tenantId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(tenantId);
    if (it == counters_.end()) {
        const auto seed = log_.highWatermark(tenantId).value_or(0);
        it = counters_.emplace(tenantId, seed).first;
        LOG_INFO(kLogCategory,
                 "LocalSequenceCounter initialized tenant=%s from=%lld",
                 tenantId.c_str(),
                 static_cast<long long>(seed));
    }
    return ++it->second;
}

}  // namespace core
