#include "core/EventStore.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "logging/Log.h"

namespace core {
namespace {
constexpr logging::LogCategory kLogCategory = logging::LogCategory::STORE;
}

EventStore::EventStore(std::shared_ptr<domain::contracts::IEventLog> log, Options options, NowFn now)
    : log_(std::move(log)), options_(options), now_(std::move(now)), cache_(options.cacheCapacity) {
    if (!log_) {
        throw std::invalid_argument("EventStore requires an event log");
    }
    if (!now_) {
        now_ = systemClock();
    }
    if (options_.defaultLimit == 0) {
        options_.defaultLimit = 100;
    }
}

bool EventStore::store(const domain::Event& event) {
    bool durable = false;
    try {
        durable = log_->append(event);
    }
    catch (const std::exception& ex) {
        LOG_ERROR(kLogCategory,
                  "EventStore durable append threw tenant=%s seq=%lld error=%s",
                  event.tenantId.c_str(),
                  static_cast<long long>(event.sequenceNumber),
                  ex.what());
    }
    if (!durable) {
        LOG_WARN(kLogCategory,
                 "EventStore event not persisted tenant=%s seq=%lld id=%s",
                 event.tenantId.c_str(),
                 static_cast<long long>(event.sequenceNumber),
                 event.id.c_str());
    }

    bool cached = false;
    try {
        cache_.push(event);
        cached = true;
    }
    catch (const std::exception& ex) {
        LOG_WARN(kLogCategory,
                 "EventStore cache push failed tenant=%s seq=%lld error=%s",
                 event.tenantId.c_str(),
                 static_cast<long long>(event.sequenceNumber),
                 ex.what());
    }
    return durable || cached;
}

CatchUpBatch EventStore::getEventsSince(const domain::TenantId& tenantId,
                                        domain::SequenceNumber since,
                                        std::size_t limit) {
    CatchUpBatch batch;
    if (limit == 0) {
        limit = options_.defaultLimit;
    }
    since = std::max<domain::SequenceNumber>(since, 0);
    const auto nowMs = now_();

    // One extra row tells us whether the range continues past the limit.
    const std::size_t probe = limit + 1;
    const char* source = "cache";
    auto events = cache_.readSince(tenantId, since, probe, nowMs);
    if (!events) {
        source = "log";
        events = log_->readSince(tenantId, since, probe, nowMs);
        if (!events) {
            LOG_WARN(kLogCategory,
                     "EventStore catch-up read failed tenant=%s since=%lld",
                     tenantId.c_str(),
                     static_cast<long long>(since));
            events.emplace();
        }
    }
    batch.events = std::move(*events);

    const auto watermark = log_->highWatermark(tenantId);
    batch.latestSequence = std::max(watermark.value_or(0), cache_.latestSequence(tenantId).value_or(0));
    if (!batch.events.empty()) {
        batch.latestSequence = std::max(batch.latestSequence, batch.events.back().sequenceNumber);
    }

    const bool contiguousStart = !batch.events.empty() && batch.events.front().sequenceNumber == since + 1;
    if (!contiguousStart) {
        if (since > batch.latestSequence) {
            batch.gap = true;
        }
        else if (since < batch.latestSequence) {
            const auto oldest = log_->oldestRetained(tenantId, nowMs);
            batch.gap = !oldest || *oldest > since + 1;
        }
    }

    if (batch.gap) {
        LOG_INFO(kLogCategory,
                 "EventStore cursor outside retained range tenant=%s since=%lld latest=%lld",
                 tenantId.c_str(),
                 static_cast<long long>(since),
                 static_cast<long long>(batch.latestSequence));
        batch.events.clear();
        batch.nextCursor = batch.latestSequence;
        return batch;
    }

    const bool cutAtHole = cutAtRecentHole_(batch.events, since, nowMs);

    if (batch.events.size() > limit) {
        batch.events.resize(limit);
        batch.hasMore = true;
    }

    if (batch.hasMore || cutAtHole) {
        batch.nextCursor = batch.events.empty() ? since : batch.events.back().sequenceNumber;
    }
    else {
        batch.nextCursor = std::max(since, batch.latestSequence);
    }

    LOG_DEBUG(kLogCategory,
              "EventStore catch-up tenant=%s since=%lld source=%s count=%zu has_more=%d hole=%d next=%lld",
              tenantId.c_str(),
              static_cast<long long>(since),
              source,
              batch.events.size(),
              batch.hasMore ? 1 : 0,
              cutAtHole ? 1 : 0,
              static_cast<long long>(batch.nextCursor));
    return batch;
}

bool EventStore::cutAtRecentHole_(std::vector<domain::Event>& events,
                                  domain::SequenceNumber since,
                                  domain::TimestampMs nowMs) const {
    auto expected = since + 1;
    for (std::size_t i = 0; i < events.size(); ++i) {
        const auto& event = events[i];
        if (event.sequenceNumber != expected && event.timestamp > nowMs - options_.holeGraceMs) {
            LOG_DEBUG(kLogCategory,
                      "EventStore holding back at hole tenant=%s missing=%lld next=%lld",
                      event.tenantId.c_str(),
                      static_cast<long long>(expected),
                      static_cast<long long>(event.sequenceNumber));
            events.resize(i);
            return true;
        }
        expected = event.sequenceNumber + 1;
    }
    return false;
}

std::size_t EventStore::purgeExpired() {
    const auto nowMs = now_();
    const auto cached = cache_.purgeExpired(nowMs);
    std::size_t durable = 0;
    try {
        durable = log_->purgeExpired(nowMs);
    }
    catch (const std::exception& ex) {
        LOG_WARN(kLogCategory, "EventStore purge failed: %s", ex.what());
    }
    if (cached > 0 || durable > 0) {
        LOG_DEBUG(kLogCategory, "EventStore purge cache=%zu log=%zu", cached, durable);
    }
    return durable;
}

}  // namespace core
