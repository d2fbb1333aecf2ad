#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "core/EventCache.hpp"
#include "core/TimeUtils.h"
#include "domain/Ports.hpp"

namespace core {

struct CatchUpBatch {
    std::vector<domain::Event> events;
    bool hasMore = false;
    // The cursor predates retention (or is ahead of anything this store knows);
    // the client must refresh its state and resume from latestSequence.
    bool gap = false;
    domain::SequenceNumber latestSequence = 0;
    // Highest sequence this batch accounts for, including rows a reader is not
    // allowed to see. The next request resumes from here.
    domain::SequenceNumber nextCursor = 0;
};

class EventStore {
public:
    struct Options {
        std::size_t cacheCapacity = 1000;
        std::size_t defaultLimit = 100;
        // A hole younger than this is an append still in flight and ends the
        // batch; an older one is a lost write and is skipped.
        std::int64_t holeGraceMs = 2000;
    };

    EventStore(std::shared_ptr<domain::contracts::IEventLog> log, Options options, NowFn now = systemClock());

    // Best effort on both tiers; never throws. Returns false only when neither
    // tier accepted the event.
    bool store(const domain::Event& event);

    CatchUpBatch getEventsSince(const domain::TenantId& tenantId, domain::SequenceNumber since, std::size_t limit);

    // Drops expired rows from the log and expired entries from the cache.
    std::size_t purgeExpired();

    const EventCache& cache() const { return cache_; }
    std::size_t defaultLimit() const noexcept { return options_.defaultLimit; }

private:
    // Truncates events at the first hole whose successor is younger than
    // holeGraceMs. Returns true when it cut.
    bool cutAtRecentHole_(std::vector<domain::Event>& events,
                          domain::SequenceNumber since,
                          domain::TimestampMs nowMs) const;

    std::shared_ptr<domain::contracts::IEventLog> log_;
    Options options_;
    NowFn now_;
    EventCache cache_;
};

}  // namespace core
