#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include <boost/json/object.hpp>

#include "adapters/duckdb/DuckEventLog.hpp"
#include "adapters/duckdb/DuckStore.hpp"
#include "core/EventStore.hpp"

namespace {

domain::Event makeEvent(const std::string& tenant, domain::SequenceNumber seq, domain::TimestampMs expiresAt) {
    domain::Event event;
    event.id = tenant + "-evt-" + std::to_string(seq);
    event.sequenceNumber = seq;
    event.tenantId = tenant;
    event.eventType = seq % 2 == 0 ? domain::EventType::LeadUpdated : domain::EventType::LeadCreated;
    boost::json::object payload;
    payload["id"] = "lead-" + std::to_string(seq);
    event.payload = std::move(payload);
    event.timestamp = 1000 + seq;
    event.expiresAt = expiresAt;
    return event;
}

bool expectRange(const core::CatchUpBatch& batch,
                 domain::SequenceNumber first,
                 domain::SequenceNumber last,
                 const char* label) {
    const auto expected = static_cast<std::size_t>(last - first + 1);
    if (batch.events.size() != expected) {
        std::cerr << label << ": expected " << expected << " events, got " << batch.events.size() << "\n";
        return false;
    }
    for (std::size_t i = 0; i < batch.events.size(); ++i) {
        if (batch.events[i].sequenceNumber != first + static_cast<domain::SequenceNumber>(i)) {
            std::cerr << label << ": out of order at index " << i << "\n";
            return false;
        }
    }
    return true;
}

}  // namespace

int main() {
    adapters::duckdb::DuckStore duck(":memory:");
    duck.migrate();
    auto log = std::make_shared<adapters::duckdb::DuckEventLog>(duck);

    auto clock = std::make_shared<std::int64_t>(5000);
    core::NowFn now = [clock]() { return *clock; };
    core::EventStore::Options options;
    options.cacheCapacity = 100;

    core::EventStore store(log, options, now);
    for (domain::SequenceNumber seq = 1; seq <= 10; ++seq) {
        if (!store.store(makeEvent("t1", seq, 1'000'000))) {
            std::cerr << "store() failed for seq " << seq << "\n";
            return 1;
        }
    }

    {
        auto batch = store.getEventsSince("t1", 4, 100);
        if (!expectRange(batch, 5, 10, "cache catch-up") || batch.hasMore || batch.gap || batch.latestSequence != 10 ||
            batch.nextCursor != 10) {
            std::cerr << "Unexpected batch flags for cache catch-up\n";
            return 1;
        }
        if (batch.events.front().id != "t1-evt-5" || !batch.events.front().payload.is_object()) {
            std::cerr << "Event content not preserved\n";
            return 1;
        }
    }

    {
        // Cold start: nothing in the cache, the log answers.
        core::EventStore cold(log, options, now);
        auto batch = cold.getEventsSince("t1", 4, 100);
        if (!expectRange(batch, 5, 10, "log catch-up") || batch.gap || batch.latestSequence != 10) {
            return 1;
        }
        const auto& payload = batch.events.front().payload.as_object();
        if (payload.at("id").as_string() != "lead-5" || batch.events.front().eventType != domain::EventType::LeadCreated) {
            std::cerr << "Log round trip lost event fields\n";
            return 1;
        }
    }

    {
        // Paging: limit 3 takes four rounds and only the last has no more.
        domain::SequenceNumber cursor = 0;
        int rounds = 0;
        while (true) {
            auto batch = store.getEventsSince("t1", cursor, 3);
            ++rounds;
            if (batch.gap || batch.events.empty()) {
                std::cerr << "Paging stalled at cursor " << cursor << "\n";
                return 1;
            }
            if (batch.nextCursor != batch.events.back().sequenceNumber) {
                std::cerr << "nextCursor must follow the last event of a page\n";
                return 1;
            }
            cursor = batch.nextCursor;
            if (!batch.hasMore) {
                break;
            }
            if (batch.events.size() != 3) {
                std::cerr << "Full pages must carry exactly the limit\n";
                return 1;
            }
        }
        if (rounds != 4 || cursor != 10) {
            std::cerr << "Expected 4 rounds ending at 10, got " << rounds << " ending at " << cursor << "\n";
            return 1;
        }
    }

    {
        // Up to date and tenant isolation.
        auto current = store.getEventsSince("t1", 10, 100);
        auto other = store.getEventsSince("t2", 0, 100);
        if (!current.events.empty() || current.gap || current.hasMore) {
            std::cerr << "Cursor at latest must return an empty, gapless batch\n";
            return 1;
        }
        if (!other.events.empty() || other.gap || other.latestSequence != 0) {
            std::cerr << "Other tenant must see nothing of t1\n";
            return 1;
        }
    }

    {
        // t4 has 1..3 and 5; seq 4 is still being appended by another emitter.
        for (domain::SequenceNumber seq = 1; seq <= 3; ++seq) {
            store.store(makeEvent("t4", seq, 1'000'000));
        }
        auto late = makeEvent("t4", 5, 1'000'000);
        late.timestamp = *clock;
        store.store(late);

        auto held = store.getEventsSince("t4", 0, 100);
        if (!expectRange(held, 1, 3, "recent hole") || held.hasMore || held.gap || held.nextCursor != 3 ||
            held.latestSequence != 5) {
            std::cerr << "A recent hole must end the batch before it\n";
            return 1;
        }
        auto atHole = store.getEventsSince("t4", 3, 100);
        if (!atHole.events.empty() || atHole.gap || atHole.nextCursor != 3) {
            std::cerr << "A cursor right before a recent hole must not move\n";
            return 1;
        }

        // Once the grace period passes the missing event is treated as lost.
        *clock += 3000;
        auto skipped = store.getEventsSince("t4", 3, 100);
        if (skipped.events.size() != 1 || skipped.events.front().sequenceNumber != 5 || skipped.gap ||
            skipped.nextCursor != 5) {
            std::cerr << "An old hole must be skipped\n";
            return 1;
        }
        *clock -= 3000;
    }

    {
        // Cursor ahead of anything known is a gap.
        auto batch = store.getEventsSince("t1", 50, 100);
        if (!batch.gap || !batch.events.empty() || batch.latestSequence != 10) {
            std::cerr << "Cursor ahead of latest must be reported as a gap\n";
            return 1;
        }
    }

    // t3: 1..5 expire at 2000 ms, 6..10 stay.
    for (domain::SequenceNumber seq = 1; seq <= 10; ++seq) {
        store.store(makeEvent("t3", seq, seq <= 5 ? 2000 : 1'000'000));
    }

    {
        auto batch = store.getEventsSince("t3", 2, 100);
        if (!batch.gap || !batch.events.empty() || batch.latestSequence != 10) {
            std::cerr << "Cursor before retention must be a gap\n";
            return 1;
        }
        auto edge = store.getEventsSince("t3", 5, 100);
        if (edge.gap || !expectRange(edge, 6, 10, "retention edge")) {
            std::cerr << "Cursor right before the oldest retained event is not a gap\n";
            return 1;
        }
        core::EventStore cold(log, options, now);
        auto coldGap = cold.getEventsSince("t3", 0, 100);
        if (!coldGap.gap) {
            std::cerr << "Log-only read must detect the same gap\n";
            return 1;
        }
    }

    {
        // Purge removes rows but never lowers the watermark.
        const auto before = log->rowCount("t3").value_or(0);
        const auto purged = store.purgeExpired();
        const auto after = log->rowCount("t3").value_or(0);
        if (before != 10 || purged != 5 || after != 5) {
            std::cerr << "Unexpected purge result before=" << before << " purged=" << purged << " after=" << after
                      << "\n";
            return 1;
        }
        if (log->highWatermark("t3").value_or(0) != 10 || log->oldestRetained("t3", *clock).value_or(0) != 6) {
            std::cerr << "Watermark or oldest retained wrong after purge\n";
            return 1;
        }
        if (log->rowCount("t1").value_or(0) != 10) {
            std::cerr << "Purge touched unexpired rows\n";
            return 1;
        }
    }

    {
        // Everything expired: the watermark still anchors latestSequence.
        *clock = 2'000'000;
        store.purgeExpired();
        core::EventStore cold(log, options, now);
        auto batch = cold.getEventsSince("t1", 3, 100);
        if (!batch.gap || batch.latestSequence != 10) {
            std::cerr << "Fully expired tenant must report a gap at the watermark\n";
            return 1;
        }
        auto caughtUp = cold.getEventsSince("t1", 10, 100);
        if (caughtUp.gap) {
            std::cerr << "Cursor at the watermark is not a gap even with nothing retained\n";
            return 1;
        }
    }

    return 0;
}
