#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/json.hpp>

#include "client/SyncStateMachine.hpp"

namespace {

using client::SyncState;
using client::SyncStateMachine;
using namespace std::chrono_literals;

domain::Event leadEvent(domain::SequenceNumber seq, domain::EventType type = domain::EventType::LeadUpdated) {
    domain::Event event;
    event.id = "evt-" + std::to_string(seq);
    event.sequenceNumber = seq;
    event.tenantId = "t1";
    event.eventType = type;
    boost::json::object payload;
    payload["id"] = "lead-42";
    payload["sequence"] = seq;
    event.payload = std::move(payload);
    event.timestamp = 1000 + seq;
    return event;
}

// nextCursor < 0 means "as the store sets it for an unfiltered batch".
std::string syncResponse(std::vector<domain::Event> events,
                         domain::SequenceNumber latest,
                         bool hasMore,
                         bool gap = false,
                         domain::SequenceNumber nextCursor = -1) {
    core::CatchUpBatch batch;
    batch.events = std::move(events);
    batch.latestSequence = latest;
    batch.hasMore = hasMore;
    batch.gap = gap;
    if (nextCursor >= 0) {
        batch.nextCursor = nextCursor;
    }
    else if (gap || !hasMore) {
        batch.nextCursor = latest;
    }
    else {
        batch.nextCursor = batch.events.empty() ? 0 : batch.events.back().sequenceNumber;
    }
    return core::wire::encodeSyncResponse(batch);
}

// Returns the lastEventId of a sync request, or -1 for anything else.
domain::SequenceNumber syncCursor(const std::string& frame) {
    const auto json = boost::json::parse(frame).as_object();
    const auto* action = json.if_contains("action");
    if (action == nullptr || !action->is_string() || action->as_string() != "sync") {
        return -1;
    }
    return json.at("lastEventId").as_int64();
}

struct Harness {
    std::vector<std::string> sent;
    std::vector<domain::SequenceNumber> applied;
    std::vector<domain::SequenceNumber> fullRefreshes;
    std::vector<SyncState> states;
    int gaveUp = 0;
    int presenceChanges = 0;

    SyncStateMachine::Callbacks callbacks() {
        SyncStateMachine::Callbacks callbacks;
        callbacks.send = [this](const std::string& text) { sent.push_back(text); };
        callbacks.onEvent = [this](const domain::Event& event) { applied.push_back(event.sequenceNumber); };
        callbacks.onFullRefresh = [this](domain::SequenceNumber latest) { fullRefreshes.push_back(latest); };
        callbacks.onStateChange = [this](SyncState, SyncState to) { states.push_back(to); };
        callbacks.onGaveUp = [this]() { ++gaveUp; };
        callbacks.onPresence = [this](const core::wire::PresenceChange&) { ++presenceChanges; };
        return callbacks;
    }
};

bool expectApplied(const Harness& harness, const std::vector<domain::SequenceNumber>& expected, const char* label) {
    if (harness.applied != expected) {
        std::cerr << label << ": applied sequence mismatch (got";
        for (auto seq : harness.applied) {
            std::cerr << ' ' << seq;
        }
        std::cerr << ")\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    SyncStateMachine::Options options;
    options.seed = 7;
    options.backoff.base = 1000ms;
    options.backoff.cap = 30000ms;
    options.backoff.maxAttempts = 3;
    options.staleTimeout = 75000ms;

    Harness harness;
    SyncStateMachine machine(options, harness.callbacks());
    int leadHandlerCalls = 0;
    machine.on(domain::EventType::LeadUpdated, [&](const domain::Event&) { ++leadHandlerCalls; });
    machine.on(domain::EventType::LeadDeleted, [](const domain::Event&) { throw std::runtime_error("handler bug"); });
    machine.setSubscriptions({domain::EventType::LeadUpdated, domain::EventType::LeadDeleted});
    if (!harness.sent.empty()) {
        std::cerr << "Subscriptions must not be sent while disconnected\n";
        return 1;
    }

    const auto t0 = SyncStateMachine::Clock::now();
    machine.onConnecting();
    machine.onTransportOpen(t0);
    if (machine.state() != SyncState::Syncing || harness.sent.size() != 2 || syncCursor(harness.sent[1]) != 0 ||
        boost::json::parse(harness.sent[0]).as_object().at("action").as_string() != "subscribe") {
        std::cerr << "Open must send subscribe then sync from 0\n";
        return 1;
    }

    // A push that races the catch-up is buffered, then applied once live.
    machine.onText(core::wire::encodeEvent(leadEvent(3)), t0);
    if (machine.bufferedEvents() != 1 || !harness.applied.empty()) {
        std::cerr << "Pushes during sync must be buffered\n";
        return 1;
    }
    machine.onText(syncResponse({leadEvent(1)}, 2, true), t0);
    if (syncCursor(harness.sent.back()) != 1 || machine.state() != SyncState::Syncing) {
        std::cerr << "hasMore must request the next page from the new cursor\n";
        return 1;
    }
    machine.onText(syncResponse({leadEvent(2)}, 3, false), t0);
    if (machine.state() != SyncState::Live || machine.cursor() != 3 || machine.bufferedEvents() != 0 ||
        !expectApplied(harness, {1, 2, 3}, "catch-up")) {
        std::cerr << "Expected live at cursor 3 after draining the buffer\n";
        return 1;
    }
    if (leadHandlerCalls != 3) {
        std::cerr << "Type handler must run for every applied event\n";
        return 1;
    }

    // Live pushes, duplicates and a failing handler.
    machine.onText(core::wire::encodeEvent(leadEvent(4)), t0);
    machine.onText(core::wire::encodeEvent(leadEvent(4)), t0);
    machine.onText(core::wire::encodeEvent(leadEvent(5, domain::EventType::LeadDeleted)), t0);
    if (!expectApplied(harness, {1, 2, 3, 4, 5}, "live") || machine.cursor() != 5) {
        return 1;
    }

    // A hole sends the machine back to syncing; the held event is applied after.
    const auto sentBeforeHole = harness.sent.size();
    machine.onText(core::wire::encodeEvent(leadEvent(7)), t0);
    if (machine.state() != SyncState::Syncing || harness.sent.size() != sentBeforeHole + 1 ||
        syncCursor(harness.sent.back()) != 5) {
        std::cerr << "Sequence hole must trigger a sync from the cursor\n";
        return 1;
    }
    machine.onText(syncResponse({leadEvent(6), leadEvent(7)}, 7, false), t0);
    if (machine.state() != SyncState::Live || machine.cursor() != 7 ||
        !expectApplied(harness, {1, 2, 3, 4, 5, 6, 7}, "hole recovery")) {
        std::cerr << "Hole recovery must apply each event exactly once\n";
        return 1;
    }

    // Ping is answered with the cursor.
    machine.onText(core::wire::encodePing(), t0);
    const auto pong = boost::json::parse(harness.sent.back()).as_object();
    if (pong.at("type").as_string() != "pong" || pong.at("lastEventId").as_int64() != 7) {
        std::cerr << "Ping must be answered with pong carrying the cursor\n";
        return 1;
    }

    // Presence is forwarded and junk is dropped without a state change.
    domain::PresenceState viewer{"u2", "Ben", domain::PresenceAction::Viewing, 5};
    machine.onText(core::wire::encodePresenceChange("lead", "lead-42", domain::PresenceSignal::Viewing, viewer), t0);
    machine.onText("{not json", t0);
    machine.onText(R"({"type":"mystery"})", t0);
    if (harness.presenceChanges != 1 || machine.state() != SyncState::Live) {
        std::cerr << "Presence must be forwarded and malformed frames ignored\n";
        return 1;
    }

    // Staleness is measured from the last inbound frame.
    const auto quietSince = t0 + 1s;
    machine.onText(core::wire::encodePing(), quietSince);
    if (machine.isStale(quietSince + 10s) || !machine.isStale(quietSince + 76s)) {
        std::cerr << "Stale detection wrong\n";
        return 1;
    }

    // Reconnect resumes from the cursor; a gap asks for a full refresh.
    auto delay = machine.onTransportClosed();
    if (!delay || *delay < 1000ms || *delay > 1500ms || machine.state() != SyncState::Disconnected) {
        std::cerr << "First reconnect delay must be within base plus jitter\n";
        return 1;
    }
    if (machine.isStale(quietSince + 1h)) {
        std::cerr << "A disconnected machine is never stale\n";
        return 1;
    }
    machine.onTransportOpen(t0 + 2s);
    if (syncCursor(harness.sent.back()) != 7) {
        std::cerr << "Reconnect must sync from the stored cursor\n";
        return 1;
    }
    machine.onText(syncResponse({}, 120, false, true), t0 + 2s);
    if (harness.fullRefreshes.size() != 1 || harness.fullRefreshes[0] != 120 || machine.cursor() != 120 ||
        machine.state() != SyncState::Live) {
        std::cerr << "Gap must trigger a full refresh and resume from latestSequence\n";
        return 1;
    }
    if (machine.reconnectAttempts() != 0) {
        std::cerr << "A successful sync must reset the backoff\n";
        return 1;
    }

    // Attempts are bounded; the machine then gives up for good.
    std::vector<std::chrono::milliseconds> delays;
    while (auto next = machine.onTransportClosed()) {
        delays.push_back(*next);
        if (delays.size() > 10) {
            break;
        }
    }
    if (delays.size() != 3 || delays[1] < 2000ms || delays[1] > 3000ms || delays[2] < 4000ms || delays[2] > 6000ms) {
        std::cerr << "Expected three exponential delays before giving up, got " << delays.size() << "\n";
        return 1;
    }
    if (machine.state() != SyncState::GaveUp || harness.gaveUp != 1) {
        std::cerr << "Machine must end in gave_up after the last attempt\n";
        return 1;
    }
    machine.onTransportOpen(t0 + 1h);
    if (machine.state() != SyncState::GaveUp || machine.onTransportClosed() || harness.gaveUp != 1) {
        std::cerr << "gave_up must be terminal\n";
        return 1;
    }
    if (std::string(client::syncStateToString(machine.state())) != "gave_up") {
        std::cerr << "Unexpected state name\n";
        return 1;
    }

    {
        // A page the server emptied by filtering still moves the cursor forward.
        Harness filtered;
        SyncStateMachine reader(options, filtered.callbacks());
        reader.setSubscriptions({domain::EventType::LeadUpdated});
        reader.onConnecting();
        reader.onTransportOpen(t0);
        reader.onText(syncResponse({}, 150, true, false, 100), t0);
        if (reader.state() != SyncState::Syncing || syncCursor(filtered.sent.back()) != 100) {
            std::cerr << "An empty page with hasMore must resume from nextCursor\n";
            return 1;
        }
        reader.onText(syncResponse({leadEvent(140)}, 150, false), t0);
        if (reader.state() != SyncState::Live || reader.cursor() != 150 ||
            !expectApplied(filtered, {140}, "filtered catch-up")) {
            std::cerr << "Filtered catch-up must end live at latestSequence\n";
            return 1;
        }

        // 151 is a type this reader did not subscribe to; the resync skips it.
        reader.onText(core::wire::encodeEvent(leadEvent(152)), t0);
        if (reader.state() != SyncState::Syncing || syncCursor(filtered.sent.back()) != 150) {
            std::cerr << "Push past an unsubscribed event must resync from the cursor\n";
            return 1;
        }
        reader.onText(syncResponse({leadEvent(152)}, 152, false), t0);
        if (reader.state() != SyncState::Live || reader.cursor() != 152 ||
            !expectApplied(filtered, {140, 152}, "unsubscribed skip")) {
            std::cerr << "Unsubscribed events must never be applied\n";
            return 1;
        }

        // A misbehaving server that repeats a non-advancing page cannot trap the reader.
        reader.onTransportClosed();
        reader.onTransportOpen(t0);
        if (syncCursor(filtered.sent.back()) != 152) {
            std::cerr << "Reopen must sync from the cursor\n";
            return 1;
        }
        const auto sentBefore = filtered.sent.size();
        reader.onText(syncResponse({}, 160, true, false, 152), t0);
        if (reader.state() != SyncState::Live || filtered.sent.size() != sentBefore) {
            std::cerr << "hasMore without progress must not loop\n";
            return 1;
        }
    }

    return 0;
}
