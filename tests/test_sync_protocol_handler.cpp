#include <iostream>
#include <stdexcept>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <boost/json.hpp>

#include "FakeConnection.hpp"
#include "adapters/duckdb/DuckEventLog.hpp"
#include "adapters/duckdb/DuckSequenceCounter.hpp"
#include "adapters/duckdb/DuckStore.hpp"
#include "app/EventEmitter.hpp"
#include "app/SyncProtocolHandler.hpp"
#include "client/SyncStateMachine.hpp"
#include "common/Metrics.hpp"

namespace {

std::string frameType(const std::string& frame) {
    const auto json = boost::json::parse(frame).as_object();
    if (const auto* type = json.if_contains("type"); type != nullptr && type->is_string()) {
        return std::string(type->as_string().c_str());
    }
    return "event";
}

core::CatchUpBatch lastSyncResponse(const FakeConnection& connection) {
    const auto message = core::wire::decodeServerMessage(connection.lastFrame());
    if (const auto* response = std::get_if<core::wire::SyncResponse>(&message)) {
        return response->batch;
    }
    throw std::runtime_error("last frame is not a sync_response: " + connection.lastFrame());
}

boost::json::object entity(const std::string& id) {
    boost::json::object obj;
    obj["id"] = id;
    return obj;
}

std::size_t countType(const FakeConnection& connection, const std::string& type) {
    std::size_t count = 0;
    for (const auto& frame : connection.frames()) {
        if (frameType(frame) == type) {
            ++count;
        }
    }
    return count;
}

}  // namespace

int main() {
    try {
        adapters::duckdb::DuckStore duck(":memory:");
        duck.migrate();
        auto log = std::make_shared<adapters::duckdb::DuckEventLog>(duck);
        auto store = std::make_shared<core::EventStore>(log, core::EventStore::Options{});
        auto registry = std::make_shared<core::ConnectionRegistry>();
        auto presence = std::make_shared<core::PresenceTracker>();
        auto sequences =
            std::make_shared<core::SequenceService>(std::make_shared<adapters::duckdb::DuckSequenceCounter>(duck));
        app::EventEmitter emitter(sequences, store, registry, app::EventEmitter::Options{});

        app::SyncProtocolHandler::Options options;
        options.syncBatchLimit = 100;
        options.maxProtocolErrors = 5;
        app::SyncProtocolHandler handler(store, registry, presence, options);

        auto ana = std::make_shared<FakeConnection>("c1", "t1", "u1");
        auto ben = std::make_shared<FakeConnection>("c2", "t1", "u2");
        auto other = std::make_shared<FakeConnection>("c3", "t2", "u3");
        handler.onOpen(ana, "Ana");
        handler.onOpen(ben, "Ben");
        handler.onOpen(other, "Cy");
        if (registry->connectionCount() != 3) {
            std::cerr << "onOpen must register connections\n";
            return 1;
        }

        // Live fanout stays inside the tenant.
        for (int i = 1; i <= 3; ++i) {
            emitter.emitLeadCreated("t1", entity("lead-" + std::to_string(i)));
        }
        if (countType(*ana, "event") != 3 || countType(*ben, "event") != 3 || !other->frames().empty()) {
            std::cerr << "Expected three pushes to t1 connections only\n";
            return 1;
        }

        // Catch-up from a cursor.
        auto& metrics = tsync::common::metrics::Registry::instance();
        const auto syncKey = tsync::common::metrics::tenantKey("sync_requests_total", "t1");
        const auto reconnectKey = tsync::common::metrics::tenantKey("reconnections_total", "t1");
        const auto syncsBefore = metrics.counter(syncKey);
        const auto reconnectsBefore = metrics.counter(reconnectKey);
        if (!handler.onMessage(ana, core::wire::encodeSync(1))) {
            std::cerr << "sync must keep the session open\n";
            return 1;
        }
        auto batch = lastSyncResponse(*ana);
        if (batch.events.size() != 2 || batch.events[0].sequenceNumber != 2 || batch.latestSequence != 3 ||
            batch.gap || batch.hasMore) {
            std::cerr << "Unexpected catch-up batch\n";
            return 1;
        }
        handler.onMessage(ben, core::wire::encodeSync(0));
        if (metrics.counter(syncKey) != syncsBefore + 2 || metrics.counter(reconnectKey) != reconnectsBefore + 1) {
            std::cerr << "sync and reconnection counters not updated\n";
            return 1;
        }

        // Lifecycle events go to their user only, live and on catch-up.
        ana->clear();
        ben->clear();
        emitter.emitAccountLocked("t1", "u2", boost::json::object{{"reason", "too many attempts"}});
        if (!ana->frames().empty() || countType(*ben, "event") != 1) {
            std::cerr << "Lifecycle push must reach only the target user\n";
            return 1;
        }
        handler.onMessage(ana, core::wire::encodeSync(3));
        auto anaBatch = lastSyncResponse(*ana);
        handler.onMessage(ben, core::wire::encodeSync(3));
        auto benBatch = lastSyncResponse(*ben);
        if (!anaBatch.events.empty() || anaBatch.latestSequence != 4 || benBatch.events.size() != 1) {
            std::cerr << "Lifecycle event leaked into another user's catch-up\n";
            return 1;
        }

        // Subscriptions narrow live pushes.
        handler.onMessage(ben, R"({"action":"subscribe","events":["case_created"]})");
        ana->clear();
        ben->clear();
        emitter.emitLeadUpdated("t1", entity("lead-1"));
        emitter.emitCaseCreated("t1", entity("case-1"));
        if (countType(*ana, "event") != 2 || countType(*ben, "event") != 1) {
            std::cerr << "Subscription filter not applied to live pushes\n";
            return 1;
        }

        // Catch-up honors the same subscriptions and still accounts for what it withheld.
        handler.onMessage(ben, core::wire::encodeSync(4));
        auto subscribedBatch = lastSyncResponse(*ben);
        if (subscribedBatch.events.size() != 1 || subscribedBatch.events[0].eventType != domain::EventType::CaseCreated ||
            subscribedBatch.nextCursor != 6 || subscribedBatch.hasMore) {
            std::cerr << "Catch-up must skip unsubscribed types and resume past them\n";
            return 1;
        }
        handler.onMessage(ana, core::wire::encodeSync(3));
        if (lastSyncResponse(*ana).events.size() != 2) {
            std::cerr << "A connection without subscriptions sees every shared type\n";
            return 1;
        }

        {
            // Pages made only of another user's lifecycle events must not stall a reader.
            app::SyncProtocolHandler::Options smallPages;
            smallPages.syncBatchLimit = 3;
            app::SyncProtocolHandler pagedHandler(store, registry, presence, smallPages);
            auto dana = std::make_shared<FakeConnection>("c9", "t9", "u1");
            pagedHandler.onOpen(dana, "Dana");
            for (int i = 0; i < 7; ++i) {
                emitter.emitSessionInvalidated("t9", "u2", boost::json::object{{"reason", "admin logout"}});
            }
            emitter.emitLeadCreated("t9", entity("lead-9"));
            dana->clear();

            std::vector<std::string> outbox;
            std::vector<domain::SequenceNumber> applied;
            client::SyncStateMachine::Options machineOptions;
            machineOptions.seed = 3;
            client::SyncStateMachine::Callbacks callbacks;
            callbacks.send = [&outbox](const std::string& text) { outbox.push_back(text); };
            callbacks.onEvent = [&applied](const domain::Event& event) { applied.push_back(event.sequenceNumber); };
            client::SyncStateMachine machine(machineOptions, callbacks);
            machine.onConnecting();
            machine.onTransportOpen();

            int rounds = 0;
            while (!outbox.empty() && rounds < 20) {
                const auto request = outbox.front();
                outbox.erase(outbox.begin());
                ++rounds;
                dana->clear();
                pagedHandler.onMessage(dana, request);
                for (const auto& frame : dana->frames()) {
                    machine.onText(frame);
                }
            }
            if (machine.state() != client::SyncState::Live || machine.cursor() != 8 ||
                applied != std::vector<domain::SequenceNumber>{8} || rounds != 3) {
                std::cerr << "Reader must page past withheld lifecycle events and go live (rounds=" << rounds
                          << " cursor=" << machine.cursor() << ")\n";
                return 1;
            }
            pagedHandler.onClose(*dana);
        }

        // Presence: broadcast to the tenant, snapshot to the viewer.
        ana->clear();
        ben->clear();
        handler.onMessage(ana, core::wire::encodePresence("lead", "L1", domain::PresenceSignal::Viewing, ""));
        if (countType(*ben, "presence_viewing") != 1 || countType(*ana, "presence_viewing") != 1 ||
            frameType(ana->lastFrame()) != "initial_presence" || !other->frames().empty()) {
            std::cerr << "Presence frames not delivered as expected\n";
            return 1;
        }
        const auto snapshotMessage = core::wire::decodeServerMessage(ana->lastFrame());
        const auto* snapshot = std::get_if<core::wire::InitialPresence>(&snapshotMessage);
        if (snapshot == nullptr || snapshot->users.size() != 1 || snapshot->users[0].userName != "Ana") {
            std::cerr << "initial_presence must list the viewer with the session name\n";
            return 1;
        }
        handler.onMessage(ben, core::wire::encodePresence("lead", "L1", domain::PresenceSignal::Editing, "Benny"));
        if (presence->getPresence("t1", "lead", "L1").size() != 2) {
            std::cerr << "Expected two users on L1\n";
            return 1;
        }
        handler.onMessage(ben, core::wire::encodePresence("lead", "L1", domain::PresenceSignal::Left, ""));
        if (presence->getPresence("t1", "lead", "L1").size() != 1 || countType(*ana, "presence_left") != 1) {
            std::cerr << "left must remove and announce\n";
            return 1;
        }

        // Presence needs a user identity.
        auto anonymous = std::make_shared<FakeConnection>("c4", "t1");
        handler.onOpen(anonymous, "");
        if (!handler.onMessage(anonymous, core::wire::encodePresence("lead", "L1", domain::PresenceSignal::Viewing, "")) ||
            frameType(anonymous->lastFrame()) != "error") {
            std::cerr << "Anonymous presence must be answered with an error\n";
            return 1;
        }

        // Consecutive protocol errors close the session; a valid frame resets the count.
        auto noisy = std::make_shared<FakeConnection>("c5", "t1", "u5");
        handler.onOpen(noisy, "Noisy");
        const auto errorsBefore = metrics.counter("protocol_errors_total");
        for (int i = 0; i < 4; ++i) {
            if (!handler.onMessage(noisy, "{bad json")) {
                std::cerr << "Session closed too early at error " << i + 1 << "\n";
                return 1;
            }
        }
        handler.onMessage(noisy, core::wire::encodeSync(0));
        for (int i = 0; i < 4; ++i) {
            if (!handler.onMessage(noisy, R"({"action":"teleport"})")) {
                std::cerr << "Valid frame must reset the error count\n";
                return 1;
            }
        }
        if (handler.onMessage(noisy, R"({"action":"teleport"})")) {
            std::cerr << "Fifth consecutive protocol error must close the session\n";
            return 1;
        }
        if (metrics.counter("protocol_errors_total") != errorsBefore + 9 || countType(*noisy, "error") != 9) {
            std::cerr << "Every protocol error must be counted and answered\n";
            return 1;
        }

        // Disconnect unregisters and clears presence.
        handler.onClose(*ana);
        if (registry->connectionCount("t1") != 3 || !presence->getPresence("t1", "lead", "L1").empty()) {
            std::cerr << "onClose must unregister and clear presence\n";
            return 1;
        }
        if (handler.onMessage(ana, core::wire::encodeSync(0))) {
            std::cerr << "Messages from closed connections must be refused\n";
            return 1;
        }

        // Shutdown asks every registered session to close; each still reports onClose.
        const auto before = handler.openSessions();
        if (handler.disconnectAll() != 4 || registry->connectionCount() != 0 || ben->disconnects() != 1 ||
            other->disconnects() != 1 || ben->isOpen()) {
            std::cerr << "disconnectAll must close and forget every registered session\n";
            return 1;
        }
        handler.onClose(*ben);
        if (handler.openSessions() != before - 1) {
            std::cerr << "onClose after shutdown must still release the session\n";
            return 1;
        }
    } catch (const std::exception& ex) {
        std::cerr << "Unexpected exception: " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
