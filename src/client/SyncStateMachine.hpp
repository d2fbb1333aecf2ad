#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "client/Backoff.hpp"
#include "client/DedupFilter.hpp"
#include "core/WireProtocol.hpp"
#include "domain/Event.hpp"

namespace client {

enum class SyncState { Disconnected, Connecting, Syncing, Live, GaveUp };

const char* syncStateToString(SyncState state) noexcept;

// Client half of the sync protocol with the socket factored out. The transport
// reports open/close and inbound text; the machine answers through
// Callbacks::send and tells the transport when to reconnect. Not thread-safe:
// drive it from one thread.
class SyncStateMachine {
public:
    using Clock = std::chrono::steady_clock;
    using EventHandler = std::function<void(const domain::Event&)>;

    struct Options {
        Backoff::Options backoff{};
        std::chrono::milliseconds staleTimeout{75000};
        std::size_t dedupCapacity = DedupFilter::kDefaultCapacity;
        std::size_t maxBufferedEvents = 10000;
        std::uint32_t seed = std::random_device{}();
    };

    struct Callbacks {
        std::function<void(const std::string&)> send;
        // Fired for every applied event, after the per-type handler.
        EventHandler onEvent;
        // The cursor fell outside retention; reload state from scratch.
        std::function<void(domain::SequenceNumber latestSequence)> onFullRefresh;
        std::function<void(SyncState from, SyncState to)> onStateChange;
        std::function<void()> onGaveUp;
        std::function<void(const core::wire::PresenceChange&)> onPresence;
        std::function<void(const core::wire::InitialPresence&)> onInitialPresence;
    };

    SyncStateMachine(Options options, Callbacks callbacks, domain::SequenceNumber initialCursor = 0);

    void on(domain::EventType type, EventHandler handler);

    // Sent right after every open, before the first sync. Empty means all types.
    void setSubscriptions(std::vector<domain::EventType> eventTypes);

    void onConnecting();
    void onTransportOpen(Clock::time_point now = Clock::now());
    void onText(std::string_view text, Clock::time_point now = Clock::now());

    // Returns the delay before the next attempt, or std::nullopt once the
    // machine has given up.
    std::optional<std::chrono::milliseconds> onTransportClosed();

    // True when the server has been silent longer than staleTimeout.
    bool isStale(Clock::time_point now = Clock::now()) const;

    SyncState state() const noexcept { return state_; }
    domain::SequenceNumber cursor() const noexcept { return cursor_; }
    std::size_t bufferedEvents() const noexcept { return buffered_.size(); }
    std::size_t reconnectAttempts() const noexcept { return backoff_.attempts(); }

private:
    void handle_(const core::wire::EventPush& push);
    void handle_(const core::wire::SyncResponse& response);
    void handle_(const core::wire::Ping& ping);
    void handle_(const core::wire::PresenceChange& change);
    void handle_(const core::wire::InitialPresence& snapshot);
    void handle_(const core::wire::ErrorReply& error);

    void requestSync_();
    void enterLive_();
    void applyLive_(const domain::Event& event);
    // Dedup, dispatch, cursor bump. Returns false for a duplicate.
    bool apply_(const domain::Event& event);
    // A throwing handler never stops the other handlers or the cursor.
    void dispatch_(const EventHandler& handler, const domain::Event& event);
    void transition_(SyncState next);
    void send_(const std::string& text);

    Options options_;
    Callbacks callbacks_;
    std::map<domain::EventType, EventHandler> handlers_;
    std::vector<domain::EventType> subscriptions_;

    SyncState state_ = SyncState::Disconnected;
    domain::SequenceNumber cursor_ = 0;
    DedupFilter dedup_;
    Backoff backoff_;
    std::vector<domain::Event> buffered_;
    Clock::time_point lastInboundAt_{};
};

}  // namespace client
