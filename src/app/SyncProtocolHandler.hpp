#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "core/ConnectionRegistry.hpp"
#include "core/EventStore.hpp"
#include "core/LogUtils.h"
#include "core/PresenceTracker.hpp"
#include "core/WireProtocol.hpp"

namespace app {

// Server side of the client sync protocol, independent of the transport. A
// session calls onOpen() after the upgrade, onMessage() for every text frame
// and onClose() exactly once when the socket goes away.
class SyncProtocolHandler {
public:
    struct Options {
        std::size_t syncBatchLimit = 100;
        std::size_t maxProtocolErrors = 5;
    };

    SyncProtocolHandler(std::shared_ptr<core::EventStore> store,
                        std::shared_ptr<core::ConnectionRegistry> registry,
                        std::shared_ptr<core::PresenceTracker> presence,
                        Options options);

    bool onOpen(const std::shared_ptr<core::IConnection>& connection, const std::string& userName);

    // Returns false when the session must be closed.
    bool onMessage(const std::shared_ptr<core::IConnection>& connection, std::string_view text);

    void onClose(const core::IConnection& connection);

    // Shutdown: closes every registered session. Sessions still report
    // onClose() as their close completes.
    std::size_t disconnectAll();
    std::size_t openSessions() const;

private:
    struct PeerState {
        std::string userName;
        std::size_t consecutiveErrors = 0;
    };

    void handle_(const std::shared_ptr<core::IConnection>& connection,
                 const std::string& userName,
                 const core::wire::SubscribeRequest& request);
    void handle_(const std::shared_ptr<core::IConnection>& connection,
                 const std::string& userName,
                 const core::wire::SyncRequest& request);
    void handle_(const std::shared_ptr<core::IConnection>& connection,
                 const std::string& userName,
                 const core::wire::PresenceRequest& request);
    void handle_(const std::shared_ptr<core::IConnection>& connection,
                 const std::string& userName,
                 const core::wire::PongReply& reply);

    std::shared_ptr<core::EventStore> store_;
    std::shared_ptr<core::ConnectionRegistry> registry_;
    std::shared_ptr<core::PresenceTracker> presence_;
    Options options_;

    mutable std::mutex peersMutex_;
    std::unordered_map<std::string, PeerState> peers_;
    core::RateLogger protocolErrorLog_{};
};

}  // namespace app
