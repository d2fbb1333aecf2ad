#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "adapters/api/ws/SessionSendQueue.hpp"
#include "common/Metrics.hpp"

using adapters::api::ws::SessionSendQueue;

namespace {
using namespace std::chrono_literals;

std::shared_ptr<const std::string> msg(const std::string& text) {
    return std::make_shared<const std::string>(text);
}

}  // namespace

int main() {
    const auto t0 = SessionSendQueue::Clock::now();

    {
        // Stalled peer: no write ever completes.
        SessionSendQueue::Config config;
        config.maxMessages = 1;
        config.maxBytes = 1024;
        config.stallTimeout = 80ms;

        int closeCount = 0;
        int writes = 0;
        SessionSendQueue::Callbacks callbacks;
        callbacks.startWrite = [&](const std::shared_ptr<const std::string>&) { ++writes; };
        callbacks.closeForBackpressure = [&]() { ++closeCount; };

        SessionSendQueue queue("stalled", config, callbacks);
        const auto before = tsync::common::metrics::Registry::instance().counter("ws_backpressure_closes_total");

        queue.enqueue(msg("m1"), t0);
        queue.enqueue(msg("m2"), t0);
        queue.enqueue(msg("m3"), t0);

        if (writes != 1) {
            std::cerr << "Expected exactly one write in flight, got " << writes << "\n";
            return 1;
        }
        if (queue.checkStall(t0 + 79ms) || closeCount != 0) {
            std::cerr << "Queue closed before the stall timeout elapsed\n";
            return 1;
        }
        if (!queue.checkStall(t0 + 80ms) || closeCount != 1) {
            std::cerr << "Expected queue to close for backpressure (closeCount=" << closeCount << ")\n";
            return 1;
        }
        if (!queue.closed() || queue.queuedMessages() != 0 || queue.queuedBytes() != 0) {
            std::cerr << "Closed queue should be empty\n";
            return 1;
        }
        if (queue.enqueue(msg("late"), t0 + 81ms)) {
            std::cerr << "Closed queue must reject new messages\n";
            return 1;
        }
        if (queue.checkStall(t0 + 200ms) || closeCount != 1) {
            std::cerr << "Backpressure close must fire once\n";
            return 1;
        }
        const auto after = tsync::common::metrics::Registry::instance().counter("ws_backpressure_closes_total");
        if (after != before + 1) {
            std::cerr << "Expected ws_backpressure_closes_total to grow by one\n";
            return 1;
        }
    }

    {
        // Slow peer that catches up before the deadline.
        SessionSendQueue::Config config;
        config.maxMessages = 1;
        config.maxBytes = 1024;
        config.stallTimeout = 200ms;

        int closeCount = 0;
        std::vector<std::string> written;
        SessionSendQueue::Callbacks callbacks;
        callbacks.startWrite = [&](const std::shared_ptr<const std::string>& payload) { written.push_back(*payload); };
        callbacks.closeForBackpressure = [&]() { ++closeCount; };

        SessionSendQueue queue("slow", config, callbacks);

        queue.enqueue(msg("m1"), t0);
        queue.enqueue(msg("m2"), t0);
        queue.enqueue(msg("m3"), t0);

        queue.onWriteComplete(t0 + 50ms);
        queue.onWriteComplete(t0 + 50ms);
        queue.onWriteComplete(t0 + 50ms);

        if (queue.checkStall(t0 + 250ms) || closeCount != 0) {
            std::cerr << "Queue should not close when it drains below threshold\n";
            return 1;
        }
        if (written != std::vector<std::string>{"m1", "m2", "m3"}) {
            std::cerr << "Expected writes in enqueue order\n";
            return 1;
        }
        if (queue.queuedMessages() != 0) {
            std::cerr << "Expected empty queue after draining\n";
            return 1;
        }
    }

    {
        // Byte threshold alone also arms the stall timer.
        SessionSendQueue::Config config;
        config.maxMessages = 0;
        config.maxBytes = 4;
        config.stallTimeout = 10ms;

        int closeCount = 0;
        SessionSendQueue::Callbacks callbacks;
        callbacks.startWrite = [](const std::shared_ptr<const std::string>&) {};
        callbacks.closeForBackpressure = [&]() { ++closeCount; };

        SessionSendQueue queue("bytes", config, callbacks);
        queue.enqueue(msg("0123456789"), t0);
        if (!queue.checkStall(t0 + 10ms) || closeCount != 1) {
            std::cerr << "Expected byte threshold to trigger backpressure close\n";
            return 1;
        }
    }

    return 0;
}
